#include "protdes/structure_predictor.hpp"
#include "protdes/errors.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace protdes {

SequenceProperties compute_sequence_properties(const Sequence& seq) {
    SequenceProperties props;
    props.hydropathy = gravy(seq);
    props.net_charge = net_charge(seq, 7.0);
    props.molecular_weight = molecular_weight(seq);
    props.aromaticity = aromaticity(seq);
    return props;
}

// ChouFasmanPredictor

ChouFasmanPredictor::ChouFasmanPredictor(ChouFasmanOptions options)
    : options_(options) {
    if (options_.helix_window < 1 || options_.sheet_window < 1) {
        throw InvalidParametersError("Chou-Fasman windows must be >= 1");
    }
}

namespace {

// Mean of values[lo, hi) through a prefix-sum array
inline double window_mean(const std::vector<double>& prefix, size_t lo, size_t hi) {
    return (prefix[hi] - prefix[lo]) / static_cast<double>(hi - lo);
}

// Window of width w around i, clipped to [0, n)
inline std::pair<size_t, size_t> window_bounds(size_t i, size_t n, int w) {
    const size_t half_left = static_cast<size_t>(w - 1) / 2;
    const size_t lo = i >= half_left ? i - half_left : 0;
    const size_t hi = std::min(n, lo + static_cast<size_t>(w));
    return {lo, hi};
}

}  // namespace

std::string ChouFasmanPredictor::assign(const Sequence& seq) const {
    const size_t n = seq.size();
    std::vector<double> helix_prefix(n + 1, 0.0);
    std::vector<double> sheet_prefix(n + 1, 0.0);
    for (size_t i = 0; i < n; ++i) {
        helix_prefix[i + 1] = helix_prefix[i] + helix_propensity(seq[i]);
        sheet_prefix[i + 1] = sheet_prefix[i] + sheet_propensity(seq[i]);
    }

    std::string states(n, 'C');
    for (size_t i = 0; i < n; ++i) {
        auto [hlo, hhi] = window_bounds(i, n, options_.helix_window);
        auto [slo, shi] = window_bounds(i, n, options_.sheet_window);
        const double pa = window_mean(helix_prefix, hlo, hhi);
        const double pb = window_mean(sheet_prefix, slo, shi);

        if (pa >= options_.helix_threshold && pa >= pb) {
            states[i] = 'H';
        } else if (pb >= options_.sheet_threshold) {
            states[i] = 'E';
        }
    }
    return states;
}

StructureRecord ChouFasmanPredictor::predict(const Sequence& seq) const {
    if (seq.empty()) {
        throw PredictorFailure("empty sequence");
    }
    if (!is_valid_protein(seq)) {
        throw PredictorFailure("sequence contains non-standard residues");
    }

    const std::string states = assign(seq);
    size_t helix = 0, sheet = 0;
    for (char s : states) {
        if (s == 'H') ++helix;
        else if (s == 'E') ++sheet;
    }
    const double n = static_cast<double>(seq.size());

    StructureRecord record;
    record.sequence = seq;
    record.secondary_structure.helix = static_cast<double>(helix) / n;
    record.secondary_structure.sheet = static_cast<double>(sheet) / n;
    record.secondary_structure.coil = static_cast<double>(seq.size() - helix - sheet) / n;
    record.properties = compute_sequence_properties(seq);
    record.predictor = name();
    return record;
}

// TimeoutPredictor

TimeoutPredictor::TimeoutPredictor(std::shared_ptr<const StructurePredictor> inner,
                                   std::chrono::milliseconds timeout,
                                   int max_workers)
    : inner_(std::move(inner)),
      timeout_(timeout),
      max_workers_(max_workers),
      running_(std::make_shared<std::atomic<int>>(0)) {
    if (!inner_) {
        throw InvalidParametersError("TimeoutPredictor needs an inner predictor");
    }
    if (timeout_.count() <= 0) {
        throw InvalidParametersError("predictor timeout must be positive");
    }
    if (max_workers_ < 1) {
        throw InvalidParametersError("TimeoutPredictor max_workers must be >= 1");
    }
}

std::string TimeoutPredictor::name() const {
    return inner_->name();
}

StructureRecord TimeoutPredictor::predict(const Sequence& seq) const {
    if (running_->fetch_add(1) >= max_workers_) {
        running_->fetch_sub(1);
        throw PredictorFailure("predictor busy: " + std::to_string(max_workers_) +
                               " calls still running");
    }

    auto promise = std::make_shared<std::promise<StructureRecord>>();
    std::future<StructureRecord> result = promise->get_future();

    try {
        std::thread worker([inner = inner_, running = running_, promise, seq]() {
            try {
                promise->set_value(inner->predict(seq));
            } catch (...) {
                // Forwarded to the waiting caller through the future
                promise->set_exception(std::current_exception());
            }
            running->fetch_sub(1);
        });
        worker.detach();
    } catch (const std::system_error&) {
        running_->fetch_sub(1);
        throw;
    }

    if (result.wait_for(timeout_) == std::future_status::timeout) {
        throw PredictorFailure("prediction timed out after " +
                               std::to_string(timeout_.count()) + " ms");
    }
    return result.get();
}

} // namespace protdes

#pragma once
// Structure prediction boundary
//
// The optimizer only sees StructurePredictor::predict(). Backends range from
// the bundled sequence heuristic to remote or learned models; any of them may
// be slow and may fail. Failures are reported by throwing (PredictorFailure
// preferred). predict() must be safe to call concurrently on distinct
// sequences.

#include "protdes/residue_tables.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace protdes {

// Fractions of residues per secondary-structure class (sum <= 1)
struct SecondaryStructureContent {
    double helix = 0.0;
    double sheet = 0.0;
    double coil = 0.0;
};

struct SequenceProperties {
    double hydropathy = 0.0;        // GRAVY
    double net_charge = 0.0;        // at pH 7
    double molecular_weight = 0.0;  // Da
    double aromaticity = 0.0;       // F+W+Y fraction
};

struct StructureRecord {
    Sequence sequence;
    SecondaryStructureContent secondary_structure;
    SequenceProperties properties;
    std::string predictor;          // backend that produced the record
};

// Sequence-derived properties shared by all bundled backends
SequenceProperties compute_sequence_properties(const Sequence& seq);

class StructurePredictor {
public:
    virtual ~StructurePredictor() = default;

    virtual StructureRecord predict(const Sequence& seq) const = 0;
    virtual std::string name() const = 0;
};

struct ChouFasmanOptions {
    int helix_window = 6;
    int sheet_window = 5;
    double helix_threshold = 1.03;   // mean P(alpha) needed to call a helix residue
    double sheet_threshold = 1.05;   // mean P(beta) needed to call a strand residue
};

/**
 * Chou-Fasman style heuristic predictor.
 *
 * Each residue is assigned helix if the windowed mean helix propensity
 * clears its threshold and is at least the sheet propensity, otherwise
 * sheet if the windowed mean sheet propensity clears its threshold,
 * otherwise coil. Deterministic; throws PredictorFailure for empty input or
 * non-standard residues.
 */
class ChouFasmanPredictor : public StructurePredictor {
public:
    explicit ChouFasmanPredictor(ChouFasmanOptions options = {});

    StructureRecord predict(const Sequence& seq) const override;
    std::string name() const override { return "chou-fasman"; }

    // Per-residue assignment string over {H, E, C}
    std::string assign(const Sequence& seq) const;

private:
    ChouFasmanOptions options_;
};

/**
 * Bounds every call of a wrapped predictor by a wall-clock timeout.
 *
 * The inner call runs on a detached worker that shares ownership of the
 * inner predictor, so a call that overruns may finish after predict() has
 * already thrown PredictorFailure; its result is discarded.
 *
 * At most max_workers inner calls run at once, counting overrun workers
 * that are still going. Past that limit predict() throws PredictorFailure
 * without starting a thread, so a backend that hangs for good costs at
 * most max_workers threads. max_workers must cover the evaluation threads.
 */
class TimeoutPredictor : public StructurePredictor {
public:
    static constexpr int DEFAULT_MAX_WORKERS = 64;

    TimeoutPredictor(std::shared_ptr<const StructurePredictor> inner,
                     std::chrono::milliseconds timeout,
                     int max_workers = DEFAULT_MAX_WORKERS);

    StructureRecord predict(const Sequence& seq) const override;
    std::string name() const override;

    std::chrono::milliseconds timeout() const { return timeout_; }

    // Inner calls still running, overrun ones included
    int running_workers() const { return running_->load(); }

private:
    std::shared_ptr<const StructurePredictor> inner_;
    std::chrono::milliseconds timeout_;
    int max_workers_;
    // Shared with detached workers, which may outlive the predictor
    std::shared_ptr<std::atomic<int>> running_;
};

} // namespace protdes

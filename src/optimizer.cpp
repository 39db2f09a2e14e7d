#include "protdes/optimizer.hpp"
#include "protdes/errors.hpp"
#include "protdes/log_utils.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <string>
#include <unordered_map>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace protdes {

// Below this temperature only non-worse children are accepted
constexpr double MIN_TEMPERATURE = 1e-12;

void OptimizationParameters::validate() const {
    if (max_iterations < 1) {
        throw InvalidParametersError("max_iterations must be >= 1");
    }
    if (population_size < 1) {
        throw InvalidParametersError("population_size must be >= 1");
    }
    if (elite_size < 0 || elite_size >= population_size) {
        throw InvalidParametersError("elite_size must be in [0, population_size), got " +
                                     std::to_string(elite_size));
    }
    if (patience < 1) {
        throw InvalidParametersError("patience must be >= 1");
    }
    if (!std::isfinite(mutation_rate) || mutation_rate < 0.0 || mutation_rate > 1.0) {
        throw InvalidParametersError("mutation_rate must be in [0,1]");
    }
    if (!std::isfinite(crossover_rate) || crossover_rate < 0.0 || crossover_rate > 1.0) {
        throw InvalidParametersError("crossover_rate must be in [0,1]");
    }
    if (!std::isfinite(temperature) || temperature <= 0.0) {
        throw InvalidParametersError("temperature must be finite and > 0");
    }
    if (!std::isfinite(cooling_rate) || cooling_rate <= 0.0 || cooling_rate > 1.0) {
        throw InvalidParametersError("cooling_rate must be in (0,1]");
    }
    if (num_threads < 0) {
        throw InvalidParametersError("num_threads must be >= 0");
    }
}

const char* stop_reason_name(StopReason reason) {
    switch (reason) {
        case StopReason::Converged: return "converged";
        case StopReason::Exhausted: return "exhausted";
        case StopReason::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

Optimizer::Optimizer(const DesignTarget& target,
                     const SequenceGenerator& generator,
                     const StructurePredictor& predictor,
                     const FitnessEvaluator& evaluator,
                     OptimizationParameters params)
    : target_(target),
      generator_(generator),
      predictor_(predictor),
      evaluator_(evaluator),
      params_(params),
      rng_(params.seed) {
    params_.validate();

#ifdef _OPENMP
    num_threads_ = params_.num_threads > 0 ? params_.num_threads : omp_get_max_threads();
#else
    num_threads_ = 1;
#endif
}

// Predict and score batch[first..]. Duplicate sequences share one call.
Optimizer::BatchOutcome Optimizer::evaluate_batch(std::vector<Candidate>& batch, size_t first) {
    BatchOutcome outcome;

    std::vector<size_t> unique;                 // batch indices that get a predictor call
    std::vector<size_t> source(batch.size());   // batch index -> evaluated index
    std::unordered_map<Sequence, size_t> seen;
    for (size_t i = first; i < batch.size(); ++i) {
        auto [it, inserted] = seen.emplace(batch[i].sequence, i);
        source[i] = it->second;
        if (inserted) unique.push_back(i);
    }

    std::vector<std::string> errors(unique.size());
    const long n = static_cast<long>(unique.size());

    #pragma omp parallel for schedule(dynamic) num_threads(num_threads_) if(num_threads_ > 1)
    for (long k = 0; k < n; ++k) {
        Candidate& cand = batch[unique[k]];
        try {
            StructureRecord record = predictor_.predict(cand.sequence);
            cand.score = evaluator_.evaluate(record, target_);
            cand.structure = std::move(record);
            cand.failed = false;
        } catch (const std::exception& e) {
            cand.structure.reset();
            cand.score = FitnessScore{};
            cand.failed = true;
            errors[k] = e.what();
        }
    }

    for (size_t i = first; i < batch.size(); ++i) {
        if (source[i] != i) {
            const Candidate& src = batch[source[i]];
            batch[i].structure = src.structure;
            batch[i].score = src.score;
            batch[i].failed = src.failed;
        }
        if (batch[i].failed) ++outcome.failures;
        ++outcome.evaluated;
    }
    for (size_t k = 0; k < unique.size(); ++k) {
        if (!batch[unique[k]].failed) continue;
        if (outcome.failed_calls == 0) outcome.first_error = errors[k];
        ++outcome.failed_calls;
    }
    outcome.calls = unique.size();
    return outcome;
}

// Roulette-wheel selection on total fitness; uniform when every score is 0
size_t Optimizer::select_parent() {
    double total = 0.0;
    for (const auto& c : population_) total += c.score.total;

    if (total <= 0.0) {
        std::uniform_int_distribution<size_t> pick(0, population_.size() - 1);
        return pick(rng_);
    }

    std::uniform_real_distribution<double> spin(0.0, total);
    const double r = spin(rng_);
    double cumulative = 0.0;
    size_t last_positive = 0;
    for (size_t i = 0; i < population_.size(); ++i) {
        if (population_[i].score.total <= 0.0) continue;
        cumulative += population_[i].score.total;
        last_positive = i;
        if (r < cumulative) return i;
    }
    // r rounded up to total
    return last_positive;
}

std::vector<Candidate> Optimizer::breed() {
    const auto pop_size = static_cast<size_t>(params_.population_size);
    const auto elite = static_cast<size_t>(params_.elite_size);

    std::vector<Candidate> offspring;
    offspring.reserve(pop_size);
    for (size_t i = 0; i < elite; ++i) {
        offspring.push_back(population_[i]);
    }

    std::uniform_real_distribution<double> coin(0.0, 1.0);
    for (size_t i = elite; i < pop_size; ++i) {
        Sequence child;
        if (coin(rng_) < params_.crossover_rate) {
            const size_t a = select_parent();
            const size_t b = select_parent();
            child = generator_.crossover(population_[a].sequence, population_[b].sequence, rng_);
        } else {
            child = population_[select_parent()].sequence;
        }
        child = generator_.mutate(child, params_.mutation_rate, rng_);
        generator_.check_candidate(child);

        Candidate cand;
        cand.sequence = std::move(child);
        offspring.push_back(std::move(cand));
    }
    return offspring;
}

// Child i challenges incumbent i (Metropolis criterion). Returns the number accepted.
size_t Optimizer::accept(std::vector<Candidate>& offspring, double temperature) {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    size_t accepted = 0;

    for (size_t i = static_cast<size_t>(params_.elite_size); i < offspring.size(); ++i) {
        const double delta = offspring[i].score.total - population_[i].score.total;
        bool take = delta >= 0.0;
        if (!take && temperature > MIN_TEMPERATURE) {
            take = uniform(rng_) < std::exp(delta / temperature);
        }
        if (take) {
            population_[i] = std::move(offspring[i]);
            ++accepted;
        }
    }
    return accepted;
}

void Optimizer::sort_population() {
    std::stable_sort(population_.begin(), population_.end(),
                     [](const Candidate& a, const Candidate& b) {
                         return a.score.total > b.score.total;
                     });
}

double Optimizer::population_mean() const {
    if (population_.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& c : population_) sum += c.score.total;
    return sum / static_cast<double>(population_.size());
}

OptimizationResult Optimizer::run(OptimizationObserver* observer) {
    OptimizationResult result;
    state_.store(RunState::Initializing, std::memory_order_relaxed);
    rng_.seed(params_.seed);

    // Initial population
    population_.clear();
    population_.reserve(static_cast<size_t>(params_.population_size));
    for (int i = 0; i < params_.population_size; ++i) {
        Candidate cand;
        cand.sequence = generator_.generate_initial(rng_);
        generator_.check_candidate(cand.sequence);
        population_.push_back(std::move(cand));
    }

    BatchOutcome init = evaluate_batch(population_, 0);
    result.predictor_calls += init.calls;
    result.predictor_failures += init.failed_calls;
    if (init.failures > 0) {
        log_utils::log_warning("initial population: prediction failed for " +
                               std::to_string(init.failures) + " of " +
                               std::to_string(init.evaluated) + " candidates (" +
                               init.first_error + ")");
    }
    sort_population();

    Candidate best = population_.front();
    double temperature = params_.temperature;
    int stall = 0;
    StopReason reason = StopReason::Exhausted;

    state_.store(RunState::Iterating, std::memory_order_relaxed);
    int iteration = 0;
    while (iteration < params_.max_iterations) {
        if (cancel_requested()) {
            reason = StopReason::Cancelled;
            break;
        }
        ++iteration;

        std::vector<Candidate> offspring = breed();
        BatchOutcome batch = evaluate_batch(offspring, static_cast<size_t>(params_.elite_size));
        result.predictor_calls += batch.calls;
        result.predictor_failures += batch.failed_calls;

        IterationStats stats;
        stats.iteration = iteration;
        stats.temperature = temperature;
        stats.evaluated = batch.evaluated;
        stats.failures = batch.failures;

        if (batch.evaluated > 0 && batch.failures == batch.evaluated) {
            log_utils::log_warning("iteration " + std::to_string(iteration) +
                                   ": prediction failed for all " +
                                   std::to_string(batch.evaluated) +
                                   " candidates, population unchanged (" +
                                   batch.first_error + ")");
        } else {
            if (batch.failures > 0) {
                log_utils::log_warning("iteration " + std::to_string(iteration) +
                                       ": prediction failed for " +
                                       std::to_string(batch.failures) + " of " +
                                       std::to_string(batch.evaluated) + " candidates (" +
                                       batch.first_error + ")");
            }
            stats.accepted = accept(offspring, temperature);
            sort_population();
        }

        if (population_.front().score.total > best.score.total) {
            best = population_.front();
            stall = 0;
        } else {
            ++stall;
        }

        temperature *= params_.cooling_rate;

        stats.best_score = best.score.total;
        stats.mean_score = population_mean();
        result.history.push_back(stats);
        result.iterations = iteration;

        if (observer) observer->on_iteration(best, best.score.total);

        if (stall >= params_.patience) {
            reason = StopReason::Converged;
            state_.store(RunState::Converged, std::memory_order_relaxed);
            break;
        }
        if (iteration == params_.max_iterations) {
            reason = StopReason::Exhausted;
            state_.store(RunState::Exhausted, std::memory_order_relaxed);
        }
    }

    cancel_requested_.store(false, std::memory_order_relaxed);
    state_.store(RunState::Terminated, std::memory_order_relaxed);

    result.best = std::move(best);
    result.stop_reason = reason;
    return result;
}

} // namespace protdes

#pragma once
// Population-based simulated annealing over protein sequences
//
// Each iteration keeps the top elite_size candidates, fills the remaining
// slots with children (fitness-proportional crossover at crossover_rate,
// otherwise a copy of one selected parent, then point mutation), predicts
// and scores every new child once, and lets child i challenge incumbent i:
// a better child always wins, a worse one wins with probability
// exp((new - old) / T). T is multiplied by cooling_rate every iteration, so
// the search goes from exploratory to greedy.
//
// A run is deterministic for a given seed: all random draws come from one
// std::mt19937_64 owned by the optimizer, and parallel evaluation writes
// results by index before any acceptance decision is made.

#include "protdes/design_target.hpp"
#include "protdes/fitness_evaluator.hpp"
#include "protdes/sequence_generator.hpp"
#include "protdes/structure_predictor.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace protdes {

// Search parameters (defaults follow the reference enzyme design run)
struct OptimizationParameters {
    int max_iterations = 100;    // hard iteration budget
    int population_size = 20;    // candidates per generation
    double mutation_rate = 0.1;  // per-residue point mutation probability
    double temperature = 1.0;    // initial annealing temperature
    double cooling_rate = 0.99;  // T *= cooling_rate after every iteration, in (0,1]
    double crossover_rate = 0.8; // probability a child comes from two parents
    int elite_size = 2;          // top candidates copied unchanged, < population_size
    int patience = 20;           // stop after this many iterations without improvement
    uint64_t seed = 42;          // RNG seed; identical seeds give identical runs
    int num_threads = 1;         // evaluation threads (0 = OpenMP default)

    // Throws InvalidParametersError
    void validate() const;
};

struct Candidate {
    Sequence sequence;
    std::optional<StructureRecord> structure;  // empty when prediction failed
    FitnessScore score;
    bool failed = false;
};

enum class RunState {
    Initializing,
    Iterating,
    Converged,
    Exhausted,
    Terminated
};

enum class StopReason {
    Converged,   // patience exhausted
    Exhausted,   // max_iterations reached
    Cancelled    // cancel() observed at the top of an iteration
};

const char* stop_reason_name(StopReason reason);

// Per-iteration diagnostics
struct IterationStats {
    int iteration = 0;
    double best_score = 0.0;
    double mean_score = 0.0;     // population mean after acceptance
    double temperature = 0.0;    // temperature used for this iteration's acceptance
    size_t evaluated = 0;        // new candidates scored this iteration
    size_t accepted = 0;         // children that replaced their incumbent
    size_t failures = 0;         // new candidates whose prediction failed
};

struct OptimizationResult {
    Candidate best;
    StopReason stop_reason = StopReason::Exhausted;
    int iterations = 0;                  // completed iterations
    std::vector<IterationStats> history;
    size_t predictor_calls = 0;          // duplicates within a batch share one call
    size_t predictor_failures = 0;       // calls that threw, <= predictor_calls

    double best_score() const { return best.score.total; }
};

// Receives the best-so-far after every completed iteration.
// Exceptions thrown from on_iteration propagate out of Optimizer::run().
class OptimizationObserver {
public:
    virtual ~OptimizationObserver() = default;
    virtual void on_iteration(const Candidate& best, double score) = 0;
};

using IterationCallback = std::function<void(const Candidate& best, double score)>;

// Adapts a callable to the observer interface
class FunctionObserver : public OptimizationObserver {
public:
    explicit FunctionObserver(IterationCallback fn) : fn_(std::move(fn)) {}
    void on_iteration(const Candidate& best, double score) override {
        if (fn_) fn_(best, score);
    }

private:
    IterationCallback fn_;
};

class Optimizer {
public:
    // Validates params (InvalidParametersError). All references must
    // outlive the optimizer.
    Optimizer(const DesignTarget& target,
              const SequenceGenerator& generator,
              const StructurePredictor& predictor,
              const FitnessEvaluator& evaluator,
              OptimizationParameters params = {});

    /**
     * Run one optimization from a freshly seeded RNG.
     *
     * Predictor failures are absorbed (candidate fitness 0). Generator
     * invariant breaches (LengthMismatchError, ConstraintViolationError) and
     * observer exceptions propagate.
     */
    OptimizationResult run(OptimizationObserver* observer = nullptr);

    // Request a stop; honoured at the top of the next iteration. Thread-safe.
    void cancel() { cancel_requested_.store(true, std::memory_order_relaxed); }
    bool cancel_requested() const { return cancel_requested_.load(std::memory_order_relaxed); }

    RunState state() const { return state_.load(std::memory_order_relaxed); }

    // Current population, best first
    const std::vector<Candidate>& population() const { return population_; }
    const OptimizationParameters& parameters() const { return params_; }

private:
    struct BatchOutcome {
        size_t evaluated = 0;
        size_t calls = 0;
        size_t failures = 0;        // candidates
        size_t failed_calls = 0;
        std::string first_error;
    };

    BatchOutcome evaluate_batch(std::vector<Candidate>& batch, size_t first);
    size_t select_parent();
    std::vector<Candidate> breed();
    size_t accept(std::vector<Candidate>& offspring, double temperature);
    void sort_population();
    double population_mean() const;

    const DesignTarget& target_;
    const SequenceGenerator& generator_;
    const StructurePredictor& predictor_;
    const FitnessEvaluator& evaluator_;
    OptimizationParameters params_;
    int num_threads_ = 1;

    std::mt19937_64 rng_;
    std::vector<Candidate> population_;
    std::atomic<bool> cancel_requested_{false};
    std::atomic<RunState> state_{RunState::Initializing};
};

} // namespace protdes

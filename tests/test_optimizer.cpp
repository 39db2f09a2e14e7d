// tests/test_optimizer.cpp
//
// Optimizer run contract:
//   - best score never decreases across iterations
//   - a run stops after max_iterations or after `patience` stalled iterations
//   - identical seeds give identical runs, regardless of thread count
//   - predictor failures score 0 and never abort the run
//   - the observer sees every completed iteration and can cancel the run
//   - a worse child is accepted only at non-zero temperature
//   - parents are drawn in proportion to fitness

#include "protdes/design_target.hpp"
#include "protdes/errors.hpp"
#include "protdes/fitness_evaluator.hpp"
#include "protdes/log_utils.hpp"
#include "protdes/optimizer.hpp"
#include "protdes/sequence_generator.hpp"
#include "protdes/structure_predictor.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using protdes::Candidate;
using protdes::ChouFasmanPredictor;
using protdes::DesignTarget;
using protdes::FitnessEvaluator;
using protdes::FunctionObserver;
using protdes::OptimizationParameters;
using protdes::OptimizationResult;
using protdes::Optimizer;
using protdes::SequenceGenerator;
using protdes::StopReason;
using protdes::StructurePredictor;
using protdes::StructureRecord;

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "FAIL: " << msg << "\n";
        ++failed;
    }
}

DesignTarget small_target() {
    return DesignTarget({20, 30}, {0.3, 0.6, 0.0, 0.3}, {-1.0, 1.0, -3.0, 3.0},
                        {{5, {'H', 'D'}}}, {{10, 'G'}}, "test fold");
}

OptimizationParameters small_params() {
    OptimizationParameters p;
    p.max_iterations = 30;
    p.population_size = 12;
    p.elite_size = 2;
    p.patience = 1000;
    p.seed = 17;
    return p;
}

// Rejects any sequence whose first residue sorts before 'K'
class PickyPredictor : public StructurePredictor {
public:
    StructureRecord predict(const protdes::Sequence& seq) const override {
        if (!seq.empty() && seq[0] < 'K') {
            throw protdes::PredictorFailure("picky backend rejected sequence");
        }
        return inner_.predict(seq);
    }
    std::string name() const override { return "picky"; }

private:
    ChouFasmanPredictor inner_;
};

class AlwaysFailingPredictor : public StructurePredictor {
public:
    StructureRecord predict(const protdes::Sequence&) const override {
        throw std::runtime_error("backend offline");
    }
    std::string name() const override { return "offline"; }
};

// Same record for every sequence: no candidate can ever improve
class ConstantPredictor : public StructurePredictor {
public:
    StructureRecord predict(const protdes::Sequence& seq) const override {
        StructureRecord r;
        r.sequence = seq;
        r.secondary_structure = {0.4, 0.2, 0.4};
        r.predictor = name();
        return r;
    }
    std::string name() const override { return "constant"; }
};

class CountingPredictor : public StructurePredictor {
public:
    StructureRecord predict(const protdes::Sequence& seq) const override {
        calls_.fetch_add(1, std::memory_order_relaxed);
        return inner_.predict(seq);
    }
    std::string name() const override { return "counting"; }
    size_t calls() const { return calls_.load(); }

private:
    ChouFasmanPredictor inner_;
    mutable std::atomic<size_t> calls_{0};
};

// Succeeds only for the first sequence it is asked about; everything else
// fails and scores 0. Single-threaded use only.
class MarkerPredictor : public StructurePredictor {
public:
    StructureRecord predict(const protdes::Sequence& seq) const override {
        if (marker_.empty()) marker_ = seq;
        if (seq != marker_) {
            throw protdes::PredictorFailure("unmarked sequence");
        }
        return inner_.predict(seq);
    }
    std::string name() const override { return "marker"; }
    const protdes::Sequence& marker() const { return marker_; }

private:
    ChouFasmanPredictor inner_;
    mutable protdes::Sequence marker_;
};

bool same_run(const OptimizationResult& a, const OptimizationResult& b) {
    if (a.best.sequence != b.best.sequence) return false;
    if (a.best.score.total != b.best.score.total) return false;
    if (a.iterations != b.iterations || a.history.size() != b.history.size()) return false;
    for (size_t i = 0; i < a.history.size(); ++i) {
        if (a.history[i].best_score != b.history[i].best_score) return false;
        if (a.history[i].mean_score != b.history[i].mean_score) return false;
        if (a.history[i].accepted != b.history[i].accepted) return false;
    }
    return true;
}

int test_best_never_decreases() {
    int failed = 0;
    const DesignTarget target = small_target();
    const SequenceGenerator gen(target);
    const ChouFasmanPredictor predictor;
    const FitnessEvaluator evaluator;
    Optimizer opt(target, gen, predictor, evaluator, small_params());

    std::vector<double> seen;
    FunctionObserver observer([&](const Candidate& best, double score) {
        expect(best.score.total == score, "observer score differs from candidate", failed);
        seen.push_back(score);
    });
    const OptimizationResult result = opt.run(&observer);

    expect(result.stop_reason == StopReason::Exhausted, "expected exhausted stop", failed);
    expect(result.iterations == 30, "iterations != max_iterations", failed);
    expect(result.history.size() == 30, "history length", failed);
    expect(seen.size() == 30, "observer not called once per iteration", failed);
    for (size_t i = 1; i < seen.size(); ++i) {
        expect(seen[i] >= seen[i - 1], "best score decreased at iteration " + std::to_string(i + 1), failed);
    }
    expect(result.best_score() == seen.back(), "final best differs from last observed", failed);
    expect(opt.state() == protdes::RunState::Terminated, "state after run", failed);

    // Elites are never challenged, so the best survives in the population
    expect(opt.population().front().score.total == result.best_score(),
           "best candidate lost from the population", failed);
    expect(result.best.structure.has_value(), "best has no structure record", failed);

    // The best sequence satisfies the target
    bool feasible = true;
    try {
        gen.check_candidate(result.best.sequence);
    } catch (const protdes::DesignError&) {
        feasible = false;
    }
    expect(feasible, "best sequence infeasible", failed);
    return failed;
}

int test_patience() {
    int failed = 0;
    const DesignTarget target = small_target();
    const SequenceGenerator gen(target);
    const ConstantPredictor predictor{};
    const FitnessEvaluator evaluator;

    OptimizationParameters p = small_params();
    p.max_iterations = 500;
    p.patience = 4;
    Optimizer opt(target, gen, predictor, evaluator, p);
    const OptimizationResult result = opt.run();

    expect(result.stop_reason == StopReason::Converged, "expected converged stop", failed);
    expect(result.iterations == 4, "stalled run did not stop after patience iterations", failed);
    return failed;
}

int test_deterministic() {
    int failed = 0;
    const DesignTarget target = small_target();
    const SequenceGenerator gen(target);
    const ChouFasmanPredictor predictor;
    const FitnessEvaluator evaluator;

    OptimizationParameters p = small_params();
    p.max_iterations = 5;

    Optimizer a(target, gen, predictor, evaluator, p);
    Optimizer b(target, gen, predictor, evaluator, p);
    const OptimizationResult ra = a.run();
    const OptimizationResult rb = b.run();
    expect(same_run(ra, rb), "same seed gave different runs", failed);

    const OptimizationResult ra2 = a.run();
    expect(same_run(ra, ra2), "rerun of one optimizer differs", failed);

    p.num_threads = 4;
    Optimizer threaded(target, gen, predictor, evaluator, p);
    expect(same_run(ra, threaded.run()), "thread count changed the run", failed);
    return failed;
}

int test_predictor_failures_absorbed() {
    int failed = 0;
    const DesignTarget target = small_target();
    const SequenceGenerator gen(target);
    const PickyPredictor predictor{};
    const FitnessEvaluator evaluator;

    Optimizer opt(target, gen, predictor, evaluator, small_params());
    bool threw = false;
    OptimizationResult result;
    try {
        result = opt.run();
    } catch (const std::exception& e) {
        threw = true;
        std::cerr << "  unexpected: " << e.what() << "\n";
    }
    expect(!threw, "predictor failure aborted the run", failed);
    expect(result.iterations == 30, "run with failures cut short", failed);
    expect(result.predictor_failures > 0, "no failures recorded", failed);
    expect(result.predictor_failures <= result.predictor_calls, "more failures than calls", failed);
    expect(result.best.sequence[0] >= 'K', "rejected sequence reported as best", failed);
    expect(result.best_score() > 0.0, "no scored candidate found", failed);

    for (const auto& c : opt.population()) {
        if (c.failed) {
            expect(c.score.total == 0.0, "failed candidate scored above 0", failed);
            expect(!c.structure.has_value(), "failed candidate has a structure", failed);
        }
    }
    return failed;
}

int test_all_predictions_fail() {
    int failed = 0;
    const DesignTarget target = small_target();
    const SequenceGenerator gen(target);
    const AlwaysFailingPredictor predictor{};
    const FitnessEvaluator evaluator;

    OptimizationParameters p = small_params();
    p.max_iterations = 6;
    p.mutation_rate = 0.0;   // copied parents share one failed call
    p.crossover_rate = 0.0;
    Optimizer opt(target, gen, predictor, evaluator, p);

    std::ostringstream log;
    protdes::log_utils::set_log_sink(&log);
    OptimizationResult result;
    bool threw = false;
    try {
        result = opt.run();
    } catch (const std::exception&) {
        threw = true;
    }
    protdes::log_utils::set_log_sink(nullptr);

    expect(!threw, "all-failing predictor aborted the run", failed);
    expect(result.iterations == 6, "all-failing run cut short", failed);
    expect(result.best.failed && result.best_score() == 0.0, "best of failed run should score 0", failed);
    expect(result.predictor_failures == result.predictor_calls, "every call failed but counts differ", failed);
    size_t failed_candidates = static_cast<size_t>(p.population_size);
    for (const auto& h : result.history) {
        expect(h.failures == h.evaluated && h.accepted == 0, "all-fail iteration changed the population", failed);
        failed_candidates += h.failures;
    }
    expect(failed_candidates > result.predictor_failures, "shared failed calls counted once per candidate", failed);
    expect(log.str().find("Warning: ") != std::string::npos, "failures not logged", failed);
    expect(log.str().find("backend offline") != std::string::npos, "failure cause not logged", failed);
    return failed;
}

int test_timeout_predictor() {
    int failed = 0;
    const DesignTarget target = small_target();
    const SequenceGenerator gen(target);
    const FitnessEvaluator evaluator;

    class Sleepy : public StructurePredictor {
    public:
        StructureRecord predict(const protdes::Sequence& seq) const override {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            return ChouFasmanPredictor().predict(seq);
        }
        std::string name() const override { return "sleepy"; }
    };
    const protdes::TimeoutPredictor predictor(std::make_shared<Sleepy>(), std::chrono::milliseconds(5));

    OptimizationParameters p = small_params();
    p.max_iterations = 2;
    p.population_size = 3;
    p.elite_size = 1;
    Optimizer opt(target, gen, predictor, evaluator, p);
    const OptimizationResult result = opt.run();
    expect(result.iterations == 2, "timed-out run cut short", failed);
    expect(result.predictor_failures > 0, "timeouts not counted as failures", failed);
    return failed;
}

int test_cancel_and_observer_errors() {
    int failed = 0;
    const DesignTarget target = small_target();
    const SequenceGenerator gen(target);
    const ChouFasmanPredictor predictor;
    const FitnessEvaluator evaluator;
    Optimizer opt(target, gen, predictor, evaluator, small_params());

    int calls = 0;
    FunctionObserver canceller([&](const Candidate&, double) {
        if (++calls == 3) opt.cancel();
    });
    const OptimizationResult result = opt.run(&canceller);
    expect(result.stop_reason == StopReason::Cancelled, "expected cancelled stop", failed);
    expect(result.iterations == 3, "cancel not honoured at the next iteration", failed);
    expect(!opt.cancel_requested(), "cancel flag survived the run", failed);

    // A later run is unaffected by the earlier cancel
    const OptimizationResult full = opt.run();
    expect(full.iterations == 30, "run after cancel cut short", failed);

    FunctionObserver thrower([](const Candidate&, double) {
        throw std::runtime_error("observer failed");
    });
    bool propagated = false;
    try {
        (void)opt.run(&thrower);
    } catch (const std::runtime_error& e) {
        propagated = std::string(e.what()) == "observer failed";
    }
    expect(propagated, "observer exception swallowed", failed);
    return failed;
}

int test_predictor_calls_counted() {
    int failed = 0;
    const DesignTarget target = small_target();
    const SequenceGenerator gen(target);
    const CountingPredictor predictor{};
    const FitnessEvaluator evaluator;

    OptimizationParameters p = small_params();
    p.mutation_rate = 0.0;   // many duplicate children
    p.crossover_rate = 0.0;
    p.max_iterations = 10;
    Optimizer opt(target, gen, predictor, evaluator, p);
    const OptimizationResult result = opt.run();

    expect(result.predictor_calls == predictor.calls(), "predictor call count mismatch", failed);
    size_t evaluated = static_cast<size_t>(p.population_size);
    for (const auto& h : result.history) evaluated += h.evaluated;
    expect(result.predictor_calls < evaluated, "duplicate children were predicted again", failed);
    return failed;
}

// Below the minimum temperature a worse child never replaces its incumbent,
// so the population mean cannot drop.
int test_greedy_acceptance() {
    int failed = 0;
    const DesignTarget target = small_target();
    const SequenceGenerator gen(target);
    const ChouFasmanPredictor predictor;
    const FitnessEvaluator evaluator;

    OptimizationParameters p = small_params();
    p.max_iterations = 40;
    p.temperature = 1e-13;
    p.cooling_rate = 1.0;
    Optimizer opt(target, gen, predictor, evaluator, p);
    const OptimizationResult result = opt.run();

    size_t accepted = 0;
    for (size_t i = 0; i < result.history.size(); ++i) {
        accepted += result.history[i].accepted;
        if (i == 0) continue;
        expect(result.history[i].mean_score >= result.history[i - 1].mean_score - 1e-12,
               "population mean dropped at iteration " + std::to_string(i + 1), failed);
    }
    expect(accepted > 0, "no non-worse child accepted", failed);
    return failed;
}

// At a high fixed temperature worse children are accepted and the mean drops
int test_hot_acceptance() {
    int failed = 0;
    const DesignTarget target = small_target();
    const SequenceGenerator gen(target);
    const ChouFasmanPredictor predictor;
    const FitnessEvaluator evaluator;

    OptimizationParameters p = small_params();
    p.max_iterations = 40;
    p.cooling_rate = 1.0;

    p.temperature = 1e-13;
    Optimizer greedy(target, gen, predictor, evaluator, p);
    size_t greedy_accepted = 0;
    for (const auto& h : greedy.run().history) greedy_accepted += h.accepted;

    p.temperature = 100.0;
    Optimizer hot(target, gen, predictor, evaluator, p);
    const OptimizationResult result = hot.run();

    size_t hot_accepted = 0;
    int drops = 0;
    for (size_t i = 0; i < result.history.size(); ++i) {
        hot_accepted += result.history[i].accepted;
        expect(result.history[i].temperature == 100.0, "temperature changed with cooling_rate 1", failed);
        if (i > 0 && result.history[i].mean_score < result.history[i - 1].mean_score) ++drops;
    }
    expect(drops > 0, "hot run never accepted a worse population", failed);
    expect(hot_accepted > greedy_accepted, "hot run accepted no more children than greedy run", failed);

    // The best-so-far is still monotone
    for (size_t i = 1; i < result.history.size(); ++i) {
        expect(result.history[i].best_score >= result.history[i - 1].best_score,
               "best score decreased in hot run", failed);
    }
    return failed;
}

// Fitness-proportional selection: when a single candidate has non-zero
// fitness, every parent is that candidate.
int test_selection_follows_fitness() {
    int failed = 0;
    const DesignTarget target = small_target();
    const SequenceGenerator gen(target);
    const MarkerPredictor predictor{};
    const FitnessEvaluator evaluator;

    OptimizationParameters p = small_params();
    p.population_size = 8;
    p.elite_size = 1;
    p.max_iterations = 1;
    p.mutation_rate = 0.0;   // children are exact copies or crosses of their parents
    p.crossover_rate = 0.5;
    p.num_threads = 1;
    Optimizer opt(target, gen, predictor, evaluator, p);
    const OptimizationResult result = opt.run();

    expect(!predictor.marker().empty(), "predictor never called", failed);
    expect(result.best.sequence == predictor.marker(), "marked candidate not best", failed);
    expect(result.best_score() > 0.0, "marked candidate scored 0", failed);
    expect(result.history.size() == 1 && result.history[0].accepted == 7,
           "children of the marked parent not all accepted", failed);
    for (const auto& c : opt.population()) {
        expect(c.sequence == predictor.marker(), "child bred from a zero-fitness parent", failed);
        expect(!c.failed, "failed candidate left in population", failed);
    }
    return failed;
}

int test_invalid_parameters() {
    int failed = 0;
    const DesignTarget target = small_target();
    const SequenceGenerator gen(target);
    const ChouFasmanPredictor predictor;
    const FitnessEvaluator evaluator;

    auto expect_rejected = [&](OptimizationParameters p, const std::string& what) {
        bool threw = false;
        try {
            Optimizer opt(target, gen, predictor, evaluator, p);
        } catch (const protdes::InvalidParametersError&) {
            threw = true;
        }
        expect(threw, what, failed);
    };

    OptimizationParameters p = small_params();
    p.population_size = 0;
    expect_rejected(p, "population 0 accepted");
    p = small_params();
    p.elite_size = p.population_size;
    expect_rejected(p, "elite_size == population_size accepted");
    p = small_params();
    p.max_iterations = 0;
    expect_rejected(p, "max_iterations 0 accepted");
    p = small_params();
    p.mutation_rate = 1.5;
    expect_rejected(p, "mutation_rate 1.5 accepted");
    p = small_params();
    p.crossover_rate = -0.1;
    expect_rejected(p, "negative crossover_rate accepted");
    p = small_params();
    p.temperature = 0.0;
    expect_rejected(p, "temperature 0 accepted");
    p = small_params();
    p.cooling_rate = 0.0;
    expect_rejected(p, "cooling_rate 0 accepted");
    p = small_params();
    p.patience = 0;
    expect_rejected(p, "patience 0 accepted");
    return failed;
}

}  // namespace

int main() {
    protdes::log_utils::set_log_sink(nullptr);

    int failed = 0;
    failed += test_best_never_decreases();
    failed += test_patience();
    failed += test_deterministic();
    failed += test_predictor_failures_absorbed();
    failed += test_all_predictions_fail();
    failed += test_timeout_predictor();
    failed += test_cancel_and_observer_errors();
    failed += test_predictor_calls_counted();
    failed += test_greedy_acceptance();
    failed += test_hot_acceptance();
    failed += test_selection_follows_fitness();
    failed += test_invalid_parameters();

    if (failed == 0) {
        std::cout << "All optimizer tests passed\n";
        return 0;
    }
    std::cerr << failed << " optimizer test(s) failed\n";
    return 1;
}

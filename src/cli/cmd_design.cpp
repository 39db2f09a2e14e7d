// protdes design: optimize a protein sequence for a design target
//
// Usage: protdes design [target flags] [optimizer flags] [-o best.fa] [--summary best.json]
//
// Builds the target (enzyme preset unless overridden), runs the annealing
// optimizer with the Chou-Fasman predictor and reports the best design.

#include "commands.hpp"
#include "args.hpp"
#include "protdes/errors.hpp"
#include "protdes/log_utils.hpp"
#include "protdes/optimizer.hpp"
#include "protdes/report.hpp"
#include "protdes/sequence_io.hpp"
#include "protdes/structure_predictor.hpp"
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace protdes {
namespace cli {

namespace {

constexpr int PROGRESS_EVERY = 10;

void print_target(const DesignTarget& target) {
    const auto& len = target.length_range();
    const auto& ss = target.secondary_structure();
    const auto& p = target.properties();
    std::cerr << "Design target:\n";
    if (!target.desired_function().empty()) {
        std::cerr << "  Function: " << target.desired_function() << "\n";
    }
    std::cerr << "  Length: " << len.min << "-" << len.max << "\n";
    std::cerr << std::fixed << std::setprecision(2);
    std::cerr << "  Helix: " << ss.min_helix << "-" << ss.max_helix
              << ", sheet: " << ss.min_sheet << "-" << ss.max_sheet << "\n";
    std::cerr << "  Hydropathy: " << p.min_hydropathy << "-" << p.max_hydropathy
              << ", charge: " << p.min_charge << "-" << p.max_charge << "\n";
    std::cerr << "  Fixed positions: " << target.fixed_position_count() << "\n";
}

}  // namespace

int cmd_design(int argc, char* argv[]) {
    auto run_start = std::chrono::steady_clock::now();

    DesignOptions opts;
    try {
        opts = parse_design_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') std::cerr << e.what() << "\n";
        return e.exit_code();
    }

    if (opts.quiet) log_utils::set_log_sink(nullptr);

    try {
        const DesignTarget target = build_target(opts.target);
        const SequenceGenerator generator(target, opts.generator);
        const FitnessEvaluator evaluator(opts.weights);

        std::shared_ptr<const StructurePredictor> predictor =
            std::make_shared<ChouFasmanPredictor>();
        if (opts.timeout_ms > 0) {
            predictor = std::make_shared<TimeoutPredictor>(
                predictor, std::chrono::milliseconds(opts.timeout_ms));
        }

        Optimizer optimizer(target, generator, *predictor, evaluator, opts.params);

        if (opts.verbose) {
            print_target(target);
            std::cerr << "Predictor: " << predictor->name() << "\n";
            std::cerr << "Population " << opts.params.population_size
                      << ", max iterations " << opts.params.max_iterations
                      << ", seed " << opts.params.seed;
#ifdef _OPENMP
            const int threads = opts.params.num_threads > 0 ? opts.params.num_threads
                                                            : omp_get_max_threads();
            std::cerr << ", threads " << threads;
#endif
            std::cerr << "\n";
        }

        int iteration = 0;
        FunctionObserver progress([&](const Candidate&, double score) {
            ++iteration;
            if (opts.quiet) return;
            if (iteration % PROGRESS_EVERY == 0 || opts.verbose) {
                std::cerr << "[Iteration " << iteration << "] best fitness: "
                          << std::fixed << std::setprecision(4) << score << "\n";
            }
        });

        log_utils::log_info("Running optimization...");
        const OptimizationResult result = optimizer.run(&progress);

        print_result(std::cout, result);

        if (!opts.output_fasta.empty()) {
            FastaWriter writer(opts.output_fasta);
            std::ostringstream desc;
            desc << std::fixed << std::setprecision(4)
                 << "score=" << result.best_score()
                 << " length=" << result.best.sequence.size()
                 << " stop=" << stop_reason_name(result.stop_reason);
            writer.write_sequence("protdes_design_1", desc.str(), result.best.sequence);
            writer.close();
        }

        if (!opts.history_file.empty()) {
            std::ofstream out(opts.history_file);
            if (!out) {
                std::cerr << "Error: Cannot open output file: " << opts.history_file << "\n";
                return 1;
            }
            write_history_tsv(out, result.history);
            out.flush();
            if (!out) {
                std::cerr << "Error: Failed to write history file: " << opts.history_file << "\n";
                return 1;
            }
        }

        if (!opts.summary_file.empty()) {
            std::ofstream out(opts.summary_file);
            if (!out) {
                std::cerr << "Error: Cannot open output file: " << opts.summary_file << "\n";
                return 1;
            }
            write_result_json(out, result, target, optimizer.parameters(), evaluator.weights());
            out.flush();
            if (!out) {
                std::cerr << "Error: Failed to write summary file: " << opts.summary_file << "\n";
                return 1;
            }
        }

        auto run_end = std::chrono::steady_clock::now();
        log_utils::log_info("Runtime: " + log_utils::format_elapsed(run_start, run_end));
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') std::cerr << e.what() << "\n";
        return e.exit_code();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

}  // namespace cli
}  // namespace protdes

// protdes score: score existing sequences against a design target
//
// Usage: protdes score <input.fa[.gz]> [target flags] [-o scores.tsv]
//
// Each record is predicted and scored independently. A record the
// predictor rejects is reported with score 0 and the error text.

#include "commands.hpp"
#include "args.hpp"
#include "protdes/fitness_evaluator.hpp"
#include "protdes/log_utils.hpp"
#include "protdes/report.hpp"
#include "protdes/sequence_io.hpp"
#include "protdes/structure_predictor.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace protdes {
namespace cli {

int cmd_score(int argc, char* argv[]) {
    auto run_start = std::chrono::steady_clock::now();

    ScoreOptions opts;
    try {
        opts = parse_score_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') std::cerr << e.what() << "\n";
        return e.exit_code();
    }

    try {
        const DesignTarget target = build_target(opts.target);
        const FitnessEvaluator evaluator(opts.weights);
        const ChouFasmanPredictor predictor;

        SequenceReader reader(opts.input_file);
        std::vector<SequenceRecord> records = reader.read_all();
        if (opts.verbose) {
            std::cerr << "Read " << records.size() << " sequences from " << opts.input_file << "\n";
        }

        const long n = static_cast<long>(records.size());
        std::vector<Candidate> scored(records.size());
        std::vector<std::string> errors(records.size());

#ifdef _OPENMP
        const int num_threads = opts.num_threads > 0 ? opts.num_threads : omp_get_max_threads();
#else
        const int num_threads = 1;
#endif

        #pragma omp parallel for schedule(dynamic) num_threads(num_threads) if(num_threads > 1)
        for (long i = 0; i < n; ++i) {
            Candidate& cand = scored[i];
            cand.sequence = SequenceUtils::clean(records[i].sequence);
            try {
                StructureRecord record = predictor.predict(cand.sequence);
                cand.score = evaluator.evaluate(record, target);
                cand.structure = std::move(record);
            } catch (const std::exception& e) {
                cand.failed = true;
                errors[i] = e.what();
            }
        }

        std::ostream* out = &std::cout;
        std::ofstream file_out;
        if (!opts.output_file.empty()) {
            file_out.open(opts.output_file);
            if (!file_out.is_open()) {
                std::cerr << "Error: Cannot open output file: " << opts.output_file << "\n";
                return 1;
            }
            out = &file_out;
        }

        size_t failed = 0;
        write_score_header(*out);
        for (size_t i = 0; i < scored.size(); ++i) {
            if (scored[i].failed) ++failed;
            write_score_row(*out, records[i].id, scored[i], errors[i]);
        }

        if (failed > 0) {
            log_utils::log_warning(std::to_string(failed) + " of " +
                                   std::to_string(scored.size()) + " sequences could not be scored");
        }
        if (!opts.output_file.empty()) {
            file_out.flush();
            if (!file_out) {
                std::cerr << "Error: Failed to write output file: " << opts.output_file << "\n";
                return 1;
            }
        }
        if (opts.verbose) {
            auto run_end = std::chrono::steady_clock::now();
            log_utils::log_info("Runtime: " + log_utils::format_elapsed(run_start, run_end));
        }
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

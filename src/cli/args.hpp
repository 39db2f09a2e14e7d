#ifndef PROTDES_CLI_ARGS_HPP
#define PROTDES_CLI_ARGS_HPP

#include "protdes/design_target.hpp"
#include "protdes/fitness_evaluator.hpp"
#include "protdes/optimizer.hpp"
#include "protdes/sequence_generator.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace protdes {
namespace cli {

// Thrown by the parsers for --help (code 0) and usage errors (code 1)
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int code, const std::string& msg = {})
        : std::runtime_error(msg), code_(code) {}
    int exit_code() const { return code_; }

private:
    int code_;
};

// Target flags. Unset fields fall back to the preset.
struct TargetOptions {
    std::string preset = "enzyme";  // "enzyme" or "none"
    std::optional<LengthRange> length;
    std::optional<std::pair<double, double>> helix;
    std::optional<std::pair<double, double>> sheet;
    std::optional<std::pair<double, double>> hydropathy;
    std::optional<std::pair<double, double>> charge;
    std::optional<CatalyticResidues> catalytic;
    std::optional<KeyResidues> key;
    std::optional<std::string> desired_function;
};

struct DesignOptions {
    TargetOptions target;
    OptimizationParameters params;
    GeneratorOptions generator;
    FitnessWeights weights;
    int timeout_ms = 0;             // 0 = no predictor timeout
    std::string output_fasta;       // best sequence (.gz = compressed)
    std::string history_file;       // per-iteration TSV
    std::string summary_file;       // JSON summary
    bool verbose = false;
    bool quiet = false;
};

struct ScoreOptions {
    TargetOptions target;
    FitnessWeights weights;
    std::string input_file;
    std::string output_file;        // empty = stdout
    int num_threads = 1;
    bool verbose = false;
};

// "MIN:MAX" -> pair; throws ParseArgsExit
std::pair<double, double> parse_range(const std::string& flag, const std::string& value);

// "POS=SYMS[,POS=SYMS..]", e.g. "50=H,100=DE"
CatalyticResidues parse_catalytic(const std::string& flag, const std::string& value);

// "POS=SYM[,POS=SYM..]", e.g. "25=P,75=G"
KeyResidues parse_key(const std::string& flag, const std::string& value);

// "S:F:T"
FitnessWeights parse_weights(const std::string& flag, const std::string& value);

// Merge flags over the preset. Throws InvalidTargetError for an invalid result.
DesignTarget build_target(const TargetOptions& opts);

void print_design_usage(const char* program_name);
void print_score_usage(const char* program_name);

// argv[0] is the subcommand name
DesignOptions parse_design_args(int argc, char* argv[]);
ScoreOptions parse_score_args(int argc, char* argv[]);

}  // namespace cli
}  // namespace protdes

#endif  // PROTDES_CLI_ARGS_HPP

#include "args.hpp"
#include "protdes/residue_tables.hpp"
#include "protdes/version.h"

#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace protdes {
namespace cli {

namespace {

int parse_int(const std::string& flag, const std::string& value) {
    try {
        size_t idx = 0;
        int parsed = std::stoi(value, &idx);
        if (idx != value.size()) {
            throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
        }
        return parsed;
    } catch (const ParseArgsExit&) {
        throw;
    } catch (const std::exception&) {
        throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
    }
}

uint64_t parse_u64(const std::string& flag, const std::string& value) {
    try {
        size_t idx = 0;
        uint64_t parsed = std::stoull(value, &idx);
        if (idx != value.size() || value.empty() || value[0] == '-') {
            throw ParseArgsExit(1, "Error: Invalid unsigned integer for " + flag + ": " + value);
        }
        return parsed;
    } catch (const ParseArgsExit&) {
        throw;
    } catch (const std::exception&) {
        throw ParseArgsExit(1, "Error: Invalid unsigned integer for " + flag + ": " + value);
    }
}

double parse_double(const std::string& flag, const std::string& value) {
    try {
        size_t idx = 0;
        double parsed = std::stod(value, &idx);
        if (idx != value.size()) {
            throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
        }
        return parsed;
    } catch (const ParseArgsExit&) {
        throw;
    } catch (const std::exception&) {
        throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
    }
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, delim)) {
        parts.push_back(item);
    }
    if (!s.empty() && s.back() == delim) parts.emplace_back();
    return parts;
}

// "POS=VALUE" items of a comma list
std::vector<std::pair<int, std::string>> parse_position_list(const std::string& flag,
                                                             const std::string& value) {
    std::vector<std::pair<int, std::string>> items;
    for (const auto& item : split(value, ',')) {
        const auto eq = item.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == item.size()) {
            throw ParseArgsExit(1, "Error: Expected POS=RESIDUES in " + flag + ": " + item);
        }
        const int pos = parse_int(flag, item.substr(0, eq));
        std::string syms;
        for (char c : item.substr(eq + 1)) {
            const char u = fast_upper(c);
            if (!is_standard_residue(u)) {
                throw ParseArgsExit(1, "Error: Non-standard residue '" + std::string(1, c) +
                                       "' in " + flag);
            }
            syms.push_back(u);
        }
        items.emplace_back(pos, syms);
    }
    return items;
}

// Consumes a target flag at argv[i]; returns false if arg is not one
bool parse_target_flag(TargetOptions& t, const std::string& arg,
                       int& i, int argc, char* argv[]) {
    auto require_value = [&](const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw ParseArgsExit(1, "Error: Missing value for " + flag);
        }
        return argv[++i];
    };

    if (arg == "--preset") {
        t.preset = require_value(arg);
        if (t.preset != "enzyme" && t.preset != "none") {
            throw ParseArgsExit(1, "Error: Unknown preset '" + t.preset + "' (enzyme, none)");
        }
    } else if (arg == "--length") {
        std::string v = require_value(arg);
        const auto parts = split(v, ':');
        if (parts.size() != 2) {
            throw ParseArgsExit(1, "Error: Expected MIN:MAX for " + arg + ": " + v);
        }
        t.length = LengthRange{parse_int(arg, parts[0]), parse_int(arg, parts[1])};
    } else if (arg == "--helix") {
        t.helix = parse_range(arg, require_value(arg));
    } else if (arg == "--sheet") {
        t.sheet = parse_range(arg, require_value(arg));
    } else if (arg == "--hydropathy") {
        t.hydropathy = parse_range(arg, require_value(arg));
    } else if (arg == "--charge") {
        t.charge = parse_range(arg, require_value(arg));
    } else if (arg == "--catalytic") {
        t.catalytic = parse_catalytic(arg, require_value(arg));
    } else if (arg == "--key") {
        t.key = parse_key(arg, require_value(arg));
    } else if (arg == "--function") {
        t.desired_function = require_value(arg);
    } else {
        return false;
    }
    return true;
}

void print_target_flags() {
    std::cout << "Target:\n";
    std::cout << "  --preset <name>          enzyme (default) or none; flags below override it\n";
    std::cout << "  --length MIN:MAX         Sequence length range (required with --preset none)\n";
    std::cout << "  --helix MIN:MAX          Helix fraction band\n";
    std::cout << "  --sheet MIN:MAX          Sheet fraction band\n";
    std::cout << "  --hydropathy MIN:MAX     GRAVY band\n";
    std::cout << "  --charge MIN:MAX         Net charge band at pH 7\n";
    std::cout << "  --catalytic POS=SYMS,..  Catalytic positions and allowed residues (1-based)\n";
    std::cout << "  --key POS=SYM,..         Required residues at key positions (1-based)\n";
    std::cout << "  --function TEXT          Desired function description\n";
    std::cout << "  --weights S:F:T          Stability:function:structure weights (default 0.3:0.5:0.2)\n";
}

}  // namespace

std::pair<double, double> parse_range(const std::string& flag, const std::string& value) {
    const auto parts = split(value, ':');
    if (parts.size() != 2) {
        throw ParseArgsExit(1, "Error: Expected MIN:MAX for " + flag + ": " + value);
    }
    return {parse_double(flag, parts[0]), parse_double(flag, parts[1])};
}

CatalyticResidues parse_catalytic(const std::string& flag, const std::string& value) {
    CatalyticResidues out;
    for (const auto& [pos, syms] : parse_position_list(flag, value)) {
        out[pos].insert(syms.begin(), syms.end());
    }
    return out;
}

KeyResidues parse_key(const std::string& flag, const std::string& value) {
    KeyResidues out;
    for (const auto& [pos, syms] : parse_position_list(flag, value)) {
        if (syms.size() != 1) {
            throw ParseArgsExit(1, "Error: Key position " + std::to_string(pos) +
                                   " needs exactly one residue in " + flag);
        }
        out[pos] = syms[0];
    }
    return out;
}

FitnessWeights parse_weights(const std::string& flag, const std::string& value) {
    const auto parts = split(value, ':');
    if (parts.size() != 3) {
        throw ParseArgsExit(1, "Error: Expected S:F:T for " + flag + ": " + value);
    }
    FitnessWeights w;
    w.stability = parse_double(flag, parts[0]);
    w.function = parse_double(flag, parts[1]);
    w.structure = parse_double(flag, parts[2]);
    return w;
}

DesignTarget build_target(const TargetOptions& opts) {
    LengthRange length{};
    SecondaryStructureTarget ss;
    PropertyTarget props;
    CatalyticResidues catalytic;
    KeyResidues key;
    std::string function;

    if (opts.preset == "enzyme") {
        const DesignTarget preset = DesignTarget::catalytic_triad_enzyme();
        length = preset.length_range();
        ss = preset.secondary_structure();
        props = preset.properties();
        catalytic = preset.catalytic_residues();
        key = preset.key_residues();
        function = preset.desired_function();
    } else if (!opts.length) {
        throw ParseArgsExit(1, "Error: --length is required with --preset none");
    }

    if (opts.length) length = *opts.length;
    if (opts.helix) { ss.min_helix = opts.helix->first; ss.max_helix = opts.helix->second; }
    if (opts.sheet) { ss.min_sheet = opts.sheet->first; ss.max_sheet = opts.sheet->second; }
    if (opts.hydropathy) {
        props.min_hydropathy = opts.hydropathy->first;
        props.max_hydropathy = opts.hydropathy->second;
    }
    if (opts.charge) { props.min_charge = opts.charge->first; props.max_charge = opts.charge->second; }
    if (opts.catalytic) catalytic = *opts.catalytic;
    if (opts.key) key = *opts.key;
    if (opts.desired_function) function = *opts.desired_function;

    return DesignTarget(length, ss, props, std::move(catalytic), std::move(key), std::move(function));
}

void print_design_usage(const char* program_name) {
    std::cout << "protdes v" << PROTDES_VERSION << "\n\n";
    std::cout << "Usage: " << program_name << " design [options]\n\n";
    print_target_flags();
    std::cout << "\nOptimizer:\n";
    std::cout << "  --iterations <int>       Maximum iterations (default: 100)\n";
    std::cout << "  --population <int>       Population size (default: 20)\n";
    std::cout << "  --mutation-rate <f>      Per-residue mutation probability (default: 0.1)\n";
    std::cout << "  --temperature <f>        Initial temperature (default: 1.0)\n";
    std::cout << "  --cooling-rate <f>       Temperature multiplier per iteration (default: 0.99)\n";
    std::cout << "  --crossover-rate <f>     Crossover probability (default: 0.8)\n";
    std::cout << "  --elite <int>            Elite size (default: 2)\n";
    std::cout << "  --patience <int>         Stop after N iterations without improvement (default: 20)\n";
    std::cout << "  --seed <int>             Random seed (default: 42)\n";
    std::cout << "  -t, --threads <int>      Evaluation threads, 0 = auto (default: 1)\n";
    std::cout << "  --timeout-ms <int>       Per-prediction timeout (default: none)\n";
    std::cout << "  --length-mutation        Allow insertions and deletions\n";
    std::cout << "  --two-point              Two-point crossover\n";
    std::cout << "\nOutput:\n";
    std::cout << "  -o, --output <file>      Best sequence as FASTA (.gz compresses)\n";
    std::cout << "  --history <file>         Per-iteration fitness history (TSV)\n";
    std::cout << "  --summary <file>         Result summary (JSON)\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -q, --quiet              No progress output\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " design --seed 7 -o best.fa --summary best.json\n";
    std::cout << "  " << program_name << " design --preset none --length 60:80 --helix 0.4:0.6 --key 10=W\n";
}

void print_score_usage(const char* program_name) {
    std::cout << "protdes v" << PROTDES_VERSION << "\n\n";
    std::cout << "Usage: " << program_name << " score <input.fa[.gz]> [options]\n\n";
    print_target_flags();
    std::cout << "\nOutput:\n";
    std::cout << "  -o, --output <file>      Score table (TSV, default: stdout)\n";
    std::cout << "  -t, --threads <int>      Threads, 0 = auto (default: 1)\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -h, --help               Show this help message\n";
}

DesignOptions parse_design_args(int argc, char* argv[]) {
    DesignOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        if (parse_target_flag(opts.target, arg, i, argc, argv)) {
            continue;
        } else if (arg == "-h" || arg == "--help") {
            print_design_usage("protdes");
            throw ParseArgsExit(0);
        } else if (arg == "--iterations") {
            opts.params.max_iterations = parse_int(arg, require_value(arg));
        } else if (arg == "--population") {
            opts.params.population_size = parse_int(arg, require_value(arg));
        } else if (arg == "--mutation-rate") {
            opts.params.mutation_rate = parse_double(arg, require_value(arg));
        } else if (arg == "--temperature") {
            opts.params.temperature = parse_double(arg, require_value(arg));
        } else if (arg == "--cooling-rate") {
            opts.params.cooling_rate = parse_double(arg, require_value(arg));
        } else if (arg == "--crossover-rate") {
            opts.params.crossover_rate = parse_double(arg, require_value(arg));
        } else if (arg == "--elite") {
            opts.params.elite_size = parse_int(arg, require_value(arg));
        } else if (arg == "--patience") {
            opts.params.patience = parse_int(arg, require_value(arg));
        } else if (arg == "--seed") {
            opts.params.seed = parse_u64(arg, require_value(arg));
        } else if (arg == "-t" || arg == "--threads") {
            opts.params.num_threads = parse_int(arg, require_value(arg));
            if (opts.params.num_threads < 0) {
                throw ParseArgsExit(1, "Error: --threads must be >= 0");
            }
        } else if (arg == "--timeout-ms") {
            opts.timeout_ms = parse_int(arg, require_value(arg));
            if (opts.timeout_ms < 1) {
                throw ParseArgsExit(1, "Error: --timeout-ms must be >= 1");
            }
        } else if (arg == "--length-mutation") {
            opts.generator.allow_length_mutation = true;
        } else if (arg == "--two-point") {
            opts.generator.crossover_points = 2;
        } else if (arg == "--weights") {
            opts.weights = parse_weights(arg, require_value(arg));
        } else if (arg == "-o" || arg == "--output") {
            opts.output_fasta = require_value(arg);
        } else if (arg == "--history") {
            opts.history_file = require_value(arg);
        } else if (arg == "--summary") {
            opts.summary_file = require_value(arg);
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (opts.verbose && opts.quiet) {
        throw ParseArgsExit(1, "Error: --verbose and --quiet are mutually exclusive");
    }

    return opts;
}

ScoreOptions parse_score_args(int argc, char* argv[]) {
    ScoreOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        if (parse_target_flag(opts.target, arg, i, argc, argv)) {
            continue;
        } else if (arg == "-h" || arg == "--help") {
            print_score_usage("protdes");
            throw ParseArgsExit(0);
        } else if (arg == "--weights") {
            opts.weights = parse_weights(arg, require_value(arg));
        } else if (arg == "-o" || arg == "--output") {
            opts.output_file = require_value(arg);
        } else if (arg == "-t" || arg == "--threads") {
            opts.num_threads = parse_int(arg, require_value(arg));
            if (opts.num_threads < 0) {
                throw ParseArgsExit(1, "Error: --threads must be >= 0");
            }
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        } else if (opts.input_file.empty()) {
            opts.input_file = arg;
        } else {
            throw ParseArgsExit(1, "Error: Unexpected argument: " + arg);
        }
    }

    if (opts.input_file.empty()) {
        throw ParseArgsExit(1, "Error: No input file specified");
    }

    return opts;
}

}  // namespace cli
}  // namespace protdes

#include "protdes/report.hpp"
#include "protdes/version.h"

#include <cstdio>
#include <iomanip>
#include <ostream>

namespace protdes {

std::string json_string(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
    return out;
}

void write_history_tsv(std::ostream& out, const std::vector<IterationStats>& history) {
    out << "iteration\tbest_score\tmean_score\ttemperature\tevaluated\taccepted\tfailures\n";
    out << std::fixed;
    for (const auto& h : history) {
        out << h.iteration
            << '\t' << std::setprecision(6) << h.best_score
            << '\t' << std::setprecision(6) << h.mean_score
            << '\t' << std::setprecision(6) << h.temperature
            << '\t' << h.evaluated
            << '\t' << h.accepted
            << '\t' << h.failures
            << '\n';
    }
}

void write_result_json(std::ostream& out,
                       const OptimizationResult& result,
                       const DesignTarget& target,
                       const OptimizationParameters& params,
                       const FitnessWeights& weights) {
    const Candidate& best = result.best;
    const auto& len = target.length_range();
    const auto& ss = target.secondary_structure();
    const auto& pt = target.properties();

    out << std::fixed;
    out << "{\n";
    out << "  \"version\": \"" << PROTDES_VERSION << "\",\n";
    out << "  \"best\": {\n";
    out << "    \"sequence\": " << json_string(best.sequence) << ",\n";
    out << "    \"length\": " << best.sequence.size() << ",\n";
    out << "    \"score\": {\n";
    out << "      \"total\": " << std::setprecision(6) << best.score.total << ",\n";
    out << "      \"stability\": " << std::setprecision(6) << best.score.stability << ",\n";
    out << "      \"function\": " << std::setprecision(6) << best.score.function << ",\n";
    out << "      \"structure\": " << std::setprecision(6) << best.score.structure << ",\n";
    out << "      \"constraint_satisfaction\": " << std::setprecision(6)
        << best.score.constraint_satisfaction << "\n";
    out << "    },\n";
    if (best.structure) {
        const auto& p = best.structure->properties;
        const auto& s = best.structure->secondary_structure;
        out << "    \"properties\": {\n";
        out << "      \"hydropathy\": " << std::setprecision(4) << p.hydropathy << ",\n";
        out << "      \"net_charge\": " << std::setprecision(4) << p.net_charge << ",\n";
        out << "      \"molecular_weight\": " << std::setprecision(2) << p.molecular_weight << ",\n";
        out << "      \"aromaticity\": " << std::setprecision(4) << p.aromaticity << "\n";
        out << "    },\n";
        out << "    \"secondary_structure\": {\n";
        out << "      \"helix\": " << std::setprecision(4) << s.helix << ",\n";
        out << "      \"sheet\": " << std::setprecision(4) << s.sheet << ",\n";
        out << "      \"coil\": " << std::setprecision(4) << s.coil << "\n";
        out << "    },\n";
        out << "    \"predictor\": " << json_string(best.structure->predictor) << "\n";
    } else {
        out << "    \"properties\": null,\n";
        out << "    \"secondary_structure\": null,\n";
        out << "    \"predictor\": null\n";
    }
    out << "  },\n";

    out << "  \"run\": {\n";
    out << "    \"stop_reason\": \"" << stop_reason_name(result.stop_reason) << "\",\n";
    out << "    \"iterations\": " << result.iterations << ",\n";
    out << "    \"predictor_calls\": " << result.predictor_calls << ",\n";
    out << "    \"predictor_failures\": " << result.predictor_failures << "\n";
    out << "  },\n";

    out << "  \"target\": {\n";
    out << "    \"length\": [" << len.min << ", " << len.max << "],\n";
    out << "    \"helix\": [" << std::setprecision(4) << ss.min_helix << ", " << ss.max_helix << "],\n";
    out << "    \"sheet\": [" << std::setprecision(4) << ss.min_sheet << ", " << ss.max_sheet << "],\n";
    out << "    \"hydropathy\": [" << std::setprecision(4) << pt.min_hydropathy << ", "
        << pt.max_hydropathy << "],\n";
    out << "    \"charge\": [" << std::setprecision(4) << pt.min_charge << ", " << pt.max_charge << "],\n";
    out << "    \"catalytic_residues\": {";
    bool first = true;
    for (const auto& [pos, allowed] : target.catalytic_residues()) {
        out << (first ? "" : ", ") << "\"" << pos << "\": "
            << json_string(std::string(allowed.begin(), allowed.end()));
        first = false;
    }
    out << "},\n";
    out << "    \"key_residues\": {";
    first = true;
    for (const auto& [pos, aa] : target.key_residues()) {
        out << (first ? "" : ", ") << "\"" << pos << "\": " << json_string(std::string(1, aa));
        first = false;
    }
    out << "},\n";
    out << "    \"desired_function\": " << json_string(target.desired_function()) << "\n";
    out << "  },\n";

    out << "  \"parameters\": {\n";
    out << "    \"max_iterations\": " << params.max_iterations << ",\n";
    out << "    \"population_size\": " << params.population_size << ",\n";
    out << "    \"mutation_rate\": " << std::setprecision(4) << params.mutation_rate << ",\n";
    out << "    \"temperature\": " << std::setprecision(4) << params.temperature << ",\n";
    out << "    \"cooling_rate\": " << std::setprecision(4) << params.cooling_rate << ",\n";
    out << "    \"crossover_rate\": " << std::setprecision(4) << params.crossover_rate << ",\n";
    out << "    \"elite_size\": " << params.elite_size << ",\n";
    out << "    \"patience\": " << params.patience << ",\n";
    out << "    \"seed\": " << params.seed << ",\n";
    out << "    \"weights\": [" << std::setprecision(4) << weights.stability << ", "
        << weights.function << ", " << weights.structure << "]\n";
    out << "  }\n";
    out << "}\n";
}

void write_score_header(std::ostream& out) {
    out << "id\tlength\ttotal\tstability\tfunction\tstructure\tconstraints"
        << "\thydropathy\tnet_charge\tmolecular_weight\taromaticity"
        << "\thelix\tsheet\tcoil\terror\n";
}

void write_score_row(std::ostream& out,
                     const std::string& id,
                     const Candidate& candidate,
                     const std::string& error) {
    out << std::fixed;
    out << id << '\t' << candidate.sequence.size()
        << '\t' << std::setprecision(4) << candidate.score.total
        << '\t' << std::setprecision(4) << candidate.score.stability
        << '\t' << std::setprecision(4) << candidate.score.function
        << '\t' << std::setprecision(4) << candidate.score.structure
        << '\t' << std::setprecision(4) << candidate.score.constraint_satisfaction;
    if (candidate.structure) {
        const auto& p = candidate.structure->properties;
        const auto& s = candidate.structure->secondary_structure;
        out << '\t' << std::setprecision(4) << p.hydropathy
            << '\t' << std::setprecision(4) << p.net_charge
            << '\t' << std::setprecision(2) << p.molecular_weight
            << '\t' << std::setprecision(4) << p.aromaticity
            << '\t' << std::setprecision(4) << s.helix
            << '\t' << std::setprecision(4) << s.sheet
            << '\t' << std::setprecision(4) << s.coil;
    } else {
        out << "\tNA\tNA\tNA\tNA\tNA\tNA\tNA";
    }
    out << '\t' << (error.empty() ? "-" : error) << '\n';
}

void print_result(std::ostream& out, const OptimizationResult& result) {
    const Candidate& best = result.best;
    out << "\nOptimization results:\n";
    out << "  Best sequence: " << best.sequence << "\n";
    out << "  Length: " << best.sequence.size() << " aa\n";
    out << "  Best fitness: " << std::fixed << std::setprecision(4) << best.score.total << "\n";
    out << "    stability " << best.score.stability
        << ", function " << best.score.function
        << ", structure " << best.score.structure
        << ", constraints " << best.score.constraint_satisfaction << "\n";
    out << "  Stop: " << stop_reason_name(result.stop_reason)
        << " after " << result.iterations << " iterations ("
        << result.predictor_calls << " predictions, "
        << result.predictor_failures << " failed)\n";

    if (!best.structure) {
        out << "  No structure record (prediction failed)\n";
        return;
    }
    const auto& p = best.structure->properties;
    out << "\nSequence properties:\n";
    out << "  hydropathy: " << std::setprecision(4) << p.hydropathy << "\n";
    out << "  net_charge: " << std::setprecision(4) << p.net_charge << "\n";
    out << "  molecular_weight: " << std::setprecision(2) << p.molecular_weight << "\n";
    out << "  aromaticity: " << std::setprecision(4) << p.aromaticity << "\n";

    const auto& s = best.structure->secondary_structure;
    out << "\nSecondary structure content:\n";
    out << "  helix: " << std::setprecision(4) << s.helix << "\n";
    out << "  sheet: " << std::setprecision(4) << s.sheet << "\n";
    out << "  coil: " << std::setprecision(4) << s.coil << "\n";
}

} // namespace protdes

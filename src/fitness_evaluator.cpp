#include "protdes/fitness_evaluator.hpp"
#include "protdes/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace protdes {

constexpr double WEIGHT_SUM_TOL = 1e-6;
constexpr double MAX_ABS_HYDROPATHY = 4.5;  // Kyte-Doolittle extreme (Ile)

void FitnessWeights::validate() const {
    const double w[3] = {stability, function, structure};
    const char* names[3] = {"stability", "function", "structure"};
    for (int i = 0; i < 3; ++i) {
        if (!std::isfinite(w[i]) || w[i] < 0.0) {
            throw InvalidWeightsError(std::string(names[i]) + " weight must be finite and >= 0");
        }
    }
    const double sum = stability + function + structure;
    if (std::abs(sum - 1.0) > WEIGHT_SUM_TOL) {
        throw InvalidWeightsError("weights sum to " + std::to_string(sum) + ", expected 1");
    }
}

void ScoringTolerances::validate() const {
    if (!(fraction > 0.0) || !(hydropathy > 0.0) || !(charge > 0.0) ||
        !std::isfinite(fraction) || !std::isfinite(hydropathy) || !std::isfinite(charge)) {
        throw InvalidParametersError("scoring tolerances must be finite and > 0");
    }
}

double band_score(double value, double lo, double hi, double tolerance) {
    double distance = 0.0;
    if (value < lo) {
        distance = lo - value;
    } else if (value > hi) {
        distance = value - hi;
    } else {
        return 1.0;
    }
    return std::max(0.0, 1.0 - distance / tolerance);
}

void validate_record(const StructureRecord& record) {
    const auto& ss = record.secondary_structure;
    for (double f : {ss.helix, ss.sheet, ss.coil}) {
        if (!std::isfinite(f) || f < 0.0 || f > 1.0) {
            throw PredictorFailure("structure fraction outside [0,1]");
        }
    }
    if (ss.helix + ss.sheet + ss.coil > 1.0 + 1e-9) {
        throw PredictorFailure("structure fractions sum above 1");
    }
    const auto& p = record.properties;
    if (!std::isfinite(p.hydropathy) || !std::isfinite(p.net_charge) ||
        !std::isfinite(p.molecular_weight) || !std::isfinite(p.aromaticity)) {
        throw PredictorFailure("non-finite sequence property");
    }
}

FitnessEvaluator::FitnessEvaluator(FitnessWeights weights, ScoringTolerances tolerances)
    : weights_(weights), tolerances_(tolerances) {
    weights_.validate();
    tolerances_.validate();
}

double FitnessEvaluator::structure_score(const StructureRecord& record,
                                         const DesignTarget& target) const {
    const auto& ss = record.secondary_structure;
    const auto& band = target.secondary_structure();
    const double helix = band_score(ss.helix, band.min_helix, band.max_helix, tolerances_.fraction);
    const double sheet = band_score(ss.sheet, band.min_sheet, band.max_sheet, tolerances_.fraction);
    return 0.5 * (helix + sheet);
}

double FitnessEvaluator::property_score(const StructureRecord& record,
                                        const DesignTarget& target) const {
    const auto& p = record.properties;
    const auto& band = target.properties();
    const double hyd = band_score(p.hydropathy, band.min_hydropathy, band.max_hydropathy,
                                  tolerances_.hydropathy);
    const double charge = band_score(p.net_charge, band.min_charge, band.max_charge,
                                     tolerances_.charge);
    return 0.5 * (hyd + charge);
}

// Recomputed from the record's sequence so the evaluator does not rely on
// the generator having enforced the constraints
double FitnessEvaluator::constraint_satisfaction(const StructureRecord& record,
                                                 const DesignTarget& target) const {
    const size_t total = target.fixed_position_count();
    if (total == 0) return 1.0;

    size_t satisfied = 0;
    for (const auto& [pos, allowed] : target.catalytic_residues()) {
        if (target.position_satisfied(record.sequence, pos)) ++satisfied;
    }
    for (const auto& [pos, aa] : target.key_residues()) {
        if (target.catalytic_residues().count(pos) > 0) continue;  // counted above
        if (target.position_satisfied(record.sequence, pos)) ++satisfied;
    }
    return static_cast<double>(satisfied) / static_cast<double>(total);
}

double FitnessEvaluator::stability_score(const StructureRecord& record) const {
    const double balance =
        1.0 - std::min(std::abs(record.properties.hydropathy) / MAX_ABS_HYDROPATHY, 1.0);
    const auto& ss = record.secondary_structure;
    const double order = std::clamp(ss.helix + ss.sheet, 0.0, 1.0);
    return 0.5 * (balance + order);
}

FitnessScore FitnessEvaluator::evaluate(const StructureRecord& record,
                                        const DesignTarget& target) const {
    validate_record(record);

    FitnessScore score;
    score.structure = structure_score(record, target);
    score.constraint_satisfaction = constraint_satisfaction(record, target);
    score.function = 0.5 * (property_score(record, target) + score.constraint_satisfaction);
    score.stability = stability_score(record);
    score.total = std::clamp(weights_.stability * score.stability +
                             weights_.function * score.function +
                             weights_.structure * score.structure,
                             0.0, 1.0);
    return score;
}

FitnessScore evaluate_fitness(const StructureRecord& record,
                              const DesignTarget& target,
                              const FitnessWeights& weights) {
    return FitnessEvaluator(weights).evaluate(record, target);
}

} // namespace protdes

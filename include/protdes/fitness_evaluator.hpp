#pragma once
// Fitness model: scores a predicted structure against a DesignTarget.
//
// Three sub-scores, each in [0,1] (higher is better):
//   structure  mean band score of helix and sheet fractions
//   function   mean of (mean band score of hydropathy and net charge) and
//              (fraction of fixed-position constraints satisfied)
//   stability  mean of hydropathy balance 1 - min(|GRAVY|/4.5, 1) and
//              structural order helix + sheet
// Band score: 1 inside [min,max], falling linearly to 0 at `tolerance`
// outside the band.
//
// total = w_stability * stability + w_function * function + w_structure * structure

#include "protdes/design_target.hpp"
#include "protdes/structure_predictor.hpp"

namespace protdes {

struct FitnessWeights {
    double stability = 0.3;
    double function = 0.5;
    double structure = 0.2;

    // Throws InvalidWeightsError unless all weights are finite, >= 0 and sum to 1
    void validate() const;
};

// Distance outside a band at which its score reaches 0
struct ScoringTolerances {
    double fraction = 0.25;
    double hydropathy = 1.0;
    double charge = 10.0;

    void validate() const;
};

struct FitnessScore {
    double total = 0.0;
    double stability = 0.0;
    double function = 0.0;
    double structure = 0.0;
    double constraint_satisfaction = 0.0;
};

// 1 inside [lo,hi], linear decay to 0 at distance tolerance
double band_score(double value, double lo, double hi, double tolerance);

// Throws PredictorFailure if the record has non-finite values, fractions
// outside [0,1] or fractions summing above 1
void validate_record(const StructureRecord& record);

class FitnessEvaluator {
public:
    explicit FitnessEvaluator(FitnessWeights weights = {},
                              ScoringTolerances tolerances = {});

    // Pure function of its inputs
    FitnessScore evaluate(const StructureRecord& record, const DesignTarget& target) const;

    double structure_score(const StructureRecord& record, const DesignTarget& target) const;
    double property_score(const StructureRecord& record, const DesignTarget& target) const;
    double constraint_satisfaction(const StructureRecord& record, const DesignTarget& target) const;
    double stability_score(const StructureRecord& record) const;

    const FitnessWeights& weights() const { return weights_; }
    const ScoringTolerances& tolerances() const { return tolerances_; }

private:
    FitnessWeights weights_;
    ScoringTolerances tolerances_;
};

// Convenience: evaluate with default tolerances
FitnessScore evaluate_fitness(const StructureRecord& record,
                              const DesignTarget& target,
                              const FitnessWeights& weights);

} // namespace protdes

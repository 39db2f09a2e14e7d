#pragma once
// Candidate sequence generation for a DesignTarget
//
// Fixed-position constraints are enforced by post-hoc correction: every
// sequence is built or recombined freely, then key residues are overwritten
// and catalytic positions are redrawn from their allowed sets when needed.
// This keeps every call O(length) no matter how many positions are pinned.
//
// The generator holds no random state; callers pass the engine so a single
// seeded generator drives a whole optimization run.

#include "protdes/design_target.hpp"
#include "protdes/residue_tables.hpp"

#include <random>
#include <vector>

namespace protdes {

struct GeneratorOptions {
    bool allow_length_mutation = false;  // mutate() may insert/delete one residue
    int crossover_points = 1;            // 1 or 2
};

class SequenceGenerator {
public:
    explicit SequenceGenerator(const DesignTarget& target,
                               GeneratorOptions options = {});

    // Random sequence of random feasible length with all constraints applied
    Sequence generate_initial(std::mt19937_64& rng) const;

    // Point-mutate each non-fixed position with probability rate.
    // With length mutation enabled, throws LengthMismatchError for an input
    // outside the feasible length range, and with probability rate also
    // inserts or deletes one residue.
    Sequence mutate(const Sequence& seq, double rate, std::mt19937_64& rng) const;

    // Recombine within the shorter parent's length, then re-apply constraints
    Sequence crossover(const Sequence& parent_a, const Sequence& parent_b,
                       std::mt19937_64& rng) const;

    // Overwrite key positions; redraw catalytic positions holding a disallowed residue
    void apply_constraints(Sequence& seq, std::mt19937_64& rng) const;

    // Throws LengthMismatchError or ConstraintViolationError if seq is not a
    // feasible candidate for the target
    void check_candidate(const Sequence& seq) const;

    // True if the 0-based index is pinned by a key or catalytic constraint
    bool is_fixed(size_t index) const {
        return index < fixed_mask_.size() && fixed_mask_[index];
    }

    const DesignTarget& target() const { return target_; }
    const GeneratorOptions& options() const { return options_; }

private:
    char random_residue(std::mt19937_64& rng) const;
    char random_other_residue(char current, std::mt19937_64& rng) const;
    Sequence single_point(const Sequence& a, const Sequence& b, std::mt19937_64& rng) const;
    Sequence two_point(const Sequence& a, const Sequence& b, std::mt19937_64& rng) const;
    void mutate_length(Sequence& seq, std::mt19937_64& rng) const;

    const DesignTarget& target_;
    GeneratorOptions options_;
    std::vector<bool> fixed_mask_;  // indexed by 0-based position
};

} // namespace protdes

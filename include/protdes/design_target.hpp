#pragma once
// Design target: what a designed protein sequence must look like.
//
// A DesignTarget bundles the allowed length range, secondary-structure and
// biophysical property bands, and residues pinned at fixed (1-indexed)
// positions. It is validated once in the constructor and immutable after
// that; every other component holds it by const reference.

#include "protdes/residue_tables.hpp"

#include <map>
#include <set>
#include <string>

namespace protdes {

struct LengthRange {
    int min = 0;
    int max = 0;
};

// Fraction bands in [0,1]
struct SecondaryStructureTarget {
    double min_helix = 0.0;
    double max_helix = 1.0;
    double min_sheet = 0.0;
    double max_sheet = 1.0;
};

struct PropertyTarget {
    double min_hydropathy = -4.5;   // Kyte-Doolittle GRAVY
    double max_hydropathy = 4.5;
    double min_charge = -1000.0;    // net charge at pH 7
    double max_charge = 1000.0;
};

// position (1-indexed) -> allowed residues
using CatalyticResidues = std::map<int, std::set<char>>;
// position (1-indexed) -> required residue
using KeyResidues = std::map<int, char>;

class DesignTarget {
public:
    /**
     * Build and validate a target.
     * Throws InvalidTargetError on an empty/inverted length range, any
     * min > max band, structure bounds outside [0,1], non-finite bounds,
     * fixed positions outside [1, length_range.max], empty or non-standard
     * residue sets, or a position that is both key and catalytic with no
     * common symbol.
     */
    DesignTarget(LengthRange length_range,
                 SecondaryStructureTarget secondary_structure,
                 PropertyTarget properties,
                 CatalyticResidues catalytic_residues = {},
                 KeyResidues key_residues = {},
                 std::string desired_function = {});

    // Enzyme with a His-Asp-Ser catalytic triad, 200-300 residues
    static DesignTarget catalytic_triad_enzyme();

    const LengthRange& length_range() const { return length_range_; }
    const SecondaryStructureTarget& secondary_structure() const { return secondary_structure_; }
    const PropertyTarget& properties() const { return properties_; }
    const CatalyticResidues& catalytic_residues() const { return catalytic_residues_; }
    const KeyResidues& key_residues() const { return key_residues_; }
    const std::string& desired_function() const { return desired_function_; }

    // Highest fixed position (0 when nothing is pinned)
    int max_fixed_position() const { return max_fixed_position_; }

    // Shortest length able to hold every fixed residue
    int feasible_min_length() const;

    size_t fixed_position_count() const;

    // True if a 1-indexed position carries a catalytic or key constraint
    bool is_fixed_position(int position) const;

    // True if the residue at a 1-indexed position of seq satisfies its
    // constraint. Positions without a constraint are always satisfied;
    // constrained positions past the end of seq are not.
    bool position_satisfied(const Sequence& seq, int position) const;

private:
    void validate() const;

    LengthRange length_range_;
    SecondaryStructureTarget secondary_structure_;
    PropertyTarget properties_;
    CatalyticResidues catalytic_residues_;
    KeyResidues key_residues_;
    std::string desired_function_;
    int max_fixed_position_ = 0;
};

} // namespace protdes

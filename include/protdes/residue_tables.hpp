#pragma once

#include <array>
#include <cstddef>
#include <string>

namespace protdes {

// Basic sequence types
using Sequence = std::string;

constexpr size_t NUM_RESIDUES = 20;

// Standard amino-acid alphabet, in the order used by every per-residue table
inline constexpr std::array<char, NUM_RESIDUES> RESIDUE_ALPHABET = {
    'A', 'C', 'D', 'E', 'F', 'G', 'H', 'I', 'K', 'L',
    'M', 'N', 'P', 'Q', 'R', 'S', 'T', 'V', 'W', 'Y'
};

// Fast uppercase - branchless lookup table
inline char fast_upper(char c) {
    return (c >= 'a' && c <= 'z') ? (c - 32) : c;
}

// Residue to alphabet index (0-19), -1 for anything that is not a standard residue
inline int residue_index(char aa) {
    switch (aa) {
        case 'A': return 0;
        case 'C': return 1;
        case 'D': return 2;
        case 'E': return 3;
        case 'F': return 4;
        case 'G': return 5;
        case 'H': return 6;
        case 'I': return 7;
        case 'K': return 8;
        case 'L': return 9;
        case 'M': return 10;
        case 'N': return 11;
        case 'P': return 12;
        case 'Q': return 13;
        case 'R': return 14;
        case 'S': return 15;
        case 'T': return 16;
        case 'V': return 17;
        case 'W': return 18;
        case 'Y': return 19;
        default: return -1;
    }
}

inline bool is_standard_residue(char aa) {
    return residue_index(aa) >= 0;
}

/**
 * Static per-residue tables
 *
 * Kyte-Doolittle hydropathy, average residue masses (Da, peptide bond form),
 * Chou-Fasman helix/sheet propensities (scaled so 1.0 is neutral).
 * All lookups return 0 for non-standard symbols.
 */
double hydropathy_kd(char aa);
double residue_mass(char aa);
double helix_propensity(char aa);
double sheet_propensity(char aa);

/**
 * Sequence-derived properties
 */

// Grand average of hydropathy (mean Kyte-Doolittle value); 0 for empty input
double gravy(const Sequence& seq);

// Henderson-Hasselbalch net charge including free termini
double net_charge(const Sequence& seq, double ph = 7.0);

// Average molecular weight in Da (sum of residue masses + one water)
double molecular_weight(const Sequence& seq);

// Fraction of F, W and Y
double aromaticity(const Sequence& seq);

// True if every symbol is one of the 20 standard residues
bool is_valid_protein(const Sequence& seq);

} // namespace protdes

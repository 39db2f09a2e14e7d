/**
 * Amino acid property tables
 *
 * Tables are indexed by (aa - 'A'); letters outside the standard alphabet
 * keep the fill value.
 */

#include "protdes/residue_tables.hpp"
#include <array>
#include <cmath>

namespace protdes {

// Kyte & Doolittle (1982) hydropathy index
static const std::array<double, 26> KD_HYDROPATHY = []() {
    std::array<double, 26> arr{};
    arr.fill(0.0);

    arr['A' - 'A'] = 1.8;
    arr['R' - 'A'] = -4.5;
    arr['N' - 'A'] = -3.5;
    arr['D' - 'A'] = -3.5;
    arr['C' - 'A'] = 2.5;
    arr['Q' - 'A'] = -3.5;
    arr['E' - 'A'] = -3.5;
    arr['G' - 'A'] = -0.4;
    arr['H' - 'A'] = -3.2;
    arr['I' - 'A'] = 4.5;
    arr['L' - 'A'] = 3.8;
    arr['K' - 'A'] = -3.9;
    arr['M' - 'A'] = 1.9;
    arr['F' - 'A'] = 2.8;
    arr['P' - 'A'] = -1.6;
    arr['S' - 'A'] = -0.8;
    arr['T' - 'A'] = -0.7;
    arr['W' - 'A'] = -0.9;
    arr['Y' - 'A'] = -1.3;
    arr['V' - 'A'] = 4.2;

    return arr;
}();

// Average residue masses (residue = amino acid - H2O)
static const std::array<double, 26> RESIDUE_MASS = []() {
    std::array<double, 26> arr{};
    arr.fill(0.0);

    arr['A' - 'A'] = 71.0788;
    arr['R' - 'A'] = 156.1875;
    arr['N' - 'A'] = 114.1038;
    arr['D' - 'A'] = 115.0886;
    arr['C' - 'A'] = 103.1388;
    arr['E' - 'A'] = 129.1155;
    arr['Q' - 'A'] = 128.1307;
    arr['G' - 'A'] = 57.0519;
    arr['H' - 'A'] = 137.1411;
    arr['I' - 'A'] = 113.1594;
    arr['L' - 'A'] = 113.1594;
    arr['K' - 'A'] = 128.1741;
    arr['M' - 'A'] = 131.1926;
    arr['F' - 'A'] = 147.1766;
    arr['P' - 'A'] = 97.1167;
    arr['S' - 'A'] = 87.0782;
    arr['T' - 'A'] = 101.1051;
    arr['W' - 'A'] = 186.2132;
    arr['Y' - 'A'] = 163.1760;
    arr['V' - 'A'] = 99.1326;

    return arr;
}();

constexpr double WATER_MASS = 18.01528;

// Chou & Fasman (1978) conformational parameters, P(alpha) / 100
static const std::array<double, 26> HELIX_PROPENSITY = []() {
    std::array<double, 26> arr{};
    arr.fill(0.0);

    arr['A' - 'A'] = 1.42;
    arr['R' - 'A'] = 0.98;
    arr['N' - 'A'] = 0.67;
    arr['D' - 'A'] = 1.01;
    arr['C' - 'A'] = 0.70;
    arr['E' - 'A'] = 1.51;
    arr['Q' - 'A'] = 1.11;
    arr['G' - 'A'] = 0.57;
    arr['H' - 'A'] = 1.00;
    arr['I' - 'A'] = 1.08;
    arr['L' - 'A'] = 1.21;
    arr['K' - 'A'] = 1.14;
    arr['M' - 'A'] = 1.45;
    arr['F' - 'A'] = 1.13;
    arr['P' - 'A'] = 0.57;
    arr['S' - 'A'] = 0.77;
    arr['T' - 'A'] = 0.83;
    arr['W' - 'A'] = 1.08;
    arr['Y' - 'A'] = 0.69;
    arr['V' - 'A'] = 1.06;

    return arr;
}();

// Chou & Fasman (1978) conformational parameters, P(beta) / 100
static const std::array<double, 26> SHEET_PROPENSITY = []() {
    std::array<double, 26> arr{};
    arr.fill(0.0);

    arr['A' - 'A'] = 0.83;
    arr['R' - 'A'] = 0.93;
    arr['N' - 'A'] = 0.89;
    arr['D' - 'A'] = 0.54;
    arr['C' - 'A'] = 1.19;
    arr['E' - 'A'] = 0.37;
    arr['Q' - 'A'] = 1.10;
    arr['G' - 'A'] = 0.75;
    arr['H' - 'A'] = 0.87;
    arr['I' - 'A'] = 1.60;
    arr['L' - 'A'] = 1.30;
    arr['K' - 'A'] = 0.74;
    arr['M' - 'A'] = 1.05;
    arr['F' - 'A'] = 1.38;
    arr['P' - 'A'] = 0.55;
    arr['S' - 'A'] = 0.75;
    arr['T' - 'A'] = 1.19;
    arr['W' - 'A'] = 1.37;
    arr['Y' - 'A'] = 1.47;
    arr['V' - 'A'] = 1.70;

    return arr;
}();

// pKa values of ionizable groups (Bjellqvist-style set)
constexpr double PKA_NTERM = 7.5;
constexpr double PKA_CTERM = 3.55;
constexpr double PKA_K = 10.0;
constexpr double PKA_R = 12.0;
constexpr double PKA_H = 5.98;
constexpr double PKA_D = 4.05;
constexpr double PKA_E = 4.45;
constexpr double PKA_C = 9.0;
constexpr double PKA_Y = 10.0;

static inline double lookup(const std::array<double, 26>& table, char aa) {
    if (aa < 'A' || aa > 'Z') return 0.0;
    return table[aa - 'A'];
}

double hydropathy_kd(char aa) {
    return lookup(KD_HYDROPATHY, aa);
}

double residue_mass(char aa) {
    return lookup(RESIDUE_MASS, aa);
}

double helix_propensity(char aa) {
    return lookup(HELIX_PROPENSITY, aa);
}

double sheet_propensity(char aa) {
    return lookup(SHEET_PROPENSITY, aa);
}

double gravy(const Sequence& seq) {
    if (seq.empty()) return 0.0;
    double sum = 0.0;
    for (char c : seq) sum += hydropathy_kd(c);
    return sum / static_cast<double>(seq.size());
}

// Fraction of a basic group that is protonated (positive)
static inline double positive_fraction(double pka, double ph) {
    return 1.0 / (1.0 + std::pow(10.0, ph - pka));
}

// Fraction of an acidic group that is deprotonated (negative)
static inline double negative_fraction(double pka, double ph) {
    return 1.0 / (1.0 + std::pow(10.0, pka - ph));
}

double net_charge(const Sequence& seq, double ph) {
    if (seq.empty()) return 0.0;

    size_t n_k = 0, n_r = 0, n_h = 0, n_d = 0, n_e = 0, n_c = 0, n_y = 0;
    for (char c : seq) {
        switch (c) {
            case 'K': ++n_k; break;
            case 'R': ++n_r; break;
            case 'H': ++n_h; break;
            case 'D': ++n_d; break;
            case 'E': ++n_e; break;
            case 'C': ++n_c; break;
            case 'Y': ++n_y; break;
            default: break;
        }
    }

    double positive = positive_fraction(PKA_NTERM, ph)
                    + n_k * positive_fraction(PKA_K, ph)
                    + n_r * positive_fraction(PKA_R, ph)
                    + n_h * positive_fraction(PKA_H, ph);
    double negative = negative_fraction(PKA_CTERM, ph)
                    + n_d * negative_fraction(PKA_D, ph)
                    + n_e * negative_fraction(PKA_E, ph)
                    + n_c * negative_fraction(PKA_C, ph)
                    + n_y * negative_fraction(PKA_Y, ph);
    return positive - negative;
}

double molecular_weight(const Sequence& seq) {
    if (seq.empty()) return 0.0;
    double mass = WATER_MASS;
    for (char c : seq) mass += residue_mass(c);
    return mass;
}

double aromaticity(const Sequence& seq) {
    if (seq.empty()) return 0.0;
    size_t aromatic = 0;
    for (char c : seq) {
        if (c == 'F' || c == 'W' || c == 'Y') ++aromatic;
    }
    return static_cast<double>(aromatic) / static_cast<double>(seq.size());
}

bool is_valid_protein(const Sequence& seq) {
    for (char c : seq) {
        if (!is_standard_residue(c)) return false;
    }
    return true;
}

} // namespace protdes

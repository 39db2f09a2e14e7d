#include "protdes/sequence_generator.hpp"
#include "protdes/errors.hpp"

#include <algorithm>
#include <iterator>
#include <string>

namespace protdes {

SequenceGenerator::SequenceGenerator(const DesignTarget& target, GeneratorOptions options)
    : target_(target), options_(options) {
    if (options_.crossover_points != 1 && options_.crossover_points != 2) {
        throw InvalidParametersError("crossover_points must be 1 or 2, got " +
                                     std::to_string(options_.crossover_points));
    }

    fixed_mask_.assign(static_cast<size_t>(target_.length_range().max), false);
    for (const auto& [pos, allowed] : target_.catalytic_residues()) {
        fixed_mask_[pos - 1] = true;
    }
    for (const auto& [pos, aa] : target_.key_residues()) {
        fixed_mask_[pos - 1] = true;
    }
}

char SequenceGenerator::random_residue(std::mt19937_64& rng) const {
    std::uniform_int_distribution<int> dist(0, static_cast<int>(NUM_RESIDUES) - 1);
    return RESIDUE_ALPHABET[dist(rng)];
}

// Uniform over the 19 residues that differ from current
char SequenceGenerator::random_other_residue(char current, std::mt19937_64& rng) const {
    const int cur = residue_index(current);
    if (cur < 0) return random_residue(rng);

    std::uniform_int_distribution<int> dist(0, static_cast<int>(NUM_RESIDUES) - 2);
    int idx = dist(rng);
    if (idx >= cur) ++idx;
    return RESIDUE_ALPHABET[idx];
}

Sequence SequenceGenerator::generate_initial(std::mt19937_64& rng) const {
    std::uniform_int_distribution<int> len_dist(target_.feasible_min_length(),
                                                target_.length_range().max);
    const int length = len_dist(rng);

    Sequence seq(static_cast<size_t>(length), 'A');
    for (char& c : seq) c = random_residue(rng);

    // Catalytic positions: uniform draw from the allowed set
    for (const auto& [pos, allowed] : target_.catalytic_residues()) {
        std::uniform_int_distribution<size_t> pick(0, allowed.size() - 1);
        seq[pos - 1] = *std::next(allowed.begin(), static_cast<std::ptrdiff_t>(pick(rng)));
    }
    for (const auto& [pos, aa] : target_.key_residues()) {
        seq[pos - 1] = aa;
    }
    return seq;
}

void SequenceGenerator::apply_constraints(Sequence& seq, std::mt19937_64& rng) const {
    for (const auto& [pos, allowed] : target_.catalytic_residues()) {
        if (static_cast<size_t>(pos) > seq.size()) continue;
        char& slot = seq[pos - 1];
        if (allowed.count(slot) == 0) {
            std::uniform_int_distribution<size_t> pick(0, allowed.size() - 1);
            slot = *std::next(allowed.begin(), static_cast<std::ptrdiff_t>(pick(rng)));
        }
    }
    for (const auto& [pos, aa] : target_.key_residues()) {
        if (static_cast<size_t>(pos) > seq.size()) continue;
        seq[pos - 1] = aa;
    }
}

Sequence SequenceGenerator::mutate(const Sequence& seq, double rate, std::mt19937_64& rng) const {
    const auto len = static_cast<int>(seq.size());
    if (options_.allow_length_mutation &&
        (len < target_.feasible_min_length() || len > target_.length_range().max)) {
        throw LengthMismatchError("cannot mutate length-" + std::to_string(len) +
                                  " sequence; feasible range is " +
                                  std::to_string(target_.feasible_min_length()) + "-" +
                                  std::to_string(target_.length_range().max));
    }

    Sequence out = seq;
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    for (size_t i = 0; i < out.size(); ++i) {
        if (is_fixed(i)) continue;
        if (coin(rng) < rate) {
            out[i] = random_other_residue(out[i], rng);
        }
    }

    if (options_.allow_length_mutation && coin(rng) < rate) {
        mutate_length(out, rng);
    }
    return out;
}

// One insertion or deletion, staying inside the feasible length range
void SequenceGenerator::mutate_length(Sequence& seq, std::mt19937_64& rng) const {
    const auto len = static_cast<int>(seq.size());
    const bool can_insert = len < target_.length_range().max;
    const bool can_delete = len > target_.feasible_min_length();
    if (!can_insert && !can_delete) return;

    bool insert = can_insert;
    if (can_insert && can_delete) {
        std::bernoulli_distribution flip(0.5);
        insert = flip(rng);
    }

    if (insert) {
        std::uniform_int_distribution<size_t> where(0, seq.size());
        seq.insert(seq.begin() + static_cast<std::ptrdiff_t>(where(rng)), random_residue(rng));
    } else {
        std::uniform_int_distribution<size_t> where(0, seq.size() - 1);
        seq.erase(seq.begin() + static_cast<std::ptrdiff_t>(where(rng)));
    }

    // Residues downstream of the indel moved; restore the pinned ones
    apply_constraints(seq, rng);
}

Sequence SequenceGenerator::crossover(const Sequence& parent_a, const Sequence& parent_b,
                                      std::mt19937_64& rng) const {
    const size_t min_len = std::min(parent_a.size(), parent_b.size());

    Sequence child;
    if (min_len < 2) {
        child = parent_a;
    } else if (options_.crossover_points == 2 && min_len >= 3) {
        child = two_point(parent_a, parent_b, rng);
    } else {
        child = single_point(parent_a, parent_b, rng);
    }

    apply_constraints(child, rng);
    return child;
}

// a[0,cut) + b[cut,|b|)
Sequence SequenceGenerator::single_point(const Sequence& a, const Sequence& b,
                                         std::mt19937_64& rng) const {
    const size_t min_len = std::min(a.size(), b.size());
    std::uniform_int_distribution<size_t> cut_dist(1, min_len - 1);
    const size_t cut = cut_dist(rng);

    Sequence child;
    child.reserve(b.size());
    child.append(a, 0, cut);
    child.append(b, cut, Sequence::npos);
    return child;
}

// a[0,i) + b[i,j) + a[j,|a|)
Sequence SequenceGenerator::two_point(const Sequence& a, const Sequence& b,
                                      std::mt19937_64& rng) const {
    const size_t min_len = std::min(a.size(), b.size());
    std::uniform_int_distribution<size_t> cut_dist(1, min_len - 1);
    size_t i = cut_dist(rng);
    size_t j = cut_dist(rng);
    if (i > j) std::swap(i, j);

    Sequence child = a;
    for (size_t k = i; k < j; ++k) child[k] = b[k];
    return child;
}

void SequenceGenerator::check_candidate(const Sequence& seq) const {
    const auto len = static_cast<int>(seq.size());
    const auto& range = target_.length_range();
    if (len < range.min || len > range.max) {
        throw LengthMismatchError("candidate length " + std::to_string(len) +
                                  " outside " + std::to_string(range.min) + "-" +
                                  std::to_string(range.max));
    }

    for (size_t i = 0; i < seq.size(); ++i) {
        if (!is_standard_residue(seq[i])) {
            throw ConstraintViolationError("non-standard residue '" + std::string(1, seq[i]) +
                                           "' at position " + std::to_string(i + 1));
        }
    }

    for (const auto& [pos, allowed] : target_.catalytic_residues()) {
        if (!target_.position_satisfied(seq, pos)) {
            throw ConstraintViolationError("catalytic position " + std::to_string(pos) +
                                           " not satisfied");
        }
    }
    for (const auto& [pos, aa] : target_.key_residues()) {
        if (!target_.position_satisfied(seq, pos)) {
            throw ConstraintViolationError("key position " + std::to_string(pos) +
                                           " must be '" + std::string(1, aa) + "'");
        }
    }
}

} // namespace protdes

#include "protdes/design_target.hpp"
#include "protdes/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace protdes {

namespace {

void check_band(double lo, double hi, const char* name) {
    if (!std::isfinite(lo) || !std::isfinite(hi)) {
        throw InvalidTargetError(std::string(name) + " bounds must be finite");
    }
    if (lo > hi) {
        throw InvalidTargetError(std::string(name) + " min (" + std::to_string(lo) +
                                 ") exceeds max (" + std::to_string(hi) + ")");
    }
}

void check_fraction_band(double lo, double hi, const char* name) {
    check_band(lo, hi, name);
    if (lo < 0.0 || hi > 1.0) {
        throw InvalidTargetError(std::string(name) + " bounds must lie in [0,1]");
    }
}

void check_position(int position, int max_length, const char* kind) {
    if (position < 1 || position > max_length) {
        throw InvalidTargetError(std::string(kind) + " position " + std::to_string(position) +
                                 " outside [1, " + std::to_string(max_length) + "]");
    }
}

void check_symbol(char aa, int position, const char* kind) {
    if (!is_standard_residue(aa)) {
        throw InvalidTargetError(std::string(kind) + " position " + std::to_string(position) +
                                 ": '" + std::string(1, aa) + "' is not a standard residue");
    }
}

}  // namespace

DesignTarget::DesignTarget(LengthRange length_range,
                           SecondaryStructureTarget secondary_structure,
                           PropertyTarget properties,
                           CatalyticResidues catalytic_residues,
                           KeyResidues key_residues,
                           std::string desired_function)
    : length_range_(length_range),
      secondary_structure_(secondary_structure),
      properties_(properties),
      catalytic_residues_(std::move(catalytic_residues)),
      key_residues_(std::move(key_residues)),
      desired_function_(std::move(desired_function)) {
    validate();

    for (const auto& [pos, allowed] : catalytic_residues_) {
        max_fixed_position_ = std::max(max_fixed_position_, pos);
    }
    for (const auto& [pos, aa] : key_residues_) {
        max_fixed_position_ = std::max(max_fixed_position_, pos);
    }
}

void DesignTarget::validate() const {
    if (length_range_.min < 1) {
        throw InvalidTargetError("length range minimum must be >= 1");
    }
    if (length_range_.min > length_range_.max) {
        throw InvalidTargetError("length range " + std::to_string(length_range_.min) + "-" +
                                 std::to_string(length_range_.max) + " is inverted");
    }

    check_fraction_band(secondary_structure_.min_helix, secondary_structure_.max_helix, "helix");
    check_fraction_band(secondary_structure_.min_sheet, secondary_structure_.max_sheet, "sheet");
    check_band(properties_.min_hydropathy, properties_.max_hydropathy, "hydropathy");
    check_band(properties_.min_charge, properties_.max_charge, "charge");

    for (const auto& [pos, allowed] : catalytic_residues_) {
        check_position(pos, length_range_.max, "catalytic");
        if (allowed.empty()) {
            throw InvalidTargetError("catalytic position " + std::to_string(pos) +
                                     " has an empty allowed set");
        }
        for (char aa : allowed) check_symbol(aa, pos, "catalytic");
    }

    for (const auto& [pos, aa] : key_residues_) {
        check_position(pos, length_range_.max, "key");
        check_symbol(aa, pos, "key");

        auto it = catalytic_residues_.find(pos);
        if (it != catalytic_residues_.end() && it->second.count(aa) == 0) {
            throw InvalidTargetError("position " + std::to_string(pos) +
                                     " requires key residue '" + std::string(1, aa) +
                                     "' which the catalytic set does not allow");
        }
    }
}

DesignTarget DesignTarget::catalytic_triad_enzyme() {
    SecondaryStructureTarget ss;
    ss.min_helix = 0.3;
    ss.max_helix = 0.5;
    ss.min_sheet = 0.2;
    ss.max_sheet = 0.4;

    PropertyTarget props;
    props.min_hydropathy = -0.5;
    props.max_hydropathy = 0.5;
    props.min_charge = -5.0;
    props.max_charge = 5.0;

    CatalyticResidues catalytic = {
        {50, {'H'}},   // histidine
        {100, {'D'}},  // aspartate
        {150, {'S'}}   // serine
    };
    KeyResidues key = {
        {25, 'P'},     // turn
        {75, 'G'},     // flexibility
        {125, 'W'}     // core packing
    };

    return DesignTarget({200, 300}, ss, props, std::move(catalytic), std::move(key),
                        "Novel enzyme with catalytic triad");
}

int DesignTarget::feasible_min_length() const {
    return std::max(length_range_.min, max_fixed_position_);
}

size_t DesignTarget::fixed_position_count() const {
    size_t count = catalytic_residues_.size();
    for (const auto& [pos, aa] : key_residues_) {
        if (catalytic_residues_.count(pos) == 0) ++count;
    }
    return count;
}

bool DesignTarget::is_fixed_position(int position) const {
    return catalytic_residues_.count(position) > 0 || key_residues_.count(position) > 0;
}

bool DesignTarget::position_satisfied(const Sequence& seq, int position) const {
    auto key_it = key_residues_.find(position);
    auto cat_it = catalytic_residues_.find(position);
    if (key_it == key_residues_.end() && cat_it == catalytic_residues_.end()) {
        return true;
    }
    if (position < 1 || static_cast<size_t>(position) > seq.size()) {
        return false;
    }

    const char aa = seq[position - 1];
    if (key_it != key_residues_.end() && aa != key_it->second) return false;
    if (cat_it != catalytic_residues_.end() && cat_it->second.count(aa) == 0) return false;
    return true;
}

} // namespace protdes

#pragma once
// Result reporting: fitness history TSV, JSON summary of a finished run,
// per-sequence score rows and the human-readable result block.

#include "protdes/design_target.hpp"
#include "protdes/fitness_evaluator.hpp"
#include "protdes/optimizer.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace protdes {

// One row per completed iteration
void write_history_tsv(std::ostream& out, const std::vector<IterationStats>& history);

// Best design, its scores and properties, target and run parameters
void write_result_json(std::ostream& out,
                       const OptimizationResult& result,
                       const DesignTarget& target,
                       const OptimizationParameters& params,
                       const FitnessWeights& weights);

// Header for write_score_row
void write_score_header(std::ostream& out);

// id, length, score breakdown, properties and structure fractions of one
// scored sequence; failed predictions get NA columns and the error text
void write_score_row(std::ostream& out,
                     const std::string& id,
                     const Candidate& candidate,
                     const std::string& error = {});

// Best sequence, score, sequence properties and secondary structure content
void print_result(std::ostream& out, const OptimizationResult& result);

// Quote and escape a string for JSON output
std::string json_string(const std::string& s);

} // namespace protdes

#pragma once

#include <stdexcept>
#include <string>

namespace protdes {

// Base class for every error raised by the design library
class DesignError : public std::runtime_error {
public:
    explicit DesignError(const std::string& msg) : std::runtime_error(msg) {}
};

// Malformed DesignTarget. Raised by the constructor, never during a run.
class InvalidTargetError : public DesignError {
public:
    explicit InvalidTargetError(const std::string& msg)
        : DesignError("Invalid design target: " + msg) {}
};

// Malformed OptimizationParameters
class InvalidParametersError : public DesignError {
public:
    explicit InvalidParametersError(const std::string& msg)
        : DesignError("Invalid optimization parameters: " + msg) {}
};

// Fitness weights that are negative, non-finite or do not sum to 1
class InvalidWeightsError : public DesignError {
public:
    explicit InvalidWeightsError(const std::string& msg)
        : DesignError("Invalid fitness weights: " + msg) {}
};

// Structure predictor error or timeout. Recoverable: the optimizer scores
// the candidate as worst-case and carries on.
class PredictorFailure : public DesignError {
public:
    explicit PredictorFailure(const std::string& msg)
        : DesignError("Predictor failure: " + msg) {}
};

// A generated sequence has a length outside the target range.
// Indicates a generator defect; not absorbed by the optimizer.
class LengthMismatchError : public DesignError {
public:
    explicit LengthMismatchError(const std::string& msg)
        : DesignError("Length mismatch: " + msg) {}
};

// A generated sequence violates a fixed-position residue constraint.
// Indicates a generator defect; not absorbed by the optimizer.
class ConstraintViolationError : public DesignError {
public:
    explicit ConstraintViolationError(const std::string& msg)
        : DesignError("Constraint violation: " + msg) {}
};

} // namespace protdes

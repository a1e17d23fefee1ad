// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <ostream>
#include <string>

namespace fdnewton {

/// Error categories surfaced through the solvers' expected results
enum class NewtonErrorCode {
    InvalidArgument,      ///< Null callable, non-finite or empty x0, bad config
    SingularDerivative,   ///< Zero denominator (f'' / f') or singular Hessian
    NonFiniteValue,       ///< Objective or derivative estimate is NaN/Inf
    DimensionMismatch     ///< Provider output does not match the iterate size
};

/// Detailed solver error passed through the expected failure path
struct NewtonError {
    NewtonErrorCode code{NewtonErrorCode::InvalidArgument};
    size_t iterations{0};   ///< Iterations completed before the failure
    double last_x{0.0};     ///< Last iterate (its 2-norm for vector solves)
    std::string message;
};

/// Error codes for configuration and input validation failures
enum class ValidationErrorCode {
    NullObjective,
    NonFiniteInitialGuess,
    EmptyInitialGuess,
    InvalidTolerance,
    InvalidStepSize,
    InvalidDivergenceThreshold,
    InvalidSingularThreshold
};

/// Detailed validation error
struct ValidationError {
    ValidationErrorCode code;
    double value;  // The invalid value that was provided
    size_t index;  // Offending coordinate for vector inputs (0 if not applicable)

    ValidationError(ValidationErrorCode code,
                    double value = 0.0,
                    size_t index = 0)
        : code(code), value(value), index(index) {}
};

inline const char* to_string(NewtonErrorCode code) {
    switch (code) {
        case NewtonErrorCode::InvalidArgument:    return "invalid argument";
        case NewtonErrorCode::SingularDerivative: return "singular derivative";
        case NewtonErrorCode::NonFiniteValue:     return "non-finite value";
        case NewtonErrorCode::DimensionMismatch:  return "dimension mismatch";
    }
    return "unknown";
}

inline const char* to_string(ValidationErrorCode code) {
    switch (code) {
        case ValidationErrorCode::NullObjective:              return "objective is not callable";
        case ValidationErrorCode::NonFiniteInitialGuess:      return "initial guess is not finite";
        case ValidationErrorCode::EmptyInitialGuess:          return "initial guess is empty";
        case ValidationErrorCode::InvalidTolerance:           return "tolerance must be positive";
        case ValidationErrorCode::InvalidStepSize:            return "finite difference step must be positive";
        case ValidationErrorCode::InvalidDivergenceThreshold: return "divergence threshold must be positive";
        case ValidationErrorCode::InvalidSingularThreshold:   return "singular threshold must be non-negative";
    }
    return "unknown";
}

/// Every validation failure surfaces from a solver as InvalidArgument
inline NewtonError convert_to_newton_error(const ValidationError& err) {
    return NewtonError{
        .code = NewtonErrorCode::InvalidArgument,
        .iterations = 0,
        .last_x = err.value,
        .message = to_string(err.code)
    };
}

/// Output stream operator for ValidationError
inline std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
    os << "ValidationError{code=" << static_cast<int>(err.code)
       << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

/// Output stream operator for NewtonError
inline std::ostream& operator<<(std::ostream& os, const NewtonError& err) {
    os << "NewtonError{code=" << to_string(err.code)
       << ", iterations=" << err.iterations
       << ", last_x=" << err.last_x;
    if (!err.message.empty()) {
        os << ", message=\"" << err.message << "\"";
    }
    os << "}";
    return os;
}

} // namespace fdnewton

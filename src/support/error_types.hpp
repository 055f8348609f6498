// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <expected>
#include <ostream>
#include <string_view>

namespace interpfit {

/// Error codes for interpolation, linear solve and fitting failures
enum class FitErrorCode {
    EmptyInput,              ///< No samples supplied
    LengthMismatch,          ///< x and y (or x and sample rows) differ in length
    DimensionMismatch,       ///< Grid/table or vector dimensions disagree
    InsufficientPoints,      ///< Too few samples for the requested degree/order
    InvalidDomain,           ///< Value outside the function's domain (e.g. log of f <= 0)
    SingularMatrix,          ///< Pivot below tolerance during elimination
    NearSingularDenominator  ///< Rational evaluation at a root of the denominator
};

/// Detailed error passed through the expected failure path
///
/// The meaning of the auxiliary fields depends on the code:
///   LengthMismatch      size = |x|, index = |y|
///   DimensionMismatch   size = expected dimension, index = offending row
///   InsufficientPoints  size = points provided, index = points required
///   InvalidDomain       value = offending value, index = offending sample
///   SingularMatrix      index = pivot column, value = pivot magnitude
///   NearSingularDenominator  value = evaluation point
struct FitError {
    FitErrorCode code;
    size_t size;
    size_t index;
    double value;

    FitError(FitErrorCode code,
             size_t size = 0,
             size_t index = 0,
             double value = 0.0)
        : code(code), size(size), index(index), value(value) {}
};

template<typename T>
using FitResult = std::expected<T, FitError>;

/// Human-readable name for an error code
[[nodiscard]] constexpr std::string_view to_string(FitErrorCode code) noexcept {
    switch (code) {
        case FitErrorCode::EmptyInput:              return "EmptyInput";
        case FitErrorCode::LengthMismatch:          return "LengthMismatch";
        case FitErrorCode::DimensionMismatch:       return "DimensionMismatch";
        case FitErrorCode::InsufficientPoints:      return "InsufficientPoints";
        case FitErrorCode::InvalidDomain:           return "InvalidDomain";
        case FitErrorCode::SingularMatrix:          return "SingularMatrix";
        case FitErrorCode::NearSingularDenominator: return "NearSingularDenominator";
    }
    return "Unknown";
}

/// Output stream operator for FitErrorCode
inline std::ostream& operator<<(std::ostream& os, FitErrorCode code) {
    return os << to_string(code);
}

/// Output stream operator for FitError
inline std::ostream& operator<<(std::ostream& os, const FitError& err) {
    os << "FitError{code=" << to_string(err.code)
       << ", size=" << err.size
       << ", index=" << err.index
       << ", value=" << err.value << "}";
    return os;
}

} // namespace interpfit

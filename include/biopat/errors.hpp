#pragma once

#include <stdexcept>

namespace biopat {

/**
 * @brief Raised when a pattern cannot be constructed from the supplied arguments
 */
class PatternError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Raised when a pattern value cannot be matched (empty, Gap or Any)
 */
class InvalidPatternError : public PatternError {
public:
    InvalidPatternError() : PatternError("Supplied pattern is invalid") {}
    using PatternError::PatternError;
};

} // namespace biopat

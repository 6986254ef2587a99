#pragma once

#include "biopat/pattern.hpp"
#include "biopat/sequence.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace biopat {

/**
 * @brief Find the first offset at which a pattern matches
 *
 * Each start offset i is tried in increasing order by matching the pattern
 * against the suffix beginning at i.
 *
 * @return The smallest such offset, or std::nullopt if there is none
 * @throws InvalidPatternError if the pattern is not matchable
 */
[[nodiscard]] std::optional<size_t> locate(std::string_view symbols, const Pattern& pattern);
[[nodiscard]] std::optional<size_t> locate(const Sequence& seq, const Pattern& pattern);

/**
 * @brief Check whether a pattern matches at any offset
 * @throws InvalidPatternError if the pattern is not matchable
 */
[[nodiscard]] bool exists(std::string_view symbols, const Pattern& pattern);
[[nodiscard]] bool exists(const Sequence& seq, const Pattern& pattern);

/**
 * @brief Find every offset at which a pattern matches, in ascending order
 * @throws InvalidPatternError if the pattern is not matchable
 */
[[nodiscard]] std::vector<size_t> locateAll(std::string_view symbols, const Pattern& pattern);
[[nodiscard]] std::vector<size_t> locateAll(const Sequence& seq, const Pattern& pattern);

} // namespace biopat

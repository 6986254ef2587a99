#pragma once

#include "biopat/errors.hpp"

#include <string_view>
#include <vector>

namespace biopat {

/**
 * @brief A contiguous window of an input: start offset and length
 */
struct Window {
    size_t start;
    size_t length;

    [[nodiscard]] size_t end() const noexcept { return start + length; }
    [[nodiscard]] bool operator==(const Window& other) const = default;
};

/**
 * @brief Length bounds shared by the region patterns
 */
class Region {
public:
    /**
     * @throws PatternError if min > max
     */
    Region(size_t min, size_t max);

    [[nodiscard]] size_t min() const noexcept { return min_; }
    [[nodiscard]] size_t max() const noexcept { return max_; }

    [[nodiscard]] bool admits(size_t length) const noexcept {
        return length >= min_ && length <= max_;
    }

private:
    size_t min_;
    size_t max_;
};

/**
 * @brief A bounded-length spacer between the motifs of a Series or Repeat
 *
 * Gaps are never matched on their own.
 */
class Gap : public Region {
public:
    using Region::Region;
};

/**
 * @brief An unconstrained region whose length lies in [min, max]
 *
 * Any does not take part in boolean matching; it enumerates the candidate
 * windows of an input instead.
 */
class Any : public Region {
public:
    using Region::Region;

    /**
     * @brief Enumerate every window whose length lies in [min, max]
     *
     * Windows are grouped by start offset (ascending) and, for each start,
     * listed from the shortest admissible length up to min(max, remaining).
     */
    [[nodiscard]] std::vector<Window> windows(std::string_view symbols) const;
};

} // namespace biopat

#include "biopat/region.hpp"
#include <algorithm>
#include <string>

namespace biopat {

Region::Region(size_t min, size_t max) : min_(min), max_(max) {
    if (min > max) {
        throw PatternError("Invalid region bounds: min " + std::to_string(min) +
                           " exceeds max " + std::to_string(max));
    }
}

std::vector<Window> Any::windows(std::string_view symbols) const {
    std::vector<Window> result;

    for (size_t start = 0; start < symbols.length(); ++start) {
        const size_t remaining = symbols.length() - start;
        const size_t longest = std::min(max(), remaining);
        for (size_t length = min(); length <= longest; ++length) {
            result.push_back({start, length});
        }
    }

    return result;
}

} // namespace biopat

#include "biopat/scan.hpp"

namespace biopat {

namespace {

void requireMatchable(const Pattern& pattern) {
    if (!pattern.isMatchable()) {
        throw InvalidPatternError("Supplied pattern is invalid: " + toString(pattern.kind()) +
                                  " cannot be located");
    }
}

} // namespace

std::optional<size_t> locate(std::string_view symbols, const Pattern& pattern) {
    requireMatchable(pattern);

    for (size_t i = 0; i < symbols.length(); ++i) {
        if (pattern.match(symbols.substr(i))) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<size_t> locate(const Sequence& seq, const Pattern& pattern) {
    return locate(std::string_view{seq.symbols()}, pattern);
}

bool exists(std::string_view symbols, const Pattern& pattern) {
    return locate(symbols, pattern).has_value();
}

bool exists(const Sequence& seq, const Pattern& pattern) {
    return locate(seq, pattern).has_value();
}

std::vector<size_t> locateAll(std::string_view symbols, const Pattern& pattern) {
    requireMatchable(pattern);

    std::vector<size_t> positions;
    for (size_t i = 0; i < symbols.length(); ++i) {
        if (pattern.match(symbols.substr(i))) {
            positions.push_back(i);
        }
    }
    return positions;
}

std::vector<size_t> locateAll(const Sequence& seq, const Pattern& pattern) {
    return locateAll(std::string_view{seq.symbols()}, pattern);
}

} // namespace biopat

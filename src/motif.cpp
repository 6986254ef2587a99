#include "biopat/motif.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace biopat {

namespace {

char toLower(char c) noexcept {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool symbolMatches(char motif_symbol, char input_symbol) noexcept {
    return isWildcard(motif_symbol) || motif_symbol == toLower(input_symbol);
}

} // namespace

Motif::Motif(std::string_view literal, double threshold, Alphabet alphabet)
    : threshold_(threshold), alphabet_(alphabet) {
    if (literal.empty()) {
        throw PatternError("Motif cannot be empty");
    }
    if (!checkAlphabet(alphabet, literal)) {
        throw PatternError("Supplied motif '" + std::string(literal) +
                           "' is not a valid " + toString(alphabet) + " sequence");
    }
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        throw PatternError("Motif threshold must lie in [0, 1]");
    }

    literal_.reserve(literal.length());
    std::ranges::transform(literal, std::back_inserter(literal_), toLower);
}

size_t Motif::matchedPrefix(std::string_view symbols) const noexcept {
    const size_t limit = std::min(literal_.length(), symbols.length());
    size_t matched = 0;
    while (matched < limit && symbolMatches(literal_[matched], symbols[matched])) {
        ++matched;
    }
    return matched;
}

double Motif::score(std::string_view symbols) const noexcept {
    return static_cast<double>(matchedPrefix(symbols)) / static_cast<double>(literal_.length());
}

bool Motif::match(std::string_view symbols, double threshold) const {
    // Exact comparison of two equal-length runs
    if (threshold == 1.0 && symbols.length() == literal_.length()) {
        return std::ranges::equal(literal_, symbols, symbolMatches);
    }

    const size_t matched = matchedPrefix(symbols);
    if (matched == literal_.length()) return true;
    return static_cast<double>(matched) / static_cast<double>(literal_.length()) >= threshold;
}

} // namespace biopat

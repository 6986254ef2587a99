#include "biopat/sequence.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <iostream>

namespace biopat {

// ============================================================================
// Constructors
// ============================================================================

Sequence::Sequence(std::string_view symbols, Alphabet alphabet)
    : alphabet_(alphabet) {
    validateSymbols(symbols, alphabet);
    symbols_.reserve(symbols.length());
    std::ranges::transform(symbols, std::back_inserter(symbols_), [](char c) {
        return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    });
}

Sequence::Sequence(std::string_view symbols, Alphabet alphabet, std::string id)
    : Sequence(symbols, alphabet) {
    id_ = std::move(id);
}

Sequence::Sequence(Unchecked, std::string symbols, Alphabet alphabet)
    : symbols_(std::move(symbols)), alphabet_(alphabet) {}

// ============================================================================
// Validation
// ============================================================================

void Sequence::validateSymbols(std::string_view symbols, Alphabet alphabet) {
    if (symbols.empty()) {
        throw SequenceError("Sequence cannot be empty");
    }

    for (size_t i = 0; i < symbols.length(); ++i) {
        if (!isValid(alphabet, symbols[i])) {
            throw SequenceError("Invalid " + biopat::toString(alphabet) + " symbol '" +
                                std::string(1, symbols[i]) + "' at position " +
                                std::to_string(i));
        }
    }
}

bool Sequence::hasWildcards() const noexcept {
    return std::ranges::any_of(symbols_, [](char c) { return isWildcard(c); });
}

// ============================================================================
// Extraction
// ============================================================================

Sequence Sequence::subsequence(size_t start, size_t length) const {
    if (start >= symbols_.length()) {
        throw SequenceError("Subsequence start position out of range");
    }

    auto actual_length = std::min(length, symbols_.length() - start);
    Sequence result(Unchecked{}, symbols_.substr(start, actual_length), alphabet_);
    if (id_) {
        result.id_ = *id_ + "_" + std::to_string(start) + "_" + std::to_string(actual_length);
    }
    return result;
}

Sequence Sequence::suffix(size_t start) const {
    return subsequence(start, symbols_.length());
}

// ============================================================================
// Stream Output
// ============================================================================

std::ostream& operator<<(std::ostream& os, const Sequence& seq) {
    if (seq.id()) {
        os << ">" << *seq.id() << "\n";
    }
    os << seq.symbols();
    return os;
}

} // namespace biopat

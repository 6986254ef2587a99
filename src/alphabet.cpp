#include "biopat/alphabet.hpp"
#include <algorithm>

namespace biopat {

namespace {

constexpr std::string_view kDnaSymbols = "ACGT-";
constexpr std::string_view kRnaSymbols = "ACGU-";
constexpr std::string_view kProteinSymbols = "ACDEFGHIKLMNOPQRSTUVWY*-";

constexpr char toUpper(char c) noexcept {
    if (c >= 'a' && c <= 'z') {
        return static_cast<char>(c - 'a' + 'A');
    }
    return c;
}

constexpr std::string_view validSymbols(Alphabet alphabet) noexcept {
    switch (alphabet) {
        case Alphabet::DNA: return kDnaSymbols;
        case Alphabet::RNA: return kRnaSymbols;
        case Alphabet::Protein: return kProteinSymbols;
    }
    return {};
}

} // namespace

std::string toString(Alphabet alphabet) {
    switch (alphabet) {
        case Alphabet::DNA: return "DNA";
        case Alphabet::RNA: return "RNA";
        case Alphabet::Protein: return "Protein";
    }
    return "Unknown";
}

bool isValid(Alphabet alphabet, char symbol) noexcept {
    if (isWildcard(symbol)) return true;
    return validSymbols(alphabet).find(toUpper(symbol)) != std::string_view::npos;
}

bool checkAlphabet(Alphabet alphabet, std::string_view symbols) noexcept {
    return std::ranges::all_of(symbols, [alphabet](char c) { return isValid(alphabet, c); });
}

} // namespace biopat

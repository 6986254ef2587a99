#pragma once

#include <string>
#include <string_view>

namespace biopat {

/**
 * @brief The symbol alphabets a pattern or sequence can be bound to
 */
enum class Alphabet {
    DNA,
    RNA,
    Protein
};

[[nodiscard]] std::string toString(Alphabet alphabet);

/**
 * @brief Check whether a symbol is a wildcard ('x' or 'n', any case)
 *
 * Wildcards are valid in every alphabet and match any symbol.
 */
[[nodiscard]] constexpr bool isWildcard(char symbol) noexcept {
    return symbol == 'x' || symbol == 'X' || symbol == 'n' || symbol == 'N';
}

/**
 * @brief Check a single symbol against an alphabet's valid-symbol table
 * @return true if the symbol is a wildcard or a member of the alphabet
 */
[[nodiscard]] bool isValid(Alphabet alphabet, char symbol) noexcept;

/**
 * @brief Check that every symbol of a run is valid for the alphabet
 * @return true for an empty run
 */
[[nodiscard]] bool checkAlphabet(Alphabet alphabet, std::string_view symbols) noexcept;

} // namespace biopat

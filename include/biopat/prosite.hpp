#pragma once

#include "biopat/alphabet.hpp"
#include "biopat/errors.hpp"
#include "biopat/regex.hpp"
#include "biopat/sequence.hpp"

#include <string>
#include <string_view>

namespace biopat {

/**
 * @brief A Prosite-style pattern compiled into a regular expression
 *
 * The pattern is a '-' separated list of tokens, each rewritten into a regex
 * fragment and concatenated:
 * - "[...]"   character class, passed through unchanged
 * - "{...}"   excluded symbols, becomes "[^...]"
 * - "S(n)" / "S(n,m)"  bounded repeat of symbol S, becomes "S{n}" / "S{n,m}"
 * - "x" / "n" wildcard, becomes "."
 * - anything else must be a literal run of alphabet symbols
 *
 * Example: "A-x-T(2,3)" compiles to "A.T{2,3}".
 */
class Prosite {
public:
    /**
     * @throws PatternError ("Invalid Prosite pattern ...") if any token is malformed
     */
    explicit Prosite(std::string_view pattern, Alphabet alphabet = Alphabet::DNA);

    /**
     * @brief Translate a Prosite pattern into a regular expression
     * @throws PatternError if any token is malformed
     */
    [[nodiscard]] static std::string compile(std::string_view pattern,
                                             Alphabet alphabet = Alphabet::DNA);

    [[nodiscard]] bool match(std::string_view symbols) const { return regex_.match(symbols); }

    [[nodiscard]] bool match(const Sequence& seq) const { return regex_.match(seq); }

    [[nodiscard]] const std::string& pattern() const noexcept { return pattern_; }
    [[nodiscard]] const Regex& regex() const noexcept { return regex_; }

private:
    std::string pattern_;
    Regex regex_;
};

} // namespace biopat

#pragma once

#include "biopat/alphabet.hpp"
#include "biopat/errors.hpp"
#include "biopat/sequence.hpp"

#include <string>
#include <string_view>

namespace biopat {

/**
 * @brief A literal run of symbols matched with wildcard tolerance and a
 *        similarity threshold
 *
 * The motif is compared position by position against the start of the input,
 * case-insensitively. Matching stops at the first mismatch or when the input
 * runs out; the score is the fraction of literal positions matched up to that
 * point, and the match succeeds if the score reaches the threshold.
 */
class Motif {
public:
    static constexpr double kDefaultThreshold = 1.0;

    /**
     * @brief Construct a motif
     * @param literal Motif symbols; wildcards ('x', 'n') are allowed
     * @param threshold Minimum fraction of matched positions, in [0, 1]
     * @param alphabet Alphabet the literal is validated against
     * @throws PatternError on an empty or invalid literal, or a threshold outside [0, 1]
     */
    explicit Motif(std::string_view literal,
                   double threshold = kDefaultThreshold,
                   Alphabet alphabet = Alphabet::DNA);

    [[nodiscard]] bool match(std::string_view symbols) const {
        return match(symbols, threshold_);
    }

    [[nodiscard]] bool match(const Sequence& seq) const {
        return match(std::string_view{seq.symbols()});
    }

    /**
     * @brief Match using an effective threshold in place of the motif's own
     *
     * Used by Set, which imposes its threshold on the motifs it contains.
     */
    [[nodiscard]] bool match(std::string_view symbols, double threshold) const;

    /**
     * @brief Fraction of literal positions matched before the first mismatch
     *        or the end of the input
     */
    [[nodiscard]] double score(std::string_view symbols) const noexcept;

    [[nodiscard]] const std::string& literal() const noexcept { return literal_; }
    [[nodiscard]] size_t length() const noexcept { return literal_.length(); }
    [[nodiscard]] double threshold() const noexcept { return threshold_; }
    [[nodiscard]] Alphabet alphabet() const noexcept { return alphabet_; }

private:
    std::string literal_;
    double threshold_;
    Alphabet alphabet_;

    [[nodiscard]] size_t matchedPrefix(std::string_view symbols) const noexcept;
};

} // namespace biopat

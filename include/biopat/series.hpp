#pragma once

#include "biopat/alphabet.hpp"
#include "biopat/errors.hpp"
#include "biopat/motif.hpp"
#include "biopat/region.hpp"
#include "biopat/sequence.hpp"

#include <string_view>
#include <variant>
#include <vector>

namespace biopat {

using SeriesElement = std::variant<Motif, Gap>;

/**
 * @brief An ordered chain of motifs separated by gaps
 *
 * Elements alternate Motif, Gap, Motif, ..., starting and ending on a Motif.
 * The first motif is matched at the start of the input. After a motif of
 * length m, every gap length g admitted by the following Gap is tried by
 * matching the next motif at offset m + g, provided that offset leaves a
 * non-empty remainder. The series matches if any such chain reaches the last
 * motif.
 */
class Series {
public:
    /**
     * @throws PatternError if elements is empty or does not alternate Motif/Gap
     *         starting and ending with a Motif
     */
    explicit Series(std::vector<SeriesElement> elements);

    [[nodiscard]] bool match(std::string_view symbols) const;

    [[nodiscard]] bool match(const Sequence& seq) const {
        return match(std::string_view{seq.symbols()});
    }

    [[nodiscard]] const std::vector<SeriesElement>& elements() const noexcept { return elements_; }
    [[nodiscard]] const std::vector<Motif>& motifs() const noexcept { return motifs_; }
    [[nodiscard]] const std::vector<Gap>& gaps() const noexcept { return gaps_; }

private:
    std::vector<SeriesElement> elements_;
    std::vector<Motif> motifs_;
    std::vector<Gap> gaps_;
};

/**
 * @brief One motif repeated count times with the same gap bounds between
 *        every pair of repeats
 */
class Repeat {
public:
    /**
     * @param literal Motif repeated by the pattern
     * @param min_gap Shortest gap between two repeats
     * @param max_gap Longest gap between two repeats
     * @param threshold Threshold applied to every repeat
     * @param count Number of repeats (>= 1)
     * @param alphabet Alphabet the literal is validated against
     * @throws PatternError if count is 0, min_gap > max_gap or the motif is invalid
     */
    Repeat(std::string_view literal, size_t min_gap, size_t max_gap,
           double threshold = Motif::kDefaultThreshold, size_t count = 1,
           Alphabet alphabet = Alphabet::DNA);

    [[nodiscard]] bool match(std::string_view symbols) const { return series_.match(symbols); }

    [[nodiscard]] bool match(const Sequence& seq) const { return series_.match(seq); }

    // Expanded [Motif, Gap, Motif, ...] list of 2 * count - 1 elements
    [[nodiscard]] const std::vector<SeriesElement>& components() const noexcept {
        return series_.elements();
    }

    [[nodiscard]] const Motif& motif() const noexcept { return series_.motifs().front(); }
    [[nodiscard]] size_t count() const noexcept { return series_.motifs().size(); }

private:
    Series series_;

    [[nodiscard]] static std::vector<SeriesElement> expand(const Motif& motif, const Gap& gap,
                                                           size_t count);
};

} // namespace biopat

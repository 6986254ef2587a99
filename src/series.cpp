#include "biopat/series.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>
#include <utility>

namespace biopat {

// ============================================================================
// Series
// ============================================================================

Series::Series(std::vector<SeriesElement> elements) : elements_(std::move(elements)) {
    if (elements_.empty()) {
        throw PatternError("Series cannot be empty");
    }
    if (elements_.size() % 2 == 0) {
        throw PatternError("Series must start and end with a Motif");
    }

    for (size_t i = 0; i < elements_.size(); ++i) {
        const bool expect_motif = (i % 2 == 0);
        if (expect_motif) {
            const auto* motif = std::get_if<Motif>(&elements_[i]);
            if (!motif) {
                throw PatternError("Series element " + std::to_string(i) + " must be a Motif");
            }
            motifs_.push_back(*motif);
        } else {
            const auto* gap = std::get_if<Gap>(&elements_[i]);
            if (!gap) {
                throw PatternError("Series element " + std::to_string(i) + " must be a Gap");
            }
            gaps_.push_back(*gap);
        }
    }
}

bool Series::match(std::string_view symbols) const {
    // Depth-first search over (motif index, offset) states; a state that has
    // been expanded once cannot lead anywhere new.
    const size_t stride = symbols.length() + 1;
    std::unordered_set<size_t> visited;
    std::vector<std::pair<size_t, size_t>> pending{{0, 0}};

    while (!pending.empty()) {
        const auto [index, offset] = pending.back();
        pending.pop_back();

        if (!visited.insert(index * stride + offset).second) continue;

        const auto slice = symbols.substr(offset);
        const Motif& motif = motifs_[index];
        if (!motif.match(slice)) continue;
        if (index + 1 == motifs_.size()) return true;

        const Gap& gap = gaps_[index];
        if (slice.length() <= motif.length()) continue;
        const size_t longest = std::min(gap.max(), slice.length() - motif.length() - 1);
        if (longest < gap.min()) continue;

        // Pushed longest first so the shortest gap is explored first
        for (size_t g = longest + 1; g-- > gap.min();) {
            pending.emplace_back(index + 1, offset + motif.length() + g);
        }
    }

    return false;
}

// ============================================================================
// Repeat
// ============================================================================

Repeat::Repeat(std::string_view literal, size_t min_gap, size_t max_gap,
               double threshold, size_t count, Alphabet alphabet)
    : series_(expand(Motif(literal, threshold, alphabet), Gap(min_gap, max_gap), count)) {}

std::vector<SeriesElement> Repeat::expand(const Motif& motif, const Gap& gap, size_t count) {
    if (count < 1) {
        throw PatternError("Repeat count must be at least 1");
    }

    std::vector<SeriesElement> components;
    components.reserve(2 * count - 1);
    components.emplace_back(motif);
    for (size_t i = 1; i < count; ++i) {
        components.emplace_back(gap);
        components.emplace_back(motif);
    }
    return components;
}

} // namespace biopat

#include <gtest/gtest.h>
#include "biopat/series.hpp"

#include <string>
#include <vector>

using namespace biopat;

namespace {

Series twoMotifSeries(size_t min_gap, size_t max_gap) {
    return Series({Motif("AC"), Gap(min_gap, max_gap), Motif("GT")});
}

} // namespace

// ============================================================================
// Series Construction Tests
// ============================================================================

TEST(SeriesTest, SplitsMotifsAndGaps) {
    auto series = twoMotifSeries(1, 2);
    EXPECT_EQ(series.elements().size(), 3);
    ASSERT_EQ(series.motifs().size(), 2);
    ASSERT_EQ(series.gaps().size(), 1);
    EXPECT_EQ(series.motifs()[1].literal(), "gt");
    EXPECT_EQ(series.gaps()[0].max(), 2);
}

TEST(SeriesTest, RejectsEmptySeries) {
    EXPECT_THROW(Series(std::vector<SeriesElement>{}), PatternError);
}

TEST(SeriesTest, RejectsBrokenAlternation) {
    EXPECT_THROW(Series({Motif("A"), Gap(0, 1)}), PatternError);
    EXPECT_THROW(Series({Gap(0, 1), Motif("A"), Gap(0, 1)}), PatternError);
    EXPECT_THROW(Series({Motif("A"), Motif("C"), Motif("G")}), PatternError);
}

// ============================================================================
// Series Matching Tests
// ============================================================================

TEST(SeriesTest, SingleMotifSeries) {
    Series series({Motif("ACG")});
    EXPECT_TRUE(series.match("ACGT"));
    EXPECT_FALSE(series.match("TACG"));
}

TEST(SeriesTest, EveryGapLengthInRangeIsTried) {
    auto series = twoMotifSeries(1, 2);
    EXPECT_TRUE(series.match("ACTGT"));
    EXPECT_TRUE(series.match("ACTTGT"));
    EXPECT_TRUE(series.match(Sequence("ACTTGT")));
}

TEST(SeriesTest, GapOutsideRangeFails) {
    auto series = twoMotifSeries(1, 2);
    EXPECT_FALSE(series.match("ACGT"));
    EXPECT_FALSE(series.match("ACTTTGT"));
}

TEST(SeriesTest, FirstMotifMustMatchAtStart) {
    auto series = twoMotifSeries(1, 2);
    EXPECT_FALSE(series.match("TACTGT"));
}

TEST(SeriesTest, TrailingSymbolsAreAllowed) {
    auto series = twoMotifSeries(1, 2);
    EXPECT_TRUE(series.match("ACTGTAAAA"));
}

TEST(SeriesTest, RemainderAfterGapMustBeNonEmpty) {
    Series series({Motif("AC"), Gap(0, 0), Motif("GT", 0.0)});
    EXPECT_FALSE(series.match("AC"));
    EXPECT_TRUE(series.match("ACA"));
}

TEST(SeriesTest, MotifThresholdsApplyPerMotif) {
    Series series({Motif("ACGT", 0.75), Gap(0, 0), Motif("GG")});
    EXPECT_TRUE(series.match("ACGAGG"));
    EXPECT_FALSE(series.match("ACTAGG"));
}

TEST(SeriesTest, BacktracksAcrossSeveralGaps) {
    Series series({Motif("A"), Gap(0, 3), Motif("C"), Gap(0, 3), Motif("G")});
    EXPECT_TRUE(series.match("ATTCTTG"));
    EXPECT_TRUE(series.match("ACG"));
    EXPECT_FALSE(series.match("ATTTTCG"));
}

TEST(SeriesTest, WideGapRangeTerminates) {
    Series series({Motif("A"), Gap(0, 1000), Motif("C"), Gap(0, 1000), Motif("G"),
                   Gap(0, 1000), Motif("T")});
    std::string input(200, 'A');
    EXPECT_FALSE(series.match(input));
    input += "CGT";
    EXPECT_TRUE(series.match(input));
}

// ============================================================================
// Repeat Tests
// ============================================================================

TEST(RepeatTest, ExpandsComponents) {
    Repeat repeat("AC", 1, 1, 1.0, 3);
    EXPECT_EQ(repeat.count(), 3);
    ASSERT_EQ(repeat.components().size(), 5);
    for (size_t i = 0; i < repeat.components().size(); ++i) {
        if (i % 2 == 0) {
            EXPECT_TRUE(std::holds_alternative<Motif>(repeat.components()[i]));
        } else {
            EXPECT_TRUE(std::holds_alternative<Gap>(repeat.components()[i]));
        }
    }
    EXPECT_EQ(repeat.motif().literal(), "ac");
}

TEST(RepeatTest, SingleRepeatIsTheMotif) {
    Repeat repeat("ACGT", 0, 5);
    EXPECT_EQ(repeat.components().size(), 1);
    EXPECT_TRUE(repeat.match("ACGTTT"));
    EXPECT_FALSE(repeat.match("ACGA"));
}

TEST(RepeatTest, MatchesRepeatsSeparatedByGaps) {
    Repeat repeat("AC", 1, 1, 1.0, 3);
    EXPECT_TRUE(repeat.match("ACTACGAC"));
    EXPECT_FALSE(repeat.match("ACTACGGAC"));
}

TEST(RepeatTest, GapRangeWidensMatches) {
    Repeat repeat("AC", 1, 2, 1.0, 3);
    EXPECT_TRUE(repeat.match("ACTACGGAC"));
    EXPECT_TRUE(repeat.match(Sequence("ACTACGGAC")));
}

TEST(RepeatTest, ThresholdAppliesToEveryRepeat) {
    Repeat repeat("ACGT", 0, 0, 0.75, 2);
    EXPECT_TRUE(repeat.match("ACGAACGA"));
    EXPECT_FALSE(repeat.match("ACGAATGA"));
}

TEST(RepeatTest, RejectsInvalidArguments) {
    EXPECT_THROW(Repeat("AC", 0, 1, 1.0, 0), PatternError);
    EXPECT_THROW(Repeat("AC", 3, 1), PatternError);
    EXPECT_THROW(Repeat("AZ", 0, 1), PatternError);
    EXPECT_NO_THROW(Repeat("ACGU", 0, 1, 1.0, 2, Alphabet::RNA));
}

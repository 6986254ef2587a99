#include <gtest/gtest.h>
#include "biopat/scan.hpp"

#include <vector>

using namespace biopat;

// ============================================================================
// Locate Tests
// ============================================================================

TEST(LocateTest, MotifAtStart) {
    Sequence seq("ACGTACGT");
    auto pos = locate(seq, Motif("ACGT"));
    ASSERT_TRUE(pos.has_value());
    EXPECT_EQ(*pos, 0);
}

TEST(LocateTest, MotifNotFound) {
    Sequence seq("ACGTACGT");
    EXPECT_FALSE(locate(seq, Motif("TTTT")).has_value());
}

TEST(LocateTest, ReturnsSmallestOffset) {
    EXPECT_EQ(locate("GGACGTACGT", Motif("ACGT")), 2);
    EXPECT_EQ(locate("ACGTT", Motif("GTT")), 2);
}

TEST(LocateTest, FuzzyMotif) {
    EXPECT_EQ(locate("TTACGT", Motif("ACGA", 0.75)), 2);
}

TEST(LocateTest, MotifTruncatedAtEndOfInput) {
    EXPECT_FALSE(locate("TACG", Motif("ACGT")).has_value());
    EXPECT_EQ(locate("TACG", Motif("ACGT", 0.75)), 1);
}

TEST(LocateTest, SeriesPattern) {
    Series series({Motif("AC"), Gap(1, 2), Motif("GT")});
    EXPECT_EQ(locate("GGACTGTA", series), 2);
    EXPECT_FALSE(locate("GGACGTA", series).has_value());
}

TEST(LocateTest, RegexMatchesFromEarliestSuffix) {
    // The expression searches the whole suffix, so offset 0 already matches
    EXPECT_EQ(locate("ACGT", Regex("gt")), 0);
    EXPECT_EQ(locate("ACGT", Regex("^gt")), 2);
}

TEST(LocateTest, PrositePattern) {
    EXPECT_EQ(locate("CCAGTTC", Prosite("A-x-T(2,3)")), 0);
    EXPECT_FALSE(locate("CCAGTCC", Prosite("A-x-T(2,3)")).has_value());
}

TEST(LocateTest, SetPattern) {
    Set set({Motif("TTTT"), Motif("GTA")});
    EXPECT_EQ(locate("ACGTAC", set), 2);
}

TEST(LocateTest, MatchesEveryOffsetScannedDirectly) {
    const std::string input = "AACGTTACGAACG";
    Pattern pattern = Motif("ACG");
    auto pos = locate(input, pattern);
    ASSERT_TRUE(pos.has_value());
    for (size_t i = 0; i < *pos; ++i) {
        EXPECT_FALSE(pattern.match(std::string_view(input).substr(i)));
    }
    EXPECT_TRUE(pattern.match(std::string_view(input).substr(*pos)));
}

TEST(LocateTest, EmptyInput) {
    EXPECT_FALSE(locate("", Motif("A")).has_value());
    EXPECT_FALSE(exists("", Motif("A")));
}

// ============================================================================
// Invalid Pattern Tests
// ============================================================================

TEST(LocateTest, InvalidPatternIsAnError) {
    EXPECT_THROW((void)locate("ACGT", Pattern{}), InvalidPatternError);
    EXPECT_THROW((void)locate("", Pattern{}), InvalidPatternError);
    EXPECT_THROW((void)locate("ACGT", Gap(0, 1)), InvalidPatternError);
    EXPECT_THROW((void)locate("ACGT", Any(0, 1)), InvalidPatternError);
    EXPECT_THROW((void)exists("ACGT", Pattern{}), InvalidPatternError);
    EXPECT_THROW((void)locateAll("ACGT", Pattern{}), InvalidPatternError);
}

// ============================================================================
// Exists Tests
// ============================================================================

TEST(ExistsTest, AgreesWithLocate) {
    Sequence seq("ACGTACGT");
    const std::vector<Pattern> patterns = {
        Motif("ACGT"), Motif("TTTT"), Motif("GTAA", 0.5), Regex("a.g"),
        Repeat("CG", 2, 2, 1.0, 2), Series({Motif("T"), Gap(3, 3), Motif("T")})};

    for (const auto& pattern : patterns) {
        EXPECT_EQ(exists(seq, pattern), locate(seq, pattern).has_value())
            << toString(pattern.kind());
    }
}

TEST(ExistsTest, FoundAndNotFound) {
    EXPECT_TRUE(exists(Sequence("ACGTACGT"), Motif("GTAC")));
    EXPECT_FALSE(exists(Sequence("ACGTACGT"), Motif("GGGG")));
}

// ============================================================================
// LocateAll Tests
// ============================================================================

TEST(LocateAllTest, EveryOffset) {
    std::vector<size_t> expected = {0, 4};
    EXPECT_EQ(locateAll(Sequence("ACGTACGT"), Motif("ACGT")), expected);
}

TEST(LocateAllTest, OverlappingMatches) {
    std::vector<size_t> expected = {0, 1, 2};
    EXPECT_EQ(locateAll("AAAA", Motif("AA")), expected);
}

TEST(LocateAllTest, NoMatches) {
    EXPECT_TRUE(locateAll("ACGT", Motif("TTTT")).empty());
}

// =============================================================================
// vq-tiers - Coordinate Join Tests
// =============================================================================
// Unit tests for pairing input records with recal scores.
// =============================================================================

#include "vqt/traversal/coordinate_join.h"

#include <gtest/gtest.h>

#include <cmath>
#include <optional>
#include <string>
#include <vector>

#include "vqt/common/error.h"

namespace vqt::traversal {
namespace {

// =============================================================================
// Test Utilities
// =============================================================================

[[nodiscard]] ScoredAnnotation makeAnnotation(ContigRank rank, Position start, Position end,
                                              std::optional<std::string> score,
                                              std::optional<std::string> culprit = std::nullopt) {
    ScoredAnnotation annotation;
    annotation.locus = Coordinate(rank == 0 ? "chr1" : "chr2", rank, start, end);
    annotation.scoreText = std::move(score);
    annotation.culprit = std::move(culprit);
    return annotation;
}

// =============================================================================
// Matching Tests
// =============================================================================

TEST(CoordinateJoinTest, MatchesOnEndCoordinate) {
    std::vector<ScoredAnnotation> candidates = {makeAnnotation(0, 100, 100, "1.0"),
                                                makeAnnotation(0, 100, 103, "-2.0")};
    Coordinate deletion("chr1", 0, 100, 103);

    const auto* match = findMatchingScore(deletion, candidates);

    ASSERT_NE(match, nullptr);
    EXPECT_EQ(match->scoreText, "-2.0");
}

TEST(CoordinateJoinTest, FirstMatchWins) {
    std::vector<ScoredAnnotation> candidates = {makeAnnotation(0, 100, 100, "1.0"),
                                                makeAnnotation(0, 100, 100, "9.0")};

    const auto* match = findMatchingScore(Coordinate("chr1", 0, 100), candidates);

    ASSERT_NE(match, nullptr);
    EXPECT_EQ(match->scoreText, "1.0");
}

TEST(CoordinateJoinTest, DifferentContigDoesNotMatch) {
    std::vector<ScoredAnnotation> candidates = {makeAnnotation(1, 100, 100, "1.0")};

    EXPECT_EQ(findMatchingScore(Coordinate("chr1", 0, 100), candidates), nullptr);
}

TEST(CoordinateJoinTest, MissingPairingIsJoinMismatch) {
    std::vector<ScoredAnnotation> candidates = {makeAnnotation(0, 100, 105, "1.0")};

    try {
        (void)requireMatchingScore(Coordinate("chr1", 0, 100), candidates, "[chr1:100 A>G]");
        FAIL() << "expected JoinMismatchError";
    } catch (const JoinMismatchError& ex) {
        EXPECT_EQ(ex.exitCode(), 5);
        EXPECT_NE(ex.message().find("isn't found in the input recal file"), std::string::npos);
        EXPECT_NE(ex.message().find("[chr1:100 A>G]"), std::string::npos);
    }
}

TEST(CoordinateJoinTest, NoCandidatesIsJoinMismatch) {
    EXPECT_THROW((void)requireMatchingScore(Coordinate("chr1", 0, 5), {}, "chr1:5"),
                 JoinMismatchError);
}

// =============================================================================
// Score Parsing Tests
// =============================================================================

TEST(CoordinateJoinTest, ParseScoreVariants) {
    EXPECT_DOUBLE_EQ(parseScore(makeAnnotation(0, 1, 1, "3.25"), "x"), 3.25);
    EXPECT_DOUBLE_EQ(parseScore(makeAnnotation(0, 1, 1, "+1.5"), "x"), 1.5);
    EXPECT_DOUBLE_EQ(parseScore(makeAnnotation(0, 1, 1, " -0.75 "), "x"), -0.75);
    EXPECT_DOUBLE_EQ(parseScore(makeAnnotation(0, 1, 1, "1e2"), "x"), 100.0);
    EXPECT_TRUE(std::isinf(parseScore(makeAnnotation(0, 1, 1, "-Infinity"), "x")));
    EXPECT_TRUE(std::isnan(parseScore(makeAnnotation(0, 1, 1, "NaN"), "x")));
}

TEST(CoordinateJoinTest, ParseScoreOutOfRangeSaturates) {
    auto huge = parseScore(makeAnnotation(0, 1, 1, "1e400"), "x");
    EXPECT_TRUE(std::isinf(huge));
    EXPECT_GT(huge, 0.0);

    auto hugeNegative = parseScore(makeAnnotation(0, 1, 1, "-1e400"), "x");
    EXPECT_TRUE(std::isinf(hugeNegative));
    EXPECT_LT(hugeNegative, 0.0);

    EXPECT_DOUBLE_EQ(parseScore(makeAnnotation(0, 1, 1, "1e-400"), "x"), 0.0);
}

TEST(CoordinateJoinTest, MissingScoreIsJoinMismatch) {
    try {
        (void)parseScore(makeAnnotation(0, 7, 7, std::nullopt), "chr1:7");
        FAIL() << "expected JoinMismatchError";
    } catch (const JoinMismatchError& ex) {
        EXPECT_NE(ex.message().find("There is no lod"), std::string::npos);
    }
}

TEST(CoordinateJoinTest, UnreadableScoreIsJoinMismatch) {
    EXPECT_THROW((void)parseScore(makeAnnotation(0, 7, 7, "high"), "chr1:7"), JoinMismatchError);
    EXPECT_THROW((void)parseScore(makeAnnotation(0, 7, 7, "1.5x"), "chr1:7"), JoinMismatchError);
    EXPECT_THROW((void)parseScore(makeAnnotation(0, 7, 7, "+"), "chr1:7"), JoinMismatchError);
}

// =============================================================================
// Record Extraction Tests
// =============================================================================

TEST(CoordinateJoinTest, FromRecordReadsScoreAndCulprit) {
    auto record = VariantRecordBuilder()
                      .locus("chr1", 0, 100)
                      .alleles("A", {"G"})
                      .attribute("VQSLOD", "4.2")
                      .attribute("culprit", "FS")
                      .make();

    auto annotation = ScoredAnnotation::fromRecord(record);

    EXPECT_EQ(annotation.locus, Coordinate("chr1", 0, 100));
    EXPECT_EQ(annotation.scoreText, "4.2");
    EXPECT_EQ(annotation.culprit, "FS");
}

TEST(CoordinateJoinTest, FromRecordWithoutScore) {
    auto record = VariantRecordBuilder().locus("chr1", 0, 100).alleles("A", {"G"}).make();

    auto annotation = ScoredAnnotation::fromRecord(record);

    EXPECT_FALSE(annotation.scoreText.has_value());
    EXPECT_FALSE(annotation.culprit.has_value());
}

}  // namespace
}  // namespace vqt::traversal

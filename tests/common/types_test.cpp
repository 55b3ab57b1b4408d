// =============================================================================
// vq-tiers - Common Types Tests
// =============================================================================
// Unit tests for coordinates, the contig dictionary, FILTER/INFO columns and
// variant records.
// =============================================================================

#include "vqt/common/types.h"

#include <gtest/gtest.h>

#include "vqt/common/error.h"

namespace vqt {
namespace {

// =============================================================================
// Coordinate Tests
// =============================================================================

TEST(CoordinateTest, OrderedByRankThenStartThenEnd) {
    Coordinate a("chr2", 0, 500, 500);
    Coordinate b("chr1", 1, 10, 10);
    Coordinate c("chr1", 1, 10, 20);

    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
    EXPECT_EQ(Coordinate("x", 1, 10, 20), c);
}

TEST(CoordinateTest, OverlapBeforeAndPast) {
    Coordinate deletion("chr1", 0, 100, 105);
    Coordinate site("chr1", 0, 103);

    EXPECT_TRUE(deletion.overlaps(site));
    EXPECT_FALSE(deletion.isBefore(site));
    EXPECT_TRUE(Coordinate("chr1", 0, 90, 99).isBefore(Coordinate("chr1", 0, 100)));
    EXPECT_TRUE(Coordinate("chr1", 0, 101).isPast(Coordinate("chr1", 0, 100)));
    EXPECT_TRUE(Coordinate("chr2", 1, 1).isPast(Coordinate("chr1", 0, 1000)));
    EXPECT_EQ(deletion.toString(), "chr1:100-105");
}

// =============================================================================
// ContigDictionary Tests
// =============================================================================

TEST(ContigDictionaryTest, RanksInOrderOfFirstAppearance) {
    ContigDictionary dictionary({"chr1", "chr2"});

    EXPECT_EQ(dictionary.rankOf("chr2"), 1u);
    EXPECT_EQ(dictionary.rankOf("chrX"), 2u);
    EXPECT_EQ(dictionary.nameOf(2), "chrX");
    EXPECT_EQ(dictionary.size(), 3u);
}

TEST(ContigDictionaryTest, FrozenDictionaryRejectsUnknownContigs) {
    ContigDictionary dictionary({"chr1"});
    dictionary.freeze();

    EXPECT_EQ(dictionary.rankOf("chr1"), 0u);
    EXPECT_THROW((void)dictionary.rankOf("chr9"), FormatError);
    EXPECT_FALSE(dictionary.find("chr9").has_value());
}

// =============================================================================
// FilterStatus Tests
// =============================================================================

TEST(FilterStatusTest, Parse) {
    EXPECT_TRUE(FilterStatus::parse(".").isNotFiltered());
    EXPECT_FALSE(FilterStatus::parse(".").isPass());
    EXPECT_TRUE(FilterStatus::parse("PASS").isPass());
    EXPECT_TRUE(FilterStatus::parse("PASS").isNotFiltered());

    auto filtered = FilterStatus::parse("LowQual;LowQual;HardFilter");
    EXPECT_TRUE(filtered.isFiltered());
    EXPECT_EQ(filtered.names(), (std::vector<std::string>{"LowQual", "HardFilter"}));
    EXPECT_EQ(filtered.toString(), "LowQual;HardFilter");
}

// =============================================================================
// Variant Classification Tests
// =============================================================================

TEST(VariantTypeTest, ClassifyAlleles) {
    EXPECT_EQ(classifyAlleles("A", {"G"}), VariantType::kSnp);
    EXPECT_EQ(classifyAlleles("AC", {"GT"}), VariantType::kMnp);
    EXPECT_EQ(classifyAlleles("A", {"AT"}), VariantType::kIndel);
    EXPECT_EQ(classifyAlleles("A", {"G", "AT"}), VariantType::kMixed);
    EXPECT_EQ(classifyAlleles("A", {"<DEL>"}), VariantType::kSymbolic);
    EXPECT_EQ(classifyAlleles("A", {}), VariantType::kNoVariation);
}

TEST(VariantTypeTest, ModeCompatibility) {
    EXPECT_TRUE(isCompatibleWithMode(VariantType::kSnp, VariantMode::kSnp));
    EXPECT_TRUE(isCompatibleWithMode(VariantType::kMnp, VariantMode::kSnp));
    EXPECT_FALSE(isCompatibleWithMode(VariantType::kIndel, VariantMode::kSnp));
    EXPECT_TRUE(isCompatibleWithMode(VariantType::kMixed, VariantMode::kIndel));
    EXPECT_FALSE(isCompatibleWithMode(VariantType::kSnp, VariantMode::kIndel));
    EXPECT_TRUE(isCompatibleWithMode(VariantType::kNoVariation, VariantMode::kBoth));
}

TEST(VariantTypeTest, ParseMode) {
    EXPECT_EQ(parseVariantMode("indel"), VariantMode::kIndel);
    EXPECT_EQ(parseVariantMode("BOTH"), VariantMode::kBoth);
    EXPECT_FALSE(parseVariantMode("SV").has_value());
}

// =============================================================================
// VariantRecord Tests
// =============================================================================

TEST(VariantRecordTest, EndFromReferenceLengthOrInfoEnd) {
    auto deletion = VariantRecordBuilder().locus("chr1", 0, 100).alleles("ACGT", {"A"}).make();
    EXPECT_EQ(deletion.end(), 103);

    auto symbolic = VariantRecordBuilder()
                        .locus("chr1", 0, 100)
                        .alleles("A", {"<DEL>"})
                        .attribute("END", "250")
                        .make();
    EXPECT_EQ(symbolic.end(), 250);
    EXPECT_EQ(symbolic.type(), VariantType::kSymbolic);
}

TEST(VariantRecordTest, InvalidEndOrEmptyRefThrows) {
    EXPECT_THROW((void)VariantRecordBuilder()
                     .locus("chr1", 0, 100)
                     .alleles("A", {"G"})
                     .attribute("END", "50")
                     .make(),
                 FormatError);
    EXPECT_THROW((void)VariantRecordBuilder().locus("chr1", 0, 100).make(), FormatError);
}

TEST(VariantRecordTest, AnnotatedCopyLeavesOriginalUntouched) {
    auto original = VariantRecordBuilder()
                        .locus("chr1", 0, 100)
                        .id("rs1")
                        .alleles("A", {"G"})
                        .qual("50")
                        .info(InfoFields::parse("DP=10;DB"))
                        .sampleColumns("GT\t0/1")
                        .make();

    auto annotated = VariantRecordBuilder(original).attribute("VQSLOD", "3.5").passFilters().make();

    EXPECT_FALSE(original.attribute("VQSLOD").has_value());
    EXPECT_EQ(annotated.attribute("VQSLOD"), "3.5");
    EXPECT_EQ(original.toVcfLine(), "chr1\t100\trs1\tA\tG\t50\t.\tDP=10;DB\tGT\t0/1");
    EXPECT_EQ(annotated.toVcfLine(), "chr1\t100\trs1\tA\tG\t50\tPASS\tDP=10;DB;VQSLOD=3.5\tGT\t0/1");
}

}  // namespace
}  // namespace vqt

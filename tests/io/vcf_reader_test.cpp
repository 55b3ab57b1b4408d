// =============================================================================
// vq-tiers - VCF Reader and Writer Tests
// =============================================================================
// Unit tests for header handling, record parsing, interval restriction,
// ordering checks, feature sites and VCF output.
// =============================================================================

#include "vqt/io/vcf_reader.h"

#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "vqt/io/vcf_writer.h"

namespace vqt::io {
namespace {

// =============================================================================
// Test Utilities
// =============================================================================

constexpr const char* kHeader =
    "##fileformat=VCFv4.2\n"
    "##contig=<ID=chr1,length=1000>\n"
    "##contig=<ID=chr2,length=1000>\n"
    "##FILTER=<ID=LowQual,Description=\"Low quality\">\n"
    "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tNA12878\n";

[[nodiscard]] std::unique_ptr<VcfReader> openText(const std::string& text,
                                                  ContigDictionary& dictionary,
                                                  VcfReaderOptions options = {}) {
    if (options.name.empty()) {
        options.name = "test.vcf";
    }
    return std::make_unique<VcfReader>(std::make_unique<std::istringstream>(text), dictionary,
                                       std::move(options));
}

[[nodiscard]] std::string dataLine(const std::string& contig, int pos,
                                   const std::string& ref = "A", const std::string& alt = "G") {
    return contig + "\t" + std::to_string(pos) + "\t.\t" + ref + "\t" + alt +
           "\t50\t.\tDP=10\tGT\t0/1\n";
}

template <typename Source>
[[nodiscard]] std::vector<std::string> drainLoci(Source& source) {
    std::vector<std::string> loci;
    while (auto record = source.pop()) {
        loci.push_back(record->contig() + ":" + std::to_string(record->position()));
    }
    return loci;
}

// =============================================================================
// Header Tests
// =============================================================================

TEST(VcfReaderTest, ReadsHeaderAndRegistersContigs) {
    ContigDictionary dictionary;
    auto reader = openText(kHeader, dictionary);

    const auto& header = reader->header();
    EXPECT_EQ(header.metaLines().size(), 4u);
    EXPECT_EQ(header.contigs(), (std::vector<std::string>{"chr1", "chr2"}));
    EXPECT_EQ(header.sampleNames(), (std::vector<std::string>{"NA12878"}));
    EXPECT_EQ(dictionary.names(), (std::vector<std::string>{"chr1", "chr2"}));
    EXPECT_FALSE(reader->readRecord().has_value());
}

TEST(VcfReaderTest, MissingColumnLineIsFormatError) {
    ContigDictionary dictionary;
    EXPECT_THROW((void)openText("##fileformat=VCFv4.2\n" + dataLine("chr1", 5), dictionary),
                 FormatError);
}

TEST(VcfReaderTest, MalformedColumnLineIsFormatError) {
    ContigDictionary dictionary;
    EXPECT_THROW((void)openText("#CHROM\tPOS\tREF\n", dictionary), FormatError);
}

TEST(VcfHeaderTest, MetaLineKeysAndReplacement) {
    EXPECT_EQ(VcfHeader::metaLineKey("##FILTER=<ID=LowQual,Description=\"x\">"), "FILTER/LowQual");
    EXPECT_EQ(VcfHeader::metaLineKey("##INFO=<Number=1,ID=DP,Type=Integer>"), "INFO/DP");
    EXPECT_EQ(VcfHeader::metaLineKey("##source=caller"), "##source=caller");

    VcfHeader header;
    header.addMetaLine("##FILTER=<ID=T99,Description=\"old\">");
    header.addMetaLine("##FILTER=<ID=T99,Description=\"new\">");
    ASSERT_EQ(header.metaLines().size(), 1u);
    EXPECT_EQ(header.metaLines()[0], "##FILTER=<ID=T99,Description=\"new\">");
}

TEST(VcfHeaderTest, MergeKeepsExistingLines) {
    VcfHeader first;
    first.addMetaLine("##INFO=<ID=DP,Description=\"first\">");
    VcfHeader second;
    second.addMetaLine("##INFO=<ID=DP,Description=\"second\">");
    second.addMetaLine("##INFO=<ID=AC,Description=\"count\">");

    first.mergeMetaLines(second);

    ASSERT_EQ(first.metaLines().size(), 2u);
    EXPECT_EQ(first.metaLines()[0], "##INFO=<ID=DP,Description=\"first\">");
    EXPECT_EQ(first.toString(),
              "##INFO=<ID=DP,Description=\"first\">\n##INFO=<ID=AC,Description=\"count\">\n"
              "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\n");
}

// =============================================================================
// Record Tests
// =============================================================================

TEST(VcfReaderTest, ParsesRecords) {
    ContigDictionary dictionary;
    auto reader = openText(std::string(kHeader) + dataLine("chr1", 100, "ACG", "A,AT") +
                               "chr2\t7\trs9\tC\t.\t.\tPASS\t.\r\n",
                           dictionary);

    auto first = reader->readRecord();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->coordinate(), Coordinate("chr1", 0, 100, 102));
    EXPECT_EQ(first->type(), VariantType::kIndel);
    EXPECT_EQ(first->toVcfLine(), "chr1\t100\t.\tACG\tA,AT\t50\t.\tDP=10\tGT\t0/1");

    auto second = reader->readRecord();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->coordinate().rank(), 1u);
    EXPECT_TRUE(second->filters().isPass());
    EXPECT_EQ(second->toVcfLine(), "chr2\t7\trs9\tC\t.\t.\tPASS\t.");

    EXPECT_FALSE(reader->readRecord().has_value());
    EXPECT_EQ(reader->recordsRead(), 2u);
}

TEST(VcfReaderTest, MalformedLineReportsLineNumber) {
    ContigDictionary dictionary;
    auto reader = openText(std::string(kHeader) + "chr1\tpos\t.\tA\tG\t50\t.\t.\n", dictionary);

    try {
        (void)reader->readRecord();
        FAIL() << "expected FormatError";
    } catch (const FormatError& ex) {
        ASSERT_TRUE(ex.hasContext());
        EXPECT_EQ(ex.context()->sourceName, "test.vcf");
        EXPECT_EQ(ex.context()->lineNumber, 6u);
    }
}

TEST(VcfReaderTest, TooFewColumnsIsFormatError) {
    ContigDictionary dictionary;
    auto reader = openText(std::string(kHeader) + "chr1\t5\t.\tA\n", dictionary);
    EXPECT_THROW((void)reader->readRecord(), FormatError);
}

TEST(VcfReaderTest, UnsortedInputIsSequenceOrderViolation) {
    ContigDictionary dictionary;
    auto reader =
        openText(std::string(kHeader) + dataLine("chr1", 200) + dataLine("chr1", 100), dictionary);

    (void)reader->readRecord();
    EXPECT_THROW((void)reader->readRecord(), SequenceOrderViolation);
}

TEST(VcfReaderTest, ContigBackwardsIsSequenceOrderViolation) {
    ContigDictionary dictionary;
    auto reader =
        openText(std::string(kHeader) + dataLine("chr2", 5) + dataLine("chr1", 10), dictionary);

    (void)reader->readRecord();
    EXPECT_THROW((void)reader->readRecord(), SequenceOrderViolation);
}

TEST(VcfReaderTest, PeekDoesNotConsume) {
    ContigDictionary dictionary;
    auto reader = openText(std::string(kHeader) + dataLine("chr1", 5), dictionary);

    const VariantRecord* peeked = reader->peek();
    ASSERT_NE(peeked, nullptr);
    EXPECT_EQ(peeked->position(), 5);
    EXPECT_EQ(reader->peek(), peeked);

    auto popped = reader->pop();
    ASSERT_TRUE(popped.has_value());
    EXPECT_EQ(popped->position(), 5);
    EXPECT_EQ(reader->peek(), nullptr);
}

// =============================================================================
// Interval Restriction Tests
// =============================================================================

TEST(VcfReaderTest, IntervalKeepsRecordsStartingInside) {
    ContigDictionary dictionary;
    VcfReaderOptions options;
    options.interval = *traversal::parseInterval("chr1:100-200");

    auto reader = openText(std::string(kHeader) + dataLine("chr1", 90, "AAAAAAAAAAAAAAA", "A") +
                               dataLine("chr1", 100) + dataLine("chr1", 200) +
                               dataLine("chr1", 201) + dataLine("chr2", 150),
                           dictionary, options);

    EXPECT_EQ(drainLoci(*reader), (std::vector<std::string>{"chr1:100", "chr1:200"}));
    EXPECT_EQ(reader->recordsSkipped(), 2u);
}

TEST(VcfReaderTest, IntervalSkipsOtherContigsUnparsed) {
    ContigDictionary dictionary({"chr1", "chr2"});
    dictionary.freeze();
    VcfReaderOptions options;
    options.interval = *traversal::parseInterval("chr2");

    // chrUn is unknown to the frozen dictionary; it is never parsed.
    auto reader = openText(std::string(kHeader) + dataLine("chr1", 5) + dataLine("chr2", 1) +
                               dataLine("chr2", 9) + dataLine("chrUn", 3),
                           dictionary, options);

    EXPECT_EQ(drainLoci(*reader), (std::vector<std::string>{"chr2:1", "chr2:9"}));
}

TEST(VcfReaderTest, UnknownContigInFrozenDictionaryIsFormatError) {
    ContigDictionary dictionary({"chr1", "chr2"});
    dictionary.freeze();
    auto reader = openText(std::string(kHeader) + dataLine("chrUn", 3), dictionary);

    EXPECT_THROW((void)reader->readRecord(), FormatError);
}

// =============================================================================
// FeatureSiteSource Tests
// =============================================================================

TEST(FeatureSiteSourceTest, DistinctStartsInOrder) {
    ContigDictionary dictionary;
    auto reader = openText(std::string(kHeader) + dataLine("chr1", 5) + dataLine("chr1", 5, "A", "T") +
                               dataLine("chr1", 8, "AC", "A") + dataLine("chr2", 1),
                           dictionary);
    FeatureSiteSource sites(*reader);

    std::vector<Coordinate> seen;
    while (auto site = sites.next()) {
        seen.push_back(*site);
    }

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], Coordinate("chr1", 0, 5));
    EXPECT_EQ(seen[1], Coordinate("chr1", 0, 8));
    EXPECT_EQ(seen[2], Coordinate("chr2", 1, 1));
}

// =============================================================================
// VcfWriter Tests
// =============================================================================

TEST(VcfWriterTest, WritesHeaderRecordsAndAppendedBody) {
    ContigDictionary dictionary;
    auto reader = openText(std::string(kHeader) + dataLine("chr1", 5), dictionary);
    auto record = reader->readRecord();
    ASSERT_TRUE(record.has_value());

    std::ostringstream out;
    VcfWriter writer(out, "memory");
    writer.writeHeader(reader->header());
    writer.add(*record);

    std::istringstream body(dataLine("chr2", 1) + dataLine("chr2", 2));
    writer.appendBody(body, 2);
    std::istringstream emptyBody("");
    writer.appendBody(emptyBody, 0);
    writer.flush();

    EXPECT_EQ(out.str(), std::string(kHeader) + dataLine("chr1", 5) + dataLine("chr2", 1) +
                             dataLine("chr2", 2));
    EXPECT_EQ(writer.recordsWritten(), 3u);
}

TEST(VcfWriterTest, UnwritableFileIsIOError) {
    EXPECT_THROW(VcfWriter("/nonexistent/vqt/out.vcf"), IOError);
}

}  // namespace
}  // namespace vqt::io

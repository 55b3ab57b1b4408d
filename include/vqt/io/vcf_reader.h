// =============================================================================
// vq-tiers - VCF Reader
// =============================================================================
// Streaming, line-oriented VCF reader.
//
// This module provides:
// - VcfHeader: "##" meta lines and the "#CHROM" column line
// - VcfReader: CoordinateSource over the data lines of one VCF, optionally
//   restricted to records starting inside an interval
// - FeatureSiteSource: Distinct record starts of a source, as traversal sites
//
// Usage:
//   ContigDictionary dictionary;
//   VcfReader reader("calls.vcf.gz", dictionary);
//   while (auto record = reader.readRecord()) { ... }
// =============================================================================

#ifndef VQT_IO_VCF_READER_H
#define VQT_IO_VCF_READER_H

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "vqt/common/error.h"
#include "vqt/common/types.h"
#include "vqt/traversal/coordinate_source.h"
#include "vqt/traversal/interval.h"

namespace vqt::io {

// =============================================================================
// VCF Header
// =============================================================================

/// @brief Mandatory VCF columns, in order.
inline constexpr std::string_view kVcfFixedColumns[] = {"#CHROM", "POS",    "ID",     "REF",
                                                        "ALT",    "QUAL",   "FILTER", "INFO"};

/// @brief Meta-information and column lines of a VCF.
class VcfHeader {
public:
    /// @brief "##" lines, in file order, without the trailing newline.
    [[nodiscard]] const std::vector<std::string>& metaLines() const noexcept { return metaLines_; }

    /// @brief Column names of the "#CHROM" line ("#CHROM" included).
    [[nodiscard]] const std::vector<std::string>& columns() const noexcept { return columns_; }

    /// @brief Sample names (columns after FORMAT).
    [[nodiscard]] std::vector<std::string> sampleNames() const;

    /// @brief Contig IDs declared by "##contig" lines, in order.
    [[nodiscard]] std::vector<std::string> contigs() const;

    /// @brief Add a meta line, replacing a structured line with the same key and ID.
    void addMetaLine(std::string line);

    /// @brief Add every meta line of @p other not already present.
    void mergeMetaLines(const VcfHeader& other);

    void setColumns(std::vector<std::string> columns) { columns_ = std::move(columns); }

    /// @brief "#CHROM\tPOS..." line (the eight fixed columns if none were read).
    [[nodiscard]] std::string columnLine() const;

    /// @brief Full header text, newline terminated.
    [[nodiscard]] std::string toString() const;

    /// @brief Key identifying a meta line, e.g. "FILTER/LowQual" or the line itself.
    [[nodiscard]] static std::string metaLineKey(std::string_view line);

private:
    std::vector<std::string> metaLines_;
    std::vector<std::string> columns_;
};

// =============================================================================
// Reader Options
// =============================================================================

/// @brief Configuration options for the VCF reader.
struct VcfReaderOptions {
    /// @brief Only records starting inside this interval are returned.
    std::optional<traversal::Interval> interval;

    /// @brief Reject records on contigs missing from the dictionary instead of
    ///        skipping them with the rest of the out-of-interval lines.
    bool requireDeclaredContigs = false;

    /// @brief Source name for messages (defaults to the file path).
    std::string name;
};

// =============================================================================
// VcfReader
// =============================================================================

/// @brief Coordinate-sorted stream of VariantRecords read from a VCF.
///
/// The header is read on construction. Contigs of "##contig" lines are added
/// to the dictionary unless it is frozen.
///
/// Thread Safety:
/// - Not thread-safe; use one reader per shard
class VcfReader final : public traversal::CoordinateSource<VariantRecord> {
public:
    /// @brief Open a VCF file (or "-" for stdin), possibly compressed.
    /// @throws IOError if the file cannot be opened.
    /// @throws FormatError if the header is malformed.
    VcfReader(const std::filesystem::path& path, ContigDictionary& dictionary,
              VcfReaderOptions options = {});

    /// @brief Read from an already open stream.
    VcfReader(std::unique_ptr<std::istream> stream, ContigDictionary& dictionary,
              VcfReaderOptions options = {});

    ~VcfReader() override;

    VcfReader(const VcfReader&) = delete;
    VcfReader& operator=(const VcfReader&) = delete;

    [[nodiscard]] const VcfHeader& header() const noexcept { return header_; }

    /// @brief Read the next record.
    /// @return The record, or nullopt at end of input.
    /// @throws FormatError on a malformed line.
    /// @throws SequenceOrderViolation if records are not coordinate sorted.
    [[nodiscard]] std::optional<VariantRecord> readRecord();

    // CoordinateSource interface
    [[nodiscard]] const VariantRecord* peek() override;
    [[nodiscard]] std::optional<VariantRecord> pop() override;
    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    /// @brief Current line number (1-based).
    [[nodiscard]] std::uint64_t lineNumber() const noexcept { return lineNumber_; }

    /// @brief Records returned so far.
    [[nodiscard]] std::uint64_t recordsRead() const noexcept { return recordsRead_; }

    /// @brief Records skipped for lying outside the interval.
    [[nodiscard]] std::uint64_t recordsSkipped() const noexcept { return recordsSkipped_; }

private:
    void readHeader();
    [[nodiscard]] bool onIntervalContig(std::string_view line);
    [[nodiscard]] std::optional<VariantRecord> readNextInRange();
    [[nodiscard]] VariantRecord parseDataLine(std::string_view line);
    void checkOrder(const VariantRecord& record);
    [[nodiscard]] ErrorContext context() const;

    std::unique_ptr<std::istream> stream_;
    ContigDictionary& dictionary_;
    VcfReaderOptions options_;
    std::string name_;
    VcfHeader header_;

    std::string line_;
    std::optional<std::string> pendingLine_;
    std::optional<VariantRecord> lookahead_;
    std::optional<Coordinate> lastCoordinate_;
    bool seenIntervalContig_ = false;
    bool passedInterval_ = false;

    std::uint64_t lineNumber_ = 0;
    std::uint64_t recordsRead_ = 0;
    std::uint64_t recordsSkipped_ = 0;
};

// =============================================================================
// FeatureSiteSource
// =============================================================================

/// @brief Yields each distinct record start of a source once, in order.
///
/// Only peeks the source: records are consumed by whoever else drains it
/// (typically a lookahead queue over the same source). Records starting at
/// or before the last emitted site that are still pending are popped so the
/// source can also be used on its own.
class FeatureSiteSource final : public traversal::SiteSource {
public:
    explicit FeatureSiteSource(traversal::CoordinateSource<VariantRecord>& source)
        : source_(source) {}

    [[nodiscard]] std::optional<Coordinate> next() override;

private:
    traversal::CoordinateSource<VariantRecord>& source_;
    std::optional<Coordinate> last_;
};

}  // namespace vqt::io

#endif  // VQT_IO_VCF_READER_H

// =============================================================================
// vq-tiers - Common Type Definitions
// =============================================================================
// Core type definitions for the vq-tiers library.
//
// This module defines:
// - Coordinate: Contig-ranked, 1-based inclusive genomic interval
// - ContigDictionary: Contig name to rank mapping
// - FilterStatus: VCF FILTER column state
// - VariantType / VariantMode: Allele classification and recalibration mode
// - InfoFields: Ordered INFO key/value pairs
// - VariantRecord / VariantRecordBuilder: Immutable variant record and its builder
// - C++20 Concepts for coordinate-keyed entries
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef VQT_COMMON_TYPES_H
#define VQT_COMMON_TYPES_H

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace vqt {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief 1-based genomic position.
using Position = std::int64_t;

/// @brief Rank of a contig in the sequence dictionary (defines contig order).
using ContigRank = std::uint32_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief VCF missing value.
inline constexpr std::string_view kMissingValue = ".";

/// @brief VCF FILTER value for records passing all filters.
inline constexpr std::string_view kPassFilter = "PASS";

/// @brief INFO key carrying the recalibrated score.
inline constexpr std::string_view kScoreKey = "VQSLOD";

/// @brief INFO key carrying the worst-performing annotation.
inline constexpr std::string_view kCulpritKey = "culprit";

/// @brief INFO key carrying an explicit record end.
inline constexpr std::string_view kEndKey = "END";

// =============================================================================
// Coordinate
// =============================================================================

/// @brief Immutable genomic interval [start, end] on a ranked contig.
/// @note Ordered by (rank, start, end). The contig name is carried for
///       messages and output only.
class Coordinate {
public:
    Coordinate() = default;

    Coordinate(std::string contig, ContigRank rank, Position start, Position end)
        : contig_(std::move(contig)), rank_(rank), start_(start), end_(end) {}

    /// @brief Single-position coordinate.
    Coordinate(std::string contig, ContigRank rank, Position pos)
        : Coordinate(std::move(contig), rank, pos, pos) {}

    [[nodiscard]] const std::string& contig() const noexcept { return contig_; }
    [[nodiscard]] ContigRank rank() const noexcept { return rank_; }
    [[nodiscard]] Position start() const noexcept { return start_; }
    [[nodiscard]] Position end() const noexcept { return end_; }

    /// @brief Check whether the two intervals share at least one position.
    [[nodiscard]] bool overlaps(const Coordinate& other) const noexcept {
        return rank_ == other.rank_ && start_ <= other.end_ && end_ >= other.start_;
    }

    /// @brief Check whether this interval lies entirely before @p other.
    [[nodiscard]] bool isBefore(const Coordinate& other) const noexcept {
        return rank_ < other.rank_ || (rank_ == other.rank_ && end_ < other.start_);
    }

    /// @brief Check whether this interval starts after @p other ends.
    [[nodiscard]] bool isPast(const Coordinate& other) const noexcept {
        return rank_ > other.rank_ || (rank_ == other.rank_ && start_ > other.end_);
    }

    /// @brief Format as "contig:start-end".
    [[nodiscard]] std::string toString() const;

    friend bool operator==(const Coordinate& lhs, const Coordinate& rhs) noexcept {
        return lhs.rank_ == rhs.rank_ && lhs.start_ == rhs.start_ && lhs.end_ == rhs.end_;
    }

    friend std::strong_ordering operator<=>(const Coordinate& lhs,
                                            const Coordinate& rhs) noexcept {
        if (auto cmp = lhs.rank_ <=> rhs.rank_; cmp != 0) {
            return cmp;
        }
        if (auto cmp = lhs.start_ <=> rhs.start_; cmp != 0) {
            return cmp;
        }
        return lhs.end_ <=> rhs.end_;
    }

private:
    std::string contig_;
    ContigRank rank_ = 0;
    Position start_ = 0;
    Position end_ = 0;
};

/// @brief Entries that can be buffered and joined by coordinate.
template <typename T>
concept CoordinateKeyed = requires(const T& entry) {
    { entry.coordinate() } -> std::convertible_to<const Coordinate&>;
};

// =============================================================================
// Contig Dictionary
// =============================================================================

/// @brief Maps contig names to ranks.
///
/// Seeded from `##contig` header lines. While not frozen, unknown contigs are
/// appended in order of first appearance. A frozen dictionary is read-only and
/// may be shared between shards.
class ContigDictionary {
public:
    ContigDictionary() = default;

    explicit ContigDictionary(const std::vector<std::string>& names);

    /// @brief Get the rank of a contig, appending it if unknown.
    /// @throws FormatError if the dictionary is frozen and the contig is unknown.
    [[nodiscard]] ContigRank rankOf(const std::string& name);

    /// @brief Look up a contig without modifying the dictionary.
    [[nodiscard]] std::optional<ContigRank> find(const std::string& name) const;

    /// @brief Append a contig if absent (no-op when present).
    void add(const std::string& name);

    /// @brief Name of the contig with the given rank.
    [[nodiscard]] const std::string& nameOf(ContigRank rank) const;

    [[nodiscard]] std::size_t size() const noexcept { return names_.size(); }
    [[nodiscard]] bool empty() const noexcept { return names_.empty(); }
    [[nodiscard]] const std::vector<std::string>& names() const noexcept { return names_; }

    void freeze() noexcept { frozen_ = true; }
    [[nodiscard]] bool isFrozen() const noexcept { return frozen_; }

private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, ContigRank> ranks_;
    bool frozen_ = false;
};

// =============================================================================
// Filter Status
// =============================================================================

/// @brief State of a record's FILTER column.
class FilterStatus {
public:
    /// @brief FILTER is "." (filters not applied).
    [[nodiscard]] static FilterStatus unfiltered() { return FilterStatus{}; }

    /// @brief FILTER is "PASS".
    [[nodiscard]] static FilterStatus pass();

    /// @brief FILTER names the given filters (duplicates dropped, order kept).
    [[nodiscard]] static FilterStatus filtered(const std::vector<std::string>& names);

    /// @brief Parse a VCF FILTER column.
    [[nodiscard]] static FilterStatus parse(std::string_view text);

    /// @brief True if no filter fails the record ("." or "PASS").
    [[nodiscard]] bool isNotFiltered() const noexcept { return names_.empty(); }

    [[nodiscard]] bool isFiltered() const noexcept { return !names_.empty(); }

    [[nodiscard]] bool isPass() const noexcept { return pass_; }

    [[nodiscard]] const std::vector<std::string>& names() const noexcept { return names_; }

    /// @brief Format as a VCF FILTER column.
    [[nodiscard]] std::string toString() const;

    friend bool operator==(const FilterStatus&, const FilterStatus&) = default;

private:
    bool pass_ = false;
    std::vector<std::string> names_;
};

// =============================================================================
// Variant Classification
// =============================================================================

/// @brief Allele-based variant classification.
enum class VariantType : std::uint8_t {
    kNoVariation = 0,
    kSnp = 1,
    kMnp = 2,
    kIndel = 3,
    kMixed = 4,
    kSymbolic = 5
};

/// @brief Recalibration model/mode: which variant types are recalibrated.
enum class VariantMode : std::uint8_t {
    kSnp = 0,
    kIndel = 1,
    kBoth = 2
};

/// @brief Convert VariantType to string representation.
[[nodiscard]] std::string_view variantTypeToString(VariantType type) noexcept;

/// @brief Convert VariantMode to string representation ("SNP", "INDEL", "BOTH").
[[nodiscard]] std::string_view variantModeToString(VariantMode mode) noexcept;

/// @brief Parse a mode name (case-insensitive).
[[nodiscard]] std::optional<VariantMode> parseVariantMode(std::string_view text) noexcept;

/// @brief Classify a record from its REF and ALT alleles.
[[nodiscard]] VariantType classifyAlleles(std::string_view ref,
                                          const std::vector<std::string>& alts);

/// @brief Check whether records of @p type are recalibrated in @p mode.
[[nodiscard]] constexpr bool isCompatibleWithMode(VariantType type, VariantMode mode) noexcept {
    switch (mode) {
        case VariantMode::kSnp:
            return type == VariantType::kSnp || type == VariantType::kMnp;
        case VariantMode::kIndel:
            return type == VariantType::kIndel || type == VariantType::kMixed ||
                   type == VariantType::kSymbolic;
        case VariantMode::kBoth:
            return true;
    }
    return false;
}

// =============================================================================
// INFO Fields
// =============================================================================

/// @brief Ordered INFO column. Flags have no value.
class InfoFields {
public:
    using Entry = std::pair<std::string, std::optional<std::string>>;

    /// @brief Parse a VCF INFO column ("." yields no fields).
    [[nodiscard]] static InfoFields parse(std::string_view text);

    /// @brief Value of a key; nullopt if absent. Flags yield an empty string.
    [[nodiscard]] std::optional<std::string_view> get(std::string_view key) const;

    [[nodiscard]] bool contains(std::string_view key) const;

    /// @brief Set or replace a key, keeping the original position on replace.
    void set(std::string key, std::optional<std::string> value);

    [[nodiscard]] const std::vector<Entry>& entries() const noexcept { return entries_; }

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// @brief Format as a VCF INFO column.
    [[nodiscard]] std::string toString() const;

    friend bool operator==(const InfoFields&, const InfoFields&) = default;

private:
    std::vector<Entry> entries_;
};

// =============================================================================
// Variant Record
// =============================================================================

class VariantRecordBuilder;

/// @brief One VCF data line.
///
/// Immutable once built; annotation goes through VariantRecordBuilder and
/// yields a new record. The coordinate end is INFO/END when present,
/// otherwise pos + len(REF) - 1.
class VariantRecord {
public:
    [[nodiscard]] const Coordinate& coordinate() const noexcept { return coordinate_; }
    [[nodiscard]] const std::string& contig() const noexcept { return coordinate_.contig(); }
    [[nodiscard]] Position position() const noexcept { return coordinate_.start(); }
    [[nodiscard]] Position end() const noexcept { return coordinate_.end(); }
    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& ref() const noexcept { return ref_; }
    [[nodiscard]] const std::vector<std::string>& alts() const noexcept { return alts_; }
    [[nodiscard]] const std::string& qual() const noexcept { return qual_; }
    [[nodiscard]] const FilterStatus& filters() const noexcept { return filters_; }
    [[nodiscard]] const InfoFields& info() const noexcept { return info_; }

    /// @brief FORMAT and sample columns, tab-joined, carried verbatim.
    [[nodiscard]] const std::string& sampleColumns() const noexcept { return sampleColumns_; }

    [[nodiscard]] VariantType type() const noexcept { return type_; }

    /// @brief INFO value for @p key (nullopt if absent).
    [[nodiscard]] std::optional<std::string_view> attribute(std::string_view key) const {
        return info_.get(key);
    }

    /// @brief Format as a VCF data line (without newline).
    [[nodiscard]] std::string toVcfLine() const;

    friend bool operator==(const VariantRecord&, const VariantRecord&) = default;

private:
    friend class VariantRecordBuilder;

    VariantRecord() = default;

    Coordinate coordinate_;
    std::string id_{kMissingValue};
    std::string ref_;
    std::vector<std::string> alts_;
    std::string qual_{kMissingValue};
    FilterStatus filters_;
    InfoFields info_;
    std::string sampleColumns_;
    VariantType type_ = VariantType::kNoVariation;
};

/// @brief Builds VariantRecords, either from scratch or as a modified copy.
class VariantRecordBuilder {
public:
    VariantRecordBuilder() = default;

    /// @brief Start from an existing record.
    explicit VariantRecordBuilder(const VariantRecord& record);

    VariantRecordBuilder& locus(std::string contig, ContigRank rank, Position pos);
    VariantRecordBuilder& id(std::string value);
    VariantRecordBuilder& alleles(std::string ref, std::vector<std::string> alts);
    VariantRecordBuilder& qual(std::string value);
    VariantRecordBuilder& filters(FilterStatus status);

    /// @brief Replace the FILTER column with a single filter name.
    VariantRecordBuilder& filter(std::string name);

    /// @brief Mark the record as passing all filters.
    VariantRecordBuilder& passFilters();

    VariantRecordBuilder& info(InfoFields fields);
    VariantRecordBuilder& attribute(std::string key, std::optional<std::string> value);
    VariantRecordBuilder& sampleColumns(std::string value);

    /// @brief Build the record.
    /// @throws FormatError if REF is empty or INFO/END is not a valid position.
    [[nodiscard]] VariantRecord make() const;

private:
    std::string contig_;
    ContigRank rank_ = 0;
    Position pos_ = 0;
    VariantRecord record_;
};

}  // namespace vqt

#endif  // VQT_COMMON_TYPES_H

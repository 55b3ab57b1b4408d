// =============================================================================
// vq-tiers - Genomic Intervals
// =============================================================================
// Intervals restrict a traversal to part of the genome and define shards.
// =============================================================================

#ifndef VQT_TRAVERSAL_INTERVAL_H
#define VQT_TRAVERSAL_INTERVAL_H

#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "vqt/common/error.h"
#include "vqt/common/types.h"

namespace vqt::traversal {

/// @brief Contig-named, 1-based inclusive interval.
struct Interval {
    std::string contig;
    Position start = 1;
    Position end = std::numeric_limits<Position>::max();

    /// @brief Check whether a record coordinate overlaps this interval.
    [[nodiscard]] bool overlaps(const Coordinate& coordinate) const noexcept {
        return coordinate.contig() == contig && coordinate.start() <= end &&
               coordinate.end() >= start;
    }

    /// @brief Check whether a record starts inside this interval.
    [[nodiscard]] bool containsStart(const Coordinate& coordinate) const noexcept {
        return coordinate.contig() == contig && coordinate.start() >= start &&
               coordinate.start() <= end;
    }

    /// @brief Whole-contig interval?
    [[nodiscard]] bool isWholeContig() const noexcept {
        return start == 1 && end == std::numeric_limits<Position>::max();
    }

    /// @brief Format as "contig" or "contig:start-end".
    [[nodiscard]] std::string toString() const;

    friend bool operator==(const Interval&, const Interval&) = default;
};

/// @brief Parse "contig", "contig:pos" or "contig:start-end".
/// @note Thousands separators (',') in positions are accepted.
[[nodiscard]] Result<Interval> parseInterval(std::string_view text);

/// @brief Sort intervals by contig rank and start, merging overlapping or
///        adjacent intervals on the same contig.
/// @note Contigs missing from @p dictionary are appended to it.
/// @throws FormatError if @p dictionary is frozen and a contig is unknown.
[[nodiscard]] std::vector<Interval> normalizeIntervals(std::vector<Interval> intervals,
                                                       ContigDictionary& dictionary);

/// @brief One whole-contig interval per contig, in dictionary order.
[[nodiscard]] std::vector<Interval> intervalsForContigs(const ContigDictionary& dictionary);

}  // namespace vqt::traversal

#endif  // VQT_TRAVERSAL_INTERVAL_H

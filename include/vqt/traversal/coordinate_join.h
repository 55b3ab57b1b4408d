// =============================================================================
// vq-tiers - Coordinate Join
// =============================================================================
// Pairs a primary record with the scored annotation at the same locus.
//
// Candidates are the recal records starting at the current site; the join key
// is the end coordinate, and the first candidate with a matching end wins.
// =============================================================================

#ifndef VQT_TRAVERSAL_COORDINATE_JOIN_H
#define VQT_TRAVERSAL_COORDINATE_JOIN_H

#include <optional>
#include <span>
#include <string>

#include "vqt/common/types.h"

namespace vqt::traversal {

/// @brief Read-only view of a recal record.
struct ScoredAnnotation {
    Coordinate locus;

    /// @brief Raw VQSLOD text, kept verbatim for output.
    std::optional<std::string> scoreText;

    /// @brief Worst-performing annotation, if recorded.
    std::optional<std::string> culprit;

    [[nodiscard]] const Coordinate& coordinate() const noexcept { return locus; }

    /// @brief Extract the score and culprit attributes of a recal record.
    [[nodiscard]] static ScoredAnnotation fromRecord(const VariantRecord& record);
};

/// @brief First candidate on the same contig whose end equals the record's end.
/// @return Pointer into @p candidates, or nullptr when nothing matches.
[[nodiscard]] const ScoredAnnotation* findMatchingScore(
    const Coordinate& record, std::span<const ScoredAnnotation> candidates) noexcept;

/// @brief Like findMatchingScore, but a missing pairing is an error.
/// @param recordLocus Rendering of the primary record used in the message
/// @throws JoinMismatchError if no candidate matches.
[[nodiscard]] const ScoredAnnotation& requireMatchingScore(
    const Coordinate& record, std::span<const ScoredAnnotation> candidates,
    const std::string& recordLocus);

/// @brief Parse the score of a matched annotation.
///
/// Leading and trailing whitespace and a leading '+' are tolerated; "inf",
/// "infinity" and "nan" (any case) are accepted.
/// @throws JoinMismatchError if the score is missing or unreadable.
[[nodiscard]] double parseScore(const ScoredAnnotation& annotation,
                                const std::string& recordLocus);

}  // namespace vqt::traversal

#endif  // VQT_TRAVERSAL_COORDINATE_JOIN_H

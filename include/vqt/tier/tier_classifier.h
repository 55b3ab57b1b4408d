// =============================================================================
// vq-tiers - Tier Classifier
// =============================================================================
// Maps a VQSLOD score onto a ThresholdTable.
//
// Tranches are scanned from the most inclusive (last index) towards index 0
// and the first tranche whose minimum score is met wins:
// - met by the last tranche        -> Unfiltered (PASS)
// - met by an intermediate tranche -> Tagged(tranche name)
// - met by none                    -> BelowLowest(first tranche name + "+")
// Boundaries are inclusive (score == minScore meets the tranche).
// =============================================================================

#ifndef VQT_TIER_TIER_CLASSIFIER_H
#define VQT_TIER_TIER_CLASSIFIER_H

#include <cstdint>
#include <string>
#include <string_view>

#include "vqt/tier/threshold_table.h"

namespace vqt::tier {

/// @brief Outcome kind of a classification.
enum class DecisionKind : std::uint8_t {
    kUnfiltered = 0,
    kTagged = 1,
    kBelowLowest = 2
};

/// @brief Convert DecisionKind to string representation.
[[nodiscard]] constexpr std::string_view decisionKindToString(DecisionKind kind) noexcept {
    switch (kind) {
        case DecisionKind::kUnfiltered:
            return "unfiltered";
        case DecisionKind::kTagged:
            return "tagged";
        case DecisionKind::kBelowLowest:
            return "below-lowest";
    }
    return "unknown";
}

/// @brief Result of classifying one score.
struct TierDecision {
    DecisionKind kind = DecisionKind::kUnfiltered;

    /// @brief Filter name; empty for kUnfiltered.
    std::string label;

    [[nodiscard]] static TierDecision unfiltered() { return {DecisionKind::kUnfiltered, {}}; }

    [[nodiscard]] static TierDecision tagged(std::string name) {
        return {DecisionKind::kTagged, std::move(name)};
    }

    [[nodiscard]] static TierDecision belowLowest(std::string name) {
        return {DecisionKind::kBelowLowest, std::move(name)};
    }

    [[nodiscard]] bool isUnfiltered() const noexcept { return kind == DecisionKind::kUnfiltered; }

    /// @brief Value for the FILTER column ("PASS" when unfiltered).
    [[nodiscard]] std::string filterValue() const;

    friend bool operator==(const TierDecision&, const TierDecision&) = default;
};

/// @brief Classify a score against a table. Pure and total.
[[nodiscard]] TierDecision classify(double score, const ThresholdTable& table);

}  // namespace vqt::tier

#endif  // VQT_TIER_TIER_CLASSIFIER_H

// =============================================================================
// vq-tiers - Tier Tally
// =============================================================================
// Accumulator of the filtering pass.
//
// combine() adds counts field by field, so it is associative and commutative
// and TierTally{} is its identity.
// =============================================================================

#ifndef VQT_FILTER_TIER_TALLY_H
#define VQT_FILTER_TIER_TALLY_H

#include <cstdint>
#include <map>
#include <string>

#include "vqt/tier/tier_classifier.h"

namespace vqt::filter {

/// @brief Counts produced by ApplyRecalibration.
struct TierTally {
    /// @brief Sites mapped.
    std::uint64_t sitesVisited = 0;

    /// @brief Records classified and annotated.
    std::uint64_t recordsRecalibrated = 0;

    /// @brief Records emitted untouched (mode or filter mismatch).
    std::uint64_t recordsPassedThrough = 0;

    /// @brief Recalibrated records per FILTER value ("PASS" for unfiltered).
    std::map<std::string, std::uint64_t> byFilter;

    /// @brief Count one recalibrated record.
    void countDecision(const tier::TierDecision& decision);

    /// @brief All records emitted.
    [[nodiscard]] std::uint64_t recordsEmitted() const noexcept {
        return recordsRecalibrated + recordsPassedThrough;
    }

    /// @brief Multi-line, human-readable summary.
    [[nodiscard]] std::string summary() const;

    /// @brief Field-wise sum.
    [[nodiscard]] static TierTally combine(TierTally lhs, const TierTally& rhs);

    friend bool operator==(const TierTally&, const TierTally&) = default;
};

}  // namespace vqt::filter

#endif  // VQT_FILTER_TIER_TALLY_H

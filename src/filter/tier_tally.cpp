// =============================================================================
// vq-tiers - Tier Tally Implementation
// =============================================================================

#include "vqt/filter/tier_tally.h"

#include <fmt/format.h>

namespace vqt::filter {

void TierTally::countDecision(const tier::TierDecision& decision) {
    ++recordsRecalibrated;
    ++byFilter[decision.filterValue()];
}

std::string TierTally::summary() const {
    std::string out = fmt::format(
        "{} sites, {} records emitted ({} recalibrated, {} passed through)", sitesVisited,
        recordsEmitted(), recordsRecalibrated, recordsPassedThrough);
    for (const auto& [filter, count] : byFilter) {
        out += fmt::format("\n  {}: {}", filter, count);
    }
    return out;
}

TierTally TierTally::combine(TierTally lhs, const TierTally& rhs) {
    lhs.sitesVisited += rhs.sitesVisited;
    lhs.recordsRecalibrated += rhs.recordsRecalibrated;
    lhs.recordsPassedThrough += rhs.recordsPassedThrough;
    for (const auto& [filter, count] : rhs.byFilter) {
        lhs.byFilter[filter] += count;
    }
    return lhs;
}

}  // namespace vqt::filter

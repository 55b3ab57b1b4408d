// =============================================================================
// vq-tiers - Tier Classifier Implementation
// =============================================================================

#include "vqt/tier/tier_classifier.h"

#include "vqt/common/types.h"

namespace vqt::tier {

std::string TierDecision::filterValue() const {
    return kind == DecisionKind::kUnfiltered ? std::string(kPassFilter) : label;
}

TierDecision classify(double score, const ThresholdTable& table) {
    const std::size_t last = table.size() - 1;

    // Most inclusive first; first match wins, so a score meeting two adjacent
    // tranches resolves to the more inclusive one.
    for (std::size_t i = table.size(); i-- > 0;) {
        const Tranche& tranche = table[i];
        if (score >= tranche.minScore) {
            if (i == last) {
                return TierDecision::unfiltered();
            }
            return TierDecision::tagged(tranche.name);
        }
    }

    return TierDecision::belowLowest(table.belowLowestName());
}

}  // namespace vqt::tier

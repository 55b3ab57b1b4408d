// =============================================================================
// vq-tiers - Coordinate Traversal Engine Implementation
// =============================================================================

#include "vqt/traversal/traversal_engine.h"

namespace vqt::traversal {

VoidResult TraversalConfig::validate() const {
    if (maxSites && *maxSites == 0) {
        return makeVoidError(ErrorCode::kUsageError, "Maximum site count must be > 0");
    }

    if (downsampleToCoverage && *downsampleToCoverage == 0) {
        return makeVoidError(ErrorCode::kUsageError, "Downsampling coverage must be > 0");
    }

    if (label.empty()) {
        return makeVoidError(ErrorCode::kUsageError, "Traversal label must not be empty");
    }

    return makeVoidSuccess();
}

void logTraversalSummary(const std::string& label, const TraversalStats& stats) {
    VQT_LOG_INFO("{}: traversal done, {} sites processed ({} accepted) in {} ms{}", label,
                 stats.sitesProcessed, stats.sitesAccepted, stats.elapsedMs,
                 stats.stoppedEarly ? " (stopped early)" : "");
    VQT_LOG_DEBUG("{}: {} entries downsampled, peak lookahead buffer {} entries", label,
                  stats.entriesDownsampled, stats.peakBufferedEntries);
}

}  // namespace vqt::traversal

// =============================================================================
// vq-tiers - Coordinate Traversal Engine
// =============================================================================
// Single forward pass over a coordinate-ordered site source.
//
// For each site the engine:
// 1. counts the site and applies the site cutoff
// 2. seeks one LookaheadCoordinateQueue per auxiliary source
// 3. downsamples the overlapping entries to the coverage cap (if any)
// 4. runs filter, then map and combine into the accumulator
// 5. reports progress every progressIntervalSites processed sites
//
// Filter, map, zero and combine are injected as closures. The pass itself is
// single-threaded; parallelism lives in ShardRunner.
//
// Usage:
//   TraversalCallbacks<VariantRecord, TierTally> callbacks{...};
//   CoordinateTraversalEngine engine(sites, {&inputs, &recal}, callbacks, config);
//   TierTally total = engine.run();
// =============================================================================

#ifndef VQT_TRAVERSAL_TRAVERSAL_ENGINE_H
#define VQT_TRAVERSAL_TRAVERSAL_ENGINE_H

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "vqt/common/error.h"
#include "vqt/common/logger.h"
#include "vqt/common/types.h"
#include "vqt/traversal/coordinate_source.h"
#include "vqt/traversal/lookahead_queue.h"

namespace vqt::traversal {

// =============================================================================
// Constants
// =============================================================================

/// @brief Default number of processed sites between progress reports.
inline constexpr std::uint64_t kDefaultProgressIntervalSites = 100'000;

/// @brief Default downsampling seed.
inline constexpr std::uint64_t kDefaultDownsampleSeed = 47382911;

// =============================================================================
// Progress Reporting
// =============================================================================

/// @brief Progress information for callbacks.
struct ProgressInfo {
    /// @brief Label of the reporting pass (shard name).
    std::string label;

    /// @brief Sites processed so far.
    std::uint64_t sitesProcessed = 0;

    /// @brief Locus of the most recent site.
    std::string currentLocus;

    /// @brief Elapsed time (milliseconds).
    std::uint64_t elapsedMs = 0;

    /// @brief Processing rate (sites per second).
    [[nodiscard]] double sitesPerSecond() const noexcept {
        if (elapsedMs == 0) return 0.0;
        return static_cast<double>(sitesProcessed) * 1000.0 / static_cast<double>(elapsedMs);
    }
};

/// @brief Progress callback type.
using ProgressCallback = std::function<void(const ProgressInfo& info)>;

// =============================================================================
// Configuration
// =============================================================================

/// @brief Configuration for one traversal pass.
struct TraversalConfig {
    /// @brief Site cutoff; the pass stops after this many sites.
    std::optional<std::uint64_t> maxSites;

    /// @brief Per-source cap on overlapping entries at a site.
    std::optional<std::size_t> downsampleToCoverage;

    /// @brief Indices of auxiliary sources never downsampled.
    std::vector<std::size_t> downsampleExempt;

    /// @brief Seed of the downsampling generator.
    std::uint64_t downsampleSeed = kDefaultDownsampleSeed;

    /// @brief Processed sites between progress reports (0 disables them).
    std::uint64_t progressIntervalSites = kDefaultProgressIntervalSites;

    /// @brief Optional progress callback, invoked with each progress report.
    ProgressCallback progressCallback;

    /// @brief Label used in log lines.
    std::string label = "traversal";

    /// @brief Validate configuration.
    [[nodiscard]] VoidResult validate() const;

    /// @brief Check whether source @p index is subject to downsampling.
    [[nodiscard]] bool downsamples(std::size_t index) const noexcept {
        return downsampleToCoverage.has_value() &&
               std::find(downsampleExempt.begin(), downsampleExempt.end(), index) ==
                   downsampleExempt.end();
    }
};

// =============================================================================
// Statistics
// =============================================================================

/// @brief Statistics collected during a traversal.
struct TraversalStats {
    /// @brief Sites pulled from the site source and counted.
    std::uint64_t sitesVisited = 0;

    /// @brief Sites that went through filter.
    std::uint64_t sitesProcessed = 0;

    /// @brief Sites accepted by filter and mapped.
    std::uint64_t sitesAccepted = 0;

    /// @brief Auxiliary entries removed by downsampling.
    std::uint64_t entriesDownsampled = 0;

    /// @brief Processing time (milliseconds).
    std::uint64_t elapsedMs = 0;

    /// @brief True if the site cutoff truncated the pass.
    bool stoppedEarly = false;

    /// @brief Largest lookahead buffer over all queues.
    std::size_t peakBufferedEntries = 0;
};

/// @brief Log a one-line summary of a finished pass at info level.
void logTraversalSummary(const std::string& label, const TraversalStats& stats);

// =============================================================================
// Site Context
// =============================================================================

/// @brief Everything the callbacks see at one site.
/// @note Each source has an entry list, empty when nothing overlaps the site.
template <CoordinateKeyed Entry>
class SiteContext {
public:
    SiteContext(Coordinate site, std::vector<std::vector<Entry>> entries)
        : site_(std::move(site)), entries_(std::move(entries)) {}

    [[nodiscard]] const Coordinate& site() const noexcept { return site_; }

    [[nodiscard]] std::size_t sourceCount() const noexcept { return entries_.size(); }

    /// @brief Entries of source @p index overlapping the site.
    [[nodiscard]] const std::vector<Entry>& overlapping(std::size_t index) const {
        return entries_.at(index);
    }

    /// @brief Entries of source @p index starting exactly at the site.
    [[nodiscard]] std::vector<Entry> startingAt(std::size_t index) const {
        std::vector<Entry> result;
        for (const auto& entry : entries_.at(index)) {
            if (entry.coordinate().start() == site_.start()) {
                result.push_back(entry);
            }
        }
        return result;
    }

    /// @brief Number of entries across all sources.
    [[nodiscard]] std::size_t totalEntries() const noexcept {
        std::size_t total = 0;
        for (const auto& list : entries_) {
            total += list.size();
        }
        return total;
    }

private:
    Coordinate site_;
    std::vector<std::vector<Entry>> entries_;
};

// =============================================================================
// Callbacks
// =============================================================================

/// @brief Closures driving a traversal.
/// @tparam Entry Auxiliary entry type
/// @tparam Acc Accumulator type; combine must be associative
template <CoordinateKeyed Entry, typename Acc>
struct TraversalCallbacks {
    /// @brief Initial accumulator value.
    std::function<Acc()> zero;

    /// @brief Site predicate; empty accepts every site.
    std::function<bool(const SiteContext<Entry>&)> filter;

    /// @brief Per-site result.
    std::function<Acc(const SiteContext<Entry>&)> map;

    /// @brief Associative combine of two results.
    std::function<Acc(Acc, Acc)> combine;
};

// =============================================================================
// Engine
// =============================================================================

/// @brief Drives one single-use traversal pass.
template <CoordinateKeyed Entry, typename Acc>
class CoordinateTraversalEngine {
public:
    /// @throws UsageError if the configuration or callbacks are invalid.
    CoordinateTraversalEngine(SiteSource& sites,
                              std::vector<CoordinateSource<Entry>*> sources,
                              TraversalCallbacks<Entry, Acc> callbacks,
                              TraversalConfig config = {})
        : sites_(sites),
          callbacks_(std::move(callbacks)),
          config_(std::move(config)),
          rng_(config_.downsampleSeed) {
        unwrapOrThrow(config_.validate());
        if (!callbacks_.zero || !callbacks_.map || !callbacks_.combine) {
            throw UsageError("Traversal requires zero, map and combine callbacks");
        }
        queues_.reserve(sources.size());
        for (auto* source : sources) {
            queues_.push_back(std::make_unique<LookaheadCoordinateQueue<Entry>>(*source));
        }
    }

    CoordinateTraversalEngine(const CoordinateTraversalEngine&) = delete;
    CoordinateTraversalEngine& operator=(const CoordinateTraversalEngine&) = delete;

    /// @brief Run the pass to completion or to the site cutoff.
    /// @throws std::logic_error if called twice.
    [[nodiscard]] Acc run() {
        if (started_) {
            throw std::logic_error("CoordinateTraversalEngine::run() called twice");
        }
        started_ = true;

        auto startTime = std::chrono::steady_clock::now();
        Acc sum = callbacks_.zero();

        while (auto site = sites_.next()) {
            ++stats_.sitesVisited;

            if (config_.maxSites && stats_.sitesVisited > *config_.maxSites) {
                stats_.stoppedEarly = true;
                VQT_LOG_WARNING("{}: maximum number of sites ({}) reached, terminating traversal at {}",
                                config_.label, *config_.maxSites, site->toString());
                break;
            }

            SiteContext<Entry> context(*site, collect(*site));
            ++stats_.sitesProcessed;

            if (!callbacks_.filter || callbacks_.filter(context)) {
                ++stats_.sitesAccepted;
                sum = callbacks_.combine(std::move(sum), callbacks_.map(context));
            }

            if (config_.progressIntervalSites > 0 &&
                stats_.sitesProcessed % config_.progressIntervalSites == 0) {
                reportProgress(*site, startTime);
            }
        }

        for (const auto& queue : queues_) {
            stats_.peakBufferedEntries = std::max(stats_.peakBufferedEntries, queue->peakBuffered());
        }
        stats_.elapsedMs = elapsedSince(startTime);
        return sum;
    }

    /// @brief Combine two accumulator values with the configured closure.
    [[nodiscard]] Acc combine(Acc lhs, Acc rhs) const {
        return callbacks_.combine(std::move(lhs), std::move(rhs));
    }

    [[nodiscard]] const TraversalStats& stats() const noexcept { return stats_; }

    [[nodiscard]] const TraversalConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::vector<std::vector<Entry>> collect(const Coordinate& site) {
        std::vector<std::vector<Entry>> entries;
        entries.reserve(queues_.size());
        for (std::size_t i = 0; i < queues_.size(); ++i) {
            const auto& overlapping = queues_[i]->seek(site).peek();
            if (config_.downsamples(i) && overlapping.size() > *config_.downsampleToCoverage) {
                entries.push_back(downsample(overlapping, *config_.downsampleToCoverage));
            } else {
                entries.push_back(overlapping);
            }
        }
        return entries;
    }

    /// Keeps coordinate order among the retained entries.
    [[nodiscard]] std::vector<Entry> downsample(const std::vector<Entry>& entries,
                                                std::size_t coverage) {
        std::vector<Entry> kept;
        kept.reserve(coverage);
        std::sample(entries.begin(), entries.end(), std::back_inserter(kept), coverage, rng_);
        stats_.entriesDownsampled += entries.size() - kept.size();
        return kept;
    }

    void reportProgress(const Coordinate& site, std::chrono::steady_clock::time_point startTime) {
        ProgressInfo info;
        info.label = config_.label;
        info.sitesProcessed = stats_.sitesProcessed;
        info.currentLocus = site.toString();
        info.elapsedMs = elapsedSince(startTime);

        VQT_LOG_INFO("{}: {} sites processed, at {} ({:.1f} sites/s)", info.label,
                     info.sitesProcessed, info.currentLocus, info.sitesPerSecond());

        if (config_.progressCallback) {
            config_.progressCallback(info);
        }
    }

    [[nodiscard]] static std::uint64_t elapsedSince(std::chrono::steady_clock::time_point start) {
        return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                              std::chrono::steady_clock::now() - start)
                                              .count());
    }

    SiteSource& sites_;
    std::vector<std::unique_ptr<LookaheadCoordinateQueue<Entry>>> queues_;
    TraversalCallbacks<Entry, Acc> callbacks_;
    TraversalConfig config_;
    std::mt19937_64 rng_;
    TraversalStats stats_;
    bool started_ = false;
};

}  // namespace vqt::traversal

#endif  // VQT_TRAVERSAL_TRAVERSAL_ENGINE_H

// =============================================================================
// vq-tiers - Traversal Engine Tests
// =============================================================================
// Unit tests for the single-pass traversal: site cutoff, downsampling,
// filter/map/combine wiring and progress reporting.
// =============================================================================

#include "vqt/traversal/traversal_engine.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace vqt::traversal {
namespace {

// =============================================================================
// Test Utilities
// =============================================================================

struct Feature {
    Coordinate locus;
    int id = 0;

    [[nodiscard]] const Coordinate& coordinate() const noexcept { return locus; }
};

[[nodiscard]] std::vector<Coordinate> sitesOnChr1(Position first, Position count) {
    std::vector<Coordinate> sites;
    for (Position pos = first; pos < first + count; ++pos) {
        sites.emplace_back("chr1", 0, pos);
    }
    return sites;
}

/// @brief Callbacks counting accepted sites.
[[nodiscard]] TraversalCallbacks<Feature, std::uint64_t> countingCallbacks() {
    TraversalCallbacks<Feature, std::uint64_t> callbacks;
    callbacks.zero = [] { return std::uint64_t{0}; };
    callbacks.map = [](const SiteContext<Feature>&) { return std::uint64_t{1}; };
    callbacks.combine = [](std::uint64_t a, std::uint64_t b) { return a + b; };
    return callbacks;
}

/// @brief @p count features all spanning chr1:1-100.
[[nodiscard]] std::vector<Feature> pileup(int count) {
    std::vector<Feature> features;
    for (int i = 0; i < count; ++i) {
        features.push_back(Feature{Coordinate("chr1", 0, 1, 100), i});
    }
    return features;
}

/// @brief Ids of source 0 seen at the single site chr1:50.
[[nodiscard]] std::vector<int> downsampledIds(std::uint64_t seed) {
    VectorSiteSource sites({Coordinate("chr1", 0, 50)});
    VectorCoordinateSource<Feature> source(pileup(20));

    std::vector<int> seen;
    auto callbacks = countingCallbacks();
    callbacks.map = [&seen](const SiteContext<Feature>& context) {
        for (const auto& feature : context.overlapping(0)) {
            seen.push_back(feature.id);
        }
        return std::uint64_t{1};
    };

    TraversalConfig config;
    config.downsampleToCoverage = 5;
    config.downsampleSeed = seed;

    CoordinateTraversalEngine<Feature, std::uint64_t> engine(sites, {&source}, callbacks, config);
    (void)engine.run();
    EXPECT_EQ(engine.stats().entriesDownsampled, 15u);
    return seen;
}

// =============================================================================
// Site Cutoff Tests
// =============================================================================

TEST(TraversalEngineTest, VisitsEverySite) {
    VectorSiteSource sites(sitesOnChr1(1, 10));
    CoordinateTraversalEngine<Feature, std::uint64_t> engine(sites, {}, countingCallbacks());

    EXPECT_EQ(engine.run(), 10u);
    EXPECT_EQ(engine.stats().sitesProcessed, 10u);
    EXPECT_FALSE(engine.stats().stoppedEarly);
}

TEST(TraversalEngineTest, CutoffProcessesExactlyMaxSites) {
    VectorSiteSource sites(sitesOnChr1(1, 10));
    TraversalConfig config;
    config.maxSites = 3;

    CoordinateTraversalEngine<Feature, std::uint64_t> engine(sites, {}, countingCallbacks(), config);

    EXPECT_EQ(engine.run(), 3u);
    EXPECT_EQ(engine.stats().sitesProcessed, 3u);
    EXPECT_EQ(engine.stats().sitesVisited, 4u);
    EXPECT_TRUE(engine.stats().stoppedEarly);
}

TEST(TraversalEngineTest, CutoffEqualToSiteCountIsNotEarly) {
    VectorSiteSource sites(sitesOnChr1(1, 3));
    TraversalConfig config;
    config.maxSites = 3;

    CoordinateTraversalEngine<Feature, std::uint64_t> engine(sites, {}, countingCallbacks(), config);

    EXPECT_EQ(engine.run(), 3u);
    EXPECT_FALSE(engine.stats().stoppedEarly);
}

// =============================================================================
// Callback Wiring Tests
// =============================================================================

TEST(TraversalEngineTest, FilterRejectsSitesBeforeMap) {
    VectorSiteSource sites(sitesOnChr1(1, 10));
    auto callbacks = countingCallbacks();
    callbacks.filter = [](const SiteContext<Feature>& context) {
        return context.site().start() % 2 == 0;
    };

    CoordinateTraversalEngine<Feature, std::uint64_t> engine(sites, {}, callbacks);

    EXPECT_EQ(engine.run(), 5u);
    EXPECT_EQ(engine.stats().sitesProcessed, 10u);
    EXPECT_EQ(engine.stats().sitesAccepted, 5u);
}

TEST(TraversalEngineTest, EverySourceHasAnEntryListAtEverySite) {
    VectorSiteSource sites({Coordinate("chr1", 0, 5), Coordinate("chr1", 0, 20)});
    VectorCoordinateSource<Feature> covered({Feature{Coordinate("chr1", 0, 5, 8), 1}});
    VectorCoordinateSource<Feature> empty(std::vector<Feature>{});

    std::vector<std::size_t> sizes;
    auto callbacks = countingCallbacks();
    callbacks.map = [&sizes](const SiteContext<Feature>& context) {
        EXPECT_EQ(context.sourceCount(), 2u);
        sizes.push_back(context.overlapping(0).size());
        sizes.push_back(context.overlapping(1).size());
        return std::uint64_t{1};
    };

    CoordinateTraversalEngine<Feature, std::uint64_t> engine(sites, {&covered, &empty}, callbacks);
    (void)engine.run();

    EXPECT_EQ(sizes, (std::vector<std::size_t>{1, 0, 0, 0}));
}

TEST(TraversalEngineTest, StartingAtSelectsEntriesBeginningAtSite) {
    VectorSiteSource sites({Coordinate("chr1", 0, 10)});
    VectorCoordinateSource<Feature> source(
        {Feature{Coordinate("chr1", 0, 8, 12), 1}, Feature{Coordinate("chr1", 0, 10, 10), 2}});

    std::vector<int> starting;
    auto callbacks = countingCallbacks();
    callbacks.map = [&starting](const SiteContext<Feature>& context) {
        EXPECT_EQ(context.totalEntries(), 2u);
        for (const auto& feature : context.startingAt(0)) {
            starting.push_back(feature.id);
        }
        return std::uint64_t{1};
    };

    CoordinateTraversalEngine<Feature, std::uint64_t> engine(sites, {&source}, callbacks);
    (void)engine.run();

    EXPECT_EQ(starting, (std::vector<int>{2}));
}

// =============================================================================
// Downsampling Tests
// =============================================================================

TEST(TraversalEngineTest, DownsamplingIsDeterministicPerSeed) {
    auto first = downsampledIds(kDefaultDownsampleSeed);
    auto second = downsampledIds(kDefaultDownsampleSeed);

    ASSERT_EQ(first.size(), 5u);
    EXPECT_EQ(first, second);
    EXPECT_TRUE(std::is_sorted(first.begin(), first.end()));
}

TEST(TraversalEngineTest, ExemptSourceIsNotDownsampled) {
    VectorSiteSource sites({Coordinate("chr1", 0, 50)});
    VectorCoordinateSource<Feature> sampled(pileup(20), "sampled");
    VectorCoordinateSource<Feature> exempt(pileup(20), "exempt");

    std::vector<std::size_t> sizes;
    auto callbacks = countingCallbacks();
    callbacks.map = [&sizes](const SiteContext<Feature>& context) {
        sizes.push_back(context.overlapping(0).size());
        sizes.push_back(context.overlapping(1).size());
        return std::uint64_t{1};
    };

    TraversalConfig config;
    config.downsampleToCoverage = 4;
    config.downsampleExempt = {1};

    CoordinateTraversalEngine<Feature, std::uint64_t> engine(sites, {&sampled, &exempt}, callbacks,
                                                             config);
    (void)engine.run();

    EXPECT_EQ(sizes, (std::vector<std::size_t>{4, 20}));
    EXPECT_EQ(engine.stats().entriesDownsampled, 16u);
    EXPECT_EQ(engine.stats().peakBufferedEntries, 20u);
}

// =============================================================================
// Progress and Lifecycle Tests
// =============================================================================

TEST(TraversalEngineTest, ProgressCallbackEveryInterval) {
    VectorSiteSource sites(sitesOnChr1(1, 25));
    std::vector<std::uint64_t> reports;

    TraversalConfig config;
    config.progressIntervalSites = 10;
    config.label = "chr1";
    config.progressCallback = [&reports](const ProgressInfo& info) {
        EXPECT_EQ(info.label, "chr1");
        reports.push_back(info.sitesProcessed);
    };

    CoordinateTraversalEngine<Feature, std::uint64_t> engine(sites, {}, countingCallbacks(), config);
    (void)engine.run();

    EXPECT_EQ(reports, (std::vector<std::uint64_t>{10, 20}));
}

TEST(TraversalEngineTest, ZeroIntervalDisablesProgress) {
    VectorSiteSource sites(sitesOnChr1(1, 25));
    int reports = 0;

    TraversalConfig config;
    config.progressIntervalSites = 0;
    config.progressCallback = [&reports](const ProgressInfo&) { ++reports; };

    CoordinateTraversalEngine<Feature, std::uint64_t> engine(sites, {}, countingCallbacks(), config);
    (void)engine.run();

    EXPECT_EQ(reports, 0);
}

TEST(TraversalEngineTest, RunIsSingleUse) {
    VectorSiteSource sites(sitesOnChr1(1, 2));
    CoordinateTraversalEngine<Feature, std::uint64_t> engine(sites, {}, countingCallbacks());

    (void)engine.run();
    EXPECT_THROW((void)engine.run(), std::logic_error);
}

TEST(TraversalEngineTest, InvalidConfigurationIsUsageError) {
    VectorSiteSource sites(sitesOnChr1(1, 2));

    TraversalConfig zeroSites;
    zeroSites.maxSites = 0;
    EXPECT_THROW((CoordinateTraversalEngine<Feature, std::uint64_t>(sites, {}, countingCallbacks(),
                                                                    zeroSites)),
                 UsageError);

    TraversalConfig zeroCoverage;
    zeroCoverage.downsampleToCoverage = 0;
    EXPECT_THROW((CoordinateTraversalEngine<Feature, std::uint64_t>(sites, {}, countingCallbacks(),
                                                                    zeroCoverage)),
                 UsageError);

    auto missingMap = countingCallbacks();
    missingMap.map = nullptr;
    EXPECT_THROW((CoordinateTraversalEngine<Feature, std::uint64_t>(sites, {}, missingMap)),
                 UsageError);
}

}  // namespace
}  // namespace vqt::traversal

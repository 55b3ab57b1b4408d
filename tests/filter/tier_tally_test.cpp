// =============================================================================
// vq-tiers - Tier Tally Tests
// =============================================================================
// Properties:
// - combine is associative with TierTally{} as identity, so shard results can
//   be merged in any grouping
// =============================================================================

#include "vqt/filter/tier_tally.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cstdint>
#include <string>

namespace vqt::filter::test {

namespace gen {

[[nodiscard]] rc::Gen<TierTally> tally() {
    return rc::gen::exec([] {
        TierTally result;
        result.sitesVisited = *rc::gen::inRange<std::uint64_t>(0, 1000);
        result.recordsPassedThrough = *rc::gen::inRange<std::uint64_t>(0, 1000);
        auto filters = *rc::gen::inRange(0, 4);
        for (int i = 0; i < filters; ++i) {
            auto name = *rc::gen::element(std::string("PASS"), std::string("T99"),
                                           std::string("T99.9"), std::string("T99+"));
            auto count = *rc::gen::inRange<std::uint64_t>(1, 100);
            result.byFilter[name] += count;
            result.recordsRecalibrated += count;
        }
        return result;
    });
}

}  // namespace gen

RC_GTEST_PROP(TierTallyProperty, CombineIsAssociative, ()) {
    auto a = *gen::tally();
    auto b = *gen::tally();
    auto c = *gen::tally();

    RC_ASSERT(TierTally::combine(TierTally::combine(a, b), c) ==
              TierTally::combine(a, TierTally::combine(b, c)));
}

RC_GTEST_PROP(TierTallyProperty, EmptyTallyIsIdentity, ()) {
    auto a = *gen::tally();

    RC_ASSERT(TierTally::combine(TierTally{}, a) == a);
    RC_ASSERT(TierTally::combine(a, TierTally{}) == a);
}

TEST(TierTallyTest, CountDecisionUsesFilterValue) {
    TierTally tally;
    tally.countDecision(tier::TierDecision::unfiltered());
    tally.countDecision(tier::TierDecision::tagged("T99"));
    tally.countDecision(tier::TierDecision::belowLowest("T99+"));
    tally.countDecision(tier::TierDecision::unfiltered());
    tally.recordsPassedThrough = 2;

    EXPECT_EQ(tally.recordsRecalibrated, 4u);
    EXPECT_EQ(tally.recordsEmitted(), 6u);
    EXPECT_EQ(tally.byFilter.at("PASS"), 2u);
    EXPECT_EQ(tally.byFilter.at("T99"), 1u);
    EXPECT_EQ(tally.byFilter.at("T99+"), 1u);
}

TEST(TierTallyTest, SummaryListsFilters) {
    TierTally tally;
    tally.sitesVisited = 3;
    tally.countDecision(tier::TierDecision::belowLowest("T99+"));

    auto text = tally.summary();
    EXPECT_NE(text.find("3 sites, 1 records emitted"), std::string::npos);
    EXPECT_NE(text.find("T99+: 1"), std::string::npos);
}

}  // namespace vqt::filter::test

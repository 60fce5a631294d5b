#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <gtest/gtest.h>

#include "../src/fairbloom/WeightedRoundRobin.hpp"

using fairbloom::WeightedRoundRobin;

namespace {
auto schedule(WeightedRoundRobin& scheduler, std::vector<uint32_t> const& weights, size_t count)
        -> std::vector<size_t> {
    std::vector<size_t> picks;
    for (size_t i = 0; i < count; ++i) {
        auto const index = scheduler.next(weights);
        if (false == index.has_value()) {
            break;
        }
        picks.push_back(index.value());
    }
    return picks;
}
}  // namespace

TEST(WeightedRoundRobinTest, FollowsWeights) {
    WeightedRoundRobin scheduler;
    auto const picks = schedule(scheduler, {5, 1, 1}, 7);
    EXPECT_EQ((std::vector<size_t>{0, 0, 0, 0, 0, 1, 2}), picks);

    // The next cycle starts over
    EXPECT_EQ(std::optional<size_t>{0}, scheduler.next({5, 1, 1}));
}

TEST(WeightedRoundRobinTest, SharesEvenlyBetweenEqualWeights) {
    WeightedRoundRobin scheduler;
    auto const picks = schedule(scheduler, {100, 100}, 6);
    EXPECT_EQ((std::vector<size_t>{0, 1, 0, 1, 0, 1}), picks);
}

TEST(WeightedRoundRobinTest, SkipsZeroWeights) {
    WeightedRoundRobin scheduler;
    auto const picks = schedule(scheduler, {0, 3, 0, 3}, 4);
    EXPECT_EQ((std::vector<size_t>{1, 3, 1, 3}), picks);
}

TEST(WeightedRoundRobinTest, NothingEligible) {
    WeightedRoundRobin scheduler;
    EXPECT_FALSE(scheduler.next({}).has_value());
    EXPECT_FALSE(scheduler.next({0, 0, 0}).has_value());

    WeightedRoundRobin resumed{1, 50};
    EXPECT_FALSE(resumed.next({0, 0}).has_value());
}

TEST(WeightedRoundRobinTest, StatePersistsAcrossCalls) {
    WeightedRoundRobin scheduler;
    ASSERT_EQ(std::optional<size_t>{0}, scheduler.next({5, 1, 1}));
    EXPECT_EQ(0, scheduler.get_current_index());
    EXPECT_EQ(5, scheduler.get_current_weight());

    WeightedRoundRobin resumed{scheduler.get_current_index(), scheduler.get_current_weight()};
    EXPECT_EQ(scheduler, resumed);
    EXPECT_EQ(schedule(scheduler, {5, 1, 1}, 10), schedule(resumed, {5, 1, 1}, 10));
}

TEST(WeightedRoundRobinTest, HandlesWeightsChangingBetweenCalls) {
    WeightedRoundRobin scheduler;
    ASSERT_EQ(std::optional<size_t>{0}, scheduler.next({100, 100, 100}));
    ASSERT_EQ(std::optional<size_t>{1}, scheduler.next({100, 100, 100}));

    // The current index is past the end of the shorter list
    auto const index = scheduler.next({100});
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(0U, index.value());
}

#include <gtest/gtest.h>

#include "tugchat/pull_aggregator.hpp"

using namespace std::chrono_literals;

namespace {
const auto kT0 = std::chrono::steady_clock::time_point{} + 1000s;
}

TEST(PullAggregatorTest, ZeroViewersGivesZeroRate) {
  tugchat::PullAggregator aggregator;
  aggregator.RecordPull("v1", kT0);
  EXPECT_EQ(aggregator.UniquePullers(kT0), 1u);
  EXPECT_DOUBLE_EQ(aggregator.EngagementRate(kT0, 0), 0.0);
}

TEST(PullAggregatorTest, RepeatedViewerCountsOnce) {
  tugchat::PullAggregator aggregator;
  aggregator.RecordPull("v1", kT0);
  aggregator.RecordPull("v2", kT0 + 1s);
  EXPECT_EQ(aggregator.UniquePullers(kT0 + 1s), 2u);
  for (int i = 0; i < 5; ++i) {
    aggregator.RecordPull("v1", kT0 + 2s);
  }
  EXPECT_EQ(aggregator.UniquePullers(kT0 + 2s), 2u);
  EXPECT_DOUBLE_EQ(aggregator.EngagementRate(kT0 + 2s, 10), 0.2);
}

TEST(PullAggregatorTest, EventsLeaveAfterWindow) {
  tugchat::PullAggregator aggregator;
  aggregator.RecordPull("v1", kT0);
  aggregator.RecordPull("v2", kT0 + 10s);
  EXPECT_EQ(aggregator.UniquePullers(kT0 + 29s), 2u);
  EXPECT_EQ(aggregator.UniquePullers(kT0 + 30s), 1u);
  EXPECT_EQ(aggregator.UniquePullers(kT0 + 40s), 0u);
  EXPECT_EQ(aggregator.WindowSize(), 0u);
}

TEST(PullAggregatorTest, ViewerStaysWhileAnyPullIsInWindow) {
  tugchat::PullAggregator aggregator(10s);
  aggregator.RecordPull("v1", kT0);
  aggregator.RecordPull("v1", kT0 + 8s);
  EXPECT_EQ(aggregator.UniquePullers(kT0 + 12s), 1u);
  EXPECT_EQ(aggregator.WindowSize(), 1u);
  EXPECT_EQ(aggregator.UniquePullers(kT0 + 18s), 0u);
}

TEST(PullAggregatorTest, RateIsClampedToOne) {
  tugchat::PullAggregator aggregator;
  aggregator.RecordPull("v1", kT0);
  aggregator.RecordPull("v2", kT0);
  aggregator.RecordPull("v3", kT0);
  EXPECT_DOUBLE_EQ(aggregator.EngagementRate(kT0, 2), 1.0);
}

TEST(PullAggregatorTest, LateEventIsKeptInOrder) {
  tugchat::PullAggregator aggregator;
  aggregator.RecordPull("v1", kT0 + 5s);
  aggregator.RecordPull("v2", kT0);
  // 뒤늦은 이벤트는 마지막 시각으로 맞춰지므로 v1 과 함께 만료된다.
  EXPECT_EQ(aggregator.UniquePullers(kT0 + 34s), 2u);
  EXPECT_EQ(aggregator.UniquePullers(kT0 + 35s), 0u);
}

#include <gtest/gtest.h>

#include "tugchat/observability.hpp"

TEST(ObservabilityTest, LogLevelParsingAndFilter) {
  EXPECT_EQ(tugchat::ParseLogLevel("debug"), tugchat::LogLevel::kDebug);
  EXPECT_EQ(tugchat::ParseLogLevel("warning"), tugchat::LogLevel::kWarn);
  EXPECT_EQ(tugchat::ParseLogLevel("nonsense"), tugchat::LogLevel::kInfo);

  tugchat::Observability observability(tugchat::LogLevel::kWarn);
  EXPECT_FALSE(observability.Enabled(tugchat::LogLevel::kInfo));
  EXPECT_TRUE(observability.Enabled(tugchat::LogLevel::kError));
}

TEST(ObservabilityTest, FormatLogIncludesOnlyKnownFields) {
  tugchat::Observability observability;
  auto line = observability.FormatLog(
      tugchat::LogContext{tugchat::LogLevel::kInfo, "match_ended", std::nullopt, "room-3", "time_expired", 0});
  EXPECT_EQ(line["level"], "info");
  EXPECT_EQ(line["eventName"], "match_ended");
  EXPECT_EQ(line["matchId"], "room-3");
  EXPECT_EQ(line["detail"], "time_expired");
  EXPECT_FALSE(line.contains("sessionId"));
}

TEST(ObservabilityTest, SnapshotCountsEvents) {
  tugchat::Observability observability;
  observability.IncrementRequest();
  observability.IncrementRequest();
  observability.IncrementError();
  observability.IncrementPullAccepted();
  observability.IncrementPullDropped();
  observability.IncrementPullDropped();
  observability.IncrementMatchCreated();
  observability.SetWebsocketActive(4);

  auto snapshot = observability.Snapshot(1, 3);
  EXPECT_EQ(snapshot.request_total, 2u);
  EXPECT_EQ(snapshot.request_errors, 1u);
  EXPECT_EQ(snapshot.pulls_accepted, 1u);
  EXPECT_EQ(snapshot.pulls_dropped, 2u);
  EXPECT_EQ(snapshot.matches_created, 1u);
  EXPECT_EQ(snapshot.matches_ended, 0u);
  EXPECT_EQ(snapshot.websocket_active, 4u);
  EXPECT_EQ(snapshot.active_matches, 1u);
  EXPECT_EQ(snapshot.queue_length, 3u);
}

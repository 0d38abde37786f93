#include <chrono>

#include <gtest/gtest.h>

#include "support/game_harness.hpp"

using namespace std::chrono_literals;
using tugchat::testing::GameHarness;

namespace {

tugchat::MatchTuning SlowTuning() {
  tugchat::MatchTuning tuning;
  tuning.ready_grace = 30s;
  return tuning;
}

}  // namespace

TEST(MatchmakingFlowTest, TwoPlayersArePairedWithOppositeOpponents) {
  GameHarness harness(SlowTuning());
  auto conn_a = harness.Connect("sess-a");
  auto conn_b = harness.Connect("sess-b");

  EXPECT_TRUE(harness.Join("sess-a", GameHarness::MakePlayer("alice")));
  EXPECT_EQ(harness.Queue().QueueLength(), 1u);
  EXPECT_TRUE(harness.Join("sess-b", GameHarness::MakePlayer("bob")));

  EXPECT_EQ(conn_a->CountOf("queue_joined"), 1u);
  EXPECT_EQ(conn_b->CountOf("queue_joined"), 1u);
  ASSERT_EQ(conn_a->CountOf("match_found"), 1u);
  ASSERT_EQ(conn_b->CountOf("match_found"), 1u);

  auto found_a = conn_a->OfType("match_found").front();
  auto found_b = conn_b->OfType("match_found").front();
  EXPECT_EQ(found_a["room_id"], found_b["room_id"]);
  EXPECT_EQ(found_a["opponent"]["id"], "bob");
  EXPECT_EQ(found_b["opponent"]["id"], "alice");
  EXPECT_EQ(found_a["side"], "player1");
  EXPECT_EQ(found_b["side"], "player2");

  EXPECT_EQ(harness.Queue().QueueLength(), 0u);
  EXPECT_EQ(harness.Matches().ActiveMatchCount(), 1u);
  EXPECT_TRUE(harness.Matches().IsPlayerInMatch("alice"));
  EXPECT_EQ(harness.Matches().MatchIdForSession("sess-b"), found_b["room_id"].get<std::string>());
}

TEST(MatchmakingFlowTest, QueueIsFirstInFirstOut) {
  GameHarness harness(SlowTuning());
  auto conn_a = harness.Connect("sess-a");
  auto conn_b = harness.Connect("sess-b");
  auto conn_c = harness.Connect("sess-c");

  harness.Join("sess-a", GameHarness::MakePlayer("alice"));
  harness.Join("sess-b", GameHarness::MakePlayer("bob"));
  harness.Join("sess-c", GameHarness::MakePlayer("carol"));

  EXPECT_EQ(conn_c->CountOf("match_found"), 0u);
  EXPECT_TRUE(harness.Queue().IsQueued("carol"));
  EXPECT_EQ(harness.Queue().QueueLength(), 1u);
}

TEST(MatchmakingFlowTest, DuplicateJoinIsRejected) {
  GameHarness harness(SlowTuning());
  auto conn_a = harness.Connect("sess-a");

  EXPECT_TRUE(harness.Join("sess-a", GameHarness::MakePlayer("alice")));
  EXPECT_FALSE(harness.Join("sess-a", GameHarness::MakePlayer("alice")));
  EXPECT_EQ(conn_a->CountOf("queue_joined"), 1u);
  EXPECT_EQ(harness.Queue().QueueLength(), 1u);
}

TEST(MatchmakingFlowTest, PlayerInMatchCannotQueueAgain) {
  GameHarness harness(SlowTuning());
  auto conn_a = harness.Connect("sess-a");
  auto conn_b = harness.Connect("sess-b");
  harness.Pair("sess-a", GameHarness::MakePlayer("alice"), "sess-b", GameHarness::MakePlayer("bob"), *conn_a);

  EXPECT_FALSE(harness.Join("sess-a", GameHarness::MakePlayer("alice")));
  EXPECT_EQ(harness.Queue().QueueLength(), 0u);
}

TEST(MatchmakingFlowTest, LeaveQueueIsIdempotent) {
  GameHarness harness(SlowTuning());
  auto conn_a = harness.Connect("sess-a");

  harness.Join("sess-a", GameHarness::MakePlayer("alice"));
  EXPECT_TRUE(harness.Service().Dispatch(tugchat::LeaveQueue{"sess-a"}));
  EXPECT_TRUE(harness.Service().Dispatch(tugchat::LeaveQueue{"sess-a"}));

  EXPECT_EQ(harness.Queue().QueueLength(), 0u);
  EXPECT_EQ(conn_a->CountOf("queue_left"), 2u);

  auto conn_b = harness.Connect("sess-b");
  harness.Join("sess-b", GameHarness::MakePlayer("bob"));
  EXPECT_EQ(conn_b->CountOf("match_found"), 0u);
}

TEST(MatchmakingFlowTest, JoinUsesLoginAttachedEarlier) {
  GameHarness harness(SlowTuning());
  auto conn_a = harness.Connect("sess-a");

  EXPECT_FALSE(harness.Service().Dispatch(tugchat::JoinQueue{"sess-a", std::nullopt}));
  EXPECT_EQ(conn_a->CountOf("queue_joined"), 0u);

  std::string error_code;
  std::string error_message;
  ASSERT_TRUE(harness.Sessions().AttachPlayer("sess-a", GameHarness::MakePlayer("alice"), error_code, error_message));
  EXPECT_TRUE(harness.Service().Dispatch(tugchat::JoinQueue{"sess-a", std::nullopt}));
  EXPECT_TRUE(harness.Queue().IsQueued("alice"));
}

TEST(MatchmakingFlowTest, UnknownSessionCannotLogIn) {
  GameHarness harness(SlowTuning());
  EXPECT_FALSE(harness.Join("ghost", GameHarness::MakePlayer("ghost")));
  EXPECT_EQ(harness.Queue().QueueLength(), 0u);
}

TEST(MatchmakingFlowTest, DisconnectRemovesQueuedPlayer) {
  GameHarness harness(SlowTuning());
  auto conn_a = harness.Connect("sess-a");
  harness.Join("sess-a", GameHarness::MakePlayer("alice"));

  EXPECT_TRUE(harness.Service().Dispatch(tugchat::Disconnect{"sess-a", conn_a.get()}));
  EXPECT_EQ(harness.Queue().QueueLength(), 0u);
  EXPECT_EQ(harness.Sessions().ActiveConnections(), 0u);
}

TEST(MatchmakingFlowTest, StaleDisconnectIsIgnored) {
  GameHarness harness(SlowTuning());
  auto old_conn = harness.Connect("sess-a");
  auto new_conn = harness.Connect("sess-a");
  harness.Join("sess-a", GameHarness::MakePlayer("alice"));

  EXPECT_FALSE(harness.Service().Dispatch(tugchat::Disconnect{"sess-a", old_conn.get()}));
  EXPECT_TRUE(harness.Queue().IsQueued("alice"));
  EXPECT_EQ(new_conn->CountOf("queue_joined"), 1u);
  EXPECT_EQ(old_conn->CountOf("queue_joined"), 0u);
}

TEST(MatchmakingFlowTest, ChatPullWithoutMatchIsDropped) {
  GameHarness harness(SlowTuning());
  EXPECT_FALSE(harness.Service().Dispatch(tugchat::ChatPull{"nobody_tv", "v1", std::chrono::steady_clock::now()}));
  EXPECT_EQ(harness.Metrics().Snapshot(0, 0).pulls_dropped, 1u);
}

TEST(MatchmakingFlowTest, MalformedClientMessageIsDropped) {
  GameHarness harness(SlowTuning());
  auto conn_a = harness.Connect("sess-a");
  EXPECT_FALSE(harness.Service().HandleClientMessage("sess-a", "{\"type\":\"dance\"}"));
  EXPECT_TRUE(harness.Service().HandleClientMessage(
      "sess-a", R"({"type":"join_queue","player":{"id":"alice","username":"Alice"}})"));
  EXPECT_EQ(conn_a->Messages().size(), 1u);
}

TEST(MatchmakingFlowTest, SessionInMatchCannotRejoinAsAnotherPlayer) {
  GameHarness harness(SlowTuning());
  auto conn_a = harness.Connect("sess-a");
  auto conn_b = harness.Connect("sess-b");
  auto conn_c = harness.Connect("sess-c");
  harness.Pair("sess-a", GameHarness::MakePlayer("alice"), "sess-b", GameHarness::MakePlayer("bob"), *conn_a);

  EXPECT_FALSE(harness.Join("sess-a", GameHarness::MakePlayer("alice2")));
  EXPECT_FALSE(harness.Queue().IsSessionQueued("sess-a"));
  ASSERT_TRUE(harness.Sessions().PlayerFor("sess-a").has_value());
  EXPECT_EQ(harness.Sessions().PlayerFor("sess-a")->id, "alice");

  EXPECT_TRUE(harness.Join("sess-c", GameHarness::MakePlayer("carol")));
  EXPECT_TRUE(harness.Queue().IsQueued("carol"));
  EXPECT_EQ(conn_c->CountOf("queue_left"), 0u);
  EXPECT_EQ(conn_c->CountOf("match_found"), 0u);
}

TEST(MatchmakingFlowTest, QueuedSessionCannotSwapPlayer) {
  GameHarness harness(SlowTuning());
  auto conn_a = harness.Connect("sess-a");

  EXPECT_TRUE(harness.Join("sess-a", GameHarness::MakePlayer("alice")));
  EXPECT_FALSE(harness.Join("sess-a", GameHarness::MakePlayer("alice2")));
  EXPECT_FALSE(harness.Queue().IsQueued("alice2"));
  EXPECT_EQ(harness.Queue().QueueLength(), 1u);
  EXPECT_EQ(harness.Sessions().PlayerFor("sess-a")->id, "alice");
}

TEST(MatchmakingFlowTest, RejectedPairingKeepsBlamelessPlayerQueued) {
  GameHarness harness(SlowTuning());
  auto conn_d = harness.Connect("sess-d");
  auto conn_c = harness.Connect("sess-c");
  auto conn_e = harness.Connect("sess-e");
  ASSERT_TRUE(harness.Join("sess-d", GameHarness::MakePlayer("dave")));

  // dave 의 세션이 큐 항목을 남긴 채 다른 경로로 매치에 들어간 상황.
  std::string error_code;
  std::string error_message;
  ASSERT_TRUE(harness.Matches()
                  .CreateMatch(tugchat::Participant{"sess-d", GameHarness::MakePlayer("dave-alt")},
                               tugchat::Participant{"sess-x", GameHarness::MakePlayer("xavier")}, error_code,
                               error_message)
                  .has_value());

  EXPECT_TRUE(harness.Join("sess-c", GameHarness::MakePlayer("carol")));
  EXPECT_EQ(conn_d->CountOf("queue_left"), 1u);
  EXPECT_EQ(conn_c->CountOf("queue_left"), 0u);
  EXPECT_TRUE(harness.Queue().IsQueued("carol"));
  EXPECT_FALSE(harness.Queue().IsQueued("dave"));
  EXPECT_EQ(harness.Queue().QueueLength(), 1u);

  EXPECT_TRUE(harness.Join("sess-e", GameHarness::MakePlayer("eve")));
  ASSERT_EQ(conn_c->CountOf("match_found"), 1u);
  auto found = conn_c->OfType("match_found").front();
  EXPECT_EQ(found["opponent"]["id"], "eve");
  EXPECT_EQ(found["side"], "player1");
  EXPECT_EQ(harness.Queue().QueueLength(), 0u);
}

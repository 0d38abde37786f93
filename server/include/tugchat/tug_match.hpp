/*
 * 설명: 줄다리기 매치 상태 머신. 틱마다 참여율 기반 공식으로 로프를 이동시키고 종료 조건을 판정한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/tug_match_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "tugchat/player.hpp"
#include "tugchat/pull_aggregator.hpp"

namespace tugchat {

enum class MatchState { kPendingReady, kInProgress, kEnded };

enum class EndReason { kRopeReachedBoundary, kTimeExpired, kOpponentDisconnected };

// kA = player1, +100 방향으로 당긴다. kB = player2, -100 방향으로 당긴다.
enum class SideId { kA, kB };

const char* EndReasonName(EndReason reason);
const char* SideName(SideId side);
SideId Opposite(SideId side);

struct MatchTuning {
  std::chrono::milliseconds tick_interval{std::chrono::seconds(1)};
  std::chrono::milliseconds duration{std::chrono::seconds(120)};
  std::chrono::milliseconds ready_grace{std::chrono::seconds(10)};
  std::chrono::milliseconds pull_window{PullAggregator::kDefaultWindow};
  double base_strength{1.0};
  double tick_scale{0.5};
};

struct SideState {
  Participant participant;
  PullAggregator pulls;
  std::uint64_t cumulative_score{0};
  std::size_t last_unique_pullers{0};
  double last_engagement_rate{0.0};
  double last_pull_power{0.0};
  bool ready{false};
  bool disconnected{false};
};

struct TickResult {
  double displacement{0.0};
  bool ended{false};
};

class TugMatch {
 public:
  static constexpr double kRopeLimit = 100.0;

  TugMatch(std::string id, Participant side_a, Participant side_b, const MatchTuning& tuning);

  // rate * base_strength * ln(unique + 1)
  static double PullPower(double engagement_rate, std::size_t unique_pullers, double base_strength);

  const std::string& Id() const { return id_; }
  MatchState State() const { return state_; }
  std::optional<EndReason> Reason() const { return reason_; }
  // 종료 전이거나 무승부면 nullopt.
  std::optional<SideId> Winner() const { return winner_; }
  double RopePosition() const { return rope_position_; }
  const MatchTuning& Tuning() const { return tuning_; }
  const SideState& Side(SideId side) const { return side == SideId::kA ? side_a_ : side_b_; }
  std::optional<SideId> SideOfSession(const std::string& session_id) const;

  // 양쪽 모두 준비되면 true. PendingReady 가 아니면 무시한다.
  bool MarkReady(SideId side);
  // PendingReady -> InProgress. 이미 끊긴 진영이 있으면 즉시 OpponentDisconnected 로 끝난다.
  bool Start(std::chrono::steady_clock::time_point now);
  // InProgress 에서만 기록된다.
  bool RecordPull(SideId side, const std::string& viewer_id, std::chrono::steady_clock::time_point at);
  TickResult Tick(std::chrono::steady_clock::time_point now);
  // PendingReady 에서는 준비 상태만 잃고, InProgress 에서는 상대 승리로 즉시 끝난다.
  void HandleDisconnect(SideId side, std::chrono::steady_clock::time_point now);

  std::chrono::milliseconds Elapsed(std::chrono::steady_clock::time_point now) const;
  std::int64_t TimeRemainingSeconds(std::chrono::steady_clock::time_point now) const;

  nlohmann::json StatePayload(std::chrono::steady_clock::time_point now) const;
  nlohmann::json EndedPayload() const;

 private:
  SideState& MutableSide(SideId side) { return side == SideId::kA ? side_a_ : side_b_; }
  void RefreshEngagement(SideState& side, std::chrono::steady_clock::time_point now);
  void End(EndReason reason, std::optional<SideId> winner, std::chrono::steady_clock::time_point now);
  const char* StatusName() const;
  nlohmann::json SideStats(const SideState& side) const;

  std::string id_;
  MatchTuning tuning_;
  SideState side_a_;
  SideState side_b_;
  MatchState state_{MatchState::kPendingReady};
  std::optional<EndReason> reason_;
  std::optional<SideId> winner_;
  double rope_position_{0.0};
  std::chrono::steady_clock::time_point started_at_{};
  std::chrono::steady_clock::time_point ended_at_{};
  bool started_{false};
};

}  // namespace tugchat

/*
 * 설명: 줄다리기 매치의 준비/진행/종료 전이와 틱 단위 로프 이동, 브로드캐스트 페이로드를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/tug_match_test.cpp
 */
#include "tugchat/tug_match.hpp"

#include <algorithm>
#include <cmath>

namespace tugchat {

const char* EndReasonName(EndReason reason) {
  switch (reason) {
    case EndReason::kRopeReachedBoundary:
      return "rope_reached_boundary";
    case EndReason::kTimeExpired:
      return "time_expired";
    case EndReason::kOpponentDisconnected:
      return "opponent_disconnected";
  }
  return "unknown";
}

const char* SideName(SideId side) { return side == SideId::kA ? "player1" : "player2"; }

SideId Opposite(SideId side) { return side == SideId::kA ? SideId::kB : SideId::kA; }

TugMatch::TugMatch(std::string id, Participant side_a, Participant side_b, const MatchTuning& tuning)
    : id_(std::move(id)), tuning_(tuning) {
  side_a_.participant = std::move(side_a);
  side_a_.pulls = PullAggregator(tuning_.pull_window);
  side_b_.participant = std::move(side_b);
  side_b_.pulls = PullAggregator(tuning_.pull_window);
}

double TugMatch::PullPower(double engagement_rate, std::size_t unique_pullers, double base_strength) {
  return engagement_rate * base_strength * std::log(static_cast<double>(unique_pullers) + 1.0);
}

std::optional<SideId> TugMatch::SideOfSession(const std::string& session_id) const {
  if (side_a_.participant.session_id == session_id) {
    return SideId::kA;
  }
  if (side_b_.participant.session_id == session_id) {
    return SideId::kB;
  }
  return std::nullopt;
}

bool TugMatch::MarkReady(SideId side) {
  if (state_ != MatchState::kPendingReady) {
    return false;
  }
  auto& s = MutableSide(side);
  if (!s.disconnected) {
    s.ready = true;
  }
  return side_a_.ready && side_b_.ready;
}

bool TugMatch::Start(std::chrono::steady_clock::time_point now) {
  if (state_ != MatchState::kPendingReady) {
    return false;
  }
  state_ = MatchState::kInProgress;
  started_ = true;
  started_at_ = now;
  rope_position_ = 0.0;

  if (side_a_.disconnected && side_b_.disconnected) {
    End(EndReason::kOpponentDisconnected, std::nullopt, now);
  } else if (side_a_.disconnected) {
    End(EndReason::kOpponentDisconnected, SideId::kB, now);
  } else if (side_b_.disconnected) {
    End(EndReason::kOpponentDisconnected, SideId::kA, now);
  }
  return true;
}

bool TugMatch::RecordPull(SideId side, const std::string& viewer_id, std::chrono::steady_clock::time_point at) {
  if (state_ != MatchState::kInProgress) {
    return false;
  }
  auto& s = MutableSide(side);
  s.pulls.RecordPull(viewer_id, at);
  ++s.cumulative_score;
  RefreshEngagement(s, at);
  return true;
}

void TugMatch::RefreshEngagement(SideState& side, std::chrono::steady_clock::time_point now) {
  side.last_unique_pullers = side.pulls.UniquePullers(now);
  side.last_engagement_rate = side.pulls.EngagementRate(now, side.participant.player.viewer_count);
}

TickResult TugMatch::Tick(std::chrono::steady_clock::time_point now) {
  TickResult result;
  if (state_ != MatchState::kInProgress) {
    result.ended = state_ == MatchState::kEnded;
    return result;
  }

  for (auto* side : {&side_a_, &side_b_}) {
    RefreshEngagement(*side, now);
    side->last_pull_power = PullPower(side->last_engagement_rate, side->last_unique_pullers, tuning_.base_strength);
  }

  result.displacement = (side_a_.last_pull_power - side_b_.last_pull_power) * tuning_.tick_scale;
  rope_position_ = std::clamp(rope_position_ + result.displacement, -kRopeLimit, kRopeLimit);

  if (rope_position_ >= kRopeLimit) {
    End(EndReason::kRopeReachedBoundary, SideId::kA, now);
  } else if (rope_position_ <= -kRopeLimit) {
    End(EndReason::kRopeReachedBoundary, SideId::kB, now);
  } else if (Elapsed(now) >= tuning_.duration) {
    std::optional<SideId> winner;
    if (rope_position_ > 0.0) {
      winner = SideId::kA;
    } else if (rope_position_ < 0.0) {
      winner = SideId::kB;
    }
    End(EndReason::kTimeExpired, winner, now);
  }
  result.ended = state_ == MatchState::kEnded;
  return result;
}

void TugMatch::HandleDisconnect(SideId side, std::chrono::steady_clock::time_point now) {
  auto& s = MutableSide(side);
  if (state_ == MatchState::kPendingReady) {
    s.disconnected = true;
    s.ready = false;
    return;
  }
  if (state_ == MatchState::kInProgress) {
    s.disconnected = true;
    End(EndReason::kOpponentDisconnected, Opposite(side), now);
  }
}

void TugMatch::End(EndReason reason, std::optional<SideId> winner, std::chrono::steady_clock::time_point now) {
  state_ = MatchState::kEnded;
  reason_ = reason;
  winner_ = winner;
  ended_at_ = now;
}

std::chrono::milliseconds TugMatch::Elapsed(std::chrono::steady_clock::time_point now) const {
  if (!started_) {
    return std::chrono::milliseconds(0);
  }
  auto until = state_ == MatchState::kEnded ? ended_at_ : now;
  if (until <= started_at_) {
    return std::chrono::milliseconds(0);
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(until - started_at_);
}

std::int64_t TugMatch::TimeRemainingSeconds(std::chrono::steady_clock::time_point now) const {
  auto remaining = tuning_.duration - Elapsed(now);
  if (remaining.count() <= 0) {
    return 0;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(remaining).count();
}

const char* TugMatch::StatusName() const {
  switch (state_) {
    case MatchState::kPendingReady:
      return "waiting";
    case MatchState::kInProgress:
      return "active";
    case MatchState::kEnded:
      return reason_ == EndReason::kOpponentDisconnected ? "abandoned" : "finished";
  }
  return "finished";
}

nlohmann::json TugMatch::StatePayload(std::chrono::steady_clock::time_point now) const {
  return {{"room_id", id_},
          {"rope_position", rope_position_},
          {"player1_score", side_a_.cumulative_score},
          {"player2_score", side_b_.cumulative_score},
          {"player1_engagement", side_a_.last_engagement_rate},
          {"player2_engagement", side_b_.last_engagement_rate},
          {"time_remaining", TimeRemainingSeconds(now)},
          {"status", StatusName()}};
}

nlohmann::json TugMatch::SideStats(const SideState& side) const {
  return {{"id", side.participant.player.id},
          {"username", side.participant.player.username},
          {"total_pulls", side.cumulative_score},
          {"unique_pullers", side.last_unique_pullers},
          {"engagement_rate", side.last_engagement_rate},
          {"pull_power", side.last_pull_power}};
}

nlohmann::json TugMatch::EndedPayload() const {
  nlohmann::json winner = nullptr;
  if (winner_) {
    winner = Side(*winner_).participant.player.id;
  }
  nlohmann::json reason = nullptr;
  if (reason_) {
    reason = EndReasonName(*reason_);
  }
  const double elapsed_seconds = static_cast<double>(Elapsed(ended_at_).count()) / 1000.0;
  return {{"type", "game_ended"},
          {"room_id", id_},
          {"winner", winner},
          {"reason", reason},
          {"stats",
           {{"rope_position", rope_position_},
            {"elapsed_seconds", elapsed_seconds},
            {"player1", SideStats(side_a_)},
            {"player2", SideStats(side_b_)}}}};
}

}  // namespace tugchat

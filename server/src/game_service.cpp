/*
 * 설명: 인바운드 이벤트 하나당 핸들러 하나로 대기열/매치/세션 상태를 갱신한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/it/matchmaking_flow_it_test.cpp, server/tests/e2e/session_flow_test.cpp
 */
#include "tugchat/game_service.hpp"

#include <variant>

#include "tugchat/error_codes.hpp"

namespace tugchat {

GameService::GameService(std::shared_ptr<SessionRegistry> sessions, std::shared_ptr<MatchQueueService> queue,
                         std::shared_ptr<MatchRegistry> matches, std::shared_ptr<Observability> observability,
                         std::chrono::milliseconds pull_cooldown)
    : sessions_(std::move(sessions)), queue_(std::move(queue)), matches_(std::move(matches)),
      observability_(std::move(observability)), pull_cooldown_(pull_cooldown) {}

bool GameService::Dispatch(const InboundEvent& event) {
  return std::visit([this](const auto& ev) { return Handle(ev); }, event);
}

bool GameService::HandleClientMessage(const std::string& session_id, const std::string& raw) {
  auto event = ParseClientMessage(session_id, raw);
  if (!event) {
    LogEvent(LogLevel::kWarn, "client_message_dropped", session_id, error_code::kBadRequest);
    return false;
  }
  return Dispatch(*event);
}

bool GameService::Handle(const JoinQueue& event) {
  std::string error_code;
  std::string error_message;
  // 매치 중이거나 이미 대기 중인 세션은 로그인 정보도 바꿀 수 없다.
  if (matches_->MatchIdForSession(event.session_id) || queue_->IsSessionQueued(event.session_id)) {
    LogEvent(LogLevel::kInfo, error_code::kAlreadyQueued, event.session_id, "세션이 이미 큐 또는 매치에 있습니다");
    return false;
  }
  if (event.player && !sessions_->AttachPlayer(event.session_id, *event.player, error_code, error_message)) {
    LogEvent(LogLevel::kWarn, error_code, event.session_id, error_message);
    return false;
  }
  auto player = event.player ? event.player : sessions_->PlayerFor(event.session_id);
  if (!player) {
    LogEvent(LogLevel::kWarn, "join_without_player", event.session_id, "로그인 정보가 없습니다");
    return false;
  }
  if (!queue_->Enqueue(Participant{event.session_id, *player}, error_code, error_message)) {
    LogEvent(LogLevel::kInfo, error_code, event.session_id, error_message);
    return false;
  }
  return true;
}

bool GameService::Handle(const LeaveQueue& event) {
  auto player = sessions_->PlayerFor(event.session_id);
  if (player) {
    queue_->Dequeue(player->id);
  }
  sessions_->Send(event.session_id, {{"type", "queue_left"}, {"message", "You've left the matchmaking queue."}});
  return true;
}

bool GameService::Handle(const GameReady& event) {
  std::string error_code;
  std::string error_message;
  if (!matches_->RouteReady(event.session_id, event.room_id, error_code, error_message)) {
    LogEvent(LogLevel::kInfo, error_code, event.session_id, error_message);
    return false;
  }
  return true;
}

bool GameService::Handle(const ChatPull& event) {
  if (!pull_cooldown_.Allow(event.channel_id, event.viewer_id, event.at)) {
    if (observability_) {
      observability_->IncrementPullDropped();
    }
    return false;
  }
  std::string error_code;
  std::string error_message;
  if (!matches_->RouteChatPull(event.channel_id, event.viewer_id, event.at, error_code, error_message)) {
    if (observability_) {
      observability_->IncrementPullDropped();
    }
    LogEvent(LogLevel::kDebug, error_code, event.channel_id, error_message);
    return false;
  }
  return true;
}

bool GameService::Handle(const Disconnect& event) {
  auto player = sessions_->PlayerFor(event.session_id);
  if (event.connection && !sessions_->Unregister(event.session_id, event.connection)) {
    // 같은 세션 id 로 새 연결이 이미 등록되었다.
    return false;
  }
  if (player) {
    queue_->Dequeue(player->id);
  }
  std::string error_code;
  std::string error_message;
  if (!matches_->RouteDisconnect(event.session_id, error_code, error_message)) {
    LogEvent(LogLevel::kDebug, error_code, event.session_id, error_message);
  }
  LogEvent(LogLevel::kInfo, "session_closed", event.session_id, player ? player->id : std::string{});
  return true;
}

void GameService::LogEvent(LogLevel level, const std::string& name, const std::string& session_id,
                           const std::string& detail) const {
  if (observability_) {
    observability_->Log(LogContext{level, name, session_id, std::nullopt, detail, 0});
  }
}

}  // namespace tugchat

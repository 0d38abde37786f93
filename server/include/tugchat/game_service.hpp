/*
 * 설명: 타입이 있는 인바운드 이벤트를 받아 큐, 매치 레지스트리, 세션 레지스트리로 분배한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/it/matchmaking_flow_it_test.cpp, server/tests/e2e/session_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "tugchat/inbound_event.hpp"
#include "tugchat/match_queue.hpp"
#include "tugchat/match_registry.hpp"
#include "tugchat/observability.hpp"
#include "tugchat/pull_cooldown.hpp"
#include "tugchat/session_registry.hpp"

namespace tugchat {

class GameService {
 public:
  GameService(std::shared_ptr<SessionRegistry> sessions, std::shared_ptr<MatchQueueService> queue,
              std::shared_ptr<MatchRegistry> matches, std::shared_ptr<Observability> observability,
              std::chrono::milliseconds pull_cooldown);

  // 이벤트가 반영되었으면 true. 실패는 모두 로그로만 남긴다.
  bool Dispatch(const InboundEvent& event);
  // 잘못된 메시지는 버린다.
  bool HandleClientMessage(const std::string& session_id, const std::string& raw);

  std::shared_ptr<SessionRegistry> Sessions() { return sessions_; }
  std::shared_ptr<MatchQueueService> Queue() { return queue_; }
  std::shared_ptr<MatchRegistry> Matches() { return matches_; }

 private:
  bool Handle(const JoinQueue& event);
  bool Handle(const LeaveQueue& event);
  bool Handle(const GameReady& event);
  bool Handle(const ChatPull& event);
  bool Handle(const Disconnect& event);
  void LogEvent(LogLevel level, const std::string& name, const std::string& session_id,
                const std::string& detail) const;

  std::shared_ptr<SessionRegistry> sessions_;
  std::shared_ptr<MatchQueueService> queue_;
  std::shared_ptr<MatchRegistry> matches_;
  std::shared_ptr<Observability> observability_;
  PullCooldown pull_cooldown_;
};

}  // namespace tugchat

/*
 * 설명: 세션 id 별 WebSocket 연결과 로그인된 플레이어를 관리하고 서버 메시지 전달을 중계한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/it/matchmaking_flow_it_test.cpp, server/tests/e2e/session_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "tugchat/observability.hpp"
#include "tugchat/player.hpp"

namespace tugchat {

// 세션 하나의 송신 경로. 이미 닫힌 연결이면 Deliver 가 false 를 돌려준다.
class SessionConnection {
 public:
  virtual ~SessionConnection() = default;
  virtual bool Deliver(std::string message) = 0;
};

class SessionRegistry {
 public:
  explicit SessionRegistry(std::shared_ptr<Observability> observability);

  void Register(const std::string& session_id, const std::shared_ptr<SessionConnection>& connection);
  // player_login_resolved. 등록되지 않은 세션이면 unknown_session.
  bool AttachPlayer(const std::string& session_id, const Player& player, std::string& error_code,
                    std::string& error_message);
  std::optional<Player> PlayerFor(const std::string& session_id) const;
  // 최선 노력 전달. 실패는 로그로 남기고 false 로 보고한다.
  bool Send(const std::string& session_id, const nlohmann::json& message);
  // connection 이 현재 등록된 연결과 같을 때만 제거하고 true.
  bool Unregister(const std::string& session_id, const SessionConnection* connection);
  std::size_t ActiveConnections() const;

 private:
  struct Entry {
    std::weak_ptr<SessionConnection> connection;
    const SessionConnection* raw{nullptr};
    std::optional<Player> player;
  };

  std::unordered_map<std::string, Entry> sessions_;
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace tugchat

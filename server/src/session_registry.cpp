/*
 * 설명: 세션별 연결을 약한 참조로 보관하고 JSON 메시지를 직렬화해 전달한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/it/matchmaking_flow_it_test.cpp, server/tests/e2e/session_flow_test.cpp
 */
#include "tugchat/session_registry.hpp"

#include "tugchat/error_codes.hpp"

namespace tugchat {

SessionRegistry::SessionRegistry(std::shared_ptr<Observability> observability)
    : observability_(std::move(observability)) {}

void SessionRegistry::Register(const std::string& session_id, const std::shared_ptr<SessionConnection>& connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entry = sessions_[session_id];
  entry.connection = connection;
  entry.raw = connection.get();
  if (observability_) {
    observability_->SetWebsocketActive(sessions_.size());
  }
}

bool SessionRegistry::AttachPlayer(const std::string& session_id, const Player& player, std::string& error_code,
                                   std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    error_code = error_code::kUnknownSession;
    error_message = "등록되지 않은 세션입니다";
    return false;
  }
  it->second.player = player;
  return true;
}

std::optional<Player> SessionRegistry::PlayerFor(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second.player;
}

bool SessionRegistry::Send(const std::string& session_id, const nlohmann::json& message) {
  std::shared_ptr<SessionConnection> connection;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
      connection = it->second.connection.lock();
    }
  }
  if (connection && connection->Deliver(message.dump())) {
    return true;
  }
  if (observability_) {
    observability_->Log(LogContext{LogLevel::kWarn, error_code::kDeliveryFailed, session_id, std::nullopt,
                                   message.value("type", std::string{}), 0});
  }
  return false;
}

bool SessionRegistry::Unregister(const std::string& session_id, const SessionConnection* connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end() || it->second.raw != connection) {
    return false;
  }
  sessions_.erase(it);
  if (observability_) {
    observability_->SetWebsocketActive(sessions_.size());
  }
  return true;
}

std::size_t SessionRegistry::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

}  // namespace tugchat

/*
 * 설명: 클라이언트/채팅 수집/연결 종료에서 들어오는 이벤트를 하나의 타입 집합으로 정의하고 파싱한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/client_message_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>

#include "tugchat/player.hpp"

namespace tugchat {

class SessionConnection;

struct JoinQueue {
  std::string session_id;
  std::optional<Player> player;
};

struct LeaveQueue {
  std::string session_id;
};

struct GameReady {
  std::string session_id;
  std::string room_id;
};

struct ChatPull {
  std::string channel_id;
  std::string viewer_id;
  std::chrono::steady_clock::time_point at;
};

// connection 이 nullptr 이 아니면 그 연결이 세션의 현재 연결일 때만 처리한다.
struct Disconnect {
  std::string session_id;
  const SessionConnection* connection{nullptr};
};

using InboundEvent = std::variant<JoinQueue, LeaveQueue, GameReady, ChatPull, Disconnect>;

// WebSocket 텍스트 프레임. 형식이 잘못되었거나 모르는 type 이면 nullopt.
std::optional<InboundEvent> ParseClientMessage(const std::string& session_id, const std::string& raw);
// 채팅 수집기의 {channelId, viewerId} 본문.
std::optional<ChatPull> ParseChatPull(const std::string& raw, std::chrono::steady_clock::time_point at);

}  // namespace tugchat

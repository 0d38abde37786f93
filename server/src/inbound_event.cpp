/*
 * 설명: 클라이언트 메시지와 채팅 수집 본문을 타입이 있는 이벤트로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/client_message_test.cpp
 */
#include "tugchat/inbound_event.hpp"

#include <nlohmann/json.hpp>

namespace tugchat {
namespace {
std::optional<nlohmann::json> ParseObject(const std::string& raw) {
  auto parsed = nlohmann::json::parse(raw, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return std::nullopt;
  }
  return parsed;
}

bool NonEmptyString(const nlohmann::json& message, const char* key) {
  auto it = message.find(key);
  return it != message.end() && it->is_string() && !it->get<std::string>().empty();
}
}  // namespace

std::optional<InboundEvent> ParseClientMessage(const std::string& session_id, const std::string& raw) {
  auto message = ParseObject(raw);
  if (!message || !NonEmptyString(*message, "type")) {
    return std::nullopt;
  }
  const auto type = (*message)["type"].get<std::string>();

  if (type == "join_queue") {
    JoinQueue event{session_id, std::nullopt};
    auto player_it = message->find("player");
    if (player_it != message->end() && !player_it->is_null()) {
      event.player = ParsePlayer(*player_it);
      if (!event.player) {
        return std::nullopt;
      }
    }
    return event;
  }
  if (type == "leave_queue") {
    return LeaveQueue{session_id};
  }
  if (type == "game_ready") {
    GameReady event{session_id, {}};
    auto room_it = message->find("room_id");
    if (room_it != message->end() && !room_it->is_null()) {
      if (!room_it->is_string()) {
        return std::nullopt;
      }
      event.room_id = room_it->get<std::string>();
    }
    return event;
  }
  return std::nullopt;
}

std::optional<ChatPull> ParseChatPull(const std::string& raw, std::chrono::steady_clock::time_point at) {
  auto message = ParseObject(raw);
  if (!message || !NonEmptyString(*message, "channelId") || !NonEmptyString(*message, "viewerId")) {
    return std::nullopt;
  }
  return ChatPull{(*message)["channelId"].get<std::string>(), (*message)["viewerId"].get<std::string>(), at};
}

}  // namespace tugchat

/*
 * 설명: 클라이언트/신원 제공자가 보낸 플레이어 JSON을 검증해 스냅샷으로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/client_message_test.cpp
 */
#include "tugchat/player.hpp"

namespace tugchat {
namespace {
std::string OptionalString(const nlohmann::json& value, const char* key) {
  auto it = value.find(key);
  if (it == value.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}
}  // namespace

std::optional<Player> ParsePlayer(const nlohmann::json& value) {
  if (!value.is_object()) {
    return std::nullopt;
  }
  Player player;
  player.id = OptionalString(value, "id");
  player.username = OptionalString(value, "username");
  if (player.id.empty() || player.username.empty()) {
    return std::nullopt;
  }
  player.channel_name = OptionalString(value, "channel_name");
  player.profile_image = OptionalString(value, "profile_image");

  auto viewers_it = value.find("viewer_count");
  if (viewers_it != value.end() && !viewers_it->is_null()) {
    if (viewers_it->is_number_unsigned()) {
      player.viewer_count = viewers_it->get<std::uint64_t>();
    } else if (viewers_it->is_number_integer()) {
      auto signed_count = viewers_it->get<std::int64_t>();
      if (signed_count < 0) {
        return std::nullopt;
      }
      player.viewer_count = static_cast<std::uint64_t>(signed_count);
    } else {
      return std::nullopt;
    }
  }
  return player;
}

nlohmann::json ToSnapshotJson(const Player& player) {
  return {{"id", player.id},
          {"username", player.username},
          {"channel_name", player.channel_name},
          {"profile_image", player.profile_image},
          {"viewer_count", player.viewer_count}};
}

}  // namespace tugchat

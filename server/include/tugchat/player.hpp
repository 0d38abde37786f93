/*
 * 설명: 로그인 시점에 확정된 스트리머 신원 스냅샷과 JSON 변환을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/client_message_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace tugchat {

struct Player {
  std::string id;
  std::string username;
  std::string channel_name;
  std::string profile_image;
  std::uint64_t viewer_count{0};
};

// 세션과 묶인 플레이어. 큐 항목과 매치 참가자 양쪽에서 사용한다.
struct Participant {
  std::string session_id;
  Player player;
};

// id/username 이 없거나 viewer_count 가 음수면 nullopt. 모르는 필드는 무시한다.
std::optional<Player> ParsePlayer(const nlohmann::json& value);
nlohmann::json ToSnapshotJson(const Player& player);

}  // namespace tugchat

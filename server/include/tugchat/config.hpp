/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/session_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

#include "tugchat/tug_match.hpp"

namespace tugchat {

struct AppConfig {
  unsigned short port;
  std::string log_level;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  std::size_t match_duration_seconds;
  std::size_t match_tick_interval_ms;
  std::size_t ready_grace_seconds;
  std::size_t pull_window_seconds;
  double base_pull_strength;
  double rope_tick_scale;
  std::size_t pull_cooldown_ms;
  std::string ingest_token;
  std::string ops_token;
};

AppConfig LoadConfigFromEnv();
MatchTuning ToMatchTuning(const AppConfig& config);

}  // namespace tugchat

/*
 * 설명: 구조화 로그(레벨 필터 포함)와 서버 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/observability_test.cpp, server/tests/e2e/metrics_ops_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace tugchat {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& value);
const char* LogLevelName(LogLevel level);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string name;
  std::optional<std::string> session_id;
  std::optional<std::string> match_id;
  std::optional<std::string> detail;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t pulls_accepted{0};
  std::uint64_t pulls_dropped{0};
  std::uint64_t matches_created{0};
  std::uint64_t matches_ended{0};
  std::uint64_t active_matches{0};
  std::uint64_t queue_length{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  void IncrementRequest();
  void IncrementError();
  void SetWebsocketActive(std::uint64_t count);
  void IncrementPullAccepted();
  void IncrementPullDropped();
  void IncrementMatchCreated();
  void IncrementMatchEnded();
  MetricsSnapshot Snapshot(std::uint64_t active_matches, std::uint64_t queue_length) const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  nlohmann::json FormatLog(const LogContext& ctx) const;
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> pulls_accepted_{0};
  std::atomic<std::uint64_t> pulls_dropped_{0};
  std::atomic<std::uint64_t> matches_created_{0};
  std::atomic<std::uint64_t> matches_ended_{0};
};

}  // namespace tugchat

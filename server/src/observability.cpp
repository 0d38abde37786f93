/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/observability_test.cpp, server/tests/e2e/metrics_ops_test.cpp
 */
#include "tugchat/observability.hpp"

#include <iostream>
#include <mutex>

namespace tugchat {
namespace {
std::mutex& OutputMutex() {
  static std::mutex mutex;
  return mutex;
}
}  // namespace

LogLevel ParseLogLevel(const std::string& value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

void Observability::IncrementPullAccepted() { pulls_accepted_.fetch_add(1); }

void Observability::IncrementPullDropped() { pulls_dropped_.fetch_add(1); }

void Observability::IncrementMatchCreated() { matches_created_.fetch_add(1); }

void Observability::IncrementMatchEnded() { matches_ended_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_matches, std::uint64_t queue_length) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.pulls_accepted = pulls_accepted_.load();
  snapshot.pulls_dropped = pulls_dropped_.load();
  snapshot.matches_created = matches_created_.load();
  snapshot.matches_ended = matches_ended_.load();
  snapshot.active_matches = active_matches;
  snapshot.queue_length = queue_length;
  return snapshot;
}

nlohmann::json Observability::FormatLog(const LogContext& ctx) const {
  nlohmann::json log_json;
  log_json["level"] = LogLevelName(ctx.level);
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.session_id) {
    log_json["sessionId"] = *ctx.session_id;
  }
  if (ctx.match_id) {
    log_json["matchId"] = *ctx.match_id;
  }
  if (ctx.detail) {
    log_json["detail"] = *ctx.detail;
  }
  return log_json;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  auto line = FormatLog(ctx).dump();
  std::lock_guard<std::mutex> lock(OutputMutex());
  std::cout << line << std::endl;
}

}  // namespace tugchat

/*
 * 설명: 채팅 수집 경계에서 시청자별 당기기 쿨다운을 적용한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/pull_cooldown_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tugchat {

class PullCooldown {
 public:
  explicit PullCooldown(std::chrono::milliseconds cooldown);

  // 같은 (channel, viewer) 의 직전 허용 시각으로부터 cooldown 이 지났으면 true 로 기록한다.
  bool Allow(const std::string& channel_id, const std::string& viewer_id, std::chrono::steady_clock::time_point now);
  std::size_t TrackedViewers() const;

 private:
  void Sweep(std::chrono::steady_clock::time_point now);

  static constexpr std::size_t kSweepEvery = 1024;

  std::chrono::milliseconds cooldown_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> last_allowed_;
  std::size_t calls_since_sweep_{0};
  mutable std::mutex mutex_;
};

}  // namespace tugchat

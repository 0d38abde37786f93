/*
 * 설명: 시청자별 마지막 허용 시각을 기록해 쿨다운 안의 중복 당기기를 걸러낸다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/pull_cooldown_test.cpp
 */
#include "tugchat/pull_cooldown.hpp"

namespace tugchat {

PullCooldown::PullCooldown(std::chrono::milliseconds cooldown) : cooldown_(cooldown) {}

bool PullCooldown::Allow(const std::string& channel_id, const std::string& viewer_id,
                         std::chrono::steady_clock::time_point now) {
  if (cooldown_.count() <= 0) {
    return true;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (++calls_since_sweep_ >= kSweepEvery) {
    Sweep(now);
  }
  const auto key = channel_id + '\n' + viewer_id;
  auto it = last_allowed_.find(key);
  if (it != last_allowed_.end() && now - it->second < cooldown_) {
    return false;
  }
  last_allowed_[key] = now;
  return true;
}

std::size_t PullCooldown::TrackedViewers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_allowed_.size();
}

void PullCooldown::Sweep(std::chrono::steady_clock::time_point now) {
  calls_since_sweep_ = 0;
  for (auto it = last_allowed_.begin(); it != last_allowed_.end();) {
    if (now - it->second >= cooldown_) {
      it = last_allowed_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace tugchat

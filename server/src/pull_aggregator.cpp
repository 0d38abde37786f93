/*
 * 설명: 시간 순 deque 와 시청자별 카운트로 윈도우 내 고유 참여자 수를 상각 O(1)로 유지한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/pull_aggregator_test.cpp
 */
#include "tugchat/pull_aggregator.hpp"

#include <algorithm>

namespace tugchat {

PullAggregator::PullAggregator(std::chrono::milliseconds window) : window_(window) {}

void PullAggregator::RecordPull(const std::string& viewer_id, std::chrono::steady_clock::time_point at) {
  if (!events_.empty() && at < events_.back().at) {
    at = events_.back().at;
  }
  events_.push_back(PullEvent{viewer_id, at});
  ++per_viewer_count_[viewer_id];
  Prune(at);
}

std::size_t PullAggregator::UniquePullers(std::chrono::steady_clock::time_point now) {
  Prune(now);
  return per_viewer_count_.size();
}

double PullAggregator::EngagementRate(std::chrono::steady_clock::time_point now, std::uint64_t total_viewers) {
  const auto unique = UniquePullers(now);
  if (total_viewers == 0) {
    return 0.0;
  }
  const double rate = static_cast<double>(unique) / static_cast<double>(total_viewers);
  return std::clamp(rate, 0.0, 1.0);
}

void PullAggregator::Prune(std::chrono::steady_clock::time_point now) {
  while (!events_.empty() && now - events_.front().at >= window_) {
    auto it = per_viewer_count_.find(events_.front().viewer_id);
    if (it != per_viewer_count_.end() && --it->second == 0) {
      per_viewer_count_.erase(it);
    }
    events_.pop_front();
  }
}

}  // namespace tugchat

/*
 * 설명: 매치 한쪽 진영의 최근 당기기 이벤트를 슬라이딩 윈도우로 유지하고 참여율을 계산한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/pull_aggregator_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <unordered_map>

namespace tugchat {

struct PullEvent {
  std::string viewer_id;
  std::chrono::steady_clock::time_point at;
};

class PullAggregator {
 public:
  static constexpr std::chrono::milliseconds kDefaultWindow{std::chrono::seconds(30)};

  explicit PullAggregator(std::chrono::milliseconds window = kDefaultWindow);

  // 삽입 시 at 기준으로 윈도우 밖 이벤트를 오래된 쪽부터 제거한다.
  // at 이 마지막 이벤트보다 과거면 마지막 시각으로 맞춰 시간 순서를 유지한다.
  void RecordPull(const std::string& viewer_id, std::chrono::steady_clock::time_point at);

  // now 기준 최근 window 안의 서로 다른 viewer_id 수.
  std::size_t UniquePullers(std::chrono::steady_clock::time_point now);

  // UniquePullers / total_viewers 를 [0, 1] 로 자른 값. total_viewers == 0 이면 0.
  double EngagementRate(std::chrono::steady_clock::time_point now, std::uint64_t total_viewers);

  std::size_t WindowSize() const { return events_.size(); }
  std::chrono::milliseconds Window() const { return window_; }

 private:
  void Prune(std::chrono::steady_clock::time_point now);

  std::chrono::milliseconds window_;
  std::deque<PullEvent> events_;
  std::unordered_map<std::string, std::size_t> per_viewer_count_;
};

}  // namespace tugchat

/*
 * 설명: 매칭 대기열을 관리하며 입장/취소와 FIFO 페어링, 매치 생성 알림을 처리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/it/matchmaking_flow_it_test.cpp, server/tests/e2e/session_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <iterator>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "tugchat/match_registry.hpp"
#include "tugchat/observability.hpp"
#include "tugchat/player.hpp"
#include "tugchat/session_registry.hpp"

namespace tugchat {

class MatchQueueService {
 public:
  MatchQueueService(std::shared_ptr<SessionRegistry> sessions, std::shared_ptr<MatchRegistry> matches,
                    std::shared_ptr<Observability> observability);

  // 플레이어 또는 세션이 이미 대기 중이거나 매치에 참여 중이면 already_queued.
  // 성공 시 queue_joined 를 보낸 뒤 페어링을 시도한다.
  bool Enqueue(const Participant& participant, std::string& error_code, std::string& error_message);
  // 없으면 아무 일도 하지 않는다. 제거했으면 true.
  bool Dequeue(const std::string& player_id);
  bool IsQueued(const std::string& player_id);
  bool IsSessionQueued(const std::string& session_id);
  std::size_t QueueLength();

 private:
  struct QueueEntry {
    Participant participant;
    std::chrono::steady_clock::time_point joined_at;
  };

  std::vector<std::pair<QueueEntry, QueueEntry>> TakePairs();
  void EraseLocked(std::list<QueueEntry>::iterator it);
  // 매치 생성이 거절된 쌍에서 이미 매치에 묶이지 않은 쪽 하나를 큐 맨 앞에 되돌린다.
  // 되돌린 항목을 가리키고, 없으면 nullptr.
  const QueueEntry* RestoreBlameless(const QueueEntry& first, const QueueEntry& second);
  void PairIfPossible();
  void NotifyMatchFound(const std::string& match_id, const QueueEntry& self, const QueueEntry& opponent,
                        const char* side);

  std::shared_ptr<SessionRegistry> sessions_;
  std::shared_ptr<MatchRegistry> matches_;
  std::shared_ptr<Observability> observability_;
  std::list<QueueEntry> queue_;
  std::unordered_map<std::string, std::list<QueueEntry>::iterator> player_index_;
  std::unordered_map<std::string, std::list<QueueEntry>::iterator> session_index_;
  std::mutex mutex_;
};

}  // namespace tugchat

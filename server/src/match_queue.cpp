/*
 * 설명: 매칭 대기열 입장/취소를 관리하고 두 명 이상이면 먼저 들어온 순서로 짝지어 매치를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/it/matchmaking_flow_it_test.cpp, server/tests/e2e/session_flow_test.cpp
 */
#include "tugchat/match_queue.hpp"

#include "tugchat/error_codes.hpp"

namespace tugchat {

MatchQueueService::MatchQueueService(std::shared_ptr<SessionRegistry> sessions, std::shared_ptr<MatchRegistry> matches,
                                     std::shared_ptr<Observability> observability)
    : sessions_(std::move(sessions)), matches_(std::move(matches)), observability_(std::move(observability)) {}

bool MatchQueueService::Enqueue(const Participant& participant, std::string& error_code, std::string& error_message) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& player_id = participant.player.id;
    const auto& session_id = participant.session_id;
    if (player_index_.count(player_id) > 0 || session_index_.count(session_id) > 0 ||
        matches_->IsPlayerInMatch(player_id) || matches_->MatchIdForSession(session_id)) {
      error_code = error_code::kAlreadyQueued;
      error_message = "이미 큐에 있거나 매치에 참여 중입니다";
      return false;
    }
    queue_.push_back(QueueEntry{participant, std::chrono::steady_clock::now()});
    auto it = std::prev(queue_.end());
    player_index_[player_id] = it;
    session_index_[session_id] = it;
  }

  sessions_->Send(participant.session_id,
                  {{"type", "queue_joined"}, {"message", "You've joined the matchmaking queue!"}});
  if (observability_) {
    observability_->Log(LogContext{LogLevel::kInfo, "queue_joined", participant.session_id, std::nullopt,
                                   participant.player.id, 0});
  }
  PairIfPossible();
  return true;
}

bool MatchQueueService::Dequeue(const std::string& player_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = player_index_.find(player_id);
  if (it == player_index_.end()) {
    return false;
  }
  EraseLocked(it->second);
  return true;
}

bool MatchQueueService::IsQueued(const std::string& player_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return player_index_.count(player_id) > 0;
}

bool MatchQueueService::IsSessionQueued(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_index_.count(session_id) > 0;
}

void MatchQueueService::EraseLocked(std::list<QueueEntry>::iterator it) {
  player_index_.erase(it->participant.player.id);
  session_index_.erase(it->participant.session_id);
  queue_.erase(it);
}

std::size_t MatchQueueService::QueueLength() {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

std::vector<std::pair<MatchQueueService::QueueEntry, MatchQueueService::QueueEntry>> MatchQueueService::TakePairs() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::pair<QueueEntry, QueueEntry>> pairs;
  while (queue_.size() >= 2) {
    auto first = queue_.front();
    queue_.pop_front();
    auto second = queue_.front();
    queue_.pop_front();
    for (const auto* entry : {&first, &second}) {
      player_index_.erase(entry->participant.player.id);
      session_index_.erase(entry->participant.session_id);
    }
    pairs.emplace_back(std::move(first), std::move(second));
  }
  return pairs;
}

const MatchQueueService::QueueEntry* MatchQueueService::RestoreBlameless(const QueueEntry& first,
                                                                          const QueueEntry& second) {
  std::vector<const QueueEntry*> blameless;
  for (const auto* entry : {&first, &second}) {
    const auto& participant = entry->participant;
    if (!matches_->IsPlayerInMatch(participant.player.id) && !matches_->MatchIdForSession(participant.session_id)) {
      blameless.push_back(entry);
    }
  }
  // 둘 다 책임이 없으면 원인을 알 수 없으므로 되돌리지 않는다. 같은 쌍이 반복 거절되는 것을 막는다.
  if (blameless.size() != 1) {
    return nullptr;
  }
  const auto* entry = blameless.front();
  std::lock_guard<std::mutex> lock(mutex_);
  if (player_index_.count(entry->participant.player.id) > 0 ||
      session_index_.count(entry->participant.session_id) > 0) {
    return nullptr;
  }
  queue_.push_front(*entry);
  player_index_[entry->participant.player.id] = queue_.begin();
  session_index_[entry->participant.session_id] = queue_.begin();
  return entry;
}

void MatchQueueService::PairIfPossible() {
  bool restored_any = true;
  while (restored_any) {
    restored_any = false;
    for (const auto& [first, second] : TakePairs()) {
      std::string error_code;
      std::string error_message;
      auto match_id = matches_->CreateMatch(first.participant, second.participant, error_code, error_message);
      if (match_id) {
        NotifyMatchFound(*match_id, first, second, "player1");
        NotifyMatchFound(*match_id, second, first, "player2");
        continue;
      }
      if (observability_) {
        observability_->Log(LogContext{LogLevel::kWarn, "pairing_failed", first.participant.session_id, std::nullopt,
                                       error_code + ": " + error_message, 0});
      }
      const auto* restored = RestoreBlameless(first, second);
      restored_any = restored_any || restored != nullptr;
      for (const auto* entry : {&first, &second}) {
        if (entry == restored) {
          continue;
        }
        sessions_->Send(entry->participant.session_id,
                        {{"type", "queue_left"}, {"message", "You've left the matchmaking queue."}});
      }
    }
  }
}

void MatchQueueService::NotifyMatchFound(const std::string& match_id, const QueueEntry& self,
                                         const QueueEntry& opponent, const char* side) {
  const bool delivered = sessions_->Send(self.participant.session_id,
                                         {{"type", "match_found"},
                                          {"room_id", match_id},
                                          {"side", side},
                                          {"opponent", ToSnapshotJson(opponent.participant.player)}});
  if (!delivered) {
    std::string error_code;
    std::string error_message;
    if (!matches_->RouteDisconnect(self.participant.session_id, error_code, error_message) && observability_) {
      observability_->Log(LogContext{LogLevel::kWarn, error_code, self.participant.session_id, match_id,
                                     error_message, 0});
    }
  }
}

}  // namespace tugchat

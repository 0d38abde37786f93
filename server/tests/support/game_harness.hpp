#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "support/fake_connection.hpp"
#include "tugchat/game_service.hpp"

namespace tugchat::testing {

// 네트워크 없이 서비스 그래프 전체를 조립한다. 매치 타이머는 별도 스레드의 io_context 에서 돈다.
class GameHarness {
 public:
  explicit GameHarness(const MatchTuning& tuning, std::chrono::milliseconds pull_cooldown = std::chrono::milliseconds(0))
      : work_guard_(boost::asio::make_work_guard(ioc_)) {
    observability_ = std::make_shared<Observability>(LogLevel::kWarn);
    sessions_ = std::make_shared<SessionRegistry>(observability_);
    matches_ = std::make_shared<MatchRegistry>(ioc_, sessions_, observability_, tuning);
    queue_ = std::make_shared<MatchQueueService>(sessions_, matches_, observability_);
    service_ = std::make_shared<GameService>(sessions_, queue_, matches_, observability_, pull_cooldown);
    runner_ = std::thread([this]() { ioc_.run(); });
  }

  ~GameHarness() {
    work_guard_.reset();
    ioc_.stop();
    if (runner_.joinable()) {
      runner_.join();
    }
  }

  std::shared_ptr<FakeConnection> Connect(const std::string& session_id) {
    auto connection = std::make_shared<FakeConnection>();
    sessions_->Register(session_id, connection);
    return connection;
  }

  static Player MakePlayer(const std::string& id, std::uint64_t viewers = 10) {
    Player player;
    player.id = id;
    player.username = id + "-name";
    player.channel_name = id + "_tv";
    player.viewer_count = viewers;
    return player;
  }

  bool Join(const std::string& session_id, const Player& player) {
    return service_->Dispatch(JoinQueue{session_id, player});
  }

  // 두 세션을 큐에 넣고 match_found 의 room_id 를 돌려준다.
  std::string Pair(const std::string& session_a, const Player& player_a, const std::string& session_b,
                   const Player& player_b, FakeConnection& connection_a) {
    Join(session_a, player_a);
    Join(session_b, player_b);
    auto found = connection_a.WaitFor("match_found");
    return found.is_null() ? std::string{} : found["room_id"].get<std::string>();
  }

  GameService& Service() { return *service_; }
  MatchQueueService& Queue() { return *queue_; }
  MatchRegistry& Matches() { return *matches_; }
  SessionRegistry& Sessions() { return *sessions_; }
  Observability& Metrics() { return *observability_; }

 private:
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<SessionRegistry> sessions_;
  std::shared_ptr<MatchRegistry> matches_;
  std::shared_ptr<MatchQueueService> queue_;
  std::shared_ptr<GameService> service_;
  std::thread runner_;
};

}  // namespace tugchat::testing

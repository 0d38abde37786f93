/*
 * 설명: 서버 전체 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/session_flow_test.cpp, server/tests/e2e/metrics_ops_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "tugchat/config.hpp"
#include "tugchat/game_service.hpp"
#include "tugchat/match_queue.hpp"
#include "tugchat/match_registry.hpp"
#include "tugchat/observability.hpp"
#include "tugchat/session_registry.hpp"

namespace tugchat {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<SessionRegistry> GetSessionRegistry() { return sessions_; }
  std::shared_ptr<MatchRegistry> GetMatchRegistry() { return matches_; }
  std::shared_ptr<MatchQueueService> GetMatchQueue() { return match_queue_; }
  std::shared_ptr<GameService> GetGameService() { return game_service_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();
  void Shutdown();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<SessionRegistry> sessions_;
  std::shared_ptr<MatchRegistry> matches_;
  std::shared_ptr<MatchQueueService> match_queue_;
  std::shared_ptr<GameService> game_service_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace tugchat

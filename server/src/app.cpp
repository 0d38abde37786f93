/*
 * 설명: 서버 수명주기와 리스닝 스레드를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/session_flow_test.cpp, server/tests/e2e/metrics_ops_test.cpp
 */
#include "tugchat/app.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "tugchat/http_session.hpp"

namespace tugchat {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<GameService> game_service, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config),
        game_service_(std::move(game_service)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->game_service_,
                                          self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<GameService> game_service_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_, SIGINT, SIGTERM) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  sessions_ = std::make_shared<SessionRegistry>(observability_);
  matches_ = std::make_shared<MatchRegistry>(ioc_, sessions_, observability_, ToMatchTuning(config));
  match_queue_ = std::make_shared<MatchQueueService>(sessions_, matches_, observability_);
  game_service_ = std::make_shared<GameService>(sessions_, match_queue_, matches_, observability_,
                                                std::chrono::milliseconds(config.pull_cooldown_ms));
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, game_service_, observability_);
    listener_->Run();
    signals_.async_wait([this](const boost::system::error_code& ec, int /*signal_number*/) {
      if (!ec) {
        std::cout << "종료 신호 수신, 서버를 정지합니다\n";
        Shutdown();
      }
    });
    std::cout << "서버 시작: 포트 " << config_.port << "\n";
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Shutdown() {
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  boost::system::error_code ignored;
  signals_.cancel(ignored);
  ioc_.stop();
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  Shutdown();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_MESSAGES", "64")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_BYTES", "262144")));
  cfg.match_duration_seconds = static_cast<std::size_t>(std::stoul(get_env("MATCH_DURATION_SECONDS", "120")));
  cfg.match_tick_interval_ms = static_cast<std::size_t>(std::stoul(get_env("MATCH_TICK_INTERVAL_MS", "1000")));
  cfg.ready_grace_seconds = static_cast<std::size_t>(std::stoul(get_env("READY_GRACE_SECONDS", "10")));
  cfg.pull_window_seconds = static_cast<std::size_t>(std::stoul(get_env("PULL_WINDOW_SECONDS", "30")));
  cfg.base_pull_strength = std::stod(get_env("BASE_PULL_STRENGTH", "1.0"));
  cfg.rope_tick_scale = std::stod(get_env("ROPE_TICK_SCALE", "0.5"));
  cfg.pull_cooldown_ms = static_cast<std::size_t>(std::stoul(get_env("PULL_COOLDOWN_MS", "500")));
  cfg.ingest_token = get_env("INGEST_TOKEN", "");
  cfg.ops_token = get_env("OPS_TOKEN", "");
  return cfg;
}

MatchTuning ToMatchTuning(const AppConfig& config) {
  MatchTuning tuning;
  tuning.tick_interval = std::chrono::milliseconds(std::max<std::size_t>(1, config.match_tick_interval_ms));
  tuning.duration = std::chrono::seconds(config.match_duration_seconds);
  tuning.ready_grace = std::chrono::seconds(config.ready_grace_seconds);
  tuning.pull_window = std::chrono::seconds(std::max<std::size_t>(1, config.pull_window_seconds));
  tuning.base_strength = config.base_pull_strength;
  tuning.tick_scale = config.rope_tick_scale;
  return tuning;
}

}  // namespace tugchat

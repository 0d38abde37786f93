/*
 * 설명: 세션 id 로 식별되는 WebSocket 연결의 수신 분배, 송신 큐, 백프레셔를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/session_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <deque>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "tugchat/game_service.hpp"
#include "tugchat/observability.hpp"
#include "tugchat/session_registry.hpp"

namespace tugchat {

class WebSocketSession : public SessionConnection, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, std::string session_id,
                   std::shared_ptr<GameService> game_service, std::shared_ptr<Observability> observability,
                   std::size_t max_queue_messages, std::size_t max_queue_bytes);
  ~WebSocketSession() override;
  void Run();

  // 어느 스레드에서든 호출할 수 있다. 실제 쓰기는 스트림 strand 에서 진행된다.
  bool Deliver(std::string message) override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  void NotifyClosed(const std::string& reason);

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::string session_id_;
  std::shared_ptr<GameService> game_service_;
  std::shared_ptr<Observability> observability_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  std::atomic<bool> closing_{false};
  bool close_notified_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace tugchat

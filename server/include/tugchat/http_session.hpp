/*
 * 설명: HTTP 연결을 처리하고 헬스/메트릭/운영/채팅 수집 엔드포인트 및 WS 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/session_flow_test.cpp, server/tests/e2e/metrics_ops_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "tugchat/config.hpp"
#include "tugchat/game_service.hpp"
#include "tugchat/observability.hpp"

namespace tugchat {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config, std::shared_ptr<GameService> game_service,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleChatPull(const std::shared_ptr<Response>& res);
  void SendResponse(std::shared_ptr<Response> res);
  void HandleWebSocket();
  std::optional<std::string> ExtractSessionId(const std::string& target) const;
  std::string HeaderValue(const char* name) const;

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<GameService> game_service_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
};

}  // namespace tugchat

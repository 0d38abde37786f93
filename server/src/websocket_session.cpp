/*
 * 설명: WebSocket 메시지를 읽어 게임 서비스로 넘기고 서버 메시지를 순서대로 송신한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/session_flow_test.cpp
 */
#include "tugchat/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

namespace tugchat {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::string session_id, std::shared_ptr<GameService> game_service,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), session_id_(std::move(session_id)), game_service_(std::move(game_service)),
      observability_(std::move(observability)), max_queue_messages_(max_queue_messages),
      max_queue_bytes_(max_queue_bytes) {}

WebSocketSession::~WebSocketSession() {
  // 같은 세션 id 로 새 연결이 들어왔다면 포인터가 달라 그대로 유지된다.
  game_service_->Sessions()->Unregister(session_id_, this);
}

void WebSocketSession::Run() {
  game_service_->Sessions()->Register(session_id_, shared_from_this());
  if (observability_) {
    observability_->Log(LogContext{LogLevel::kInfo, "session_opened", session_id_, std::nullopt, std::nullopt, 0});
  }
  DoRead();
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::websocket::error::closed) {
    return NotifyClosed("client_closed");
  }
  if (ec) {
    return NotifyClosed(ec.message());
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  game_service_->HandleClientMessage(session_id_, data);

  DoRead();
}

bool WebSocketSession::Deliver(std::string message) {
  if (closing_) {
    return false;
  }
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), message = std::move(message)]() mutable {
    self->EnqueueMessage(std::move(message));
  });
  return true;
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    closing_ = true;
    return NotifyClosed(ec.message());
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  send_queue_.clear();
  queued_bytes_ = 0;
  if (observability_) {
    observability_->Log(
        LogContext{LogLevel::kWarn, "backpressure_exceeded", session_id_, std::nullopt, std::nullopt, 0});
  }
  NotifyClosed("backpressure_exceeded");
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

void WebSocketSession::NotifyClosed(const std::string& reason) {
  closing_ = true;
  if (close_notified_) {
    return;
  }
  close_notified_ = true;
  if (observability_) {
    observability_->Log(LogContext{LogLevel::kDebug, "ws_closed", session_id_, std::nullopt, reason, 0});
  }
  game_service_->Dispatch(Disconnect{session_id_, this});
}

}  // namespace tugchat

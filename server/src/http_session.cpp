/*
 * 설명: HTTP 요청을 처리하고 헬스/메트릭/운영/채팅 수집/WS 업그레이드를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/session_flow_test.cpp, server/tests/e2e/metrics_ops_test.cpp
 */
#include "tugchat/http_session.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "tugchat/error_codes.hpp"
#include "tugchat/websocket_session.hpp"

namespace tugchat {

namespace {
constexpr std::size_t kMaxSessionIdLength = 128;

std::string CurrentTimestamp() {
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm = *std::gmtime(&now);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

// {success, data, error, meta{timestamp}} 응답 엔벨로프.
nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  return {{"success", true}, {"data", data}, {"error", nullptr}, {"meta", {{"timestamp", CurrentTimestamp()}}}};
}

nlohmann::json MakeErrorEnvelope(const char* code, const char* message) {
  return {{"success", false},
          {"data", nullptr},
          {"error", {{"code", code}, {"message", message}, {"detail", nullptr}}},
          {"meta", {{"timestamp", CurrentTimestamp()}}}};
}

void SetJsonBody(boost::beast::http::response<boost::beast::http::string_body>& res,
                 boost::beast::http::status status, const nlohmann::json& body_json) {
  auto body = body_json.dump();
  res.result(status);
  res.body() = body;
  res.content_length(body.size());
}

bool IsValidSessionId(const std::string& value) {
  if (value.empty() || value.size() > kMaxSessionIdLength) {
    return false;
  }
  for (unsigned char c : value) {
    if (!std::isalnum(c) && c != '-' && c != '_') {
      return false;
    }
  }
  return true;
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<GameService> game_service, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), game_service_(std::move(game_service)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "tugchat-server");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str.substr(0, target_str.find('?'));

  if (req_.method() == http::verb::get && path == "/api/health") {
    SetJsonBody(*res, http::status::ok, MakeSuccessEnvelope({{"status", "ok"}, {"version", "v1.0.0"}}));
    return SendResponse(res);
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto matches = game_service_->Matches();
    auto queue = game_service_->Queue();
    auto snapshot = observability_->Snapshot(matches->ActiveMatchCount(), queue->QueueLength());
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"matches",
                         {{"active", snapshot.active_matches},
                          {"created", snapshot.matches_created},
                          {"ended", snapshot.matches_ended}}},
                        {"pulls", {{"accepted", snapshot.pulls_accepted}, {"dropped", snapshot.pulls_dropped}}},
                        {"queue", {{"length", snapshot.queue_length}}}};
    SetJsonBody(*res, http::status::ok, MakeSuccessEnvelope(data));
    return SendResponse(res);
  }

  if (req_.method() == http::verb::get && path == "/ops/status") {
    if (config_.ops_token.empty() || HeaderValue("X-Ops-Token") != config_.ops_token) {
      SetJsonBody(*res, http::status::unauthorized,
                  MakeErrorEnvelope(error_code::kUnauthorized, "운영 토큰이 올바르지 않습니다"));
      return SendResponse(res);
    }
    auto snapshot = observability_->Snapshot(game_service_->Matches()->ActiveMatchCount(),
                                             game_service_->Queue()->QueueLength());
    nlohmann::json data{{"activeMatches", snapshot.active_matches},
                        {"queueLength", snapshot.queue_length},
                        {"activeWebsocket", snapshot.websocket_active},
                        {"errorCount", snapshot.request_errors}};
    SetJsonBody(*res, http::status::ok, MakeSuccessEnvelope(data));
    return SendResponse(res);
  }

  if (req_.method() == http::verb::post && path == "/api/chat/pull") {
    return HandleChatPull(res);
  }

  SetJsonBody(*res, http::status::not_found, MakeErrorEnvelope(error_code::kNotFound, "지원되지 않는 경로입니다"));
  SendResponse(res);
}

void HttpSession::HandleChatPull(const std::shared_ptr<Response>& res) {
  using namespace boost::beast;
  if (!config_.ingest_token.empty() && HeaderValue("X-Ingest-Token") != config_.ingest_token) {
    SetJsonBody(*res, http::status::unauthorized,
                MakeErrorEnvelope(error_code::kUnauthorized, "수집 토큰이 올바르지 않습니다"));
    return SendResponse(res);
  }
  auto pull = ParseChatPull(req_.body(), std::chrono::steady_clock::now());
  if (!pull) {
    SetJsonBody(*res, http::status::bad_request,
                MakeErrorEnvelope(error_code::kBadRequest, "channelId와 viewerId가 필요합니다"));
    return SendResponse(res);
  }
  const bool accepted = game_service_->Dispatch(*pull);
  SetJsonBody(*res, http::status::accepted, MakeSuccessEnvelope({{"accepted", accepted}}));
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    observability_->Log(LogContext{LogLevel::kDebug, std::string(req_.target()), std::nullopt, std::nullopt,
                                   std::to_string(res->result_int()), static_cast<long>(latency)});
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::HandleWebSocket() {
  request_start_ = std::chrono::steady_clock::now();
  auto session_id = ExtractSessionId(std::string(req_.target()));
  if (!session_id) {
    auto res = std::make_shared<Response>();
    res->version(req_.version());
    res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    SetJsonBody(*res, boost::beast::http::status::bad_request,
                MakeErrorEnvelope(error_code::kBadRequest, "WS 경로에 세션 id가 필요합니다"));
    return SendResponse(res);
  }
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, "tugchat-server");
  }));
  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    if (observability_) {
      observability_->Log(LogContext{LogLevel::kWarn, "ws_accept_failed", *session_id, std::nullopt, ec.message(), 0});
    }
    ws.next_layer().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return;
  }
  std::make_shared<WebSocketSession>(std::move(ws), *session_id, game_service_, observability_,
                                     config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes)
      ->Run();
}

std::optional<std::string> HttpSession::ExtractSessionId(const std::string& target) const {
  const std::string prefix = "/ws/";
  std::string path = target.substr(0, target.find('?'));
  if (path.size() <= prefix.size() || path.compare(0, prefix.size(), prefix) != 0) {
    return std::nullopt;
  }
  auto session_id = path.substr(prefix.size());
  if (!IsValidSessionId(session_id)) {
    return std::nullopt;
  }
  return session_id;
}

std::string HttpSession::HeaderValue(const char* name) const {
  auto it = req_.base().find(name);
  return it == req_.base().end() ? std::string() : std::string(it->value());
}

}  // namespace tugchat

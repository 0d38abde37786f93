/*
 * 설명: 진행 중인 매치를 소유하고 준비/당기기/연결 끊김 이벤트를 매치별 strand 로 라우팅하며 틱 루프를 구동한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/it/match_lifecycle_it_test.cpp, server/tests/it/matchmaking_flow_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <nlohmann/json.hpp>

#include "tugchat/observability.hpp"
#include "tugchat/player.hpp"
#include "tugchat/session_registry.hpp"
#include "tugchat/tug_match.hpp"

namespace tugchat {

class MatchRegistry : public std::enable_shared_from_this<MatchRegistry> {
 public:
  MatchRegistry(boost::asio::io_context& ioc, std::shared_ptr<SessionRegistry> sessions,
                std::shared_ptr<Observability> observability, const MatchTuning& tuning);

  // 두 참가자로 매치를 만들고 id 를 돌려준다. 어느 한쪽이 이미 매치에 있으면 duplicate_participant.
  std::optional<std::string> CreateMatch(const Participant& side_a, const Participant& side_b,
                                         std::string& error_code, std::string& error_message);
  bool IsPlayerInMatch(const std::string& player_id) const;
  std::optional<std::string> MatchIdForSession(const std::string& session_id) const;

  // room_id 가 비어 있지 않으면 세션이 속한 매치와 일치해야 한다.
  bool RouteReady(const std::string& session_id, const std::string& room_id, std::string& error_code,
                  std::string& error_message);
  bool RoutePull(const std::string& match_id, SideId side, const std::string& viewer_id,
                 std::chrono::steady_clock::time_point at, std::string& error_code, std::string& error_message);
  // chat_command_seen. channel_id 는 진행 중인 매치 참가자의 채널명, 없으면 플레이어 id 로 찾는다.
  bool RouteChatPull(const std::string& channel_id, const std::string& viewer_id,
                     std::chrono::steady_clock::time_point at, std::string& error_code, std::string& error_message);
  bool RouteDisconnect(const std::string& session_id, std::string& error_code, std::string& error_message);

  std::size_t ActiveMatchCount() const;

 private:
  struct MatchContext {
    TugMatch match;
    boost::asio::strand<boost::asio::io_context::executor_type> strand;
    boost::asio::steady_timer tick_timer;
    boost::asio::steady_timer grace_timer;
    std::chrono::steady_clock::time_point next_tick{};
    bool finished{false};

    MatchContext(boost::asio::io_context& ioc, std::string id, const Participant& side_a, const Participant& side_b,
                 const MatchTuning& tuning)
        : match(std::move(id), side_a, side_b, tuning),
          strand(boost::asio::make_strand(ioc)),
          tick_timer(strand),
          grace_timer(strand) {}
  };

  struct ChannelRoute {
    std::string match_id;
    SideId side;
  };

  std::shared_ptr<MatchContext> FindById(const std::string& match_id) const;
  std::shared_ptr<MatchContext> FindBySession(const std::string& session_id) const;

  void MapChannelsLocked(const std::shared_ptr<MatchContext>& ctx);
  void OpenMatch(const std::shared_ptr<MatchContext>& ctx);
  void HandleReady(const std::shared_ptr<MatchContext>& ctx, const std::string& session_id);
  void BeginPlay(const std::shared_ptr<MatchContext>& ctx);
  void ScheduleTick(const std::shared_ptr<MatchContext>& ctx);
  void HandleTick(const std::shared_ptr<MatchContext>& ctx);
  void HandlePull(const std::shared_ptr<MatchContext>& ctx, SideId side, const std::string& viewer_id,
                  std::chrono::steady_clock::time_point at);
  void HandleDisconnect(const std::shared_ptr<MatchContext>& ctx, SideId side);
  void Broadcast(const std::shared_ptr<MatchContext>& ctx, const nlohmann::json& payload);
  void FinishMatch(const std::shared_ptr<MatchContext>& ctx);
  void Log(LogLevel level, const std::string& name, const std::string& match_id,
           const std::optional<std::string>& detail = std::nullopt) const;

  boost::asio::io_context& ioc_;
  std::shared_ptr<SessionRegistry> sessions_;
  std::shared_ptr<Observability> observability_;
  MatchTuning tuning_;
  std::size_t next_match_id_{1};
  std::unordered_map<std::string, std::shared_ptr<MatchContext>> matches_;
  std::unordered_map<std::string, std::string> player_to_match_;
  std::unordered_map<std::string, std::string> session_to_match_;
  // 채널명과 플레이어 id 는 서로 다른 키 공간이다. 먼저 등록된 경로를 덮어쓰지 않는다.
  std::unordered_map<std::string, ChannelRoute> channel_name_routes_;
  std::unordered_map<std::string, ChannelRoute> player_id_routes_;
  mutable std::mutex mutex_;
};

}  // namespace tugchat

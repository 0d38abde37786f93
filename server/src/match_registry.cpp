/*
 * 설명: 매치 생성과 매치별 strand 위의 준비/틱/당기기/연결 끊김 처리, 종료 후 정리를 조율한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/it/match_lifecycle_it_test.cpp, server/tests/it/matchmaking_flow_it_test.cpp
 */
#include "tugchat/match_registry.hpp"

#include <sstream>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

#include "tugchat/error_codes.hpp"

namespace tugchat {

MatchRegistry::MatchRegistry(boost::asio::io_context& ioc, std::shared_ptr<SessionRegistry> sessions,
                             std::shared_ptr<Observability> observability, const MatchTuning& tuning)
    : ioc_(ioc), sessions_(std::move(sessions)), observability_(std::move(observability)), tuning_(tuning) {}

std::optional<std::string> MatchRegistry::CreateMatch(const Participant& side_a, const Participant& side_b,
                                                      std::string& error_code, std::string& error_message) {
  std::shared_ptr<MatchContext> ctx;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool same_player = side_a.player.id == side_b.player.id;
    const bool same_session = side_a.session_id == side_b.session_id;
    if (same_player || same_session || player_to_match_.count(side_a.player.id) > 0 ||
        player_to_match_.count(side_b.player.id) > 0 || session_to_match_.count(side_a.session_id) > 0 ||
        session_to_match_.count(side_b.session_id) > 0) {
      error_code = error_code::kDuplicateParticipant;
      error_message = "이미 매치에 참여 중인 플레이어가 있습니다";
      return std::nullopt;
    }
    std::ostringstream oss;
    oss << "room-" << next_match_id_++;
    ctx = std::make_shared<MatchContext>(ioc_, oss.str(), side_a, side_b, tuning_);
    const auto& id = ctx->match.Id();
    matches_[id] = ctx;
    player_to_match_[side_a.player.id] = id;
    player_to_match_[side_b.player.id] = id;
    session_to_match_[side_a.session_id] = id;
    session_to_match_[side_b.session_id] = id;
  }

  if (observability_) {
    observability_->IncrementMatchCreated();
  }
  Log(LogLevel::kInfo, "match_created", ctx->match.Id(), side_a.player.id + " vs " + side_b.player.id);
  boost::asio::dispatch(ctx->strand, [self = shared_from_this(), ctx]() { self->OpenMatch(ctx); });
  return ctx->match.Id();
}

bool MatchRegistry::IsPlayerInMatch(const std::string& player_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return player_to_match_.count(player_id) > 0;
}

std::optional<std::string> MatchRegistry::MatchIdForSession(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = session_to_match_.find(session_id);
  if (it == session_to_match_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::shared_ptr<MatchRegistry::MatchContext> MatchRegistry::FindById(const std::string& match_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = matches_.find(match_id);
  if (it == matches_.end()) {
    return nullptr;
  }
  return it->second;
}

std::shared_ptr<MatchRegistry::MatchContext> MatchRegistry::FindBySession(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = session_to_match_.find(session_id);
  if (it == session_to_match_.end()) {
    return nullptr;
  }
  auto ctx_it = matches_.find(it->second);
  if (ctx_it == matches_.end()) {
    return nullptr;
  }
  return ctx_it->second;
}

bool MatchRegistry::RouteReady(const std::string& session_id, const std::string& room_id, std::string& error_code,
                               std::string& error_message) {
  auto ctx = FindBySession(session_id);
  if (!ctx) {
    error_code = error_code::kUnknownSession;
    error_message = "매치에 연결되지 않은 세션입니다";
    return false;
  }
  if (!room_id.empty() && room_id != ctx->match.Id()) {
    error_code = error_code::kUnknownMatch;
    error_message = "세션이 속한 방이 아닙니다";
    return false;
  }
  boost::asio::post(ctx->strand, [self = shared_from_this(), ctx, session_id]() { self->HandleReady(ctx, session_id); });
  return true;
}

bool MatchRegistry::RoutePull(const std::string& match_id, SideId side, const std::string& viewer_id,
                              std::chrono::steady_clock::time_point at, std::string& error_code,
                              std::string& error_message) {
  auto ctx = FindById(match_id);
  if (!ctx) {
    error_code = error_code::kUnknownMatch;
    error_message = "존재하지 않는 매치입니다";
    return false;
  }
  boost::asio::post(ctx->strand, [self = shared_from_this(), ctx, side, viewer_id, at]() {
    self->HandlePull(ctx, side, viewer_id, at);
  });
  return true;
}

bool MatchRegistry::RouteChatPull(const std::string& channel_id, const std::string& viewer_id,
                                  std::chrono::steady_clock::time_point at, std::string& error_code,
                                  std::string& error_message) {
  std::optional<ChannelRoute> route;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto* routes : {&channel_name_routes_, &player_id_routes_}) {
      auto it = routes->find(channel_id);
      if (it != routes->end()) {
        route = it->second;
        break;
      }
    }
  }
  if (!route) {
    error_code = error_code::kUnknownMatch;
    error_message = "진행 중인 매치에 연결되지 않은 채널입니다";
    return false;
  }
  return RoutePull(route->match_id, route->side, viewer_id, at, error_code, error_message);
}

bool MatchRegistry::RouteDisconnect(const std::string& session_id, std::string& error_code,
                                    std::string& error_message) {
  auto ctx = FindBySession(session_id);
  if (!ctx) {
    error_code = error_code::kUnknownSession;
    error_message = "매치에 연결되지 않은 세션입니다";
    return false;
  }
  boost::asio::post(ctx->strand, [self = shared_from_this(), ctx, session_id]() {
    auto side = ctx->match.SideOfSession(session_id);
    if (side) {
      self->HandleDisconnect(ctx, *side);
    }
  });
  return true;
}

void MatchRegistry::OpenMatch(const std::shared_ptr<MatchContext>& ctx) {
  ctx->grace_timer.expires_after(tuning_.ready_grace);
  auto self = shared_from_this();
  ctx->grace_timer.async_wait(
      boost::asio::bind_executor(ctx->strand, [self, ctx](const boost::system::error_code& ec) {
        if (ec || ctx->finished || ctx->match.State() != MatchState::kPendingReady) {
          return;
        }
        self->Log(LogLevel::kInfo, "ready_grace_expired", ctx->match.Id());
        self->BeginPlay(ctx);
      }));
}

void MatchRegistry::HandleReady(const std::shared_ptr<MatchContext>& ctx, const std::string& session_id) {
  if (ctx->finished) {
    return;
  }
  auto side = ctx->match.SideOfSession(session_id);
  if (!side) {
    return;
  }
  if (ctx->match.MarkReady(*side)) {
    BeginPlay(ctx);
  }
}

void MatchRegistry::BeginPlay(const std::shared_ptr<MatchContext>& ctx) {
  ctx->grace_timer.cancel();
  const auto now = std::chrono::steady_clock::now();
  if (!ctx->match.Start(now)) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    MapChannelsLocked(ctx);
  }

  Log(LogLevel::kInfo, "match_started", ctx->match.Id());
  Broadcast(ctx, {{"type", "game_started"},
                  {"room_id", ctx->match.Id()},
                  {"message", "The tug of war has begun! Chat, type !PULL to help!"}});
  if (ctx->match.State() == MatchState::kEnded) {
    FinishMatch(ctx);
    return;
  }
  ctx->next_tick = now;
  ScheduleTick(ctx);
}

void MatchRegistry::MapChannelsLocked(const std::shared_ptr<MatchContext>& ctx) {
  const auto& id = ctx->match.Id();
  auto map_route = [this, &id](std::unordered_map<std::string, ChannelRoute>& routes, const std::string& key,
                               SideId side) {
    if (key.empty()) {
      return;
    }
    auto [it, inserted] = routes.try_emplace(key, ChannelRoute{id, side});
    if (!inserted && (it->second.match_id != id || it->second.side != side)) {
      Log(LogLevel::kWarn, "channel_route_conflict", id, key + " -> " + it->second.match_id);
    }
  };
  for (auto side : {SideId::kA, SideId::kB}) {
    const auto& player = ctx->match.Side(side).participant.player;
    map_route(player_id_routes_, player.id, side);
    map_route(channel_name_routes_, player.channel_name, side);
  }
}

void MatchRegistry::ScheduleTick(const std::shared_ptr<MatchContext>& ctx) {
  // 다음 틱 시각을 누적해서 스케줄 지연이 쌓이지 않게 한다.
  ctx->next_tick += tuning_.tick_interval;
  ctx->tick_timer.expires_at(ctx->next_tick);
  auto self = shared_from_this();
  ctx->tick_timer.async_wait(
      boost::asio::bind_executor(ctx->strand, [self, ctx](const boost::system::error_code& ec) {
        if (!ec) {
          self->HandleTick(ctx);
        }
      }));
}

void MatchRegistry::HandleTick(const std::shared_ptr<MatchContext>& ctx) {
  if (ctx->finished) {
    return;
  }
  const auto now = std::chrono::steady_clock::now();
  auto result = ctx->match.Tick(now);
  if (result.ended) {
    FinishMatch(ctx);
    return;
  }
  Broadcast(ctx, {{"type", "game_update"}, {"state", ctx->match.StatePayload(now)}});
  if (ctx->finished) {
    return;
  }
  ScheduleTick(ctx);
}

void MatchRegistry::HandlePull(const std::shared_ptr<MatchContext>& ctx, SideId side, const std::string& viewer_id,
                               std::chrono::steady_clock::time_point at) {
  const bool recorded = !ctx->finished && ctx->match.RecordPull(side, viewer_id, at);
  if (!observability_) {
    return;
  }
  if (recorded) {
    observability_->IncrementPullAccepted();
  } else {
    observability_->IncrementPullDropped();
    Log(LogLevel::kDebug, "pull_dropped", ctx->match.Id(), viewer_id);
  }
}

void MatchRegistry::HandleDisconnect(const std::shared_ptr<MatchContext>& ctx, SideId side) {
  if (ctx->finished) {
    return;
  }
  ctx->match.HandleDisconnect(side, std::chrono::steady_clock::now());
  Log(LogLevel::kInfo, "participant_disconnected", ctx->match.Id(), SideName(side));
  if (ctx->match.State() == MatchState::kEnded) {
    FinishMatch(ctx);
  }
}

void MatchRegistry::Broadcast(const std::shared_ptr<MatchContext>& ctx, const nlohmann::json& payload) {
  for (auto side : {SideId::kA, SideId::kB}) {
    const auto& session_id = ctx->match.Side(side).participant.session_id;
    if (sessions_->Send(session_id, payload) || ctx->finished) {
      continue;
    }
    // 전달 실패는 해당 진영의 연결 끊김으로 처리한다. 현재 핸들러가 끝난 뒤 같은 strand 에서 실행된다.
    boost::asio::post(ctx->strand, [self = shared_from_this(), ctx, side]() { self->HandleDisconnect(ctx, side); });
  }
}

void MatchRegistry::FinishMatch(const std::shared_ptr<MatchContext>& ctx) {
  if (ctx->finished) {
    return;
  }
  ctx->finished = true;
  ctx->tick_timer.cancel();
  ctx->grace_timer.cancel();

  const auto now = std::chrono::steady_clock::now();
  Broadcast(ctx, {{"type", "game_update"}, {"state", ctx->match.StatePayload(now)}});
  auto ended_payload = ctx->match.EndedPayload();
  Broadcast(ctx, ended_payload);

  if (observability_) {
    observability_->IncrementMatchEnded();
  }
  std::ostringstream detail;
  detail << ended_payload["reason"].get<std::string>() << " winner="
         << (ended_payload["winner"].is_null() ? std::string{"draw"} : ended_payload["winner"].get<std::string>());
  Log(LogLevel::kInfo, "match_ended", ctx->match.Id(), detail.str());

  std::lock_guard<std::mutex> lock(mutex_);
  const auto& id = ctx->match.Id();
  for (auto side : {SideId::kA, SideId::kB}) {
    const auto& participant = ctx->match.Side(side).participant;
    auto player_it = player_to_match_.find(participant.player.id);
    if (player_it != player_to_match_.end() && player_it->second == id) {
      player_to_match_.erase(player_it);
    }
    auto session_it = session_to_match_.find(participant.session_id);
    if (session_it != session_to_match_.end() && session_it->second == id) {
      session_to_match_.erase(session_it);
    }
  }
  for (auto* routes : {&player_id_routes_, &channel_name_routes_}) {
    for (auto it = routes->begin(); it != routes->end();) {
      if (it->second.match_id == id) {
        it = routes->erase(it);
      } else {
        ++it;
      }
    }
  }
  matches_.erase(id);
}

std::size_t MatchRegistry::ActiveMatchCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return matches_.size();
}

void MatchRegistry::Log(LogLevel level, const std::string& name, const std::string& match_id,
                        const std::optional<std::string>& detail) const {
  if (observability_) {
    observability_->Log(LogContext{level, name, std::nullopt, match_id, detail, 0});
  }
}

}  // namespace tugchat

/*
 * 설명: 매치 테이블, 매치별 strand/타이머 틱 루프, 종료/몰수/취소 처리와 레이팅 반영을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_coordinator_test.cpp
 */
#include "arena/match_coordinator.hpp"

#include <random>
#include <vector>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

namespace arena {

std::string_view ToString(MatchStatus status) {
  switch (status) {
    case MatchStatus::kWaiting:
      return "waiting";
    case MatchStatus::kActive:
      return "active";
    case MatchStatus::kCompleted:
      return "completed";
    case MatchStatus::kCancelled:
      return "cancelled";
  }
  return "waiting";
}

MatchLifecycleCoordinator::MatchLifecycleCoordinator(boost::asio::io_context& ioc, CoordinatorConfig config,
                                                     std::shared_ptr<RatingLedger> ratings,
                                                     std::shared_ptr<OutcomePublisher> publisher,
                                                     std::shared_ptr<Observability> observability)
    : ioc_(ioc), config_(config), ratings_(std::move(ratings)), publisher_(std::move(publisher)),
      observability_(std::move(observability)) {}

std::optional<MatchView> MatchLifecycleCoordinator::CreateWaitingMatch(const std::string& match_id,
                                                                      QueueClass queue_class,
                                                                      const PlayerHandle& player1,
                                                                      std::optional<SimulationState> initial_state) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (matches_.count(match_id) > 0) {
    return std::nullopt;
  }
  std::uint32_t seed = config_.rng_seed ? *config_.rng_seed + seed_counter_++ : std::random_device{}();
  MatchSimulator simulator = initial_state ? MatchSimulator(*initial_state, seed) : MatchSimulator(seed);
  auto ctx = std::make_shared<MatchContext>(ioc_, std::move(simulator));
  ctx->id = match_id;
  ctx->queue_class = queue_class;
  ctx->player1 = player1;
  ctx->status = MatchStatus::kWaiting;
  ctx->created_at = std::chrono::system_clock::now();
  matches_[match_id] = ctx;
  connection_index_[player1.connection_id] = match_id;
  return BuildViewLocked(*ctx);
}

std::optional<MatchView> MatchLifecycleCoordinator::JoinMatch(const std::string& match_id, const PlayerHandle& player2) {
  // 전역 락 -> 매치 락 순서. 상태 전이와 색인 등록 사이에 teardown이 끼어들 수 없다.
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = matches_.find(match_id);
  if (it == matches_.end()) {
    return std::nullopt;
  }
  auto& ctx = it->second;
  std::lock_guard<std::mutex> ctx_lock(ctx->mutex);
  if (ctx->player2 || ctx->status != MatchStatus::kWaiting || ctx->torn_down) {
    return std::nullopt;
  }
  ctx->player2 = player2;
  ctx->status = MatchStatus::kActive;
  connection_index_[player2.connection_id] = match_id;
  return BuildViewLocked(*ctx);
}

bool MatchLifecycleCoordinator::StartSimulation(const std::string& match_id, DeltaSink on_delta,
                                                CompletionSink on_complete, std::chrono::milliseconds start_delay) {
  auto ctx = Find(match_id);
  if (!ctx) {
    return false;
  }
  {
    std::lock_guard<std::mutex> ctx_lock(ctx->mutex);
    if (ctx->loop_started || ctx->status != MatchStatus::kActive) {
      return false;
    }
    ctx->loop_started = true;
    ctx->on_delta = std::move(on_delta);
    ctx->on_complete = std::move(on_complete);
  }
  observability_->IncrementMatchStarted();
  observability_->Info("match_loop_scheduled", {{"matchId", match_id}, {"startDelayMs", start_delay.count()}});
  auto wait = std::chrono::duration_cast<std::chrono::nanoseconds>(start_delay) + config_.tick_interval;
  boost::asio::dispatch(ctx->strand, [self = shared_from_this(), ctx, wait]() { self->ScheduleTick(ctx, wait); });
  return true;
}

bool MatchLifecycleCoordinator::ApplyPaddleInput(const std::string& match_id, ConnectionId connection_id,
                                                 double paddle_y) {
  auto ctx = Find(match_id);
  if (!ctx) {
    return false;
  }
  std::lock_guard<std::mutex> ctx_lock(ctx->mutex);
  if (ctx->status != MatchStatus::kWaiting && ctx->status != MatchStatus::kActive) {
    return false;
  }
  if (ctx->player1.connection_id == connection_id) {
    ctx->simulator.SetPaddle(Slot::kPlayer1, paddle_y);
    return true;
  }
  if (ctx->player2 && ctx->player2->connection_id == connection_id) {
    ctx->simulator.SetPaddle(Slot::kPlayer2, paddle_y);
    return true;
  }
  return false;
}

std::optional<MatchView> MatchLifecycleCoordinator::Cancel(const std::string& match_id) {
  auto ctx = Find(match_id);
  if (!ctx) {
    return std::nullopt;
  }
  MatchView view;
  {
    std::lock_guard<std::mutex> ctx_lock(ctx->mutex);
    if (ctx->status != MatchStatus::kWaiting && ctx->status != MatchStatus::kActive) {
      return std::nullopt;
    }
    ctx->status = MatchStatus::kCancelled;
    view = BuildViewLocked(*ctx);
  }
  Teardown(ctx);
  observability_->IncrementMatchCancelled();
  observability_->Info("match_cancelled", {{"matchId", match_id}});
  return view;
}

std::optional<DisconnectResolution> MatchLifecycleCoordinator::ResolveDisconnect(ConnectionId connection_id) {
  auto match_id = MatchOf(connection_id);
  if (!match_id) {
    return std::nullopt;
  }
  auto ctx = Find(*match_id);
  if (!ctx) {
    return std::nullopt;
  }

  std::optional<Slot> winner_slot;
  std::optional<PlayerHandle> remaining;
  MatchStatus status;
  {
    std::lock_guard<std::mutex> ctx_lock(ctx->mutex);
    status = ctx->status;
    if (status == MatchStatus::kActive && ctx->player2) {
      bool left_is_player1 = ctx->player1.connection_id == connection_id;
      winner_slot = left_is_player1 ? Slot::kPlayer2 : Slot::kPlayer1;
      remaining = left_is_player1 ? *ctx->player2 : ctx->player1;
    }
  }

  DisconnectResolution resolution;
  if (winner_slot) {
    resolution.forfeit = Finish(ctx, *winner_slot, true);
    if (!resolution.forfeit) {
      // 같은 틱에 정상 종료가 먼저 처리되었다.
      return std::nullopt;
    }
    resolution.remaining = remaining;
    observability_->IncrementForfeit();
  } else if (status == MatchStatus::kWaiting) {
    if (!Cancel(*match_id)) {
      return std::nullopt;
    }
  } else {
    return std::nullopt;
  }

  std::lock_guard<std::mutex> ctx_lock(ctx->mutex);
  resolution.match = BuildViewLocked(*ctx);
  return resolution;
}

void MatchLifecycleCoordinator::Shutdown() {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : matches_) {
      ids.push_back(entry.first);
    }
  }
  for (const auto& id : ids) {
    Cancel(id);
  }
}

std::optional<MatchView> MatchLifecycleCoordinator::GetMatch(const std::string& match_id) const {
  auto ctx = Find(match_id);
  if (!ctx) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> ctx_lock(ctx->mutex);
  return BuildViewLocked(*ctx);
}

std::optional<Slot> MatchLifecycleCoordinator::SlotOf(const std::string& match_id, ConnectionId connection_id) const {
  auto ctx = Find(match_id);
  if (!ctx) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> ctx_lock(ctx->mutex);
  if (ctx->player1.connection_id == connection_id) {
    return Slot::kPlayer1;
  }
  if (ctx->player2 && ctx->player2->connection_id == connection_id) {
    return Slot::kPlayer2;
  }
  return std::nullopt;
}

std::optional<std::string> MatchLifecycleCoordinator::MatchOf(ConnectionId connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connection_index_.find(connection_id);
  if (it == connection_index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t MatchLifecycleCoordinator::ActiveMatchCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return matches_.size();
}

MatchLifecycleCoordinator::ContextPtr MatchLifecycleCoordinator::Find(const std::string& match_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = matches_.find(match_id);
  if (it == matches_.end()) {
    return nullptr;
  }
  return it->second;
}

MatchView MatchLifecycleCoordinator::BuildViewLocked(const MatchContext& ctx) const {
  MatchView view;
  view.id = ctx.id;
  view.queue_class = ctx.queue_class;
  view.player1 = ctx.player1;
  view.player2 = ctx.player2;
  view.status = ctx.status;
  view.winner = ctx.winner;
  view.created_at = ctx.created_at;
  view.state = ctx.simulator.State();
  return view;
}

void MatchLifecycleCoordinator::ScheduleTick(const ContextPtr& ctx, std::chrono::nanoseconds wait) {
  ctx->timer.expires_after(wait);
  auto self = shared_from_this();
  ctx->timer.async_wait(boost::asio::bind_executor(ctx->strand, [self, ctx](const boost::system::error_code& ec) {
    if (!ec) {
      self->HandleTick(ctx);
    }
  }));
}

void MatchLifecycleCoordinator::HandleTick(const ContextPtr& ctx) {
  // 매치 레코드가 사라졌으면 루프를 조용히 끝낸다.
  if (Find(ctx->id) != ctx) {
    std::lock_guard<std::mutex> ctx_lock(ctx->mutex);
    ctx->simulator.DropDeltaCache();
    return;
  }

  std::optional<Slot> winner;
  std::optional<StateDelta> delta;
  DeltaSink sink;
  {
    std::lock_guard<std::mutex> ctx_lock(ctx->mutex);
    if (ctx->status != MatchStatus::kActive || ctx->torn_down) {
      ctx->simulator.DropDeltaCache();
      return;
    }
    auto result = ctx->simulator.Tick();
    if (result.scorer) {
      observability_->Debug("point_scored", {{"matchId", ctx->id},
                                             {"player1Score", ctx->simulator.State().player1_score},
                                             {"player2Score", ctx->simulator.State().player2_score}});
    }
    if (result.winner) {
      winner = result.winner;
    } else {
      delta = ctx->simulator.TakeDelta();
      sink = ctx->on_delta;
    }
  }

  if (winner) {
    Finish(ctx, *winner, false);
    return;
  }
  if (sink) {
    sink(ctx->id, *delta);
  }
  ScheduleTick(ctx, config_.tick_interval);
}

std::optional<MatchResult> MatchLifecycleCoordinator::Finish(const ContextPtr& ctx, Slot winner_slot, bool forfeit) {
  MatchResult result;
  CompletionSink sink;
  {
    std::lock_guard<std::mutex> ctx_lock(ctx->mutex);
    if (ctx->status != MatchStatus::kActive || !ctx->player2) {
      return std::nullopt;
    }
    ctx->status = MatchStatus::kCompleted;
    const auto& winner = winner_slot == Slot::kPlayer1 ? ctx->player1 : *ctx->player2;
    ctx->winner = winner.identity;

    const auto& state = ctx->simulator.State();
    result.match_id = ctx->id;
    result.queue_class = ctx->queue_class;
    result.winner = winner.identity;
    result.winner_slot = winner_slot;
    result.player1_score = state.player1_score;
    result.player2_score = state.player2_score;
    result.player1.player = ctx->player1;
    result.player2.player = *ctx->player2;
    result.forfeit = forfeit;
    if (!forfeit) {
      sink = ctx->on_complete;
    }
  }

  auto& winner_result = winner_slot == Slot::kPlayer1 ? result.player1 : result.player2;
  auto& loser_result = winner_slot == Slot::kPlayer1 ? result.player2 : result.player1;
  std::vector<PlayerRatingUpdate> updates;
  if (result.queue_class == QueueClass::kRanked) {
    auto ranked = ratings_->ApplyRankedResult(winner_result.player.identity, loser_result.player.identity);
    winner_result.rating_change = ranked.delta.winner_change;
    winner_result.new_rating = ranked.winner_after.rating;
    loser_result.rating_change = ranked.delta.loser_change;
    loser_result.new_rating = ranked.loser_after.rating;
    updates.push_back({winner_result.player.identity, ranked.winner_after, true});
    updates.push_back({loser_result.player.identity, ranked.loser_after, false});
    observability_->Info("rating_applied", {{"matchId", result.match_id},
                                            {"winner", winner_result.player.identity},
                                            {"winnerChange", winner_result.rating_change},
                                            {"loser", loser_result.player.identity},
                                            {"loserChange", loser_result.rating_change}});
  } else {
    winner_result.new_rating = ratings_->Peek(winner_result.player.identity).rating;
    loser_result.new_rating = ratings_->Peek(loser_result.player.identity).rating;
  }

  OutcomeSummary summary;
  summary.match_id = result.match_id;
  summary.player1 = result.player1.player.identity;
  summary.player2 = result.player2.player.identity;
  summary.player1_score = result.player1_score;
  summary.player2_score = result.player2_score;
  summary.winner = result.winner;
  summary.queue_class = result.queue_class;
  summary.player1_rating_change = result.player1.rating_change;
  summary.player2_rating_change = result.player2.rating_change;
  summary.forfeit = forfeit;
  if (publisher_) {
    publisher_->Publish(summary, std::move(updates));
  }

  Teardown(ctx);
  observability_->IncrementMatchCompleted();
  observability_->Info(forfeit ? "match_forfeited" : "match_completed", ToJson(summary));
  if (sink) {
    sink(result);
  }
  return result;
}

void MatchLifecycleCoordinator::Teardown(const ContextPtr& ctx) {
  {
    std::lock_guard<std::mutex> ctx_lock(ctx->mutex);
    if (ctx->torn_down) {
      return;
    }
    ctx->torn_down = true;
    ctx->simulator.DropDeltaCache();
  }
  // 타이머는 strand 위에서만 다룬다.
  boost::asio::post(ctx->strand, [ctx]() { ctx->timer.cancel(); });

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = matches_.find(ctx->id);
  if (it != matches_.end() && it->second == ctx) {
    matches_.erase(it);
  }
  auto release = [this, &ctx](ConnectionId connection_id) {
    auto conn_it = connection_index_.find(connection_id);
    if (conn_it != connection_index_.end() && conn_it->second == ctx->id) {
      connection_index_.erase(conn_it);
    }
  };
  release(ctx->player1.connection_id);
  if (ctx->player2) {
    release(ctx->player2->connection_id);
  }
}

}  // namespace arena

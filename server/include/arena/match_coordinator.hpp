/*
 * 설명: 매치 생성/참가/틱 루프 구동/취소/이탈 몰수와 종료 시 레이팅 반영을 관리하는 매치 수명주기 조율자.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_coordinator_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "arena/match_types.hpp"
#include "arena/observability.hpp"
#include "arena/outcome_publisher.hpp"
#include "arena/rating_ledger.hpp"
#include "arena/simulation.hpp"

namespace arena {

enum class MatchStatus { kWaiting, kActive, kCompleted, kCancelled };

std::string_view ToString(MatchStatus status);

struct MatchView {
  std::string id;
  QueueClass queue_class{QueueClass::kUnranked};
  PlayerHandle player1;
  std::optional<PlayerHandle> player2;
  MatchStatus status{MatchStatus::kWaiting};
  std::optional<std::string> winner;
  std::chrono::system_clock::time_point created_at;
  SimulationState state;
};

struct PlayerResult {
  PlayerHandle player;
  int rating_change{0};
  int new_rating{0};
};

struct MatchResult {
  std::string match_id;
  QueueClass queue_class{QueueClass::kUnranked};
  std::string winner;
  Slot winner_slot{Slot::kPlayer1};
  int player1_score{0};
  int player2_score{0};
  PlayerResult player1;
  PlayerResult player2;
  bool forfeit{false};

  const PlayerResult& For(Slot slot) const { return slot == Slot::kPlayer1 ? player1 : player2; }
};

struct DisconnectResolution {
  MatchView match;
  std::optional<MatchResult> forfeit;
  std::optional<PlayerHandle> remaining;
};

using DeltaSink = std::function<void(const std::string& match_id, const StateDelta& delta)>;
using CompletionSink = std::function<void(const MatchResult& result)>;

struct CoordinatorConfig {
  std::chrono::nanoseconds tick_interval{MatchSimulator::kTickInterval};
  std::optional<std::uint32_t> rng_seed;
};

class MatchLifecycleCoordinator : public std::enable_shared_from_this<MatchLifecycleCoordinator> {
 public:
  MatchLifecycleCoordinator(boost::asio::io_context& ioc, CoordinatorConfig config,
                            std::shared_ptr<RatingLedger> ratings, std::shared_ptr<OutcomePublisher> publisher,
                            std::shared_ptr<Observability> observability);

  std::optional<MatchView> CreateWaitingMatch(const std::string& match_id, QueueClass queue_class,
                                              const PlayerHandle& player1,
                                              std::optional<SimulationState> initial_state = std::nullopt);
  // 이미 두 명이거나 waiting이 아니면 nullopt.
  std::optional<MatchView> JoinMatch(const std::string& match_id, const PlayerHandle& player2);
  // 매치당 틱 루프는 하나뿐이다. 두 번째 호출이나 active가 아닌 매치는 false.
  bool StartSimulation(const std::string& match_id, DeltaSink on_delta, CompletionSink on_complete,
                       std::chrono::milliseconds start_delay = std::chrono::milliseconds(0));
  bool ApplyPaddleInput(const std::string& match_id, ConnectionId connection_id, double paddle_y);
  std::optional<MatchView> Cancel(const std::string& match_id);
  std::optional<DisconnectResolution> ResolveDisconnect(ConnectionId connection_id);
  void Shutdown();

  std::optional<MatchView> GetMatch(const std::string& match_id) const;
  std::optional<Slot> SlotOf(const std::string& match_id, ConnectionId connection_id) const;
  std::optional<std::string> MatchOf(ConnectionId connection_id) const;
  std::size_t ActiveMatchCount() const;

 private:
  struct MatchContext {
    std::string id;
    QueueClass queue_class{QueueClass::kUnranked};
    PlayerHandle player1;
    std::optional<PlayerHandle> player2;
    MatchStatus status{MatchStatus::kWaiting};
    std::optional<std::string> winner;
    std::chrono::system_clock::time_point created_at;
    MatchSimulator simulator;
    boost::asio::strand<boost::asio::io_context::executor_type> strand;
    boost::asio::steady_timer timer;
    DeltaSink on_delta;
    CompletionSink on_complete;
    bool loop_started{false};
    bool torn_down{false};
    std::mutex mutex;

    MatchContext(boost::asio::io_context& ioc, MatchSimulator sim)
        : simulator(std::move(sim)), strand(boost::asio::make_strand(ioc)), timer(ioc) {}
  };
  using ContextPtr = std::shared_ptr<MatchContext>;

  ContextPtr Find(const std::string& match_id) const;
  MatchView BuildViewLocked(const MatchContext& ctx) const;
  void ScheduleTick(const ContextPtr& ctx, std::chrono::nanoseconds wait);
  void HandleTick(const ContextPtr& ctx);
  std::optional<MatchResult> Finish(const ContextPtr& ctx, Slot winner_slot, bool forfeit);
  void Teardown(const ContextPtr& ctx);

  boost::asio::io_context& ioc_;
  CoordinatorConfig config_;
  std::shared_ptr<RatingLedger> ratings_;
  std::shared_ptr<OutcomePublisher> publisher_;
  std::shared_ptr<Observability> observability_;
  std::unordered_map<std::string, ContextPtr> matches_;
  std::unordered_map<ConnectionId, std::string> connection_index_;
  std::uint32_t seed_counter_{0};
  mutable std::mutex mutex_;
};

}  // namespace arena

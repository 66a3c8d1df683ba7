/*
 * 설명: 연결별 클라이언트 명령을 대기열/매치 조율자/레이팅 캐시에 연결하고 결과 이벤트를 전달하는 경계 서비스.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/arena_service_test.cpp, server/tests/e2e/arena_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "arena/client_command.hpp"
#include "arena/events.hpp"
#include "arena/match_coordinator.hpp"
#include "arena/match_queue.hpp"
#include "arena/observability.hpp"
#include "arena/rate_limiter.hpp"
#include "arena/rating_ledger.hpp"

namespace arena {

struct ArenaConfig {
  std::chrono::milliseconds match_start_delay{3000};
  std::chrono::seconds sweep_interval{1};
  std::size_t rate_limit_max{100};
  std::chrono::seconds rate_limit_window{60};
};

class ArenaService : public std::enable_shared_from_this<ArenaService> {
 public:
  using Clock = std::chrono::steady_clock;

  ArenaService(boost::asio::io_context& ioc, ArenaConfig config, std::shared_ptr<MatchmakingQueue> queue,
               std::shared_ptr<MatchLifecycleCoordinator> coordinator, std::shared_ptr<RatingLedger> ratings,
               std::shared_ptr<EventSink> sink, std::shared_ptr<Observability> observability);

  // 대기열 만료/재페어링 타이머를 시작한다.
  void Start();
  void Stop();

  ConnectionId NextConnectionId() { return next_connection_id_.fetch_add(1); }

  // 한 연결의 명령은 호출 순서대로 처리되어야 한다(전송 계층이 읽기 순서대로 호출).
  void Dispatch(ConnectionId connection_id, const ClientCommand& command);
  void Sweep(Clock::time_point now);

  RatingRecord LookupRating(const std::string& identity) { return ratings_->Resolve(identity); }
  const RatingEngine& Engine() const { return ratings_->Engine(); }
  std::shared_ptr<MatchmakingQueue> Queue() const { return queue_; }
  std::shared_ptr<MatchLifecycleCoordinator> Coordinator() const { return coordinator_; }

 private:
  void HandleJoin(ConnectionId connection_id, const JoinQueue& command);
  void HandleLeave(ConnectionId connection_id);
  void HandlePaddle(ConnectionId connection_id, const UpdatePaddle& command);
  void HandleCancel(ConnectionId connection_id, const CancelMatch& command);
  void HandleGetRating(ConnectionId connection_id, const GetRating& command);
  void HandleDisconnect(ConnectionId connection_id);

  // pairing_mutex_를 잡은 상태에서 호출한다.
  void StartMatch(const QueueEntry& waiting, const QueueEntry& joined);
  void BroadcastDelta(ConnectionId player1, ConnectionId player2, const StateDelta& delta);
  void BroadcastEnded(const MatchResult& result);
  void ScheduleSweep();
  std::string NewMatchId();

  boost::asio::strand<boost::asio::io_context::executor_type> sweep_strand_;
  boost::asio::steady_timer sweep_timer_;
  ArenaConfig config_;
  std::shared_ptr<MatchmakingQueue> queue_;
  std::shared_ptr<MatchLifecycleCoordinator> coordinator_;
  std::shared_ptr<RatingLedger> ratings_;
  std::shared_ptr<EventSink> sink_;
  std::shared_ptr<Observability> observability_;
  RateLimiter rate_limiter_;
  // 대기열 항목이 매치로 옮겨지는 구간과 연결 이탈 처리를 직렬화한다.
  std::mutex pairing_mutex_;
  std::atomic<ConnectionId> next_connection_id_{1};
  std::atomic<bool> running_{false};
};

}  // namespace arena

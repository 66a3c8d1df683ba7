/*
 * 설명: 서버 전체 수명주기와 컴포넌트 조립을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/arena_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "arena/arena_service.hpp"
#include "arena/config.hpp"
#include "arena/match_coordinator.hpp"
#include "arena/match_queue.hpp"
#include "arena/match_repository.hpp"
#include "arena/observability.hpp"
#include "arena/outcome_publisher.hpp"
#include "arena/rating_ledger.hpp"
#include "arena/realtime.hpp"

namespace arena {

class Listener;

class ServerApp {
 public:
  // repository가 null이고 DB가 활성화되어 있으면 MariaDB 저장소를 만든다.
  explicit ServerApp(const AppConfig& config, std::shared_ptr<MatchRepository> repository = nullptr,
                     std::shared_ptr<SettlementService> settlement = nullptr);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<ArenaService> GetArena() { return arena_; }
  std::shared_ptr<MatchLifecycleCoordinator> GetCoordinator() { return coordinator_; }
  std::shared_ptr<MatchmakingQueue> GetQueue() { return queue_; }
  std::shared_ptr<RatingLedger> GetRatings() { return ratings_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MatchRepository> repository_;
  std::shared_ptr<OutcomePublisher> publisher_;
  std::shared_ptr<RatingLedger> ratings_;
  std::shared_ptr<MatchmakingQueue> queue_;
  std::shared_ptr<MatchLifecycleCoordinator> coordinator_;
  std::shared_ptr<RealtimeCoordinator> realtime_;
  std::shared_ptr<ArenaService> arena_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace arena

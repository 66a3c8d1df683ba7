/*
 * 설명: 메모리 상태 반영이 끝난 매치 결과를 저장소/정산 협력자에게 백그라운드로 1회 전달한다(실패는 로그 후 폐기).
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_coordinator_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "arena/match_repository.hpp"
#include "arena/observability.hpp"

namespace arena {

class OutcomePublisher {
 public:
  OutcomePublisher(std::shared_ptr<MatchRepository> repository, std::shared_ptr<SettlementService> settlement,
                   std::shared_ptr<Observability> observability, std::size_t threads = 1);
  ~OutcomePublisher();

  OutcomePublisher(const OutcomePublisher&) = delete;
  OutcomePublisher& operator=(const OutcomePublisher&) = delete;

  void Publish(const OutcomeSummary& summary, std::vector<PlayerRatingUpdate> updates);
  // 대기 중인 전달을 모두 끝낸다. 이후의 Publish는 실행되지 않는다.
  void Drain();

 private:
  void Deliver(const OutcomeSummary& summary, const std::vector<PlayerRatingUpdate>& updates);

  std::shared_ptr<MatchRepository> repository_;
  std::shared_ptr<SettlementService> settlement_;
  std::shared_ptr<Observability> observability_;
  boost::asio::thread_pool pool_;
};

}  // namespace arena

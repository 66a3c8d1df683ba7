/*
 * 설명: 결과 요약 직렬화와 저장/정산 협력자 호출(최대 1회, 재시도 없음)을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_coordinator_test.cpp
 */
#include "arena/outcome_publisher.hpp"

#include <exception>

#include <boost/asio/post.hpp>

namespace arena {

nlohmann::json ToJson(const OutcomeSummary& summary) {
  return nlohmann::json{{"matchId", summary.match_id},
                        {"player1", summary.player1},
                        {"player2", summary.player2},
                        {"player1Score", summary.player1_score},
                        {"player2Score", summary.player2_score},
                        {"winner", summary.winner},
                        {"queueClass", std::string(ToString(summary.queue_class))},
                        {"player1RatingChange", summary.player1_rating_change},
                        {"player2RatingChange", summary.player2_rating_change},
                        {"forfeit", summary.forfeit}};
}

OutcomePublisher::OutcomePublisher(std::shared_ptr<MatchRepository> repository,
                                   std::shared_ptr<SettlementService> settlement,
                                   std::shared_ptr<Observability> observability, std::size_t threads)
    : repository_(std::move(repository)), settlement_(std::move(settlement)),
      observability_(std::move(observability)), pool_(threads) {}

OutcomePublisher::~OutcomePublisher() { pool_.join(); }

void OutcomePublisher::Publish(const OutcomeSummary& summary, std::vector<PlayerRatingUpdate> updates) {
  boost::asio::post(pool_, [this, summary, updates = std::move(updates)]() { Deliver(summary, updates); });
}

void OutcomePublisher::Drain() { pool_.join(); }

void OutcomePublisher::Deliver(const OutcomeSummary& summary, const std::vector<PlayerRatingUpdate>& updates) {
  if (repository_) {
    try {
      repository_->PersistOutcome(summary, updates);
      observability_->Debug("outcome_persisted", {{"matchId", summary.match_id}});
    } catch (const std::exception& ex) {
      observability_->IncrementPersistenceFailure();
      observability_->Error("outcome_persist_failed", {{"matchId", summary.match_id}, {"error", ex.what()}});
    }
  }
  if (settlement_) {
    try {
      settlement_->SubmitResult(summary);
    } catch (const std::exception& ex) {
      observability_->IncrementPersistenceFailure();
      observability_->Error("settlement_submit_failed", {{"matchId", summary.match_id}, {"error", ex.what()}});
    }
  }
}

}  // namespace arena

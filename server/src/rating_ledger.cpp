/*
 * 설명: 레이팅 캐시 조회/생성과 랭크 결과 반영을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rating_ledger_test.cpp
 */
#include "arena/rating_ledger.hpp"

#include <exception>
#include <optional>

namespace arena {

RatingLedger::RatingLedger(RatingEngine engine, std::shared_ptr<MatchRepository> repository,
                           std::shared_ptr<Observability> observability)
    : engine_(std::move(engine)), repository_(std::move(repository)), observability_(std::move(observability)) {}

RatingRecord RatingLedger::Resolve(const std::string& identity) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(identity);
    if (it != records_.end()) {
      return it->second;
    }
  }

  std::optional<RatingRecord> loaded;
  if (repository_) {
    try {
      loaded = repository_->LoadRating(identity);
    } catch (const std::exception& ex) {
      observability_->Warn("rating_load_failed", {{"identity", identity}, {"error", ex.what()}});
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  // 조회 중 다른 스레드가 먼저 채웠다면 그 값을 유지한다.
  auto [it, inserted] = records_.try_emplace(
      identity, loaded ? *loaded : RatingRecord{engine_.Config().default_rating, 0});
  return it->second;
}

RatingRecord RatingLedger::Peek(const std::string& identity) {
  std::lock_guard<std::mutex> lock(mutex_);
  return EntryLocked(identity);
}

RankedResult RatingLedger::ApplyRankedResult(const std::string& winner, const std::string& loser) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& winner_record = EntryLocked(winner);
  auto& loser_record = EntryLocked(loser);

  RankedResult result;
  result.winner_before = winner_record;
  result.loser_before = loser_record;
  result.delta = engine_.ComputeDelta(winner_record.rating, loser_record.rating, winner_record.placement_count,
                                      loser_record.placement_count);
  winner_record = engine_.Apply(winner_record, result.delta.winner_change);
  loser_record = engine_.Apply(loser_record, result.delta.loser_change);
  result.winner_after = winner_record;
  result.loser_after = loser_record;
  return result;
}

std::size_t RatingLedger::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

RatingRecord& RatingLedger::EntryLocked(const std::string& identity) {
  auto it = records_.find(identity);
  if (it == records_.end()) {
    it = records_.emplace(identity, RatingRecord{engine_.Config().default_rating, 0}).first;
  }
  return it->second;
}

}  // namespace arena

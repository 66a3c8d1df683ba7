/*
 * 설명: 식별자별 레이팅 레코드의 메모리 캐시를 소유하고 랭크 매치 결과를 원자적으로 반영한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rating_ledger_test.cpp
 */
#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "arena/match_repository.hpp"
#include "arena/observability.hpp"
#include "arena/rating_engine.hpp"

namespace arena {

struct RankedResult {
  RatingDelta delta;
  RatingRecord winner_before;
  RatingRecord loser_before;
  RatingRecord winner_after;
  RatingRecord loser_after;
};

class RatingLedger {
 public:
  RatingLedger(RatingEngine engine, std::shared_ptr<MatchRepository> repository,
               std::shared_ptr<Observability> observability);

  // 캐시 -> 저장소 -> 기본값 순으로 조회한다. 저장소 호출은 락 밖에서 수행한다.
  RatingRecord Resolve(const std::string& identity);
  // I/O 없이 캐시 또는 기본값을 돌려준다(기본값이면 캐시에 생성).
  RatingRecord Peek(const std::string& identity);
  RankedResult ApplyRankedResult(const std::string& winner, const std::string& loser);

  const RatingEngine& Engine() const { return engine_; }
  std::size_t Size() const;

 private:
  RatingRecord& EntryLocked(const std::string& identity);

  RatingEngine engine_;
  std::shared_ptr<MatchRepository> repository_;
  std::shared_ptr<Observability> observability_;
  std::unordered_map<std::string, RatingRecord> records_;
  mutable std::mutex mutex_;
};

}  // namespace arena

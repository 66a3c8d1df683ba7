/*
 * 설명: 레이팅 조회와 매치 결과 저장, 정산 제출을 위한 외부 협력자 인터페이스와 결과 요약 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_coordinator_test.cpp, server/tests/it/mariadb_repository_it_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "arena/match_types.hpp"
#include "arena/rating_engine.hpp"

namespace arena {

// 협력자에게 넘기는 결정적 결과 요약. 시각 등 비결정 값은 담지 않는다.
struct OutcomeSummary {
  std::string match_id;
  std::string player1;
  std::string player2;
  int player1_score{0};
  int player2_score{0};
  std::string winner;
  QueueClass queue_class{QueueClass::kUnranked};
  int player1_rating_change{0};
  int player2_rating_change{0};
  bool forfeit{false};
};

nlohmann::json ToJson(const OutcomeSummary& summary);

struct PlayerRatingUpdate {
  std::string identity;
  RatingRecord record;
  bool won{false};
};

class MatchRepository {
 public:
  virtual ~MatchRepository() = default;

  virtual std::optional<RatingRecord> LoadRating(const std::string& identity) = 0;
  // updates는 랭크 매치에서만 채워진다.
  virtual void PersistOutcome(const OutcomeSummary& summary, const std::vector<PlayerRatingUpdate>& updates) = 0;
};

class SettlementService {
 public:
  virtual ~SettlementService() = default;

  virtual void SubmitResult(const OutcomeSummary& summary) = 0;
};

}  // namespace arena

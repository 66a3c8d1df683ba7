/*
 * 설명: player_ratings/match_history 테이블 기반 MatchRepository 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/sql/schema.sql
 * 테스트: server/tests/it/mariadb_repository_it_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "arena/db_client.hpp"
#include "arena/match_repository.hpp"

namespace arena {

class MariaDbMatchRepository : public MatchRepository {
 public:
  explicit MariaDbMatchRepository(std::shared_ptr<MariaDbClient> db_client);

  std::optional<RatingRecord> LoadRating(const std::string& identity) override;
  // 같은 match_id가 이미 있으면 아무것도 바꾸지 않는다.
  void PersistOutcome(const OutcomeSummary& summary, const std::vector<PlayerRatingUpdate>& updates) override;

  std::optional<OutcomeSummary> FindOutcome(const std::string& match_id) const;
  void Remove(const std::string& match_id, const std::vector<std::string>& identities) const;

 private:
  bool InsertMatchHistory(MYSQL* conn, const OutcomeSummary& summary) const;
  void UpsertRating(MYSQL* conn, const PlayerRatingUpdate& update) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace arena

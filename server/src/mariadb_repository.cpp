/*
 * 설명: 레이팅 조회와 매치 결과/레이팅 저장을 MariaDB에 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/sql/schema.sql
 * 테스트: server/tests/it/mariadb_repository_it_test.cpp
 */
#include "arena/mariadb_repository.hpp"

#include <sstream>

namespace arena {
namespace {
int ToInt(const char* value) { return value ? std::stoi(value) : 0; }
constexpr unsigned int kDuplicateEntry = 1062;
}  // namespace

MariaDbMatchRepository::MariaDbMatchRepository(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

std::optional<RatingRecord> MariaDbMatchRepository::LoadRating(const std::string& identity) {
  std::optional<RatingRecord> result;
  db_client_->WithConnection([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT rating, placement_count FROM player_ratings WHERE identity='" << db_client_->Escape(conn, identity)
        << "';";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "레이팅 조회 실패");
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "레이팅 결과 없음");
    }
    MYSQL_ROW row = mysql_fetch_row(res);
    if (row) {
      result = RatingRecord{ToInt(row[0]), ToInt(row[1])};
    }
    mysql_free_result(res);
  });
  return result;
}

void MariaDbMatchRepository::PersistOutcome(const OutcomeSummary& summary,
                                            const std::vector<PlayerRatingUpdate>& updates) {
  db_client_->ExecuteTransaction([&](MYSQL* conn) {
    if (!InsertMatchHistory(conn, summary)) {
      return false;
    }
    for (const auto& update : updates) {
      UpsertRating(conn, update);
    }
    return true;
  });
}

bool MariaDbMatchRepository::InsertMatchHistory(MYSQL* conn, const OutcomeSummary& summary) const {
  std::ostringstream oss;
  oss << "INSERT INTO match_history(match_id, player1, player2, winner, player1_score, player2_score, queue_class, "
         "player1_rating_change, player2_rating_change, forfeit) VALUES('"
      << db_client_->Escape(conn, summary.match_id) << "', '" << db_client_->Escape(conn, summary.player1) << "', '"
      << db_client_->Escape(conn, summary.player2) << "', '" << db_client_->Escape(conn, summary.winner) << "', "
      << summary.player1_score << ", " << summary.player2_score << ", '" << ToString(summary.queue_class) << "', "
      << summary.player1_rating_change << ", " << summary.player2_rating_change << ", "
      << (summary.forfeit ? 1 : 0) << ");";
  if (mysql_query(conn, oss.str().c_str()) != 0) {
    if (mysql_errno(conn) == kDuplicateEntry) {
      return false;
    }
    db_client_->RaiseError(conn, "매치 기록 저장 실패");
  }
  return true;
}

void MariaDbMatchRepository::UpsertRating(MYSQL* conn, const PlayerRatingUpdate& update) const {
  std::ostringstream oss;
  int wins = update.won ? 1 : 0;
  int losses = update.won ? 0 : 1;
  oss << "INSERT INTO player_ratings(identity, rating, placement_count, wins, losses) VALUES('"
      << db_client_->Escape(conn, update.identity) << "', " << update.record.rating << ", "
      << update.record.placement_count << ", " << wins << ", " << losses
      << ") ON DUPLICATE KEY UPDATE rating=VALUES(rating), placement_count=VALUES(placement_count), wins=wins+"
      << wins << ", losses=losses+" << losses << ";";
  if (mysql_query(conn, oss.str().c_str()) != 0) {
    db_client_->RaiseError(conn, "레이팅 저장 실패");
  }
}

std::optional<OutcomeSummary> MariaDbMatchRepository::FindOutcome(const std::string& match_id) const {
  std::optional<OutcomeSummary> result;
  db_client_->WithConnection([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT match_id, player1, player2, winner, player1_score, player2_score, queue_class, "
           "player1_rating_change, player2_rating_change, forfeit FROM match_history WHERE match_id='"
        << db_client_->Escape(conn, match_id) << "';";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "매치 기록 조회 실패");
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "매치 기록 결과 없음");
    }
    MYSQL_ROW row = mysql_fetch_row(res);
    if (row) {
      OutcomeSummary summary;
      summary.match_id = row[0] ? row[0] : "";
      summary.player1 = row[1] ? row[1] : "";
      summary.player2 = row[2] ? row[2] : "";
      summary.winner = row[3] ? row[3] : "";
      summary.player1_score = ToInt(row[4]);
      summary.player2_score = ToInt(row[5]);
      summary.queue_class = ParseQueueClass(row[6] ? row[6] : "").value_or(QueueClass::kUnranked);
      summary.player1_rating_change = ToInt(row[7]);
      summary.player2_rating_change = ToInt(row[8]);
      summary.forfeit = ToInt(row[9]) != 0;
      result = summary;
    }
    mysql_free_result(res);
  });
  return result;
}

void MariaDbMatchRepository::Remove(const std::string& match_id, const std::vector<std::string>& identities) const {
  db_client_->WithConnection([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "DELETE FROM match_history WHERE match_id='" << db_client_->Escape(conn, match_id) << "';";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "매치 기록 삭제 실패");
    }
    for (const auto& identity : identities) {
      std::ostringstream del;
      del << "DELETE FROM player_ratings WHERE identity='" << db_client_->Escape(conn, identity) << "';";
      if (mysql_query(conn, del.str().c_str()) != 0) {
        db_client_->RaiseError(conn, "레이팅 삭제 실패");
      }
    }
  });
}

}  // namespace arena

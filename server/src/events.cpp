/*
 * 설명: 서버 이벤트 payload를 JSON으로 구성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/arena_service_test.cpp
 */
#include "arena/events.hpp"

namespace arena {

nlohmann::json MakeSearchingPayload(QueueClass queue_class, int rating, std::chrono::milliseconds estimated_wait) {
  return {{"queueClass", std::string(ToString(queue_class))},
          {"rating", rating},
          {"estimatedWaitMs", estimated_wait.count()}};
}

nlohmann::json MakeMatchFoundPayload(const std::string& match_id, Slot slot, QueueClass queue_class,
                                     const PlayerHandle& opponent) {
  return {{"matchId", match_id},
          {"opponent", opponent.identity},
          {"opponentRating", opponent.rating},
          {"slot", static_cast<int>(slot)},
          {"queueClass", std::string(ToString(queue_class))},
          {"opponentCosmetics", ToJson(opponent.cosmetics)}};
}

nlohmann::json MakeMatchEndedPayload(const MatchResult& result, Slot slot) {
  const auto& mine = result.For(slot);
  nlohmann::json payload{{"matchId", result.match_id},
                         {"winner", result.winner},
                         {"player1Score", result.player1_score},
                         {"player2Score", result.player2_score},
                         {"queueClass", std::string(ToString(result.queue_class))},
                         {"ratingChange", mine.rating_change},
                         {"newRating", mine.new_rating}};
  if (result.forfeit) {
    payload["forfeit"] = true;
  }
  return payload;
}

nlohmann::json MakeMatchCancelledPayload(const std::string& match_id, const std::string& reason) {
  return {{"matchId", match_id}, {"reason", reason}};
}

nlohmann::json MakeOpponentDisconnectedPayload(const std::string& match_id) { return {{"matchId", match_id}}; }

nlohmann::json MakePlayerRatingPayload(const std::string& identity, const RatingRecord& record,
                                       const RatingEngine& engine) {
  const auto& tier = TierFor(record.rating);
  return {{"identity", identity},
          {"rating", record.rating},
          {"tier", RankWithDivision(record.rating)},
          {"tierColor", tier.color},
          {"placementCount", record.placement_count},
          {"isPlacement", engine.IsPlacement(record)}};
}

}  // namespace arena

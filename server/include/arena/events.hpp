/*
 * 설명: 서버 -> 클라이언트 이벤트 이름과 payload 구성, 이벤트 전달 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/arena_service_test.cpp
 */
#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "arena/match_coordinator.hpp"
#include "arena/match_types.hpp"
#include "arena/rating_engine.hpp"

namespace arena {

namespace event {
inline constexpr const char* kSearching = "searching";
inline constexpr const char* kQueueLeft = "queue_left";
inline constexpr const char* kQueueTimeout = "queue_timeout";
inline constexpr const char* kMatchFound = "match_found";
inline constexpr const char* kGameStateUpdate = "game_state_update";
inline constexpr const char* kMatchEnded = "match_ended";
inline constexpr const char* kMatchCancelled = "match_cancelled";
inline constexpr const char* kOpponentDisconnected = "opponent_disconnected";
inline constexpr const char* kPlayerRating = "player_rating";
}  // namespace event

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void SendEvent(ConnectionId connection_id, const std::string& event, const nlohmann::json& payload) = 0;
  virtual void SendError(ConnectionId connection_id, const std::string& code, const std::string& message) = 0;
};

nlohmann::json MakeSearchingPayload(QueueClass queue_class, int rating, std::chrono::milliseconds estimated_wait);
nlohmann::json MakeMatchFoundPayload(const std::string& match_id, Slot slot, QueueClass queue_class,
                                     const PlayerHandle& opponent);
nlohmann::json MakeMatchEndedPayload(const MatchResult& result, Slot slot);
nlohmann::json MakeMatchCancelledPayload(const std::string& match_id, const std::string& reason);
nlohmann::json MakeOpponentDisconnectedPayload(const std::string& match_id);
nlohmann::json MakePlayerRatingPayload(const std::string& identity, const RatingRecord& record,
                                       const RatingEngine& engine);

}  // namespace arena

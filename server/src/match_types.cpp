/*
 * 설명: 공유 값 타입의 문자열/JSON 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/client_command_test.cpp
 */
#include "arena/match_types.hpp"

namespace arena {

std::string_view ToString(QueueClass queue_class) {
  return queue_class == QueueClass::kRanked ? "ranked" : "unranked";
}

std::optional<QueueClass> ParseQueueClass(std::string_view text) {
  if (text == "ranked") {
    return QueueClass::kRanked;
  }
  if (text == "unranked") {
    return QueueClass::kUnranked;
  }
  return std::nullopt;
}

nlohmann::json ToJson(const CosmeticLoadout& loadout) {
  if (loadout.Empty()) {
    return nullptr;
  }
  nlohmann::json j = nlohmann::json::object();
  if (loadout.paddle) {
    j["paddle"] = *loadout.paddle;
  }
  if (loadout.ball) {
    j["ball"] = *loadout.ball;
  }
  if (loadout.trail) {
    j["trail"] = *loadout.trail;
  }
  if (loadout.court) {
    j["court"] = *loadout.court;
  }
  return j;
}

}  // namespace arena

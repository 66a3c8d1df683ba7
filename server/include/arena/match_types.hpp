/*
 * 설명: 큐 등급, 연결 식별자, 코스메틱 장착 정보 등 코어 전반에서 공유하는 값 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/client_command_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace arena {

using ConnectionId = std::uint64_t;

enum class QueueClass { kRanked, kUnranked };

enum class Slot { kPlayer1 = 1, kPlayer2 = 2 };

std::string_view ToString(QueueClass queue_class);
std::optional<QueueClass> ParseQueueClass(std::string_view text);

struct CosmeticLoadout {
  std::optional<std::string> paddle;
  std::optional<std::string> ball;
  std::optional<std::string> trail;
  std::optional<std::string> court;

  bool Empty() const { return !paddle && !ball && !trail && !court; }
};

nlohmann::json ToJson(const CosmeticLoadout& loadout);

struct PlayerHandle {
  ConnectionId connection_id{0};
  std::string identity;
  int rating{0};
  CosmeticLoadout cosmetics;
};

}  // namespace arena

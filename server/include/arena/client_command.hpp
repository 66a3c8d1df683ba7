/*
 * 설명: WebSocket 엔벨로프를 검증해 클라이언트 명령(variant)으로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/client_command_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "arena/match_types.hpp"

namespace arena {

struct JoinQueue {
  std::string identity;
  QueueClass queue_class{QueueClass::kUnranked};
  CosmeticLoadout cosmetics;
};

struct LeaveQueue {};

struct UpdatePaddle {
  std::string match_id;
  double paddle_y{0.0};
};

struct CancelMatch {
  std::string match_id;
};

struct GetRating {
  std::string identity;
};

// 전송 계층이 연결 종료 시 합성한다. 와이어에서 파싱되지 않는다.
struct Disconnect {};

using ClientCommand = std::variant<JoinQueue, LeaveQueue, UpdatePaddle, CancelMatch, GetRating, Disconnect>;

bool IsValidIdentity(std::string_view identity);
bool IsValidMatchId(std::string_view match_id);
bool IsValidPaddleY(const nlohmann::json& value);
std::optional<CosmeticLoadout> ParseCosmetics(const nlohmann::json& value);

// 실패 시 nullopt. error_code가 비어 있으면 응답 없이 버려야 하는 입력이다(잘못된 패들 갱신).
std::optional<ClientCommand> ParseClientCommand(const nlohmann::json& envelope, std::string& error_code,
                                                std::string& error_message);

}  // namespace arena

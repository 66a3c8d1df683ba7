/*
 * 설명: 클라이언트 엔벨로프 파싱과 식별자/매치 ID/패들/코스메틱 검증을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/client_command_test.cpp
 */
#include "arena/client_command.hpp"

#include <cctype>
#include <cmath>

namespace arena {
namespace {
constexpr std::size_t kMinIdentityLength = 32;
constexpr std::size_t kMaxIdentityLength = 44;
constexpr std::size_t kMaxCosmeticLength = 50;
constexpr double kMaxPaddleY = 450.0;

bool IsBase58(char c) {
  // 0, O, I, l 제외
  if (c >= '1' && c <= '9') {
    return true;
  }
  if (c >= 'A' && c <= 'Z') {
    return c != 'I' && c != 'O';
  }
  if (c >= 'a' && c <= 'z') {
    return c != 'l';
  }
  return false;
}

bool IsHex(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

const nlohmann::json* FindString(const nlohmann::json& payload, const char* key) {
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string()) {
    return nullptr;
  }
  return &*it;
}

void SetError(std::string& error_code, std::string& error_message, const char* code, const char* message) {
  error_code = code;
  error_message = message;
}
}  // namespace

bool IsValidIdentity(std::string_view identity) {
  if (identity.size() < kMinIdentityLength || identity.size() > kMaxIdentityLength) {
    return false;
  }
  for (char c : identity) {
    if (!IsBase58(c)) {
      return false;
    }
  }
  return true;
}

bool IsValidMatchId(std::string_view match_id) {
  // 8-4-4-4-12, 버전 4, variant 8/9/a/b (대소문자 무시)
  if (match_id.size() != 36) {
    return false;
  }
  for (std::size_t i = 0; i < match_id.size(); ++i) {
    char c = match_id[i];
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (c != '-') {
        return false;
      }
      continue;
    }
    if (!IsHex(c)) {
      return false;
    }
  }
  if (match_id[14] != '4') {
    return false;
  }
  char variant = static_cast<char>(std::tolower(static_cast<unsigned char>(match_id[19])));
  return variant == '8' || variant == '9' || variant == 'a' || variant == 'b';
}

bool IsValidPaddleY(const nlohmann::json& value) {
  if (!value.is_number()) {
    return false;
  }
  double y = value.get<double>();
  return std::isfinite(y) && y >= 0.0 && y <= kMaxPaddleY;
}

std::optional<CosmeticLoadout> ParseCosmetics(const nlohmann::json& value) {
  CosmeticLoadout loadout;
  if (value.is_null()) {
    return loadout;
  }
  if (!value.is_object()) {
    return std::nullopt;
  }
  for (const auto& [key, item] : value.items()) {
    std::optional<std::string>* slot = nullptr;
    if (key == "paddle") {
      slot = &loadout.paddle;
    } else if (key == "ball") {
      slot = &loadout.ball;
    } else if (key == "trail") {
      slot = &loadout.trail;
    } else if (key == "court") {
      slot = &loadout.court;
    } else {
      return std::nullopt;
    }
    // 빈 값은 미장착으로 본다.
    if (item.is_null()) {
      continue;
    }
    if (!item.is_string()) {
      return std::nullopt;
    }
    auto text = item.get<std::string>();
    if (text.size() > kMaxCosmeticLength) {
      return std::nullopt;
    }
    if (!text.empty()) {
      *slot = std::move(text);
    }
  }
  return loadout;
}

std::optional<ClientCommand> ParseClientCommand(const nlohmann::json& envelope, std::string& error_code,
                                                std::string& error_message) {
  if (!envelope.is_object()) {
    SetError(error_code, error_message, "bad_request", "잘못된 메시지 형식");
    return std::nullopt;
  }
  auto type_it = envelope.find("t");
  auto event_it = envelope.find("event");
  if (type_it == envelope.end() || !type_it->is_string() || *type_it != "event" || event_it == envelope.end() ||
      !event_it->is_string()) {
    SetError(error_code, error_message, "bad_request", "알 수 없는 메시지 유형");
    return std::nullopt;
  }
  const auto event = event_it->get<std::string>();
  nlohmann::json payload = nlohmann::json::object();
  auto payload_it = envelope.find("p");
  if (payload_it != envelope.end() && !payload_it->is_null()) {
    if (!payload_it->is_object()) {
      SetError(error_code, error_message, "bad_request", "payload가 객체가 아닙니다");
      return std::nullopt;
    }
    payload = *payload_it;
  }

  if (event == "join_queue") {
    auto identity = FindString(payload, "identity");
    if (!identity || !IsValidIdentity(identity->get_ref<const std::string&>())) {
      SetError(error_code, error_message, "invalid_identity", "식별자 형식이 올바르지 않습니다");
      return std::nullopt;
    }
    auto queue_text = FindString(payload, "queueClass");
    auto queue_class = queue_text ? ParseQueueClass(queue_text->get_ref<const std::string&>()) : std::nullopt;
    if (!queue_class) {
      SetError(error_code, error_message, "invalid_queue_class", "queueClass는 ranked 또는 unranked여야 합니다");
      return std::nullopt;
    }
    auto cosmetics_it = payload.find("cosmetics");
    auto cosmetics = ParseCosmetics(cosmetics_it == payload.end() ? nlohmann::json() : *cosmetics_it);
    if (!cosmetics) {
      SetError(error_code, error_message, "invalid_cosmetics", "코스메틱 정보가 올바르지 않습니다");
      return std::nullopt;
    }
    return JoinQueue{identity->get<std::string>(), *queue_class, *cosmetics};
  }

  if (event == "leave_queue") {
    return LeaveQueue{};
  }

  if (event == "update_paddle") {
    auto match_id = FindString(payload, "matchId");
    auto y_it = payload.find("paddleY");
    if (!match_id || !IsValidMatchId(match_id->get_ref<const std::string&>()) || y_it == payload.end() ||
        !IsValidPaddleY(*y_it)) {
      // 매 프레임 들어오는 입력이므로 응답하지 않는다.
      error_code.clear();
      error_message.clear();
      return std::nullopt;
    }
    return UpdatePaddle{match_id->get<std::string>(), y_it->get<double>()};
  }

  if (event == "cancel_match") {
    auto match_id = FindString(payload, "matchId");
    if (!match_id || !IsValidMatchId(match_id->get_ref<const std::string&>())) {
      SetError(error_code, error_message, "invalid_match_id", "매치 ID 형식이 올바르지 않습니다");
      return std::nullopt;
    }
    return CancelMatch{match_id->get<std::string>()};
  }

  if (event == "get_rating") {
    auto identity = FindString(payload, "identity");
    if (!identity || !IsValidIdentity(identity->get_ref<const std::string&>())) {
      SetError(error_code, error_message, "invalid_identity", "식별자 형식이 올바르지 않습니다");
      return std::nullopt;
    }
    return GetRating{identity->get<std::string>()};
  }

  SetError(error_code, error_message, "bad_request", "알 수 없는 이벤트");
  return std::nullopt;
}

}  // namespace arena

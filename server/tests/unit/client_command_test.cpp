#include <limits>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "arena/client_command.hpp"

namespace {

constexpr const char* kIdentity = "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v";
constexpr const char* kMatchId = "3f2a9c1e-8b4d-4e6f-9a1b-2c3d4e5f6a7b";

nlohmann::json Event(const std::string& name, nlohmann::json payload = nlohmann::json::object()) {
  return {{"t", "event"}, {"seq", 1}, {"event", name}, {"p", payload}};
}

TEST(IdentityValidationTest, AcceptsBase58WithinLength) {
  EXPECT_TRUE(arena::IsValidIdentity(kIdentity));
  EXPECT_TRUE(arena::IsValidIdentity(std::string(32, 'a')));
  EXPECT_FALSE(arena::IsValidIdentity(std::string(31, 'a')));
  EXPECT_FALSE(arena::IsValidIdentity(std::string(45, 'a')));
  // 0, O, I, l은 base58 문자가 아니다.
  EXPECT_FALSE(arena::IsValidIdentity(std::string(31, 'a') + "0"));
  EXPECT_FALSE(arena::IsValidIdentity(std::string(31, 'a') + "O"));
  EXPECT_FALSE(arena::IsValidIdentity(std::string(31, 'a') + "I"));
  EXPECT_FALSE(arena::IsValidIdentity(std::string(31, 'a') + "l"));
}

TEST(MatchIdValidationTest, RequiresVersionFourUuid) {
  EXPECT_TRUE(arena::IsValidMatchId(kMatchId));
  EXPECT_TRUE(arena::IsValidMatchId("3F2A9C1E-8B4D-4E6F-BA1B-2C3D4E5F6A7B"));
  EXPECT_FALSE(arena::IsValidMatchId("3f2a9c1e-8b4d-1e6f-9a1b-2c3d4e5f6a7b"));
  EXPECT_FALSE(arena::IsValidMatchId("3f2a9c1e-8b4d-4e6f-7a1b-2c3d4e5f6a7b"));
  EXPECT_FALSE(arena::IsValidMatchId("3f2a9c1e8b4d4e6f9a1b2c3d4e5f6a7b"));
  EXPECT_FALSE(arena::IsValidMatchId("zf2a9c1e-8b4d-4e6f-9a1b-2c3d4e5f6a7b"));
}

TEST(PaddleValidationTest, AcceptsFiniteValuesInsideCourt) {
  EXPECT_TRUE(arena::IsValidPaddleY(0));
  EXPECT_TRUE(arena::IsValidPaddleY(450.0));
  EXPECT_TRUE(arena::IsValidPaddleY(120.5));
  EXPECT_FALSE(arena::IsValidPaddleY(-0.1));
  EXPECT_FALSE(arena::IsValidPaddleY(450.1));
  EXPECT_FALSE(arena::IsValidPaddleY("100"));
  EXPECT_FALSE(arena::IsValidPaddleY(nlohmann::json()));
}

TEST(CosmeticsParseTest, AcceptsKnownKeysAndSkipsEmptyValues) {
  auto loadout = arena::ParseCosmetics({{"paddle", "neon"}, {"ball", nullptr}, {"trail", ""}});
  ASSERT_TRUE(loadout.has_value());
  EXPECT_EQ(loadout->paddle.value_or(""), "neon");
  EXPECT_FALSE(loadout->ball);
  EXPECT_FALSE(loadout->trail);
  EXPECT_FALSE(loadout->court);

  auto none = arena::ParseCosmetics(nlohmann::json());
  ASSERT_TRUE(none.has_value());
  EXPECT_TRUE(none->Empty());
}

TEST(CosmeticsParseTest, RejectsUnknownKeysAndLongValues) {
  EXPECT_FALSE(arena::ParseCosmetics({{"hat", "crown"}}));
  EXPECT_FALSE(arena::ParseCosmetics({{"court", std::string(51, 'x')}}));
  EXPECT_FALSE(arena::ParseCosmetics({{"ball", 3}}));
  EXPECT_FALSE(arena::ParseCosmetics(nlohmann::json::array()));
}

TEST(ClientCommandParseTest, JoinQueueCarriesIdentityClassAndCosmetics) {
  std::string code;
  std::string message;
  auto command = arena::ParseClientCommand(
      Event("join_queue", {{"identity", kIdentity}, {"queueClass", "ranked"}, {"cosmetics", {{"court", "space"}}}}),
      code, message);
  ASSERT_TRUE(command.has_value());
  const auto* join = std::get_if<arena::JoinQueue>(&*command);
  ASSERT_NE(join, nullptr);
  EXPECT_EQ(join->identity, kIdentity);
  EXPECT_EQ(join->queue_class, arena::QueueClass::kRanked);
  EXPECT_EQ(join->cosmetics.court.value_or(""), "space");
}

TEST(ClientCommandParseTest, JoinQueueErrorsNameTheBadField) {
  std::string code;
  std::string message;
  EXPECT_FALSE(arena::ParseClientCommand(Event("join_queue", {{"identity", "short"}, {"queueClass", "ranked"}}),
                                         code, message));
  EXPECT_EQ(code, "invalid_identity");

  EXPECT_FALSE(arena::ParseClientCommand(Event("join_queue", {{"identity", kIdentity}, {"queueClass", "casual"}}),
                                         code, message));
  EXPECT_EQ(code, "invalid_queue_class");

  EXPECT_FALSE(arena::ParseClientCommand(
      Event("join_queue", {{"identity", kIdentity}, {"queueClass", "unranked"}, {"cosmetics", {{"hat", "x"}}}}), code,
      message));
  EXPECT_EQ(code, "invalid_cosmetics");
  EXPECT_FALSE(message.empty());
}

TEST(ClientCommandParseTest, InvalidPaddleUpdateIsDroppedSilently) {
  std::string code = "stale";
  std::string message = "stale";
  EXPECT_FALSE(arena::ParseClientCommand(Event("update_paddle", {{"matchId", kMatchId}, {"paddleY", 900}}), code,
                                         message));
  EXPECT_TRUE(code.empty());

  auto command =
      arena::ParseClientCommand(Event("update_paddle", {{"matchId", kMatchId}, {"paddleY", 200.5}}), code, message);
  ASSERT_TRUE(command.has_value());
  const auto* paddle = std::get_if<arena::UpdatePaddle>(&*command);
  ASSERT_NE(paddle, nullptr);
  EXPECT_EQ(paddle->match_id, kMatchId);
  EXPECT_DOUBLE_EQ(paddle->paddle_y, 200.5);
}

TEST(ClientCommandParseTest, CancelAndRatingRequests) {
  std::string code;
  std::string message;
  auto cancel = arena::ParseClientCommand(Event("cancel_match", {{"matchId", kMatchId}}), code, message);
  ASSERT_TRUE(cancel.has_value());
  EXPECT_TRUE(std::holds_alternative<arena::CancelMatch>(*cancel));

  EXPECT_FALSE(arena::ParseClientCommand(Event("cancel_match", {{"matchId", "nope"}}), code, message));
  EXPECT_EQ(code, "invalid_match_id");

  auto rating = arena::ParseClientCommand(Event("get_rating", {{"identity", kIdentity}}), code, message);
  ASSERT_TRUE(rating.has_value());
  EXPECT_EQ(std::get<arena::GetRating>(*rating).identity, kIdentity);

  auto leave = arena::ParseClientCommand({{"t", "event"}, {"event", "leave_queue"}}, code, message);
  ASSERT_TRUE(leave.has_value());
  EXPECT_TRUE(std::holds_alternative<arena::LeaveQueue>(*leave));
}

TEST(ClientCommandParseTest, MalformedEnvelopesAreBadRequests) {
  std::string code;
  std::string message;
  EXPECT_FALSE(arena::ParseClientCommand(nlohmann::json::array(), code, message));
  EXPECT_EQ(code, "bad_request");

  code.clear();
  EXPECT_FALSE(arena::ParseClientCommand({{"t", "ping"}, {"event", "join_queue"}}, code, message));
  EXPECT_EQ(code, "bad_request");

  code.clear();
  EXPECT_FALSE(arena::ParseClientCommand({{"t", "event"}, {"event", "join_queue"}, {"p", 5}}, code, message));
  EXPECT_EQ(code, "bad_request");

  code.clear();
  EXPECT_FALSE(arena::ParseClientCommand(Event("disconnect"), code, message));
  EXPECT_EQ(code, "bad_request");
}

}  // namespace

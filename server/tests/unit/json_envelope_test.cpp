#include <gtest/gtest.h>

#include "arena/api_response.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = arena::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env.contains("meta"));
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = arena::MakeErrorEnvelope("bad_request", "에러");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "bad_request");
  EXPECT_EQ(env["error"]["message"], "에러");
  EXPECT_EQ(env["error"].size(), 2u);
}

TEST(JsonEnvelopeTest, EventFrameShape) {
  auto frame = arena::ToWsJson(arena::MakeEventEnvelope("searching", {{"rating", 1000}}));
  EXPECT_EQ(frame["t"], "event");
  EXPECT_EQ(frame["event"], "searching");
  EXPECT_EQ(frame["seq"], 0);
  EXPECT_EQ(frame["p"]["rating"], 1000);
}

TEST(JsonEnvelopeTest, ErrorFrameEchoesSeq) {
  auto frame = arena::ToWsJson(arena::MakeErrorFrame("invalid_identity", "식별자 오류", 7));
  EXPECT_EQ(frame["t"], "error");
  EXPECT_TRUE(frame["event"].is_null());
  EXPECT_EQ(frame["seq"], 7);
  EXPECT_EQ(frame["p"]["code"], "invalid_identity");
  EXPECT_EQ(frame["p"]["message"], "식별자 오류");
}

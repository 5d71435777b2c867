#include <gtest/gtest.h>

#include "arbiter/api_response.hpp"
#include "arbiter/match_types.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"gameId", "abc"}, {"status", "active"}};
  auto env = arbiter::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  ASSERT_TRUE(env["meta"].contains("timestamp"));
  EXPECT_TRUE(arbiter::ParseTimestamp(env["meta"]["timestamp"].get<std::string>()).has_value());
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = arbiter::MakeErrorEnvelope("illegal_state", "에러");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "illegal_state");
  EXPECT_EQ(env["error"]["message"], "에러");
  EXPECT_TRUE(env["error"].contains("detail"));
  EXPECT_TRUE(env["error"]["detail"].is_null());
}

TEST(JsonEnvelopeTest, ErrorDetailIsCarried) {
  auto env = arbiter::MakeErrorEnvelope("invalid_move", "둘 수 없는 수", {{"move", "e5"}, {"suggestion", "e4"}});
  EXPECT_EQ(env["error"]["detail"]["move"], "e5");
  EXPECT_EQ(env["error"]["detail"]["suggestion"], "e4");
}

#include <gtest/gtest.h>

#include "gateway/api_response.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = gateway::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env.contains("meta"));
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = gateway::MakeErrorEnvelope("not_found", "에러");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "not_found");
  EXPECT_EQ(env["error"]["message"], "에러");
  EXPECT_TRUE(env["error"].contains("detail"));
}

TEST(JsonEnvelopeTest, OutboundEventShape) {
  gateway::OutboundEnvelope env{"a", "output", {{"text", "hi"}}};
  auto j = gateway::ToWsJson(env);
  EXPECT_EQ(j, nlohmann::json::parse(R"({"type":"event","chatId":"a","event":"output","payload":{"text":"hi"}})"));
}

TEST(JsonEnvelopeTest, OutboundEventKeepsScalarPayload) {
  gateway::OutboundEnvelope env{"b", "message", 3};
  auto j = gateway::ToWsJson(env);
  EXPECT_EQ(j["payload"], 3);
  EXPECT_EQ(j["chatId"], "b");
}

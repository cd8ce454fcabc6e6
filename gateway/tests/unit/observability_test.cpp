#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "gateway/observability.hpp"

using gateway::LogContext;
using gateway::LogLevel;
using gateway::Observability;

TEST(ObservabilityTest, ParsesLogLevels) {
  EXPECT_EQ(gateway::ParseLogLevel("debug"), LogLevel::kDebug);
  EXPECT_EQ(gateway::ParseLogLevel("info"), LogLevel::kInfo);
  EXPECT_EQ(gateway::ParseLogLevel("warn"), LogLevel::kWarn);
  EXPECT_EQ(gateway::ParseLogLevel("warning"), LogLevel::kWarn);
  EXPECT_EQ(gateway::ParseLogLevel("error"), LogLevel::kError);
  EXPECT_EQ(gateway::ParseLogLevel("verbose"), LogLevel::kInfo);
  EXPECT_STREQ(gateway::LogLevelName(LogLevel::kWarn), "warn");
}

TEST(ObservabilityTest, WritesOneJsonLinePerEnabledEntry) {
  std::ostringstream sink;
  Observability obs(LogLevel::kInfo, sink);
  obs.Log(LogContext{LogLevel::kDebug, "t0", std::nullopt, std::nullopt, "hidden", 0, std::nullopt});
  obs.Log(LogContext{LogLevel::kWarn, "t1", std::string("conn-1"), std::string("chat-9"), "upstream.finished", 12,
                     std::string("eof")});

  std::istringstream lines(sink.str());
  std::string line;
  ASSERT_TRUE(std::getline(lines, line));
  auto entry = nlohmann::json::parse(line);
  EXPECT_EQ(entry["level"], "warn");
  EXPECT_EQ(entry["traceId"], "t1");
  EXPECT_EQ(entry["eventName"], "upstream.finished");
  EXPECT_EQ(entry["connectionId"], "conn-1");
  EXPECT_EQ(entry["chatId"], "chat-9");
  EXPECT_EQ(entry["latencyMs"], 12);
  EXPECT_EQ(entry["detail"], "eof");
  EXPECT_FALSE(std::getline(lines, line));
}

TEST(ObservabilityTest, OmitsAbsentOptionalFields) {
  std::ostringstream sink;
  Observability obs(LogLevel::kDebug, sink);
  obs.Log(LogContext{LogLevel::kDebug, "t2", std::nullopt, std::nullopt, "ws.control", 0, std::nullopt});
  auto entry = nlohmann::json::parse(sink.str());
  EXPECT_FALSE(entry.contains("connectionId"));
  EXPECT_FALSE(entry.contains("chatId"));
  EXPECT_FALSE(entry.contains("detail"));
}

TEST(ObservabilityTest, InvalidUtf8IsReplaced) {
  std::ostringstream sink;
  Observability obs(LogLevel::kInfo, sink);
  obs.Log(LogContext{LogLevel::kInfo, "t3", std::nullopt, std::nullopt, "frame", 0, std::string("bad\xff")});
  EXPECT_NO_THROW(nlohmann::json::parse(sink.str()));
}

TEST(ObservabilityTest, TraceIdsAreUnique) {
  std::ostringstream sink;
  Observability obs(LogLevel::kInfo, sink);
  EXPECT_NE(obs.NextTraceId(), obs.NextTraceId());
}

TEST(ObservabilityTest, MetricsJsonShape) {
  std::ostringstream sink;
  Observability obs(LogLevel::kError, sink);
  obs.IncrementRequest();
  obs.IncrementRequest();
  obs.IncrementError();
  obs.SetWebsocketActive(3);
  obs.PumpStarted();
  obs.PumpStarted();
  obs.PumpStopped();
  obs.AddEnvelopesForwarded(5);
  obs.AddEnvelopesDropped(2);
  obs.AddFramesDropped(1);
  obs.IncrementUpstreamFailure();

  auto metrics = gateway::MetricsToJson(obs.Snapshot());
  EXPECT_EQ(metrics["requests"]["total"], 2);
  EXPECT_EQ(metrics["requests"]["errors"], 1);
  EXPECT_EQ(metrics["connections"]["websocket"], 3);
  EXPECT_EQ(metrics["pumps"]["active"], 1);
  EXPECT_EQ(metrics["pumps"]["upstreamFailures"], 1);
  EXPECT_EQ(metrics["envelopes"]["forwarded"], 5);
  EXPECT_EQ(metrics["envelopes"]["dropped"], 2);
  EXPECT_EQ(metrics["frames"]["dropped"], 1);
}

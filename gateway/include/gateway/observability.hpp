/*
 * 설명: 구조화 로그와 게이트웨이 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace gateway {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

// 알 수 없는 문자열은 info로 취급한다.
LogLevel ParseLogLevel(const std::string& value);
const char* LogLevelName(LogLevel level);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string trace_id;
  std::optional<std::string> connection_id;
  std::optional<std::string> chat_id;
  std::string name;
  long latency_ms{0};
  std::optional<std::string> detail;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t pumps_active{0};
  std::uint64_t envelopes_forwarded{0};
  std::uint64_t envelopes_dropped{0};
  std::uint64_t frames_dropped{0};
  std::uint64_t upstream_failures{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo);
  Observability(LogLevel min_level, std::ostream& out);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void SetWebsocketActive(std::uint64_t count);
  void PumpStarted();
  void PumpStopped();
  void AddEnvelopesForwarded(std::uint64_t count);
  void AddEnvelopesDropped(std::uint64_t count);
  void AddFramesDropped(std::uint64_t count);
  void IncrementUpstreamFailure();
  MetricsSnapshot Snapshot() const;
  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::ostream* out_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> pumps_active_{0};
  std::atomic<std::uint64_t> envelopes_forwarded_{0};
  std::atomic<std::uint64_t> envelopes_dropped_{0};
  std::atomic<std::uint64_t> frames_dropped_{0};
  std::atomic<std::uint64_t> upstream_failures_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

nlohmann::json MetricsToJson(const MetricsSnapshot& snapshot);

}  // namespace gateway

/*
 * 설명: 구조화 로그 출력과 게이트웨이 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/observability_test.cpp
 */
#include "gateway/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace gateway {
namespace {
std::mutex& LogMutex() {
  static std::mutex mutex;
  return mutex;
}
}  // namespace

LogLevel ParseLogLevel(const std::string& value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level) : Observability(min_level, std::cout) {}

Observability::Observability(LogLevel min_level, std::ostream& out) : min_level_(min_level), out_(&out) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

void Observability::PumpStarted() { pumps_active_.fetch_add(1); }

void Observability::PumpStopped() { pumps_active_.fetch_sub(1); }

void Observability::AddEnvelopesForwarded(std::uint64_t count) { envelopes_forwarded_.fetch_add(count); }

void Observability::AddEnvelopesDropped(std::uint64_t count) { envelopes_dropped_.fetch_add(count); }

void Observability::AddFramesDropped(std::uint64_t count) { frames_dropped_.fetch_add(count); }

void Observability::IncrementUpstreamFailure() { upstream_failures_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.pumps_active = pumps_active_.load();
  snapshot.envelopes_forwarded = envelopes_forwarded_.load();
  snapshot.envelopes_dropped = envelopes_dropped_.load();
  snapshot.frames_dropped = frames_dropped_.load();
  snapshot.upstream_failures = upstream_failures_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LogLevelName(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.connection_id) {
    log_json["connectionId"] = *ctx.connection_id;
  }
  if (ctx.chat_id) {
    log_json["chatId"] = *ctx.chat_id;
  }
  if (ctx.detail) {
    log_json["detail"] = *ctx.detail;
  }
  // 잘못된 UTF-8은 대체 문자로 치환한다.
  auto line = log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(LogMutex());
  *out_ << line << std::endl;
}

nlohmann::json MetricsToJson(const MetricsSnapshot& snapshot) {
  return {{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
          {"connections", {{"websocket", snapshot.websocket_active}}},
          {"pumps", {{"active", snapshot.pumps_active}, {"upstreamFailures", snapshot.upstream_failures}}},
          {"envelopes", {{"forwarded", snapshot.envelopes_forwarded}, {"dropped", snapshot.envelopes_dropped}}},
          {"frames", {{"dropped", snapshot.frames_dropped}}}};
}

}  // namespace gateway

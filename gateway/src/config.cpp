/*
 * 설명: 환경변수에서 게이트웨이 설정을 읽고 백엔드 URL을 호스트/포트/경로로 분해한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/config_test.cpp
 */
#include "gateway/config.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace gateway {
namespace {
bool ParseUnsigned(const std::string& value, std::size_t max, std::size_t& out) {
  if (value.empty()) {
    return false;
  }
  try {
    std::size_t idx = 0;
    auto parsed = std::stoull(value, &idx);
    if (idx != value.size() || parsed > max) {
      return false;
    }
    out = static_cast<std::size_t>(parsed);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

std::size_t RequireUnsigned(const char* key, const std::string& value, std::size_t max) {
  std::size_t parsed = 0;
  if (!ParseUnsigned(value, max, parsed)) {
    throw std::invalid_argument(std::string(key) + " 값이 올바르지 않습니다: " + value);
  }
  return parsed;
}
}  // namespace

bool ParseBackendUrl(const std::string& url, BackendEndpoint& out, std::string& error_message) {
  const std::string scheme = "http://";
  if (url.compare(0, scheme.size(), scheme) != 0) {
    error_message = "http:// 스킴만 지원합니다";
    return false;
  }
  auto rest = url.substr(scheme.size());
  auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  std::string path = slash == std::string::npos ? std::string{} : rest.substr(slash);
  if (authority.empty()) {
    error_message = "호스트가 비어 있습니다";
    return false;
  }

  BackendEndpoint endpoint;
  auto colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
    std::size_t port = 0;
    if (!ParseUnsigned(authority.substr(colon + 1), std::numeric_limits<unsigned short>::max(), port) ||
        port == 0) {
      error_message = "포트가 올바르지 않습니다";
      return false;
    }
    endpoint.port = static_cast<unsigned short>(port);
    endpoint.host = authority.substr(0, colon);
  } else {
    endpoint.host = authority;
  }
  if (endpoint.host.size() >= 2 && endpoint.host.front() == '[' && endpoint.host.back() == ']') {
    endpoint.host = endpoint.host.substr(1, endpoint.host.size() - 2);
  }
  if (endpoint.host.empty()) {
    error_message = "호스트가 비어 있습니다";
    return false;
  }

  auto query = path.find_first_of("?#");
  if (query != std::string::npos) {
    path.erase(query);
  }
  while (!path.empty() && path.back() == '/') {
    path.pop_back();
  }
  endpoint.base_path = path;
  out = endpoint;
  return true;
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.host = get_env("WS_HOST", "127.0.0.1");
  cfg.port = static_cast<unsigned short>(
      RequireUnsigned("WS_PORT", get_env("WS_PORT", "8081"), std::numeric_limits<unsigned short>::max()));
  cfg.backend_url = get_env("BACKEND_BASE_URL", "http://127.0.0.1:8080");
  std::string error_message;
  if (!ParseBackendUrl(cfg.backend_url, cfg.backend, error_message)) {
    throw std::invalid_argument("BACKEND_BASE_URL: " + error_message);
  }
  cfg.log_level = get_env("LOG_LEVEL", "info");
  auto max_size = std::numeric_limits<std::size_t>::max();
  cfg.ws_queue_limit_messages =
      RequireUnsigned("WS_QUEUE_LIMIT_MESSAGES", get_env("WS_QUEUE_LIMIT_MESSAGES", "1024"), max_size);
  cfg.ws_queue_limit_bytes =
      RequireUnsigned("WS_QUEUE_LIMIT_BYTES", get_env("WS_QUEUE_LIMIT_BYTES", "4194304"), max_size);
  cfg.upstream_connect_timeout_seconds = RequireUnsigned(
      "UPSTREAM_CONNECT_TIMEOUT_SECONDS", get_env("UPSTREAM_CONNECT_TIMEOUT_SECONDS", "10"), 3600);
  cfg.worker_threads = RequireUnsigned("WORKER_THREADS", get_env("WORKER_THREADS", "0"), 256);
  if (cfg.ws_queue_limit_messages == 0 || cfg.ws_queue_limit_bytes == 0) {
    throw std::invalid_argument("WS_QUEUE_LIMIT_* 값은 0보다 커야 합니다");
  }
  return cfg;
}

}  // namespace gateway

/*
 * 설명: 게이트웨이 환경설정 로딩과 기본값, 백엔드 URL 파싱을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace gateway {

struct BackendEndpoint {
  std::string host;
  unsigned short port{80};
  // 스트림 경로 앞에 붙는 접두사. 비어 있거나 '/'로 시작하고 '/'로 끝나지 않는다.
  std::string base_path;
};

struct AppConfig {
  std::string host;
  unsigned short port;
  std::string backend_url;
  BackendEndpoint backend;
  std::string log_level;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  std::size_t upstream_connect_timeout_seconds;
  std::size_t worker_threads;
};

bool ParseBackendUrl(const std::string& url, BackendEndpoint& out, std::string& error_message);

// 잘못된 값이 있으면 std::invalid_argument를 던진다.
AppConfig LoadConfigFromEnv();

}  // namespace gateway

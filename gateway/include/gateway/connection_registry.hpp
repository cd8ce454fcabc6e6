/*
 * 설명: 살아 있는 WebSocket 연결을 연결 id로 관리하고 서버 종료 시 일괄 종료를 중계한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/connection_registry_test.cpp, gateway/tests/e2e/gateway_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "gateway/observability.hpp"

namespace gateway {

class WebSocketSession;

class ConnectionRegistry : public std::enable_shared_from_this<ConnectionRegistry> {
 public:
  // 16바이트 난수의 16진 문자열.
  std::string NextConnectionId() const;
  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }
  void Register(const std::string& connection_id, const std::shared_ptr<WebSocketSession>& session);
  void Unregister(const std::string& connection_id, const WebSocketSession* session);
  // 등록된 모든 연결에 종료를 요청한다. 각 연결은 자기 스트랜드에서 정리된다.
  void CloseAll();
  std::size_t ActiveConnections() const;

 private:
  struct Entry {
    std::weak_ptr<WebSocketSession> session;
    const WebSocketSession* raw{nullptr};
  };

  std::unordered_map<std::string, Entry> connections_;
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace gateway

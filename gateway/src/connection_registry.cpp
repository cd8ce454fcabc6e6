/*
 * 설명: 연결 등록/해제와 종료 시 일괄 종료 요청.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/connection_registry_test.cpp, gateway/tests/e2e/gateway_flow_test.cpp
 */
#include "gateway/connection_registry.hpp"

#include <iomanip>
#include <sstream>
#include <vector>

#include <openssl/rand.h>

#include "gateway/websocket_session.hpp"

namespace gateway {
namespace {
std::string BytesToHex(const std::vector<unsigned char>& data) {
  std::ostringstream oss;
  for (unsigned char byte : data) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return oss.str();
}
}  // namespace

std::string ConnectionRegistry::NextConnectionId() const {
  std::vector<unsigned char> buffer(16);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1 && observability_) {
    observability_->IncrementError();
    observability_->Log(LogContext{LogLevel::kError, observability_->NextTraceId(), std::nullopt, std::nullopt,
                                   "connection_id.rand_failed", 0, std::nullopt});
  }
  return BytesToHex(buffer);
}

void ConnectionRegistry::Register(const std::string& connection_id, const std::shared_ptr<WebSocketSession>& session) {
  std::lock_guard<std::mutex> lock(mutex_);
  connections_[connection_id] = Entry{session, session.get()};
  if (observability_) {
    observability_->SetWebsocketActive(connections_.size());
  }
}

void ConnectionRegistry::Unregister(const std::string& connection_id, const WebSocketSession* session) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    return;
  }
  if (it->second.raw == session) {
    connections_.erase(it);
    if (observability_) {
      observability_->SetWebsocketActive(connections_.size());
    }
  }
}

void ConnectionRegistry::CloseAll() {
  std::vector<std::shared_ptr<WebSocketSession>> sessions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : connections_) {
      if (auto session = entry.second.session.lock()) {
        sessions.push_back(std::move(session));
      }
    }
  }
  for (const auto& session : sessions) {
    session->Close();
  }
}

std::size_t ConnectionRegistry::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

}  // namespace gateway

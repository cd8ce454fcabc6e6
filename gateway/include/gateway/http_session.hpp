/*
 * 설명: HTTP 연결을 처리하고 헬스/메트릭 엔드포인트와 /ws WebSocket 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/e2e/gateway_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "gateway/api_response.hpp"
#include "gateway/config.hpp"
#include "gateway/connection_registry.hpp"
#include "gateway/observability.hpp"
#include "gateway/upstream_client.hpp"
#include "gateway/websocket_session.hpp"

namespace gateway {

inline constexpr const char* kWebSocketPath = "/ws";
inline constexpr const char* kServerName = "chat-event-gateway";
inline constexpr const char* kGatewayVersion = "v1.0.0";

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config, std::shared_ptr<UpstreamClient> upstream,
              std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void SendResponse(std::shared_ptr<boost::beast::http::response<boost::beast::http::string_body>> res);
  void SendJson(boost::beast::http::status status, const nlohmann::json& body);
  void HandleWebSocket();
  std::string RequestPath() const;

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<UpstreamClient> upstream_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace gateway

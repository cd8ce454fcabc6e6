/*
 * 설명: WebSocket 연결 하나의 수명주기. 제어 메시지를 구독 관리자로 넘기고, 펌프가 만든 엔벨로프를
 *       백프레셔 정책에 따라 클라이언트로 보내며, 연결 종료 시 모든 펌프를 정확히 한 번 정리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/send_queue_test.cpp, gateway/tests/e2e/gateway_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "gateway/api_response.hpp"
#include "gateway/connection_registry.hpp"
#include "gateway/control_message.hpp"
#include "gateway/observability.hpp"
#include "gateway/send_queue.hpp"
#include "gateway/stream_pump.hpp"
#include "gateway/subscription_manager.hpp"
#include "gateway/upstream_client.hpp"

namespace gateway {

class WebSocketSession : public std::enable_shared_from_this<WebSocketSession>, public PumpListener {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, std::string connection_id,
                   std::shared_ptr<UpstreamClient> upstream, std::shared_ptr<ConnectionRegistry> registry,
                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                   std::size_t max_queue_bytes);
  ~WebSocketSession() override;
  void Run();
  // 서버 종료용. 연결 스트랜드에서 정리 후 going_away로 닫는다.
  void Close();

  void OnPumpEnvelope(const std::shared_ptr<StreamPump>& pump, OutboundEnvelope envelope) override;
  void OnPumpFinished(const std::shared_ptr<StreamPump>& pump) override;

  const std::string& ConnectionId() const { return connection_id_; }

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleControlMessage(const ControlMessage& message);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void DoClose();
  void Teardown(const std::string& reason);
  void LogEvent(LogLevel level, const std::string& name, const std::optional<std::string>& chat_id,
                const std::optional<std::string>& detail) const;

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::string connection_id_;
  std::shared_ptr<UpstreamClient> upstream_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
  SubscriptionManager subscriptions_;
  SendQueue send_queue_;
  bool closing_{false};
  bool close_sent_{false};
  bool torn_down_{false};
};

}  // namespace gateway

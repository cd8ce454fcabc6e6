/*
 * 설명: WebSocket 제어 메시지를 읽어 구독을 바꾸고, 펌프 엔벨로프를 순서대로 전송하며 연결 종료를 정리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/send_queue_test.cpp, gateway/tests/e2e/gateway_flow_test.cpp
 */
#include "gateway/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

namespace gateway {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::string connection_id, std::shared_ptr<UpstreamClient> upstream,
                                   std::shared_ptr<ConnectionRegistry> registry,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), connection_id_(std::move(connection_id)), upstream_(std::move(upstream)),
      registry_(std::move(registry)), observability_(std::move(observability)),
      subscriptions_([this](const std::string& chat_id, bool replay) {
        return upstream_->CreatePump(chat_id, replay, weak_from_this());
      }),
      send_queue_(max_queue_messages, max_queue_bytes) {}

WebSocketSession::~WebSocketSession() { Teardown("destroyed"); }

void WebSocketSession::Run() {
  registry_->Register(connection_id_, shared_from_this());
  LogEvent(LogLevel::kInfo, "ws.connected", std::nullopt, std::nullopt);
  DoRead();
}

void WebSocketSession::Close() {
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(), [self]() {
    if (self->closing_) {
      return;
    }
    self->closing_ = true;
    self->Teardown("server_shutdown");
    if (!self->send_queue_.InFlight()) {
      self->DoClose();
    }
  });
}

void WebSocketSession::OnPumpEnvelope(const std::shared_ptr<StreamPump>& pump, OutboundEnvelope envelope) {
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(), [self, pump, envelope = std::move(envelope)]() {
    // 교체되었거나 취소된 펌프의 엔벨로프는 버린다.
    if (self->torn_down_ || !self->subscriptions_.IsActive(*pump)) {
      return;
    }
    self->EnqueueMessage(ToWsJson(envelope).dump());
  });
}

void WebSocketSession::OnPumpFinished(const std::shared_ptr<StreamPump>& pump) {
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(), [self, pump]() {
    if (self->torn_down_) {
      return;
    }
    if (self->subscriptions_.OnPumpFinished(*pump)) {
      self->LogEvent(LogLevel::kDebug, "subscription.ended", pump->ChatId(), std::nullopt);
    }
  });
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    closing_ = true;
    Teardown(ec == boost::beast::websocket::error::closed ? std::string("client_closed") : ec.message());
    return;
  }
  if (closing_) {
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  auto message = ParseControlMessage(data);
  if (message) {
    HandleControlMessage(*message);
  } else {
    LogEvent(LogLevel::kDebug, "control.ignored", std::nullopt, std::nullopt);
  }

  DoRead();
}

void WebSocketSession::HandleControlMessage(const ControlMessage& message) {
  switch (message.type) {
    case ControlType::kSubscribe:
      subscriptions_.Subscribe(message.chat_id, message.replay);
      LogEvent(LogLevel::kDebug, "control.subscribe", message.chat_id, message.replay ? "replay" : "live");
      break;
    case ControlType::kSubscribeMany:
      subscriptions_.SubscribeMany(message.chat_ids, message.replay);
      LogEvent(LogLevel::kDebug, "control.subscribeMany", std::nullopt,
               std::to_string(subscriptions_.ActiveCount()) + " active");
      break;
    case ControlType::kUnsubscribe:
      subscriptions_.Unsubscribe(message.chat_id);
      LogEvent(LogLevel::kDebug, "control.unsubscribe", message.chat_id, std::nullopt);
      break;
  }
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  auto dropped = send_queue_.Push(std::move(message));
  if (dropped > 0 && observability_) {
    observability_->AddEnvelopesDropped(dropped);
    LogEvent(LogLevel::kWarn, "ws.backpressure_drop", std::nullopt, std::to_string(dropped) + " dropped");
  }
  if (!send_queue_.InFlight()) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.Empty() || closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.BeginWrite()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  send_queue_.PopFront();
  if (ec) {
    closing_ = true;
    Teardown("write: " + ec.message());
    return;
  }
  if (observability_) {
    observability_->AddEnvelopesForwarded(1);
  }
  if (closing_) {
    DoClose();
    return;
  }
  WriteNext();
}

void WebSocketSession::DoClose() {
  if (close_sent_) {
    return;
  }
  close_sent_ = true;
  send_queue_.Clear();
  auto self = shared_from_this();
  ws_.async_close(boost::beast::websocket::close_code::going_away, [self](boost::beast::error_code) {});
}

void WebSocketSession::Teardown(const std::string& reason) {
  if (torn_down_) {
    return;
  }
  torn_down_ = true;
  auto cancelled = subscriptions_.UnsubscribeAll();
  registry_->Unregister(connection_id_, this);
  LogEvent(LogLevel::kInfo, "ws.disconnected", std::nullopt,
           reason + ", " + std::to_string(cancelled) + " subscriptions cancelled");
}

void WebSocketSession::LogEvent(LogLevel level, const std::string& name, const std::optional<std::string>& chat_id,
                                const std::optional<std::string>& detail) const {
  if (!observability_ || !observability_->Enabled(level)) {
    return;
  }
  observability_->Log(LogContext{level, observability_->NextTraceId(), connection_id_, chat_id, name, 0, detail});
}

}  // namespace gateway

/*
 * 설명: HTTP 요청을 처리하고 헬스/메트릭 응답과 WS 업그레이드를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/e2e/gateway_flow_test.cpp
 */
#include "gateway/http_session.hpp"

#include <chrono>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace gateway {

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<UpstreamClient> upstream, std::shared_ptr<ConnectionRegistry> registry,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), upstream_(std::move(upstream)), registry_(std::move(registry)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

std::string HttpSession::RequestPath() const {
  std::string target_str = std::string(req_.target());
  auto qpos = target_str.find('?');
  return qpos == std::string::npos ? target_str : target_str.substr(0, qpos);
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  auto path = RequestPath();

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", kGatewayVersion}};
    return SendJson(http::status::ok, MakeSuccessEnvelope(payload));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto data = MetricsToJson(observability_->Snapshot());
    data["connections"]["registered"] = registry_->ActiveConnections();
    return SendJson(http::status::ok, MakeSuccessEnvelope(data));
  }

  if (path == "/api/health" || path == "/metrics") {
    return SendJson(http::status::method_not_allowed,
                    MakeErrorEnvelope("method_not_allowed", "지원되지 않는 메서드입니다"));
  }

  SendJson(http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::SendJson(boost::beast::http::status status, const nlohmann::json& body) {
  auto res = std::make_shared<boost::beast::http::response<boost::beast::http::string_body>>();
  res->version(req_.version());
  res->result(status);
  res->set(boost::beast::http::field::server, kServerName);
  res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
  res->body() = body.dump();
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<boost::beast::http::response<boost::beast::http::string_body>> res) {
  auto self = shared_from_this();
  if (observability_) {
    auto status = static_cast<unsigned>(res->result_int());
    if (status >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    observability_->Log(LogContext{status >= 500 ? LogLevel::kError : LogLevel::kInfo, trace_id_, std::nullopt,
                                   std::nullopt, std::string(req_.target()), latency, std::to_string(status)});
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::HandleWebSocket() {
  if (RequestPath() != kWebSocketPath) {
    return SendJson(boost::beast::http::status::not_found,
                    MakeErrorEnvelope("not_found", "WS 업그레이드는 /ws 경로만 지원합니다"));
  }
  stream_.expires_never();
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  try {
    ws.accept(req_);
    std::make_shared<WebSocketSession>(std::move(ws), registry_->NextConnectionId(), upstream_, registry_,
                                       observability_, config_.ws_queue_limit_messages,
                                       config_.ws_queue_limit_bytes)
        ->Run();
  } catch (const boost::system::system_error& ex) {
    if (observability_) {
      observability_->IncrementError();
      observability_->Log(LogContext{LogLevel::kWarn, trace_id_, std::nullopt, std::nullopt, "ws.accept_failed", 0,
                                     std::string(ex.what())});
    }
    boost::beast::error_code ec;
    ws.next_layer().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  }
}

}  // namespace gateway

/*
 * 설명: 백엔드의 세션별 이벤트 스트림(HTTP GET)을 여는 펌프를 생성하고 본문을 청크 단위로 읽는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/upstream_client_test.cpp, gateway/tests/e2e/gateway_flow_test.cpp
 */
#pragma once

#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "gateway/config.hpp"
#include "gateway/observability.hpp"
#include "gateway/stream_pump.hpp"

namespace gateway {

std::string PercentEncode(const std::string& value);
std::string BuildEventsTarget(const BackendEndpoint& backend, const std::string& chat_id, bool replay);

class HttpStreamPump : public StreamPump {
 public:
  HttpStreamPump(boost::asio::io_context& ioc, const BackendEndpoint& backend, std::chrono::seconds connect_timeout,
                 std::string chat_id, bool replay, std::weak_ptr<PumpListener> listener,
                 std::shared_ptr<Observability> observability);

 protected:
  void DoStart() override;

 private:
  std::shared_ptr<HttpStreamPump> SharedSelf();
  void OnResolve(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results);
  void OnConnect(boost::beast::error_code ec);
  void OnWrite(boost::beast::error_code ec);
  void OnReadHeader(boost::beast::error_code ec);
  void DoReadBody();
  void OnReadBody(boost::beast::error_code ec);
  void Fail(const char* stage, boost::beast::error_code ec);
  void CloseStream();

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::ip::tcp::resolver resolver_;
  boost::asio::steady_timer resolve_timer_;
  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::empty_body> req_;
  std::optional<boost::beast::http::response_parser<boost::beast::http::buffer_body>> parser_;
  std::array<char, 8192> body_buffer_{};
  BackendEndpoint backend_;
  std::chrono::seconds connect_timeout_;
  bool resolved_{false};
};

class UpstreamClient {
 public:
  UpstreamClient(boost::asio::io_context& ioc, BackendEndpoint backend, std::chrono::seconds connect_timeout,
                 std::shared_ptr<Observability> observability);

  std::shared_ptr<StreamPump> CreatePump(const std::string& chat_id, bool replay,
                                         std::weak_ptr<PumpListener> listener);
  const BackendEndpoint& Backend() const { return backend_; }

 private:
  boost::asio::io_context& ioc_;
  BackendEndpoint backend_;
  std::chrono::seconds connect_timeout_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace gateway

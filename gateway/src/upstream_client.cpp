/*
 * 설명: 업스트림 이벤트 스트림 요청(resolve -> connect -> GET -> 헤더 -> 본문 청크 루프)과 취소 처리.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/upstream_client_test.cpp, gateway/tests/e2e/gateway_flow_test.cpp
 */
#include "gateway/upstream_client.hpp"

#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>

#include <boost/asio/post.hpp>
#include <boost/beast/version.hpp>

namespace gateway {

std::string PercentEncode(const std::string& value) {
  std::ostringstream oss;
  for (unsigned char c : value) {
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '.' ||
        c == '_' || c == '~') {
      oss << c;
    } else {
      oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c)
          << std::nouppercase << std::dec;
    }
  }
  return oss.str();
}

std::string BuildEventsTarget(const BackendEndpoint& backend, const std::string& chat_id, bool replay) {
  return backend.base_path + "/api/chats/" + PercentEncode(chat_id) + "/events?replay=" + (replay ? "1" : "0");
}

HttpStreamPump::HttpStreamPump(boost::asio::io_context& ioc, const BackendEndpoint& backend,
                               std::chrono::seconds connect_timeout, std::string chat_id, bool replay,
                               std::weak_ptr<PumpListener> listener, std::shared_ptr<Observability> observability)
    : StreamPump(std::move(chat_id), replay, std::move(listener), std::move(observability)),
      strand_(boost::asio::make_strand(ioc)), resolver_(strand_), resolve_timer_(strand_), stream_(strand_),
      backend_(backend),
      connect_timeout_(connect_timeout) {}

std::shared_ptr<HttpStreamPump> HttpStreamPump::SharedSelf() {
  return std::static_pointer_cast<HttpStreamPump>(shared_from_this());
}

void HttpStreamPump::DoStart() {
  std::weak_ptr<HttpStreamPump> weak = SharedSelf();
  Token().OnCancel([weak]() {
    if (auto self = weak.lock()) {
      boost::asio::post(self->strand_, [self]() { self->CloseStream(); });
    }
  });

  req_.method(boost::beast::http::verb::get);
  req_.target(BuildEventsTarget(backend_, ChatId(), Replay()));
  req_.version(11);
  req_.set(boost::beast::http::field::host,
           backend_.port == 80 ? backend_.host : backend_.host + ":" + std::to_string(backend_.port));
  req_.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  req_.set(boost::beast::http::field::accept, "text/event-stream");
  req_.set(boost::beast::http::field::cache_control, "no-cache");

  auto self = SharedSelf();
  boost::asio::post(strand_, [self]() {
    if (self->IsCancelled()) {
      return;
    }
    self->stream_.expires_after(self->connect_timeout_);
    // tcp_stream 타이머는 resolve를 덮지 않으므로 별도 타이머로 제한한다.
    self->resolve_timer_.expires_after(self->connect_timeout_);
    self->resolve_timer_.async_wait([self](boost::beast::error_code ec) {
      if (ec || self->IsCancelled() || self->State() != PumpState::kRunning || self->resolved_) {
        return;
      }
      self->Fail("resolve", boost::beast::error::timeout);
    });
    self->resolver_.async_resolve(
        self->backend_.host, std::to_string(self->backend_.port),
        [self](boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results) {
          self->OnResolve(ec, std::move(results));
        });
  });
}

void HttpStreamPump::OnResolve(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results) {
  // 시간 초과로 이미 종료된 펌프의 늦은 resolve 결과는 버린다.
  if (IsCancelled() || State() != PumpState::kRunning) {
    return;
  }
  resolved_ = true;
  resolve_timer_.cancel();
  if (ec) {
    return Fail("resolve", ec);
  }
  auto self = SharedSelf();
  stream_.async_connect(results, [self](boost::beast::error_code ec,
                                        const boost::asio::ip::tcp::endpoint& /*endpoint*/) { self->OnConnect(ec); });
}

void HttpStreamPump::OnConnect(boost::beast::error_code ec) {
  if (IsCancelled()) {
    return;
  }
  if (ec) {
    return Fail("connect", ec);
  }
  auto self = SharedSelf();
  boost::beast::http::async_write(stream_, req_, [self](boost::beast::error_code ec, std::size_t /*bytes*/) {
    self->OnWrite(ec);
  });
}

void HttpStreamPump::OnWrite(boost::beast::error_code ec) {
  if (IsCancelled()) {
    return;
  }
  if (ec) {
    return Fail("write", ec);
  }
  parser_.emplace();
  parser_->body_limit(std::numeric_limits<std::uint64_t>::max());
  auto self = SharedSelf();
  boost::beast::http::async_read_header(stream_, buffer_, *parser_,
                                        [self](boost::beast::error_code ec, std::size_t /*bytes*/) {
                                          self->OnReadHeader(ec);
                                        });
}

void HttpStreamPump::OnReadHeader(boost::beast::error_code ec) {
  if (IsCancelled()) {
    return;
  }
  if (ec) {
    return Fail("read_header", ec);
  }
  auto status = parser_->get().result_int();
  if (status < 200 || status >= 300) {
    if (GetObservability()) {
      GetObservability()->IncrementUpstreamFailure();
    }
    CloseStream();
    return Finish(LogLevel::kWarn, "업스트림 응답 상태 " + std::to_string(status));
  }
  // 스트림 자체에는 시간 제한을 두지 않는다.
  stream_.expires_never();
  if (GetObservability() && GetObservability()->Enabled(LogLevel::kDebug)) {
    GetObservability()->Log(LogContext{LogLevel::kDebug, GetObservability()->NextTraceId(), std::nullopt, ChatId(),
                                       "upstream.connected", 0, std::string(req_.target())});
  }
  DoReadBody();
}

void HttpStreamPump::DoReadBody() {
  if (parser_->is_done()) {
    CloseStream();
    return Finish(LogLevel::kInfo, "업스트림 스트림 종료");
  }
  parser_->get().body().data = body_buffer_.data();
  parser_->get().body().size = body_buffer_.size();
  auto self = SharedSelf();
  boost::beast::http::async_read_some(stream_, buffer_, *parser_,
                                      [self](boost::beast::error_code ec, std::size_t /*bytes*/) {
                                        self->OnReadBody(ec);
                                      });
}

void HttpStreamPump::OnReadBody(boost::beast::error_code ec) {
  if (IsCancelled()) {
    return;
  }
  if (ec == boost::beast::http::error::need_buffer) {
    ec = {};
  }
  auto used = body_buffer_.size() - parser_->get().body().size;
  if (used > 0) {
    HandleChunk(std::string_view(body_buffer_.data(), used));
    if (IsCancelled()) {
      return;
    }
  }
  if (ec == boost::beast::http::error::end_of_stream) {
    CloseStream();
    return Finish(LogLevel::kInfo, "업스트림 스트림 종료");
  }
  if (ec) {
    return Fail("read_body", ec);
  }
  DoReadBody();
}

void HttpStreamPump::Fail(const char* stage, boost::beast::error_code ec) {
  if (GetObservability()) {
    GetObservability()->IncrementUpstreamFailure();
  }
  CloseStream();
  Finish(LogLevel::kWarn, std::string(stage) + ": " + ec.message());
}

void HttpStreamPump::CloseStream() {
  resolve_timer_.cancel();
  resolver_.cancel();
  boost::beast::error_code ec;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  stream_.close();
}

UpstreamClient::UpstreamClient(boost::asio::io_context& ioc, BackendEndpoint backend,
                               std::chrono::seconds connect_timeout, std::shared_ptr<Observability> observability)
    : ioc_(ioc), backend_(std::move(backend)), connect_timeout_(connect_timeout),
      observability_(std::move(observability)) {}

std::shared_ptr<StreamPump> UpstreamClient::CreatePump(const std::string& chat_id, bool replay,
                                                       std::weak_ptr<PumpListener> listener) {
  return std::make_shared<HttpStreamPump>(ioc_, backend_, connect_timeout_, chat_id, replay, std::move(listener),
                                          observability_);
}

}  // namespace gateway

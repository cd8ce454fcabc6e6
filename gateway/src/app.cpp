/*
 * 설명: 게이트웨이 수명주기와 리스닝, 워커 스레드, 종료 시그널 처리를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/e2e/gateway_flow_test.cpp
 */
#include "gateway/app.hpp"

#include <algorithm>
#include <csignal>
#include <string>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "gateway/http_session.hpp"

namespace gateway {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<UpstreamClient> upstream, std::shared_ptr<ConnectionRegistry> registry,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), upstream_(std::move(upstream)),
        registry_(std::move(registry)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

  unsigned short LocalPort() const {
    boost::beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->upstream_, self->registry_,
                                          self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<UpstreamClient> upstream_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_, SIGINT, SIGTERM) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  registry_ = std::make_shared<ConnectionRegistry>();
  registry_->SetObservability(observability_);
  upstream_ = std::make_shared<UpstreamClient>(
      ioc_, config.backend, std::chrono::seconds(config.upstream_connect_timeout_seconds), observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::make_address(config_.host), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, upstream_, registry_, observability_);
    bound_port_ = listener_->LocalPort();
    listener_->Run();
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      observability_->Log(LogContext{LogLevel::kInfo, observability_->NextTraceId(), std::nullopt, std::nullopt,
                                     "gateway.signal", 0, std::to_string(signal_number)});
      Shutdown();
    });
    observability_->Log(LogContext{LogLevel::kInfo, observability_->NextTraceId(), std::nullopt, std::nullopt,
                                   "gateway.started", 0,
                                   "ws://" + config_.host + ":" + std::to_string(bound_port_.load()) +
                                       kWebSocketPath + " -> " + config_.backend_url});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->Log(LogContext{LogLevel::kError, observability_->NextTraceId(), std::nullopt, std::nullopt,
                                   "gateway.failed", 0, std::string(ex.what())});
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count =
      config_.worker_threads > 0 ? static_cast<unsigned int>(config_.worker_threads)
                                 : std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Shutdown() {
  boost::asio::post(ioc_, [this]() {
    if (listener_) {
      listener_->Stop();
    }
    boost::system::error_code ignored;
    signals_.cancel(ignored);
    registry_->CloseAll();
    work_guard_.reset();
  });
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

}  // namespace gateway

/*
 * 설명: 게이트웨이 전체 수명주기(리스너, 워커 스레드, 시그널 기반 종료)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/e2e/gateway_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "gateway/config.hpp"
#include "gateway/connection_registry.hpp"
#include "gateway/observability.hpp"
#include "gateway/upstream_client.hpp"

namespace gateway {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  // 리스너를 열고 io_context가 멈출 때까지 블로킹한다.
  void Run();
  // 수락을 멈추고 모든 연결을 닫은 뒤 남은 작업이 끝나면 Run()이 반환되게 한다. 스레드 안전.
  void Shutdown();
  // 즉시 멈추고 워커를 join한다. io_context 스레드에서 호출하면 안 된다.
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<ConnectionRegistry> GetRegistry() { return registry_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }
  // 리스너가 바인딩된 실제 포트. 리스닝 전이면 0.
  unsigned short Port() const { return bound_port_.load(); }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<UpstreamClient> upstream_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  std::atomic<unsigned short> bound_port_{0};
};

}  // namespace gateway

/*
 * 설명: 펌프 하나에 붙는 일회성 취소 신호.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/cancellation_test.cpp
 */
#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <vector>

namespace gateway {

class CancellationToken {
 public:
  using Handler = std::function<void()>;

  CancellationToken() = default;
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  // 첫 호출만 true를 반환하고 등록된 핸들러를 한 번씩 실행한다.
  bool Cancel();
  bool IsCancelled() const { return cancelled_.load(std::memory_order_acquire); }
  // 이미 취소된 경우 핸들러를 즉시 실행한다.
  void OnCancel(Handler handler);

 private:
  std::atomic<bool> cancelled_{false};
  std::mutex mutex_;
  std::vector<Handler> handlers_;
};

}  // namespace gateway

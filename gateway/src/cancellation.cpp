/*
 * 설명: 일회성 취소 신호와 취소 핸들러 실행.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/cancellation_test.cpp
 */
#include "gateway/cancellation.hpp"

namespace gateway {

bool CancellationToken::Cancel() {
  std::vector<Handler> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.load(std::memory_order_relaxed)) {
      return false;
    }
    cancelled_.store(true, std::memory_order_release);
    handlers.swap(handlers_);
  }
  // 핸들러는 락 밖에서 실행한다.
  for (auto& handler : handlers) {
    handler();
  }
  return true;
}

void CancellationToken::OnCancel(Handler handler) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancelled_.load(std::memory_order_relaxed)) {
      handlers_.push_back(std::move(handler));
      return;
    }
  }
  handler();
}

}  // namespace gateway

/*
 * 설명: 아웃바운드 큐의 적재, drop-oldest 축출, 전송 시작/완료 처리.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/send_queue_test.cpp
 */
#include "gateway/send_queue.hpp"

namespace gateway {

SendQueue::SendQueue(std::size_t max_messages, std::size_t max_bytes)
    : max_messages_(max_messages), max_bytes_(max_bytes) {}

std::size_t SendQueue::Push(std::string message) {
  pending_bytes_ += message.size();
  messages_.push_back(std::move(message));

  std::size_t dropped = 0;
  const std::size_t first_pending = in_flight_ ? 1 : 0;
  while ((PendingCount() > max_messages_ || pending_bytes_ > max_bytes_) && PendingCount() > 1) {
    auto victim = messages_.begin() + static_cast<std::ptrdiff_t>(first_pending);
    pending_bytes_ -= victim->size();
    messages_.erase(victim);
    ++dropped;
  }
  return dropped;
}

const std::string& SendQueue::BeginWrite() {
  if (!in_flight_) {
    in_flight_ = true;
    pending_bytes_ -= messages_.front().size();
  }
  return messages_.front();
}

void SendQueue::PopFront() {
  if (messages_.empty()) {
    return;
  }
  if (!in_flight_) {
    pending_bytes_ -= messages_.front().size();
  }
  messages_.pop_front();
  in_flight_ = false;
}

void SendQueue::Clear() {
  messages_.clear();
  pending_bytes_ = 0;
  in_flight_ = false;
}

}  // namespace gateway

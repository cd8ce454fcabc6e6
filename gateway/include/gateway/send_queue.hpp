/*
 * 설명: WebSocket 연결의 아웃바운드 메시지 큐. 메시지 수/바이트 상한을 넘으면 가장 오래된 대기 메시지부터 버린다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/send_queue_test.cpp
 */
#pragma once

#include <cstddef>
#include <deque>
#include <string>

namespace gateway {

// 상한은 아직 쓰기를 시작하지 않은 대기 메시지에만 적용된다.
// 전송 중인 메시지와 방금 넣은 메시지는 버리지 않는다.
class SendQueue {
 public:
  SendQueue(std::size_t max_messages, std::size_t max_bytes);

  // 버린 메시지 수를 반환한다.
  std::size_t Push(std::string message);
  // 맨 앞 메시지를 전송 중으로 표시한다. 비어 있지 않을 때만 호출한다.
  const std::string& BeginWrite();
  // 전송 중인 맨 앞 메시지를 제거한다.
  void PopFront();
  void Clear();

  bool Empty() const { return messages_.empty(); }
  bool InFlight() const { return in_flight_; }
  std::size_t Size() const { return messages_.size(); }
  std::size_t PendingCount() const { return messages_.size() - (in_flight_ ? 1 : 0); }
  std::size_t PendingBytes() const { return pending_bytes_; }
  const std::string& Front() const { return messages_.front(); }

 private:
  std::deque<std::string> messages_;
  std::size_t pending_bytes_{0};
  bool in_flight_{false};
  std::size_t max_messages_;
  std::size_t max_bytes_;
};

}  // namespace gateway

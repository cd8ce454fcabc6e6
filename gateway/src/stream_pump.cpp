/*
 * 설명: 펌프 상태 전이, 청크 파싱, 엔벨로프 전달과 종료 통지.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/stream_pump_test.cpp
 */
#include "gateway/stream_pump.hpp"

namespace gateway {

StreamPump::StreamPump(std::string chat_id, bool replay, std::weak_ptr<PumpListener> listener,
                       std::shared_ptr<Observability> observability)
    : chat_id_(std::move(chat_id)), replay_(replay), listener_(std::move(listener)),
      observability_(std::move(observability)) {}

void StreamPump::Start() {
  auto expected = PumpState::kIdle;
  if (!state_.compare_exchange_strong(expected, PumpState::kRunning)) {
    return;
  }
  if (observability_) {
    observability_->PumpStarted();
  }
  DoStart();
}

void StreamPump::Cancel() {
  if (!LeaveRunning(PumpState::kCancelled)) {
    auto expected = PumpState::kIdle;
    state_.compare_exchange_strong(expected, PumpState::kCancelled);
  }
  token_.Cancel();
}

bool StreamPump::LeaveRunning(PumpState next) {
  auto expected = PumpState::kRunning;
  if (!state_.compare_exchange_strong(expected, next)) {
    return false;
  }
  if (observability_) {
    observability_->PumpStopped();
  }
  return true;
}

void StreamPump::HandleChunk(std::string_view chunk) {
  if (IsCancelled()) {
    return;
  }
  auto dropped_before = parser_.DroppedFrames();
  auto frames = parser_.Feed(chunk);
  if (observability_ && parser_.DroppedFrames() != dropped_before) {
    observability_->AddFramesDropped(parser_.DroppedFrames() - dropped_before);
  }
  for (auto& frame : frames) {
    if (IsCancelled()) {
      return;
    }
    auto listener = listener_.lock();
    if (!listener) {
      Cancel();
      return;
    }
    listener->OnPumpEnvelope(shared_from_this(),
                             OutboundEnvelope{chat_id_, std::move(frame.event), std::move(frame.payload)});
  }
}

void StreamPump::Finish(LogLevel level, const std::string& reason) {
  if (!LeaveRunning(PumpState::kFinished)) {
    return;
  }
  if (observability_) {
    observability_->Log(LogContext{level, observability_->NextTraceId(), std::nullopt, chat_id_,
                                   "upstream.finished", 0, reason});
  }
  if (auto listener = listener_.lock()) {
    listener->OnPumpFinished(shared_from_this());
  }
}

}  // namespace gateway

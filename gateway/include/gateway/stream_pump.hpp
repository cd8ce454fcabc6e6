/*
 * 설명: (연결, chatId) 하나에 대한 업스트림 스트림 수명주기와 프레임 전달을 관리하는 펌프 기반 클래스.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/stream_pump_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <string_view>

#include "gateway/api_response.hpp"
#include "gateway/cancellation.hpp"
#include "gateway/frame_parser.hpp"
#include "gateway/observability.hpp"

namespace gateway {

class StreamPump;

// 펌프를 소유한 연결 쪽 수신자. 두 콜백 모두 펌프의 실행 컨텍스트에서 호출된다.
class PumpListener {
 public:
  virtual ~PumpListener() = default;
  virtual void OnPumpEnvelope(const std::shared_ptr<StreamPump>& pump, OutboundEnvelope envelope) = 0;
  virtual void OnPumpFinished(const std::shared_ptr<StreamPump>& pump) = 0;
};

enum class PumpState { kIdle, kRunning, kFinished, kCancelled };

class StreamPump : public std::enable_shared_from_this<StreamPump> {
 public:
  StreamPump(std::string chat_id, bool replay, std::weak_ptr<PumpListener> listener,
             std::shared_ptr<Observability> observability);
  virtual ~StreamPump() = default;

  StreamPump(const StreamPump&) = delete;
  StreamPump& operator=(const StreamPump&) = delete;

  void Start();
  // 취소 신호를 보낸다. 이후에는 어떤 엔벨로프도 내보내지 않는다.
  void Cancel();

  const std::string& ChatId() const { return chat_id_; }
  bool Replay() const { return replay_; }
  bool IsCancelled() const { return token_.IsCancelled(); }
  PumpState State() const { return state_.load(); }

 protected:
  virtual void DoStart() = 0;

  CancellationToken& Token() { return token_; }
  // 업스트림에서 받은 청크 하나를 파서에 넣고 완성된 프레임을 순서대로 내보낸다.
  void HandleChunk(std::string_view chunk);
  // 업스트림 종료나 오류. 취소된 펌프는 통지하지 않는다.
  void Finish(LogLevel level, const std::string& reason);
  const std::shared_ptr<Observability>& GetObservability() const { return observability_; }

 private:
  bool LeaveRunning(PumpState next);

  std::string chat_id_;
  bool replay_;
  std::weak_ptr<PumpListener> listener_;
  std::shared_ptr<Observability> observability_;
  CancellationToken token_;
  FrameParser parser_;
  std::atomic<PumpState> state_{PumpState::kIdle};
};

}  // namespace gateway

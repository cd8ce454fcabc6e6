#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "gateway/stream_pump.hpp"

namespace gateway_test {

// 업스트림 없이 청크와 종료를 직접 주입하는 펌프. 시작/취소를 공유 로그에 "start:id", "cancel:id"로 남긴다.
class FakePump : public gateway::StreamPump {
 public:
  FakePump(std::string chat_id, bool replay, std::weak_ptr<gateway::PumpListener> listener,
           std::shared_ptr<std::vector<std::string>> log = nullptr,
           std::shared_ptr<gateway::Observability> observability = nullptr)
      : StreamPump(std::move(chat_id), replay, std::move(listener), std::move(observability)), log_(std::move(log)) {
    Token().OnCancel([this]() {
      ++cancel_signals;
      if (log_) {
        log_->push_back("cancel:" + ChatId());
      }
    });
  }

  void Deliver(std::string_view chunk) { HandleChunk(chunk); }
  void End() { Finish(gateway::LogLevel::kInfo, "eof"); }

  int start_calls{0};
  int cancel_signals{0};

 protected:
  void DoStart() override {
    ++start_calls;
    if (log_) {
      log_->push_back("start:" + ChatId());
    }
  }

 private:
  std::shared_ptr<std::vector<std::string>> log_;
};

class RecordingListener : public gateway::PumpListener {
 public:
  void OnPumpEnvelope(const std::shared_ptr<gateway::StreamPump>& /*pump*/,
                      gateway::OutboundEnvelope envelope) override {
    envelopes.push_back(std::move(envelope));
  }
  void OnPumpFinished(const std::shared_ptr<gateway::StreamPump>& pump) override { finished.push_back(pump); }

  std::vector<gateway::OutboundEnvelope> envelopes;
  std::vector<std::shared_ptr<gateway::StreamPump>> finished;
};

}  // namespace gateway_test

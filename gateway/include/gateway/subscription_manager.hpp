/*
 * 설명: 연결 하나의 구독 테이블(chatId -> 펌프)을 관리하고 제어 메시지에 따라 펌프를 시작/중지한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/subscription_manager_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "gateway/stream_pump.hpp"

namespace gateway {

using PumpFactory = std::function<std::shared_ptr<StreamPump>(const std::string& chat_id, bool replay)>;

// 스레드 안전하지 않다. 모든 호출은 소유 연결의 스트랜드에서 이루어져야 한다.
// 교체되거나 제거되는 펌프는 테이블 항목이 바뀌기 전에 항상 먼저 취소된다.
class SubscriptionManager {
 public:
  explicit SubscriptionManager(PumpFactory factory);
  ~SubscriptionManager();

  SubscriptionManager(const SubscriptionManager&) = delete;
  SubscriptionManager& operator=(const SubscriptionManager&) = delete;

  // 이미 구독 중이어도 기존 펌프를 취소하고 새로 시작한다.
  void Subscribe(const std::string& chat_id, bool replay);
  // 목록에 없는 구독은 취소하고 새 id만 시작한다. 겹치는 id의 펌프는 건드리지 않는다.
  void SubscribeMany(const std::vector<std::string>& chat_ids, bool replay);
  bool Unsubscribe(const std::string& chat_id);
  std::size_t UnsubscribeAll();

  // 테이블 항목이 아직 이 펌프일 때만 제거한다.
  bool OnPumpFinished(const StreamPump& pump);
  bool IsActive(const StreamPump& pump) const;
  std::vector<std::string> ActiveChatIds() const;
  std::size_t ActiveCount() const { return pumps_.size(); }

 private:
  void StartPump(const std::string& chat_id, bool replay);

  PumpFactory factory_;
  std::unordered_map<std::string, std::shared_ptr<StreamPump>> pumps_;
};

}  // namespace gateway

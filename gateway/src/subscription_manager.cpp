/*
 * 설명: 단일/일괄 구독, 구독 해제, 전체 해제와 펌프 종료 반영.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/subscription_manager_test.cpp
 */
#include "gateway/subscription_manager.hpp"

#include <unordered_set>

namespace gateway {

SubscriptionManager::SubscriptionManager(PumpFactory factory) : factory_(std::move(factory)) {}

SubscriptionManager::~SubscriptionManager() { UnsubscribeAll(); }

void SubscriptionManager::Subscribe(const std::string& chat_id, bool replay) {
  if (chat_id.empty()) {
    return;
  }
  auto it = pumps_.find(chat_id);
  if (it != pumps_.end()) {
    it->second->Cancel();
    pumps_.erase(it);
  }
  StartPump(chat_id, replay);
}

void SubscriptionManager::SubscribeMany(const std::vector<std::string>& chat_ids, bool replay) {
  std::unordered_set<std::string> next;
  for (const auto& id : chat_ids) {
    if (!id.empty()) {
      next.insert(id);
    }
  }

  for (auto it = pumps_.begin(); it != pumps_.end();) {
    if (next.count(it->first) == 0) {
      it->second->Cancel();
      it = pumps_.erase(it);
    } else {
      ++it;
    }
  }

  // 요청 순서대로 시작한다.
  for (const auto& id : chat_ids) {
    if (id.empty() || pumps_.count(id) > 0) {
      continue;
    }
    StartPump(id, replay);
  }
}

bool SubscriptionManager::Unsubscribe(const std::string& chat_id) {
  auto it = pumps_.find(chat_id);
  if (it == pumps_.end()) {
    return false;
  }
  it->second->Cancel();
  pumps_.erase(it);
  return true;
}

std::size_t SubscriptionManager::UnsubscribeAll() {
  auto count = pumps_.size();
  for (auto& entry : pumps_) {
    entry.second->Cancel();
  }
  pumps_.clear();
  return count;
}

bool SubscriptionManager::OnPumpFinished(const StreamPump& pump) {
  auto it = pumps_.find(pump.ChatId());
  if (it == pumps_.end() || it->second.get() != &pump) {
    return false;
  }
  pumps_.erase(it);
  return true;
}

bool SubscriptionManager::IsActive(const StreamPump& pump) const {
  auto it = pumps_.find(pump.ChatId());
  return it != pumps_.end() && it->second.get() == &pump && !pump.IsCancelled();
}

std::vector<std::string> SubscriptionManager::ActiveChatIds() const {
  std::vector<std::string> ids;
  ids.reserve(pumps_.size());
  for (const auto& entry : pumps_) {
    ids.push_back(entry.first);
  }
  return ids;
}

void SubscriptionManager::StartPump(const std::string& chat_id, bool replay) {
  auto pump = factory_(chat_id, replay);
  if (!pump) {
    return;
  }
  pumps_[chat_id] = pump;
  pump->Start();
}

}  // namespace gateway

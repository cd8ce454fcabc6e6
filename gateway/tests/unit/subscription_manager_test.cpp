#include <algorithm>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <gtest/gtest.h>

#include "fake_pump.hpp"
#include "gateway/subscription_manager.hpp"

using gateway_test::FakePump;
using gateway_test::RecordingListener;

namespace {

class SubscriptionManagerFixture : public ::testing::Test {
 protected:
  SubscriptionManagerFixture()
      : log_(std::make_shared<std::vector<std::string>>()), listener_(std::make_shared<RecordingListener>()),
        manager_([this](const std::string& chat_id, bool replay) {
          auto pump = std::make_shared<FakePump>(chat_id, replay, listener_, log_);
          created_.push_back(pump);
          return pump;
        }) {}

  std::vector<std::shared_ptr<FakePump>> CreatedFor(const std::string& chat_id) const {
    std::vector<std::shared_ptr<FakePump>> out;
    for (const auto& pump : created_) {
      if (pump->ChatId() == chat_id) {
        out.push_back(pump);
      }
    }
    return out;
  }

  std::size_t CountLog(const std::string& entry) const {
    return static_cast<std::size_t>(std::count(log_->begin(), log_->end(), entry));
  }

  std::vector<std::string> SortedActiveIds() const {
    auto ids = manager_.ActiveChatIds();
    std::sort(ids.begin(), ids.end());
    return ids;
  }

  std::shared_ptr<std::vector<std::string>> log_;
  std::shared_ptr<RecordingListener> listener_;
  std::vector<std::shared_ptr<FakePump>> created_;
  gateway::SubscriptionManager manager_;
};

}  // namespace

TEST_F(SubscriptionManagerFixture, SubscribeStartsPumpWithReplayFlag) {
  manager_.Subscribe("a", true);
  ASSERT_EQ(created_.size(), 1u);
  EXPECT_TRUE(created_[0]->Replay());
  EXPECT_EQ(created_[0]->start_calls, 1);
  EXPECT_EQ(manager_.ActiveCount(), 1u);
  EXPECT_TRUE(manager_.IsActive(*created_[0]));
}

TEST_F(SubscriptionManagerFixture, ResubscribeCancelsOldPumpBeforeStartingNew) {
  manager_.Subscribe("a", true);
  manager_.Subscribe("a", true);

  auto pumps = CreatedFor("a");
  ASSERT_EQ(pumps.size(), 2u);
  EXPECT_EQ(pumps[0]->cancel_signals, 1);
  EXPECT_EQ(pumps[1]->cancel_signals, 0);
  EXPECT_EQ(*log_, (std::vector<std::string>{"start:a", "cancel:a", "start:a"}));
  EXPECT_EQ(manager_.ActiveCount(), 1u);
  EXPECT_FALSE(manager_.IsActive(*pumps[0]));
  EXPECT_TRUE(manager_.IsActive(*pumps[1]));
}

TEST_F(SubscriptionManagerFixture, SubscribeManyLeavesOverlappingIdsUntouched) {
  manager_.SubscribeMany({"a", "b"}, false);
  ASSERT_EQ(created_.size(), 2u);
  auto original_b = CreatedFor("b").at(0);

  manager_.SubscribeMany({"b", "c"}, false);

  EXPECT_EQ(CountLog("cancel:a"), 1u);
  EXPECT_EQ(CountLog("cancel:b"), 0u);
  EXPECT_EQ(CountLog("start:b"), 1u);
  EXPECT_EQ(CountLog("start:c"), 1u);
  EXPECT_EQ(CreatedFor("b").size(), 1u);
  EXPECT_TRUE(manager_.IsActive(*original_b));
  EXPECT_EQ(SortedActiveIds(), (std::vector<std::string>{"b", "c"}));
}

TEST_F(SubscriptionManagerFixture, SubscribeManyIsIdempotent) {
  manager_.SubscribeMany({"a", "b"}, true);
  manager_.SubscribeMany({"b", "a"}, false);
  EXPECT_EQ(created_.size(), 2u);
  EXPECT_EQ(CountLog("cancel:a") + CountLog("cancel:b"), 0u);
}

TEST_F(SubscriptionManagerFixture, SubscribeManyCollapsesDuplicatesAndEmptyIds) {
  manager_.SubscribeMany({"a", "", "a", "b"}, false);
  EXPECT_EQ(created_.size(), 2u);
  EXPECT_EQ(SortedActiveIds(), (std::vector<std::string>{"a", "b"}));
}

TEST_F(SubscriptionManagerFixture, SubscribeManyEmptySetCancelsEverything) {
  manager_.SubscribeMany({"a", "b", "c"}, false);
  manager_.SubscribeMany({}, false);
  EXPECT_EQ(manager_.ActiveCount(), 0u);
  for (const auto& pump : created_) {
    EXPECT_EQ(pump->cancel_signals, 1);
  }
}

TEST_F(SubscriptionManagerFixture, SubscribeAfterSubscribeManyRestartsOnlyThatId) {
  manager_.SubscribeMany({"a", "b"}, false);
  manager_.Subscribe("b", true);
  EXPECT_EQ(CountLog("cancel:b"), 1u);
  EXPECT_EQ(CountLog("cancel:a"), 0u);
  auto b_pumps = CreatedFor("b");
  ASSERT_EQ(b_pumps.size(), 2u);
  EXPECT_TRUE(b_pumps[1]->Replay());
}

TEST_F(SubscriptionManagerFixture, UnsubscribeCancelsSinglePump) {
  manager_.SubscribeMany({"a", "b"}, false);
  EXPECT_TRUE(manager_.Unsubscribe("a"));
  EXPECT_FALSE(manager_.Unsubscribe("a"));
  EXPECT_EQ(CountLog("cancel:a"), 1u);
  EXPECT_EQ(SortedActiveIds(), (std::vector<std::string>{"b"}));
}

TEST_F(SubscriptionManagerFixture, UnsubscribeAllCancelsEveryPump) {
  manager_.SubscribeMany({"a", "b", "c"}, false);
  manager_.Subscribe("d", true);
  EXPECT_EQ(manager_.UnsubscribeAll(), 4u);
  EXPECT_EQ(manager_.ActiveCount(), 0u);
  std::size_t cancels = 0;
  for (const auto& entry : *log_) {
    if (entry.rfind("cancel:", 0) == 0) {
      ++cancels;
    }
  }
  EXPECT_EQ(cancels, 4u);
  EXPECT_EQ(manager_.UnsubscribeAll(), 0u);
}

TEST_F(SubscriptionManagerFixture, FinishedPumpIsRemovedOnlyIfStillRegistered) {
  manager_.Subscribe("a", true);
  auto old_pump = created_.at(0);
  manager_.Subscribe("a", true);
  auto new_pump = created_.at(1);

  EXPECT_FALSE(manager_.OnPumpFinished(*old_pump));
  EXPECT_EQ(manager_.ActiveCount(), 1u);
  EXPECT_TRUE(manager_.IsActive(*new_pump));

  EXPECT_TRUE(manager_.OnPumpFinished(*new_pump));
  EXPECT_EQ(manager_.ActiveCount(), 0u);
  EXPECT_EQ(new_pump->cancel_signals, 0);
}

TEST_F(SubscriptionManagerFixture, FinishedPumpCanBeResubscribed) {
  manager_.SubscribeMany({"a"}, false);
  auto first = created_.at(0);
  first->End();
  ASSERT_EQ(listener_->finished.size(), 1u);
  EXPECT_TRUE(manager_.OnPumpFinished(*listener_->finished[0]));

  manager_.SubscribeMany({"a"}, false);
  EXPECT_EQ(created_.size(), 2u);
  EXPECT_EQ(first->cancel_signals, 0);
}

TEST(SubscriptionManagerTest, DestructionCancelsRemainingPumps) {
  auto listener = std::make_shared<RecordingListener>();
  std::vector<std::shared_ptr<FakePump>> created;
  {
    gateway::SubscriptionManager manager([&](const std::string& chat_id, bool replay) {
      auto pump = std::make_shared<FakePump>(chat_id, replay, listener);
      created.push_back(pump);
      return pump;
    });
    manager.SubscribeMany({"a", "b"}, false);
  }
  ASSERT_EQ(created.size(), 2u);
  EXPECT_EQ(created[0]->cancel_signals, 1);
  EXPECT_EQ(created[1]->cancel_signals, 1);
}

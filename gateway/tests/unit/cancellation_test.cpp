#include <atomic>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "gateway/cancellation.hpp"

TEST(CancellationTokenTest, HandlersRunOnceOnFirstCancel) {
  gateway::CancellationToken token;
  int calls = 0;
  token.OnCancel([&calls]() { ++calls; });
  token.OnCancel([&calls]() { ++calls; });
  EXPECT_FALSE(token.IsCancelled());
  EXPECT_TRUE(token.Cancel());
  EXPECT_TRUE(token.IsCancelled());
  EXPECT_EQ(calls, 2);
  EXPECT_FALSE(token.Cancel());
  EXPECT_EQ(calls, 2);
}

TEST(CancellationTokenTest, LateHandlerRunsImmediately) {
  gateway::CancellationToken token;
  token.Cancel();
  bool called = false;
  token.OnCancel([&called]() { called = true; });
  EXPECT_TRUE(called);
}

TEST(CancellationTokenTest, ConcurrentCancelRunsHandlerOnce) {
  gateway::CancellationToken token;
  std::atomic<int> calls{0};
  std::atomic<int> winners{0};
  token.OnCancel([&calls]() { calls.fetch_add(1); });
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&]() {
      if (token.Cancel()) {
        winners.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(calls.load(), 1);
  EXPECT_EQ(winners.load(), 1);
}

// Repository: Montage-preview
// Component: Event Loop Tests
// Purpose: Verify ordering, delayed execution and cancellation of EventLoop.
// Copyright (c) 2025 Montage

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

#include "montage/runtime/EventLoop.h"

namespace montage::runtime::testing {
namespace {

using namespace std::chrono_literals;

// Blocks until `count` tasks have reported in, or the timeout expires.
class Latch {
 public:
  explicit Latch(int count) : remaining_(count) {}

  void CountDown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (--remaining_ <= 0) cv_.notify_all();
  }

  bool Wait(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return remaining_ <= 0; });
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  int remaining_;
};

TEST(EventLoopTest, PostedTasksRunInOrderOnLoopThread) {
  EventLoop loop;
  Latch latch(3);
  std::mutex mutex;
  std::vector<int> order;
  std::atomic<bool> on_loop_thread{true};

  for (int i = 0; i < 3; ++i) {
    loop.Post([&, i]() {
      if (!loop.IsLoopThread()) on_loop_thread = false;
      {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(i);
      }
      latch.CountDown();
    });
  }

  ASSERT_TRUE(latch.Wait(2s));
  EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
  EXPECT_TRUE(on_loop_thread.load());
  EXPECT_FALSE(loop.IsLoopThread());
}

TEST(EventLoopTest, DelayedTaskWaitsForItsDelay) {
  EventLoop loop;
  Latch latch(1);
  const auto posted = std::chrono::steady_clock::now();
  std::chrono::steady_clock::time_point ran;

  const auto id = loop.PostDelayed(50, [&]() {
    ran = std::chrono::steady_clock::now();
    latch.CountDown();
  });
  EXPECT_NE(id, IExecutor::kInvalidTimer);

  ASSERT_TRUE(latch.Wait(2s));
  EXPECT_GE(ran - posted, 50ms);
}

TEST(EventLoopTest, DelayedTasksFireInDeadlineOrder) {
  EventLoop loop;
  Latch latch(2);
  std::mutex mutex;
  std::vector<int> order;

  loop.PostDelayed(60, [&]() {
    std::lock_guard<std::mutex> lock(mutex);
    order.push_back(2);
    latch.CountDown();
  });
  loop.PostDelayed(20, [&]() {
    std::lock_guard<std::mutex> lock(mutex);
    order.push_back(1);
    latch.CountDown();
  });

  ASSERT_TRUE(latch.Wait(2s));
  EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(EventLoopTest, FarDeadlineDoesNotFireEarly) {
  EventLoop loop;
  std::atomic<bool> fired{false};

  const auto far = loop.PostDelayed(10000000000000, [&]() { fired = true; });
  const auto saturated = loop.PostDelayed(INT64_MAX, [&]() { fired = true; });

  // A near timer still runs while the far ones stay queued.
  Latch latch(1);
  loop.PostDelayed(20, [&]() { latch.CountDown(); });
  ASSERT_TRUE(latch.Wait(2s));
  std::this_thread::sleep_for(100ms);

  EXPECT_FALSE(fired.load());
  EXPECT_EQ(loop.PendingTimerCount(), 2u);
  EXPECT_TRUE(loop.Cancel(far));
  EXPECT_TRUE(loop.Cancel(saturated));
}

TEST(EventLoopTest, CancelledTaskNeverRuns) {
  EventLoop loop;
  std::atomic<bool> ran{false};

  const auto id = loop.PostDelayed(30, [&]() { ran = true; });
  EXPECT_TRUE(loop.Cancel(id));
  EXPECT_FALSE(loop.Cancel(id));
  EXPECT_EQ(loop.PendingTimerCount(), 0u);

  std::this_thread::sleep_for(80ms);
  EXPECT_FALSE(ran.load());
}

TEST(EventLoopTest, CancelAfterFireReturnsFalse) {
  EventLoop loop;
  Latch latch(1);
  const auto id = loop.PostDelayed(0, [&]() { latch.CountDown(); });

  ASSERT_TRUE(latch.Wait(2s));
  EXPECT_FALSE(loop.Cancel(id));
}

TEST(EventLoopTest, CancelFromLoopThreadStopsSibling) {
  EventLoop loop;
  Latch latch(1);
  std::atomic<bool> sibling_ran{false};

  const auto sibling = loop.PostDelayed(40, [&]() { sibling_ran = true; });
  loop.Post([&]() {
    loop.Cancel(sibling);
    latch.CountDown();
  });

  ASSERT_TRUE(latch.Wait(2s));
  std::this_thread::sleep_for(80ms);
  EXPECT_FALSE(sibling_ran.load());
}

TEST(EventLoopTest, ShutdownDiscardsPendingWorkAndIsIdempotent) {
  std::atomic<bool> ran{false};
  EventLoop loop;
  loop.PostDelayed(1000, [&]() { ran = true; });

  loop.Shutdown();
  loop.Shutdown();
  loop.Post([&]() { ran = true; });

  EXPECT_EQ(loop.PendingTimerCount(), 0u);
  EXPECT_FALSE(ran.load());
}

}  // namespace
}  // namespace montage::runtime::testing

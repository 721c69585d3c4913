// Repository: Montage-preview
// Component: Event Loop
// Purpose: Threaded IExecutor used as the owner context in production.
// Copyright (c) 2025 Montage

#ifndef MONTAGE_RUNTIME_EVENT_LOOP_H_
#define MONTAGE_RUNTIME_EVENT_LOOP_H_

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>

#include "montage/runtime/IExecutor.h"

namespace montage::runtime {

// EventLoop runs posted tasks on one worker thread.
//
// Lifecycle:
// 1. Construct (worker thread starts immediately)
// 2. Post / PostDelayed from any thread
// 3. Shutdown() or destructor: pending tasks and timers are discarded, the
//    worker is joined.  Shutdown() must not be called from the loop thread.
class EventLoop : public IExecutor {
 public:
  EventLoop();
  ~EventLoop() override;

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  void Post(Task task) override;
  TimerId PostDelayed(int64_t delay_ms, Task task) override;
  bool Cancel(TimerId id) override;

  // Idempotent.
  void Shutdown();

  bool IsLoopThread() const;

  // Number of timers still waiting to fire.
  std::size_t PendingTimerCount() const;

 private:
  using Clock = std::chrono::steady_clock;

  struct Timer {
    Clock::time_point deadline;
    Task task;
  };

  void WorkerLoop();

  // Caller holds mutex_.  Returns timers_.end() if none are pending.
  std::map<TimerId, Timer>::iterator EarliestTimerLocked();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Task> tasks_;
  std::map<TimerId, Timer> timers_;
  TimerId next_timer_id_ = 1;
  bool shutdown_ = false;
  std::thread worker_thread_;
};

}  // namespace montage::runtime

#endif  // MONTAGE_RUNTIME_EVENT_LOOP_H_

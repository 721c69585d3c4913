// Manual owner executor for scheduler contract tests.
// Virtual clock; nothing runs until the test drains or advances it.

#ifndef MONTAGE_TESTS_FIXTURES_MANUAL_EXECUTOR_H_
#define MONTAGE_TESTS_FIXTURES_MANUAL_EXECUTOR_H_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <utility>

#include "montage/runtime/IExecutor.h"

namespace montage::tests::fixtures {

// Post() may be called from any thread (stub players, merge completions).
// Tasks and timers run only inside RunPending() / AdvanceMs() on the calling
// thread, so the test thread plays the role of the owner context.
class ManualExecutor : public montage::runtime::IExecutor {
 public:
  void Post(Task task) override {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(std::move(task));
  }

  TimerId PostDelayed(int64_t delay_ms, Task task) override {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimerId id = next_timer_id_++;
    if (delay_ms < 0) delay_ms = 0;
    timers_.emplace(id, Timer{now_ms_ + delay_ms, std::move(task)});
    return id;
  }

  bool Cancel(TimerId id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool erased = timers_.erase(id) > 0;
    if (erased) ++cancelled_count_;
    return erased;
  }

  // Runs posted tasks (including ones they post) until the queue is empty.
  // Returns the number of tasks run.
  std::size_t RunPending() {
    std::size_t ran = 0;
    while (true) {
      Task task;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tasks_.empty()) return ran;
        task = std::move(tasks_.front());
        tasks_.pop_front();
      }
      if (task) task();
      ++ran;
    }
  }

  // Moves the virtual clock forward, firing due timers in deadline order and
  // draining posted tasks after each one.
  void AdvanceMs(int64_t delta_ms) {
    RunPending();
    int64_t target;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      target = now_ms_ + delta_ms;
    }
    while (true) {
      Task task;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        auto due = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
          if (it->second.deadline_ms > target) continue;
          if (due == timers_.end() || it->second.deadline_ms < due->second.deadline_ms) {
            due = it;
          }
        }
        if (due == timers_.end()) {
          now_ms_ = target;
          break;
        }
        now_ms_ = due->second.deadline_ms;
        task = std::move(due->second.task);
        timers_.erase(due);
        ++fired_count_;
      }
      if (task) task();
      RunPending();
    }
    RunPending();
  }

  int64_t NowMs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_ms_;
  }

  std::size_t PendingTimerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
  }

  std::size_t PendingTaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
  }

  // Deadline of the earliest pending timer, -1 if none.
  int64_t NextDeadlineMs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t next = -1;
    for (const auto& entry : timers_) {
      if (next < 0 || entry.second.deadline_ms < next) next = entry.second.deadline_ms;
    }
    return next;
  }

  int fired_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fired_count_;
  }
  int cancelled_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_count_;
  }

 private:
  struct Timer {
    int64_t deadline_ms;
    Task task;
  };

  mutable std::mutex mutex_;
  std::deque<Task> tasks_;
  std::map<TimerId, Timer> timers_;
  TimerId next_timer_id_ = 1;
  int64_t now_ms_ = 0;
  int fired_count_ = 0;
  int cancelled_count_ = 0;
};

}  // namespace montage::tests::fixtures

#endif  // MONTAGE_TESTS_FIXTURES_MANUAL_EXECUTOR_H_

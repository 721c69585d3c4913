// Repository: Montage-preview
// Component: Event Loop
// Purpose: Implementation of EventLoop.
// Copyright (c) 2025 Montage

#include "montage/runtime/EventLoop.h"

#include <algorithm>
#include <utility>

#include "montage/util/Logger.hpp"

namespace montage::runtime {

using montage::util::Logger;

namespace {

// Upper bound on a single condition-variable wait.  Far deadlines are reached
// in slices so the wait never converts a saturated time_point.
constexpr std::chrono::hours kMaxWaitSlice{1};

}  // namespace

EventLoop::EventLoop() {
  worker_thread_ = std::thread(&EventLoop::WorkerLoop, this);
}

EventLoop::~EventLoop() {
  Shutdown();
}

void EventLoop::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_ && !worker_thread_.joinable()) return;
    shutdown_ = true;
    tasks_.clear();
    timers_.clear();
  }
  cv_.notify_all();
  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }
}

void EventLoop::Post(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
      Logger::Debug("[EventLoop] Post after shutdown dropped");
      return;
    }
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
}

IExecutor::TimerId EventLoop::PostDelayed(int64_t delay_ms, Task task) {
  TimerId id = kInvalidTimer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_timer_id_++;
    if (shutdown_) {
      Logger::Debug("[EventLoop] PostDelayed after shutdown dropped");
      return id;
    }
    if (delay_ms < 0) delay_ms = 0;
    const auto now = Clock::now();
    const auto headroom =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    const auto deadline = delay_ms >= headroom.count()
                              ? Clock::time_point::max()
                              : now + std::chrono::milliseconds(delay_ms);
    timers_.emplace(id, Timer{deadline, std::move(task)});
  }
  cv_.notify_one();
  return id;
}

bool EventLoop::Cancel(TimerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return timers_.erase(id) > 0;
}

bool EventLoop::IsLoopThread() const {
  return std::this_thread::get_id() == worker_thread_.get_id();
}

std::size_t EventLoop::PendingTimerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return timers_.size();
}

std::map<IExecutor::TimerId, EventLoop::Timer>::iterator
EventLoop::EarliestTimerLocked() {
  auto earliest = timers_.end();
  for (auto it = timers_.begin(); it != timers_.end(); ++it) {
    if (earliest == timers_.end() || it->second.deadline < earliest->second.deadline) {
      earliest = it;
    }
  }
  return earliest;
}

void EventLoop::WorkerLoop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      while (true) {
        if (shutdown_) return;

        if (!tasks_.empty()) {
          task = std::move(tasks_.front());
          tasks_.pop_front();
          break;
        }

        auto due = EarliestTimerLocked();
        if (due == timers_.end()) {
          cv_.wait(lock);
          continue;
        }

        const auto now = Clock::now();
        if (due->second.deadline <= now) {
          // Erased under the lock: from here on Cancel(id) returns false.
          task = std::move(due->second.task);
          timers_.erase(due);
          break;
        }

        const Clock::duration remaining = due->second.deadline - now;
        cv_.wait_for(lock, std::min<Clock::duration>(remaining, kMaxWaitSlice));
      }
    }

    if (task) task();
  }
}

}  // namespace montage::runtime

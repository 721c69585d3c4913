// Repository: Montage-preview
// Component: Executor Interface
// Purpose: Owner context that runs every scheduler transition, with one-shot
//          cancellable deferred tasks.
// Copyright (c) 2025 Montage

#ifndef MONTAGE_RUNTIME_IEXECUTOR_H_
#define MONTAGE_RUNTIME_IEXECUTOR_H_

#include <cstdint>
#include <functional>

namespace montage::runtime {

// IExecutor is the single logical thread that owns the scheduler, the pool
// bookkeeping and every delegate callback.  Work produced on other threads
// (player end-of-item, merge completion) is re-posted here.
//
// Tasks run one at a time, in posting order; delayed tasks run no earlier than
// their delay.  Cancel() and the firing of a delayed task are serialized:
// either Cancel() returns true and the task never runs, or the task has been
// dequeued (it ran or is running) and Cancel() returns false.
class IExecutor {
 public:
  using Task = std::function<void()>;
  using TimerId = uint64_t;

  static constexpr TimerId kInvalidTimer = 0;

  virtual ~IExecutor() = default;

  virtual void Post(Task task) = 0;

  // Returns a handle for Cancel().  Never returns kInvalidTimer.
  virtual TimerId PostDelayed(int64_t delay_ms, Task task) = 0;

  // Returns true if the task was still pending and will not run.
  // Unknown, fired and already-cancelled ids return false.
  virtual bool Cancel(TimerId id) = 0;
};

}  // namespace montage::runtime

#endif  // MONTAGE_RUNTIME_IEXECUTOR_H_

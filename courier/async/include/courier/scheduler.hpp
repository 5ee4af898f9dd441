#pragma once

#include <coroutine>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "courier/cancelled-error.hpp"
#include "courier/task.hpp"

namespace courier::async {

class Scheduler;
class TaskHandle;

using CallbackId = uint64_t;
using DoneCallback = std::function<void(const TaskHandle&)>;

namespace detail {

// Book-keeping of a spawned task. Shared between the Scheduler, the TaskHandles pointing to it and the objects the
// task is currently waiting on.
struct TaskState : std::enable_shared_from_this<TaskState> {
  TaskState(Scheduler& scheduler, Task<void> task) : scheduler(&scheduler), task(std::move(task)) {}

  // Null once the owning scheduler is closed.
  Scheduler* scheduler;
  Task<void> task;
  // Innermost coroutine to resume on the next step, set when the task suspends on a leaf awaitable.
  std::coroutine_handle<> resumePoint;
  // Unregisters the task from the object it waits on, if any.
  std::function<void()> detach;
  std::exception_ptr exception;
  std::vector<std::pair<CallbackId, DoneCallback>> callbacks;
  CallbackId nextCallbackId{1};
  bool started{false};
  bool done{false};
  bool cancelled{false};
  bool cancelPending{false};
  bool wakeQueued{false};
};

// Returns the task currently being stepped by its scheduler.
// Throws std::logic_error when called outside of a spawned task.
[[nodiscard]] std::shared_ptr<TaskState> CurrentTask();

// To be called from await_suspend of leaf awaitables.
// Returns false if a cancellation is already pending, in which case the awaitable must not suspend.
[[nodiscard]] bool PrepareSuspend(TaskState& task, std::coroutine_handle<> handle) noexcept;

// To be called from await_resume of leaf awaitables. Throws CancelledError once if cancellation was requested.
void ConsumeCancellation(TaskState& task);

}  // namespace detail

// Reference to a spawned task. Cheap to copy, all copies observe the same task.
class TaskHandle {
 public:
  TaskHandle() noexcept = default;

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_state); }

  [[nodiscard]] bool done() const noexcept;

  // True if the task completed because of a cancellation.
  [[nodiscard]] bool cancelled() const noexcept;

  // Requests cancellation. CancelledError will be thrown inside the task at its next suspension point.
  // A task that did not start yet completes as cancelled without running its body.
  // Returns false if the task is already done.
  bool cancel();

  // Exception that terminated the task, if any (nullptr for a successful or cancelled task).
  [[nodiscard]] std::exception_ptr exception() const noexcept;

  // Registers a callback to be invoked synchronously, in registration order, when the task completes.
  // If the task is already done, the callback is invoked immediately and 0 is returned.
  CallbackId addDoneCallback(DoneCallback callback);

  // Returns true if the callback was still registered.
  bool removeDoneCallback(CallbackId id) noexcept;

  // Waits for the task and rethrows its outcome (CancelledError if it was cancelled).
  Task<void> wait() const;

  // Waits for the task to reach a terminal state, whatever it is.
  Task<void> join() const;

  bool operator==(const TaskHandle&) const noexcept = default;

 private:
  friend class Scheduler;

  explicit TaskHandle(std::shared_ptr<detail::TaskState> state) noexcept : _state(std::move(state)) {}

  static Task<void> Wait(std::shared_ptr<detail::TaskState> state, bool rethrow);

  std::shared_ptr<detail::TaskState> _state;
};

// Single threaded cooperative scheduler.
// Tasks are resumed in FIFO order from a ready queue, there is no I/O multiplexing: tasks waiting on external
// events are resumed when the event source (a Future, a ContentStream...) is fed.
class Scheduler {
 public:
  enum class StartMode : uint8_t { Deferred, Eager };

  Scheduler() = default;

  Scheduler(const Scheduler&) = delete;
  Scheduler(Scheduler&&) noexcept = delete;
  Scheduler& operator=(const Scheduler&) = delete;
  Scheduler& operator=(Scheduler&&) noexcept = delete;

  ~Scheduler();

  // Registers a new task. In Deferred mode its first step is queued, in Eager mode it runs synchronously until its
  // first suspension point.
  // Throws std::logic_error if the scheduler is closed.
  TaskHandle spawn(Task<void> task, StartMode mode = StartMode::Deferred);

  void callSoon(std::function<void()> callback);

  // Runs one queued callback. Returns false if the ready queue was empty.
  bool runOnce();

  // Runs until the ready queue is empty.
  void runUntilIdle();

  // Drives 'task' to completion and returns its result.
  // Throws std::logic_error if the scheduler becomes idle while the task is still pending.
  template <class T>
  T runUntilComplete(Task<T> task);

  // Destroys all pending tasks, detaches them from this scheduler and refuses new ones.
  void close();

  [[nodiscard]] bool closed() const noexcept { return *_closed; }

  // Shared view of closed(), still readable after the scheduler is destroyed.
  [[nodiscard]] std::shared_ptr<const bool> closedFlag() const noexcept { return _closed; }

  [[nodiscard]] std::size_t nbPendingTasks() const noexcept { return _live.size(); }

  // Queues the next step of 'state'. Used by leaf awaitables when the awaited event happens.
  void wake(const std::shared_ptr<detail::TaskState>& state);

 private:
  friend class TaskHandle;

  template <class T>
  static Task<void> StoreResult(Task<T> task, std::optional<T>& out) {
    out.emplace(co_await std::move(task));
  }

  void step(const std::shared_ptr<detail::TaskState>& state);
  void finish(const std::shared_ptr<detail::TaskState>& state, std::exception_ptr ex);
  void driveUntilDone(const TaskHandle& handle);

  std::deque<std::function<void()>> _ready;
  std::vector<std::shared_ptr<detail::TaskState>> _live;
  std::shared_ptr<bool> _closed{std::make_shared<bool>(false)};
};

template <class T>
T Scheduler::runUntilComplete(Task<T> task) {
  if constexpr (std::is_void_v<T>) {
    TaskHandle handle = spawn(std::move(task));
    driveUntilDone(handle);
  } else {
    std::optional<T> result;
    TaskHandle handle = spawn(StoreResult(std::move(task), result));
    driveUntilDone(handle);
    return std::move(*result);
  }
}

// Reschedules the current task behind the callbacks already queued.
class Yield {
 public:
  [[nodiscard]] bool await_ready() const noexcept { return false; }

  bool await_suspend(std::coroutine_handle<> handle);

  void await_resume() const;

 private:
  std::shared_ptr<detail::TaskState> _task;
};

}  // namespace courier::async

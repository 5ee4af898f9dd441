#pragma once

#include <utility>

#include "courier/scheduler.hpp"

namespace courier::async {

// Owner slot of a spawned task that empties itself as soon as the task completes.
// The slot registers a completion observer on the task it holds. Assigning a new task, or destroying the slot,
// removes that observer. Assigning an already completed task leaves the slot empty.
class TaskSlot {
 public:
  TaskSlot() noexcept = default;

  explicit TaskSlot(TaskHandle handle) { assign(std::move(handle)); }

  // The observer captures the slot address.
  TaskSlot(const TaskSlot&) = delete;
  TaskSlot(TaskSlot&&) noexcept = delete;
  TaskSlot& operator=(const TaskSlot&) = delete;
  TaskSlot& operator=(TaskSlot&&) noexcept = delete;

  ~TaskSlot() { reset(); }

  void assign(TaskHandle handle);

  // Forgets the current task without cancelling it.
  void reset() noexcept;

  [[nodiscard]] bool empty() const noexcept { return !_handle.valid(); }

  explicit operator bool() const noexcept { return _handle.valid(); }

  // Invalid handle if the slot is empty.
  [[nodiscard]] const TaskHandle& handle() const noexcept { return _handle; }

 private:
  TaskHandle _handle;
  CallbackId _observer{};
};

}  // namespace courier::async

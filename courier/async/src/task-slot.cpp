#include "courier/task-slot.hpp"

#include <utility>

#include "courier/scheduler.hpp"

namespace courier::async {

void TaskSlot::assign(TaskHandle handle) {
  reset();
  if (!handle.valid() || handle.done()) {
    return;
  }
  _handle = std::move(handle);
  _observer = _handle.addDoneCallback([this](const TaskHandle&) {
    _handle = TaskHandle{};
    _observer = 0;
  });
}

void TaskSlot::reset() noexcept {
  if (_handle.valid()) {
    _handle.removeDoneCallback(_observer);
    _handle = TaskHandle{};
    _observer = 0;
  }
}

}  // namespace courier::async

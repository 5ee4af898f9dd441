#include "courier/scheduler.hpp"

#include <algorithm>
#include <coroutine>
#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>

#include "courier/cancelled-error.hpp"
#include "courier/future.hpp"
#include "courier/task.hpp"

namespace courier::async {

namespace {
thread_local detail::TaskState* tCurrentTask = nullptr;
}  // namespace

bool IsCancellation(const std::exception_ptr& ex) noexcept {
  if (!ex) {
    return false;
  }
  try {
    std::rethrow_exception(ex);
  } catch (const CancelledError&) {
    return true;
  } catch (...) {
    return false;
  }
}

namespace detail {

std::shared_ptr<TaskState> CurrentTask() {
  if (tCurrentTask == nullptr) {
    throw std::logic_error("Suspension point reached outside of a scheduled task");
  }
  return tCurrentTask->shared_from_this();
}

bool PrepareSuspend(TaskState& task, std::coroutine_handle<> handle) noexcept {
  if (task.cancelPending) {
    return false;
  }
  task.resumePoint = handle;
  return true;
}

void ConsumeCancellation(TaskState& task) {
  if (task.cancelPending) {
    task.cancelPending = false;
    throw CancelledError();
  }
}

bool WaiterList::suspend(const std::shared_ptr<TaskState>& task, std::coroutine_handle<> handle) {
  if (!PrepareSuspend(*task, handle)) {
    return false;
  }
  auto it = _waiters.insert(_waiters.end(), task);
  task->detach = [weakSelf = weak_from_this(), it] {
    if (auto self = weakSelf.lock()) {
      self->_waiters.erase(it);
    }
  };
  return true;
}

void WaiterList::wakeAll() {
  auto waiters = std::move(_waiters);
  _waiters.clear();
  for (const auto& weakTask : waiters) {
    if (auto task = weakTask.lock()) {
      task->detach = nullptr;
      if (task->scheduler != nullptr) {
        task->scheduler->wake(task);
      }
    }
  }
}

}  // namespace detail

bool TaskHandle::done() const noexcept { return _state && _state->done; }

bool TaskHandle::cancelled() const noexcept { return _state && _state->cancelled; }

bool TaskHandle::cancel() {
  if (!_state || _state->done) {
    return false;
  }
  _state->cancelPending = true;
  if (_state->detach) {
    auto detach = std::exchange(_state->detach, nullptr);
    detach();
  }
  if (_state->resumePoint && _state->scheduler != nullptr) {
    _state->scheduler->wake(_state);
  }
  return true;
}

std::exception_ptr TaskHandle::exception() const noexcept { return _state ? _state->exception : nullptr; }

CallbackId TaskHandle::addDoneCallback(DoneCallback callback) {
  if (!_state) {
    throw std::logic_error("addDoneCallback on an empty TaskHandle");
  }
  if (_state->done) {
    callback(*this);
    return 0;
  }
  const CallbackId id = _state->nextCallbackId++;
  _state->callbacks.emplace_back(id, std::move(callback));
  return id;
}

bool TaskHandle::removeDoneCallback(CallbackId id) noexcept {
  if (!_state) {
    return false;
  }
  auto& callbacks = _state->callbacks;
  auto it = std::ranges::find_if(callbacks, [id](const auto& entry) { return entry.first == id; });
  if (it == callbacks.end()) {
    return false;
  }
  callbacks.erase(it);
  return true;
}

Task<void> TaskHandle::wait() const { return Wait(_state, true); }

Task<void> TaskHandle::join() const { return Wait(_state, false); }

Task<void> TaskHandle::Wait(std::shared_ptr<detail::TaskState> state, bool rethrow) {
  if (!state) {
    throw std::logic_error("Waiting on an empty TaskHandle");
  }
  if (!state->done) {
    Future<void> finished;
    TaskHandle handle(state);
    const CallbackId id = handle.addDoneCallback([finished](const TaskHandle&) mutable { finished.setResult(); });
    try {
      co_await finished;
    } catch (const CancelledError&) {
      handle.removeDoneCallback(id);
      throw;
    }
  }
  if (rethrow) {
    if (state->cancelled) {
      throw CancelledError();
    }
    if (state->exception) {
      std::rethrow_exception(state->exception);
    }
  }
}

Scheduler::~Scheduler() { close(); }

TaskHandle Scheduler::spawn(Task<void> task, StartMode mode) {
  if (*_closed) {
    throw std::logic_error("Cannot spawn a task on a closed scheduler");
  }
  if (!task.valid()) {
    throw std::invalid_argument("Cannot spawn an empty task");
  }
  auto state = std::make_shared<detail::TaskState>(*this, std::move(task));
  _live.push_back(state);
  if (mode == StartMode::Eager) {
    step(state);
  } else {
    wake(state);
  }
  return TaskHandle(std::move(state));
}

void Scheduler::callSoon(std::function<void()> callback) {
  if (*_closed) {
    throw std::logic_error("Cannot schedule a callback on a closed scheduler");
  }
  _ready.push_back(std::move(callback));
}

bool Scheduler::runOnce() {
  if (_ready.empty()) {
    return false;
  }
  auto callback = std::move(_ready.front());
  _ready.pop_front();
  callback();
  return true;
}

void Scheduler::runUntilIdle() {
  while (runOnce()) {
  }
}

void Scheduler::close() {
  if (*_closed) {
    return;
  }
  *_closed = true;
  auto live = std::move(_live);
  _live.clear();
  for (const auto& state : live) {
    state->detach = nullptr;
    state->scheduler = nullptr;
    state->task.reset();
  }
  _ready.clear();
}

void Scheduler::wake(const std::shared_ptr<detail::TaskState>& state) {
  if (*_closed || state->done || state->wakeQueued) {
    return;
  }
  state->wakeQueued = true;
  _ready.emplace_back([this, state] { step(state); });
}

void Scheduler::step(const std::shared_ptr<detail::TaskState>& state) {
  state->wakeQueued = false;
  if (state->done || !state->task.valid()) {
    return;
  }
  if (!state->started && state->cancelPending) {
    state->cancelPending = false;
    finish(state, std::make_exception_ptr(CancelledError()));
    return;
  }
  std::coroutine_handle<> point = state->task.handle();
  if (state->started) {
    point = std::exchange(state->resumePoint, nullptr);
    if (!point) {
      return;
    }
  }
  state->started = true;

  detail::TaskState* previous = std::exchange(tCurrentTask, state.get());
  point.resume();
  tCurrentTask = previous;

  if (state->task.valid() && state->task.done()) {
    finish(state, state->task.exception());
  }
}

void Scheduler::finish(const std::shared_ptr<detail::TaskState>& state, std::exception_ptr ex) {
  auto keepAlive = state;
  keepAlive->done = true;
  keepAlive->detach = nullptr;
  if (IsCancellation(ex)) {
    keepAlive->cancelled = true;
  } else {
    keepAlive->exception = std::move(ex);
  }
  std::erase(_live, keepAlive);
  // The frame may own the last references to objects observing this task.
  keepAlive->task.reset();

  const TaskHandle handle(keepAlive);
  while (!keepAlive->callbacks.empty()) {
    auto callback = std::move(keepAlive->callbacks.front().second);
    keepAlive->callbacks.erase(keepAlive->callbacks.begin());
    callback(handle);
  }
}

void Scheduler::driveUntilDone(const TaskHandle& handle) {
  while (!handle.done()) {
    if (!runOnce()) {
      throw std::logic_error("Scheduler became idle while the awaited task is still pending");
    }
  }
  if (handle.cancelled()) {
    throw CancelledError();
  }
  if (auto ex = handle.exception()) {
    std::rethrow_exception(ex);
  }
}

bool Yield::await_suspend(std::coroutine_handle<> handle) {
  _task = detail::CurrentTask();
  if (!detail::PrepareSuspend(*_task, handle)) {
    return false;
  }
  _task->scheduler->wake(_task);
  return true;
}

void Yield::await_resume() const {
  if (_task) {
    detail::ConsumeCancellation(*_task);
  }
}

}  // namespace courier::async

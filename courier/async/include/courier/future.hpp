#pragma once

#include <coroutine>
#include <exception>
#include <list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

#include "courier/cancelled-error.hpp"
#include "courier/scheduler.hpp"

namespace courier::async {

namespace detail {

// Tasks suspended on the same event.
class WaiterList : public std::enable_shared_from_this<WaiterList> {
 public:
  // Suspends 'task' at 'handle' until wakeAll() is called. Sets the detach hook of the task so that a cancellation
  // unregisters it. Returns false if the task must not suspend (cancellation already pending).
  bool suspend(const std::shared_ptr<TaskState>& task, std::coroutine_handle<> handle);

  void wakeAll();

  [[nodiscard]] bool empty() const noexcept { return _waiters.empty(); }

 private:
  std::list<std::weak_ptr<TaskState>> _waiters;
};

}  // namespace detail

// One-shot result shared by a producer and any number of awaiting tasks. Copies refer to the same result.
template <class T = void>
class Future {
  struct State {
    std::optional<T> value;
    std::exception_ptr exception;
    bool cancelled{false};
    std::shared_ptr<detail::WaiterList> waiters = std::make_shared<detail::WaiterList>();

    [[nodiscard]] bool done() const noexcept { return value.has_value() || exception || cancelled; }
  };

 public:
  class Awaiter {
   public:
    explicit Awaiter(std::shared_ptr<State> state) noexcept : _state(std::move(state)) {}

    [[nodiscard]] bool await_ready() const noexcept { return _state->done(); }

    bool await_suspend(std::coroutine_handle<> handle) {
      _task = detail::CurrentTask();
      return _state->waiters->suspend(_task, handle);
    }

    T await_resume() const {
      if (_task) {
        detail::ConsumeCancellation(*_task);
      }
      if (_state->cancelled) {
        throw CancelledError();
      }
      if (_state->exception) {
        std::rethrow_exception(_state->exception);
      }
      return *_state->value;
    }

   private:
    std::shared_ptr<State> _state;
    std::shared_ptr<detail::TaskState> _task;
  };

  Future() : _state(std::make_shared<State>()) {}

  [[nodiscard]] bool done() const noexcept { return _state->done(); }
  [[nodiscard]] bool cancelled() const noexcept { return _state->cancelled; }

  // Throws std::logic_error if the future is already done.
  void setResult(T value) {
    checkPending();
    _state->value.emplace(std::move(value));
    _state->waiters->wakeAll();
  }

  // Throws std::logic_error if the future is already done.
  void setException(std::exception_ptr ex) {
    checkPending();
    _state->exception = std::move(ex);
    _state->waiters->wakeAll();
  }

  // Returns false if the future is already done.
  bool cancel() {
    if (_state->done()) {
      return false;
    }
    _state->cancelled = true;
    _state->waiters->wakeAll();
    return true;
  }

  // Result of a done future. Throws std::logic_error if it is still pending.
  [[nodiscard]] const T& result() const {
    if (!_state->done()) {
      throw std::logic_error("Future is still pending");
    }
    if (_state->cancelled) {
      throw CancelledError();
    }
    if (_state->exception) {
      std::rethrow_exception(_state->exception);
    }
    return *_state->value;
  }

  Awaiter operator co_await() const noexcept { return Awaiter(_state); }

  bool operator==(const Future& other) const noexcept { return _state == other._state; }

 private:
  void checkPending() const {
    if (_state->done()) {
      throw std::logic_error("Future is already done");
    }
  }

  std::shared_ptr<State> _state;
};

template <>
class Future<void> {
  struct State {
    std::exception_ptr exception;
    bool resolved{false};
    bool cancelled{false};
    std::shared_ptr<detail::WaiterList> waiters = std::make_shared<detail::WaiterList>();

    [[nodiscard]] bool done() const noexcept { return resolved || exception || cancelled; }
  };

 public:
  class Awaiter {
   public:
    explicit Awaiter(std::shared_ptr<State> state) noexcept : _state(std::move(state)) {}

    [[nodiscard]] bool await_ready() const noexcept { return _state->done(); }

    bool await_suspend(std::coroutine_handle<> handle) {
      _task = detail::CurrentTask();
      return _state->waiters->suspend(_task, handle);
    }

    void await_resume() const {
      if (_task) {
        detail::ConsumeCancellation(*_task);
      }
      if (_state->cancelled) {
        throw CancelledError();
      }
      if (_state->exception) {
        std::rethrow_exception(_state->exception);
      }
    }

   private:
    std::shared_ptr<State> _state;
    std::shared_ptr<detail::TaskState> _task;
  };

  Future() : _state(std::make_shared<State>()) {}

  [[nodiscard]] bool done() const noexcept { return _state->done(); }
  [[nodiscard]] bool cancelled() const noexcept { return _state->cancelled; }

  void setResult() {
    checkPending();
    _state->resolved = true;
    _state->waiters->wakeAll();
  }

  void setException(std::exception_ptr ex) {
    checkPending();
    _state->exception = std::move(ex);
    _state->waiters->wakeAll();
  }

  bool cancel() {
    if (_state->done()) {
      return false;
    }
    _state->cancelled = true;
    _state->waiters->wakeAll();
    return true;
  }

  Awaiter operator co_await() const noexcept { return Awaiter(_state); }

  bool operator==(const Future& other) const noexcept { return _state == other._state; }

 private:
  void checkPending() const {
    if (_state->done()) {
      throw std::logic_error("Future is already done");
    }
  }

  std::shared_ptr<State> _state;
};

}  // namespace courier::async

#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace courier::async {

template <class T = void>
class Task;

namespace detail {

class PromiseBase {
 public:
  struct FinalAwaiter {
    [[nodiscard]] bool await_ready() const noexcept { return false; }

    // Hands control back to the awaiting coroutine, if any (symmetric transfer).
    template <class Promise>
    std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> handle) noexcept {
      auto continuation = handle.promise()._continuation;
      if (continuation) {
        return continuation;
      }
      return std::noop_coroutine();
    }

    void await_resume() const noexcept {}
  };

  std::suspend_always initial_suspend() noexcept { return {}; }
  FinalAwaiter final_suspend() noexcept { return {}; }

  void unhandled_exception() noexcept { _exception = std::current_exception(); }

  std::coroutine_handle<> _continuation;
  std::exception_ptr _exception;
};

}  // namespace detail

// Lazily started coroutine. A Task starts running only when awaited by another coroutine, or when handed to a
// Scheduler with spawn(). Exceptions escaping the coroutine body are captured and rethrown to the awaiter.
template <class T>
class [[nodiscard]] Task {
 public:
  struct promise_type : detail::PromiseBase {
    Task get_return_object() noexcept { return Task{std::coroutine_handle<promise_type>::from_promise(*this)}; }

    void return_value(T value) noexcept(std::is_nothrow_move_constructible_v<T>) { _value.emplace(std::move(value)); }

    std::optional<T> _value;
  };

  Task() noexcept = default;
  explicit Task(std::coroutine_handle<promise_type> handle) noexcept : _coro(handle) {}

  Task(Task&& other) noexcept : _coro(std::exchange(other._coro, {})) {}
  Task& operator=(Task&& other) noexcept {
    if (this != &other) {
      reset();
      _coro = std::exchange(other._coro, {});
    }
    return *this;
  }

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  ~Task() { reset(); }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_coro); }
  [[nodiscard]] bool done() const noexcept { return !_coro || _coro.done(); }

  [[nodiscard]] std::coroutine_handle<promise_type> handle() const noexcept { return _coro; }

  [[nodiscard]] std::exception_ptr exception() const noexcept {
    return _coro ? _coro.promise()._exception : std::exception_ptr{};
  }

  void reset() noexcept {
    if (_coro) {
      _coro.destroy();
      _coro = {};
    }
  }

  [[nodiscard]] bool await_ready() const noexcept { return done(); }

  std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept {
    _coro.promise()._continuation = awaiting;
    return _coro;
  }

  T await_resume() {
    if (!_coro) {
      throw std::logic_error("Awaiting an empty Task");
    }
    auto& promise = _coro.promise();
    if (promise._exception) {
      std::rethrow_exception(promise._exception);
    }
    return std::move(*promise._value);
  }

 private:
  std::coroutine_handle<promise_type> _coro;
};

template <>
class [[nodiscard]] Task<void> {
 public:
  struct promise_type : detail::PromiseBase {
    Task get_return_object() noexcept { return Task{std::coroutine_handle<promise_type>::from_promise(*this)}; }

    void return_void() const noexcept {}
  };

  Task() noexcept = default;
  explicit Task(std::coroutine_handle<promise_type> handle) noexcept : _coro(handle) {}

  Task(Task&& other) noexcept : _coro(std::exchange(other._coro, {})) {}
  Task& operator=(Task&& other) noexcept {
    if (this != &other) {
      reset();
      _coro = std::exchange(other._coro, {});
    }
    return *this;
  }

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  ~Task() { reset(); }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_coro); }
  [[nodiscard]] bool done() const noexcept { return !_coro || _coro.done(); }

  [[nodiscard]] std::coroutine_handle<promise_type> handle() const noexcept { return _coro; }

  [[nodiscard]] std::exception_ptr exception() const noexcept {
    return _coro ? _coro.promise()._exception : std::exception_ptr{};
  }

  void reset() noexcept {
    if (_coro) {
      _coro.destroy();
      _coro = {};
    }
  }

  [[nodiscard]] bool await_ready() const noexcept { return done(); }

  std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept {
    _coro.promise()._continuation = awaiting;
    return _coro;
  }

  void await_resume() const {
    if (!_coro) {
      throw std::logic_error("Awaiting an empty Task");
    }
    if (_coro.promise()._exception) {
      std::rethrow_exception(_coro.promise()._exception);
    }
  }

 private:
  std::coroutine_handle<promise_type> _coro;
};

}  // namespace courier::async

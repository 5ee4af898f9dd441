#pragma once

#include <exception>

namespace courier::async {

// Thrown at the first suspension point reached by a task after cancel() was requested on it.
// It does not derive from std::runtime_error so that generic error handlers can let it pass.
class CancelledError : public std::exception {
 public:
  [[nodiscard]] const char* what() const noexcept override { return "task cancelled"; }
};

// Returns true if 'ex' holds a CancelledError.
[[nodiscard]] bool IsCancellation(const std::exception_ptr& ex) noexcept;

}  // namespace courier::async

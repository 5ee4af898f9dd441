#pragma once

#include <string>

namespace courier {

// Whole content of the regular file at 'path'.
// Throws std::system_error (with the errno of the failing call) if it cannot be opened or read.
[[nodiscard]] std::string ReadWholeFile(const std::string& path);

// True if 'path' names an existing regular file.
[[nodiscard]] bool IsRegularFile(const std::string& path) noexcept;

}  // namespace courier

#pragma once

#include <filesystem>
#include <string_view>

namespace courier::test {

// Creates a unique directory under the system temp directory, removed with its content on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "courier-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&&) = delete;
  ScopedTempDir& operator=(ScopedTempDir&&) = delete;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

  // Writes 'content' to the file 'name' in this directory and returns its full path.
  std::filesystem::path writeFile(std::string_view name, std::string_view content) const;

 private:
  std::filesystem::path _dir;
};

}  // namespace courier::test

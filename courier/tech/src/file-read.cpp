#include "courier/file-read.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string>

#include "courier/errno-throw.hpp"
#include "courier/log.hpp"

namespace courier {

namespace {

class ScopedFd {
 public:
  explicit ScopedFd(int fd) noexcept : _fd(fd) {}

  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;
  ScopedFd(ScopedFd&&) = delete;
  ScopedFd& operator=(ScopedFd&&) = delete;

  ~ScopedFd() {
    if (::close(_fd) != 0) {
      log::error("Unable to close fd # {}: {}", _fd, std::strerror(errno));
    }
  }

  [[nodiscard]] int fd() const noexcept { return _fd; }

 private:
  int _fd;
};

}  // namespace

std::string ReadWholeFile(const std::string& path) {
  const int rawFd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (rawFd == -1) {
    ThrowErrno("Unable to open '{}'", path);
  }
  ScopedFd fd(rawFd);

  std::string content;
  constexpr std::size_t kBufSize = 8192;
  for (;;) {
    const std::size_t oldSize = content.size();
    ssize_t lastRead = 0;
    content.resize_and_overwrite(oldSize + kBufSize, [&fd, oldSize, &lastRead](char* data, std::size_t) {
      lastRead = ::read(fd.fd(), data + oldSize, kBufSize);
      return lastRead > 0 ? oldSize + static_cast<std::size_t>(lastRead) : oldSize;
    });
    if (lastRead == 0) {
      break;
    }
    if (lastRead == -1) {
      if (errno == EINTR) {
        continue;
      }
      ThrowErrno("Unable to read '{}'", path);
    }
  }
  return content;
}

bool IsRegularFile(const std::string& path) noexcept {
  struct stat st{};
  return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

}  // namespace courier

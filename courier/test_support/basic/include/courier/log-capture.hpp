#pragma once

#include <spdlog/sinks/ringbuffer_sink.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace courier::test {

// Records the messages of the client logger (formatted as "<level>: <message>") while alive.
class ClientLogCapture {
 public:
  ClientLogCapture();

  ClientLogCapture(const ClientLogCapture&) = delete;
  ClientLogCapture& operator=(const ClientLogCapture&) = delete;
  ClientLogCapture(ClientLogCapture&&) = delete;
  ClientLogCapture& operator=(ClientLogCapture&&) = delete;

  ~ClientLogCapture();

  [[nodiscard]] std::vector<std::string> messages() const;

  // True if a captured message contains 'needle'.
  [[nodiscard]] bool contains(std::string_view needle) const;

 private:
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> _sink;
  spdlog::level::level_enum _oldLevel;
};

}  // namespace courier::test

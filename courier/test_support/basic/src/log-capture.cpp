#include "courier/log-capture.hpp"

#include <spdlog/sinks/ringbuffer_sink.h>

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "courier/log.hpp"

namespace courier::test {

ClientLogCapture::ClientLogCapture()
    : _sink(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256)), _oldLevel(ClientLog()->level()) {
  _sink->set_pattern("%l: %v");
  ClientLog()->sinks().push_back(_sink);
  ClientLog()->set_level(log::level::debug);
}

ClientLogCapture::~ClientLogCapture() {
  auto& sinks = ClientLog()->sinks();
  std::erase(sinks, _sink);
  ClientLog()->set_level(_oldLevel);
}

std::vector<std::string> ClientLogCapture::messages() const { return _sink->last_formatted(); }

bool ClientLogCapture::contains(std::string_view needle) const {
  const auto msgs = messages();
  return std::ranges::any_of(msgs, [needle](const std::string& msg) { return msg.find(needle) != std::string::npos; });
}

}  // namespace courier::test

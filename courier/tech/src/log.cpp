#include "courier/log.hpp"

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace courier {

const std::shared_ptr<log::logger>& ClientLog() {
  static const std::shared_ptr<log::logger> kLogger = [] {
    const std::string name(kClientLoggerName);
    if (auto existing = log::get(name)) {
      return existing;
    }
    const auto& defaultLogger = log::default_logger();
    auto logger = std::make_shared<log::logger>(name, defaultLogger->sinks().begin(), defaultLogger->sinks().end());
    logger->set_level(defaultLogger->level());
    log::register_logger(logger);
    return logger;
  }();
  return kLogger;
}

}  // namespace courier

#pragma once

#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/logger.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

#include <memory>
#include <string_view>

namespace courier {

namespace log = spdlog;

inline constexpr std::string_view kClientLoggerName = "courier.client";

// Logger used for client side diagnostics (unclosed responses, unreadable cookies, netrc problems).
// It is registered in spdlog's registry on first use and writes to the sinks of the default logger.
[[nodiscard]] const std::shared_ptr<log::logger>& ClientLog();

}  // namespace courier

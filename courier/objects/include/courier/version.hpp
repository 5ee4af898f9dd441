#pragma once

#include <string_view>

#ifndef COURIER_VERSION_STR
#error "COURIER_VERSION_STR must be defined via build system"
#endif

namespace courier {

// Semver of the project as injected by the build system.
constexpr std::string_view version() { return COURIER_VERSION_STR; }

// Default User-Agent header value.
constexpr std::string_view userAgent() { return "courier/" COURIER_VERSION_STR; }

}  // namespace courier

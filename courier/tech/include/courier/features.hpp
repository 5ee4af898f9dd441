#pragma once

namespace courier {

#ifdef COURIER_ENABLE_ZLIB
constexpr bool zlibEnabled() { return true; }
#else
constexpr bool zlibEnabled() { return false; }
#endif

#ifdef COURIER_ENABLE_BROTLI
constexpr bool brotliEnabled() { return true; }
#else
constexpr bool brotliEnabled() { return false; }
#endif

}  // namespace courier

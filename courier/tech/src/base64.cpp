#include "courier/base64.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace courier {

std::string B64Encode(std::string_view binData) {
  static constexpr const char kB64Table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  static constexpr int kB64NbBits = 6;
  static constexpr uint32_t kMask6 = (1U << kB64NbBits) - 1U;

  std::string ret;
  ret.reserve(B64EncodedLen(binData.size()));

  int bitsCollected = 0;
  uint32_t accumulator = 0;
  for (char ch : binData) {
    accumulator = (accumulator << 8) | static_cast<uint8_t>(ch);
    bitsCollected += 8;
    while (bitsCollected >= kB64NbBits) {
      bitsCollected -= kB64NbBits;
      ret.push_back(kB64Table[(accumulator >> bitsCollected) & kMask6]);
    }
  }
  if (bitsCollected > 0) {
    accumulator <<= kB64NbBits - bitsCollected;
    ret.push_back(kB64Table[accumulator & kMask6]);
  }
  ret.resize(B64EncodedLen(binData.size()), '=');
  return ret;
}

std::string B64Decode(std::string_view ascData) {
  static constexpr unsigned char kReverseTable[] = {
      64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
      64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 62, 64, 64, 64, 63, 52, 53, 54, 55,
      56, 57, 58, 59, 60, 61, 64, 64, 64, 64, 64, 64, 64, 0,  1,  2,  3,  4,  5,  6,  7,  8,  9,  10, 11, 12,
      13, 14, 15, 16, 17, 18, 19, 20, 21, 22, 23, 24, 25, 64, 64, 64, 64, 64, 64, 26, 27, 28, 29, 30, 31, 32,
      33, 34, 35, 36, 37, 38, 39, 40, 41, 42, 43, 44, 45, 46, 47, 48, 49, 50, 51, 64, 64, 64, 64, 64};

  std::string ret;
  ret.reserve((ascData.size() * 3) / 4);
  int bitsCollected = 0;
  unsigned int accumulator = 0;

  for (char ch : ascData) {
    if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == '=') {
      continue;
    }
    const auto uc = static_cast<unsigned char>(ch);
    if (uc >= sizeof(kReverseTable) || kReverseTable[uc] > 63) {
      throw std::invalid_argument("Illegal character detected for a base 64 encoded string");
    }
    accumulator = (accumulator << 6) | kReverseTable[uc];
    bitsCollected += 6;
    if (bitsCollected >= 8) {
      bitsCollected -= 8;
      ret.push_back(static_cast<char>((accumulator >> bitsCollected) & 0xFFU));
    }
  }
  return ret;
}

}  // namespace courier

#include "courier/temp-dir.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace courier::test {

namespace {

std::string ToHex(uint64_t value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(16);
  for (int idx = 15; idx >= 0; --idx) {
    out.push_back(kHex[(value >> (idx * 4)) & 0xF]);
  }
  return out;
}

std::mt19937_64& Rng() {
  static std::mt19937_64 engine = [] {
    std::random_device rd;
    const auto now = static_cast<uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
    std::array<uint64_t, 2> seeds{static_cast<uint64_t>(rd()), now};
    std::seed_seq seq(seeds.begin(), seeds.end());
    return std::mt19937_64(seq);
  }();
  return engine;
}

}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  const auto base = std::filesystem::temp_directory_path();
  std::uniform_int_distribution<uint64_t> dist;
  for (int attempt = 0; attempt < 100; ++attempt) {
    const auto candidate = base / (std::string(prefix) + ToHex(dist(Rng())));
    std::error_code ec;
    if (std::filesystem::create_directories(candidate, ec)) {
      _dir = candidate;
      return;
    }
  }
  throw std::runtime_error("ScopedTempDir: Failed to create temp dir");
}

ScopedTempDir::~ScopedTempDir() {
  std::error_code ec;
  std::filesystem::remove_all(_dir, ec);
}

std::filesystem::path ScopedTempDir::writeFile(std::string_view name, std::string_view content) const {
  auto path = _dir / name;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!out) {
    throw std::runtime_error("ScopedTempDir: write failed");
  }
  return path;
}

}  // namespace courier::test

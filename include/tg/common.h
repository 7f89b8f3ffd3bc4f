#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace tg {

inline std::string PathToUtf8String(const std::filesystem::path& path) {
  return path.string();
}

// Stable 64-bit name hash for lock files and similar derived identifiers.
[[nodiscard]] constexpr uint64_t Fnv1a64(std::string_view input) noexcept {
  uint64_t hash = 1469598103934665603ull;
  for (unsigned char c : input) {
    hash ^= static_cast<uint64_t>(c);
    hash *= 1099511628211ull;
  }
  return hash;
}

// ISO-8601 UTC with microseconds, e.g. 2024-05-01T12:00:00.123456Z.
std::string FormatIsoTimestamp(std::chrono::system_clock::time_point tp);

[[nodiscard]] inline std::string_view TrimAsciiWhitespace(std::string_view text) noexcept {
  const auto is_space = [](char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
  };
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

} // namespace tg

#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace tg::crypto {
std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data);
std::string SHA256_Hex(std::string_view text);
} // namespace tg::crypto

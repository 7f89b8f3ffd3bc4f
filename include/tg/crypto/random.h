#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace tg::crypto {

void SystemRandomBytes(std::span<uint8_t> out);

// Lowercase hex string drawn from SystemRandomBytes, two characters per byte.
std::string RandomHexToken(size_t bytes);

}  // namespace tg::crypto

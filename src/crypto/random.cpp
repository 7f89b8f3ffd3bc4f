#include "tg/crypto/random.h"

#include <algorithm>
#include <cerrno>
#include <climits>

#include <openssl/rand.h>

#if defined(__linux__)
#include <sys/random.h>
#endif

#include "tg/error.h"
#include "tg/errors.h"

namespace tg::crypto {
namespace {

bool FillFromKernel(std::span<uint8_t> out) noexcept {
#if defined(__linux__)
  size_t filled = 0;
  while (filled < out.size()) {
    const ssize_t got = ::getrandom(out.data() + filled, out.size() - filled, 0);
    if (got < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    filled += static_cast<size_t>(got);
  }
  return true;
#else
  (void)out;
  return false;
#endif
}

}  // namespace

void SystemRandomBytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
  if (FillFromKernel(out)) {
    return;
  }
  // OpenSSL DRBG covers kernels without getrandom
  size_t offset = 0;
  while (offset < out.size()) {
    const size_t chunk = std::min<size_t>(out.size() - offset, INT_MAX);
    if (RAND_bytes(out.data() + offset, static_cast<int>(chunk)) != 1) {
      throw Error{ErrorDomain::Dependency, errors::dependency::kRandomUnavailable,
                  std::string(errors::msg::kRandomUnavailable)};
    }
    offset += chunk;
  }
}

std::string RandomHexToken(size_t bytes) {
  std::string random(bytes, '\0');
  SystemRandomBytes(std::span<uint8_t>(reinterpret_cast<uint8_t*>(random.data()), random.size()));
  static constexpr char kHex[] = "0123456789abcdef";
  std::string token;
  token.reserve(bytes * 2);
  for (unsigned char byte : random) {
    token.push_back(kHex[(byte >> 4) & 0x0F]);
    token.push_back(kHex[byte & 0x0F]);
  }
  return token;
}

}  // namespace tg::crypto

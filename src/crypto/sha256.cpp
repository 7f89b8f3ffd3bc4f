#include "tg/crypto/sha256.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include "tg/error.h"

namespace tg::crypto {
namespace {

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }
  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

}  // namespace

std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    throw Error{ErrorDomain::Dependency, errors::dependency::kDigestUnavailable,
                BuildOpenSSLErrorMessage("EVP_Digest(EVP_sha256)")};
  }
  if (len != out.size()) {
    throw Error{ErrorDomain::Dependency, errors::dependency::kDigestUnavailable,
                "Unexpected SHA-256 length", static_cast<int>(len)};
  }
  return out;
}

std::string SHA256_Hex(std::string_view text) {
  const auto* data = reinterpret_cast<const uint8_t*>(text.data());
  const auto digest = SHA256_Hash(std::span<const uint8_t>(data, text.size()));
  static constexpr char kHex[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(digest.size() * 2);
  for (auto byte : digest) {
    hex.push_back(kHex[(byte >> 4) & 0x0F]);
    hex.push_back(kHex[byte & 0x0F]);
  }
  return hex;
}

}  // namespace tg::crypto

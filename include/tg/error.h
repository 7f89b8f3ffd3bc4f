#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tg {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    Dependency = 0x06,
    State = 0x07,
    Lock = 0x08,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes to avoid collisions with propagated
  // platform error numbers. Codes inside the reserved range are stable.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Dependency:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Lock:
      return 0x0800;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace security {
      inline constexpr int kSymlinkSwapDetected = Make(ErrorDomain::Security, 0x01);
      inline constexpr int kLedgerCorrupt = Make(ErrorDomain::Security, 0x02);
      inline constexpr int kUntrustedBinary = Make(ErrorDomain::Security, 0x03);
      inline constexpr int kBinaryNotFound = Make(ErrorDomain::Security, 0x04);
      inline constexpr int kDangerousPattern = Make(ErrorDomain::Security, 0x05);
    } // namespace security

    namespace io {
      inline constexpr int kOpenFailed = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kReadFailed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kWriteFailed = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kSyncFailed = Make(ErrorDomain::IO, 0x04);
      inline constexpr int kRenameFailed = Make(ErrorDomain::IO, 0x05);
      inline constexpr int kRemoveFailed = Make(ErrorDomain::IO, 0x06);
      inline constexpr int kDirectoryFailed = Make(ErrorDomain::IO, 0x07);
      inline constexpr int kExecFailed = Make(ErrorDomain::IO, 0x08);
      inline constexpr int kExecTimedOut = Make(ErrorDomain::IO, 0x09);
      inline constexpr int kNativeFailure = Make(ErrorDomain::IO, 0x0A);
    } // namespace io

    namespace validation {
      inline constexpr int kEmptyInput = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kPathEscape = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kSymlinkRejected = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kPathUnresolvable = Make(ErrorDomain::Validation, 0x04);
      inline constexpr int kInvalidIdentifier = Make(ErrorDomain::Validation, 0x05);
      inline constexpr int kInvalidValue = Make(ErrorDomain::Validation, 0x06);
      inline constexpr int kNumericFormat = Make(ErrorDomain::Validation, 0x07);
      inline constexpr int kOutOfRange = Make(ErrorDomain::Validation, 0x08);
      inline constexpr int kShellMetacharacters = Make(ErrorDomain::Validation, 0x09);
      inline constexpr int kJsonTooLarge = Make(ErrorDomain::Validation, 0x0A);
      inline constexpr int kJsonTooDeep = Make(ErrorDomain::Validation, 0x0B);
      inline constexpr int kJsonMalformed = Make(ErrorDomain::Validation, 0x0C);
      inline constexpr int kJsonArrayTooLarge = Make(ErrorDomain::Validation, 0x0D);
      inline constexpr int kLedgerEntryShape = Make(ErrorDomain::Validation, 0x0E);
      inline constexpr int kInvalidBinaryName = Make(ErrorDomain::Validation, 0x0F);
      inline constexpr int kParameterMismatch = Make(ErrorDomain::Validation, 0x10);
    } // namespace validation

    namespace config {
      inline constexpr int kThresholdClamped = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kMalformedSetting = Make(ErrorDomain::Config, 0x02);
    } // namespace config

    namespace dependency {
      inline constexpr int kRandomUnavailable = Make(ErrorDomain::Dependency, 0x01);
      inline constexpr int kDigestUnavailable = Make(ErrorDomain::Dependency, 0x02);
      inline constexpr int kTestRunnerMissing = Make(ErrorDomain::Dependency, 0x03);
    } // namespace dependency

    namespace state {
      inline constexpr int kDatabaseOpenFailed = Make(ErrorDomain::State, 0x01);
      inline constexpr int kDatabaseQueryFailed = Make(ErrorDomain::State, 0x02);
      inline constexpr int kSchemaMismatch = Make(ErrorDomain::State, 0x03);
      inline constexpr int kGateFailed = Make(ErrorDomain::State, 0x04);
    } // namespace state

    namespace lock {
      inline constexpr int kTimeout = Make(ErrorDomain::Lock, 0x01);
      inline constexpr int kUnavailable = Make(ErrorDomain::Lock, 0x02);
    } // namespace lock

    namespace internal {
      inline constexpr int kUnexpected = Make(ErrorDomain::Internal, 0x01);
    } // namespace internal

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };

  // Dotted reason for a framework code, e.g. "validation.path_escape".
  [[nodiscard]] std::string_view ReasonTag(int code) noexcept;
  [[nodiscard]] std::string_view DomainName(ErrorDomain domain) noexcept;
} // namespace tg

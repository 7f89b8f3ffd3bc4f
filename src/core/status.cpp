#include "tg/status.h"

#include <sstream>

#include "tg/security/input_sanitizer.h"

namespace tg {

std::string_view DomainName(ErrorDomain domain) noexcept {
  switch (domain) {
  case ErrorDomain::Security:
    return "security";
  case ErrorDomain::IO:
    return "io";
  case ErrorDomain::Crypto:
    return "crypto";
  case ErrorDomain::Validation:
    return "validation";
  case ErrorDomain::Config:
    return "config";
  case ErrorDomain::Dependency:
    return "dependency";
  case ErrorDomain::State:
    return "state";
  case ErrorDomain::Lock:
    return "lock";
  case ErrorDomain::Internal:
    return "internal";
  }
  return "internal";
}

std::string_view ReasonTag(int code) noexcept {
  switch (code) {
  case errors::security::kSymlinkSwapDetected:
    return "security.symlink_swap";
  case errors::security::kLedgerCorrupt:
    return "security.ledger_corrupt";
  case errors::security::kUntrustedBinary:
    return "security.untrusted_binary";
  case errors::security::kBinaryNotFound:
    return "security.binary_not_found";
  case errors::security::kDangerousPattern:
    return "security.dangerous_pattern";
  case errors::io::kOpenFailed:
    return "io.open_failed";
  case errors::io::kReadFailed:
    return "io.read_failed";
  case errors::io::kWriteFailed:
    return "io.write_failed";
  case errors::io::kSyncFailed:
    return "io.sync_failed";
  case errors::io::kRenameFailed:
    return "io.rename_failed";
  case errors::io::kRemoveFailed:
    return "io.remove_failed";
  case errors::io::kDirectoryFailed:
    return "io.directory_failed";
  case errors::io::kExecFailed:
    return "io.exec_failed";
  case errors::io::kExecTimedOut:
    return "io.exec_timeout";
  case errors::io::kNativeFailure:
    return "io.native_failure";
  case errors::validation::kEmptyInput:
    return "validation.empty_input";
  case errors::validation::kPathEscape:
    return "validation.path_escape";
  case errors::validation::kSymlinkRejected:
    return "validation.symlink_rejected";
  case errors::validation::kPathUnresolvable:
    return "validation.path_unresolvable";
  case errors::validation::kInvalidIdentifier:
    return "validation.invalid_identifier";
  case errors::validation::kInvalidValue:
    return "validation.invalid_value";
  case errors::validation::kNumericFormat:
    return "validation.numeric_format";
  case errors::validation::kOutOfRange:
    return "validation.out_of_range";
  case errors::validation::kShellMetacharacters:
    return "validation.shell_metacharacters";
  case errors::validation::kJsonTooLarge:
    return "validation.json_too_large";
  case errors::validation::kJsonTooDeep:
    return "validation.json_too_deep";
  case errors::validation::kJsonMalformed:
    return "validation.json_malformed";
  case errors::validation::kJsonArrayTooLarge:
    return "validation.json_array_too_large";
  case errors::validation::kLedgerEntryShape:
    return "validation.ledger_entry_shape";
  case errors::validation::kInvalidBinaryName:
    return "validation.invalid_binary_name";
  case errors::validation::kParameterMismatch:
    return "validation.parameter_mismatch";
  case errors::config::kThresholdClamped:
    return "config.threshold_clamped";
  case errors::config::kMalformedSetting:
    return "config.malformed_setting";
  case errors::dependency::kRandomUnavailable:
    return "dependency.random_unavailable";
  case errors::dependency::kDigestUnavailable:
    return "dependency.digest_unavailable";
  case errors::dependency::kTestRunnerMissing:
    return "dependency.test_runner_missing";
  case errors::state::kDatabaseOpenFailed:
    return "state.database_open_failed";
  case errors::state::kDatabaseQueryFailed:
    return "state.database_query_failed";
  case errors::state::kSchemaMismatch:
    return "state.schema_mismatch";
  case errors::state::kGateFailed:
    return "state.gate_failed";
  case errors::lock::kTimeout:
    return "lock.timeout";
  case errors::lock::kUnavailable:
    return "lock.unavailable";
  case errors::internal::kUnexpected:
    return "internal.unexpected";
  default:
    break;
  }
  return "internal.unclassified";
}

Status Status::Fail(ErrorDomain domain, int code, std::string_view message, Retryability retry) {
  Status status;
  status.domain_ = domain;
  status.code_ = code == 0 ? errors::internal::kUnexpected : code;
  status.retryability_ = retry;
  status.message_ = security::MaskSecrets(message);
  return status;
}

Status Status::FromError(const Error& err) {
  // Native errno values land in the io span so callers still see a framework code.
  int code = err.code;
  if (!IsFrameworkErrorCode(err.domain, code)) {
    code = err.domain == ErrorDomain::IO ? errors::io::kNativeFailure : errors::internal::kUnexpected;
  }
  return Fail(err.domain, code, err.what(), err.retryability);
}

std::string Status::ToString() const {
  if (ok()) {
    return "[ok]";
  }
  std::ostringstream oss;
  oss << '[' << tag() << "] " << message_;
  return oss.str();
}

} // namespace tg

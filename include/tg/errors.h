#pragma once

#include <string_view>

namespace tg::errors::msg {
// centralized message catalog
inline constexpr std::string_view kEmptyPath{"Path is empty"};
inline constexpr std::string_view kPathEscapesBase{"Path escapes base directory"};
inline constexpr std::string_view kSymlinkEscapesBase{"Symlink component resolves outside base directory"};
inline constexpr std::string_view kSymlinkTarget{"Target is a symlink"};
inline constexpr std::string_view kSymlinkSwapped{"Target became a symlink before commit"};
inline constexpr std::string_view kPathUnresolvable{"Unable to canonicalize path"};
inline constexpr std::string_view kInvalidStateKey{"State key must be a plain identifier"};
inline constexpr std::string_view kStateValueMultiline{"State value must not contain line breaks"};
inline constexpr std::string_view kNotRegularFile{"Target is not a regular file"};
inline constexpr std::string_view kLockTimeout{"Timed out waiting for lock"};
inline constexpr std::string_view kLockOpenFailed{"Unable to open lock file"};
inline constexpr std::string_view kLedgerEntryNotObject{"Ledger entry must be a JSON object"};
inline constexpr std::string_view kLedgerEntryMultiline{"Ledger entry must be a single line"};
inline constexpr std::string_view kLedgerEntryMissingField{"Ledger entry requires string event, id and timestamp fields"};
inline constexpr std::string_view kLedgerCorrupt{"Ledger contains malformed lines"};
inline constexpr std::string_view kJsonTooLarge{"JSON input exceeds maximum size"};
inline constexpr std::string_view kJsonTooDeep{"JSON input exceeds maximum nesting depth"};
inline constexpr std::string_view kJsonArrayTooLarge{"JSON array exceeds maximum item count"};
inline constexpr std::string_view kJsonMalformed{"JSON input is malformed"};
inline constexpr std::string_view kJsonEmpty{"JSON input is empty"};
inline constexpr std::string_view kScoreEmpty{"Score is empty"};
inline constexpr std::string_view kScoreNotNumeric{"Score must be an unsigned decimal number"};
inline constexpr std::string_view kScoreShellCharacters{"Score contains shell metacharacters"};
inline constexpr std::string_view kScoreOutOfRange{"Score outside accepted range"};
inline constexpr std::string_view kVulnCountNotInteger{"Critical vulnerability count must be a non-negative integer"};
inline constexpr std::string_view kUnknownScoreKind{"Unknown gate score kind"};
inline constexpr std::string_view kTestRunnerMissing{"Test runner missing or not functional"};
inline constexpr std::string_view kInvalidBinaryName{"Binary name must be a plain file name"};
inline constexpr std::string_view kBinaryNotFound{"Binary not found in trusted directories"};
inline constexpr std::string_view kUntrustedBinary{"Binary path is outside trusted directories"};
inline constexpr std::string_view kExecFailed{"Failed to execute trusted binary"};
inline constexpr std::string_view kExecTimedOut{"Trusted binary exceeded time limit"};
inline constexpr std::string_view kDangerousPattern{"Input matches a dangerous pattern"};
inline constexpr std::string_view kDatabaseSymlink{"Database path is a symlink"};
inline constexpr std::string_view kDatabaseParentSymlink{"Database parent directory is a symlink"};
inline constexpr std::string_view kDatabaseTraversal{"Database path contains traversal"};
inline constexpr std::string_view kDatabaseOpenFailed{"Unable to open state database"};
inline constexpr std::string_view kDatabaseQueryFailed{"State database statement failed"};
inline constexpr std::string_view kSchemaMismatch{"State database schema version unsupported"};
inline constexpr std::string_view kSqlParameterMismatch{"SQL placeholder count does not match parameters"};
inline constexpr std::string_view kRandomUnavailable{"Secure random source unavailable"};
}  // namespace tg::errors::msg

#include "tg/storage/ledger.h"

#include <cerrno>
#include <ctime>
#include <fstream>
#include <sys/stat.h>

#include "tg/common.h"
#include "tg/crypto/random.h"
#include "tg/errors.h"
#include "tg/orchestrator/event_bus.h"
#include "tg/orchestrator/file_lock.h"
#include "tg/orchestrator/io_util.h"
#include "tg/security/path_validator.h"

namespace tg::storage {
namespace {

using orchestrator::EventField;
using orchestrator::FieldPrivacy;
using orchestrator::LockMode;
using orchestrator::ScopedFileLock;

constexpr size_t kEntryIdBytes = 16;
constexpr int kMaxArchiveSuffix = 1000;

Status EntryShape(std::string_view message) {
  return Status::Fail(ErrorDomain::Validation, errors::validation::kLedgerEntryShape, message);
}

std::string ArchiveStamp() {
  const std::time_t now = std::time(nullptr);
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buffer[32];
  const size_t len = std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &tm);
  return std::string(buffer, len);
}

bool PathExists(const std::filesystem::path& path) {
  struct stat st {};
  return ::lstat(path.c_str(), &st) == 0;
}

std::filesystem::path NextArchivePath(const std::filesystem::path& ledger) {
  std::filesystem::path base = ledger;
  base += "." + ArchiveStamp();
  if (!PathExists(base)) {
    return base;
  }
  for (int suffix = 1; suffix <= kMaxArchiveSuffix; ++suffix) {
    auto candidate = base;
    candidate += "." + std::to_string(suffix);
    if (!PathExists(candidate)) {
      return candidate;
    }
  }
  throw Error{ErrorDomain::IO, errors::io::kRenameFailed, "No free ledger archive name"};
}

} // namespace

Ledger::Ledger(LedgerOptions options) : options_(std::move(options)) {
  if (options_.base_dir.empty()) {
    options_.base_dir = options_.ledger_path.parent_path();
  }
}

std::filesystem::path Ledger::lock_path() const {
  auto lock = options_.ledger_path;
  lock += ".lock";
  return lock;
}

Status Ledger::ValidateLocation() const {
  if (options_.ledger_path.empty()) {
    return Status::Fail(ErrorDomain::Validation, errors::validation::kEmptyInput, errors::msg::kEmptyPath);
  }
  if (auto status = security::CheckSymlinkSafe(options_.ledger_path, options_.base_dir); !status) {
    return status;
  }
  if (security::IsSymlink(options_.ledger_path) || security::IsSymlink(lock_path())) {
    orchestrator::PublishSecurityEvent("ledger_symlink_rejected", errors::msg::kSymlinkTarget,
                                       {EventField("path", PathToUtf8String(options_.ledger_path),
                                                   FieldPrivacy::kHash)},
                                       orchestrator::EventSeverity::kCritical);
    return Status::Fail(ErrorDomain::Validation, errors::validation::kSymlinkRejected, errors::msg::kSymlinkTarget);
  }
  return Status::Ok();
}

Status Ledger::ValidateEntry(std::string_view entry) const {
  if (entry.find_first_of("\r\n") != std::string_view::npos) {
    return EntryShape(errors::msg::kLedgerEntryMultiline);
  }
  auto parsed = security::SafeParseJson(entry, options_.json_limits);
  if (!parsed) {
    return parsed.status();
  }
  const auto& doc = *parsed;
  if (!doc.is_object()) {
    return EntryShape(errors::msg::kLedgerEntryNotObject);
  }
  for (const char* field : {"event", "id", "timestamp"}) {
    auto it = doc.find(field);
    if (it == doc.end() || !it->is_string()) {
      return EntryShape(errors::msg::kLedgerEntryMissingField);
    }
  }
  return Status::Ok();
}

bool Ledger::RotateLocked() const {
  struct stat st {};
  if (::lstat(options_.ledger_path.c_str(), &st) != 0) {
    if (errno == ENOENT) {
      return false;
    }
    throw Error{ErrorDomain::IO, errors::io::kReadFailed, "Unable to stat ledger", errno};
  }
  if (!S_ISREG(st.st_mode)) {
    throw Error{ErrorDomain::Security, errors::security::kSymlinkSwapDetected, std::string(errors::msg::kSymlinkSwapped)};
  }
  if (static_cast<size_t>(st.st_size) <= options_.max_bytes) {
    return false;
  }
  const auto archive = NextArchivePath(options_.ledger_path);
  if (::rename(options_.ledger_path.c_str(), archive.c_str()) != 0) {
    throw Error{ErrorDomain::IO, errors::io::kRenameFailed, "Unable to archive ledger", errno};
  }
  // recreate immediately so readers never find the ledger missing
  orchestrator::AppendToFile(options_.ledger_path, {});
  orchestrator::SyncDirectory(options_.ledger_path.parent_path());
  orchestrator::PublishEvent(orchestrator::EventCategory::kLifecycle, orchestrator::EventSeverity::kInfo,
                             "ledger_rotated", "Ledger archived",
                             {EventField("archive", archive.filename().string()),
                              EventField("bytes", std::to_string(st.st_size), FieldPrivacy::kPublic, true)});
  return true;
}

Status Ledger::Append(std::string_view entry_json) const {
  const auto entry = TrimAsciiWhitespace(entry_json);
  if (auto status = ValidateEntry(entry); !status) {
    return status;
  }
  if (auto status = ValidateLocation(); !status) {
    return status;
  }
  if (auto status = CaptureStatus([&] { orchestrator::EnsurePrivateDirectory(options_.ledger_path.parent_path()); });
      !status) {
    return status;
  }

  auto lock = ScopedFileLock::Acquire(lock_path(), LockMode::kExclusive, options_.lock_timeout);
  if (!lock) {
    return orchestrator::LockFailureStatus(lock);
  }
  if (auto status = ValidateLocation(); !status) {
    return status;
  }
  return CaptureStatus([&] {
    RotateLocked();
    std::string line(entry);
    line += '\n';
    orchestrator::AppendToFile(options_.ledger_path, line);
  });
}

Result<std::string> Ledger::AppendEvent(std::string_view event, const nlohmann::json& payload) const {
  if (!payload.is_object()) {
    return EntryShape(errors::msg::kLedgerEntryNotObject);
  }
  auto built = CaptureStatus([&] {
    nlohmann::json entry = payload;
    const std::string id = crypto::RandomHexToken(kEntryIdBytes);
    entry["event"] = std::string(event);
    entry["id"] = id;
    entry["timestamp"] = FormatIsoTimestamp(std::chrono::system_clock::now());
    // invalid UTF-8 is replaced so dump cannot throw
    return Result<std::pair<std::string, std::string>>(
        std::make_pair(id, entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)));
  });
  if (!built) {
    return built.status();
  }
  if (auto status = Append(built->second); !status) {
    return status;
  }
  return built->first;
}

Status Ledger::ReadEntries(std::string_view filter, const LineSink& sink) const {
  if (auto status = ValidateLocation(); !status) {
    return status;
  }
  if (!PathExists(options_.ledger_path)) {
    return Status::Ok();
  }
  auto lock = ScopedFileLock::Acquire(lock_path(), LockMode::kShared, options_.read_timeout);
  if (!lock) {
    return orchestrator::LockFailureStatus(lock);
  }
  if (auto status = ValidateLocation(); !status) {
    return status;
  }
  return CaptureStatus([&] {
    const auto content = orchestrator::ReadFileNoFollow(options_.ledger_path);
    if (!content) {
      return;
    }
    std::string_view remaining(*content);
    while (!remaining.empty()) {
      const auto end = remaining.find('\n');
      const auto line = remaining.substr(0, end);
      remaining = end == std::string_view::npos ? std::string_view{} : remaining.substr(end + 1);
      if (line.empty()) {
        continue;
      }
      if (filter.empty() || line.find(filter) != std::string_view::npos) {
        sink(line);
      }
    }
  });
}

Result<std::vector<std::string>> Ledger::ReadEntries(std::string_view filter) const {
  std::vector<std::string> entries;
  auto status = ReadEntries(filter, [&](std::string_view line) { entries.emplace_back(line); });
  if (!status) {
    return status;
  }
  return entries;
}

Result<IntegrityReport> Ledger::VerifyIntegrity() const {
  IntegrityReport report;
  if (auto status = ValidateLocation(); !status) {
    return status;
  }
  if (!PathExists(options_.ledger_path)) {
    return report;
  }
  auto lock = ScopedFileLock::Acquire(lock_path(), LockMode::kShared, options_.read_timeout);
  if (!lock) {
    return orchestrator::LockFailureStatus(lock);
  }
  if (auto status = ValidateLocation(); !status) {
    return status;
  }
  size_t line_number = 0;
  auto scanned = CaptureStatus([&] {
    const auto content = orchestrator::ReadFileNoFollow(options_.ledger_path);
    if (!content) {
      return;
    }
    std::string_view remaining(*content);
    while (!remaining.empty()) {
      const auto end = remaining.find('\n');
      const auto line = remaining.substr(0, end);
      remaining = end == std::string_view::npos ? std::string_view{} : remaining.substr(end + 1);
      ++line_number;
      if (TrimAsciiWhitespace(line).empty()) {
        continue;
      }
      ++report.total_lines;
      if (!nlohmann::json::accept(line)) {
        ++report.invalid_lines;
        report.invalid_line_numbers.push_back(line_number);
      }
    }
  });
  if (!scanned) {
    return scanned;
  }
  report.pass = report.invalid_lines == 0;
  if (!report.pass) {
    orchestrator::PublishSecurityEvent(
        "ledger_integrity_failed", errors::msg::kLedgerCorrupt,
        {EventField("path", PathToUtf8String(options_.ledger_path), FieldPrivacy::kHash),
         EventField("invalid_lines", std::to_string(report.invalid_lines), FieldPrivacy::kPublic, true),
         EventField("reason", std::string(ReasonTag(errors::security::kLedgerCorrupt)))},
        orchestrator::EventSeverity::kCritical);
  }
  return report;
}

Result<bool> Ledger::RotateIfNeeded() const {
  if (auto status = ValidateLocation(); !status) {
    return status;
  }
  if (!PathExists(options_.ledger_path)) {
    return false;
  }
  auto lock = ScopedFileLock::Acquire(lock_path(), LockMode::kExclusive, options_.lock_timeout);
  if (!lock) {
    return orchestrator::LockFailureStatus(lock);
  }
  if (auto status = ValidateLocation(); !status) {
    return status;
  }
  return CaptureStatus([&] { return Result<bool>(RotateLocked()); });
}

}  // namespace tg::storage

#include "tg/storage/state_store.h"

#include <charconv>
#include <limits>

#include "tg/common.h"
#include "tg/errors.h"
#include "tg/orchestrator/event_bus.h"
#include "tg/security/input_sanitizer.h"
#include "tg/security/path_validator.h"

namespace tg::storage {
namespace {

using orchestrator::EventField;
using orchestrator::FieldPrivacy;
using orchestrator::LockMode;

int64_t ParseCounter(std::string_view content) noexcept {
  const auto text = TrimAsciiWhitespace(content);
  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
    return 0;
  }
  return value;
}

// Integrity failures always reach the security log.
Status Surface(Status status, const std::filesystem::path& target) {
  if (!status.ok() && status.domain() == ErrorDomain::Security) {
    orchestrator::PublishSecurityEvent("state_integrity_violation", status.message(),
                                       {EventField("path", PathToUtf8String(target), FieldPrivacy::kHash),
                                        EventField("reason", std::string(status.tag()))},
                                       orchestrator::EventSeverity::kCritical);
  }
  return status;
}

Status CheckRecordKey(std::string_view key) {
  if (!security::ValidateIdentifier(key)) {
    return Status::Fail(ErrorDomain::Validation, errors::validation::kInvalidIdentifier,
                        errors::msg::kInvalidStateKey);
  }
  return Status::Ok();
}

} // namespace

StateStore::StateStore(StateStoreOptions options) : options_(std::move(options)) {
  if (options_.lock_dir.empty()) {
    options_.lock_dir = options_.state_root / ".locks";
  }
  lock_dir_status_ = CheckLockDir();
}

Status StateStore::CheckLockDir() const {
  std::error_code ec;
  if (options_.state_root.empty() || !std::filesystem::exists(options_.state_root, ec)) {
    // nothing under the root can be a symlink yet; ForResource refuses one later
    return Status::Ok();
  }
  const auto lock_dir = std::filesystem::absolute(options_.lock_dir, ec).lexically_normal();
  const auto root = std::filesystem::absolute(options_.state_root, ec).lexically_normal();
  if (ec || !security::IsWithin(lock_dir, root)) {
    return Status::Ok();
  }
  return security::CheckSymlinkSafe(options_.lock_dir, options_.state_root);
}

std::filesystem::path StateStore::Resolve(const std::filesystem::path& path) const {
  if (path.is_relative()) {
    return options_.state_root / path;
  }
  return path;
}

Status StateStore::Validate(const std::filesystem::path& target) const {
  if (target.empty() || options_.state_root.empty()) {
    return Status::Fail(ErrorDomain::Validation, errors::validation::kEmptyInput, errors::msg::kEmptyPath);
  }
  auto status = security::CheckSymlinkSafe(target, options_.state_root);
  if (!status) {
    return status;
  }
  // the root itself is a directory, never a record
  const auto canonical_target = security::CanonicalizePath(target);
  const auto canonical_root = security::CanonicalizePath(options_.state_root);
  if (!canonical_target || !canonical_root || *canonical_target == *canonical_root) {
    return Status::Fail(ErrorDomain::Validation, errors::validation::kPathEscape, errors::msg::kPathEscapesBase);
  }
  return Status::Ok();
}

Result<orchestrator::ScopedFileLock> StateStore::Lock(const std::filesystem::path& target, LockMode mode) const {
  if (!lock_dir_status_) {
    return lock_dir_status_;
  }
  auto lock = orchestrator::ScopedFileLock::ForResource(options_.lock_dir, target, mode, options_.lock_timeout);
  if (!lock) {
    return orchestrator::LockFailureStatus(lock);
  }
  return lock;
}

StateStore::Records StateStore::ParseRecords(std::string_view content) {
  Records records;
  size_t start = 0;
  while (start < content.size()) {
    size_t end = content.find('\n', start);
    if (end == std::string_view::npos) {
      end = content.size();
    }
    const auto line = content.substr(start, end - start);
    const auto eq = line.find('=');
    if (eq != std::string_view::npos && eq > 0) {
      records.emplace_back(std::string(line.substr(0, eq)), std::string(line.substr(eq + 1)));
    }
    start = end + 1;
  }
  return records;
}

std::string StateStore::SerializeRecords(const Records& records) {
  std::string out;
  for (const auto& [key, value] : records) {
    out += key;
    out += '=';
    out += value;
    out += '\n';
  }
  return out;
}

Status StateStore::AtomicWrite(const std::filesystem::path& path, std::string_view content,
                               const orchestrator::AtomicReplaceHooks& hooks) const {
  const auto target = Resolve(path);
  if (auto status = Validate(target); !status) {
    return status;
  }
  auto lock = Lock(target, LockMode::kExclusive);
  if (!lock) {
    return lock.status();
  }
  if (auto status = Validate(target); !status) {
    return status;
  }
  return Surface(CaptureStatus([&] {
                   orchestrator::EnsurePrivateDirectory(target.parent_path());
                   orchestrator::AtomicReplace(target, content, hooks);
                 }),
                 target);
}

Status StateStore::AtomicAppend(const std::filesystem::path& path, std::string_view content) const {
  const auto target = Resolve(path);
  if (auto status = Validate(target); !status) {
    return status;
  }
  auto lock = Lock(target, LockMode::kExclusive);
  if (!lock) {
    return lock.status();
  }
  if (auto status = Validate(target); !status) {
    return status;
  }
  return Surface(CaptureStatus([&] {
                   orchestrator::EnsurePrivateDirectory(target.parent_path());
                   std::string line(content);
                   line += '\n';
                   orchestrator::AppendToFile(target, line);
                 }),
                 target);
}

Result<int64_t> StateStore::AtomicIncrement(const std::filesystem::path& path, int64_t delta) const {
  const auto target = Resolve(path);
  if (auto status = Validate(target); !status) {
    return status;
  }
  auto lock = Lock(target, LockMode::kExclusive);
  if (!lock) {
    return lock.status();
  }
  if (auto status = Validate(target); !status) {
    return status;
  }
  auto current = CaptureStatus([&] { return Result<std::optional<std::string>>(orchestrator::ReadFileNoFollow(target)); });
  if (!current) {
    return Surface(current.status(), target);
  }
  const int64_t value = current->has_value() ? ParseCounter(**current) : 0;
  if ((delta > 0 && value > std::numeric_limits<int64_t>::max() - delta) ||
      (delta < 0 && value < std::numeric_limits<int64_t>::min() - delta)) {
    return Status::Fail(ErrorDomain::Validation, errors::validation::kOutOfRange, "Counter overflow");
  }
  const int64_t next = value + delta;
  auto written = CaptureStatus([&] {
    orchestrator::EnsurePrivateDirectory(target.parent_path());
    orchestrator::AtomicReplace(target, std::to_string(next) + "\n");
  });
  if (!written) {
    return Surface(written, target);
  }
  return next;
}

Result<std::string> StateStore::AtomicRead(const std::filesystem::path& path) const {
  const auto target = Resolve(path);
  if (auto status = Validate(target); !status) {
    return status;
  }
  auto lock = Lock(target, LockMode::kShared);
  if (!lock) {
    return lock.status();
  }
  auto content = CaptureStatus([&] { return Result<std::optional<std::string>>(orchestrator::ReadFileNoFollow(target)); });
  if (!content) {
    return Surface(content.status(), target);
  }
  if (!content->has_value()) {
    return Status::Fail(ErrorDomain::IO, errors::io::kOpenFailed, "State file does not exist");
  }
  return **content;
}

Status StateStore::StateSet(const std::filesystem::path& file, std::string_view key, std::string_view value) const {
  if (auto status = CheckRecordKey(key); !status) {
    return status;
  }
  if (value.find_first_of("\r\n") != std::string_view::npos) {
    return Status::Fail(ErrorDomain::Validation, errors::validation::kInvalidValue,
                        errors::msg::kStateValueMultiline);
  }
  const auto target = Resolve(file);
  if (auto status = Validate(target); !status) {
    return status;
  }
  auto lock = Lock(target, LockMode::kExclusive);
  if (!lock) {
    return lock.status();
  }
  if (auto status = Validate(target); !status) {
    return status;
  }
  return Surface(CaptureStatus([&] {
                   auto existing = orchestrator::ReadFileNoFollow(target);
                   auto records = ParseRecords(existing.value_or(std::string{}));
                   bool replaced = false;
                   for (auto& record : records) {
                     if (record.first == key) {
                       record.second = std::string(value);
                       replaced = true;
                     }
                   }
                   if (!replaced) {
                     records.emplace_back(std::string(key), std::string(value));
                   }
                   orchestrator::EnsurePrivateDirectory(target.parent_path());
                   orchestrator::AtomicReplace(target, SerializeRecords(records));
                 }),
                 target);
}

Result<std::string> StateStore::StateGet(const std::filesystem::path& file, std::string_view key,
                                         std::string_view default_value) const {
  if (auto status = CheckRecordKey(key); !status) {
    return status;
  }
  const auto target = Resolve(file);
  if (auto status = Validate(target); !status) {
    return status;
  }
  auto lock = Lock(target, LockMode::kShared);
  if (!lock) {
    return lock.status();
  }
  auto content = CaptureStatus([&] { return Result<std::optional<std::string>>(orchestrator::ReadFileNoFollow(target)); });
  if (!content) {
    return Surface(content.status(), target);
  }
  if (!content->has_value()) {
    return std::string(default_value);
  }
  std::string found(default_value);
  for (const auto& [record_key, record_value] : ParseRecords(**content)) {
    if (record_key == key) {
      found = record_value;
    }
  }
  return found;
}

Status StateStore::StateDelete(const std::filesystem::path& file, std::string_view key) const {
  if (auto status = CheckRecordKey(key); !status) {
    return status;
  }
  const auto target = Resolve(file);
  if (auto status = Validate(target); !status) {
    return status;
  }
  auto lock = Lock(target, LockMode::kExclusive);
  if (!lock) {
    return lock.status();
  }
  if (auto status = Validate(target); !status) {
    return status;
  }
  return Surface(CaptureStatus([&] {
                   auto existing = orchestrator::ReadFileNoFollow(target);
                   if (!existing) {
                     return;
                   }
                   auto records = ParseRecords(*existing);
                   std::erase_if(records, [&](const auto& record) { return record.first == key; });
                   if (!records.empty()) {
                     orchestrator::AtomicReplace(target, SerializeRecords(records));
                     return;
                   }
                   if (security::IsSymlink(target)) {
                     throw Error{ErrorDomain::Security, errors::security::kSymlinkSwapDetected,
                                 std::string(errors::msg::kSymlinkSwapped)};
                   }
                   std::error_code ec;
                   if (!std::filesystem::remove(target, ec) && ec) {
                     throw Error{ErrorDomain::IO, errors::io::kRemoveFailed, "Unable to remove state file",
                                 ec.value()};
                   }
                 }),
                 target);
}

}  // namespace tg::storage

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tg/orchestrator/file_lock.h"
#include "tg/orchestrator/io_util.h"
#include "tg/status.h"

namespace tg::storage {

struct StateStoreOptions {
  std::filesystem::path state_root;
  // Defaults to <state_root>/.locks when empty. A lock_dir inside the root
  // must pass the same symlink check as the records.
  std::filesystem::path lock_dir;
  std::chrono::milliseconds lock_timeout{5000};
};

// File-per-record state under a single root. Every mutation validates the
// target, takes an exclusive lock for it, validates again under the lock and
// only then touches the filesystem. Relative paths resolve against the root.
class StateStore {
public:
  explicit StateStore(StateStoreOptions options);

  [[nodiscard]] const std::filesystem::path& state_root() const noexcept { return options_.state_root; }

  [[nodiscard]] Status AtomicWrite(const std::filesystem::path& path, std::string_view content,
                                   const orchestrator::AtomicReplaceHooks& hooks = {}) const;
  // Appends content as one line.
  [[nodiscard]] Status AtomicAppend(const std::filesystem::path& path, std::string_view content) const;
  // A missing or non-numeric counter counts as 0. Returns the new value.
  [[nodiscard]] Result<int64_t> AtomicIncrement(const std::filesystem::path& path, int64_t delta = 1) const;
  [[nodiscard]] Result<std::string> AtomicRead(const std::filesystem::path& path) const;

  // key=value records, one per line.
  [[nodiscard]] Status StateSet(const std::filesystem::path& file, std::string_view key,
                                std::string_view value) const;
  [[nodiscard]] Result<std::string> StateGet(const std::filesystem::path& file, std::string_view key,
                                             std::string_view default_value = {}) const;
  // Removing the last key removes the file. A missing file is not an error.
  [[nodiscard]] Status StateDelete(const std::filesystem::path& file, std::string_view key) const;

private:
  using Records = std::vector<std::pair<std::string, std::string>>;

  [[nodiscard]] std::filesystem::path Resolve(const std::filesystem::path& path) const;
  [[nodiscard]] Status Validate(const std::filesystem::path& target) const;
  [[nodiscard]] Status CheckLockDir() const;
  [[nodiscard]] Result<orchestrator::ScopedFileLock> Lock(const std::filesystem::path& target,
                                                          orchestrator::LockMode mode) const;

  static Records ParseRecords(std::string_view content);
  static std::string SerializeRecords(const Records& records);

  StateStoreOptions options_;
  Status lock_dir_status_;
};

}  // namespace tg::storage

#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "tg/status.h"

namespace tg::orchestrator {

enum class LockMode { kShared, kExclusive };

enum class LockStatus { kAcquired, kTimedOut, kFailed };

// Cross-process advisory lock on a 0600 lock file. The lock is released when
// the object is destroyed, on every exit path. flock locks are per open file
// description, so a holder must not re-acquire the same file.
class ScopedFileLock {
public:
  ScopedFileLock() = default;
  ScopedFileLock(const ScopedFileLock&) = delete;
  ScopedFileLock& operator=(const ScopedFileLock&) = delete;
  ScopedFileLock(ScopedFileLock&& other) noexcept;
  ScopedFileLock& operator=(ScopedFileLock&& other) noexcept;
  ~ScopedFileLock();

  // Polls with capped exponential backoff until timeout elapses.
  [[nodiscard]] static ScopedFileLock Acquire(const std::filesystem::path& lock_path, LockMode mode,
                                              std::chrono::milliseconds timeout);
  // Lock file inside lock_dir named after a hash of the resource path.
  // lock_dir is created 0700 when missing and refused when it is a symlink.
  [[nodiscard]] static ScopedFileLock ForResource(const std::filesystem::path& lock_dir,
                                                  const std::filesystem::path& resource, LockMode mode,
                                                  std::chrono::milliseconds timeout);
  [[nodiscard]] static std::filesystem::path LockPathFor(const std::filesystem::path& lock_dir,
                                                         const std::filesystem::path& resource);

  [[nodiscard]] bool locked() const noexcept { return fd_ >= 0; }
  explicit operator bool() const noexcept { return locked(); }
  [[nodiscard]] LockStatus status() const noexcept { return status_; }
  [[nodiscard]] int native_error() const noexcept { return native_error_; }
  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  void Release() noexcept;

private:
  ScopedFileLock(int fd, std::filesystem::path path) noexcept;
  static ScopedFileLock Failed(LockStatus status, int native_error, std::filesystem::path path) noexcept;

  int fd_{-1};
  LockStatus status_{LockStatus::kFailed};
  int native_error_{0};
  std::filesystem::path path_;
};

// lock.timeout (transient) for kTimedOut, lock.unavailable otherwise.
[[nodiscard]] Status LockFailureStatus(const ScopedFileLock& lock);

}  // namespace tg::orchestrator

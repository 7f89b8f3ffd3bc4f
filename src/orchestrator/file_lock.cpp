#include "tg/orchestrator/file_lock.h"

#include <algorithm>
#include <cerrno>
#include <ctime>
#include <fcntl.h>
#include <string_view>
#include <sys/file.h>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

#include "tg/common.h"
#include "tg/errors.h"
#include "tg/orchestrator/event_bus.h"

namespace tg::orchestrator {
namespace {

constexpr std::chrono::milliseconds kInitialBackoff{1};
constexpr std::chrono::milliseconds kMaxBackoff{50};

std::string MakeBaseName(const std::filesystem::path& path) {
  const std::string canonical = tg::PathToUtf8String(path);
  const uint64_t hash = tg::Fnv1a64(canonical);
  static constexpr char kHex[] = "0123456789abcdef";
  std::string encoded(16, '0');
  uint64_t value = hash;
  for (int idx = 15; idx >= 0; --idx) {
    encoded[idx] = kHex[value & 0x0F];
    value >>= 4;
  }
  return "tglock" + encoded + ".lock";
}

// Diagnostic only; readers never depend on it.
void WriteHolderMetadata(int fd) noexcept {
  const std::string line =
      "pid=" + std::to_string(::getpid()) + " ts=" + std::to_string(static_cast<long long>(::time(nullptr))) + "\n";
  if (::ftruncate(fd, 0) != 0) {
    return;
  }
  size_t written = 0;
  while (written < line.size()) {
    const ssize_t rc = ::pwrite(fd, line.data() + written, line.size() - written, static_cast<off_t>(written));
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      return;
    }
    written += static_cast<size_t>(rc);
  }
}

} // namespace

ScopedFileLock::ScopedFileLock(int fd, std::filesystem::path path) noexcept
    : fd_(fd), status_(LockStatus::kAcquired), path_(std::move(path)) {}

ScopedFileLock ScopedFileLock::Failed(LockStatus status, int native_error, std::filesystem::path path) noexcept {
  ScopedFileLock lock;
  lock.status_ = status;
  lock.native_error_ = native_error;
  lock.path_ = std::move(path);
  return lock;
}

ScopedFileLock::ScopedFileLock(ScopedFileLock&& other) noexcept { *this = std::move(other); }

ScopedFileLock& ScopedFileLock::operator=(ScopedFileLock&& other) noexcept {
  if (this == &other) {
    return *this;
  }
  Release();
  fd_ = other.fd_;
  status_ = other.status_;
  native_error_ = other.native_error_;
  path_ = std::move(other.path_);
  other.fd_ = -1;
  other.status_ = LockStatus::kFailed;
  return *this;
}

ScopedFileLock::~ScopedFileLock() { Release(); }

ScopedFileLock ScopedFileLock::Acquire(const std::filesystem::path& lock_path, LockMode mode,
                                       std::chrono::milliseconds timeout) {
  int fd = -1;
  do {
    fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC | O_NOFOLLOW, 0600);
  } while (fd < 0 && errno == EINTR);
  if (fd < 0) {
    return Failed(LockStatus::kFailed, errno, lock_path);
  }

  const int operation = (mode == LockMode::kExclusive ? LOCK_EX : LOCK_SH) | LOCK_NB;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  auto backoff = kInitialBackoff;
  while (true) {
    if (::flock(fd, operation) == 0) {
      break;
    }
    const int err = errno;
    if (err == EINTR) {
      continue;
    }
    if (err != EWOULDBLOCK) {
      ::close(fd);
      return Failed(LockStatus::kFailed, err, lock_path);
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      ::close(fd);
      return Failed(LockStatus::kTimedOut, EWOULDBLOCK, lock_path);
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(backoff, std::max(remaining, std::chrono::milliseconds(1))));
    backoff = std::min(backoff * 2, kMaxBackoff);
  }

  if (mode == LockMode::kExclusive) {
    WriteHolderMetadata(fd);
  }
  return ScopedFileLock(fd, lock_path);
}

std::filesystem::path ScopedFileLock::LockPathFor(const std::filesystem::path& lock_dir,
                                                  const std::filesystem::path& resource) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(resource, ec);
  if (ec) {
    absolute = resource;
  }
  return lock_dir / MakeBaseName(absolute.lexically_normal());
}

ScopedFileLock ScopedFileLock::ForResource(const std::filesystem::path& lock_dir,
                                           const std::filesystem::path& resource, LockMode mode,
                                           std::chrono::milliseconds timeout) {
  std::error_code ec;
  const bool created = std::filesystem::create_directories(lock_dir, ec);
  if (ec) {
    return Failed(LockStatus::kFailed, ec.value(), lock_dir);
  }
  if (created && ::chmod(lock_dir.c_str(), 0700) != 0) {
    return Failed(LockStatus::kFailed, errno, lock_dir);
  }
  // lock files open no-follow; the directory holding them must not redirect either
  struct stat info {};
  if (::lstat(lock_dir.c_str(), &info) != 0) {
    return Failed(LockStatus::kFailed, errno, lock_dir);
  }
  if (!S_ISDIR(info.st_mode)) {
    PublishSecurityEvent("lock_dir_symlink_rejected", "Lock directory is not a plain directory",
                         {EventField("lock_dir", PathToUtf8String(lock_dir), FieldPrivacy::kHash)},
                         EventSeverity::kCritical);
    return Failed(LockStatus::kFailed, S_ISLNK(info.st_mode) ? ELOOP : ENOTDIR, lock_dir);
  }
  return Acquire(LockPathFor(lock_dir, resource), mode, timeout);
}

void ScopedFileLock::Release() noexcept {
  if (fd_ < 0) {
    return;
  }
  ::flock(fd_, LOCK_UN);
  ::close(fd_);
  fd_ = -1;
}

Status LockFailureStatus(const ScopedFileLock& lock) {
  if (lock.status() == LockStatus::kTimedOut) {
    PublishEvent(EventCategory::kDiagnostics, EventSeverity::kWarning, "lock_timeout", errors::msg::kLockTimeout,
                 {EventField("lock", PathToUtf8String(lock.path()), FieldPrivacy::kHash)});
    return Status::Fail(ErrorDomain::Lock, errors::lock::kTimeout, errors::msg::kLockTimeout,
                        Retryability::kTransient);
  }
  return Status::Fail(ErrorDomain::Lock, errors::lock::kUnavailable,
                      std::string(errors::msg::kLockOpenFailed) + " (errno " +
                          std::to_string(lock.native_error()) + ")");
}

}  // namespace tg::orchestrator

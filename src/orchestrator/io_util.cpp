#include "tg/orchestrator/io_util.h"

#include "tg/common.h"
#include "tg/crypto/random.h"
#include "tg/errors.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <type_traits>
#include <unordered_set>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace tg::orchestrator {
namespace {

constexpr const char* kAtomicReplaceErrorMessage = "Atomic file replace failed";
constexpr const char* kAppendErrorMessage = "Append failed";
constexpr const char* kReadErrorMessage = "Read failed";
constexpr size_t kTempTokenBytes = 16;

class ErrorContext { // accumulate nested call context
 public:
  void Push(std::string context) { context_stack_.push_back(std::move(context)); }
  void Pop() {
    if (!context_stack_.empty()) {
      context_stack_.pop_back();
    }
  }
  [[nodiscard]] std::vector<std::string> Stack() const { return context_stack_; }
  [[nodiscard]] std::string Format(std::string_view message) const {
    std::ostringstream oss;
    oss << message;
    for (auto it = context_stack_.rbegin(); it != context_stack_.rend(); ++it) {
      oss << "\n  while: " << *it;
    }
    return oss.str();
  }

 private:
  std::vector<std::string> context_stack_;
};

class ScopedErrorContext {
 public:
  ScopedErrorContext(ErrorContext& ctx, std::string description) : ctx_(ctx) {
    ctx_.Push(std::move(description));
  }
  ScopedErrorContext(const ScopedErrorContext&) = delete;
  ScopedErrorContext& operator=(const ScopedErrorContext&) = delete;
  ~ScopedErrorContext() { ctx_.Pop(); }

 private:
  ErrorContext& ctx_;
};

tg::Retryability ClassifyNativeError(int native) {
  switch (native) {
    case EINTR:
    case EAGAIN:
#if EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
      return tg::Retryability::kRetryable;
    case EBUSY:
    case ETIMEDOUT:
      return tg::Retryability::kTransient;
    default:
      break;
  }
  return tg::Retryability::kFatal;
}

std::vector<std::string> MergeContext(const std::vector<std::string>& existing, const ErrorContext& ctx) {
  auto merged = existing;
  auto stack = ctx.Stack();
  merged.insert(merged.end(), stack.begin(), stack.end());
  return merged;
}

[[noreturn]] void ThrowIoError(const ErrorContext& ctx, int code, std::string message, int native) {
  throw Error{ErrorDomain::IO, code, ctx.Format(std::move(message)), native, ClassifyNativeError(native),
              ctx.Stack()};
}

[[noreturn]] void ThrowValidationError(const ErrorContext& ctx, int code, std::string_view message) {
  throw Error{ErrorDomain::Validation, code, ctx.Format(message), std::nullopt, tg::Retryability::kFatal,
              ctx.Stack()};
}

[[noreturn]] void ThrowSymlinkSwap(const ErrorContext& ctx) {
  throw Error{ErrorDomain::Security, errors::security::kSymlinkSwapDetected, ctx.Format(errors::msg::kSymlinkSwapped),
              std::nullopt, tg::Retryability::kFatal, ctx.Stack()};
}

Error AugmentError(const Error& err, const ErrorContext& ctx) {
  return Error{err.domain, err.code, ctx.Format(err.what()), err.native_code, err.retryability,
               MergeContext(err.context, ctx)};
}

[[noreturn]] void RethrowSystemError(const std::system_error& sys_err, const ErrorContext& ctx) {
  throw Error{ErrorDomain::IO,
              errors::io::kNativeFailure,
              ctx.Format(sys_err.what()),
              sys_err.code().value(),
              ClassifyNativeError(sys_err.code().value()),
              ctx.Stack()};
}

[[noreturn]] void RethrowUnknownError(const std::exception& ex, const ErrorContext& ctx) {
  throw Error{ErrorDomain::Internal, errors::internal::kUnexpected, ctx.Format(ex.what()), std::nullopt,
              tg::Retryability::kFatal, ctx.Stack()};
}

template <typename Func>
auto WithContext(ErrorContext& ctx, std::string description, Func&& fn) -> std::invoke_result_t<Func&> {
  ScopedErrorContext scoped(ctx, std::move(description));
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Func&>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const Error& err) {
    if (err.context.empty()) {
      throw AugmentError(err, ctx);
    }
    throw;
  } catch (const std::system_error& sys_err) {
    RethrowSystemError(sys_err, ctx);
  } catch (const std::exception& ex) {
    RethrowUnknownError(ex, ctx);
  }
}

// Shared outer boundary for the public entry points.
template <typename Func>
auto Guarded(ErrorContext& ctx, Func&& fn) -> std::invoke_result_t<Func&> {
  try {
    return fn();
  } catch (const Error& err) {
    if (err.context.empty()) {
      throw AugmentError(err, ctx);
    }
    throw;
  } catch (const std::system_error& sys_err) {
    RethrowSystemError(sys_err, ctx);
  } catch (const std::exception& ex) {
    RethrowUnknownError(ex, ctx);
  }
}

int OpenNoFollow(const std::filesystem::path& path, int flags, mode_t mode = 0600) {
  int fd = -1;
  do {
    fd = ::open(path.c_str(), flags | O_CLOEXEC | O_NOFOLLOW, mode);
  } while (fd < 0 && errno == EINTR);
  return fd;
}

class ScopedFd {
 public:
  explicit ScopedFd(int fd) noexcept : fd_(fd) {}
  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;
  ~ScopedFd() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }
  [[nodiscard]] int get() const noexcept { return fd_; }
  // Closes explicitly so the caller can observe the result.
  int Close() noexcept {
    const int rc = ::close(fd_);
    fd_ = -1;
    return rc;
  }

 private:
  int fd_;
};

bool IsSymlinkNoThrow(const std::filesystem::path& path) {
  struct stat st {};
  return ::lstat(path.c_str(), &st) == 0 && S_ISLNK(st.st_mode);
}

bool IsTransientFsyncError(int err) { return err == EINTR || err == EAGAIN || err == EBUSY; }

void SyncFileWithRetry(int fd, ErrorContext& ctx) {
  constexpr int kMaxRetries = 4;
  std::chrono::milliseconds backoff{5};
  for (int attempt = 0;; ++attempt) {
    if (::fsync(fd) == 0) {
      return;
    }
    const int saved_errno = errno;
    if (saved_errno == EINTR) {
      continue;
    }
    if (attempt >= kMaxRetries || !IsTransientFsyncError(saved_errno)) {
      ThrowIoError(ctx, errors::io::kSyncFailed, "fsync failed", saved_errno);
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

void WriteAll(int fd, std::span<const uint8_t> payload, ErrorContext& ctx) {
  size_t written = 0;
  while (written < payload.size()) {
    auto chunk = ::write(fd, payload.data() + written, payload.size() - written);
    if (chunk < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      ThrowIoError(ctx, errors::io::kWriteFailed, "write failed", saved_errno);
    }
    if (chunk == 0) {
      ThrowIoError(ctx, errors::io::kWriteFailed, "short write", 0);
    }
    written += static_cast<size_t>(chunk);
  }
}

std::span<const uint8_t> AsBytes(std::string_view text) {
  return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

class TempFileRegistry { // removes in-flight temp files on exit or fatal signal
 public:
  static TempFileRegistry& Instance() {
    static TempFileRegistry instance;
    return instance;
  }

  void Track(const std::filesystem::path& path) {
    EnsureHandlers();
    std::lock_guard<std::mutex> lock(mutex_);
    tracked_.insert(path);
  }

  void Untrack(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    tracked_.erase(path);
  }

  void CleanupAll() noexcept {
    std::vector<std::filesystem::path> snapshot;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      snapshot.assign(tracked_.begin(), tracked_.end());
      tracked_.clear();
    }
    for (const auto& candidate : snapshot) {
      std::error_code ec;
      if (!std::filesystem::remove(candidate, ec) && ec) {
        std::cerr << "TempFileRegistry cleanup failed for " << candidate << ": " << ec.message() << '\n';
      }
    }
  }

  static void HandleSignal(int signal) noexcept {
    TempFileRegistry::Instance().CleanupAll();
    std::signal(signal, SIG_DFL);
    std::raise(signal);
  }

 private:
  TempFileRegistry() = default;

  void EnsureHandlers() {
    std::call_once(handlers_once_, [] {
      std::atexit([] { TempFileRegistry::Instance().CleanupAll(); });
      std::signal(SIGINT, TempFileRegistry::HandleSignal);
      std::signal(SIGTERM, TempFileRegistry::HandleSignal);
      std::signal(SIGHUP, TempFileRegistry::HandleSignal);
      std::signal(SIGQUIT, TempFileRegistry::HandleSignal);
    });
  }

  std::mutex mutex_;
  std::unordered_set<std::filesystem::path> tracked_;
  std::once_flag handlers_once_;
};

class TempFileGuard { // removes the temp file unless the rename committed it
 public:
  explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {
    if (!path_.empty()) {
      TempFileRegistry::Instance().Track(path_);
    }
  }
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;
  ~TempFileGuard() noexcept {
    if (!path_.empty()) {
      std::error_code ec;
      if (!std::filesystem::remove(path_, ec) && ec) {
        std::cerr << "TempFileGuard cleanup failed for " << path_ << ": " << ec.message() << '\n';
      } else {
        TempFileRegistry::Instance().Untrack(path_);
      }
    }
  }

  void Release() noexcept {
    if (!path_.empty()) {
      TempFileRegistry::Instance().Untrack(path_);
    }
    path_.clear();
  }

 private:
  std::filesystem::path path_;
};

std::filesystem::path MakeTempPath(const std::filesystem::path& dir, const std::filesystem::path& base) {
  std::filesystem::path temp_name = base.filename();
  temp_name += ".tmp.";
  temp_name += tg::crypto::RandomHexToken(kTempTokenBytes);
  return dir / temp_name;
}

void EnsurePrivatePermissions(int fd, const ErrorContext& ctx) {
  if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
    const int saved_errno = errno;
    ThrowIoError(ctx, errors::io::kOpenFailed, "failed to harden temp file permissions", saved_errno);
  }
}

// Last byte of an open file, nullopt when empty.
std::optional<char> LastByte(int fd, ErrorContext& ctx) {
  struct stat st {};
  if (::fstat(fd, &st) != 0) {
    const int saved_errno = errno;
    ThrowIoError(ctx, errors::io::kReadFailed, "fstat failed", saved_errno);
  }
  if (st.st_size == 0) {
    return std::nullopt;
  }
  char last = '\0';
  ssize_t rc = -1;
  do {
    rc = ::pread(fd, &last, 1, st.st_size - 1);
  } while (rc < 0 && errno == EINTR);
  if (rc != 1) {
    const int saved_errno = rc < 0 ? errno : 0;
    ThrowIoError(ctx, errors::io::kReadFailed, "tail read failed", saved_errno);
  }
  return last;
}

}  // namespace

void SyncDirectory(const std::filesystem::path& dir) {
  int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dir_fd < 0) {
    const int saved_errno = errno;
    throw Error{ErrorDomain::IO, errors::io::kDirectoryFailed,
                std::string(kAtomicReplaceErrorMessage) + ": open directory failed", saved_errno,
                ClassifyNativeError(saved_errno)};
  }
  if (::fsync(dir_fd) != 0) {
    const int err = errno;
    ::close(dir_fd);
    throw Error{ErrorDomain::IO, errors::io::kSyncFailed,
                std::string(kAtomicReplaceErrorMessage) + ": directory flush failed", err,
                ClassifyNativeError(err)};
  }
  ::close(dir_fd);
}

void EnsurePrivateDirectory(const std::filesystem::path& dir) {
  std::vector<std::filesystem::path> missing;
  for (auto ancestor = dir; !ancestor.empty(); ancestor = ancestor.parent_path()) {
    std::error_code ec;
    if (std::filesystem::exists(ancestor, ec)) {
      break;
    }
    missing.push_back(ancestor);
    if (ancestor == ancestor.parent_path()) {
      break;
    }
  }
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kDirectoryFailed, "Unable to create directory " + PathToUtf8String(dir),
                ec.value(), ClassifyNativeError(ec.value())};
  }
  for (const auto& created : missing) {
    if (::chmod(created.c_str(), 0700) != 0) {
      const int saved_errno = errno;
      throw Error{ErrorDomain::IO, errors::io::kDirectoryFailed,
                  "Unable to restrict directory " + PathToUtf8String(created), saved_errno,
                  ClassifyNativeError(saved_errno)};
    }
  }
}

void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks) {
  ErrorContext ctx;
  const std::string target_utf8 = target.empty() ? std::string("<empty>") : tg::PathToUtf8String(target);
  ScopedErrorContext root(ctx, "atomic replace target=" + target_utf8);

  Guarded(ctx, [&] {
    if (target.empty()) {
      ThrowValidationError(ctx, errors::validation::kEmptyInput, errors::msg::kEmptyPath);
    }
    if (IsSymlinkNoThrow(target)) {
      ThrowValidationError(ctx, errors::validation::kSymlinkRejected, errors::msg::kSymlinkTarget);
    }

    auto dir = target.parent_path();
    if (dir.empty()) {
      dir = WithContext(ctx, "resolving current working directory", [] { return std::filesystem::current_path(); });
    }

    auto temp_path = MakeTempPath(dir, target);
    TempFileGuard cleanup(temp_path);

    const int raw_fd = WithContext(ctx, "opening temporary payload file", [&]() {
      int handle = OpenNoFollow(temp_path, O_CREAT | O_EXCL | O_WRONLY);
      if (handle < 0) {
        const int saved_errno = errno;
        ThrowIoError(ctx, errors::io::kOpenFailed, std::string(kAtomicReplaceErrorMessage) + ": open failed",
                     saved_errno);
      }
      return handle;
    });
    ScopedFd fd(raw_fd);

    EnsurePrivatePermissions(fd.get(), ctx);
    WithContext(ctx, "writing payload", [&] { WriteAll(fd.get(), payload, ctx); });
    WithContext(ctx, "syncing payload", [&] { SyncFileWithRetry(fd.get(), ctx); });
    WithContext(ctx, "closing temporary payload file", [&] {
      if (fd.Close() != 0) {
        const int saved_errno = errno;
        ThrowIoError(ctx, errors::io::kWriteFailed, std::string(kAtomicReplaceErrorMessage) + ": close failed",
                     saved_errno);
      }
    });

    if (hooks.before_rename) {
      WithContext(ctx, "executing before_rename hook", [&] { hooks.before_rename(temp_path, target); });
    }

    WithContext(ctx, "renaming temporary file into place", [&] {
      // a link planted after the first check is reported, not replaced
      if (IsSymlinkNoThrow(target)) {
        ThrowSymlinkSwap(ctx);
      }
      if (::rename(temp_path.c_str(), target.c_str()) != 0) {
        const int err = errno;
        ThrowIoError(ctx, errors::io::kRenameFailed, std::string(kAtomicReplaceErrorMessage) + ": rename failed",
                     err);
      }
    });
    cleanup.Release();

    WithContext(ctx, "syncing directory metadata", [&] { SyncDirectory(dir); });
  });
}

void AtomicReplace(const std::filesystem::path& target, std::string_view payload, const AtomicReplaceHooks& hooks) {
  AtomicReplace(target, AsBytes(payload), hooks);
}

void AppendToFile(const std::filesystem::path& target, std::string_view data) {
  ErrorContext ctx;
  ScopedErrorContext root(ctx, "append target=" + tg::PathToUtf8String(target));

  Guarded(ctx, [&] {
    const int raw_fd = OpenNoFollow(target, O_WRONLY | O_APPEND | O_CREAT);
    if (raw_fd < 0) {
      const int saved_errno = errno;
      if (saved_errno == ELOOP) {
        ThrowValidationError(ctx, errors::validation::kSymlinkRejected, errors::msg::kSymlinkTarget);
      }
      ThrowIoError(ctx, errors::io::kOpenFailed, std::string(kAppendErrorMessage) + ": open failed", saved_errno);
    }
    ScopedFd fd(raw_fd);

    std::string buffer;
    buffer.reserve(data.size() + 1);
    const auto last = WithContext(ctx, "checking trailing newline", [&] { return LastByte(fd.get(), ctx); });
    if (last.has_value() && *last != '\n') {
      buffer.push_back('\n');
    }
    buffer.append(data);

    WithContext(ctx, "writing payload", [&] { WriteAll(fd.get(), AsBytes(buffer), ctx); });
    WithContext(ctx, "syncing payload", [&] { SyncFileWithRetry(fd.get(), ctx); });
    if (fd.Close() != 0) {
      const int saved_errno = errno;
      ThrowIoError(ctx, errors::io::kWriteFailed, std::string(kAppendErrorMessage) + ": close failed", saved_errno);
    }
  });
}

std::optional<std::string> ReadFileNoFollow(const std::filesystem::path& path) {
  ErrorContext ctx;
  ScopedErrorContext root(ctx, "read path=" + tg::PathToUtf8String(path));

  return Guarded(ctx, [&]() -> std::optional<std::string> {
    const int raw_fd = OpenNoFollow(path, O_RDONLY);
    if (raw_fd < 0) {
      const int saved_errno = errno;
      if (saved_errno == ENOENT) {
        return std::nullopt;
      }
      if (saved_errno == ELOOP) {
        ThrowValidationError(ctx, errors::validation::kSymlinkRejected, errors::msg::kSymlinkTarget);
      }
      ThrowIoError(ctx, errors::io::kOpenFailed, std::string(kReadErrorMessage) + ": open failed", saved_errno);
    }
    ScopedFd fd(raw_fd);

    struct stat st {};
    if (::fstat(fd.get(), &st) != 0) {
      const int saved_errno = errno;
      ThrowIoError(ctx, errors::io::kReadFailed, std::string(kReadErrorMessage) + ": fstat failed", saved_errno);
    }
    if (!S_ISREG(st.st_mode)) {
      ThrowValidationError(ctx, errors::validation::kInvalidValue, errors::msg::kNotRegularFile);
    }

    std::string content;
    content.reserve(static_cast<size_t>(st.st_size));
    char chunk[8192];
    while (true) {
      const ssize_t rc = ::read(fd.get(), chunk, sizeof(chunk));
      if (rc < 0) {
        const int saved_errno = errno;
        if (saved_errno == EINTR) {
          continue;
        }
        ThrowIoError(ctx, errors::io::kReadFailed, std::string(kReadErrorMessage) + ": read failed", saved_errno);
      }
      if (rc == 0) {
        break;
      }
      content.append(chunk, static_cast<size_t>(rc));
    }
    return content;
  });
}

}  // namespace tg::orchestrator

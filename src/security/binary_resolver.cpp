#include "tg/security/binary_resolver.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include "tg/common.h"
#include "tg/errors.h"
#include "tg/orchestrator/event_bus.h"
#include "tg/security/path_validator.h"

extern char** environ;

namespace tg::security {
namespace {

using orchestrator::EventField;
using orchestrator::FieldPrivacy;

constexpr std::array<std::string_view, 16> kDangerousEnvKeys = {
    "LD_PRELOAD",   "LD_LIBRARY_PATH", "LD_AUDIT",  "PYTHONPATH", "PYTHONHOME",           "PYTHONSTARTUP",
    "NODE_OPTIONS", "NODE_PATH",       "RUBYLIB",   "RUBYOPT",    "PERL5LIB",             "PERL5OPT",
    "DYLD_INSERT_LIBRARIES", "DYLD_LIBRARY_PATH", "BASH_ENV", "ENV"};

bool IsPlainBinaryName(std::string_view name) noexcept {
  if (name.empty() || name.size() > 255 || name == "." || name == "..") {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](char ch) {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '_' ||
           ch == '-' || ch == '.' || ch == '+';
  });
}

bool HasDotDot(const std::filesystem::path& path) {
  return std::any_of(path.begin(), path.end(), [](const std::filesystem::path& part) { return part == ".."; });
}

std::map<std::string, std::string> CurrentEnvironment() {
  std::map<std::string, std::string> env;
  for (char** entry = environ; entry && *entry; ++entry) {
    std::string_view kv(*entry);
    const auto eq = kv.find('=');
    if (eq == std::string_view::npos || eq == 0) {
      continue;
    }
    env.emplace(std::string(kv.substr(0, eq)), std::string(kv.substr(eq + 1)));
  }
  return env;
}

std::vector<std::string> Flatten(const std::map<std::string, std::string>& env) {
  std::vector<std::string> out;
  out.reserve(env.size());
  for (const auto& [key, value] : env) {
    out.push_back(key + "=" + value);
  }
  return out;
}

class Pipe {
 public:
  Pipe() = default;
  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;
  ~Pipe() {
    CloseRead();
    CloseWrite();
  }
  bool Open() noexcept { return ::pipe2(fds_, O_CLOEXEC) == 0; }
  [[nodiscard]] int read_end() const noexcept { return fds_[0]; }
  [[nodiscard]] int write_end() const noexcept { return fds_[1]; }
  void CloseRead() noexcept {
    if (fds_[0] >= 0) {
      ::close(fds_[0]);
      fds_[0] = -1;
    }
  }
  void CloseWrite() noexcept {
    if (fds_[1] >= 0) {
      ::close(fds_[1]);
      fds_[1] = -1;
    }
  }

 private:
  int fds_[2]{-1, -1};
};

Status ExecFailure(int code, std::string_view message, int native, Retryability retry = Retryability::kFatal) {
  std::string detail(message);
  if (native != 0) {
    detail += " (errno " + std::to_string(native) + ")";
  }
  return Status::Fail(ErrorDomain::IO, code, detail, retry);
}

void ReapChild(pid_t pid, int* wait_status) noexcept {
  while (::waitpid(pid, wait_status, 0) < 0 && errno == EINTR) {
  }
}

} // namespace

std::vector<std::filesystem::path> DefaultTrustedBinaryDirs() {
  return {"/usr/bin", "/bin", "/usr/local/bin", "/usr/sbin", "/sbin"};
}

std::map<std::string, std::filesystem::path> DefaultKnownBinaries() {
  return {
      {"git", "/usr/bin/git"},       {"sqlite3", "/usr/bin/sqlite3"}, {"grep", "/usr/bin/grep"},
      {"sed", "/usr/bin/sed"},       {"awk", "/usr/bin/awk"},         {"jq", "/usr/bin/jq"},
      {"flock", "/usr/bin/flock"},   {"timeout", "/usr/bin/timeout"}, {"find", "/usr/bin/find"},
      {"python3", "/usr/bin/python3"},
  };
}

bool IsDangerousEnvKey(std::string_view key) noexcept {
  if (key.rfind("LD_", 0) == 0 || key.rfind("DYLD_", 0) == 0) {
    return true;
  }
  return std::find(kDangerousEnvKeys.begin(), kDangerousEnvKeys.end(), key) != kDangerousEnvKeys.end();
}

BinaryResolver::BinaryResolver(BinaryResolverConfig config) : known_binaries_(std::move(config.known_binaries)) {
  for (auto& dir : config.trusted_dirs) {
    if (dir.is_absolute() && !HasDotDot(dir)) {
      trusted_dirs_.push_back(dir.lexically_normal());
    }
  }
}

bool BinaryResolver::IsTrustedBinaryPath(const std::filesystem::path& path) const noexcept {
  try {
    if (path.empty() || !path.is_absolute() || HasDotDot(path)) {
      return false;
    }
    const auto normal = path.lexically_normal();
    const auto parent = normal.parent_path();
    const bool listed = std::any_of(trusted_dirs_.begin(), trusted_dirs_.end(),
                                    [&](const std::filesystem::path& dir) { return dir == parent; });
    if (!listed) {
      return false;
    }

    std::error_code ec;
    const auto canonical = std::filesystem::canonical(normal, ec);
    if (ec) {
      return false;
    }
    const bool canonical_trusted =
        std::any_of(trusted_dirs_.begin(), trusted_dirs_.end(), [&](const std::filesystem::path& dir) {
          std::error_code dir_ec;
          const auto canonical_dir = std::filesystem::canonical(dir, dir_ec);
          return !dir_ec && IsWithin(canonical, canonical_dir);
        });
    if (!canonical_trusted) {
      return false;
    }

    struct stat st {};
    if (::stat(canonical.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
      return false;
    }
    if ((st.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)) == 0 || (st.st_mode & S_IWOTH) != 0) {
      return false;
    }
    return ::access(canonical.c_str(), X_OK) == 0;
  } catch (const std::exception&) {
    return false;
  }
}

Result<std::filesystem::path> BinaryResolver::SecureWhich(std::string_view name) const {
  if (!IsPlainBinaryName(name)) {
    orchestrator::PublishSecurityEvent("binary_name_rejected", errors::msg::kInvalidBinaryName,
                                       {EventField("name", std::string(name), FieldPrivacy::kHash)});
    return Status::Fail(ErrorDomain::Validation, errors::validation::kInvalidBinaryName,
                        errors::msg::kInvalidBinaryName);
  }
  const std::string key(name);
  if (auto it = known_binaries_.find(key); it != known_binaries_.end()) {
    if (IsTrustedBinaryPath(it->second)) {
      return it->second.lexically_normal();
    }
  }
  for (const auto& dir : trusted_dirs_) {
    const auto candidate = dir / key;
    if (IsTrustedBinaryPath(candidate)) {
      return candidate;
    }
  }
  orchestrator::PublishSecurityEvent("binary_not_trusted", errors::msg::kBinaryNotFound,
                                     {EventField("name", key)});
  return Status::Fail(ErrorDomain::Security, errors::security::kBinaryNotFound, errors::msg::kBinaryNotFound);
}

std::vector<std::string> BinaryResolver::BuildSafeEnvironment(
    const std::map<std::string, std::string>& base) const {
  std::map<std::string, std::string> clean;
  for (const auto& [key, value] : base) {
    if (key == "PATH") {
      continue;
    }
    if (IsDangerousEnvKey(key)) {
      orchestrator::PublishSecurityEvent("dangerous_env_stripped", "Dangerous environment variable removed",
                                         {EventField("key", key)}, orchestrator::EventSeverity::kInfo);
      continue;
    }
    clean.emplace(key, value);
  }
  std::string path_value;
  for (const auto& dir : trusted_dirs_) {
    if (!path_value.empty()) {
      path_value += ':';
    }
    path_value += dir.string();
  }
  clean["PATH"] = path_value;
  return Flatten(clean);
}

Result<ExecResult> BinaryResolver::SecureExec(std::string_view name, const std::vector<std::string>& args,
                                              const ExecOptions& options) const {
  auto env = CurrentEnvironment();
  for (const auto& [key, value] : options.extra_env) {
    env[key] = value;
  }
  return Run(name, args, Flatten(env), options);
}

Result<ExecResult> BinaryResolver::SafeEnvExec(std::string_view name, const std::vector<std::string>& args,
                                               const ExecOptions& options) const {
  auto env = CurrentEnvironment();
  for (const auto& [key, value] : options.extra_env) {
    env[key] = value;
  }
  return Run(name, args, BuildSafeEnvironment(env), options);
}

Result<ExecResult> BinaryResolver::Run(std::string_view name, const std::vector<std::string>& args,
                                       const std::vector<std::string>& env, const ExecOptions& options) const {
  auto resolved = SecureWhich(name);
  if (!resolved) {
    return resolved.status();
  }
  const std::string binary = resolved->string();

  // everything the child touches is built before fork
  std::vector<char*> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char*>(binary.c_str()));
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);
  std::vector<char*> envp;
  envp.reserve(env.size() + 1);
  for (const auto& entry : env) {
    envp.push_back(const_cast<char*>(entry.c_str()));
  }
  envp.push_back(nullptr);

  Pipe out;
  Pipe err;
  Pipe exec_status;
  if (!out.Open() || !err.Open() || !exec_status.Open()) {
    return ExecFailure(errors::io::kExecFailed, errors::msg::kExecFailed, errno);
  }
  const int dev_null = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (dev_null < 0) {
    return ExecFailure(errors::io::kExecFailed, errors::msg::kExecFailed, errno);
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int saved_errno = errno;
    ::close(dev_null);
    return ExecFailure(errors::io::kExecFailed, errors::msg::kExecFailed, saved_errno);
  }
  if (pid == 0) {
    if (::dup2(dev_null, STDIN_FILENO) < 0 || ::dup2(out.write_end(), STDOUT_FILENO) < 0 ||
        ::dup2(err.write_end(), STDERR_FILENO) < 0) {
      const int child_errno = errno;
      (void)!::write(exec_status.write_end(), &child_errno, sizeof(child_errno));
      ::_exit(127);
    }
    ::execve(binary.c_str(), argv.data(), envp.data());
    const int child_errno = errno;
    (void)!::write(exec_status.write_end(), &child_errno, sizeof(child_errno));
    ::_exit(127);
  }

  ::close(dev_null);
  out.CloseWrite();
  err.CloseWrite();
  exec_status.CloseWrite();

  int child_errno = 0;
  ssize_t status_bytes = 0;
  do {
    status_bytes = ::read(exec_status.read_end(), &child_errno, sizeof(child_errno));
  } while (status_bytes < 0 && errno == EINTR);
  if (status_bytes == static_cast<ssize_t>(sizeof(child_errno))) {
    int wait_status = 0;
    ReapChild(pid, &wait_status);
    return ExecFailure(errors::io::kExecFailed, errors::msg::kExecFailed, child_errno);
  }

  ExecResult result;
  const auto deadline = std::chrono::steady_clock::now() + options.timeout;
  std::array<pollfd, 2> fds{{{out.read_end(), POLLIN, 0}, {err.read_end(), POLLIN, 0}}};
  std::array<std::string*, 2> sinks{&result.stdout_data, &result.stderr_data};
  int open_streams = 2;
  bool timed_out = false;
  char buffer[4096];
  while (open_streams > 0) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      timed_out = true;
      break;
    }
    const int ready = ::poll(fds.data(), fds.size(), static_cast<int>(std::min<long long>(remaining.count(), 1000)));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      const int saved_errno = errno;
      ::kill(pid, SIGKILL);
      int wait_status = 0;
      ReapChild(pid, &wait_status);
      return ExecFailure(errors::io::kExecFailed, errors::msg::kExecFailed, saved_errno);
    }
    for (size_t idx = 0; idx < fds.size(); ++idx) {
      if (fds[idx].fd < 0 || (fds[idx].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      const ssize_t got = ::read(fds[idx].fd, buffer, sizeof(buffer));
      if (got < 0 && errno == EINTR) {
        continue;
      }
      if (got <= 0) {
        fds[idx].fd = -1;
        --open_streams;
        continue;
      }
      auto* sink = sinks[idx];
      const size_t room = options.max_output_bytes > sink->size() ? options.max_output_bytes - sink->size() : 0;
      sink->append(buffer, std::min(room, static_cast<size_t>(got)));
    }
  }

  if (timed_out) {
    ::kill(pid, SIGKILL);
    int wait_status = 0;
    ReapChild(pid, &wait_status);
    orchestrator::PublishSecurityEvent("exec_timeout", errors::msg::kExecTimedOut,
                                       {EventField("binary", binary),
                                        EventField("timeout_ms", std::to_string(options.timeout.count()),
                                                   FieldPrivacy::kPublic, true)});
    return ExecFailure(errors::io::kExecTimedOut, errors::msg::kExecTimedOut, 0, Retryability::kTransient);
  }

  int wait_status = 0;
  ReapChild(pid, &wait_status);
  if (WIFEXITED(wait_status)) {
    result.exit_code = WEXITSTATUS(wait_status);
  } else if (WIFSIGNALED(wait_status)) {
    result.term_signal = WTERMSIG(wait_status);
  }
  return result;
}

}  // namespace tg::security

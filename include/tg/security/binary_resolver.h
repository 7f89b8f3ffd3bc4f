#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "tg/status.h"

namespace tg::security {

[[nodiscard]] std::vector<std::filesystem::path> DefaultTrustedBinaryDirs();
[[nodiscard]] std::map<std::string, std::filesystem::path> DefaultKnownBinaries();

// Fixed at construction; a resolver never consults the caller's PATH.
struct BinaryResolverConfig {
  std::vector<std::filesystem::path> trusted_dirs{DefaultTrustedBinaryDirs()};
  std::map<std::string, std::filesystem::path> known_binaries{DefaultKnownBinaries()};
};

struct ExecOptions {
  std::chrono::milliseconds timeout{30000};
  size_t max_output_bytes{1024 * 1024};
  // Applied after sanitization in SafeEnvExec; dangerous keys are still dropped.
  std::map<std::string, std::string> extra_env;
};

struct ExecResult {
  int exit_code{-1};
  int term_signal{0};
  std::string stdout_data;
  std::string stderr_data;
};

// LD_*, DYLD_* and the interpreter hook variables.
[[nodiscard]] bool IsDangerousEnvKey(std::string_view key) noexcept;

class BinaryResolver {
public:
  explicit BinaryResolver(BinaryResolverConfig config);

  [[nodiscard]] const std::vector<std::filesystem::path>& trusted_dirs() const noexcept { return trusted_dirs_; }

  // Plain file names only. The known-binary map is consulted first, then each
  // trusted directory in order.
  [[nodiscard]] Result<std::filesystem::path> SecureWhich(std::string_view name) const;

  // Absolute path whose directory is trusted, whose canonical location is also
  // inside a trusted directory, and which is a regular executable file that is
  // not world-writable.
  [[nodiscard]] bool IsTrustedBinaryPath(const std::filesystem::path& path) const noexcept;

  // fork/execve of the resolved absolute path; no shell is involved.
  [[nodiscard]] Result<ExecResult> SecureExec(std::string_view name, const std::vector<std::string>& args,
                                              const ExecOptions& options = {}) const;
  // As SecureExec with dangerous variables removed and PATH reset to the
  // trusted directories.
  [[nodiscard]] Result<ExecResult> SafeEnvExec(std::string_view name, const std::vector<std::string>& args,
                                               const ExecOptions& options = {}) const;

  [[nodiscard]] std::vector<std::string> BuildSafeEnvironment(
      const std::map<std::string, std::string>& base) const;

private:
  Result<ExecResult> Run(std::string_view name, const std::vector<std::string>& args,
                         const std::vector<std::string>& env, const ExecOptions& options) const;

  std::vector<std::filesystem::path> trusted_dirs_;
  std::map<std::string, std::filesystem::path> known_binaries_;
};

}  // namespace tg::security

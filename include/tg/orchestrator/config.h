#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <vector>

#include "tg/orchestrator/event_bus.h"
#include "tg/orchestrator/gate_validator.h"
#include "tg/security/binary_resolver.h"
#include "tg/security/input_sanitizer.h"

namespace tg::orchestrator {

inline constexpr std::chrono::milliseconds kDefaultLockTimeout{5000};
inline constexpr size_t kDefaultLedgerMaxBytes = 100ull * 1024 * 1024;

// Explicit configuration value handed to each component. Nothing reads the
// environment after LoadConfigFromEnvironment returns.
struct TrustConfig {
  std::filesystem::path root_dir;
  std::filesystem::path state_dir;
  std::filesystem::path tasks_dir;
  std::filesystem::path log_dir;
  std::filesystem::path lock_dir;
  std::filesystem::path ledger_path;

  size_t ledger_max_bytes{kDefaultLedgerMaxBytes};
  size_t event_log_max_bytes{kDefaultEventLogMaxBytes};
  std::chrono::milliseconds ledger_lock_timeout{kDefaultLockTimeout};
  std::chrono::milliseconds ledger_read_timeout{kDefaultLockTimeout};
  std::chrono::milliseconds state_lock_timeout{kDefaultLockTimeout};

  security::JsonLimits json_limits;
  GateThresholds gate_thresholds;
  std::vector<std::filesystem::path> trusted_binary_dirs{security::DefaultTrustedBinaryDirs()};
};

// Derives state/tasks/log/lock directories and the ledger path from root.
[[nodiscard]] TrustConfig MakeDefaultConfig(const std::filesystem::path& root_dir);

// Reads the TG_* settings once. Malformed values keep their default and are
// published as configuration warnings.
[[nodiscard]] TrustConfig LoadConfigFromEnvironment();

// <log_dir>/security-events.jsonl with the configured size limit.
[[nodiscard]] EventLogOptions MakeEventLogOptions(const TrustConfig& config);
// Points the event bus sink at config.log_dir. Warnings raised while the
// configuration was loading are written there first.
void ConfigureEventLog(const TrustConfig& config);

}  // namespace tg::orchestrator

#include "tg/orchestrator/config.h"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include "tg/common.h"
#include "tg/errors.h"
#include "tg/orchestrator/event_bus.h"

namespace tg::orchestrator {
namespace {

const char* NonEmptyEnv(const char* name) {
  const char* value = std::getenv(name);
  if (!value || *value == '\0') {
    return nullptr;
  }
  return value;
}

void ReportMalformed(std::string_view name) {
  PublishEvent(EventCategory::kSecurity, EventSeverity::kWarning, "config_value_malformed",
               "Configuration value malformed; default kept",
               {EventField("setting", std::string(name)),
                EventField("reason", std::string(ReasonTag(errors::config::kMalformedSetting)))});
}

template <typename T>
std::optional<T> ParseUnsigned(std::string_view text) {
  text = TrimAsciiWhitespace(text);
  T value{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || text.front() == '-' || ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

template <typename T>
void ReadUnsigned(const char* name, T& target, bool allow_zero = false) {
  const char* raw = NonEmptyEnv(name);
  if (!raw) {
    return;
  }
  auto parsed = ParseUnsigned<T>(raw);
  if (!parsed || (!allow_zero && *parsed == 0)) {
    ReportMalformed(name);
    return;
  }
  target = *parsed;
}

void ReadMilliseconds(const char* name, std::chrono::milliseconds& target) {
  const char* raw = NonEmptyEnv(name);
  if (!raw) {
    return;
  }
  auto parsed = ParseUnsigned<uint32_t>(raw);
  if (!parsed || *parsed == 0) {
    ReportMalformed(name);
    return;
  }
  target = std::chrono::milliseconds(*parsed);
}

void ReadPercentage(const char* name, double& target) {
  const char* raw = NonEmptyEnv(name);
  if (!raw) {
    return;
  }
  const std::string_view text = TrimAsciiWhitespace(raw);
  double value = 0.0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc() || ptr != text.data() + text.size() || !std::isfinite(value)) {
    ReportMalformed(name);
    return;
  }
  // floors are applied later by GateValidator, which also logs the clamp
  target = value;
}

void ReadBool(const char* name, bool& target) {
  const char* raw = NonEmptyEnv(name);
  if (!raw) {
    return;
  }
  const std::string_view text = TrimAsciiWhitespace(raw);
  if (text == "1" || text == "true" || text == "yes" || text == "on") {
    target = true;
  } else if (text == "0" || text == "false" || text == "no" || text == "off") {
    target = false;
  } else {
    ReportMalformed(name);
  }
}

std::vector<std::filesystem::path> ParseTrustedDirs(std::string_view list) {
  std::vector<std::filesystem::path> dirs;
  size_t start = 0;
  while (start <= list.size()) {
    size_t end = list.find(':', start);
    if (end == std::string_view::npos) {
      end = list.size();
    }
    const auto entry = TrimAsciiWhitespace(list.substr(start, end - start));
    if (!entry.empty()) {
      std::filesystem::path dir{std::string(entry)};
      if (dir.is_absolute()) {
        dirs.push_back(dir.lexically_normal());
      } else {
        PublishSecurityEvent("trusted_dir_rejected", "Relative trusted binary directory dropped",
                             {EventField("dir", std::string(entry), FieldPrivacy::kHash)});
      }
    }
    start = end + 1;
  }
  return dirs;
}

} // namespace

TrustConfig MakeDefaultConfig(const std::filesystem::path& root_dir) {
  TrustConfig config;
  config.root_dir = root_dir;
  config.state_dir = root_dir / ".tg" / "state";
  config.tasks_dir = root_dir / ".tg" / "tasks";
  config.log_dir = root_dir / ".tg" / "logs";
  config.lock_dir = config.state_dir / "locks";
  config.ledger_path = config.tasks_dir / "ledger.jsonl";
  return config;
}

TrustConfig LoadConfigFromEnvironment() {
  std::filesystem::path root;
  if (const char* raw = NonEmptyEnv("TG_ROOT_DIR")) {
    root = raw;
  } else {
    std::error_code ec;
    root = std::filesystem::current_path(ec);
    if (ec) {
      root = std::filesystem::temp_directory_path(ec);
    }
  }
  TrustConfig config = MakeDefaultConfig(root);

  if (const char* raw = NonEmptyEnv("TG_STATE_DIR")) {
    config.state_dir = raw;
  }
  if (const char* raw = NonEmptyEnv("TG_TASKS_DIR")) {
    config.tasks_dir = raw;
    config.ledger_path = config.tasks_dir / "ledger.jsonl";
  }
  if (const char* raw = NonEmptyEnv("TG_LOG_DIR")) {
    config.log_dir = raw;
  }
  config.lock_dir = config.state_dir / "locks";

  ReadMilliseconds("TG_LEDGER_LOCK_TIMEOUT_MS", config.ledger_lock_timeout);
  ReadMilliseconds("TG_LEDGER_READ_TIMEOUT_MS", config.ledger_read_timeout);
  ReadMilliseconds("TG_STATE_LOCK_TIMEOUT_MS", config.state_lock_timeout);

  size_t ledger_mb = config.ledger_max_bytes / (1024 * 1024);
  ReadUnsigned("TG_LEDGER_MAX_SIZE_MB", ledger_mb);
  if (ledger_mb > std::numeric_limits<size_t>::max() / (1024 * 1024)) {
    ReportMalformed("TG_LEDGER_MAX_SIZE_MB");
  } else {
    config.ledger_max_bytes = ledger_mb * 1024 * 1024;
  }

  ReadUnsigned("TG_EVENT_LOG_MAX_SIZE", config.event_log_max_bytes);

  ReadUnsigned("TG_MAX_JSON_BYTES", config.json_limits.max_bytes);
  ReadUnsigned("TG_MAX_JSON_DEPTH", config.json_limits.max_depth);
  ReadUnsigned("TG_MAX_JSON_ARRAY_ITEMS", config.json_limits.max_array_items);

  ReadPercentage("TG_MIN_COVERAGE", config.gate_thresholds.min_coverage);
  ReadPercentage("TG_MIN_SECURITY_SCORE", config.gate_thresholds.min_security_score);
  ReadUnsigned("TG_MAX_CRITICAL_VULNS", config.gate_thresholds.max_critical_vulns, true);
  ReadBool("TG_STRICT_MODE", config.gate_thresholds.strict_mode);

  if (const char* raw = NonEmptyEnv("TG_TRUSTED_BIN_DIRS")) {
    auto dirs = ParseTrustedDirs(raw);
    if (dirs.empty()) {
      ReportMalformed("TG_TRUSTED_BIN_DIRS");
    } else {
      PublishSecurityEvent("trusted_dirs_overridden", "Trusted binary directories overridden",
                           {EventField("count", std::to_string(dirs.size()), FieldPrivacy::kPublic, true)});
      config.trusted_binary_dirs = std::move(dirs);
    }
  }
  return config;
}

EventLogOptions MakeEventLogOptions(const TrustConfig& config) {
  EventLogOptions options;
  options.log_path = config.log_dir / kEventLogFileName;
  options.max_bytes = config.event_log_max_bytes;
  return options;
}

void ConfigureEventLog(const TrustConfig& config) {
  EventBus::Instance().ConfigureLogFile(MakeEventLogOptions(config));
}

}  // namespace tg::orchestrator

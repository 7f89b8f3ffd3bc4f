#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "tg/security/input_sanitizer.h"
#include "tg/status.h"

namespace tg::storage {

struct LedgerOptions {
  std::filesystem::path ledger_path;
  // Root the ledger must stay inside.
  std::filesystem::path base_dir;
  std::chrono::milliseconds lock_timeout{5000};
  std::chrono::milliseconds read_timeout{5000};
  size_t max_bytes{100ull * 1024 * 1024};
  security::JsonLimits json_limits;
};

struct IntegrityReport {
  bool pass{true};
  size_t total_lines{0};
  size_t invalid_lines{0};
  std::vector<size_t> invalid_line_numbers;  // 1-based
};

// JSON Lines event log. Writers serialize on an exclusive lock of
// <ledger>.lock, readers share it. Lines are never edited in place; rotation
// moves the whole file aside.
class Ledger {
public:
  using LineSink = std::function<void(std::string_view)>;

  explicit Ledger(LedgerOptions options);

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return options_.ledger_path; }
  [[nodiscard]] std::filesystem::path lock_path() const;

  // entry_json must be a single-line object with string event, id and
  // timestamp fields. A lock timeout is returned as lock.timeout and nothing
  // is written.
  [[nodiscard]] Status Append(std::string_view entry_json) const;
  // Adds a fresh 128-bit id and a UTC timestamp; returns the id.
  [[nodiscard]] Result<std::string> AppendEvent(std::string_view event,
                                                const nlohmann::json& payload = nlohmann::json::object()) const;

  // Lines containing filter as a plain substring; an empty filter matches all.
  [[nodiscard]] Result<std::vector<std::string>> ReadEntries(std::string_view filter = {}) const;
  [[nodiscard]] Status ReadEntries(std::string_view filter, const LineSink& sink) const;

  [[nodiscard]] Result<IntegrityReport> VerifyIntegrity() const;

  // True when the ledger was archived.
  [[nodiscard]] Result<bool> RotateIfNeeded() const;

private:
  [[nodiscard]] Status ValidateLocation() const;
  [[nodiscard]] Status ValidateEntry(std::string_view entry) const;
  // Caller holds the exclusive lock. Throws tg::Error.
  bool RotateLocked() const;

  LedgerOptions options_;
};

}  // namespace tg::storage

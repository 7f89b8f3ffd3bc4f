#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tg/status.h"

struct sqlite3;

namespace tg::storage {

inline constexpr int kSqliteSchemaVersion = 1;

struct SqliteStateOptions {
  std::filesystem::path state_root;
  std::filesystem::path db_path;
  std::chrono::milliseconds busy_timeout{5000};
};

struct StateRow {
  std::string file_path;
  std::string key;
  std::string value;
  std::string updated_at;
};

// Rejects an empty path, ".." components, a symlinked file or parent, and any
// location outside state_root. An unusual extension only logs a warning.
[[nodiscard]] Status ValidateDbPath(const std::filesystem::path& db_path, const std::filesystem::path& state_root);

// Literal-interpolation fallback for statements that cannot be prepared.
// Each ? outside a quoted literal becomes a quoted SqlEscape'd parameter.
[[nodiscard]] Result<std::string> InterpolateSqlLiterals(std::string_view sql_template,
                                                         const std::vector<std::string>& params);

class SqliteStateStore {
  struct OpenKey {
    explicit OpenKey() = default;
  };

public:
  // Validates, creates the file owner-only if needed, re-validates right
  // before open, then applies pragmas and the schema. Safe to repeat.
  [[nodiscard]] static Result<std::unique_ptr<SqliteStateStore>> Open(SqliteStateOptions options);

  // Only Open can produce the key.
  SqliteStateStore(OpenKey, sqlite3* db, SqliteStateOptions options) noexcept;
  SqliteStateStore(const SqliteStateStore&) = delete;
  SqliteStateStore& operator=(const SqliteStateStore&) = delete;
  ~SqliteStateStore();

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return options_.db_path; }

  [[nodiscard]] Status Set(std::string_view file_path, std::string_view key, std::string_view value);
  // nullopt when no row exists.
  [[nodiscard]] Result<std::optional<std::string>> Get(std::string_view file_path, std::string_view key) const;
  [[nodiscard]] Status Delete(std::string_view file_path, std::string_view key);
  [[nodiscard]] Result<std::vector<StateRow>> List(std::string_view file_path) const;
  [[nodiscard]] Result<int> SchemaVersion() const;

  // Every row as an INSERT statement inside one transaction.
  [[nodiscard]] Result<std::string> ExportStateSql() const;

private:
  sqlite3* db_;
  SqliteStateOptions options_;
};

// Convenience form of SqliteStateStore::Open for callers that only need the
// database to exist with the current schema.
[[nodiscard]] Status SqliteStateInit(const std::filesystem::path& db_path, const std::filesystem::path& state_root);

}  // namespace tg::storage

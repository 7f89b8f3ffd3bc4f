#include "tg/storage/sqlite_state.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <charconv>
#include <initializer_list>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <sqlite3.h>

#include "tg/common.h"
#include "tg/errors.h"
#include "tg/orchestrator/event_bus.h"
#include "tg/orchestrator/io_util.h"
#include "tg/security/input_sanitizer.h"
#include "tg/security/path_validator.h"

namespace tg::storage {
namespace {

using orchestrator::EventField;
using orchestrator::FieldPrivacy;

constexpr std::array<std::string_view, 3> kExpectedExtensions = {".db", ".sqlite", ".sqlite3"};

constexpr const char* kSchemaSql =
    "CREATE TABLE IF NOT EXISTS meta ("
    "  key TEXT PRIMARY KEY NOT NULL,"
    "  value TEXT NOT NULL);"
    "CREATE TABLE IF NOT EXISTS state ("
    "  file_path TEXT NOT NULL,"
    "  key TEXT NOT NULL,"
    "  value TEXT NOT NULL,"
    "  updated_at TEXT NOT NULL,"
    "  PRIMARY KEY (file_path, key));"
    "INSERT OR IGNORE INTO meta (key, value) VALUES ('schema_version', '1');";

Status PathRejected(int code, std::string_view message, const std::filesystem::path& db_path) {
  orchestrator::PublishSecurityEvent("sqlite_path_rejected", message,
                                     {EventField("path", PathToUtf8String(db_path), FieldPrivacy::kHash)});
  return Status::Fail(ErrorDomain::Validation, code, message);
}

Status SqliteFailure(sqlite3* db, int rc, std::string_view what) {
  std::string message(what);
  message += ": ";
  message += db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  const auto retry = (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) ? Retryability::kTransient : Retryability::kFatal;
  return Status::Fail(ErrorDomain::State, errors::state::kDatabaseQueryFailed, message, retry);
}

class Statement {
 public:
  Statement() = default;
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  ~Statement() { sqlite3_finalize(stmt_); }

  int Prepare(sqlite3* db, const char* sql) { return sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr); }
  int BindText(int index, std::string_view value) {
    return sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
  }
  int Step() { return sqlite3_step(stmt_); }
  [[nodiscard]] std::string ColumnText(int index) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    const int size = sqlite3_column_bytes(stmt_, index);
    return text ? std::string(text, static_cast<size_t>(size)) : std::string{};
  }

 private:
  sqlite3_stmt* stmt_{nullptr};
};

// Binds params in order; first failing rc wins.
int BindAll(Statement& stmt, std::initializer_list<std::string_view> params) {
  int index = 1;
  for (auto param : params) {
    if (const int rc = stmt.BindText(index++, param); rc != SQLITE_OK) {
      return rc;
    }
  }
  return SQLITE_OK;
}

Status CheckRowKey(std::string_view file_path, std::string_view key) {
  if (file_path.empty()) {
    return Status::Fail(ErrorDomain::Validation, errors::validation::kEmptyInput, errors::msg::kEmptyPath);
  }
  if (!security::ValidateIdentifier(key)) {
    return Status::Fail(ErrorDomain::Validation, errors::validation::kInvalidIdentifier,
                        errors::msg::kInvalidStateKey);
  }
  return Status::Ok();
}

// Creates the file 0600 without following a final symlink and tightens an
// existing file to 0600.
Status PrepareDatabaseFile(const std::filesystem::path& db_path) {
  int fd = -1;
  do {
    fd = ::open(db_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC | O_NOFOLLOW, 0600);
  } while (fd < 0 && errno == EINTR);
  if (fd < 0) {
    const int saved_errno = errno;
    if (saved_errno == ELOOP) {
      return PathRejected(errors::validation::kSymlinkRejected, errors::msg::kDatabaseSymlink, db_path);
    }
    return Status::Fail(ErrorDomain::State, errors::state::kDatabaseOpenFailed,
                        std::string(errors::msg::kDatabaseOpenFailed) + " (errno " + std::to_string(saved_errno) +
                            ")");
  }
  struct stat st {};
  Status status = Status::Ok();
  if (::fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
    status = Status::Fail(ErrorDomain::State, errors::state::kDatabaseOpenFailed, errors::msg::kNotRegularFile);
  } else if ((st.st_mode & 0777) != 0600 && ::fchmod(fd, 0600) != 0) {
    status = Status::Fail(ErrorDomain::State, errors::state::kDatabaseOpenFailed,
                          std::string(errors::msg::kDatabaseOpenFailed) + ": unable to restrict permissions");
  }
  ::close(fd);
  return status;
}

} // namespace

Status ValidateDbPath(const std::filesystem::path& db_path, const std::filesystem::path& state_root) {
  if (db_path.empty() || state_root.empty()) {
    return Status::Fail(ErrorDomain::Validation, errors::validation::kEmptyInput, errors::msg::kEmptyPath);
  }
  for (const auto& part : db_path) {
    if (part == "..") {
      return PathRejected(errors::validation::kPathEscape, errors::msg::kDatabaseTraversal, db_path);
    }
  }
  if (security::IsSymlink(db_path)) {
    return PathRejected(errors::validation::kSymlinkRejected, errors::msg::kDatabaseSymlink, db_path);
  }
  if (db_path.has_parent_path() && security::IsSymlink(db_path.parent_path())) {
    return PathRejected(errors::validation::kSymlinkRejected, errors::msg::kDatabaseParentSymlink, db_path);
  }
  if (auto status = security::CheckSymlinkSafe(db_path, state_root); !status) {
    return status;
  }
  const auto extension = db_path.extension().string();
  if (std::find(kExpectedExtensions.begin(), kExpectedExtensions.end(), extension) == kExpectedExtensions.end()) {
    orchestrator::PublishEvent(orchestrator::EventCategory::kSecurity, orchestrator::EventSeverity::kWarning,
                               "sqlite_unusual_extension", "Database path has an unusual extension",
                               {EventField("extension", extension)});
  }
  return Status::Ok();
}

Result<std::string> InterpolateSqlLiterals(std::string_view sql_template, const std::vector<std::string>& params) {
  std::string out;
  out.reserve(sql_template.size() + params.size() * 8);
  size_t next = 0;
  bool in_literal = false;
  for (char ch : sql_template) {
    if (ch == '\'') {
      // a doubled quote inside a literal toggles twice and stays inside
      in_literal = !in_literal;
      out.push_back(ch);
      continue;
    }
    if (ch == '?' && !in_literal) {
      if (next >= params.size()) {
        return Status::Fail(ErrorDomain::Validation, errors::validation::kParameterMismatch,
                            errors::msg::kSqlParameterMismatch);
      }
      out.push_back('\'');
      out += security::SqlEscape(params[next++]);
      out.push_back('\'');
      continue;
    }
    out.push_back(ch);
  }
  if (in_literal || next != params.size()) {
    return Status::Fail(ErrorDomain::Validation, errors::validation::kParameterMismatch,
                        errors::msg::kSqlParameterMismatch);
  }
  return out;
}

SqliteStateStore::SqliteStateStore(OpenKey, sqlite3* db, SqliteStateOptions options) noexcept
    : db_(db), options_(std::move(options)) {}

SqliteStateStore::~SqliteStateStore() { sqlite3_close_v2(db_); }

Result<std::unique_ptr<SqliteStateStore>> SqliteStateStore::Open(SqliteStateOptions options) {
  if (auto status = ValidateDbPath(options.db_path, options.state_root); !status) {
    return status;
  }
  if (auto status = CaptureStatus([&] { orchestrator::EnsurePrivateDirectory(options.db_path.parent_path()); });
      !status) {
    return status;
  }
  if (auto status = ValidateDbPath(options.db_path, options.state_root); !status) {
    return status;
  }
  if (auto status = PrepareDatabaseFile(options.db_path); !status) {
    return status;
  }

  // last check before sqlite resolves the name; NOFOLLOW covers the final hop
  if (security::IsSymlink(options.db_path) || security::IsSymlink(options.db_path.parent_path())) {
    orchestrator::PublishSecurityEvent("sqlite_symlink_swap", errors::msg::kSymlinkSwapped,
                                       {EventField("path", PathToUtf8String(options.db_path), FieldPrivacy::kHash)},
                                       orchestrator::EventSeverity::kCritical);
    return Status::Fail(ErrorDomain::Security, errors::security::kSymlinkSwapDetected, errors::msg::kSymlinkSwapped);
  }

  sqlite3* raw = nullptr;
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_NOFOLLOW | SQLITE_OPEN_FULLMUTEX;
  const int open_rc = sqlite3_open_v2(options.db_path.c_str(), &raw, flags, nullptr);
  auto store = std::make_unique<SqliteStateStore>(OpenKey{}, raw, std::move(options));
  if (open_rc != SQLITE_OK) {
    auto status = SqliteFailure(raw, open_rc, errors::msg::kDatabaseOpenFailed);
    return Status::Fail(ErrorDomain::State, errors::state::kDatabaseOpenFailed, status.message());
  }

  sqlite3_busy_timeout(store->db_, static_cast<int>(store->options_.busy_timeout.count()));
  char* error_text = nullptr;
  const int pragma_rc = sqlite3_exec(store->db_,
                                     "PRAGMA journal_mode=WAL;"
                                     "PRAGMA synchronous=NORMAL;"
                                     "PRAGMA foreign_keys=ON;",
                                     nullptr, nullptr, &error_text);
  sqlite3_free(error_text);
  if (pragma_rc != SQLITE_OK) {
    return SqliteFailure(store->db_, pragma_rc, "Applying pragmas");
  }
  const int schema_rc = sqlite3_exec(store->db_, kSchemaSql, nullptr, nullptr, &error_text);
  sqlite3_free(error_text);
  if (schema_rc != SQLITE_OK) {
    return SqliteFailure(store->db_, schema_rc, "Applying schema");
  }

  auto version = store->SchemaVersion();
  if (!version) {
    return version.status();
  }
  if (*version != kSqliteSchemaVersion) {
    return Status::Fail(ErrorDomain::State, errors::state::kSchemaMismatch, errors::msg::kSchemaMismatch);
  }
  return store;
}

Result<int> SqliteStateStore::SchemaVersion() const {
  Statement stmt;
  if (const int rc = stmt.Prepare(db_, "SELECT value FROM meta WHERE key = 'schema_version'"); rc != SQLITE_OK) {
    return SqliteFailure(db_, rc, errors::msg::kDatabaseQueryFailed);
  }
  const int rc = stmt.Step();
  if (rc != SQLITE_ROW) {
    return Status::Fail(ErrorDomain::State, errors::state::kSchemaMismatch, errors::msg::kSchemaMismatch);
  }
  const std::string text = stmt.ColumnText(0);
  int version = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), version);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return Status::Fail(ErrorDomain::State, errors::state::kSchemaMismatch, errors::msg::kSchemaMismatch);
  }
  return version;
}

Status SqliteStateStore::Set(std::string_view file_path, std::string_view key, std::string_view value) {
  if (auto status = CheckRowKey(file_path, key); !status) {
    return status;
  }
  Statement stmt;
  int rc = stmt.Prepare(db_,
                        "INSERT INTO state (file_path, key, value, updated_at) VALUES (?, ?, ?, ?) "
                        "ON CONFLICT (file_path, key) DO UPDATE SET value = excluded.value, "
                        "updated_at = excluded.updated_at");
  if (rc != SQLITE_OK) {
    return SqliteFailure(db_, rc, errors::msg::kDatabaseQueryFailed);
  }
  const std::string now = FormatIsoTimestamp(std::chrono::system_clock::now());
  if (rc = BindAll(stmt, {file_path, key, value, now}); rc != SQLITE_OK) {
    return SqliteFailure(db_, rc, errors::msg::kDatabaseQueryFailed);
  }
  if (rc = stmt.Step(); rc != SQLITE_DONE) {
    return SqliteFailure(db_, rc, errors::msg::kDatabaseQueryFailed);
  }
  return Status::Ok();
}

Result<std::optional<std::string>> SqliteStateStore::Get(std::string_view file_path, std::string_view key) const {
  if (auto status = CheckRowKey(file_path, key); !status) {
    return status;
  }
  Statement stmt;
  int rc = stmt.Prepare(db_, "SELECT value FROM state WHERE file_path = ? AND key = ?");
  if (rc != SQLITE_OK) {
    return SqliteFailure(db_, rc, errors::msg::kDatabaseQueryFailed);
  }
  if (rc = BindAll(stmt, {file_path, key}); rc != SQLITE_OK) {
    return SqliteFailure(db_, rc, errors::msg::kDatabaseQueryFailed);
  }
  rc = stmt.Step();
  if (rc == SQLITE_DONE) {
    return std::optional<std::string>{};
  }
  if (rc != SQLITE_ROW) {
    return SqliteFailure(db_, rc, errors::msg::kDatabaseQueryFailed);
  }
  return std::optional<std::string>{stmt.ColumnText(0)};
}

Status SqliteStateStore::Delete(std::string_view file_path, std::string_view key) {
  if (auto status = CheckRowKey(file_path, key); !status) {
    return status;
  }
  Statement stmt;
  int rc = stmt.Prepare(db_, "DELETE FROM state WHERE file_path = ? AND key = ?");
  if (rc != SQLITE_OK) {
    return SqliteFailure(db_, rc, errors::msg::kDatabaseQueryFailed);
  }
  if (rc = BindAll(stmt, {file_path, key}); rc != SQLITE_OK) {
    return SqliteFailure(db_, rc, errors::msg::kDatabaseQueryFailed);
  }
  if (rc = stmt.Step(); rc != SQLITE_DONE) {
    return SqliteFailure(db_, rc, errors::msg::kDatabaseQueryFailed);
  }
  return Status::Ok();
}

Result<std::vector<StateRow>> SqliteStateStore::List(std::string_view file_path) const {
  Statement stmt;
  const bool all = file_path.empty();
  int rc = stmt.Prepare(db_, all ? "SELECT file_path, key, value, updated_at FROM state ORDER BY file_path, key"
                                 : "SELECT file_path, key, value, updated_at FROM state WHERE file_path = ? "
                                   "ORDER BY key");
  if (rc != SQLITE_OK) {
    return SqliteFailure(db_, rc, errors::msg::kDatabaseQueryFailed);
  }
  if (!all) {
    if (rc = stmt.BindText(1, file_path); rc != SQLITE_OK) {
      return SqliteFailure(db_, rc, errors::msg::kDatabaseQueryFailed);
    }
  }
  std::vector<StateRow> rows;
  while ((rc = stmt.Step()) == SQLITE_ROW) {
    rows.push_back({stmt.ColumnText(0), stmt.ColumnText(1), stmt.ColumnText(2), stmt.ColumnText(3)});
  }
  if (rc != SQLITE_DONE) {
    return SqliteFailure(db_, rc, errors::msg::kDatabaseQueryFailed);
  }
  return rows;
}

Result<std::string> SqliteStateStore::ExportStateSql() const {
  auto rows = List({});
  if (!rows) {
    return rows.status();
  }
  std::string out = "BEGIN TRANSACTION;\n";
  for (const auto& row : *rows) {
    out += "INSERT INTO state (file_path, key, value, updated_at) VALUES ('";
    out += security::SqlEscape(row.file_path);
    out += "', '";
    out += security::SqlEscape(row.key);
    out += "', '";
    out += security::SqlEscape(row.value);
    out += "', '";
    out += security::SqlEscape(row.updated_at);
    out += "');\n";
  }
  out += "COMMIT;\n";
  return out;
}

Status SqliteStateInit(const std::filesystem::path& db_path, const std::filesystem::path& state_root) {
  auto store = SqliteStateStore::Open({state_root, db_path});
  return store ? Status::Ok() : store.status();
}

}  // namespace tg::storage

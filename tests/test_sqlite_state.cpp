#include "tg/storage/sqlite_state.h"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <type_traits>
#include <vector>

#include <sqlite3.h>
#include <sys/stat.h>

#include "test_support.h"

namespace {

namespace fs = std::filesystem;
using tg::storage::InterpolateSqlLiterals;
using tg::storage::SqliteStateOptions;
using tg::storage::SqliteStateStore;
using tg::storage::ValidateDbPath;

// Stores only come out of Open; a raw handle cannot be wrapped directly.
static_assert(!std::is_constructible_v<SqliteStateStore, sqlite3*, SqliteStateOptions>);
static_assert(!std::is_copy_constructible_v<SqliteStateStore>);

SqliteStateOptions OptionsFor(const fs::path& root, const fs::path& db) {
  SqliteStateOptions options;
  options.state_root = root;
  options.db_path = db;
  return options;
}

mode_t ModeOf(const fs::path& path) {
  struct stat st {};
  assert(::stat(path.c_str(), &st) == 0);
  return st.st_mode & 0777;
}

// Replays exported SQL into a scratch in-memory database.
int ReplayExport(const std::string& sql) {
  sqlite3* db = nullptr;
  assert(sqlite3_open(":memory:", &db) == SQLITE_OK);
  assert(sqlite3_exec(db,
                      "CREATE TABLE state (file_path TEXT NOT NULL, key TEXT NOT NULL, value TEXT NOT NULL, "
                      "updated_at TEXT NOT NULL, PRIMARY KEY (file_path, key));",
                      nullptr, nullptr, nullptr) == SQLITE_OK);
  assert(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr) == SQLITE_OK);
  sqlite3_stmt* stmt = nullptr;
  assert(sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM state WHERE value = 'O''Reilly''s; DROP TABLE state; --'", -1,
                            &stmt, nullptr) == SQLITE_OK);
  assert(sqlite3_step(stmt) == SQLITE_ROW);
  const int injected_rows = sqlite3_column_int(stmt, 0);
  sqlite3_finalize(stmt);
  assert(sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM state", -1, &stmt, nullptr) == SQLITE_OK);
  assert(sqlite3_step(stmt) == SQLITE_ROW);
  const int rows = sqlite3_column_int(stmt, 0);
  sqlite3_finalize(stmt);
  sqlite3_close(db);
  assert(injected_rows == 1);
  return rows;
}

void TestOpenAndCrud(const fs::path& root) {
  const auto db_path = root / "db" / "state.db";
  {
    auto opened = SqliteStateStore::Open(OptionsFor(root, db_path));
    assert(opened);
    auto& store = *opened.value();
    assert(ModeOf(db_path) == 0600);
    assert(ModeOf(db_path.parent_path()) == 0700);

    auto version = store.SchemaVersion();
    assert(version && *version == tg::storage::kSqliteSchemaVersion);

    assert(store.Set("tasks/t1", "phase", "build"));
    assert(store.Set("tasks/t1", "owner", "worker-2"));
    assert(store.Set("tasks/t2", "phase", "review"));
    assert(store.Set("tasks/t1", "phase", "test"));

    auto phase = store.Get("tasks/t1", "phase");
    assert(phase && phase->has_value() && **phase == "test");
    auto absent = store.Get("tasks/t1", "missing");
    assert(absent && !absent->has_value());

    // hostile values are data, never SQL
    const std::string hostile = "O'Reilly's; DROP TABLE state; --";
    assert(store.Set("tasks/t3", "note", hostile));
    auto note = store.Get("tasks/t3", "note");
    assert(note && note->has_value() && **note == hostile);

    auto t1 = store.List("tasks/t1");
    assert(t1 && t1->size() == 2);
    assert((*t1)[0].key == "owner");
    assert((*t1)[1].key == "phase");
    assert((*t1)[1].value == "test");
    assert(!(*t1)[1].updated_at.empty());
    auto all = store.List("");
    assert(all && all->size() == 4);

    assert(store.Delete("tasks/t1", "owner"));
    assert(store.Delete("tasks/t1", "owner"));
    auto after_delete = store.List("tasks/t1");
    assert(after_delete && after_delete->size() == 1);

    auto bad_key = store.Set("tasks/t1", "bad key", "v");
    assert(!bad_key);
    assert(bad_key.tag() == "validation.invalid_identifier");
    auto empty_file = store.Set("", "phase", "v");
    assert(!empty_file);
    assert(empty_file.tag() == "validation.empty_input");
    assert(!store.Get("tasks/t1", "x;DROP"));

    auto exported = store.ExportStateSql();
    assert(exported);
    assert(exported->rfind("BEGIN TRANSACTION;\n", 0) == 0);
    assert(exported->size() > 8 && exported->substr(exported->size() - 8) == "COMMIT;\n");
    assert(exported->find("O''Reilly''s") != std::string::npos);
    assert(ReplayExport(*exported) == 3);
  }

  // reopening keeps data and does not re-seed the schema
  auto reopened = SqliteStateStore::Open(OptionsFor(root, db_path));
  assert(reopened);
  auto phase = reopened.value()->Get("tasks/t1", "phase");
  assert(phase && phase->has_value() && **phase == "test");
  assert(tg::storage::SqliteStateInit(db_path, root));
  auto rows = reopened.value()->List("");
  assert(rows && rows->size() == 3);
}

void TestPathRejections(const fs::path& root, const fs::path& outside) {
  tg_test::EventRecorder recorder;

  auto traversal = ValidateDbPath(root / "db" / ".." / "state.db", root);
  assert(!traversal);
  assert(traversal.tag() == "validation.path_escape");
  assert(!ValidateDbPath("", root));
  auto escaped = ValidateDbPath(outside / "state.db", root);
  assert(!escaped);
  assert(escaped.tag() == "validation.path_escape");

  // symlinked database file
  const auto victim = outside / "victim.db";
  tg_test::WriteText(victim, "");
  fs::create_symlink(victim, root / "linked.db");
  auto file_link = ValidateDbPath(root / "linked.db", root);
  assert(!file_link);
  assert(file_link.tag() == "validation.symlink_rejected");
  assert(!SqliteStateStore::Open(OptionsFor(root, root / "linked.db")));
  assert(tg_test::ReadText(victim).empty());

  // symlinked parent directory, even one that stays inside the root
  fs::create_directories(root / "realdir");
  fs::create_directory_symlink(root / "realdir", root / "linkdir");
  auto parent_link = ValidateDbPath(root / "linkdir" / "state.db", root);
  assert(!parent_link);
  assert(parent_link.tag() == "validation.symlink_rejected");
  assert(!SqliteStateStore::Open(OptionsFor(root, root / "linkdir" / "state.db")));
  assert(!fs::exists(root / "realdir" / "state.db"));
  assert(recorder.Saw("sqlite_path_rejected"));

  // unusual extension is allowed with a warning
  recorder.Clear();
  assert(ValidateDbPath(root / "state.data", root));
  assert(recorder.Saw("sqlite_unusual_extension"));
}

void TestPermissionsTightened(const fs::path& root) {
  const auto loose = root / "loose.sqlite";
  tg_test::WriteText(loose, "");
  fs::permissions(loose, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read |
                             fs::perms::others_read);
  assert(ModeOf(loose) == 0644);
  auto store = SqliteStateStore::Open(OptionsFor(root, loose));
  assert(store);
  assert(ModeOf(loose) == 0600);
}

void TestInterpolation() {
  auto basic = InterpolateSqlLiterals("SELECT value FROM state WHERE file_path = ? AND key = ?", {"t1", "O'Reilly"});
  assert(basic);
  assert(*basic == "SELECT value FROM state WHERE file_path = 't1' AND key = 'O''Reilly'");

  // placeholders inside literals are text
  auto quoted = InterpolateSqlLiterals("SELECT '?', 'it''s ?' WHERE key = ?", {"k"});
  assert(quoted);
  assert(*quoted == "SELECT '?', 'it''s ?' WHERE key = 'k'");

  auto injection = InterpolateSqlLiterals("DELETE FROM state WHERE key = ?", {"x' OR '1'='1"});
  assert(injection);
  assert(*injection == "DELETE FROM state WHERE key = 'x'' OR ''1''=''1'");

  auto none = InterpolateSqlLiterals("SELECT 1", {});
  assert(none && *none == "SELECT 1");

  auto too_few = InterpolateSqlLiterals("SELECT ? , ?", {"a"});
  assert(!too_few);
  assert(too_few.status().tag() == "validation.parameter_mismatch");
  assert(!InterpolateSqlLiterals("SELECT ?", {"a", "b"}));
  assert(!InterpolateSqlLiterals("SELECT 'unterminated", {}));
}

}  // namespace

int main() {
  tg_test::TempDir temp("tg_sqlite_state_");
  tg_test::RouteEventLog(temp.path());
  const auto root = temp.path() / "state";
  const auto outside = temp.path() / "outside";
  fs::create_directories(root);
  fs::create_directories(outside);

  TestOpenAndCrud(root);
  TestPathRejections(root, outside);
  TestPermissionsTightened(root);
  TestInterpolation();

  std::cout << "sqlite state tests ok\n";
  return 0;
}

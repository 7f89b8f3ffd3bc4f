#include "tg/storage/ledger.h"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "tg/orchestrator/file_lock.h"
#include "test_support.h"

namespace {

namespace fs = std::filesystem;
using tg::storage::Ledger;
using tg::storage::LedgerOptions;

LedgerOptions OptionsFor(const fs::path& tasks_dir) {
  LedgerOptions options;
  options.ledger_path = tasks_dir / "ledger.jsonl";
  options.base_dir = tasks_dir;
  options.lock_timeout = std::chrono::milliseconds(10000);
  options.read_timeout = std::chrono::milliseconds(2000);
  return options;
}

std::string Entry(const std::string& event, const std::string& id) {
  return nlohmann::json{{"event", event}, {"id", id}, {"timestamp", "2026-01-01T00:00:00Z"}}.dump();
}

void TestRoundTrip(const fs::path& dir) {
  const Ledger ledger{OptionsFor(dir / "roundtrip")};

  // first append creates the directory and file
  const auto first = Entry("task_started", "a1");
  assert(ledger.Append(first));
  assert(ledger.Append("  " + Entry("task_finished", "a2") + "\n"));

  auto all = ledger.ReadEntries();
  assert(all);
  assert(all->size() == 2);
  assert((*all)[0] == first);
  assert((*all)[1] == Entry("task_finished", "a2"));

  auto filtered = ledger.ReadEntries("task_started");
  assert(filtered && filtered->size() == 1);
  assert(filtered->front() == first);
  // filters are plain text, not patterns
  auto literal = ledger.ReadEntries("task_.*");
  assert(literal && literal->empty());

  auto id = ledger.AppendEvent("gate_passed", {{"coverage", 91.5}, {"task", "t-7"}});
  assert(id);
  assert(id->size() == 32);
  auto gate = ledger.ReadEntries("gate_passed");
  assert(gate && gate->size() == 1);
  const auto parsed = nlohmann::json::parse(gate->front());
  assert(parsed["event"] == "gate_passed");
  assert(parsed["id"] == *id);
  assert(parsed["timestamp"].get<std::string>().back() == 'Z');
  assert(parsed["coverage"] == 91.5);

  auto second_id = ledger.AppendEvent("gate_passed");
  assert(second_id && *second_id != *id);
  assert(!ledger.AppendEvent("bad", nlohmann::json::array({1, 2})));

  auto report = ledger.VerifyIntegrity();
  assert(report && report->pass);
  assert(report->total_lines == 4);

  std::vector<std::string> streamed;
  assert(ledger.ReadEntries("", [&](std::string_view line) { streamed.emplace_back(line); }));
  assert(streamed.size() == 4);

  // a missing ledger reads empty and verifies clean
  const Ledger empty{OptionsFor(dir / "empty")};
  auto none = empty.ReadEntries();
  assert(none && none->empty());
  auto clean = empty.VerifyIntegrity();
  assert(clean && clean->pass && clean->total_lines == 0);
}

void TestEntryShape(const fs::path& dir) {
  const Ledger ledger{OptionsFor(dir / "shape")};
  const std::vector<std::pair<std::string, std::string>> rejected = {
      {R"({"event":"x","id":"1",)" "\n" R"("timestamp":"t"})", "validation.ledger_entry_shape"},
      {R"([1,2,3])", "validation.ledger_entry_shape"},
      {R"("just a string")", "validation.ledger_entry_shape"},
      {R"({"event":"x","timestamp":"t"})", "validation.ledger_entry_shape"},
      {R"({"event":"x","id":7,"timestamp":"t"})", "validation.ledger_entry_shape"},
      {R"({"event":"x","id":"1","timestamp":"t")", "validation.json_malformed"},
      {"", "validation.json_malformed"},
  };
  for (const auto& [entry, tag] : rejected) {
    auto status = ledger.Append(entry);
    assert(!status);
    assert(status.tag() == tag);
  }

  std::string deep = R"({"event":"x","id":"1","timestamp":"t","p":)";
  for (int i = 0; i < 25; ++i) {
    deep += "[";
  }
  for (int i = 0; i < 25; ++i) {
    deep += "]";
  }
  deep += "}";
  auto too_deep = ledger.Append(deep);
  assert(!too_deep);
  assert(too_deep.tag() == "validation.json_too_deep");

  assert(!fs::exists(ledger.path()));
}

void TestIntegrity(const fs::path& dir) {
  const auto tasks = dir / "integrity";
  fs::create_directories(tasks);
  const Ledger ledger{OptionsFor(tasks)};
  tg_test::WriteText(ledger.path(), Entry("a", "1") + "\n" + "{\"event\":\"b\",\"id\":\n" + "\n" + Entry("c", "3") +
                                        "\n" + "not json at all\n");

  tg_test::EventRecorder recorder;
  auto report = ledger.VerifyIntegrity();
  assert(report);
  assert(!report->pass);
  assert(report->total_lines == 4);
  assert(report->invalid_lines == 2);
  assert((report->invalid_line_numbers == std::vector<size_t>{2, 5}));
  assert(recorder.Saw("ledger_integrity_failed"));

  // an unterminated last line is moved off before the next append
  const Ledger torn{OptionsFor(dir / "torn")};
  fs::create_directories(dir / "torn");
  tg_test::WriteText(torn.path(), Entry("a", "1"));
  assert(torn.Append(Entry("b", "2")));
  assert(tg_test::ReadText(torn.path()) == Entry("a", "1") + "\n" + Entry("b", "2") + "\n");
  auto torn_report = torn.VerifyIntegrity();
  assert(torn_report && torn_report->pass && torn_report->total_lines == 2);
}

void TestConcurrentAppends(const fs::path& dir) {
  const Ledger ledger{OptionsFor(dir / "concurrent")};
  constexpr int kWriters = 50;
  std::vector<pid_t> children;
  for (int writer = 0; writer < kWriters; ++writer) {
    const pid_t pid = ::fork();
    if (pid == 0) {
      nlohmann::json payload{{"writer", writer}, {"padding", std::string(512, 'p')}};
      ::_exit(ledger.AppendEvent("concurrent_write", payload) ? 0 : 1);
    }
    assert(pid > 0);
    children.push_back(pid);
  }
  for (const pid_t pid : children) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
    }
    assert(WIFEXITED(status) && WEXITSTATUS(status) == 0);
  }

  auto entries = ledger.ReadEntries("concurrent_write");
  assert(entries);
  assert(entries->size() == static_cast<size_t>(kWriters));
  std::vector<bool> seen(kWriters, false);
  for (const auto& line : *entries) {
    const auto parsed = nlohmann::json::parse(line);
    seen[parsed["writer"].get<size_t>()] = true;
  }
  for (const bool writer_seen : seen) {
    assert(writer_seen);
  }
  auto report = ledger.VerifyIntegrity();
  assert(report && report->pass && report->total_lines == static_cast<size_t>(kWriters));
}

void TestLockTimeout(const fs::path& dir) {
  auto options = OptionsFor(dir / "locked");
  options.lock_timeout = std::chrono::milliseconds(200);
  options.read_timeout = std::chrono::milliseconds(200);
  const Ledger ledger{options};
  assert(ledger.Append(Entry("before", "1")));

  {
    auto held = tg::orchestrator::ScopedFileLock::Acquire(ledger.lock_path(), tg::orchestrator::LockMode::kExclusive,
                                                          std::chrono::milliseconds(100));
    assert(held);
    const auto start = std::chrono::steady_clock::now();
    auto blocked = ledger.Append(Entry("during", "2"));
    assert(!blocked);
    assert(blocked.tag() == "lock.timeout");
    assert(blocked.IsLockTimeout());
    assert(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(180));

    auto read_blocked = ledger.ReadEntries();
    assert(!read_blocked);
    assert(read_blocked.status().tag() == "lock.timeout");
  }

  // readers share
  {
    auto reader = tg::orchestrator::ScopedFileLock::Acquire(ledger.lock_path(), tg::orchestrator::LockMode::kShared,
                                                            std::chrono::milliseconds(100));
    assert(reader);
    auto shared_read = ledger.ReadEntries();
    assert(shared_read && shared_read->size() == 1);
    assert(!ledger.Append(Entry("during", "3")));
  }

  assert(ledger.Append(Entry("after", "4")));
  auto entries = ledger.ReadEntries();
  assert(entries && entries->size() == 2);
  assert(entries->back() == Entry("after", "4"));
}

void TestRotation(const fs::path& dir) {
  const auto tasks = dir / "rotation";
  auto options = OptionsFor(tasks);
  options.max_bytes = 256;
  const Ledger ledger{options};

  auto nothing = ledger.RotateIfNeeded();
  assert(nothing && !*nothing);

  tg_test::EventRecorder recorder;
  int appended = 0;
  while (!fs::exists(ledger.path()) || fs::file_size(ledger.path()) <= options.max_bytes) {
    assert(ledger.Append(Entry("fill", std::to_string(appended++))));
  }
  assert(ledger.Append(Entry("fresh", "new")));
  assert(recorder.Saw("ledger_rotated"));

  std::vector<fs::path> archives;
  for (const auto& item : fs::directory_iterator(tasks)) {
    const auto name = item.path().filename().string();
    if (name.rfind("ledger.jsonl.", 0) == 0 && name != "ledger.jsonl.lock") {
      archives.push_back(item.path());
    }
  }
  assert(archives.size() == 1);

  auto current = ledger.ReadEntries();
  assert(current && current->size() == 1);
  assert(current->front() == Entry("fresh", "new"));

  const Ledger archived{[&] {
    auto archive_options = OptionsFor(tasks);
    archive_options.ledger_path = archives.front();
    return archive_options;
  }()};
  auto old_entries = archived.ReadEntries("fill");
  assert(old_entries && old_entries->size() == static_cast<size_t>(appended));

  // explicit rotation when over the limit, none when under
  auto small = ledger.RotateIfNeeded();
  assert(small && !*small);
  while (fs::file_size(ledger.path()) <= options.max_bytes) {
    assert(ledger.Append(Entry("fill2", std::to_string(appended++))));
  }
  auto rotated = ledger.RotateIfNeeded();
  assert(rotated && *rotated);
  assert(fs::exists(ledger.path()));
  assert(fs::file_size(ledger.path()) == 0);
}

void TestSymlinks(const fs::path& dir) {
  const auto tasks = dir / "symlinks";
  const auto outside = dir / "outside";
  fs::create_directories(tasks);
  fs::create_directories(outside);
  const auto victim = outside / "victim.jsonl";
  tg_test::WriteText(victim, "");

  tg_test::EventRecorder recorder;
  const Ledger ledger{OptionsFor(tasks)};
  fs::create_symlink(victim, ledger.path());
  auto escaped = ledger.Append(Entry("x", "1"));
  assert(!escaped);
  assert(escaped.tag() == "validation.symlink_rejected");
  assert(tg_test::ReadText(victim).empty());
  assert(!ledger.VerifyIntegrity());
  fs::remove(ledger.path());

  // an inside alias or a symlinked lock file is refused as well
  tg_test::WriteText(tasks / "real.jsonl", "");
  fs::create_symlink(tasks / "real.jsonl", ledger.path());
  assert(!ledger.Append(Entry("x", "2")));
  fs::remove(ledger.path());
  fs::create_symlink(tasks / "real.jsonl", ledger.lock_path());
  assert(!ledger.Append(Entry("x", "3")));
  assert(recorder.Saw("ledger_symlink_rejected"));
  assert(tg_test::ReadText(tasks / "real.jsonl").empty());

  // a ledger configured outside its base directory never opens
  auto stray = OptionsFor(tasks);
  stray.ledger_path = outside / "stray.jsonl";
  const Ledger outside_ledger{stray};
  auto stray_status = outside_ledger.Append(Entry("x", "4"));
  assert(!stray_status);
  assert(stray_status.tag() == "validation.path_escape");
  assert(!fs::exists(outside / "stray.jsonl"));
}

}  // namespace

int main() {
  tg_test::TempDir temp("tg_ledger_");
  tg_test::RouteEventLog(temp.path());

  TestRoundTrip(temp.path());
  TestEntryShape(temp.path());
  TestIntegrity(temp.path());
  TestConcurrentAppends(temp.path());
  TestLockTimeout(temp.path());
  TestRotation(temp.path());
  TestSymlinks(temp.path());

  std::cout << "ledger tests ok\n";
  return 0;
}

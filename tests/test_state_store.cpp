#include "tg/storage/state_store.h"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include "test_support.h"

namespace {

namespace fs = std::filesystem;
using tg::storage::StateStore;
using tg::storage::StateStoreOptions;

StateStore MakeStore(const fs::path& root) {
  StateStoreOptions options;
  options.state_root = root;
  options.lock_timeout = std::chrono::milliseconds(10000);
  return StateStore{options};
}

void TestWriteAndRead(const StateStore& store, const fs::path& root) {
  assert(store.AtomicWrite("status.json", R"({"phase":"build"})"));
  assert(tg_test::ReadText(root / "status.json") == R"({"phase":"build"})");
  auto read = store.AtomicRead(root / "status.json");
  assert(read);
  assert(*read == R"({"phase":"build"})");

  // parents are created private
  assert(store.AtomicWrite("tasks/t1/result.txt", "done"));
  struct stat st {};
  assert(::stat((root / "tasks").c_str(), &st) == 0);
  assert((st.st_mode & 0777) == 0700);
  assert(::stat((root / "tasks" / "t1" / "result.txt").c_str(), &st) == 0);
  assert((st.st_mode & 0777) == 0600);

  assert(store.AtomicAppend("events.log", "first"));
  assert(store.AtomicAppend("events.log", "second"));
  assert(tg_test::ReadText(root / "events.log") == "first\nsecond\n");

  auto missing = store.AtomicRead("nope.txt");
  assert(!missing);
  assert(missing.status().tag() == "io.open_failed");
}

void TestEscapes(const StateStore& store, const fs::path& root, const fs::path& outside) {
  tg_test::EventRecorder recorder;
  const auto victim = outside / "victim.txt";
  tg_test::WriteText(victim, "original");

  auto traversal = store.AtomicWrite(root / ".." / "outside" / "victim.txt", "pwned");
  assert(!traversal);
  assert(traversal.tag() == "validation.path_escape");
  assert(!store.AtomicWrite("../outside/victim.txt", "pwned"));
  assert(!store.AtomicWrite(victim, "pwned"));
  assert(!store.AtomicWrite(root, "x"));
  assert(!store.AtomicWrite("", "x"));

  // symlink planted inside the root, pointing out
  fs::create_symlink(victim, root / "planted");
  auto planted = store.AtomicWrite("planted", "pwned");
  assert(!planted);
  assert(planted.tag() == "validation.symlink_rejected");
  assert(!store.AtomicAppend("planted", "pwned"));
  assert(!store.AtomicIncrement("planted"));
  assert(!store.StateSet("planted", "k", "v"));
  assert(!store.AtomicRead("planted"));
  assert(recorder.Saw("symlink_escape_blocked"));

  // directory symlink pointing out
  fs::create_directory_symlink(outside, root / "linkdir");
  assert(!store.AtomicWrite("linkdir/victim.txt", "pwned"));
  assert(!store.AtomicWrite("linkdir/new.txt", "pwned"));
  assert(!fs::exists(outside / "new.txt"));

  // alias symlink that stays inside is still never written through
  tg_test::WriteText(root / "real.txt", "real");
  fs::create_symlink(root / "real.txt", root / "alias");
  auto alias = store.AtomicWrite("alias", "through");
  assert(!alias);
  assert(alias.tag() == "validation.symlink_rejected");
  assert(tg_test::ReadText(root / "real.txt") == "real");

  assert(tg_test::ReadText(victim) == "original");
}

void TestSwapBeforeCommit(const StateStore& store, const fs::path& root, const fs::path& outside) {
  tg_test::EventRecorder recorder;
  const auto victim = outside / "swap-victim.txt";
  tg_test::WriteText(victim, "original");
  assert(store.AtomicWrite("swap.txt", "v1"));

  tg::orchestrator::AtomicReplaceHooks hooks;
  hooks.before_rename = [&](const fs::path&, const fs::path& target) {
    fs::remove(target);
    fs::create_symlink(victim, target);
  };
  auto swapped = store.AtomicWrite("swap.txt", "v2", hooks);
  assert(!swapped);
  assert(swapped.tag() == "security.symlink_swap");
  assert(recorder.Saw("state_integrity_violation"));
  assert(tg_test::ReadText(victim) == "original");
  fs::remove(root / "swap.txt");

  // an interrupted write leaves the previous content and no temp files
  assert(store.AtomicWrite("crash.txt", "before"));
  tg::orchestrator::AtomicReplaceHooks crash;
  crash.before_rename = [](const fs::path&, const fs::path&) { throw std::runtime_error("simulated crash"); };
  assert(!store.AtomicWrite("crash.txt", "after", crash));
  assert(tg_test::ReadText(root / "crash.txt") == "before");
  for (const auto& entry : fs::directory_iterator(root)) {
    assert(entry.path().filename().string().find(".tmp.") == std::string::npos);
  }
}

void TestCounters(const StateStore& store, const fs::path& root) {
  auto first = store.AtomicIncrement("counters/retries");
  assert(first && *first == 1);
  auto second = store.AtomicIncrement("counters/retries");
  assert(second && *second == 2);
  auto jump = store.AtomicIncrement("counters/retries", 5);
  assert(jump && *jump == 7);
  auto down = store.AtomicIncrement("counters/retries", -10);
  assert(down && *down == -3);
  assert(tg_test::ReadText(root / "counters" / "retries") == "-3\n");

  tg_test::WriteText(root / "counters" / "garbage", "not a number");
  auto reset = store.AtomicIncrement("counters/garbage");
  assert(reset && *reset == 1);

  tg_test::WriteText(root / "counters" / "max", std::to_string(std::numeric_limits<int64_t>::max()));
  auto overflow = store.AtomicIncrement("counters/max");
  assert(!overflow);
  assert(overflow.status().tag() == "validation.out_of_range");
  assert(tg_test::ReadText(root / "counters" / "max") == std::to_string(std::numeric_limits<int64_t>::max()));
}

void TestConcurrentIncrements(const StateStore& store, const fs::path& root) {
  constexpr int kWorkers = 8;
  constexpr int kPerWorker = 25;
  std::vector<pid_t> children;
  for (int worker = 0; worker < kWorkers; ++worker) {
    const pid_t pid = ::fork();
    if (pid == 0) {
      int failures = 0;
      for (int i = 0; i < kPerWorker; ++i) {
        if (!store.AtomicIncrement("shared_counter")) {
          ++failures;
        }
      }
      ::_exit(failures == 0 ? 0 : 1);
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
  assert(tg_test::ReadText(root / "shared_counter") == std::to_string(kWorkers * kPerWorker) + "\n");
}

void TestKeyValue(const StateStore& store, const fs::path& root) {
  assert(store.StateSet("task.state", "phase", "review"));
  assert(store.StateSet("task.state", "owner", "builder"));
  assert(store.StateSet("task.state", "phase", "done"));
  assert(tg_test::ReadText(root / "task.state") == "phase=done\nowner=builder\n");

  auto phase = store.StateGet("task.state", "phase");
  assert(phase && *phase == "done");
  auto fallback = store.StateGet("task.state", "absent", "none");
  assert(fallback && *fallback == "none");
  auto no_file = store.StateGet("missing.state", "phase", "idle");
  assert(no_file && *no_file == "idle");

  // values keep '=' characters
  assert(store.StateSet("task.state", "query", "a=b=c"));
  auto query = store.StateGet("task.state", "query");
  assert(query && *query == "a=b=c");

  auto bad_key = store.StateSet("task.state", "bad key", "v");
  assert(!bad_key);
  assert(bad_key.tag() == "validation.invalid_identifier");
  assert(!store.StateSet("task.state", "k=v", "v"));
  assert(!store.StateGet("task.state", ""));
  auto multiline = store.StateSet("task.state", "phase", "done\ninjected=1");
  assert(!multiline);
  assert(multiline.tag() == "validation.invalid_value");

  assert(store.StateDelete("task.state", "owner"));
  assert(store.StateDelete("task.state", "query"));
  assert(tg_test::ReadText(root / "task.state") == "phase=done\n");
  assert(store.StateDelete("task.state", "absent"));
  assert(store.StateDelete("task.state", "phase"));
  assert(!fs::exists(root / "task.state"));

  // deleting from a file that does not exist is a no-op
  assert(store.StateDelete("never.state", "phase"));
  assert(!fs::exists(root / "never.state"));
}

void TestRedirectedLockDir(const fs::path& base) {
  tg_test::EventRecorder recorder;
  const auto elsewhere = base / "lock-target";
  fs::create_directories(elsewhere);

  // planted before the store is built
  const auto root = base / "redirected-state";
  fs::create_directories(root);
  fs::create_directory_symlink(elsewhere, root / ".locks");
  const auto store = MakeStore(root);
  auto write = store.AtomicWrite("record.txt", "value");
  assert(!write);
  assert(write.tag() == "validation.symlink_rejected");
  assert(!store.AtomicIncrement("counter"));
  assert(!fs::exists(root / "record.txt"));
  assert(fs::is_empty(elsewhere));

  // swapped in after the store was built
  const auto late_root = base / "late-state";
  fs::create_directories(late_root);
  const auto late = MakeStore(late_root);
  assert(late.AtomicWrite("first.txt", "ok"));
  fs::remove_all(late_root / ".locks");
  fs::create_directory_symlink(elsewhere, late_root / ".locks");
  auto swapped = late.AtomicWrite("second.txt", "value");
  assert(!swapped);
  assert(swapped.tag() == "lock.unavailable");
  assert(recorder.Saw("lock_dir_symlink_rejected"));
  assert(!fs::exists(late_root / "second.txt"));
  assert(fs::is_empty(elsewhere));
}

}  // namespace

int main() {
  tg_test::TempDir temp("tg_state_store_");
  tg_test::RouteEventLog(temp.path());
  const auto root = temp.path() / "state";
  const auto outside = temp.path() / "outside";
  fs::create_directories(root);
  fs::create_directories(outside);

  const auto store = MakeStore(root);
  TestWriteAndRead(store, root);
  TestEscapes(store, root, outside);
  TestSwapBeforeCommit(store, root, outside);
  TestCounters(store, root);
  TestConcurrentIncrements(store, root);
  TestKeyValue(store, root);
  TestRedirectedLockDir(temp.path());

  std::cout << "state store tests ok\n";
  return 0;
}

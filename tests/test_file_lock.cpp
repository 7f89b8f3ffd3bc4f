#include "tg/orchestrator/file_lock.h"

#include <cassert>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>

#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include "test_support.h"

namespace {

namespace fs = std::filesystem;
using tg::orchestrator::LockMode;
using tg::orchestrator::LockStatus;
using tg::orchestrator::ScopedFileLock;

// Child takes the lock, reports through the pipe, holds it, then exits
// without running atexit handlers.
pid_t HoldInChild(const fs::path& lock_path, LockMode mode, std::chrono::milliseconds hold) {
  int ready[2];
  if (::pipe(ready) != 0) {
    return -1;
  }
  const pid_t pid = ::fork();
  if (pid == 0) {
    ::close(ready[0]);
    auto lock = ScopedFileLock::Acquire(lock_path, mode, std::chrono::milliseconds(1000));
    const char flag = lock ? '1' : '0';
    (void)!::write(ready[1], &flag, 1);
    ::close(ready[1]);
    std::this_thread::sleep_for(hold);
    ::_exit(lock ? 0 : 1);
  }
  ::close(ready[1]);
  char flag = '0';
  while (::read(ready[0], &flag, 1) < 0) {
  }
  ::close(ready[0]);
  assert(flag == '1');
  return pid;
}

int WaitChild(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
  }
  return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

void TestExclusiveTimeout(const fs::path& dir) {
  const auto lock_path = dir / "exclusive.lock";
  const pid_t child = HoldInChild(lock_path, LockMode::kExclusive, std::chrono::milliseconds(2000));
  assert(child > 0);

  tg_test::EventRecorder recorder;
  const auto start = std::chrono::steady_clock::now();
  auto blocked = ScopedFileLock::Acquire(lock_path, LockMode::kExclusive, std::chrono::milliseconds(1000));
  const auto elapsed = std::chrono::steady_clock::now() - start;
  assert(!blocked);
  assert(blocked.status() == LockStatus::kTimedOut);
  assert(elapsed >= std::chrono::milliseconds(950));
  assert(elapsed < std::chrono::milliseconds(1900));

  auto status = tg::orchestrator::LockFailureStatus(blocked);
  assert(status.tag() == "lock.timeout");
  assert(status.IsLockTimeout());
  assert(status.retryability() == tg::Retryability::kTransient);
  assert(recorder.Saw("lock_timeout"));

  // holder metadata
  assert(tg_test::ReadText(lock_path).rfind("pid=" + std::to_string(child), 0) == 0);

  assert(WaitChild(child) == 0);
  auto after = ScopedFileLock::Acquire(lock_path, LockMode::kExclusive, std::chrono::milliseconds(1000));
  assert(after);
  assert(after.status() == LockStatus::kAcquired);

  struct stat st {};
  assert(::stat(lock_path.c_str(), &st) == 0);
  assert((st.st_mode & 0777) == 0600);
}

void TestSharedCoexistence(const fs::path& dir) {
  const auto lock_path = dir / "shared.lock";
  const pid_t child = HoldInChild(lock_path, LockMode::kShared, std::chrono::milliseconds(800));
  assert(child > 0);

  auto reader = ScopedFileLock::Acquire(lock_path, LockMode::kShared, std::chrono::milliseconds(200));
  assert(reader);
  auto writer = ScopedFileLock::Acquire(lock_path, LockMode::kExclusive, std::chrono::milliseconds(100));
  assert(!writer);
  assert(writer.status() == LockStatus::kTimedOut);

  reader.Release();
  assert(!reader.locked());
  assert(WaitChild(child) == 0);
  auto writer_after = ScopedFileLock::Acquire(lock_path, LockMode::kExclusive, std::chrono::milliseconds(500));
  assert(writer_after);
}

void TestScopeAndMove(const fs::path& dir) {
  const auto lock_path = dir / "scoped.lock";
  {
    auto first = ScopedFileLock::Acquire(lock_path, LockMode::kExclusive, std::chrono::milliseconds(100));
    assert(first);
    ScopedFileLock moved = std::move(first);
    assert(moved.locked());
    assert(!first.locked());
    // a second open file description conflicts even inside one process
    auto second = ScopedFileLock::Acquire(lock_path, LockMode::kExclusive, std::chrono::milliseconds(50));
    assert(!second);
  }
  auto again = ScopedFileLock::Acquire(lock_path, LockMode::kExclusive, std::chrono::milliseconds(50));
  assert(again);
}

void TestLockFiles(const fs::path& dir) {
  // symlinked lock file is refused
  const auto target = dir / "target.txt";
  tg_test::WriteText(target, "keep");
  const auto link = dir / "link.lock";
  fs::create_symlink(target, link);
  auto refused = ScopedFileLock::Acquire(link, LockMode::kExclusive, std::chrono::milliseconds(50));
  assert(!refused);
  assert(refused.status() == LockStatus::kFailed);
  assert(tg::orchestrator::LockFailureStatus(refused).tag() == "lock.unavailable");
  assert(tg_test::ReadText(target) == "keep");

  const auto lock_dir = dir / "locks";
  const auto a = ScopedFileLock::LockPathFor(lock_dir, dir / "state" / "a.json");
  const auto a_again = ScopedFileLock::LockPathFor(lock_dir, dir / "state" / "sub" / ".." / "a.json");
  const auto b = ScopedFileLock::LockPathFor(lock_dir, dir / "state" / "b.json");
  assert(a == a_again);
  assert(a != b);
  assert(a.parent_path() == lock_dir);
  assert(a.filename().string().rfind("tglock", 0) == 0);

  auto resource_lock = ScopedFileLock::ForResource(lock_dir, dir / "state" / "a.json", LockMode::kExclusive,
                                                   std::chrono::milliseconds(100));
  assert(resource_lock);
  assert(resource_lock.path() == a);
  struct stat st {};
  assert(::stat(lock_dir.c_str(), &st) == 0);
  assert((st.st_mode & 0777) == 0700);

  // a lock directory that redirects elsewhere is refused
  tg_test::EventRecorder recorder;
  const auto elsewhere = dir / "elsewhere";
  fs::create_directories(elsewhere);
  const auto linked_dir = dir / "linked-locks";
  fs::create_directory_symlink(elsewhere, linked_dir);
  auto redirected = ScopedFileLock::ForResource(linked_dir, dir / "state" / "a.json", LockMode::kExclusive,
                                                std::chrono::milliseconds(100));
  assert(!redirected);
  assert(redirected.status() == LockStatus::kFailed);
  assert(redirected.native_error() == ELOOP);
  assert(recorder.Saw("lock_dir_symlink_rejected"));
  assert(fs::is_empty(elsewhere));
}

}  // namespace

int main() {
  tg_test::TempDir temp("tg_file_lock_");
  tg_test::RouteEventLog(temp.path());

  TestExclusiveTimeout(temp.path());
  TestSharedCoexistence(temp.path());
  TestScopeAndMove(temp.path());
  TestLockFiles(temp.path());

  std::cout << "file lock tests ok\n";
  return 0;
}

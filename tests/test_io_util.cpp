#include "tg/orchestrator/io_util.h"

#include <array>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <span>
#include <stdexcept>
#include <string>

#include <sys/stat.h>

#include "tg/errors.h"
#include "test_support.h"

namespace {

namespace fs = std::filesystem;
using tg::orchestrator::AppendToFile;
using tg::orchestrator::AtomicReplace;
using tg::orchestrator::AtomicReplaceHooks;
using tg::orchestrator::ReadFileNoFollow;

bool NoTempFiles(const fs::path& dir) {
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (entry.path().filename().string().find(".tmp.") != std::string::npos) {
      return false;
    }
  }
  return true;
}

void TestCrashBeforeRename(const fs::path& dir) {
  const auto target = dir / "atomic.bin";
  const std::array<uint8_t, 4> baseline{0xDE, 0xAD, 0xBE, 0xEF};
  AtomicReplace(target, std::span<const uint8_t>(baseline.data(), baseline.size()));

  AtomicReplaceHooks hooks;
  fs::path seen_temp;
  hooks.before_rename = [&](const fs::path& temp, const fs::path&) {
    seen_temp = temp;
    struct stat st {};
    assert(::stat(temp.c_str(), &st) == 0);
    assert((st.st_mode & 0777) == 0600);
    throw std::runtime_error("simulated crash");
  };

  const std::array<uint8_t, 4> update{0xBA, 0xAD, 0xF0, 0x0D};
  bool threw = false;
  try {
    AtomicReplace(target, std::span<const uint8_t>(update.data(), update.size()), hooks);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "Expected simulated crash before rename");
  assert(seen_temp.parent_path() == dir);
  assert(!fs::exists(seen_temp));
  assert(tg_test::ReadText(target) == std::string("\xDE\xAD\xBE\xEF", 4));

  AtomicReplace(target, std::span<const uint8_t>(update.data(), update.size()));
  assert(tg_test::ReadText(target) == std::string("\xBA\xAD\xF0\x0D", 4));
  assert(NoTempFiles(dir));

  struct stat st {};
  assert(::stat(target.c_str(), &st) == 0);
  assert((st.st_mode & 0777) == 0600);
}

void TestSymlinkTargets(const fs::path& dir) {
  const auto victim = dir / "victim.txt";
  tg_test::WriteText(victim, "untouched");

  const auto link = dir / "link.txt";
  fs::create_symlink(victim, link);
  try {
    AtomicReplace(link, std::string_view("replaced"));
    assert(false && "symlink target must be rejected");
  } catch (const tg::Error& err) {
    assert(err.code == tg::errors::validation::kSymlinkRejected);
  }
  try {
    AppendToFile(link, "appended\n");
    assert(false && "symlink append must be rejected");
  } catch (const tg::Error& err) {
    assert(err.code == tg::errors::validation::kSymlinkRejected);
  }
  try {
    (void)ReadFileNoFollow(link);
    assert(false && "symlink read must be rejected");
  } catch (const tg::Error& err) {
    assert(err.code == tg::errors::validation::kSymlinkRejected);
  }
  assert(fs::is_symlink(link));

  // swap between temp write and rename
  const auto swapped = dir / "swapped.txt";
  tg_test::WriteText(swapped, "v1");
  AtomicReplaceHooks hooks;
  hooks.before_rename = [&](const fs::path&, const fs::path& target) {
    fs::remove(target);
    fs::create_symlink(victim, target);
  };
  try {
    AtomicReplace(swapped, std::string_view("v2"), hooks);
    assert(false && "swap must be detected");
  } catch (const tg::Error& err) {
    assert(err.domain == tg::ErrorDomain::Security);
    assert(err.code == tg::errors::security::kSymlinkSwapDetected);
    assert(!err.context.empty());
  }
  assert(tg_test::ReadText(victim) == "untouched");
  assert(NoTempFiles(dir));
}

void TestAppend(const fs::path& dir) {
  const auto log = dir / "append.log";
  AppendToFile(log, "one\n");
  AppendToFile(log, "two\n");
  assert(tg_test::ReadText(log) == "one\ntwo\n");

  // a torn last line is closed off first
  tg_test::WriteText(log, "partial");
  AppendToFile(log, "next\n");
  assert(tg_test::ReadText(log) == "partial\nnext\n");

  const auto fresh = dir / "fresh.log";
  AppendToFile(fresh, {});
  assert(fs::exists(fresh));
  assert(fs::file_size(fresh) == 0);
}

void TestRead(const fs::path& dir) {
  assert(!ReadFileNoFollow(dir / "absent").has_value());
  tg_test::WriteText(dir / "present", "payload");
  auto content = ReadFileNoFollow(dir / "present");
  assert(content && *content == "payload");
  try {
    (void)ReadFileNoFollow(dir);
    assert(false && "directories are not readable records");
  } catch (const tg::Error& err) {
    assert(err.domain == tg::ErrorDomain::Validation);
  }
}

void TestPrivateDirectory(const fs::path& dir) {
  const auto nested = dir / "a" / "b" / "c";
  tg::orchestrator::EnsurePrivateDirectory(nested);
  for (const auto& created : {dir / "a", dir / "a" / "b", nested}) {
    struct stat st {};
    assert(::stat(created.c_str(), &st) == 0);
    assert((st.st_mode & 0777) == 0700);
  }
  // existing directories keep their mode
  fs::permissions(dir / "a", fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
  tg::orchestrator::EnsurePrivateDirectory(nested / "d");
  struct stat st {};
  assert(::stat((dir / "a").c_str(), &st) == 0);
  assert((st.st_mode & 0777) == 0750);
}

}  // namespace

int main() {
  tg_test::TempDir temp("tg_io_util_");
  tg_test::RouteEventLog(temp.path());

  TestCrashBeforeRename(temp.path());
  TestSymlinkTargets(temp.path());
  TestAppend(temp.path());
  TestRead(temp.path());
  TestPrivateDirectory(temp.path());

  std::cout << "atomic replace tests ok\n";
  return 0;
}

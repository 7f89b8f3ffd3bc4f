#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "tg/error.h"

namespace tg::orchestrator {

struct AtomicReplaceHooks { // test seam for crash and swap simulation
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
};

// Performs an atomic replace of the target file by writing the payload to a
// 0600 temporary file in the same directory, syncing it to disk, then renaming
// it into place. A target that is (or becomes) a symlink is never followed;
// the swap is reported as security::kSymlinkSwapDetected. Throws tg::Error.
void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks = {});
void AtomicReplace(const std::filesystem::path& target, std::string_view payload,
                   const AtomicReplaceHooks& hooks = {});

// O_APPEND write followed by fsync. If the existing file does not end in a
// newline one is written first so data starts on a fresh line.
void AppendToFile(const std::filesystem::path& target, std::string_view data);

// Reads a regular file without following a final symlink. nullopt when the
// file does not exist.
[[nodiscard]] std::optional<std::string> ReadFileNoFollow(const std::filesystem::path& path);

// create_directories, then 0700 on every directory this call created.
void EnsurePrivateDirectory(const std::filesystem::path& dir);

void SyncDirectory(const std::filesystem::path& dir);

}  // namespace tg::orchestrator

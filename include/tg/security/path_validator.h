#pragma once

#include <filesystem>
#include <optional>

#include "tg/status.h"

namespace tg::security {

// Canonicalizes path (resolving symlinks on the existing prefix, normalizing
// the rest) and accepts it only when it equals base_dir or is a strict
// descendant. Component-wise comparison so "/state" never admits "/stateevil".
[[nodiscard]] Status CheckPathInDirectory(const std::filesystem::path& path,
                                          const std::filesystem::path& base_dir) noexcept;

// Walks every component from base_dir to path. A symlink component is resolved
// and rejected when its target leaves base_dir. Ends with CheckPathInDirectory.
[[nodiscard]] Status CheckSymlinkSafe(const std::filesystem::path& path,
                                      const std::filesystem::path& base_dir) noexcept;

[[nodiscard]] bool ValidatePathInDirectory(const std::filesystem::path& path,
                                           const std::filesystem::path& base_dir) noexcept;
[[nodiscard]] bool IsSymlinkSafe(const std::filesystem::path& path,
                                 const std::filesystem::path& base_dir) noexcept;

// realpath -m equivalent. nullopt on empty input or resolution failure.
[[nodiscard]] std::optional<std::filesystem::path> CanonicalizePath(
    const std::filesystem::path& path) noexcept;

[[nodiscard]] bool IsWithin(const std::filesystem::path& canonical_path,
                            const std::filesystem::path& canonical_base) noexcept;

// lstat based, false on any error.
[[nodiscard]] bool IsSymlink(const std::filesystem::path& path) noexcept;

}  // namespace tg::security

#include "tg/security/path_validator.h"

#include <cerrno>
#include <string>
#include <system_error>

#include <sys/stat.h>

#include "tg/common.h"
#include "tg/errors.h"
#include "tg/orchestrator/event_bus.h"

namespace tg::security {
namespace {

// Bound on symlink hops while walking so a loop cannot spin forever.
constexpr int kMaxSymlinkHops = 40;

Status Reject(int code, std::string_view message) {
  return Status::Fail(ErrorDomain::Validation, code, message);
}

void ReportEscape(std::string_view event_id, const std::filesystem::path& path,
                  const std::filesystem::path& base_dir) {
  orchestrator::PublishSecurityEvent(
      event_id, "Path rejected by validator",
      {orchestrator::EventField("path", PathToUtf8String(path), orchestrator::FieldPrivacy::kHash),
       orchestrator::EventField("base_dir", PathToUtf8String(base_dir),
                                orchestrator::FieldPrivacy::kHash)});
}

}  // namespace

std::optional<std::filesystem::path> CanonicalizePath(const std::filesystem::path& path) noexcept {
  if (path.empty()) {
    return std::nullopt;
  }
  try {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
      return std::nullopt;
    }
    auto canonical = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
      return std::nullopt;
    }
    canonical = canonical.lexically_normal();
    // weakly_canonical keeps a trailing separator as an empty filename
    if (!canonical.has_filename() && canonical.has_relative_path()) {
      canonical = canonical.parent_path();
    }
    return canonical;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

bool IsWithin(const std::filesystem::path& canonical_path,
              const std::filesystem::path& canonical_base) noexcept {
  if (canonical_base.empty() || canonical_path.empty()) {
    return false;
  }
  auto base_it = canonical_base.begin();
  auto path_it = canonical_path.begin();
  for (; base_it != canonical_base.end(); ++base_it, ++path_it) {
    if (base_it->empty()) {
      continue;
    }
    if (path_it == canonical_path.end() || *path_it != *base_it) {
      return false;
    }
  }
  for (; path_it != canonical_path.end(); ++path_it) {
    if (*path_it == "..") {
      return false;
    }
  }
  return true;
}

bool IsSymlink(const std::filesystem::path& path) noexcept {
  struct stat info {};
  if (::lstat(path.c_str(), &info) != 0) {
    return false;
  }
  return S_ISLNK(info.st_mode);
}

Status CheckPathInDirectory(const std::filesystem::path& path,
                            const std::filesystem::path& base_dir) noexcept {
  try {
    if (path.empty() || base_dir.empty()) {
      return Reject(errors::validation::kEmptyInput, errors::msg::kEmptyPath);
    }
    auto canonical_base = CanonicalizePath(base_dir);
    auto canonical_path = CanonicalizePath(path);
    if (!canonical_base || !canonical_path) {
      return Reject(errors::validation::kPathUnresolvable, errors::msg::kPathUnresolvable);
    }
    if (!IsWithin(*canonical_path, *canonical_base)) {
      ReportEscape("path_escape_blocked", path, base_dir);
      return Reject(errors::validation::kPathEscape, errors::msg::kPathEscapesBase);
    }
    return Status::Ok();
  } catch (const std::exception& ex) {
    return Status::Fail(ErrorDomain::Internal, errors::internal::kUnexpected, ex.what());
  }
}

Status CheckSymlinkSafe(const std::filesystem::path& path,
                        const std::filesystem::path& base_dir) noexcept {
  try {
    if (path.empty() || base_dir.empty()) {
      return Reject(errors::validation::kEmptyInput, errors::msg::kEmptyPath);
    }
    auto canonical_base = CanonicalizePath(base_dir);
    if (!canonical_base) {
      return Reject(errors::validation::kPathUnresolvable, errors::msg::kPathUnresolvable);
    }

    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
      return Reject(errors::validation::kPathUnresolvable, errors::msg::kPathUnresolvable);
    }
    absolute = absolute.lexically_normal();

    // The walk starts from whichever spelling of base_dir the caller used.
    auto base_absolute = std::filesystem::absolute(base_dir, ec).lexically_normal();
    if (ec) {
      return Reject(errors::validation::kPathUnresolvable, errors::msg::kPathUnresolvable);
    }
    std::filesystem::path relative;
    if (IsWithin(absolute, base_absolute)) {
      relative = absolute.lexically_relative(base_absolute);
    } else if (IsWithin(absolute, *canonical_base)) {
      relative = absolute.lexically_relative(*canonical_base);
    } else {
      ReportEscape("path_escape_blocked", path, base_dir);
      return Reject(errors::validation::kPathEscape, errors::msg::kPathEscapesBase);
    }

    std::filesystem::path current = *canonical_base;
    int hops = 0;
    for (const auto& component : relative) {
      if (component.empty() || component == ".") {
        continue;
      }
      if (component == "..") {
        ReportEscape("path_traversal_blocked", path, base_dir);
        return Reject(errors::validation::kPathEscape, errors::msg::kPathEscapesBase);
      }
      current /= component;
      struct stat info {};
      if (::lstat(current.c_str(), &info) != 0) {
        if (errno == ENOENT) {
          break;  // nothing further exists to be a symlink
        }
        return Reject(errors::validation::kPathUnresolvable, errors::msg::kPathUnresolvable);
      }
      if (!S_ISLNK(info.st_mode)) {
        continue;
      }
      if (++hops > kMaxSymlinkHops) {
        return Reject(errors::validation::kPathUnresolvable, errors::msg::kPathUnresolvable);
      }
      auto resolved = CanonicalizePath(current);
      if (!resolved || !IsWithin(*resolved, *canonical_base)) {
        ReportEscape("symlink_escape_blocked", path, base_dir);
        return Reject(errors::validation::kSymlinkRejected, errors::msg::kSymlinkEscapesBase);
      }
      current = *resolved;
    }
    return CheckPathInDirectory(path, base_dir);
  } catch (const std::exception& ex) {
    return Status::Fail(ErrorDomain::Internal, errors::internal::kUnexpected, ex.what());
  }
}

bool ValidatePathInDirectory(const std::filesystem::path& path,
                             const std::filesystem::path& base_dir) noexcept {
  return CheckPathInDirectory(path, base_dir).ok();
}

bool IsSymlinkSafe(const std::filesystem::path& path,
                   const std::filesystem::path& base_dir) noexcept {
  return CheckSymlinkSafe(path, base_dir).ok();
}

}  // namespace tg::security

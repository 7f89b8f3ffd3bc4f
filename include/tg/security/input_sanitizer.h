#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "tg/security/pattern_catalog.h"
#include "tg/status.h"

namespace tg::security {

inline constexpr std::string_view kRedactionMarker{"[REDACTED]"};
inline constexpr size_t kMaxLlmInputBytes = 100 * 1024;

struct JsonLimits {
  size_t max_bytes{100 * 1024};
  size_t max_depth{20};
  size_t max_array_items{1000};
};

struct PatternVerdict {
  bool rejected{false};
  std::string pattern_id;  // catalog id of the row that fired
};

// Replaces every recognized credential with kRedactionMarker. Text without a
// match comes back byte-identical.
[[nodiscard]] std::string MaskSecrets(std::string_view text);
[[nodiscard]] std::string MaskSecrets(std::string_view text, const CompiledPatternSet& catalog);
[[nodiscard]] bool ContainsSecrets(std::string_view text);

// Case-insensitive screen against the destructive/injection signature table.
// A rejection is published as a security event.
[[nodiscard]] PatternVerdict CheckDangerousPatterns(std::string_view text);

// Drops NUL and control characters (keeping \n, \r, \t) and backslash-escapes
// the shell metacharacters \ $ ` ".
[[nodiscard]] std::string SanitizeInput(std::string_view text);

// Strips prompt-injection directives and truncates to max_bytes on a UTF-8
// boundary. Ordinary prose passes through unchanged.
[[nodiscard]] std::string SanitizeLlmInput(std::string_view text, size_t max_bytes = kMaxLlmInputBytes);

// Doubles every single quote and touches nothing else.
[[nodiscard]] std::string SqlEscape(std::string_view value);

// [A-Za-z0-9_.-]{1,128}, not starting with '.'.
[[nodiscard]] bool ValidateIdentifier(std::string_view value) noexcept;

// Structural checks that run before any parser sees the input. Depth counts
// only brackets and braces outside string literals.
[[nodiscard]] Status ValidateJsonSize(std::string_view text, const JsonLimits& limits = {});
[[nodiscard]] Status ValidateJsonDepth(std::string_view text, const JsonLimits& limits = {});
[[nodiscard]] size_t MeasureJsonDepth(std::string_view text) noexcept;
[[nodiscard]] Result<nlohmann::json> SafeParseJson(std::string_view text, const JsonLimits& limits = {});

}  // namespace tg::security

#include "tg/security/input_sanitizer.h"

#include <algorithm>
#include <vector>

#include "tg/errors.h"
#include "tg/orchestrator/event_bus.h"

namespace tg::security {
namespace {

constexpr std::string_view kPemBegin{"-----BEGIN "};
constexpr std::string_view kPemEnd{"-----END "};
constexpr std::string_view kPemPrivateKey{"PRIVATE KEY"};
constexpr std::string_view kPemDelimiter{"-----"};
constexpr size_t kMaxIdentifierLength = 128;

// Removes whole "-----BEGIN ... PRIVATE KEY-----" blocks through their END
// line. Unterminated headers are left for the catalog's header row.
std::string StripPemPrivateKeyBlocks(std::string_view text) {
  std::string out;
  size_t cursor = 0;
  bool changed = false;
  while (cursor < text.size()) {
    const size_t begin = text.find(kPemBegin, cursor);
    if (begin == std::string_view::npos) {
      break;
    }
    const size_t label_end = text.find(kPemDelimiter, begin + kPemBegin.size());
    if (label_end == std::string_view::npos) {
      break;
    }
    const auto label = text.substr(begin + kPemBegin.size(), label_end - begin - kPemBegin.size());
    if (label.find(kPemPrivateKey) == std::string_view::npos || label.find('\n') != std::string_view::npos) {
      out.append(text.substr(cursor, label_end - cursor));
      cursor = label_end;
      continue;
    }
    const size_t end = text.find(kPemEnd, label_end);
    if (end == std::string_view::npos) {
      break;
    }
    const size_t end_close = text.find(kPemDelimiter, end + kPemEnd.size());
    if (end_close == std::string_view::npos) {
      break;
    }
    out.append(text.substr(cursor, begin - cursor));
    out.append(kRedactionMarker);
    cursor = end_close + kPemDelimiter.size();
    changed = true;
  }
  if (!changed) {
    return std::string(text);
  }
  out.append(text.substr(cursor));
  return out;
}

bool IsIdentifierChar(char ch) noexcept {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '_' ||
         ch == '-' || ch == '.';
}

// Walks the parsed document without recursion; depth is already bounded.
bool ArraysWithinLimit(const nlohmann::json& root, size_t max_items) {
  std::vector<const nlohmann::json*> pending{&root};
  while (!pending.empty()) {
    const auto* node = pending.back();
    pending.pop_back();
    if (node->is_array()) {
      if (node->size() > max_items) {
        return false;
      }
      for (const auto& child : *node) {
        pending.push_back(&child);
      }
    } else if (node->is_object()) {
      for (const auto& item : node->items()) {
        pending.push_back(&item.value());
      }
    }
  }
  return true;
}

}  // namespace

std::string MaskSecrets(std::string_view text) { return MaskSecrets(text, DefaultSecretSet()); }

std::string MaskSecrets(std::string_view text, const CompiledPatternSet& catalog) {
  if (text.empty()) {
    return {};
  }
  return catalog.ReplaceAll(StripPemPrivateKeyBlocks(text));
}

bool ContainsSecrets(std::string_view text) {
  return DefaultSecretSet().FirstMatch(text).has_value();
}

PatternVerdict CheckDangerousPatterns(std::string_view text) {
  PatternVerdict verdict;
  auto match = DefaultDangerousSet().FirstMatch(text);
  if (!match) {
    return verdict;
  }
  verdict.rejected = true;
  verdict.pattern_id = *match;
  orchestrator::PublishSecurityEvent(
      "dangerous_pattern_blocked", errors::msg::kDangerousPattern,
      {orchestrator::EventField("pattern_id", verdict.pattern_id),
       orchestrator::EventField("input", std::string(text), orchestrator::FieldPrivacy::kHash)});
  return verdict;
}

std::string SanitizeInput(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char ch : text) {
    const auto byte = static_cast<unsigned char>(ch);
    if ((byte < 0x20 && ch != '\n' && ch != '\r' && ch != '\t') || byte == 0x7F) {
      continue;
    }
    if (ch == '\\' || ch == '$' || ch == '`' || ch == '"') {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  return out;
}

std::string SanitizeLlmInput(std::string_view text, size_t max_bytes) {
  std::string cleaned = DefaultInjectionSet().ReplaceAll(text);
  if (cleaned.size() > max_bytes) {
    size_t cut = max_bytes;
    // back up over UTF-8 continuation bytes so no code point is split
    while (cut > 0 && (static_cast<unsigned char>(cleaned[cut]) & 0xC0) == 0x80) {
      --cut;
    }
    cleaned.resize(cut);
  }
  return cleaned;
}

std::string SqlEscape(std::string_view value) {
  std::string out;
  out.reserve(value.size() + static_cast<size_t>(std::count(value.begin(), value.end(), '\'')));
  for (char ch : value) {
    out.push_back(ch);
    if (ch == '\'') {
      out.push_back('\'');
    }
  }
  return out;
}

bool ValidateIdentifier(std::string_view value) noexcept {
  if (value.empty() || value.size() > kMaxIdentifierLength || value.front() == '.') {
    return false;
  }
  return std::all_of(value.begin(), value.end(), IsIdentifierChar);
}

Status ValidateJsonSize(std::string_view text, const JsonLimits& limits) {
  if (text.size() > limits.max_bytes) {
    return Status::Fail(ErrorDomain::Validation, errors::validation::kJsonTooLarge,
                        std::string(errors::msg::kJsonTooLarge) + " (" + std::to_string(text.size()) +
                            " > " + std::to_string(limits.max_bytes) + " bytes)");
  }
  return Status::Ok();
}

size_t MeasureJsonDepth(std::string_view text) noexcept {
  size_t depth = 0;
  size_t max_depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (char ch : text) {
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (ch == '\\') {
        escaped = true;
      } else if (ch == '"') {
        in_string = false;
      }
      continue;
    }
    switch (ch) {
    case '"':
      in_string = true;
      break;
    case '{':
    case '[':
      ++depth;
      max_depth = std::max(max_depth, depth);
      break;
    case '}':
    case ']':
      if (depth > 0) {
        --depth;
      }
      break;
    default:
      break;
    }
  }
  return max_depth;
}

Status ValidateJsonDepth(std::string_view text, const JsonLimits& limits) {
  const size_t depth = MeasureJsonDepth(text);
  if (depth > limits.max_depth) {
    return Status::Fail(ErrorDomain::Validation, errors::validation::kJsonTooDeep,
                        std::string(errors::msg::kJsonTooDeep) + " (" + std::to_string(depth) + " > " +
                            std::to_string(limits.max_depth) + ")");
  }
  return Status::Ok();
}

Result<nlohmann::json> SafeParseJson(std::string_view text, const JsonLimits& limits) {
  if (text.empty()) {
    return Status::Fail(ErrorDomain::Validation, errors::validation::kJsonMalformed, errors::msg::kJsonEmpty);
  }
  if (auto size = ValidateJsonSize(text, limits); !size) {
    return size;
  }
  if (auto depth = ValidateJsonDepth(text, limits); !depth) {
    return depth;
  }
  auto parsed = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
  if (parsed.is_discarded()) {
    return Status::Fail(ErrorDomain::Validation, errors::validation::kJsonMalformed, errors::msg::kJsonMalformed);
  }
  if (!ArraysWithinLimit(parsed, limits.max_array_items)) {
    return Status::Fail(ErrorDomain::Validation, errors::validation::kJsonArrayTooLarge,
                        errors::msg::kJsonArrayTooLarge);
  }
  return parsed;
}

}  // namespace tg::security

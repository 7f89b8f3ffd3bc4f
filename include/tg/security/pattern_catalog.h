#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <re2/re2.h>

namespace tg::security {

// Bumped whenever a table below gains, loses or changes a row.
inline constexpr int kPatternCatalogVersion = 2;

struct PatternSpec {
  std::string_view id;
  std::string_view expression;   // RE2 syntax, matched byte-wise
  std::string_view replacement;  // RE2 rewrite (\1 for groups), unused by detection tables
  bool case_insensitive{false};
};

// Credential shapes: provider keys, tokens, headers, JSON fields, DB URLs.
std::span<const PatternSpec> SecretPatterns() noexcept;
// Destructive commands, pipe-to-shell, fork bombs, reverse shells, SQL injection.
std::span<const PatternSpec> DangerousPatterns() noexcept;
// Prompt-injection directives stripped from LLM-bound text.
std::span<const PatternSpec> InjectionPatterns() noexcept;

class CompiledPatternSet {
public:
  // Throws tg::Error (Config domain) when a row fails to compile.
  explicit CompiledPatternSet(std::span<const PatternSpec> specs);

  // Applies every row's replacement in table order. Input without any match
  // is returned byte-identical. Matching runs in time linear in the input.
  [[nodiscard]] std::string ReplaceAll(std::string_view text) const;
  // Id of the first row that matches anywhere in text.
  [[nodiscard]] std::optional<std::string> FirstMatch(std::string_view text) const;
  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }

private:
  struct Entry {
    std::string id;
    std::unique_ptr<RE2> regex;
    std::string replacement;
  };
  std::vector<Entry> entries_;
};

const CompiledPatternSet& DefaultSecretSet();
const CompiledPatternSet& DefaultDangerousSet();
const CompiledPatternSet& DefaultInjectionSet();

}  // namespace tg::security

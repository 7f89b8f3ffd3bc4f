#include "tg/security/pattern_catalog.h"

#include <array>
#include <memory>
#include <utility>

#include "tg/error.h"

namespace tg::security {
namespace {

constexpr std::array kSecretPatterns{
    // provider environment assignments keep the variable name
    PatternSpec{"provider_api_key_env",
                R"re(((?:ANTHROPIC|OPENAI|GOOGLE|GEMINI|AZURE_OPENAI|COHERE|MISTRAL|GROQ|HUGGINGFACE)_API_KEY\s*[=:]\s*)["']?[^\s"']+["']?)re",
                R"(\1[REDACTED])"},
    PatternSpec{"openai_project_key", R"re(sk-proj-[A-Za-z0-9_-]{20,})re", "[REDACTED]"},
    PatternSpec{"anthropic_key", R"re(sk-ant-[A-Za-z0-9_-]{20,})re", "[REDACTED]"},
    PatternSpec{"openai_key", R"re(\bsk-[A-Za-z0-9_-]{20,})re", "[REDACTED]"},
    PatternSpec{"google_api_key", R"re(AIza[0-9A-Za-z_-]{30,})re", "[REDACTED]"},
    PatternSpec{"google_oauth_token", R"re(ya29\.[A-Za-z0-9_-]{20,})re", "[REDACTED]"},
    PatternSpec{"github_token", R"re(\bgh[pousr]_[A-Za-z0-9]{36,})re", "[REDACTED]"},
    PatternSpec{"github_fine_grained_pat", R"re(\bgithub_pat_[A-Za-z0-9_]{22,})re", "[REDACTED]"},
    PatternSpec{"gitlab_pat", R"re(\bglpat-[A-Za-z0-9_-]{20,})re", "[REDACTED]"},
    PatternSpec{"aws_credential_env",
                R"re(((?:AWS_ACCESS_KEY_ID|AWS_SECRET_ACCESS_KEY|AWS_SESSION_TOKEN)\s*[=:]\s*)["']?[^\s"']+["']?)re",
                R"(\1[REDACTED])"},
    PatternSpec{"aws_access_key_id",
                R"re(\b(?:A3T[A-Z0-9]|AKIA|ASIA|AGPA|AIDA|ANPA|ANVA|AROA|AIPA|APKA)[A-Z0-9]{16}\b)re",
                "[REDACTED]"},
    PatternSpec{"azure_secret_env", R"re((\bAZURE_[A-Z0-9_]*(?:KEY|SECRET|PASSWORD)\s*[=:]\s*)["']?[^\s"']+["']?)re",
                R"(\1[REDACTED])"},
    PatternSpec{"azure_connection_string",
                R"re((\b(?:AccountKey|SharedAccessKey|SharedAccessSignature)\s*=\s*)[^;\s"']+)re",
                R"(\1[REDACTED])", true},
    PatternSpec{"slack_token", R"re(\bxox[baprs]-[A-Za-z0-9-]{10,})re", "[REDACTED]"},
    PatternSpec{"stripe_key", R"re(\b(?:sk|rk|pk)_(?:live|test)_[A-Za-z0-9]{16,})re", "[REDACTED]"},
    PatternSpec{"twilio_key", R"re(\bSK[0-9a-fA-F]{32}\b)re", "[REDACTED]"},
    PatternSpec{"sendgrid_key", R"re(\bSG\.[A-Za-z0-9_-]{16,}\.[A-Za-z0-9_-]{16,})re", "[REDACTED]"},
    PatternSpec{"jwt", R"re(\beyJ[A-Za-z0-9_-]{5,}\.[A-Za-z0-9_-]{5,}\.[A-Za-z0-9_-]*)re", "[REDACTED]"},
    PatternSpec{"bearer_token", R"re((\bBearer\s+)[A-Za-z0-9._~+/=-]{8,})re", R"(\1[REDACTED])", true},
    PatternSpec{"authorization_header", R"re((\bAuthorization\s*:\s*)[^\r\n]+)re", R"(\1[REDACTED])", true},
    PatternSpec{"api_key_header", R"re((\bX-Api-Key\s*:\s*)[^\r\n]+)re", R"(\1[REDACTED])", true},
    PatternSpec{"oauth_assignment",
                R"re((\b(?:oauth_token|oauth_token_secret|oauth_secret|access_token|refresh_token|id_token|client_secret)\s*[=:]\s*)["']?[^\s"'&;,]+["']?)re",
                R"(\1[REDACTED])", true},
    PatternSpec{"credential_assignment",
                R"re((\b(?:password|passwd|pwd|secret|token|api_key|apikey)\s*[=:]\s*)["']?[^\s"'&;,]+["']?)re",
                R"(\1[REDACTED])", true},
    PatternSpec{"json_credential_field",
                R"re(("(?:password|passwd|secret|token|api_key|apiKey|apikey|access_token|refresh_token|client_secret|private_key)"\s*:\s*")(?:[^"\\]|\\.)*")re",
                R"(\1[REDACTED]")", true},
    PatternSpec{"database_url_credentials",
                R"re((\b(?:postgres(?:ql)?|mysql|mariadb|mongodb(?:\+srv)?|rediss?|sqlserver|mssql|oracle|cockroachdb|amqps?)://[^:/\s@]*:)[^@\s]+@)re",
                R"(\1[REDACTED]@)", true},
    PatternSpec{"jdbc_password", R"re((\bjdbc:[A-Za-z0-9]+:[^\s]*?(?:password|pwd)=)[^&;\s]+)re", R"(\1[REDACTED])",
                true},
    PatternSpec{"pem_private_key_header", R"re(-----BEGIN (?:[A-Z]+ )*PRIVATE KEY(?: BLOCK)?-----)re",
                "[REDACTED]"},
};

constexpr std::array kDangerousPatterns{
    PatternSpec{"rm_recursive_force", R"re(\brm\s+(?:-[a-z]*r[a-z]*f[a-z]*|-[a-z]*f[a-z]*r[a-z]*|-r\s+-f|-f\s+-r|--recursive\s+--force|--force\s+--recursive)\b)re",
                "", true},
    PatternSpec{"chained_rm", R"re([;&|]\s*rm\s)re", "", true},
    PatternSpec{"substituted_rm", R"re(\$\([^)]*\brm\b)re", "", true},
    PatternSpec{"backtick_rm", R"re(`[^`]*\brm\b)re", "", true},
    PatternSpec{"raw_disk_write", R"re(>\s*/dev/(?:sd|hd|nvme|vd|xvd)[a-z0-9]*)re", "", true},
    PatternSpec{"mkfs", R"re(\bmkfs(?:\.[a-z0-9]+)?\b)re", "", true},
    PatternSpec{"dd_to_device", R"re(\bdd\s+[^\n]*\bif=[^\n]*\bof=/)re", "", true},
    PatternSpec{"pipe_to_shell", R"re(\b(?:curl|wget|fetch)\b[^|\n]*\|\s*(?:sudo\s+)?(?:ba|z|k|da)?sh\b)re", "",
                true},
    PatternSpec{"fork_bomb", R"re(:\s*\(\s*\)\s*\{\s*:\s*\|\s*:\s*&\s*\}\s*;\s*:)re", "", true},
    PatternSpec{"reverse_shell_dev_tcp", R"re(/dev/(?:tcp|udp)/)re", "", true},
    PatternSpec{"reverse_shell_netcat", R"re(\b(?:nc|ncat|netcat)\b[^\n]*\s-[a-z]*[ec]\b)re", "", true},
    PatternSpec{"reverse_shell_interactive", R"re(\b(?:ba)?sh\s+-i\s*(?:>&|<&|>\s*&))re", "", true},
    PatternSpec{"path_traversal", R"re(\.\./\.\.|\.\./etc/)re", "", true},
    PatternSpec{"sql_tautology", R"re('\s*or\s*'1'\s*=\s*'1)re", "", true},
    PatternSpec{"sql_drop", R"re(\bdrop\s+(?:table|database|schema)\b)re", "", true},
    PatternSpec{"sql_delete", R"re(;\s*delete\s+from\b)re", "", true},
    PatternSpec{"shell_expansion", R"re(\$\{[^}]*\})re", "", true},
};

constexpr std::array kInjectionPatterns{
    PatternSpec{"system_tag", R"re(\[\s*SYSTEM\s*\])re", "", true},
    PatternSpec{"inst_tag", R"re(\[/?INST\])re", "", true},
    PatternSpec{"chat_template_token", R"re(<\|[A-Za-z_]{1,32}\|>)re", "", true},
    PatternSpec{"sys_block_tag", R"re(<</?SYS>>)re", "", true},
    PatternSpec{"ignore_previous", R"re(\bIGNORE\s+(?:ALL\s+)?(?:THE\s+)?(?:PREVIOUS|PRIOR|ABOVE)\s+INSTRUCTIONS\b)re",
                "", true},
    PatternSpec{"disregard_above", R"re(\bDISREGARD\b[^\n]{0,120}?\bABOVE\b)re", "", true},
    PatternSpec{"forget_instructions", R"re(\bFORGET\b[^\n]{0,120}?\bINSTRUCTIONS\b)re", "", true},
    PatternSpec{"new_instructions", R"re(\bNEW\s+INSTRUCTIONS\s*:)re", "", true},
    PatternSpec{"override_system", R"re(\bOVERRIDE\s+SYSTEM\b)re", "", true},
    PatternSpec{"forced_approval", R"re(\b(?:OUTPUT|RESULT)\s*:\s*APPROVED\b)re", "", true},
    PatternSpec{"mark_approved", R"re(\bMARK\b[^\n]{0,120}?\bAS\s+APPROVED\b)re", "", true},
    PatternSpec{"role_reassignment", R"re(\bYOU\s+ARE\s+NOW\b)re", "", true},
    PatternSpec{"act_as_if", R"re(\bACT\s+AS\s+IF\b)re", "", true},
    PatternSpec{"pretend_you_are", R"re(\bPRETEND\s+YOU\s+ARE\b)re", "", true},
    PatternSpec{"hash_system_block", R"re(#{3,}\s*SYSTEM\b[^\n]*?#{3,})re", "", true},
    PatternSpec{"dash_system_block", R"re(-{3,}\s*SYSTEM\b[^\n]*?-{3,})re", "", true},
    PatternSpec{"star_system_block", R"re(\*{3,}\s*SYSTEM\b[^\n]*?\*{3,})re", "", true},
    PatternSpec{"role_fence", R"re(```\s*(?:system|assistant|user)\b)re", "", true},
};

}  // namespace

std::span<const PatternSpec> SecretPatterns() noexcept { return kSecretPatterns; }
std::span<const PatternSpec> DangerousPatterns() noexcept { return kDangerousPatterns; }
std::span<const PatternSpec> InjectionPatterns() noexcept { return kInjectionPatterns; }

CompiledPatternSet::CompiledPatternSet(std::span<const PatternSpec> specs) {
  entries_.reserve(specs.size());
  for (const auto& spec : specs) {
    RE2::Options options;
    options.set_encoding(RE2::Options::EncodingLatin1);
    options.set_case_sensitive(!spec.case_insensitive);
    options.set_log_errors(false);
    auto regex = std::make_unique<RE2>(re2::StringPiece(spec.expression.data(), spec.expression.size()), options);
    if (!regex->ok()) {
      throw Error{ErrorDomain::Config, errors::config::kMalformedSetting,
                  "Pattern '" + std::string(spec.id) + "' failed to compile: " + regex->error()};
    }
    entries_.push_back(Entry{std::string(spec.id), std::move(regex), std::string(spec.replacement)});
  }
}

std::string CompiledPatternSet::ReplaceAll(std::string_view text) const {
  std::string current(text);
  for (const auto& entry : entries_) {
    RE2::GlobalReplace(&current, *entry.regex, entry.replacement);
  }
  return current;
}

std::optional<std::string> CompiledPatternSet::FirstMatch(std::string_view text) const {
  const re2::StringPiece input(text.data(), text.size());
  for (const auto& entry : entries_) {
    if (RE2::PartialMatch(input, *entry.regex)) {
      return entry.id;
    }
  }
  return std::nullopt;
}

const CompiledPatternSet& DefaultSecretSet() {
  static const CompiledPatternSet set(SecretPatterns());
  return set;
}

const CompiledPatternSet& DefaultDangerousSet() {
  static const CompiledPatternSet set(DangerousPatterns());
  return set;
}

const CompiledPatternSet& DefaultInjectionSet() {
  static const CompiledPatternSet set(InjectionPatterns());
  return set;
}

}  // namespace tg::security

#include "tg/orchestrator/gate_validator.h"

#include <charconv>
#include <cmath>
#include <sstream>

#include "tg/common.h"
#include "tg/errors.h"
#include "tg/orchestrator/event_bus.h"

namespace tg::orchestrator {
namespace {

constexpr size_t kMaxScoreLength = 32;
constexpr std::string_view kShellMetacharacters{"$`;|&<>(){}\\'\"\n"};

Status Reject(int code, std::string_view message, std::string_view context) {
  PublishSecurityEvent("gate_score_rejected", message,
                       {EventField("score_kind", std::string(context)),
                        EventField("reason", std::string(ReasonTag(code)))});
  return Status::Fail(ErrorDomain::Validation, code, message);
}

bool IsUnsignedDecimal(std::string_view value) noexcept {
  size_t idx = 0;
  size_t integer_digits = 0;
  while (idx < value.size() && value[idx] >= '0' && value[idx] <= '9') {
    ++idx;
    ++integer_digits;
  }
  if (integer_digits == 0) {
    return false;
  }
  if (idx == value.size()) {
    return true;
  }
  if (value[idx] != '.') {
    return false;
  }
  ++idx;
  size_t fraction_digits = 0;
  while (idx < value.size() && value[idx] >= '0' && value[idx] <= '9') {
    ++idx;
    ++fraction_digits;
  }
  return fraction_digits > 0 && idx == value.size();
}

// Shared front half of every score validator: trim, metacharacters, format.
Result<double> ParseScore(std::string_view raw, std::string_view context) {
  const auto value = TrimAsciiWhitespace(raw);
  if (value.empty()) {
    return Reject(errors::validation::kEmptyInput, errors::msg::kScoreEmpty, context);
  }
  if (value.find_first_of(kShellMetacharacters) != std::string_view::npos) {
    return Reject(errors::validation::kShellMetacharacters, errors::msg::kScoreShellCharacters, context);
  }
  if (value.size() > kMaxScoreLength || !IsUnsignedDecimal(value)) {
    return Reject(errors::validation::kNumericFormat, errors::msg::kScoreNotNumeric, context);
  }
  double parsed = 0.0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size() || !std::isfinite(parsed)) {
    return Reject(errors::validation::kNumericFormat, errors::msg::kScoreNotNumeric, context);
  }
  return parsed;
}

Result<double> ParsePercentage(std::string_view raw, std::string_view context) {
  auto parsed = ParseScore(raw, context);
  if (!parsed) {
    return parsed;
  }
  if (*parsed < 0.0 || *parsed > 100.0) {
    return Reject(errors::validation::kOutOfRange, errors::msg::kScoreOutOfRange, context);
  }
  return parsed;
}

std::string FormatNumber(double value) {
  std::ostringstream oss;
  oss << value;
  return oss.str();
}

GateThresholds EnforceBounds(const GateThresholds& requested) {
  auto bounded = ClampToBounds(requested);
  for (const auto& adjustment : bounded.adjustments) {
    const bool ceiling = adjustment.name == "max_critical_vulns";
    PublishSecurityEvent(ceiling ? "threshold_ceiling_enforced" : "threshold_floor_enforced",
                         "Requested gate threshold weaker than its bound; clamped",
                         {EventField("threshold", adjustment.name),
                          EventField("requested", FormatNumber(adjustment.requested), FieldPrivacy::kPublic, true),
                          EventField("enforced", FormatNumber(adjustment.enforced), FieldPrivacy::kPublic, true),
                          EventField("reason", std::string(ReasonTag(errors::config::kThresholdClamped)))});
  }
  return bounded.thresholds;
}

// A perfect score is accepted but may be a spoofed report.
void ReportPerfectScore(std::string_view event_id, std::string_view kind) {
  PublishEvent(EventCategory::kSecurity, EventSeverity::kWarning, event_id,
               "Perfect 100 score reported; verify the report source", {EventField("kind", std::string(kind))});
}

} // namespace

BoundedThresholds ClampToBounds(const GateThresholds& requested) {
  BoundedThresholds bounded{requested, {}};
  auto& out = bounded.thresholds;
  // !(x >= floor) also catches NaN
  if (!(requested.min_coverage >= kMinCoverageFloor)) {
    bounded.adjustments.push_back({"min_coverage", requested.min_coverage, kMinCoverageFloor});
    out.min_coverage = kMinCoverageFloor;
  }
  if (!(requested.min_security_score >= kMinSecurityScoreFloor)) {
    bounded.adjustments.push_back({"min_security_score", requested.min_security_score, kMinSecurityScoreFloor});
    out.min_security_score = kMinSecurityScoreFloor;
  }
  if (requested.max_critical_vulns > kMaxCriticalVulnsCeiling) {
    bounded.adjustments.push_back({"max_critical_vulns", static_cast<double>(requested.max_critical_vulns),
                                   static_cast<double>(kMaxCriticalVulnsCeiling)});
    out.max_critical_vulns = kMaxCriticalVulnsCeiling;
  }
  if (!requested.strict_mode) {
    bounded.adjustments.push_back({"strict_mode", 0.0, 1.0});
    out.strict_mode = true;
  }
  return bounded;
}

std::optional<GateScoreKind> ParseGateScoreKind(std::string_view name) noexcept {
  if (name == "coverage") {
    return GateScoreKind::kCoverage;
  }
  if (name == "security" || name == "security_score") {
    return GateScoreKind::kSecurityScore;
  }
  if (name == "confidence") {
    return GateScoreKind::kConfidence;
  }
  if (name == "critical_vulns") {
    return GateScoreKind::kCriticalVulns;
  }
  return std::nullopt;
}

Result<double> ValidateCoverageReport(std::string_view value) {
  auto coverage = ParsePercentage(value, "coverage");
  if (coverage && *coverage == 100.0) {
    ReportPerfectScore("coverage_perfect_score", "coverage");
  }
  return coverage;
}

Result<double> ValidateSecurityScore(std::string_view value) {
  auto score = ParsePercentage(value, "security_score");
  if (score && *score == 100.0) {
    ReportPerfectScore("security_score_perfect_score", "security_score");
  }
  return score;
}

Result<double> ValidateConfidenceScore(std::string_view value) {
  auto parsed = ParseScore(value, "confidence");
  if (!parsed) {
    return parsed;
  }
  const double confidence = *parsed;
  if (confidence <= 1.0) {
    return confidence;
  }
  if (confidence <= 100.0) {
    return confidence / 100.0;
  }
  return Reject(errors::validation::kOutOfRange, errors::msg::kScoreOutOfRange, "confidence");
}

Result<int> ValidateCriticalVulnCount(std::string_view raw) {
  const auto value = TrimAsciiWhitespace(raw);
  if (value.empty()) {
    return Reject(errors::validation::kEmptyInput, errors::msg::kScoreEmpty, "critical_vulns");
  }
  if (value.find_first_of(kShellMetacharacters) != std::string_view::npos) {
    return Reject(errors::validation::kShellMetacharacters, errors::msg::kScoreShellCharacters,
                  "critical_vulns");
  }
  int count = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), count);
  if (value.front() == '-' || value.front() == '+' || ec != std::errc() || ptr != value.data() + value.size()) {
    return Reject(errors::validation::kNumericFormat, errors::msg::kVulnCountNotInteger, "critical_vulns");
  }
  return count;
}

Result<double> ValidateGateScore(GateScoreKind kind, std::string_view value) {
  switch (kind) {
  case GateScoreKind::kCoverage:
    return ValidateCoverageReport(value);
  case GateScoreKind::kSecurityScore:
    return ValidateSecurityScore(value);
  case GateScoreKind::kConfidence:
    return ValidateConfidenceScore(value);
  case GateScoreKind::kCriticalVulns: {
    auto count = ValidateCriticalVulnCount(value);
    if (!count) {
      return count.status();
    }
    return static_cast<double>(*count);
  }
  }
  return Status::Fail(ErrorDomain::Validation, errors::validation::kInvalidValue, errors::msg::kUnknownScoreKind);
}

GateValidator::GateValidator(const GateThresholds& requested) : thresholds_(EnforceBounds(requested)) {}

GateDecision GateValidator::Evaluate(const GateReport& report) const {
  GateDecision decision;
  if (auto coverage = ValidateCoverageReport(report.coverage); !coverage) {
    decision.failures.emplace_back("coverage_invalid");
  } else if (*coverage < thresholds_.min_coverage) {
    decision.failures.emplace_back("coverage_below_threshold");
  }
  if (auto score = ValidateSecurityScore(report.security_score); !score) {
    decision.failures.emplace_back("security_score_invalid");
  } else if (*score < thresholds_.min_security_score) {
    decision.failures.emplace_back("security_score_below_threshold");
  }
  if (auto vulns = ValidateCriticalVulnCount(report.critical_vulns); !vulns) {
    decision.failures.emplace_back("critical_vulns_invalid");
  } else if (*vulns > thresholds_.max_critical_vulns) {
    decision.failures.emplace_back("critical_vulns_exceed_ceiling");
  }
  // strict mode is always on after clamping; a missing runner is never a skip
  if (!report.test_runner_available) {
    decision.failures.emplace_back("test_runner_missing");
  } else if (!report.tests_passed) {
    decision.failures.emplace_back("tests_failed");
  }

  decision.passed = decision.failures.empty();
  std::string joined;
  for (const auto& failure : decision.failures) {
    if (!joined.empty()) {
      joined += ',';
    }
    joined += failure;
  }
  if (decision.passed) {
    decision.status = Status::Ok();
  } else if (!report.test_runner_available) {
    decision.status = Status::Fail(ErrorDomain::Dependency, errors::dependency::kTestRunnerMissing,
                                   std::string(errors::msg::kTestRunnerMissing) + ": " + joined);
  } else {
    decision.status = Status::Fail(ErrorDomain::State, errors::state::kGateFailed, "Gate failed: " + joined);
  }
  PublishEvent(EventCategory::kLifecycle, decision.passed ? EventSeverity::kInfo : EventSeverity::kWarning,
               "gate_evaluated", decision.passed ? "Gate passed" : "Gate failed",
               {EventField("failures", joined)});
  return decision;
}

}  // namespace tg::orchestrator

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tg/status.h"

namespace tg::orchestrator {

// Immutable bounds. Runtime configuration may tighten a gate, never loosen it.
inline constexpr double kMinCoverageFloor = 70.0;
inline constexpr double kMinSecurityScoreFloor = 60.0;
inline constexpr int kMaxCriticalVulnsCeiling = 0;

inline constexpr double kDefaultMinCoverage = 80.0;
inline constexpr double kDefaultMinSecurityScore = 70.0;
inline constexpr int kDefaultMaxCriticalVulns = 0;

struct GateThresholds {
  double min_coverage{kDefaultMinCoverage};
  double min_security_score{kDefaultMinSecurityScore};
  int max_critical_vulns{kDefaultMaxCriticalVulns};
  bool strict_mode{true};
};

struct ThresholdAdjustment {
  std::string name;
  double requested{0.0};
  double enforced{0.0};
};

struct BoundedThresholds {
  GateThresholds thresholds;
  std::vector<ThresholdAdjustment> adjustments;
};

// Pure clamp of requested thresholds onto the floors and ceiling.
[[nodiscard]] BoundedThresholds ClampToBounds(const GateThresholds& requested);

enum class GateScoreKind { kCoverage, kSecurityScore, kConfidence, kCriticalVulns };

[[nodiscard]] std::optional<GateScoreKind> ParseGateScoreKind(std::string_view name) noexcept;

// Each validator trims surrounding whitespace, then accepts only an unsigned
// integer or decimal inside its closed range.
[[nodiscard]] Result<double> ValidateCoverageReport(std::string_view value);
[[nodiscard]] Result<double> ValidateSecurityScore(std::string_view value);
// Accepts 0-1 or 0-100; the result is normalized to 0-1.
[[nodiscard]] Result<double> ValidateConfidenceScore(std::string_view value);
[[nodiscard]] Result<int> ValidateCriticalVulnCount(std::string_view value);
[[nodiscard]] Result<double> ValidateGateScore(GateScoreKind kind, std::string_view value);

struct GateReport {
  std::string coverage;
  std::string security_score;
  std::string critical_vulns;
  bool test_runner_available{false};
  bool tests_passed{false};
};

struct GateDecision {
  bool passed{false};
  std::vector<std::string> failures;
  Status status;
};

class GateValidator {
public:
  // Clamps requested onto the bounds; every clamp is published as a
  // security event.
  explicit GateValidator(const GateThresholds& requested = {});

  [[nodiscard]] const GateThresholds& thresholds() const noexcept { return thresholds_; }

  [[nodiscard]] GateDecision Evaluate(const GateReport& report) const;

private:
  const GateThresholds thresholds_;
};

}  // namespace tg::orchestrator

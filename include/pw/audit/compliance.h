#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "pw/types.h"

namespace pw::audit {

enum class ComplianceFramework : std::uint8_t { kIso27001, kSoc2, kGdpr, kHipaa, kPciDss, kNist, kCis };

std::string_view ToString(ComplianceFramework framework) noexcept;
ComplianceFramework ParseComplianceFramework(std::string_view name);

enum class ControlStatus : std::uint8_t { kCompliant, kPartiallyCompliant, kNonCompliant, kNotAssessed };

std::string_view ToString(ControlStatus status) noexcept;

// What the audit trail has to show for a control to pass.
enum class ControlCheck : std::uint8_t {
  kAccessControl,
  kAuditLogging,
  kIncidentResponse,
  kMalwareProtection,
  kDataProtection,
  kChangeManagement,
  kThreatMonitoring
};

struct DateRange {
  TimePoint start{};
  TimePoint end{};

  bool Contains(TimePoint tp) const noexcept { return tp >= start && tp <= end; }
};

struct ControlDefinition {
  std::string id;
  std::string name;
  std::string category;
  ControlCheck check{ControlCheck::kAuditLogging};
};

// Controls assessed for |framework|, in catalogue order.
const std::vector<ControlDefinition>& ControlCatalogue(ComplianceFramework framework);

// Audit-trail figures for one reporting period.
struct PeriodStatistics {
  std::uint64_t events{0};
  std::uint64_t login_failures{0};
  std::uint64_t permission_denials{0};
  std::uint64_t malware_detections{0};
  std::uint64_t exfiltration_events{0};
  std::uint64_t policy_violations{0};
  std::uint64_t configuration_changes{0};
  std::uint64_t suspicious_activities{0};
  std::uint64_t unresolved_high_events{0};
  std::uint64_t incidents{0};
  std::uint64_t incidents_resolved{0};  // RESOLVED or CLOSED
  std::uint64_t incidents_unresolved_critical{0};
  bool audit_log_intact{true};
};

struct ComplianceControl {
  std::string id;
  std::string name;
  std::string category;
  ControlStatus status{ControlStatus::kNotAssessed};
  double score{0.0};
  std::vector<std::string> evidence;  // Evidence ids
  TimePoint last_tested{};
  TimePoint next_test{};
  std::string owner{"security-team"};
};

struct ComplianceViolation {
  std::string id;
  std::string control_id;
  Severity severity{Severity::kMedium};
  std::string description;
  TimePoint discovered_at{};
  std::string remediation;
  TimePoint due_date{};
};

struct ComplianceRecommendation {
  std::string id;
  std::string title;
  std::string description;
  Severity priority{Severity::kMedium};
  std::string category;
};

struct Evidence {
  std::string id;
  std::string type{"AUDIT_TRAIL"};
  std::string description;
  std::string source{"audit-system"};
  TimePoint timestamp{};
  std::string data;
  std::string hash;  // SHA-256 hex of data
  bool verified{false};
};

struct ComplianceReport {
  std::string id;
  ComplianceFramework framework{ComplianceFramework::kIso27001};
  DateRange period;
  double overall_score{0.0};
  std::vector<ComplianceControl> controls;
  std::vector<ComplianceViolation> violations;
  std::vector<ComplianceRecommendation> recommendations;
  std::vector<Evidence> evidence;
  TimePoint generated_at{};
  TimePoint next_review{};
};

inline constexpr double kCompliantScore = 90.0;
inline constexpr double kPartiallyCompliantScore = 60.0;
inline constexpr auto kReviewInterval = std::chrono::hours(24 * 90);

// Score in [0,100] for one control against the period's figures.
double AssessControl(ControlCheck check, const PeriodStatistics& stats) noexcept;
ControlStatus StatusForScore(double score) noexcept;

// Builds the full report: controls, evidence, violations for failed controls,
// recommendations per affected category and the mean control score.
ComplianceReport BuildComplianceReport(ComplianceFramework framework, const DateRange& period,
                                       const PeriodStatistics& stats, TimePoint now);

} // namespace pw::audit

#include "pw/audit/compliance.h"

#include <algorithm>
#include <map>
#include <sstream>

#include "pw/crypto/sha256.h"
#include "pw/error.h"

namespace pw::audit {

namespace {

std::string_view ToString(ControlCheck check) noexcept {
  switch (check) {
  case ControlCheck::kAccessControl:
    return "access-control";
  case ControlCheck::kAuditLogging:
    return "audit-logging";
  case ControlCheck::kIncidentResponse:
    return "incident-response";
  case ControlCheck::kMalwareProtection:
    return "malware-protection";
  case ControlCheck::kDataProtection:
    return "data-protection";
  case ControlCheck::kChangeManagement:
    return "change-management";
  case ControlCheck::kThreatMonitoring:
    return "threat-monitoring";
  }
  return "unknown";
}

std::string_view RemediationFor(ControlCheck check) noexcept {
  switch (check) {
  case ControlCheck::kAccessControl:
    return "Review failed logins and permission denials; tighten credentials and grants";
  case ControlCheck::kAuditLogging:
    return "Restore the audit log chain and investigate the integrity failure";
  case ControlCheck::kIncidentResponse:
    return "Work open incidents to resolution, prioritising critical ones";
  case ControlCheck::kMalwareProtection:
    return "Quarantine affected plugins and rescan their sources";
  case ControlCheck::kDataProtection:
    return "Block exfiltration paths and review plugin network grants";
  case ControlCheck::kChangeManagement:
    return "Route configuration changes through review and fix policy violations";
  case ControlCheck::kThreatMonitoring:
    return "Triage suspicious activity and unresolved high severity events";
  }
  return "";
}

double Clamp(double score) noexcept {
  return std::clamp(score, 0.0, 100.0);
}

ControlDefinition Control(std::string id, std::string name, std::string category, ControlCheck check) {
  return ControlDefinition{std::move(id), std::move(name), std::move(category), check};
}

std::string Describe(ControlCheck check, const PeriodStatistics& stats) {
  std::ostringstream out;
  out << "check=" << ToString(check) << ";events=" << stats.events;
  switch (check) {
  case ControlCheck::kAccessControl:
    out << ";login_failures=" << stats.login_failures << ";permission_denials=" << stats.permission_denials;
    break;
  case ControlCheck::kAuditLogging:
    out << ";log_intact=" << (stats.audit_log_intact ? "true" : "false");
    break;
  case ControlCheck::kIncidentResponse:
    out << ";incidents=" << stats.incidents << ";resolved=" << stats.incidents_resolved
        << ";unresolved_critical=" << stats.incidents_unresolved_critical;
    break;
  case ControlCheck::kMalwareProtection:
    out << ";malware=" << stats.malware_detections;
    break;
  case ControlCheck::kDataProtection:
    out << ";exfiltration=" << stats.exfiltration_events;
    break;
  case ControlCheck::kChangeManagement:
    out << ";configuration_changes=" << stats.configuration_changes
        << ";policy_violations=" << stats.policy_violations;
    break;
  case ControlCheck::kThreatMonitoring:
    out << ";suspicious=" << stats.suspicious_activities
        << ";unresolved_high=" << stats.unresolved_high_events;
    break;
  }
  return out.str();
}

} // namespace

std::string_view ToString(ComplianceFramework framework) noexcept {
  switch (framework) {
  case ComplianceFramework::kIso27001:
    return "ISO27001";
  case ComplianceFramework::kSoc2:
    return "SOC2";
  case ComplianceFramework::kGdpr:
    return "GDPR";
  case ComplianceFramework::kHipaa:
    return "HIPAA";
  case ComplianceFramework::kPciDss:
    return "PCI_DSS";
  case ComplianceFramework::kNist:
    return "NIST";
  case ComplianceFramework::kCis:
    return "CIS";
  }
  return "ISO27001";
}

ComplianceFramework ParseComplianceFramework(std::string_view name) {
  for (auto candidate : {ComplianceFramework::kIso27001, ComplianceFramework::kSoc2, ComplianceFramework::kGdpr,
                         ComplianceFramework::kHipaa, ComplianceFramework::kPciDss, ComplianceFramework::kNist,
                         ComplianceFramework::kCis}) {
    if (ToString(candidate) == name) {
      return candidate;
    }
  }
  throw Error(ErrorDomain::Validation, errors::validation::kUnknownEnumName,
              "Unknown compliance framework: " + std::string(name));
}

std::string_view ToString(ControlStatus status) noexcept {
  switch (status) {
  case ControlStatus::kCompliant:
    return "COMPLIANT";
  case ControlStatus::kPartiallyCompliant:
    return "PARTIALLY_COMPLIANT";
  case ControlStatus::kNonCompliant:
    return "NON_COMPLIANT";
  case ControlStatus::kNotAssessed:
    return "NOT_ASSESSED";
  }
  return "NOT_ASSESSED";
}

const std::vector<ControlDefinition>& ControlCatalogue(ComplianceFramework framework) {
  using C = ControlCheck;
  static const std::map<ComplianceFramework, std::vector<ControlDefinition>> kCatalogue = {
      {ComplianceFramework::kIso27001,
       {Control("A.5.15", "Access control", "Access", C::kAccessControl),
        Control("A.5.24", "Incident management planning", "Incident", C::kIncidentResponse),
        Control("A.8.7", "Protection against malware", "Endpoint", C::kMalwareProtection),
        Control("A.8.12", "Data leakage prevention", "Data", C::kDataProtection),
        Control("A.8.15", "Logging", "Monitoring", C::kAuditLogging),
        Control("A.8.32", "Change management", "Operations", C::kChangeManagement)}},
      {ComplianceFramework::kSoc2,
       {Control("CC6.1", "Logical access security", "Access", C::kAccessControl),
        Control("CC7.2", "System monitoring", "Monitoring", C::kAuditLogging),
        Control("CC7.3", "Security event evaluation", "Monitoring", C::kThreatMonitoring),
        Control("CC7.4", "Incident response", "Incident", C::kIncidentResponse),
        Control("CC8.1", "Change management", "Operations", C::kChangeManagement)}},
      {ComplianceFramework::kGdpr,
       {Control("Art.25", "Data protection by design", "Access", C::kAccessControl),
        Control("Art.30", "Records of processing", "Monitoring", C::kAuditLogging),
        Control("Art.32", "Security of processing", "Data", C::kDataProtection),
        Control("Art.33", "Breach notification", "Incident", C::kIncidentResponse)}},
      {ComplianceFramework::kHipaa,
       {Control("164.308(a)(1)", "Security management process", "Monitoring", C::kThreatMonitoring),
        Control("164.308(a)(6)", "Security incident procedures", "Incident", C::kIncidentResponse),
        Control("164.312(a)(1)", "Access control", "Access", C::kAccessControl),
        Control("164.312(b)", "Audit controls", "Monitoring", C::kAuditLogging),
        Control("164.312(e)(1)", "Transmission security", "Data", C::kDataProtection)}},
      {ComplianceFramework::kPciDss,
       {Control("5.2", "Malicious software prevention", "Endpoint", C::kMalwareProtection),
        Control("6.5", "Change management", "Operations", C::kChangeManagement),
        Control("7.2", "Access control", "Access", C::kAccessControl),
        Control("10.2", "Audit logs", "Monitoring", C::kAuditLogging),
        Control("12.10", "Incident response", "Incident", C::kIncidentResponse)}},
      {ComplianceFramework::kNist,
       {Control("PR.AA-05", "Access permissions", "Access", C::kAccessControl),
        Control("PR.DS-02", "Data in transit protection", "Data", C::kDataProtection),
        Control("DE.CM-01", "Network monitoring", "Monitoring", C::kThreatMonitoring),
        Control("PR.PS-04", "Log records", "Monitoring", C::kAuditLogging),
        Control("RS.MA-01", "Incident management", "Incident", C::kIncidentResponse)}},
      {ComplianceFramework::kCis,
       {Control("CIS-3", "Data protection", "Data", C::kDataProtection),
        Control("CIS-6", "Access control management", "Access", C::kAccessControl),
        Control("CIS-8", "Audit log management", "Monitoring", C::kAuditLogging),
        Control("CIS-10", "Malware defenses", "Endpoint", C::kMalwareProtection),
        Control("CIS-17", "Incident response management", "Incident", C::kIncidentResponse)}},
  };
  return kCatalogue.at(framework);
}

double AssessControl(ControlCheck check, const PeriodStatistics& stats) noexcept {
  switch (check) {
  case ControlCheck::kAccessControl:
    return Clamp(100.0 - 5.0 * static_cast<double>(stats.login_failures) -
                 3.0 * static_cast<double>(stats.permission_denials));
  case ControlCheck::kAuditLogging:
    return stats.audit_log_intact ? 100.0 : 40.0;
  case ControlCheck::kIncidentResponse: {
    const auto unresolved =
        stats.incidents > stats.incidents_resolved ? stats.incidents - stats.incidents_resolved : 0;
    return Clamp(100.0 - 15.0 * static_cast<double>(unresolved) -
                 20.0 * static_cast<double>(stats.incidents_unresolved_critical));
  }
  case ControlCheck::kMalwareProtection:
    return Clamp(100.0 - 30.0 * static_cast<double>(stats.malware_detections));
  case ControlCheck::kDataProtection:
    return Clamp(100.0 - 40.0 * static_cast<double>(stats.exfiltration_events));
  case ControlCheck::kChangeManagement:
    return Clamp(100.0 - 10.0 * static_cast<double>(stats.policy_violations));
  case ControlCheck::kThreatMonitoring:
    return Clamp(100.0 - 10.0 * static_cast<double>(stats.suspicious_activities) -
                 5.0 * static_cast<double>(stats.unresolved_high_events));
  }
  return 0.0;
}

ControlStatus StatusForScore(double score) noexcept {
  if (score >= kCompliantScore) {
    return ControlStatus::kCompliant;
  }
  if (score >= kPartiallyCompliantScore) {
    return ControlStatus::kPartiallyCompliant;
  }
  return ControlStatus::kNonCompliant;
}

ComplianceReport BuildComplianceReport(ComplianceFramework framework, const DateRange& period,
                                       const PeriodStatistics& stats, TimePoint now) {
  ComplianceReport report;
  report.id = MakeId("rpt");
  report.framework = framework;
  report.period = period;
  report.generated_at = now;
  report.next_review = now + kReviewInterval;

  const auto& catalogue = ControlCatalogue(framework);
  std::map<std::string, Severity> categories;
  double total = 0.0;
  for (const auto& definition : catalogue) {
    Evidence evidence;
    evidence.id = MakeId("evd");
    evidence.description = "Audit trail summary for " + definition.id;
    evidence.timestamp = now;
    evidence.data = Describe(definition.check, stats);
    evidence.hash = crypto::SHA256_Hex(evidence.data);
    evidence.verified = true;

    ComplianceControl control;
    control.id = definition.id;
    control.name = definition.name;
    control.category = definition.category;
    control.score = AssessControl(definition.check, stats);
    control.status = StatusForScore(control.score);
    control.last_tested = now;
    control.next_test = now + kReviewInterval;
    control.evidence.push_back(evidence.id);
    total += control.score;

    if (control.status != ControlStatus::kCompliant) {
      ComplianceViolation violation;
      violation.id = MakeId("cvl");
      violation.control_id = control.id;
      violation.severity =
          control.status == ControlStatus::kNonCompliant ? Severity::kHigh : Severity::kMedium;
      violation.description = control.name + " scored " + std::to_string(static_cast<int>(control.score));
      violation.discovered_at = now;
      violation.remediation = std::string(RemediationFor(definition.check));
      violation.due_date = now + std::chrono::hours(24 * (violation.severity == Severity::kHigh ? 30 : 90));
      auto& worst = categories[control.category];
      worst = std::max(worst, violation.severity);
      report.violations.push_back(std::move(violation));
    }
    report.evidence.push_back(std::move(evidence));
    report.controls.push_back(std::move(control));
  }
  report.overall_score = catalogue.empty() ? 100.0 : total / static_cast<double>(catalogue.size());

  for (const auto& [category, priority] : categories) {
    ComplianceRecommendation recommendation;
    recommendation.id = MakeId("rec");
    recommendation.category = category;
    recommendation.priority = priority;
    recommendation.title = "Remediate " + category + " controls";
    std::string controls;
    for (const auto& violation : report.violations) {
      for (const auto& control : report.controls) {
        if (control.id == violation.control_id && control.category == category) {
          controls += (controls.empty() ? "" : ", ") + control.id;
        }
      }
    }
    recommendation.description = "Failed controls: " + controls;
    report.recommendations.push_back(std::move(recommendation));
  }
  return report;
}

} // namespace pw::audit

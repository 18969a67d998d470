#include "pw/orchestrator/orchestration.h"

#include <algorithm>
#include <future>
#include <iostream>
#include <limits>
#include <numeric>
#include <set>

#include "pw/crypto/x509.h"
#include "pw/error.h"
#include "pw/errors.h"
#include "pw/orchestrator/event_bus.h"
#include "pw/orchestrator/io_util.h"
#include "pw/trust/manifest.h"

namespace pw::orchestrator {

namespace {

constexpr int kProfileRetries = 3;
constexpr auto kDefaultReportPeriod = std::chrono::hours(24 * 30);
constexpr std::string_view kManifestName{"plugin.json"};

const std::vector<std::string>& SensitiveRoots() {
  static const std::vector<std::string> kRoots = {"/etc", "/root", "/home", "/var", "/boot", "/sys"};
  return kRoots;
}

Severity FindingSeverity(trust::IssueSeverity severity) noexcept {
  switch (severity) {
  case trust::IssueSeverity::kFatal:
    return Severity::kHigh;
  case trust::IssueSeverity::kError:
    return Severity::kMedium;
  case trust::IssueSeverity::kWarning:
    return Severity::kLow;
  }
  return Severity::kLow;
}

std::vector<std::string> ManifestPermissions(const std::filesystem::path& plugin_path,
                                             const std::optional<trust::VerificationResult>& verification) {
  if (verification && verification->manifest) {
    return verification->manifest->permissions;
  }
  const auto manifest = plugin_path / kManifestName;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(manifest, ec)) {
    return {};
  }
  return trust::ParseManifest(ReadFileText(manifest)).permissions;
}

void AddUnique(std::vector<std::string>& values, std::string value) {
  if (std::find(values.begin(), values.end(), value) == values.end()) {
    values.push_back(std::move(value));
  }
}

double Mean(const std::vector<double>& values, double fallback) {
  if (values.empty()) {
    return fallback;
  }
  return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

} // namespace

std::string_view ToString(RestrictionType type) noexcept {
  switch (type) {
  case RestrictionType::kNetwork:
    return "NETWORK";
  case RestrictionType::kFilesystem:
    return "FILESYSTEM";
  }
  return "NETWORK";
}

std::string_view ToString(ProfileStatus status) noexcept {
  switch (status) {
  case ProfileStatus::kActive:
    return "ACTIVE";
  case ProfileStatus::kDenied:
    return "DENIED";
  case ProfileStatus::kRetired:
    return "RETIRED";
  }
  return "DENIED";
}

std::string_view ToString(ProfileCompliance status) noexcept {
  switch (status) {
  case ProfileCompliance::kCompliant:
    return "COMPLIANT";
  case ProfileCompliance::kUnderReview:
    return "UNDER_REVIEW";
  case ProfileCompliance::kNonCompliant:
    return "NON_COMPLIANT";
  }
  return "UNDER_REVIEW";
}

std::string_view ToString(ReportType type) noexcept {
  switch (type) {
  case ReportType::kVulnerability:
    return "VULNERABILITY";
  case ReportType::kCompliance:
    return "COMPLIANCE";
  case ReportType::kIncident:
    return "INCIDENT";
  case ReportType::kTrend:
    return "TREND";
  case ReportType::kExecutive:
    return "EXECUTIVE";
  }
  return "EXECUTIVE";
}

ReportType ParseReportType(std::string_view name) {
  for (auto candidate : {ReportType::kVulnerability, ReportType::kCompliance, ReportType::kIncident,
                         ReportType::kTrend, ReportType::kExecutive}) {
    if (ToString(candidate) == name) {
      return candidate;
    }
  }
  throw Error(ErrorDomain::Validation, errors::validation::kUnknownEnumName,
              "Unknown report type: " + std::string(name));
}

std::string_view ToString(RiskTrend trend) noexcept {
  switch (trend) {
  case RiskTrend::kImproving:
    return "IMPROVING";
  case RiskTrend::kStable:
    return "STABLE";
  case RiskTrend::kDeteriorating:
    return "DETERIORATING";
  }
  return "STABLE";
}

RiskLevel ComputeRiskLevel(const std::vector<security::PolicyViolation>& violations, int score) noexcept {
  bool critical = false;
  std::size_t high = 0;
  for (const auto& violation : violations) {
    if (violation.severity == Severity::kCritical) {
      critical = true;
    } else if (violation.severity == Severity::kHigh) {
      ++high;
    }
  }
  if (critical || score < 30) {
    return RiskLevel::kCritical;
  }
  if (high > 2 || score < 50) {
    return RiskLevel::kHigh;
  }
  if (high >= 1 || score < 70) {
    return RiskLevel::kMedium;
  }
  return RiskLevel::kLow;
}

std::vector<SecurityRestriction> GenerateRestrictions(RiskLevel risk, TrustLevel trust) {
  std::vector<SecurityRestriction> out;
  if (risk >= RiskLevel::kHigh) {
    out.push_back({RestrictionType::kNetwork, "deny-all", {"*"},
                   "Risk level " + std::string(ToString(risk)) + " forbids outbound traffic"});
  }
  if (trust <= TrustLevel::kLow) {
    out.push_back({RestrictionType::kFilesystem, "deny", SensitiveRoots(),
                   "Trust level " + std::string(ToString(trust)) + " forbids sensitive filesystem roots"});
  }
  return out;
}

bool IsInstallationAllowed(const std::vector<security::PolicyViolation>& violations, int score, bool strict_mode,
                           bool signature_valid, bool signatures_required) noexcept {
  const bool critical = std::any_of(violations.begin(), violations.end(), [](const security::PolicyViolation& v) {
    return v.severity == Severity::kCritical;
  });
  return !critical && (score >= 50 || !strict_mode) && (signature_valid || !signatures_required);
}

double CvssForSeverity(Severity severity) noexcept {
  switch (severity) {
  case Severity::kCritical:
    return 9.0;
  case Severity::kHigh:
    return 7.0;
  case Severity::kMedium:
    return 5.0;
  case Severity::kLow:
    return 3.0;
  case Severity::kInfo:
    return 0.0;
  }
  return 0.0;
}

Orchestration::Orchestration(OrchestrationConfig config, EventBus& bus, audit::AuditSystem& audit,
                             analysis::CodeAnalyzer& analyzer, trust::SignatureVerifier& verifier,
                             security::SecurityFramework& framework, OrchestrationHooks hooks)
    : bus_(bus),
      audit_(audit),
      analyzer_(analyzer),
      verifier_(verifier),
      framework_(framework),
      hooks_(std::move(hooks)),
      config_(std::move(config)) {}

TimePoint Orchestration::Now() const {
  return hooks_.now ? hooks_.now() : Clock::now();
}

OrchestrationConfig Orchestration::Configuration() const {
  std::lock_guard<std::mutex> guard(config_mutex_);
  return config_;
}

InstallationResult Orchestration::ProcessPluginInstallation(const std::string& plugin_id,
                                                            const std::filesystem::path& plugin_path,
                                                            const SecurityContext& context) {
  InstallationResult result;
  result.plugin_id = plugin_id;
  bool audit_enabled = true;
  try {
    const auto config = Configuration();
    audit_enabled = config.auditing.enabled;
    if (hooks_.before_assessment) {
      hooks_.before_assessment(plugin_id);
    }
    RunInstallation(plugin_id, plugin_path, context, config, result);
  } catch (const std::exception& ex) {
    FailClosed(plugin_id, plugin_path, ex.what(), context, result);
  }

  try {
    if (audit_enabled) {
      std::vector<std::string> tags = {"installation", result.allowed ? "allowed" : "denied"};
      if (result.sandbox_id) {
        tags.push_back("sandboxed");
      }
      RecordAudit(audit::EventType::kPluginInstall, result.allowed ? Severity::kInfo : Severity::kHigh, plugin_id,
                  std::string("Plugin installation ") + (result.allowed ? "allowed" : "denied"),
                  {{"score", std::to_string(result.score)},
                   {"risk_level", std::string(ToString(result.risk_level))},
                   {"trust_level", std::string(ToString(result.trust_level))},
                   {"violations", std::to_string(result.violations.size())},
                   {"sandbox_id", result.sandbox_id.value_or("")}},
                  std::move(tags), context);
    }
    Event event;
    event.category = EventCategory::kSecurity;
    event.severity = result.allowed ? EventSeverity::kInfo : EventSeverity::kWarning;
    event.event_id = "plugin_installation";
    event.message = result.allowed ? "Plugin installation allowed" : "Plugin installation denied";
    event.fields.emplace_back("plugin_id", plugin_id);
    event.fields.emplace_back("score", std::to_string(result.score), FieldPrivacy::kPublic, true);
    event.fields.emplace_back("risk_level", std::string(ToString(result.risk_level)));
    event.fields.emplace_back("trust_level", std::string(ToString(result.trust_level)));
    bus_.Publish(event);
  } catch (const std::exception& ex) {
    std::clog << "{\"event\":\"installation_audit_failed\",\"plugin\":\"" << plugin_id << "\",\"message\":\""
              << ex.what() << "\"}" << std::endl;
  }
  return result;
}

void Orchestration::RunInstallation(const std::string& plugin_id, const std::filesystem::path& plugin_path,
                                    const SecurityContext& context, const OrchestrationConfig& config,
                                    InstallationResult& result) {
  // Analysis and verification have no ordering dependency.
  std::future<analysis::AnalysisResult> analysis_future;
  std::future<trust::VerificationResult> verification_future;
  if (config.static_analysis.enabled) {
    analysis::AnalysisOptions options;
    options.include_tests = config.static_analysis.include_tests;
    options.max_depth = config.static_analysis.max_depth;
    options.timeout = config.static_analysis.timeout;
    options.max_file_size = config.static_analysis.max_file_size;
    analysis_future = std::async(std::launch::async, [this, plugin_path, options]() {
      return analyzer_.Analyze(plugin_path, options);
    });
  }
  if (config.signatures.enabled) {
    verification_future =
        std::async(std::launch::async, [this, plugin_path]() { return verifier_.Verify(plugin_path); });
  }
  if (analysis_future.valid()) {
    result.analysis = analysis_future.get();
  }
  if (verification_future.valid()) {
    result.verification = verification_future.get();
  }

  result.score = result.analysis ? result.analysis->score : 100;
  result.trust_level = result.verification ? result.verification->trust_level : TrustLevel::kUntrusted;
  const bool signature_valid = result.verification && result.verification->valid;

  security::ValidationRequest request;
  request.plugin_id = plugin_id;
  request.policy_id = config.runtime.policy;
  request.analysis = result.analysis ? &*result.analysis : nullptr;
  request.verification = result.verification ? &*result.verification : nullptr;
  request.requested_permissions = ManifestPermissions(plugin_path, result.verification);
  request.requested_memory = config.runtime.sandbox.memory.limit_bytes;
  request.requested_cpu_time = config.runtime.sandbox.cpu.cpu_time;
  request.unsigned_allowed = config.signatures.allow_unsigned;
  request.context = context;
  auto validation = framework_.ValidatePluginForExecution(request);
  result.violations = std::move(validation.violations);

  result.risk_level = ComputeRiskLevel(result.violations, result.score);
  result.restrictions = GenerateRestrictions(result.risk_level, result.trust_level);
  result.allowed = IsInstallationAllowed(result.violations, result.score, config.static_analysis.strict_mode,
                                         signature_valid, config.signatures.enabled && config.signatures.require);

  // Findings and recommendations for the plugin author.
  std::vector<SecurityFinding> findings;
  if (result.analysis) {
    for (const auto& finding : result.analysis->vulnerabilities) {
      findings.push_back({finding.id, "static-analysis", finding.severity, finding.title,
                          finding.description + " (" + finding.file + ":" + std::to_string(finding.line) + ")",
                          CvssForSeverity(finding.severity), finding.remediation});
    }
    for (const auto& recommendation : result.analysis->recommendations) {
      AddUnique(result.recommendations, recommendation.title + ": " + recommendation.description);
    }
  }
  if (result.verification) {
    for (const auto& issue : result.verification->errors) {
      const auto severity = FindingSeverity(issue.severity);
      findings.push_back({MakeId("finding"), "signature", severity, std::string(trust::ToString(issue.code)),
                          issue.message, CvssForSeverity(severity),
                          "Re-sign the plugin with a valid certificate chained to a registered trust anchor"});
    }
  }
  for (const auto& violation : result.violations) {
    if (violation.kind == security::ViolationKind::kPermissionDenied ||
        violation.kind == security::ViolationKind::kResourceLimit) {
      findings.push_back({violation.id, "policy", violation.severity, std::string(ToString(violation.kind)),
                          violation.description, CvssForSeverity(violation.severity),
                          "Align the plugin's requirements with policy " + config.runtime.policy});
    }
  }
  if (config.signatures.enabled && !signature_valid) {
    AddUnique(result.recommendations, "Sign the plugin with a certificate chained to a registered trust anchor");
  }
  if (std::any_of(result.violations.begin(), result.violations.end(), [](const security::PolicyViolation& v) {
        return v.kind == security::ViolationKind::kPermissionDenied;
      })) {
    AddUnique(result.recommendations, "Request only permissions granted by policy " + config.runtime.policy);
  }
  if (result.risk_level >= RiskLevel::kHigh) {
    AddUnique(result.recommendations, "Resolve HIGH and CRITICAL findings before deployment");
  }
  if (config.static_analysis.strict_mode && result.score < 50) {
    AddUnique(result.recommendations, "Raise the security score to at least 50");
  }

  result.profile_version = CommitAssessment(plugin_id, plugin_path, result, std::move(findings));

  if (!result.allowed || !config.runtime.enabled) {
    return;
  }
  security::SandboxRestrictions restrictions;
  for (const auto& restriction : result.restrictions) {
    if (restriction.type == RestrictionType::kNetwork) {
      restrictions.deny_network = true;
    } else {
      for (const auto& target : restriction.targets) {
        restrictions.blocked_paths.emplace_back(target);
      }
    }
  }
  result.sandbox_id =
      framework_.CreateSecureSandbox(plugin_id, config.runtime.policy, context, config.runtime.sandbox, restrictions);
  const auto sandbox_id = *result.sandbox_id;
  result.profile_version = MutateProfile(plugin_id, [&sandbox_id](PluginSecurityProfile& profile) {
    profile.sandbox_id = sandbox_id;
  });
}

void Orchestration::FailClosed(const std::string& plugin_id, const std::filesystem::path& plugin_path,
                               const std::string& reason, const SecurityContext& context,
                               InstallationResult& result) {
  std::clog << "[orchestration] installation of " << plugin_id << " failed closed: " << reason << std::endl;
  try {
    if (result.sandbox_id) {
      framework_.ReleaseSandbox(*result.sandbox_id);
      result.sandbox_id.reset();
    }
  } catch (const std::exception& ex) {
    std::clog << "[orchestration] sandbox cleanup failed: " << ex.what() << std::endl;
  }

  security::PolicyViolation violation;
  violation.id = MakeId("vio");
  violation.kind = security::ViolationKind::kInternalError;
  violation.severity = Severity::kHigh;
  violation.description = "Security pipeline failed: " + reason;
  violation.timestamp = Now();
  violation.plugin_id = plugin_id;
  violation.context = context;
  violation.details = {{"phase", "installation"}};
  violation.blocked = true;
  result.violations.push_back(std::move(violation));

  result.allowed = false;
  result.risk_level = ComputeRiskLevel(result.violations, result.score);
  result.restrictions = GenerateRestrictions(result.risk_level, result.trust_level);
  AddUnique(result.recommendations, "Retry the installation after resolving: " + reason);

  try {
    result.profile_version = CommitAssessment(
        plugin_id, plugin_path, result,
        {{result.violations.back().id, "internal", Severity::kHigh, "INTERNAL_ERROR", reason,
          CvssForSeverity(Severity::kHigh), "Retry the installation"}});
  } catch (const std::exception& ex) {
    std::clog << "[orchestration] profile for " << plugin_id << " not recorded: " << ex.what() << std::endl;
  }
}

std::uint64_t Orchestration::CommitAssessment(const std::string& plugin_id, const std::filesystem::path& plugin_path,
                                              const InstallationResult& result,
                                              std::vector<SecurityFinding> findings) {
  SecurityAssessment assessment;
  assessment.id = MakeId("assess");
  assessment.performed_at = Now();
  assessment.score = result.score;
  assessment.risk_level = result.risk_level;
  assessment.trust_level = result.trust_level;
  assessment.allowed = result.allowed;
  assessment.findings = std::move(findings);

  std::optional<std::string> previous_sandbox;
  const auto version = MutateProfile(plugin_id, [&](PluginSecurityProfile& profile) {
    previous_sandbox = profile.sandbox_id;
    profile.plugin_path = plugin_path;
    profile.security_score = result.score;
    profile.trust_level = result.trust_level;
    profile.violations = result.violations;
    profile.risk_level = ComputeRiskLevel(profile.violations, profile.security_score);
    profile.restrictions = GenerateRestrictions(profile.risk_level, profile.trust_level);
    profile.allowed = result.allowed;
    profile.status = result.allowed ? ProfileStatus::kActive : ProfileStatus::kDenied;
    if (!result.allowed) {
      profile.compliance = ProfileCompliance::kNonCompliant;
    } else if (profile.risk_level >= RiskLevel::kHigh) {
      profile.compliance = ProfileCompliance::kUnderReview;
    } else {
      profile.compliance = ProfileCompliance::kCompliant;
    }
    profile.sandbox_id.reset();
    profile.history.push_back(assessment);
  });
  // A re-assessment replaces the running sandbox.
  if (previous_sandbox) {
    framework_.ReleaseSandbox(*previous_sandbox);
  }
  return version;
}

std::uint64_t Orchestration::MutateProfile(const std::string& plugin_id,
                                           const std::function<void(PluginSecurityProfile&)>& mutate) {
  for (int attempt = 1;; ++attempt) {
    auto current = GetSecurityProfile(plugin_id);
    const std::uint64_t expected = current ? current->version : 0;
    PluginSecurityProfile profile;
    if (current) {
      profile = std::move(*current);
    } else {
      profile.plugin_id = plugin_id;
      profile.created_at = Now();
    }
    mutate(profile);
    profile.updated_at = Now();
    try {
      return UpdateSecurityProfile(std::move(profile), expected);
    } catch (const Error& error) {
      if (error.code != errors::state::kProfileConflict || attempt >= kProfileRetries) {
        throw;
      }
      std::clog << "[orchestration] profile " << plugin_id << " changed concurrently, retrying" << std::endl;
    }
  }
}

std::uint64_t Orchestration::UpdateSecurityProfile(PluginSecurityProfile profile, std::uint64_t expected_version) {
  std::lock_guard<std::mutex> guard(profiles_mutex_);
  auto it = profiles_.find(profile.plugin_id);
  const std::uint64_t stored = it == profiles_.end() ? 0 : it->second.version;
  if (stored != expected_version) {
    throw Error(ErrorDomain::State, errors::state::kProfileConflict,
                std::string(errors::msg::kProfileVersionConflict) + ": " + profile.plugin_id + " is at version " +
                    std::to_string(stored) + ", expected " + std::to_string(expected_version),
                std::nullopt, Retryability::kRetryable);
  }
  profile.version = stored + 1;
  const auto version = profile.version;
  const auto id = profile.plugin_id;
  profiles_[id] = std::move(profile);
  return version;
}

std::optional<PluginSecurityProfile> Orchestration::GetSecurityProfile(const std::string& plugin_id) const {
  std::lock_guard<std::mutex> guard(profiles_mutex_);
  auto it = profiles_.find(plugin_id);
  if (it == profiles_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<PluginSecurityProfile> Orchestration::ListSecurityProfiles() const {
  std::lock_guard<std::mutex> guard(profiles_mutex_);
  std::vector<PluginSecurityProfile> out;
  out.reserve(profiles_.size());
  for (const auto& [id, profile] : profiles_) {
    out.push_back(profile);
  }
  return out;
}

security::MonitorResult Orchestration::MonitorPluginExecution(const std::string& plugin_id,
                                                              const security::Operation& operation,
                                                              const SecurityContext& context) {
  const auto profile = GetSecurityProfile(plugin_id);
  if (!profile || !profile->sandbox_id) {
    throw Error(ErrorDomain::State, errors::state::kSandboxNotFound,
                std::string(errors::msg::kNoRunningSandbox) + ": " + plugin_id);
  }
  auto outcome = framework_.MonitorPluginExecution(*profile->sandbox_id, operation, context);

  if (outcome.allowed && !outcome.violation && Configuration().auditing.enabled) {
    RecordAudit(audit::EventType::kPluginExecution, Severity::kInfo, plugin_id,
                std::string("Plugin operation ") + std::string(security::ToString(operation.type)),
                {{"operation", std::string(security::ToString(operation.type))},
                 {"target", operation.target},
                 {"sandbox_id", *profile->sandbox_id}},
                {"runtime"}, context);
  }
  if (outcome.violation) {
    std::vector<std::string> incident_ids;
    for (const auto& incident : audit_.ListIncidents()) {
      if (std::find(incident.affected_plugins.begin(), incident.affected_plugins.end(), plugin_id) !=
          incident.affected_plugins.end()) {
        incident_ids.push_back(incident.id);
      }
    }
    const auto violation = *outcome.violation;
    MutateProfile(plugin_id, [&](PluginSecurityProfile& stored) {
      stored.violations.push_back(violation);
      stored.risk_level = ComputeRiskLevel(stored.violations, stored.security_score);
      stored.restrictions = GenerateRestrictions(stored.risk_level, stored.trust_level);
      if (stored.risk_level >= RiskLevel::kHigh && stored.compliance == ProfileCompliance::kCompliant) {
        stored.compliance = ProfileCompliance::kUnderReview;
      }
      for (auto& id : incident_ids) {
        AddUnique(stored.incident_ids, id);
      }
    });
  }
  return outcome;
}

bool Orchestration::UninstallPlugin(const std::string& plugin_id, const SecurityContext& context) {
  const auto profile = GetSecurityProfile(plugin_id);
  if (!profile) {
    return false;
  }
  if (profile->sandbox_id) {
    framework_.ReleaseSandbox(*profile->sandbox_id);
  }
  MutateProfile(plugin_id, [](PluginSecurityProfile& stored) {
    stored.status = ProfileStatus::kRetired;
    stored.allowed = false;
    stored.sandbox_id.reset();
  });
  if (Configuration().auditing.enabled) {
    RecordAudit(audit::EventType::kPluginUninstall, Severity::kInfo, plugin_id, "Plugin uninstalled",
                {{"sandbox_id", profile->sandbox_id.value_or("")}}, {"uninstall"}, context);
  }
  return true;
}

SecurityReport Orchestration::GenerateSecurityReport(ReportType type, std::optional<audit::DateRange> period) {
  const auto config = Configuration();
  const auto now = Now();
  SecurityReport report;
  report.id = MakeId("report");
  report.type = type;
  report.period = period.value_or(audit::DateRange{now - kDefaultReportPeriod, now});
  report.generated_at = now;
  report.framework = framework_.GenerateSecurityReport(report.period);
  report.metrics = audit_.Metrics();
  report.summary.compliance_status = report.framework.status;

  // HIGH+ events per day; the trend compares the two halves of the period.
  audit::EventFilter filter;
  filter.period = report.period;
  filter.limit = std::numeric_limits<std::size_t>::max();
  const auto midpoint = report.period.start + (report.period.end - report.period.start) / 2;
  std::uint64_t first_half = 0;
  std::uint64_t second_half = 0;
  for (const auto& event : audit_.SearchEvents(filter)) {
    if (event.severity < Severity::kHigh) {
      continue;
    }
    ++report.daily_high_events[FormatTimestamp(event.timestamp).substr(0, 10)];
    ++(event.timestamp < midpoint ? first_half : second_half);
  }
  if (second_half > first_half) {
    report.summary.risk_trend = RiskTrend::kDeteriorating;
  } else if (second_half < first_half) {
    report.summary.risk_trend = RiskTrend::kImproving;
  }

  const bool executive = type == ReportType::kExecutive;
  std::vector<double> scores;

  if (type == ReportType::kVulnerability || executive) {
    std::vector<double> profile_scores;
    for (auto& profile : ListSecurityProfiles()) {
      if (profile.status == ProfileStatus::kRetired) {
        continue;
      }
      profile_scores.push_back(profile.security_score);
      if (!profile.history.empty()) {
        for (const auto& finding : profile.history.back().findings) {
          if (finding.severity == Severity::kCritical) {
            report.summary.critical_issues.push_back(profile.plugin_id + ": " + finding.title);
          } else if (finding.severity == Severity::kHigh) {
            report.summary.key_findings.push_back(profile.plugin_id + ": " + finding.title);
          }
        }
      }
      report.profiles.push_back(std::move(profile));
    }
    scores.push_back(Mean(profile_scores, 100.0));
  }

  if (type == ReportType::kCompliance || executive) {
    std::vector<double> compliance_scores;
    for (auto framework : config.compliance_frameworks) {
      auto compliance = audit_.GenerateComplianceReport(framework, report.period);
      compliance_scores.push_back(compliance.overall_score);
      report.summary.key_findings.push_back(std::string(audit::ToString(framework)) + " score " +
                                            std::to_string(static_cast<int>(compliance.overall_score)));
      for (const auto& violation : compliance.violations) {
        if (violation.severity == Severity::kCritical) {
          report.summary.critical_issues.push_back(violation.description);
        }
      }
      for (const auto& recommendation : compliance.recommendations) {
        AddUnique(report.recommendations, recommendation.title);
      }
      report.compliance.push_back(std::move(compliance));
    }
    scores.push_back(Mean(compliance_scores, 100.0));
  }

  if (type == ReportType::kIncident || executive) {
    std::map<audit::IncidentStatus, std::uint64_t> by_status;
    for (auto& incident : audit_.ListIncidents()) {
      if (!report.period.Contains(incident.created_at)) {
        continue;
      }
      ++by_status[incident.status];
      const bool unresolved = incident.status != audit::IncidentStatus::kResolved &&
                              incident.status != audit::IncidentStatus::kClosed;
      if (unresolved && incident.severity == Severity::kCritical) {
        report.summary.critical_issues.push_back("Unresolved incident " + incident.id + ": " + incident.title);
      }
      report.incidents.push_back(std::move(incident));
    }
    for (const auto& [status, count] : by_status) {
      report.summary.key_findings.push_back(std::to_string(count) + " " + std::string(audit::ToString(status)) +
                                            " incidents");
    }
    scores.push_back(std::max(0.0, 100.0 - report.metrics.risk_score));
  }

  if (type == ReportType::kTrend || executive) {
    for (const auto& [day, count] : report.daily_high_events) {
      report.summary.key_findings.push_back(day + ": " + std::to_string(count) + " high-severity events");
    }
    report.summary.key_findings.push_back("Risk trend " + std::string(ToString(report.summary.risk_trend)));
    scores.push_back(report.framework.compliance_score);
  }

  report.summary.overall_score = Mean(scores, 100.0);
  for (const auto& recommendation : report.framework.recommendations) {
    AddUnique(report.recommendations, recommendation);
  }

  Event event;
  event.category = EventCategory::kTelemetry;
  event.event_id = "security_report_generated";
  event.message = "Security report generated";
  event.fields.emplace_back("report_id", report.id);
  event.fields.emplace_back("type", std::string(ToString(type)));
  event.fields.emplace_back("overall_score", std::to_string(static_cast<int>(report.summary.overall_score)),
                            FieldPrivacy::kPublic, true);
  bus_.Publish(event);
  return report;
}

void Orchestration::UpdateConfiguration(OrchestrationConfig config, const SecurityContext& context) {
  framework_.GetPolicy(config.runtime.policy);  // throws State kPolicyNotFound
  std::map<std::string, std::string> details = {
      {"strict_mode", config.static_analysis.strict_mode ? "true" : "false"},
      {"runtime_enabled", config.runtime.enabled ? "true" : "false"},
      {"policy", config.runtime.policy},
      {"signatures_required", config.signatures.require ? "true" : "false"},
      {"allow_unsigned", config.signatures.allow_unsigned ? "true" : "false"}};
  const bool audit_enabled = config.auditing.enabled;
  {
    std::lock_guard<std::mutex> guard(config_mutex_);
    config_ = std::move(config);
  }
  if (audit_enabled) {
    RecordAudit(audit::EventType::kConfigurationChange, Severity::kLow, {}, "Orchestration configuration updated",
                std::move(details), {"configuration"}, context);
  }
}

void Orchestration::AddTrustAnchor(const std::string& name, std::string_view certificate_pem, TrustLevel level,
                                   const SecurityContext& context) {
  const auto certificate = crypto::Certificate::FromPem(certificate_pem);
  verifier_.AddTrustAnchor(name, certificate, level);
  RecordAudit(audit::EventType::kConfigurationChange, Severity::kLow, {}, "Trust anchor added",
              {{"anchor", name},
               {"trust_level", std::string(ToString(level))},
               {"subject", certificate.Subject()},
               {"fingerprint", certificate.FingerprintSha256()}},
              {"configuration", "trust-anchor"}, context);
}

void Orchestration::RemoveTrustAnchor(const std::string& name, const SecurityContext& context) {
  if (!verifier_.RemoveTrustAnchor(name)) {
    throw Error(ErrorDomain::State, errors::state::kTrustAnchorNotFound,
                std::string(errors::msg::kTrustAnchorUnknown) + ": " + name);
  }
  RecordAudit(audit::EventType::kConfigurationChange, Severity::kLow, {}, "Trust anchor removed", {{"anchor", name}},
              {"configuration", "trust-anchor"}, context);
}

std::vector<trust::TrustAnchor> Orchestration::ListTrustAnchors() const {
  return verifier_.ListTrustAnchors();
}

std::string Orchestration::ExportData(audit::ExportKind kind, audit::ExportFormat format,
                                      const audit::EventFilter& filter) const {
  return audit_.ExportData(kind, format, filter);
}

std::size_t Orchestration::ApplyAuditRetention() {
  const auto days = Configuration().auditing.retention_days;
  return audit_.ApplyRetention(std::chrono::hours(24 * static_cast<std::int64_t>(days)));
}

void Orchestration::RecordAudit(audit::EventType type, Severity severity, const std::string& plugin_id,
                                std::string description, std::map<std::string, std::string> details,
                                std::vector<std::string> tags, const SecurityContext& context) {
  audit::SecurityEvent draft;
  draft.type = type;
  draft.severity = severity;
  draft.source = {audit::SourceType::kApplication, "orchestration", "main"};
  if (!plugin_id.empty()) {
    draft.plugin_id = plugin_id;
  }
  draft.context = context;
  draft.description = std::move(description);
  draft.details = std::move(details);
  draft.tags = std::move(tags);
  audit_.RecordEvent(std::move(draft));
}

SecurityServices::SecurityServices(OrchestrationConfig config, ServiceHooks hooks) {
  bus_ = std::make_unique<EventBus>();
  if (!config.auditing.log.empty()) {
    log_ = std::make_shared<JsonLineLogger>(config.auditing.log);
    bus_->AttachLogger(log_);
  }

  audit::AuditOptions audit_options;
  audit_options.correlation_threshold = config.incident_response.escalation_threshold;
  audit_ = std::make_unique<audit::AuditSystem>(*bus_, audit_options, audit::AuditHooks{hooks.now});
  if (log_) {
    audit_->SetAuditLog(log_);
  }

  analyzer_ = std::make_unique<analysis::CodeAnalyzer>(*bus_);
  verifier_ = std::make_unique<trust::SignatureVerifier>(*bus_, trust::VerifierHooks{hooks.now});
  for (const auto& anchor : config.anchors) {
    verifier_->AddTrustAnchor(anchor.name, crypto::Certificate::FromPem(ReadFileText(anchor.pem)), anchor.level);
  }
  for (const auto& crl : config.crls) {
    const auto added = verifier_->ImportCrl(ReadFileText(crl));
    std::clog << "[orchestration] imported " << added << " revocations from " << crl.string() << std::endl;
  }

  security::FrameworkOptions framework_options;
  framework_options.auto_isolate = config.runtime.auto_isolate;
  framework_options.incident_response = config.incident_response.enabled;
  framework_options.detection_interval =
      config.threat_detection.enabled ? config.threat_detection.interval : std::chrono::milliseconds(0);
  framework_ = std::make_unique<security::SecurityFramework>(*bus_, *audit_, framework_options,
                                                             security::FrameworkHooks{hooks.now, hooks.sandbox});

  auto orchestration_hooks = hooks.orchestration;
  if (!orchestration_hooks.now) {
    orchestration_hooks.now = hooks.now;
  }
  orchestration_ = std::make_unique<Orchestration>(std::move(config), *bus_, *audit_, *analyzer_, *verifier_,
                                                   *framework_, std::move(orchestration_hooks));
}

SecurityServices::~SecurityServices() = default;

} // namespace pw::orchestrator

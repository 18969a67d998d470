#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pw/analysis/code_analyzer.h"
#include "pw/audit/audit_system.h"
#include "pw/orchestrator/config.h"
#include "pw/security/security_framework.h"
#include "pw/trust/signature_verifier.h"
#include "pw/types.h"

namespace pw::orchestrator {

class EventBus;
class JsonLineLogger;

enum class RestrictionType : std::uint8_t { kNetwork, kFilesystem };

std::string_view ToString(RestrictionType type) noexcept;

// Additive tightening on top of the sandbox policy.
struct SecurityRestriction {
  RestrictionType type{RestrictionType::kNetwork};
  std::string rule;  // "deny-all" or "deny"
  std::vector<std::string> targets;
  std::string reason;
};

struct SecurityFinding {
  std::string id;
  std::string source;  // static-analysis, signature or policy
  Severity severity{Severity::kLow};
  std::string title;
  std::string description;
  double cvss{0.0};
  std::string remediation;
};

struct SecurityAssessment {
  std::string id;
  TimePoint performed_at{};
  int score{0};
  RiskLevel risk_level{RiskLevel::kLow};
  TrustLevel trust_level{TrustLevel::kUntrusted};
  bool allowed{false};
  std::vector<SecurityFinding> findings;
};

enum class ProfileStatus : std::uint8_t { kActive, kDenied, kRetired };
enum class ProfileCompliance : std::uint8_t { kCompliant, kUnderReview, kNonCompliant };

std::string_view ToString(ProfileStatus status) noexcept;
std::string_view ToString(ProfileCompliance status) noexcept;

// Durable verdict for one plugin. |version| grows by one per committed write.
struct PluginSecurityProfile {
  std::string plugin_id;
  std::uint64_t version{0};
  int security_score{0};
  RiskLevel risk_level{RiskLevel::kLow};
  TrustLevel trust_level{TrustLevel::kUntrusted};
  bool allowed{false};
  ProfileStatus status{ProfileStatus::kDenied};
  ProfileCompliance compliance{ProfileCompliance::kUnderReview};
  std::vector<SecurityRestriction> restrictions;
  std::vector<security::PolicyViolation> violations;
  std::vector<SecurityAssessment> history;
  std::vector<std::string> incident_ids;
  std::optional<std::string> sandbox_id;
  std::filesystem::path plugin_path;
  TimePoint created_at{};
  TimePoint updated_at{};
};

struct InstallationResult {
  std::string plugin_id;
  bool allowed{false};
  int score{0};
  RiskLevel risk_level{RiskLevel::kCritical};
  TrustLevel trust_level{TrustLevel::kUntrusted};
  std::vector<security::PolicyViolation> violations;
  std::vector<SecurityRestriction> restrictions;
  std::vector<std::string> recommendations;
  std::optional<std::string> sandbox_id;
  std::optional<analysis::AnalysisResult> analysis;
  std::optional<trust::VerificationResult> verification;
  std::uint64_t profile_version{0};
};

enum class ReportType : std::uint8_t { kVulnerability, kCompliance, kIncident, kTrend, kExecutive };

std::string_view ToString(ReportType type) noexcept;
ReportType ParseReportType(std::string_view name);

enum class RiskTrend : std::uint8_t { kImproving, kStable, kDeteriorating };

std::string_view ToString(RiskTrend trend) noexcept;

struct ReportSummary {
  double overall_score{100.0};
  std::vector<std::string> key_findings;
  std::vector<std::string> critical_issues;
  RiskTrend risk_trend{RiskTrend::kStable};
  security::FrameworkCompliance compliance_status{security::FrameworkCompliance::kCompliant};
};

struct SecurityReport {
  std::string id;
  ReportType type{ReportType::kExecutive};
  audit::DateRange period;
  TimePoint generated_at{};
  ReportSummary summary;
  std::vector<PluginSecurityProfile> profiles;       // VULNERABILITY, EXECUTIVE
  std::vector<audit::ComplianceReport> compliance;   // COMPLIANCE, EXECUTIVE
  std::vector<audit::SecurityIncident> incidents;    // INCIDENT, EXECUTIVE
  std::map<std::string, std::uint64_t> daily_high_events;  // TREND: YYYY-MM-DD -> HIGH+ events
  security::FrameworkReport framework;
  audit::AuditMetrics metrics;
  std::vector<std::string> recommendations;
};

// Step 2 of the installation pipeline. Pure function of violations and score.
RiskLevel ComputeRiskLevel(const std::vector<security::PolicyViolation>& violations, int score) noexcept;

// Step 3. HIGH/CRITICAL risk denies all network traffic; UNTRUSTED/LOW trust
// denies the sensitive filesystem roots.
std::vector<SecurityRestriction> GenerateRestrictions(RiskLevel risk, TrustLevel trust);

// Step 4.
bool IsInstallationAllowed(const std::vector<security::PolicyViolation>& violations, int score, bool strict_mode,
                           bool signature_valid, bool signatures_required) noexcept;

double CvssForSeverity(Severity severity) noexcept;

struct OrchestrationHooks { // TSK171_Orchestration_Test_Seams
  std::function<TimePoint()> now;
  // Runs before the assessment starts; an exception here exercises the
  // fail-closed path.
  std::function<void(const std::string& plugin_id)> before_assessment;
};

class Orchestration {
 public:
  Orchestration(OrchestrationConfig config, EventBus& bus, audit::AuditSystem& audit,
                analysis::CodeAnalyzer& analyzer, trust::SignatureVerifier& verifier,
                security::SecurityFramework& framework, OrchestrationHooks hooks = {});
  Orchestration(const Orchestration&) = delete;
  Orchestration& operator=(const Orchestration&) = delete;

  // Never throws. Internal failures produce a denial carrying a synthetic
  // HIGH violation.
  InstallationResult ProcessPluginInstallation(const std::string& plugin_id, const std::filesystem::path& plugin_path,
                                               const SecurityContext& context);

  // Routes one operation of an installed plugin through its sandbox.
  // Throws State kSandboxNotFound when the plugin has no running sandbox.
  security::MonitorResult MonitorPluginExecution(const std::string& plugin_id, const security::Operation& operation,
                                                 const SecurityContext& context);

  // Stops the sandbox and retires the profile. Returns false for an unknown
  // plugin.
  bool UninstallPlugin(const std::string& plugin_id, const SecurityContext& context);

  std::optional<PluginSecurityProfile> GetSecurityProfile(const std::string& plugin_id) const;
  std::vector<PluginSecurityProfile> ListSecurityProfiles() const;

  // Compare-and-set: commits |profile| when the stored version equals
  // |expected_version| (0 for a new plugin). Throws State kProfileConflict
  // otherwise. Returns the committed version.
  std::uint64_t UpdateSecurityProfile(PluginSecurityProfile profile, std::uint64_t expected_version);

  // |period| defaults to the last 30 days.
  SecurityReport GenerateSecurityReport(ReportType type, std::optional<audit::DateRange> period = std::nullopt);

  // Takes effect for the next installation. Recorded as CONFIGURATION_CHANGE.
  void UpdateConfiguration(OrchestrationConfig config, const SecurityContext& context);
  OrchestrationConfig Configuration() const;

  void AddTrustAnchor(const std::string& name, std::string_view certificate_pem, TrustLevel level,
                      const SecurityContext& context);
  // Throws State kTrustAnchorNotFound.
  void RemoveTrustAnchor(const std::string& name, const SecurityContext& context);
  std::vector<trust::TrustAnchor> ListTrustAnchors() const;

  std::string ExportData(audit::ExportKind kind, audit::ExportFormat format,
                         const audit::EventFilter& filter = {}) const;

  // Applies auditing.retention_days. Returns the number of events dropped.
  std::size_t ApplyAuditRetention();

 private:
  TimePoint Now() const;
  void RunInstallation(const std::string& plugin_id, const std::filesystem::path& plugin_path,
                       const SecurityContext& context, const OrchestrationConfig& config, InstallationResult& result);
  void FailClosed(const std::string& plugin_id, const std::filesystem::path& plugin_path, const std::string& reason,
                  const SecurityContext& context, InstallationResult& result);
  std::uint64_t CommitAssessment(const std::string& plugin_id, const std::filesystem::path& plugin_path,
                                 const InstallationResult& result, std::vector<SecurityFinding> findings);
  // Read-modify-write of one profile with bounded compare-and-set retries.
  // A missing profile starts from an empty one for |plugin_id|.
  std::uint64_t MutateProfile(const std::string& plugin_id,
                              const std::function<void(PluginSecurityProfile&)>& mutate);
  void RecordAudit(audit::EventType type, Severity severity, const std::string& plugin_id, std::string description,
                   std::map<std::string, std::string> details, std::vector<std::string> tags,
                   const SecurityContext& context);

  EventBus& bus_;
  audit::AuditSystem& audit_;
  analysis::CodeAnalyzer& analyzer_;
  trust::SignatureVerifier& verifier_;
  security::SecurityFramework& framework_;
  OrchestrationHooks hooks_;

  mutable std::mutex config_mutex_;
  OrchestrationConfig config_;

  mutable std::mutex profiles_mutex_;
  std::map<std::string, PluginSecurityProfile> profiles_;
};

struct ServiceHooks { // TSK172_Service_Test_Seams
  std::function<TimePoint()> now;
  sandbox::SandboxHooks sandbox;
  OrchestrationHooks orchestration;
};

// Explicitly constructed service graph for hosts and the CLI. Members are
// destroyed in reverse order, so sandboxes stop before the audit trail goes.
class SecurityServices {
 public:
  // Loads the configured trust anchors and CRLs; throws pw::Error when one
  // cannot be read or parsed.
  explicit SecurityServices(OrchestrationConfig config, ServiceHooks hooks = {});
  ~SecurityServices();
  SecurityServices(const SecurityServices&) = delete;
  SecurityServices& operator=(const SecurityServices&) = delete;

  EventBus& bus() noexcept { return *bus_; }
  audit::AuditSystem& audit() noexcept { return *audit_; }
  analysis::CodeAnalyzer& analyzer() noexcept { return *analyzer_; }
  trust::SignatureVerifier& verifier() noexcept { return *verifier_; }
  security::SecurityFramework& framework() noexcept { return *framework_; }
  Orchestration& orchestration() noexcept { return *orchestration_; }
  std::shared_ptr<JsonLineLogger> log() const noexcept { return log_; }

 private:
  std::unique_ptr<EventBus> bus_;
  std::shared_ptr<JsonLineLogger> log_;
  std::unique_ptr<audit::AuditSystem> audit_;
  std::unique_ptr<analysis::CodeAnalyzer> analyzer_;
  std::unique_ptr<trust::SignatureVerifier> verifier_;
  std::unique_ptr<security::SecurityFramework> framework_;
  std::unique_ptr<Orchestration> orchestration_;
};

} // namespace pw::orchestrator

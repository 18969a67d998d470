#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "pw/audit/compliance.h"
#include "pw/types.h"

namespace pw::orchestrator {
class EventBus;
class JsonLineLogger;
} // namespace pw::orchestrator

namespace pw::audit {

enum class EventType : std::uint8_t {
  kLoginSuccess,
  kLoginFailure,
  kPermissionDenied,
  kPluginInstall,
  kPluginUninstall,
  kPluginExecution,
  kSecurityViolation,
  kRuntimeViolation,
  kDataAccess,
  kDataExfiltration,
  kConfigurationChange,
  kMalwareDetected,
  kSuspiciousActivity,
  kPolicyViolation,
  kSystemError
};

std::string_view ToString(EventType type) noexcept;
EventType ParseEventType(std::string_view name);

enum class SourceType : std::uint8_t { kPlugin, kSystem, kUser, kNetwork, kApplication, kExternal };

std::string_view ToString(SourceType type) noexcept;

struct EventSource {
  SourceType type{SourceType::kSystem};
  std::string component{"unknown"};
  std::string instance{"unknown"};
};

// Append-only. RecordEvent assigns id and timestamp; every other field is
// kept as supplied.
struct SecurityEvent {
  std::string id;
  TimePoint timestamp{};
  EventType type{EventType::kSuspiciousActivity};
  Severity severity{Severity::kMedium};
  EventSource source;
  std::optional<std::string> plugin_id;
  std::optional<std::string> sandbox_id;
  SecurityContext context;
  std::string description;
  std::map<std::string, std::string> details;
  std::vector<std::string> tags;
  std::optional<std::string> correlation_id;
  bool resolved{false};
  std::optional<TimePoint> resolved_at;
  std::optional<std::string> resolved_by;
  std::string mitigation;
};

enum class IncidentStatus : std::uint8_t { kOpen, kInProgress, kResolved, kClosed, kEscalated };

std::string_view ToString(IncidentStatus status) noexcept;
IncidentStatus ParseIncidentStatus(std::string_view name);

enum class IncidentCategory : std::uint8_t { kSecurity, kCompliance, kOperational, kPrivacy, kAvailability };

std::string_view ToString(IncidentCategory category) noexcept;

enum class AvailabilityImpact : std::uint8_t { kNone, kMinor, kMajor, kCritical };

std::string_view ToString(AvailabilityImpact impact) noexcept;

struct ImpactAssessment {
  bool data_exposed{false};
  std::vector<std::string> systems_affected;
  std::uint32_t users_affected{0};
  std::uint64_t data_volume{0};
  Severity reputation_impact{Severity::kLow};
  std::vector<std::string> compliance_impact;
  AvailabilityImpact availability_impact{AvailabilityImpact::kNone};
};

struct TimelineEntry {
  TimePoint timestamp{};
  std::string action;
  std::string actor;
  std::string description;
};

struct SecurityIncident {
  std::string id;
  std::string title;
  std::string description;
  Severity severity{Severity::kMedium};
  IncidentStatus status{IncidentStatus::kOpen};
  IncidentCategory category{IncidentCategory::kSecurity};
  std::string source;
  TimePoint created_at{};
  TimePoint detected_at{};
  std::vector<std::string> event_ids;
  std::vector<std::string> affected_plugins;
  std::vector<std::string> affected_users;
  ImpactAssessment impact;
  std::vector<TimelineEntry> timeline;
  std::optional<std::string> assigned_to;
  std::optional<TimePoint> resolved_at;
  std::string resolution;
  std::string correlation_key;
};

struct IncidentDraft {
  std::string title;
  std::string description;
  Severity severity{Severity::kMedium};
  IncidentCategory category{IncidentCategory::kSecurity};
  std::string source{"manual"};
  std::vector<std::string> event_ids;
};

// TSK150_Incident_State_Machine
// OPEN -> IN_PROGRESS | ESCALATED*, IN_PROGRESS -> RESOLVED | ESCALATED*,
// ESCALATED -> IN_PROGRESS | RESOLVED, RESOLVED -> CLOSED | IN_PROGRESS.
// (*) CRITICAL incidents only. CLOSED is terminal.
bool IsValidTransition(IncidentStatus from, IncidentStatus to, Severity severity) noexcept;

enum class PolicyAction : std::uint8_t { kAllow, kWarn, kDeny, kQuarantine, kEscalate };

std::string_view ToString(PolicyAction action) noexcept;
PolicyAction ParsePolicyAction(std::string_view name);

// |condition| is "field op value" clauses joined by "&&". Fields: type,
// severity, plugin_id, user_id, ip_address, source.component, tag,
// description. Ops: ==, !=, >=, <= (severity only), contains.
struct AuditRule {
  std::string id;
  std::string name;
  std::string condition;
  PolicyAction action{PolicyAction::kWarn};
  Severity severity{Severity::kMedium};
  bool enabled{true};
  std::uint64_t trigger_count{0};
  std::optional<TimePoint> last_triggered;
};

struct AuditPolicy {
  std::string id;
  std::string name;
  bool active{true};
  std::vector<AuditRule> rules;
};

enum class IndicatorType : std::uint8_t { kIpAddress, kDomain, kHash, kUserAgent, kUrl };

std::string_view ToString(IndicatorType type) noexcept;

struct ThreatIndicator {
  std::string id;
  IndicatorType type{IndicatorType::kIpAddress};
  std::string value;
  std::string description;
  Severity severity{Severity::kHigh};
  double confidence{1.0};
  std::string source{"local"};
  TimePoint first_seen{};
  std::optional<TimePoint> expires_at;
  bool active{true};
};

struct AuditMetrics {
  std::uint64_t total_events{0};
  std::map<EventType, std::uint64_t> events_by_type;
  std::map<Severity, std::uint64_t> events_by_severity;
  std::uint64_t total_incidents{0};
  std::map<IncidentStatus, std::uint64_t> incidents_by_status;
  std::map<Severity, std::uint64_t> incidents_by_severity;
  double mean_time_to_detect_minutes{0.0};
  double mean_time_to_resolve_minutes{0.0};
  double compliance_score{100.0};
  double risk_score{0.0};
  std::uint64_t threats_blocked{0};
  std::uint64_t active_threats{0};
};

struct EventFilter {
  std::optional<EventType> type;
  std::optional<Severity> severity;
  std::optional<std::string> plugin_id;
  std::optional<std::string> user_id;
  std::optional<std::string> ip_address;
  std::optional<DateRange> period;
  std::optional<bool> resolved;
  std::vector<std::string> tags;  // any
  std::size_t page{0};
  std::size_t limit{50};
};

enum class ExportKind : std::uint8_t { kEvents, kIncidents, kMetrics, kCompliance };
enum class ExportFormat : std::uint8_t { kJson, kCsv, kXml };

std::string_view ToString(ExportKind kind) noexcept;
std::string_view ToString(ExportFormat format) noexcept;
ExportKind ParseExportKind(std::string_view name);
ExportFormat ParseExportFormat(std::string_view name);

enum class AuditType : std::uint8_t { kPeriodic, kIncident, kCompliance };

std::string_view ToString(AuditType type) noexcept;

struct AuditFinding {
  std::string id;
  std::string category;
  Severity severity{Severity::kLow};
  std::string description;
  std::vector<std::string> evidence;
  std::string recommendation;
};

struct RiskAssessment {
  RiskLevel overall{RiskLevel::kLow};
  int score{0};
  std::vector<std::string> key_risks;
  std::vector<std::string> mitigations;
};

struct AuditReport {
  std::string id;
  AuditType type{AuditType::kPeriodic};
  std::vector<AuditFinding> findings;
  std::vector<std::string> recommendations;
  RiskAssessment risk;
  TimePoint completed_at{};
};

struct AuditOptions {
  std::chrono::minutes correlation_window{5};
  std::size_t correlation_threshold{3};
  std::chrono::seconds anomaly_window{60};
  std::size_t anomaly_burst{10};
  double anomaly_threshold{0.8};
  std::string escalation_assignee{"security-oncall"};
};

struct AuditHooks { // TSK151_Audit_Test_Seams
  std::function<TimePoint()> now;
};

class AuditSystem {
 public:
  explicit AuditSystem(orchestrator::EventBus& bus, AuditOptions options = {}, AuditHooks hooks = {});
  ~AuditSystem();
  AuditSystem(const AuditSystem&) = delete;
  AuditSystem& operator=(const AuditSystem&) = delete;

  // Stores |draft| with a fresh id and record timestamp, evaluates policy
  // rules, threat indicators, correlation and anomaly score, and opens or
  // extends an incident when one of them calls for it.
  SecurityEvent RecordEvent(SecurityEvent draft);
  void ResolveEvent(const std::string& event_id, const std::string& actor, std::string mitigation);
  std::optional<SecurityEvent> GetEvent(const std::string& event_id) const;

  SecurityIncident CreateIncident(IncidentDraft draft);
  // Throws State kIncidentNotFound / kInvalidIncidentTransition.
  SecurityIncident UpdateIncidentStatus(const std::string& incident_id, IncidentStatus status,
                                        const std::string& actor, std::optional<std::string> notes = std::nullopt);
  std::optional<SecurityIncident> GetIncident(const std::string& incident_id) const;
  std::vector<SecurityIncident> ListIncidents() const;

  // Throws Validation kRuleConditionInvalid for an unparsable condition.
  void AddPolicy(AuditPolicy policy);
  std::vector<AuditPolicy> Policies() const;

  void AddThreatIndicator(ThreatIndicator indicator);
  std::vector<ThreatIndicator> ActiveIndicators() const;

  AuditMetrics Metrics() const;
  std::vector<SecurityEvent> SearchEvents(const EventFilter& filter) const;

  ComplianceReport GenerateComplianceReport(ComplianceFramework framework, const DateRange& period);
  std::vector<ComplianceReport> ComplianceReports() const;

  std::string ExportData(ExportKind kind, ExportFormat format, const EventFilter& filter = {}) const;

  AuditReport PerformSecurityAudit(AuditType type) const;

  // Drops events older than |retention| unless an unresolved incident
  // references them. Returns the number removed.
  std::size_t ApplyRetention(std::chrono::hours retention);

  // When set, compliance reports check the audit log chain.
  void SetAuditLog(std::shared_ptr<orchestrator::JsonLineLogger> log);

 private:
  struct CompiledRule;
  struct Pending;

  TimePoint Now() const;
  TimePoint NextTimestampLocked();
  SecurityIncident& CreateIncidentLocked(IncidentDraft draft, std::string correlation_key, Pending& pending);
  void EscalateLocked(SecurityIncident& incident, Pending& pending);
  void EvaluateLocked(SecurityEvent& event, Pending& pending);
  std::string CorrelationKey(const SecurityEvent& event) const;
  PeriodStatistics CollectStatisticsLocked(const DateRange& period) const;
  void Flush(Pending& pending);

  orchestrator::EventBus& bus_;
  const AuditOptions options_;
  AuditHooks hooks_;
  std::shared_ptr<orchestrator::JsonLineLogger> log_;

  mutable std::mutex mutex_;
  std::vector<SecurityEvent> events_;
  std::unordered_map<std::string, std::size_t> event_index_;
  std::vector<SecurityIncident> incidents_;
  std::vector<AuditPolicy> policies_;
  std::vector<std::vector<CompiledRule>> compiled_rules_;  // parallel to policies_
  std::vector<ThreatIndicator> indicators_;
  std::vector<ComplianceReport> reports_;
  AuditMetrics metrics_;
  TimePoint last_timestamp_{};
  bool mttd_seeded_{false};
  bool mttr_seeded_{false};
};

} // namespace pw::audit

#include "pw/audit/audit_system.h" // TSK150_Audit

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "pw/orchestrator/event_bus.h"
#include "test_support.h"

namespace {

  using pw::Severity;
  using pw::audit::AuditOptions;
  using pw::audit::AuditSystem;
  using pw::audit::EventFilter;
  using pw::audit::EventType;
  using pw::audit::IncidentStatus;
  using pw::audit::SecurityEvent;
  using pw::test::Expect;
  using pw::test::ExpectError;

  // Manually advanced clock shared by the audit system under test.
  struct FakeClock {
    pw::TimePoint now{pw::FromUnixSeconds(1700000000)};
    pw::audit::AuditHooks Hooks() {
      pw::audit::AuditHooks hooks;
      hooks.now = [this] { return now; };
      return hooks;
    }
  };

  SecurityEvent MakeEvent(EventType type, Severity severity, std::string plugin_id = {},
                          std::string ip = "192.0.2.10") {
    SecurityEvent event;
    event.type = type;
    event.severity = severity;
    event.source.type = pw::audit::SourceType::kPlugin;
    event.source.component = "runtime";
    if (!plugin_id.empty()) {
      event.plugin_id = std::move(plugin_id);
    }
    event.context.request_id = pw::MakeId("req");
    event.context.ip_address = std::move(ip);
    event.description = std::string(pw::audit::ToString(type)) + " observed";
    return event;
  }

  void TestCorrelation() { // TSK152_Audit_Correlation
    pw::orchestrator::EventBus bus;
    int created = 0;
    bus.Subscribe([&](const pw::orchestrator::Event& e) {
      if (e.event_id == "incident_created") {
        ++created;
      }
    });
    FakeClock clock;
    AuditSystem audit(bus, AuditOptions{}, clock.Hooks());

    const auto first = audit.RecordEvent(MakeEvent(EventType::kSuspiciousActivity, Severity::kMedium, "p1"));
    clock.now += std::chrono::minutes(1);
    audit.RecordEvent(MakeEvent(EventType::kSuspiciousActivity, Severity::kMedium, "p1"));
    Expect(audit.ListIncidents().empty(), "two correlated events stay below the threshold");
    clock.now += std::chrono::minutes(1);
    audit.RecordEvent(MakeEvent(EventType::kPolicyViolation, Severity::kMedium, "p1"));
    auto incidents = audit.ListIncidents();
    Expect(incidents.size() == 1, "third correlated event opens an incident");
    Expect(!incidents.empty() && incidents[0].event_ids.size() == 3 && incidents[0].event_ids[0] == first.id,
           "incident references every correlated event");
    Expect(!incidents.empty() && incidents[0].status == IncidentStatus::kOpen &&
               incidents[0].severity == Severity::kMedium,
           "incident opens at the events' severity");
    Expect(!incidents.empty() && incidents[0].affected_plugins.size() == 1, "affected plugin recorded");
    Expect(created == 1, "incident creation published");

    clock.now += std::chrono::minutes(1);
    audit.RecordEvent(MakeEvent(EventType::kSuspiciousActivity, Severity::kHigh, "p1"));
    incidents = audit.ListIncidents();
    Expect(incidents.size() == 1 && incidents[0].event_ids.size() == 4, "open incident absorbs later events");
    Expect(incidents.size() == 1 && incidents[0].severity == Severity::kHigh, "severity rises with the events");

    for (int i = 0; i < 3; ++i) {
      audit.RecordEvent(MakeEvent(EventType::kPluginExecution, Severity::kLow, "p2"));
    }
    Expect(audit.ListIncidents().size() == 1, "routine LOW events do not correlate");

    audit.RecordEvent(MakeEvent(EventType::kSuspiciousActivity, Severity::kMedium, "p3"));
    clock.now += std::chrono::minutes(3);
    audit.RecordEvent(MakeEvent(EventType::kSuspiciousActivity, Severity::kMedium, "p3"));
    clock.now += std::chrono::minutes(3);
    audit.RecordEvent(MakeEvent(EventType::kSuspiciousActivity, Severity::kMedium, "p3"));
    Expect(audit.ListIncidents().size() == 1, "events outside the window are not correlated");

    const auto metrics = audit.Metrics();
    Expect(metrics.total_events == 10, "every event counted");
    Expect(metrics.events_by_type.at(EventType::kSuspiciousActivity) == 6, "counted per type");
    Expect(metrics.total_incidents == 1 && metrics.active_threats == 1, "one active incident");
  }

  void TestCorrelationWindowTail() {
    pw::orchestrator::EventBus bus;
    FakeClock clock;
    AuditSystem audit(bus, AuditOptions{}, clock.Hooks());

    const auto stale = audit.RecordEvent(MakeEvent(EventType::kPolicyViolation, Severity::kMedium, "p5"));
    audit.RecordEvent(MakeEvent(EventType::kPolicyViolation, Severity::kMedium, "p5"));
    clock.now += std::chrono::minutes(10);
    for (int i = 0; i < 200; ++i) {
      audit.RecordEvent(MakeEvent(EventType::kPluginExecution, Severity::kLow, "p6"));
    }
    audit.RecordEvent(MakeEvent(EventType::kPolicyViolation, Severity::kMedium, "p5"));
    clock.now += std::chrono::seconds(30);
    audit.RecordEvent(MakeEvent(EventType::kPolicyViolation, Severity::kMedium, "p5"));
    Expect(audit.ListIncidents().empty(), "stale events behind a long history do not correlate");

    clock.now += std::chrono::seconds(30);
    const auto last = audit.RecordEvent(MakeEvent(EventType::kPolicyViolation, Severity::kMedium, "p5"));
    const auto incidents = audit.ListIncidents();
    Expect(incidents.size() == 1 && incidents[0].event_ids.size() == 3, "recent events correlate");
    Expect(incidents.size() == 1 &&
               std::find(incidents[0].event_ids.begin(), incidents[0].event_ids.end(), stale.id) ==
                   incidents[0].event_ids.end() &&
               incidents[0].event_ids.back() == last.id,
           "incident lists only in-window events in record order");
  }

  void TestCriticalEscalates() {
    pw::orchestrator::EventBus bus;
    FakeClock clock;
    AuditSystem audit(bus, AuditOptions{}, clock.Hooks());
    audit.RecordEvent(MakeEvent(EventType::kMalwareDetected, Severity::kCritical, "p9"));
    const auto incidents = audit.ListIncidents();
    Expect(incidents.size() == 1, "critical event opens an incident immediately");
    Expect(!incidents.empty() && incidents[0].status == IncidentStatus::kEscalated &&
               incidents[0].assigned_to == std::optional<std::string>("security-oncall"),
           "critical incidents escalate to the on-call assignee");
    Expect(!incidents.empty() && incidents[0].timeline.size() == 2, "creation and escalation on the timeline");
  }

  void TestIncidentLifecycle() { // TSK150_Incident_State_Machine
    pw::orchestrator::EventBus bus;
    FakeClock clock;
    AuditSystem audit(bus, AuditOptions{}, clock.Hooks());
    pw::audit::IncidentDraft draft;
    draft.title = "Manual review";
    draft.description = "Analyst opened";
    draft.severity = Severity::kHigh;
    const auto incident = audit.CreateIncident(draft);
    Expect(incident.status == IncidentStatus::kOpen, "manual incidents open");

    ExpectError([&] { audit.UpdateIncidentStatus(incident.id, IncidentStatus::kEscalated, "alice"); },
                pw::ErrorDomain::State, pw::errors::state::kInvalidIncidentTransition,
                "only critical incidents escalate");
    audit.UpdateIncidentStatus(incident.id, IncidentStatus::kInProgress, "alice");
    ExpectError([&] { audit.UpdateIncidentStatus(incident.id, IncidentStatus::kClosed, "alice"); },
                pw::ErrorDomain::State, pw::errors::state::kInvalidIncidentTransition,
                "closing requires a resolution");
    clock.now += std::chrono::minutes(30);
    auto resolved = audit.UpdateIncidentStatus(incident.id, IncidentStatus::kResolved, "alice", "patched");
    Expect(resolved.resolution == "patched" && resolved.resolved_at.has_value(), "resolution recorded");
    Expect(audit.Metrics().mean_time_to_resolve_minutes >= 30.0, "time to resolve measured");
    const auto closed = audit.UpdateIncidentStatus(incident.id, IncidentStatus::kClosed, "bob");
    Expect(closed.status == IncidentStatus::kClosed, "resolved incident closes");
    Expect(closed.timeline.size() == 4, "every transition on the timeline");
    ExpectError([&] { audit.UpdateIncidentStatus(incident.id, IncidentStatus::kInProgress, "bob"); },
                pw::ErrorDomain::State, pw::errors::state::kInvalidIncidentTransition, "closed is terminal");
    ExpectError([&] { audit.UpdateIncidentStatus("inc-missing", IncidentStatus::kInProgress, "bob"); },
                pw::ErrorDomain::State, pw::errors::state::kIncidentNotFound, "unknown incident");

    Expect(pw::audit::IsValidTransition(IncidentStatus::kOpen, IncidentStatus::kEscalated, Severity::kCritical),
           "critical open incident may escalate");
    Expect(pw::audit::IsValidTransition(IncidentStatus::kResolved, IncidentStatus::kInProgress, Severity::kLow),
           "resolved incident may reopen");
    Expect(!pw::audit::IsValidTransition(IncidentStatus::kOpen, IncidentStatus::kResolved, Severity::kLow),
           "work must start before resolution");
  }

  void TestPolicyRules() {
    pw::orchestrator::EventBus bus;
    FakeClock clock;
    AuditSystem audit(bus, AuditOptions{}, clock.Hooks());
    pw::audit::AuditPolicy policy;
    policy.id = "auth";
    policy.name = "Authentication";
    pw::audit::AuditRule rule;
    rule.id = "block-bruteforce";
    rule.name = "Known brute-force source";
    rule.condition = "type == LOGIN_FAILURE && ip_address == 10.0.0.9";
    rule.action = pw::audit::PolicyAction::kDeny;
    rule.severity = Severity::kHigh;
    policy.rules.push_back(rule);
    audit.AddPolicy(policy);

    auto stored = audit.RecordEvent(MakeEvent(EventType::kLoginFailure, Severity::kLow, {}, "10.0.0.9"));
    Expect(std::find(stored.tags.begin(), stored.tags.end(), "rule:block-bruteforce") != stored.tags.end() &&
               std::find(stored.tags.begin(), stored.tags.end(), "blocked") != stored.tags.end(),
           "matching rule tags the event");
    Expect(audit.Metrics().threats_blocked == 1, "deny counts as a blocked threat");
    const auto incidents = audit.ListIncidents();
    Expect(incidents.size() == 1 && incidents[0].severity == Severity::kHigh, "HIGH rule opens an incident");
    Expect(audit.Policies()[0].rules[0].trigger_count == 1, "trigger counted");

    stored = audit.RecordEvent(MakeEvent(EventType::kLoginFailure, Severity::kLow, {}, "10.0.0.10"));
    Expect(stored.tags.empty(), "non-matching event untouched");

    pw::audit::AuditPolicy broken;
    broken.id = "broken";
    pw::audit::AuditRule bad;
    bad.id = "bad";
    bad.condition = "colour == red";
    broken.rules.push_back(bad);
    ExpectError([&] { audit.AddPolicy(broken); }, pw::ErrorDomain::Validation,
                pw::errors::validation::kRuleConditionInvalid, "unknown field");
    broken.rules[0].condition = "description >= x";
    ExpectError([&] { audit.AddPolicy(broken); }, pw::ErrorDomain::Validation,
                pw::errors::validation::kRuleConditionInvalid, "ordering on a text field");
    broken.rules[0].condition = "severity >= SEVERE";
    ExpectError([&] { audit.AddPolicy(broken); }, pw::ErrorDomain::Validation,
                pw::errors::validation::kRuleConditionInvalid, "unknown severity");
    Expect(audit.Policies().size() == 1, "rejected policies are not stored");
  }

  void TestThreatIndicators() {
    pw::orchestrator::EventBus bus;
    FakeClock clock;
    AuditSystem audit(bus, AuditOptions{}, clock.Hooks());
    pw::audit::ThreatIndicator indicator;
    indicator.id = "ioc-1";
    indicator.type = pw::audit::IndicatorType::kIpAddress;
    indicator.value = "203.0.113.7";
    indicator.severity = Severity::kHigh;
    audit.AddThreatIndicator(indicator);

    pw::audit::ThreatIndicator expired;
    expired.type = pw::audit::IndicatorType::kDomain;
    expired.value = "old.example";
    expired.expires_at = clock.now - std::chrono::hours(1);
    audit.AddThreatIndicator(expired);
    Expect(audit.ActiveIndicators().size() == 1, "expired indicator inactive");

    const auto stored = audit.RecordEvent(MakeEvent(EventType::kDataAccess, Severity::kInfo, {}, "203.0.113.7"));
    Expect(std::find(stored.tags.begin(), stored.tags.end(), "threat:ioc-1") != stored.tags.end(),
           "indicator match tagged");
    const auto incidents = audit.ListIncidents();
    Expect(incidents.size() == 1 && incidents[0].severity == Severity::kHigh, "indicator severity drives incident");

    auto event = MakeEvent(EventType::kDataAccess, Severity::kInfo);
    event.description = "fetched https://old.example/payload";
    audit.RecordEvent(event);
    Expect(audit.ListIncidents().size() == 1, "expired indicator ignored");
  }

  void TestSearchAndResolve() {
    pw::orchestrator::EventBus bus;
    FakeClock clock;
    AuditSystem audit(bus, AuditOptions{}, clock.Hooks());
    std::string last_id;
    for (int i = 0; i < 5; ++i) {
      last_id = audit.RecordEvent(MakeEvent(EventType::kPluginExecution, Severity::kInfo, "search")).id;
    }
    audit.RecordEvent(MakeEvent(EventType::kConfigurationChange, Severity::kLow, "other"));

    EventFilter filter;
    filter.plugin_id = "search";
    auto found = audit.SearchEvents(filter);
    Expect(found.size() == 5 && found[0].id == last_id, "newest first");
    filter.limit = 2;
    filter.page = 2;
    found = audit.SearchEvents(filter);
    Expect(found.size() == 1, "last page holds the remainder");

    audit.ResolveEvent(last_id, "alice", "expected behaviour");
    EventFilter resolved;
    resolved.resolved = true;
    found = audit.SearchEvents(resolved);
    Expect(found.size() == 1 && found[0].resolved_by == std::optional<std::string>("alice") &&
               found[0].mitigation == "expected behaviour",
           "resolution stored on the event");
    ExpectError([&] { audit.ResolveEvent("evt-missing", "alice", ""); }, pw::ErrorDomain::State,
                pw::errors::state::kIncidentNotFound, "unknown event");

    EventFilter by_type;
    by_type.type = EventType::kConfigurationChange;
    Expect(audit.SearchEvents(by_type).size() == 1, "type filter");
  }

  void TestComplianceReport() {
    pw::orchestrator::EventBus bus;
    FakeClock clock;
    AuditSystem audit(bus, AuditOptions{}, clock.Hooks());
    pw::audit::DateRange period{clock.now - std::chrono::hours(24), clock.now + std::chrono::hours(24)};

    auto report = audit.GenerateComplianceReport(pw::audit::ComplianceFramework::kIso27001, period);
    Expect(!report.controls.empty() && report.overall_score == 100.0, "clean trail is fully compliant");
    Expect(report.violations.empty() && report.recommendations.empty(), "nothing to remediate");
    Expect(report.evidence.size() == report.controls.size() && report.evidence[0].hash.size() == 64 &&
               report.evidence[0].verified,
           "hashed evidence per control");

    audit.RecordEvent(MakeEvent(EventType::kMalwareDetected, Severity::kLow, "m1"));
    audit.RecordEvent(MakeEvent(EventType::kMalwareDetected, Severity::kLow, "m2"));
    report = audit.GenerateComplianceReport(pw::audit::ComplianceFramework::kIso27001, period);
    const auto malware = std::find_if(report.controls.begin(), report.controls.end(),
                                      [](const auto& c) { return c.id == "A.8.7"; });
    Expect(malware != report.controls.end() && malware->score == 40.0 &&
               malware->status == pw::audit::ControlStatus::kNonCompliant,
           "malware detections fail the malware control");
    Expect(std::any_of(report.violations.begin(), report.violations.end(),
                       [](const auto& v) { return v.control_id == "A.8.7" && v.severity == Severity::kHigh; }),
           "non-compliant control is a HIGH violation");
    Expect(!report.recommendations.empty() && report.overall_score < 100.0, "recommendation and lower score");
    Expect(audit.Metrics().compliance_score == report.overall_score, "metrics track the latest score");
    Expect(audit.ComplianceReports().size() == 2, "reports retained");

    pw::audit::DateRange past{clock.now - std::chrono::hours(72), clock.now - std::chrono::hours(48)};
    Expect(audit.GenerateComplianceReport(pw::audit::ComplianceFramework::kSoc2, past).overall_score == 100.0,
           "events outside the period are not counted");
  }

  void TestExports() {
    pw::orchestrator::EventBus bus;
    FakeClock clock;
    AuditSystem audit(bus, AuditOptions{}, clock.Hooks());
    audit.RecordEvent(MakeEvent(EventType::kPluginInstall, Severity::kInfo, "exp"));
    auto event = MakeEvent(EventType::kPluginExecution, Severity::kLow, "exp");
    event.description = "ran, \"quoted\" <tag>";
    audit.RecordEvent(event);

    const auto json_text = audit.ExportData(pw::audit::ExportKind::kEvents, pw::audit::ExportFormat::kJson);
    const auto parsed = nlohmann::json::parse(json_text);
    Expect(parsed.is_array() && parsed.size() == 2, "JSON export lists events");
    Expect(parsed.size() == 2 && parsed[0]["description"] == "ran, \"quoted\" <tag>", "newest event first");

    const auto csv = audit.ExportData(pw::audit::ExportKind::kEvents, pw::audit::ExportFormat::kCsv);
    Expect(std::count(csv.begin(), csv.end(), '\n') == 3, "CSV header plus one row per event");
    Expect(csv.find("\"ran, \"\"quoted\"\" <tag>\"") != std::string::npos, "CSV cell quoting");

    const auto xml = audit.ExportData(pw::audit::ExportKind::kEvents, pw::audit::ExportFormat::kXml);
    Expect(xml.rfind("<?xml", 0) == 0 && xml.find("<record>") != std::string::npos, "XML records");
    Expect(xml.find("&lt;tag&gt;") != std::string::npos, "XML escaping");

    const auto metrics = nlohmann::json::parse(
        audit.ExportData(pw::audit::ExportKind::kMetrics, pw::audit::ExportFormat::kJson));
    Expect(metrics.contains("total_events") && metrics["total_events"] == 2, "metrics export");
  }

  void TestRetention() {
    pw::orchestrator::EventBus bus;
    FakeClock clock;
    AuditSystem audit(bus, AuditOptions{}, clock.Hooks());
    const auto routine = audit.RecordEvent(MakeEvent(EventType::kPluginExecution, Severity::kLow, "old"));
    const auto critical = audit.RecordEvent(MakeEvent(EventType::kDataExfiltration, Severity::kCritical, "old2"));
    clock.now += std::chrono::hours(72);
    const auto recent = audit.RecordEvent(MakeEvent(EventType::kPluginExecution, Severity::kLow, "new"));

    Expect(audit.ApplyRetention(std::chrono::hours(48)) == 1, "one expired event removed");
    Expect(!audit.GetEvent(routine.id).has_value(), "expired routine event dropped");
    Expect(audit.GetEvent(critical.id).has_value(), "event behind an open incident kept");
    Expect(audit.GetEvent(recent.id).has_value(), "recent event kept");
  }

  void TestSecurityAudit() {
    pw::orchestrator::EventBus bus;
    FakeClock clock;
    AuditSystem audit(bus, AuditOptions{}, clock.Hooks());
    auto report = audit.PerformSecurityAudit(pw::audit::AuditType::kPeriodic);
    Expect(report.findings.empty() && report.risk.overall == pw::RiskLevel::kLow, "quiet system audits clean");

    audit.RecordEvent(MakeEvent(EventType::kPermissionDenied, Severity::kHigh, "a1"));
    clock.now += std::chrono::hours(30);
    report = audit.PerformSecurityAudit(pw::audit::AuditType::kPeriodic);
    Expect(std::any_of(report.findings.begin(), report.findings.end(),
                       [](const auto& f) { return f.category == "events"; }),
           "unresolved HIGH events reported");
    Expect(!report.risk.key_risks.empty() && !report.recommendations.empty(), "risks and recommendations");

    report = audit.PerformSecurityAudit(pw::audit::AuditType::kCompliance);
    Expect(report.findings.size() == 1 && report.findings[0].category == "compliance",
           "missing compliance report flagged");

    pw::test::TempDir dir("pw_audit");
    const auto path = dir.path() / "audit.log";
    auto log = std::make_shared<pw::orchestrator::JsonLineLogger>(path);
    bus.AttachLogger(log);
    audit.RecordEvent(MakeEvent(EventType::kPluginExecution, Severity::kInfo, "a2"));
    audit.SetAuditLog(log);
    Expect(log->Verify(), "audit log chain intact");
    auto text = pw::test::ReadFile(path);
    const auto pos = text.find("security_event");
    Expect(pos != std::string::npos, "audit event logged");
    if (pos != std::string::npos) {
      text.replace(pos, 8, "SECURITY");
      pw::test::WriteFile(path, text);
    }
    report = audit.PerformSecurityAudit(pw::audit::AuditType::kCompliance);
    Expect(std::any_of(report.findings.begin(), report.findings.end(),
                       [](const auto& f) { return f.severity == Severity::kCritical; }),
           "tampered audit log is a critical finding");
  }

} // namespace

int main() {
  TestCorrelation();
  TestCorrelationWindowTail();
  TestCriticalEscalates();
  TestIncidentLifecycle();
  TestPolicyRules();
  TestThreatIndicators();
  TestSearchAndResolve();
  TestComplianceReport();
  TestExports();
  TestRetention();
  TestSecurityAudit();
  return pw::test::Finish("audit system");
}

#include "pw/security/security_framework.h" // TSK160_Framework

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "pw/audit/audit_system.h"
#include "pw/orchestrator/event_bus.h"
#include "test_support.h"

namespace {

  using pw::Severity;
  using pw::security::FrameworkOptions;
  using pw::security::Operation;
  using pw::security::OperationType;
  using pw::security::PolicyViolation;
  using pw::security::SecurityFramework;
  using pw::security::SecurityPolicy;
  using pw::security::ViolationKind;
  using pw::test::Expect;
  using pw::test::ExpectError;
  using pw::test::TempDir;

  constexpr std::uint64_t kMiB = 1024ull * 1024ull;

  FrameworkOptions QuietOptions() {
    FrameworkOptions options;
    options.detection_interval = std::chrono::milliseconds(0);
    return options;
  }

  SecurityPolicy TestPolicy() {
    SecurityPolicy policy;
    policy.id = "test-policy";
    policy.name = "Test Policy";
    policy.permissions = {"storage.read", "network.https"};
    policy.network.allowed_hosts = {"api.example.com"};
    policy.network.blocked_hosts = {"10.0.0.0/8"};
    policy.network.allowed_ports = {443};
    policy.network.max_connections = 4;
    policy.filesystem.blocked_paths = {"/etc"};
    policy.execution.max_processes = 1;
    policy.execution.allowed_executables = {"node"};
    policy.data_access.allowed_databases = {"main"};
    policy.data_access.allowed_tables = {"users"};
    policy.data_access.max_query_time = std::chrono::milliseconds(1000);
    return policy;
  }

  pw::sandbox::SandboxConfig BaseConfig(const TempDir& root) {
    pw::sandbox::SandboxConfig config;
    config.root_dir = root.path();
    config.unit_path = pw::test::SandboxUnitPath();
    config.interpreter = {"/bin/sh", "-c"};
    config.monitoring.enabled = false;
    config.max_processes = 0;
    config.grace_period = std::chrono::milliseconds(500);
    return config;
  }

  pw::SecurityContext Context() {
    pw::SecurityContext context;
    context.request_id = pw::MakeId("req");
    context.ip_address = "198.51.100.4";
    return context;
  }

  void TestDefaultPolicyLookup() {
    const pw::security::PolicyStore store;
    const auto id = std::string(pw::security::kDefaultPolicyId);
    const auto listed = store.List();
    Expect(listed.size() == 1 && listed.front()->id == id, "store starts with the default policy");
    const auto found = store.Get(id);
    Expect(found && found->id == id && found->version == 1, "default policy reachable by its id");
    Expect(found && found->network.allowed_ports.size() == 2 && found->execution.max_processes == 5,
           "default policy contents");
  }

  void TestPolicyStore() {
    pw::orchestrator::EventBus bus;
    pw::audit::AuditSystem audit(bus);
    SecurityFramework framework(bus, audit, QuietOptions());
    const auto defaults = framework.GetPolicy(std::string(pw::security::kDefaultPolicyId));
    Expect(defaults->permissions.size() == 2 && defaults->version == 1, "default policy registered");

    auto registered = framework.RegisterPolicy(TestPolicy());
    Expect(registered->version == 1 && framework.ListPolicies().size() == 2, "policy registered");
    ExpectError([&] { (void)framework.RegisterPolicy(TestPolicy()); }, pw::ErrorDomain::Validation,
                pw::errors::validation::kPolicyInvalid, "duplicate id");

    auto updated = TestPolicy();
    updated.permissions.push_back("storage.write");
    const auto snapshot = framework.UpdatePolicy(updated);
    Expect(snapshot->version == 2 && snapshot->permissions.size() == 3, "update publishes a new version");
    Expect(registered->version == 1 && registered->permissions.size() == 2, "earlier snapshot unchanged");

    auto unknown = TestPolicy();
    unknown.id = "nobody";
    ExpectError([&] { (void)framework.UpdatePolicy(unknown); }, pw::ErrorDomain::State,
                pw::errors::state::kPolicyNotFound, "update of an unknown policy");
    ExpectError([&] { (void)framework.GetPolicy("nobody"); }, pw::ErrorDomain::State,
                pw::errors::state::kPolicyNotFound, "lookup of an unknown policy");

    auto broken = TestPolicy();
    broken.id = "broken";
    broken.execution.max_memory = 0;
    ExpectError([&] { (void)framework.RegisterPolicy(broken); }, pw::ErrorDomain::Validation,
                pw::errors::validation::kPolicyInvalid, "zero memory limit");
    broken = TestPolicy();
    broken.id = "broken";
    broken.filesystem.allowed_paths = {"/etc/plugin"};
    ExpectError([&] { (void)framework.RegisterPolicy(broken); }, pw::ErrorDomain::Validation,
                pw::errors::validation::kPolicyInvalid, "allowed path inside a blocked one");

    Expect(pw::security::HostMatches("cdn.api.example.com", "api.example.com"), "subdomain match");
    Expect(!pw::security::HostMatches("badapi.example.com", "api.example.com"), "suffix must follow a dot");
    Expect(pw::security::HostMatches("10.1.2.3", "10.0.0.0/8"), "CIDR match");
    Expect(!pw::security::HostMatches("11.1.2.3", "10.0.0.0/8"), "outside the CIDR");
  }

  void TestValidation() { // TSK161_Framework_Validation
    pw::orchestrator::EventBus bus;
    pw::audit::AuditSystem audit(bus);
    SecurityFramework framework(bus, audit, QuietOptions());
    framework.RegisterPolicy(TestPolicy());

    pw::security::ValidationRequest request;
    request.plugin_id = "clean";
    request.policy_id = "test-policy";
    request.requested_permissions = {"storage.read"};
    request.requested_memory = 64 * kMiB;
    auto result = framework.ValidatePluginForExecution(request);
    Expect(result.valid && result.violations.empty(), "clean plugin passes");

    pw::analysis::AnalysisResult analysis;
    pw::analysis::SecurityVulnerability weak;
    weak.id = "PW-000000000001";
    weak.severity = Severity::kMedium;
    weak.title = "Weak hash";
    weak.file = "index.js";
    weak.line = 4;
    analysis.vulnerabilities.push_back(weak);
    request.plugin_id = "medium";
    request.analysis = &analysis;
    request.requested_memory = 2048 * kMiB;
    result = framework.ValidatePluginForExecution(request);
    Expect(result.valid && result.violations.size() == 2, "MEDIUM findings do not block");
    Expect(result.violations.size() == 2 && result.violations[0].kind == ViolationKind::kCodeInjection &&
               result.violations[0].details.at("file") == "index.js",
           "analysis finding carried through");
    Expect(result.violations.size() == 2 && result.violations[1].kind == ViolationKind::kResourceLimit,
           "oversized memory request flagged");

    pw::analysis::SecurityVulnerability dependency;
    dependency.id = "PW-000000000002";
    dependency.severity = Severity::kHigh;
    dependency.title = "Vulnerable dependency lodash";
    dependency.file = "package.json";
    dependency.pass = pw::analysis::DetectionPass::kDependency;
    analysis.vulnerabilities = {dependency};
    request.plugin_id = "risky";
    request.requested_memory = 0;
    request.requested_permissions = {"storage.read", "admin"};
    result = framework.ValidatePluginForExecution(request);
    Expect(!result.valid && result.violations.size() == 2, "HIGH findings block");
    Expect(result.violations.size() == 2 && result.violations[0].kind == ViolationKind::kVulnerableDependency &&
               result.violations[1].kind == ViolationKind::kPermissionDenied && result.violations[1].blocked,
           "dependency and permission violations");

    pw::analysis::AnalysisResult timed_out;
    timed_out.status = pw::analysis::AnalysisStatus::kTimeout;
    request.analysis = &timed_out;
    request.requested_permissions.clear();
    result = framework.ValidatePluginForExecution(request);
    Expect(!result.valid && result.violations.size() == 1 && result.violations[0].severity == Severity::kHigh,
           "incomplete analysis blocks");

    pw::trust::VerificationResult verification;
    verification.manifest = pw::trust::PluginManifest{};
    verification.errors.push_back({pw::trust::VerificationCode::kManifestInvalid, pw::trust::IssueSeverity::kFatal,
                                   "Manifest does not contain a signature block"});
    request.analysis = nullptr;
    request.verification = &verification;
    request.unsigned_allowed = true;
    result = framework.ValidatePluginForExecution(request);
    Expect(result.valid && result.violations.size() == 1 && result.violations[0].severity == Severity::kMedium &&
               result.violations[0].kind == ViolationKind::kSignatureInvalid,
           "tolerated unsigned plugin");
    request.unsigned_allowed = false;
    result = framework.ValidatePluginForExecution(request);
    Expect(!result.valid && result.violations[0].severity == Severity::kCritical, "unsigned plugin refused");

    ExpectError(
        [&] {
          auto bad = request;
          bad.policy_id = "nobody";
          (void)framework.ValidatePluginForExecution(bad);
        },
        pw::ErrorDomain::State, pw::errors::state::kPolicyNotFound, "unknown policy");

    const auto metrics = framework.Metrics();
    Expect(metrics.total_violations == 7 && metrics.blocked_requests == 4, "violations counted");
  }

  void TestMonitorOperations() { // TSK162_Framework_Monitor
    TempDir root("pw_framework");
    pw::orchestrator::EventBus bus;
    int notices = 0;
    bus.Subscribe([&](const pw::orchestrator::Event& e) {
      if (e.event_id == "security_team_notified") {
        ++notices;
      }
    });
    pw::audit::AuditSystem audit(bus);
    SecurityFramework framework(bus, audit, QuietOptions());
    framework.RegisterPolicy(TestPolicy());
    const auto context = Context();
    const auto id = framework.CreateSecureSandbox("monitored", "test-policy", context, BaseConfig(root));
    auto box = framework.GetSandbox(id);
    Expect(box && box->state() == pw::sandbox::SandboxState::kActive, "sandbox started");

    auto result = framework.MonitorPluginExecution(id, Operation{OperationType::kFileRead, "data/in.json"}, context);
    Expect(result.allowed && !result.violation, "workspace read allowed");
    Operation connect{OperationType::kNetworkConnect, "api.example.com", 443};
    result = framework.MonitorPluginExecution(id, connect, context);
    Expect(result.allowed && !result.violation, "allow-listed connection");

    Operation query{OperationType::kDataQuery, "users"};
    query.database = "main";
    query.duration = std::chrono::milliseconds(5000);
    result = framework.MonitorPluginExecution(id, query, context);
    Expect(result.allowed && result.violation && result.violation->kind == ViolationKind::kResourceLimit &&
               result.violation->details.at("resource") == "query time",
           "slow query allowed with a resource violation");
    Expect(box->state() == pw::sandbox::SandboxState::kThrottled, "resource overrun throttles");

    result = framework.MonitorPluginExecution(id, Operation{OperationType::kProcessSpawn, "/usr/bin/node"}, context);
    Expect(result.allowed && !result.violation, "first process within the limit");
    result = framework.MonitorPluginExecution(id, Operation{OperationType::kProcessSpawn, "/usr/bin/node"}, context);
    Expect(result.allowed && result.violation && result.violation->details.at("resource") == "processes",
           "second process exceeds the limit");
    Expect(framework.Metrics().resource_exhaustions == 2 && notices == 0, "MEDIUM violations not escalated");

    result = framework.MonitorPluginExecution(id, Operation{OperationType::kPermissionUse, "admin"}, context);
    Expect(!result.allowed && result.violation && result.violation->severity == Severity::kHigh &&
               result.violation->kind == ViolationKind::kPermissionDenied,
           "ungranted permission denied");
    Expect(box->state() == pw::sandbox::SandboxState::kTerminated, "HIGH policy violation stops the sandbox");
    Expect(notices == 1, "security team notified once");
    const auto incidents = audit.ListIncidents();
    Expect(incidents.size() == 1 && incidents[0].severity == Severity::kHigh, "incident opened for the denial");

    ExpectError([&] { (void)framework.MonitorPluginExecution(id, connect, context); }, pw::ErrorDomain::State,
                pw::errors::state::kSandboxNotActive, "stopped sandbox refuses monitoring");
    ExpectError([&] { (void)framework.MonitorPluginExecution("sandbox-missing", connect, context); },
                pw::ErrorDomain::State, pw::errors::state::kSandboxNotFound, "unknown sandbox");
  }

  void TestPolicyDenials() {
    TempDir root("pw_framework");
    pw::orchestrator::EventBus bus;
    pw::audit::AuditSystem audit(bus);
    auto options = QuietOptions();
    options.auto_isolate = false;
    SecurityFramework framework(bus, audit, options);
    framework.RegisterPolicy(TestPolicy());
    const auto context = Context();
    const auto id = framework.CreateSecureSandbox("denied", "test-policy", context, BaseConfig(root));

    auto check = [&](Operation operation, const std::string& what) {
      const auto result = framework.MonitorPluginExecution(id, operation, context);
      Expect(!result.allowed && result.violation && result.violation->blocked, what);
      return result;
    };
    check(Operation{OperationType::kNetworkConnect, "10.2.3.4", 443}, "CIDR-blocked host");
    check(Operation{OperationType::kNetworkConnect, "other.example.org", 443}, "host off the allow list");
    check(Operation{OperationType::kNetworkConnect, "api.example.com", 8443}, "port off the allow list");
    check(Operation{OperationType::kFileRead, "/etc/hosts"}, "blocked path");
    check(Operation{OperationType::kFileWrite, "/var/tmp/out.bin", 0, "", 10}, "write outside the writable area");
    check(Operation{OperationType::kProcessSpawn, "/bin/bash"}, "executable not allowed");
    Operation query{OperationType::kDataQuery, "secrets"};
    query.database = "main";
    check(query, "table not allowed");

    Expect(framework.GetSandbox(id)->state() != pw::sandbox::SandboxState::kTerminated,
           "without auto isolation the sandbox keeps running");
    Expect(framework.Metrics().blocked_requests == 7, "denials counted as blocked requests");

    PolicyViolation critical;
    critical.id = pw::MakeId("vio");
    critical.kind = ViolationKind::kNetworkBlocked;
    critical.severity = Severity::kCritical;
    critical.description = "bulk upload after credential read";
    critical.plugin_id = "denied";
    critical.sandbox_id = id;
    critical.context = context;
    critical.blocked = true;
    framework.HandleSecurityViolation(critical);
    Expect(framework.GetSandbox(id)->state() == pw::sandbox::SandboxState::kTerminated,
           "CRITICAL violation contained even without auto isolation");

    const auto replacement = framework.CreateSecureSandbox("denied", "test-policy", context, BaseConfig(root));
    Expect(!framework.GetSandbox(id) && framework.ListSandboxes().size() == 1,
           "terminated sandbox superseded by the plugin's new one");
    framework.StopAll();
    Expect(framework.GetSandbox(replacement)->state() == pw::sandbox::SandboxState::kTerminated,
           "StopAll stops sandboxes");
    Expect(framework.ReleaseSandbox(replacement) && framework.ListSandboxes().empty(), "released sandbox forgotten");
    Expect(!framework.ReleaseSandbox(replacement), "release once");
  }

  void TestSandboxDenial() {
    TempDir root("pw_framework");
    pw::orchestrator::EventBus bus;
    pw::audit::AuditSystem audit(bus);
    SecurityFramework framework(bus, audit, QuietOptions());
    auto policy = TestPolicy();
    policy.network.allowed_ports.clear();
    framework.RegisterPolicy(policy);
    const auto context = Context();
    const auto id = framework.CreateSecureSandbox("ssh", "test-policy", context, BaseConfig(root));

    const auto result =
        framework.MonitorPluginExecution(id, Operation{OperationType::kNetworkConnect, "api.example.com", 22}, context);
    Expect(!result.allowed && result.violation && result.violation->kind == ViolationKind::kNetworkBlocked &&
               result.violation->details.count("sandbox_violation") == 1,
           "sandbox blocks the port the policy leaves open");
    const auto box = framework.GetSandbox(id);
    Expect(box->state() == pw::sandbox::SandboxState::kThrottled, "sandbox-level denial throttles");
    Expect(framework.Metrics().sandbox_violations == 1, "sandbox violation forwarded");
    const auto events = audit.SearchEvents(pw::audit::EventFilter{pw::audit::EventType::kRuntimeViolation});
    Expect(events.size() == 1 && events[0].sandbox_id == std::optional<std::string>(id), "runtime violation audited");
    framework.StopSandbox(id);
    Expect(!framework.StopSandbox("sandbox-missing"), "unknown sandbox cannot be stopped");
  }

  void TestExfiltrationDetected() { // TSK163_Framework_Detection
    TempDir root("pw_framework");
    pw::orchestrator::EventBus bus;
    pw::audit::AuditSystem audit(bus);
    SecurityFramework framework(bus, audit, QuietOptions());
    framework.RegisterPolicy(TestPolicy());
    const auto context = Context();
    const auto id = framework.CreateSecureSandbox("leaky", "test-policy", context, BaseConfig(root));
    Expect(framework.DetectSuspiciousActivity(id, context).empty(), "nothing to scan yet");

    auto result = framework.MonitorPluginExecution(id, Operation{OperationType::kFileRead, "/usr/share/doc"}, context);
    Expect(result.allowed, "system read allowed");
    Operation upload{OperationType::kNetworkConnect, "api.example.com", 443};
    upload.bytes = 20 * kMiB;
    result = framework.MonitorPluginExecution(id, upload, context);
    Expect(result.allowed, "upload allowed on its own");

    const auto found = framework.DetectSuspiciousActivity(id, context);
    Expect(found.size() == 1 && found[0].severity == Severity::kCritical &&
               found[0].details.at("signal") == "exfiltration",
           "large upload after a sensitive read");
    Expect(framework.GetSandbox(id)->state() == pw::sandbox::SandboxState::kTerminated, "sandbox contained");
    Expect(framework.Metrics().suspicious_activities == 1, "suspicious activity counted");
    const auto incidents = audit.ListIncidents();
    Expect(incidents.size() == 1 && incidents[0].status == pw::audit::IncidentStatus::kEscalated,
           "critical incident escalated");
    Expect(framework.DetectSuspiciousActivity(id, context).empty(), "operations are scanned once");
    Expect(framework.DetectSuspiciousActivity("sandbox-missing", context).empty(), "unknown sandbox ignored");
  }

  void TestAttackSignature() {
    TempDir root("pw_framework");
    pw::orchestrator::EventBus bus;
    pw::audit::AuditSystem audit(bus);
    auto options = QuietOptions();
    options.auto_isolate = false;
    SecurityFramework framework(bus, audit, options);
    framework.RegisterPolicy(TestPolicy());
    const auto context = Context();
    const auto id = framework.CreateSecureSandbox("probe", "test-policy", context, BaseConfig(root));

    const auto result =
        framework.MonitorPluginExecution(id, Operation{OperationType::kFileRead, "../../etc/passwd"}, context);
    Expect(!result.allowed && result.violation &&
               result.violation->kind == ViolationKind::kFilesystemViolation,
           "sandbox refuses the escape");
    const auto found = framework.DetectSuspiciousActivity(id, context);
    Expect(found.size() == 1 && found[0].details.at("signal") == "attack" &&
               found[0].details.at("patterns") == "credential-file, path-traversal",
           "attack signatures matched");
    framework.StopAll();
  }

  void TestReport() {
    pw::orchestrator::EventBus bus;
    pw::audit::AuditSystem audit(bus);
    SecurityFramework framework(bus, audit, QuietOptions());
    const auto now = pw::Clock::now();

    PolicyViolation injection;
    injection.id = pw::MakeId("vio");
    injection.kind = ViolationKind::kCodeInjection;
    injection.severity = Severity::kHigh;
    injection.description = "eval of request data";
    injection.timestamp = now;
    injection.plugin_id = "reported";
    injection.context = Context();
    injection.blocked = true;
    framework.HandleSecurityViolation(injection);

    PolicyViolation resource = injection;
    resource.id = pw::MakeId("vio");
    resource.kind = ViolationKind::kResourceLimit;
    resource.severity = Severity::kMedium;
    resource.description = "memory";
    resource.blocked = false;
    framework.HandleSecurityViolation(resource);

    Expect(audit.ListIncidents().size() == 1, "HIGH violation opens an incident");
    const auto report =
        framework.GenerateSecurityReport({now - std::chrono::hours(1), now + std::chrono::hours(1)});
    Expect(report.violations.size() == 2, "violations in the period");
    Expect(report.compliance_score == 90.0 && report.status == pw::security::FrameworkCompliance::kRequiresAttention,
           "one HIGH violation requires attention");
    Expect(report.by_kind.at(ViolationKind::kCodeInjection) == 1 && report.by_severity.at(Severity::kMedium) == 1,
           "breakdowns");
    Expect(report.recommendations.size() == 4, "recommendations per violation kind");
    Expect(framework.Metrics().compliance_score == 90.0, "metrics track the report");

    const auto past = framework.GenerateSecurityReport({now - std::chrono::hours(3), now - std::chrono::hours(2)});
    Expect(past.violations.empty() && past.status == pw::security::FrameworkCompliance::kCompliant,
           "empty period is compliant");

    auto options = QuietOptions();
    options.incident_response = false;
    pw::audit::AuditSystem quiet_audit(bus);
    SecurityFramework quiet(bus, quiet_audit, options);
    quiet.HandleSecurityViolation(injection);
    Expect(quiet_audit.ListIncidents().empty(), "incident response can be disabled");
  }

  void TestSandboxCreation() {
    TempDir root("pw_framework");
    pw::orchestrator::EventBus bus;
    pw::audit::AuditSystem audit(bus);
    SecurityFramework framework(bus, audit, QuietOptions());
    framework.RegisterPolicy(TestPolicy());
    const auto context = Context();
    ExpectError([&] { (void)framework.CreateSecureSandbox("p", "nobody", context, BaseConfig(root)); },
                pw::ErrorDomain::State, pw::errors::state::kPolicyNotFound, "unknown policy");
    auto broken = BaseConfig(root);
    broken.unit_path = root.path() / "no-such-unit";
    ExpectError([&] { (void)framework.CreateSecureSandbox("p", "test-policy", context, broken); },
                pw::ErrorDomain::State, pw::errors::state::kSandboxStartFailed, "unit missing");

    pw::security::SandboxRestrictions restrictions;
    restrictions.deny_network = true;
    const auto id = framework.CreateSecureSandbox("offline", "test-policy", context, BaseConfig(root), restrictions);
    auto updated = TestPolicy();
    updated.permissions.push_back("storage.write");
    framework.UpdatePolicy(updated);
    const auto sandboxes = framework.ListSandboxes();
    const auto info = std::find_if(sandboxes.begin(), sandboxes.end(), [&](const auto& s) { return s.id == id; });
    Expect(info != sandboxes.end() && info->policy_version == 1, "sandbox keeps the policy it started with");
    Expect(!framework.GetSandbox(id)->CheckNetworkAccess("api.example.com", 443), "restriction removes egress");
    framework.StopAll();
  }

} // namespace

int main() {
  TestDefaultPolicyLookup();
  TestPolicyStore();
  TestValidation();
  TestMonitorOperations();
  TestPolicyDenials();
  TestSandboxDenial();
  TestExfiltrationDetected();
  TestAttackSignature();
  TestReport();
  TestSandboxCreation();
  return pw::test::Finish("security framework");
}

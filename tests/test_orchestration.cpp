#include "pw/orchestrator/orchestration.h" // TSK171_Orchestration

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "pw/crypto/x509.h"
#include "pw/orchestrator/event_bus.h"
#include "test_support.h"

namespace {

  using pw::RiskLevel;
  using pw::Severity;
  using pw::TrustLevel;
  using pw::crypto::CertificateRequest;
  using pw::crypto::GenerateCertificate;
  using pw::crypto::IssuedCertificate;
  using pw::orchestrator::OrchestrationConfig;
  using pw::orchestrator::ProfileCompliance;
  using pw::orchestrator::ProfileStatus;
  using pw::orchestrator::ReportType;
  using pw::orchestrator::RestrictionType;
  using pw::orchestrator::SecurityServices;
  using pw::security::PolicyViolation;
  using pw::security::ViolationKind;
  using pw::test::Expect;
  using pw::test::ExpectError;
  using pw::test::TempDir;
  using pw::test::WriteFile;

  OrchestrationConfig MakeConfig(const TempDir& root) {
    OrchestrationConfig config;
    config.threat_detection.enabled = false;
    auto& sandbox = config.runtime.sandbox;
    sandbox.root_dir = root.path();
    sandbox.unit_path = pw::test::SandboxUnitPath();
    sandbox.interpreter = {"/bin/sh", "-c"};
    sandbox.monitoring.enabled = false;
    sandbox.max_processes = 0;
    sandbox.grace_period = std::chrono::milliseconds(500);
    return config;
  }

  pw::SecurityContext Context() {
    pw::SecurityContext context;
    context.request_id = pw::MakeId("req");
    context.user_id = "operator";
    context.ip_address = "203.0.113.7";
    return context;
  }

  void WriteManifest(const std::filesystem::path& dir, const std::string& id) {
    WriteFile(dir / "plugin.json", "{\"id\":\"" + id + "\",\"name\":\"" + id + "\",\"version\":\"1.0.0\","
                                   "\"entry\":\"index.js\",\"permissions\":[\"storage.read\"]}");
  }

  void WriteCleanPlugin(const std::filesystem::path& dir, const std::string& id) {
    WriteFile(dir / "index.js", "module.exports = function add(a, b) { return a + b; };\n");
    WriteManifest(dir, id);
  }

  struct Pki {
    IssuedCertificate root;
    IssuedCertificate leaf;
  };

  Pki MakePki() {
    CertificateRequest root_req;
    root_req.common_name = "PW Orchestration Root";
    root_req.is_ca = true;
    root_req.validity_days = 3650;
    auto root = GenerateCertificate(root_req);

    CertificateRequest leaf_req;
    leaf_req.common_name = "Weather Publisher";
    leaf_req.permissions = {"storage.read"};
    auto leaf = GenerateCertificate(leaf_req, &root);
    return Pki{std::move(root), std::move(leaf)};
  }

  std::size_t CountSeverity(const std::vector<PolicyViolation>& violations, Severity severity) {
    return static_cast<std::size_t>(std::count_if(violations.begin(), violations.end(),
                                                  [severity](const auto& v) { return v.severity == severity; }));
  }

  bool HasKind(const std::vector<PolicyViolation>& violations, ViolationKind kind, Severity severity) {
    return std::any_of(violations.begin(), violations.end(),
                       [&](const PolicyViolation& v) { return v.kind == kind && v.severity == severity; });
  }

  std::vector<pw::audit::SecurityEvent> EventsFor(SecurityServices& services, pw::audit::EventType type,
                                                  const std::string& plugin_id) {
    pw::audit::EventFilter filter;
    filter.type = type;
    filter.plugin_id = plugin_id;
    return services.audit().SearchEvents(filter);
  }

  void TestPureDecisions() {
    Expect(pw::orchestrator::ComputeRiskLevel({}, 100) == RiskLevel::kLow, "clean plugin is LOW risk");
    Expect(pw::orchestrator::ComputeRiskLevel({}, 65) == RiskLevel::kMedium, "score below 70 is MEDIUM");
    Expect(pw::orchestrator::ComputeRiskLevel({}, 45) == RiskLevel::kHigh, "score below 50 is HIGH");
    Expect(pw::orchestrator::ComputeRiskLevel({}, 20) == RiskLevel::kCritical, "score below 30 is CRITICAL");

    PolicyViolation high;
    high.severity = Severity::kHigh;
    Expect(pw::orchestrator::ComputeRiskLevel({high}, 100) == RiskLevel::kMedium, "one HIGH is MEDIUM");
    Expect(pw::orchestrator::ComputeRiskLevel({high, high, high}, 100) == RiskLevel::kHigh, "three HIGH is HIGH");
    PolicyViolation critical;
    critical.severity = Severity::kCritical;
    Expect(pw::orchestrator::ComputeRiskLevel({critical}, 100) == RiskLevel::kCritical, "any CRITICAL dominates");

    auto restrictions = pw::orchestrator::GenerateRestrictions(RiskLevel::kHigh, TrustLevel::kEnterprise);
    Expect(restrictions.size() == 1 && restrictions[0].type == RestrictionType::kNetwork &&
               restrictions[0].rule == "deny-all",
           "HIGH risk denies all network traffic");
    restrictions = pw::orchestrator::GenerateRestrictions(RiskLevel::kLow, TrustLevel::kLow);
    Expect(restrictions.size() == 1 && restrictions[0].type == RestrictionType::kFilesystem &&
               restrictions[0].targets.size() == 6,
           "LOW trust denies the sensitive roots");
    Expect(pw::orchestrator::GenerateRestrictions(RiskLevel::kMedium, TrustLevel::kMedium).empty(),
           "MEDIUM risk with MEDIUM trust is unrestricted");

    Expect(pw::orchestrator::IsInstallationAllowed({}, 80, true, false, false), "unsigned allowed when optional");
    Expect(!pw::orchestrator::IsInstallationAllowed({}, 80, true, false, true), "signature required");
    Expect(!pw::orchestrator::IsInstallationAllowed({}, 40, true, true, true), "strict mode floor");
    Expect(pw::orchestrator::IsInstallationAllowed({}, 40, false, true, true), "lenient mode ignores the floor");
    Expect(!pw::orchestrator::IsInstallationAllowed({critical}, 100, false, true, false), "CRITICAL never allowed");

    Expect(pw::orchestrator::CvssForSeverity(Severity::kCritical) == 9.0 &&
               pw::orchestrator::CvssForSeverity(Severity::kLow) == 3.0,
           "CVSS mapping");
    Expect(pw::orchestrator::ParseReportType("TREND") == ReportType::kTrend, "report type parsed");
    ExpectError([] { (void)pw::orchestrator::ParseReportType("WEEKLY"); }, pw::ErrorDomain::Validation,
                pw::errors::validation::kUnknownEnumName, "unknown report type");
  }

  void TestSignedInstallation() { // TSK173_Install_Pipeline
    TempDir root("pw_orch");
    const auto plugin = root.path() / "weather";
    WriteFile(plugin / "index.js",
              "const crypto = require('crypto');\n"
              "const digest = crypto.createHash('md5');\n"
              "const a = Math.random();\n"
              "const b = Math.random();\n"
              "const docs = 'http://example.com/docs';\n"
              "const help = 'http://example.org/help';\n");
    WriteManifest(plugin, "weather");

    SecurityServices services(MakeConfig(root));
    auto& orchestration = services.orchestration();
    const auto context = Context();
    const auto pki = MakePki();
    orchestration.AddTrustAnchor("corp", pki.root.certificate.ToPem(), TrustLevel::kEnterprise, context);
    Expect(orchestration.ListTrustAnchors().size() == 1, "anchor registered through the orchestrator");
    const auto signature =
        services.verifier().Sign(plugin, pki.leaf.certificate, pki.leaf.key, {pki.root.certificate});
    pw::trust::SignatureVerifier::WriteSignature(plugin / "plugin.json", signature);

    const auto result = orchestration.ProcessPluginInstallation("weather", plugin, context);
    Expect(result.allowed, "signed plugin with minor findings is allowed");
    Expect(result.score == 80, "score taken from static analysis");
    Expect(result.risk_level == RiskLevel::kLow, "no HIGH findings keeps risk LOW");
    Expect(result.trust_level == TrustLevel::kEnterprise, "trust taken from the anchor");
    Expect(result.verification && result.verification->valid, "signature verified");
    Expect(result.restrictions.empty(), "trusted LOW-risk plugin is unrestricted");
    Expect(CountSeverity(result.violations, Severity::kHigh) == 0 &&
               CountSeverity(result.violations, Severity::kCritical) == 0,
           "findings map to MEDIUM and LOW violations");
    Expect(result.sandbox_id.has_value(), "sandbox created for the allowed plugin");
    Expect(result.profile_version == 2, "assessment and sandbox binding are two commits");
    Expect(!result.recommendations.empty(), "analysis recommendations carried over");

    const auto profile = orchestration.GetSecurityProfile("weather");
    Expect(profile && profile->status == ProfileStatus::kActive &&
               profile->compliance == ProfileCompliance::kCompliant,
           "profile active and compliant");
    Expect(profile && profile->sandbox_id == result.sandbox_id && profile->history.size() == 1 &&
               profile->history[0].findings.size() == 5,
           "profile records the sandbox and one assessment");

    const auto installs = EventsFor(services, pw::audit::EventType::kPluginInstall, "weather");
    Expect(installs.size() == 1 && installs[0].severity == Severity::kInfo, "installation audited at INFO");
    Expect(!installs.empty() && std::find(installs[0].tags.begin(), installs[0].tags.end(), "sandboxed") !=
                                    installs[0].tags.end(),
           "installation tagged as sandboxed");

    // Runtime: allowed traffic is logged, a blocked write contains the sandbox.
    pw::security::Operation fetch;
    fetch.type = pw::security::OperationType::kNetworkConnect;
    fetch.target = "api.github.com";
    fetch.port = 443;
    auto outcome = orchestration.MonitorPluginExecution("weather", fetch, context);
    Expect(outcome.allowed && !outcome.violation, "allow-listed host reachable");
    Expect(EventsFor(services, pw::audit::EventType::kPluginExecution, "weather").size() == 1,
           "allowed operation audited");

    pw::security::Operation tamper;
    tamper.type = pw::security::OperationType::kFileWrite;
    tamper.target = "/etc/passwd";
    outcome = orchestration.MonitorPluginExecution("weather", tamper, context);
    Expect(!outcome.allowed && outcome.violation && outcome.violation->severity == Severity::kHigh,
           "write to a blocked path denied");
    auto box = services.framework().GetSandbox(*result.sandbox_id);
    Expect(box && box->state() == pw::sandbox::SandboxState::kTerminated, "HIGH denial isolates the sandbox");

    const auto updated = orchestration.GetSecurityProfile("weather");
    Expect(updated && updated->violations.size() == result.violations.size() + 1, "runtime violation appended");
    Expect(updated && updated->risk_level == RiskLevel::kMedium, "risk recomputed with the HIGH violation");
    Expect(updated && !updated->incident_ids.empty(), "incident linked to the profile");
    ExpectError([&] { (void)orchestration.MonitorPluginExecution("weather", fetch, context); },
                pw::ErrorDomain::State, pw::errors::state::kSandboxNotActive, "isolated sandbox refuses work");

    Expect(orchestration.UninstallPlugin("weather", context), "uninstall known plugin");
    Expect(!orchestration.UninstallPlugin("unknown", context), "uninstall unknown plugin");
    const auto retired = orchestration.GetSecurityProfile("weather");
    Expect(retired && retired->status == ProfileStatus::kRetired && !retired->allowed && !retired->sandbox_id,
           "profile retired");
    Expect(EventsFor(services, pw::audit::EventType::kPluginUninstall, "weather").size() == 1, "uninstall audited");
    Expect(!services.framework().GetSandbox(*result.sandbox_id), "uninstall releases the sandbox");
    ExpectError([&] { (void)orchestration.MonitorPluginExecution("weather", fetch, context); },
                pw::ErrorDomain::State, pw::errors::state::kSandboxNotFound, "retired plugin has no sandbox");

    orchestration.RemoveTrustAnchor("corp", context);
    ExpectError([&] { orchestration.RemoveTrustAnchor("corp", context); }, pw::ErrorDomain::State,
                pw::errors::state::kTrustAnchorNotFound, "anchor removed once");
  }

  void TestUnsignedInstallation() {
    TempDir root("pw_orch");
    const auto plugin = root.path() / "calc";
    WriteCleanPlugin(plugin, "calc");

    SecurityServices services(MakeConfig(root));
    auto& orchestration = services.orchestration();
    const auto context = Context();

    const auto first = orchestration.ProcessPluginInstallation("calc", plugin, context);
    Expect(first.allowed && first.score == 100, "unsigned plugin allowed while signatures are optional");
    Expect(first.trust_level == TrustLevel::kUntrusted, "unsigned plugin is untrusted");
    Expect(HasKind(first.violations, ViolationKind::kSignatureInvalid, Severity::kMedium),
           "missing signature is a MEDIUM violation");
    Expect(first.restrictions.size() == 1 && first.restrictions[0].type == RestrictionType::kFilesystem,
           "untrusted plugin kept off the sensitive roots");
    Expect(std::find(first.recommendations.begin(), first.recommendations.end(),
                     "Sign the plugin with a certificate chained to a registered trust anchor") !=
               first.recommendations.end(),
           "signing recommended");
    Expect(first.sandbox_id.has_value(), "sandbox created");

    // Re-assessment replaces the running sandbox.
    const auto second = orchestration.ProcessPluginInstallation("calc", plugin, context);
    Expect(second.sandbox_id && second.sandbox_id != first.sandbox_id, "new sandbox for the re-assessment");
    Expect(!services.framework().GetSandbox(*first.sandbox_id) && services.framework().ListSandboxes().size() == 1,
           "previous sandbox released");
    const auto profile = orchestration.GetSecurityProfile("calc");
    Expect(profile && profile->history.size() == 2 && profile->version == 4, "history kept across assessments");

    // Signatures become mandatory.
    auto config = orchestration.Configuration();
    config.runtime.policy = "no-such-policy";
    ExpectError([&] { orchestration.UpdateConfiguration(config, context); }, pw::ErrorDomain::State,
                pw::errors::state::kPolicyNotFound, "configuration must name a known policy");
    config.runtime.policy = std::string(pw::security::kDefaultPolicyId);
    config.signatures.require = true;
    orchestration.UpdateConfiguration(config, context);
    Expect(orchestration.Configuration().signatures.require, "configuration updated");
    pw::audit::EventFilter changes;
    changes.type = pw::audit::EventType::kConfigurationChange;
    Expect(services.audit().SearchEvents(changes).size() == 1, "configuration change audited");

    const auto denied = orchestration.ProcessPluginInstallation("calc", plugin, context);
    Expect(!denied.allowed && !denied.sandbox_id, "unsigned plugin denied once signatures are required");
    const auto denied_profile = orchestration.GetSecurityProfile("calc");
    Expect(denied_profile && denied_profile->status == ProfileStatus::kDenied &&
               denied_profile->compliance == ProfileCompliance::kNonCompliant && !denied_profile->sandbox_id,
           "denied profile");
    Expect(!services.framework().GetSandbox(*second.sandbox_id) && services.framework().ListSandboxes().empty(),
           "denial releases the running sandbox");

    config.signatures.require = false;
    config.signatures.allow_unsigned = false;
    orchestration.UpdateConfiguration(config, context);
    const auto strict = orchestration.ProcessPluginInstallation("calc", plugin, context);
    Expect(!strict.allowed && HasKind(strict.violations, ViolationKind::kSignatureInvalid, Severity::kCritical),
           "unsigned plugins are CRITICAL when not allowed");
    Expect(strict.risk_level == RiskLevel::kCritical, "CRITICAL violation sets CRITICAL risk");
  }

  void TestCriticalFindingDenied() {
    TempDir root("pw_orch");
    const auto plugin = root.path() / "runner";
    WriteFile(plugin / "run.js", "const value = eval(input);\n");
    WriteManifest(plugin, "runner");

    SecurityServices services(MakeConfig(root));
    auto& orchestration = services.orchestration();
    const auto result = orchestration.ProcessPluginInstallation("runner", plugin, Context());
    Expect(!result.allowed, "CRITICAL finding is never allowed");
    Expect(result.score == 75, "score still reported");
    Expect(result.risk_level == RiskLevel::kCritical, "CRITICAL risk");
    Expect(HasKind(result.violations, ViolationKind::kCodeInjection, Severity::kCritical),
           "finding surfaced as a CRITICAL violation");
    Expect(result.restrictions.size() == 2 && result.restrictions[0].type == RestrictionType::kNetwork &&
               result.restrictions[0].rule == "deny-all",
           "network denied and sensitive roots denied");
    Expect(!result.sandbox_id && services.framework().ListSandboxes().empty(), "no sandbox for a denied plugin");
    Expect(std::find(result.recommendations.begin(), result.recommendations.end(),
                     "Resolve HIGH and CRITICAL findings before deployment") != result.recommendations.end(),
           "remediation recommended");

    const auto installs = EventsFor(services, pw::audit::EventType::kPluginInstall, "runner");
    Expect(installs.size() == 1 && installs[0].severity == Severity::kHigh, "denial audited at HIGH");

    auto report = orchestration.GenerateSecurityReport(ReportType::kVulnerability);
    Expect(report.profiles.size() == 1 && !report.summary.critical_issues.empty(),
           "vulnerability report lists the CRITICAL finding");
    Expect(report.summary.overall_score == 75.0, "vulnerability score is the mean profile score");
  }

  void TestFailClosed() {
    TempDir root("pw_orch");
    const auto plugin = root.path() / "flaky";
    WriteCleanPlugin(plugin, "flaky");

    pw::orchestrator::ServiceHooks hooks;
    hooks.orchestration.before_assessment = [](const std::string& id) {
      throw std::runtime_error("analysis backend unavailable for " + id);
    };
    SecurityServices services(MakeConfig(root), hooks);
    auto& orchestration = services.orchestration();
    const auto result = orchestration.ProcessPluginInstallation("flaky", plugin, Context());
    Expect(!result.allowed && !result.sandbox_id, "pipeline failure denies the installation");
    Expect(result.violations.size() == 1 && result.violations[0].kind == ViolationKind::kInternalError &&
               result.violations[0].severity == Severity::kHigh,
           "synthetic HIGH violation");
    const auto profile = orchestration.GetSecurityProfile("flaky");
    Expect(profile && profile->status == ProfileStatus::kDenied && profile->history.size() == 1,
           "denial committed to the profile");
    const auto installs = EventsFor(services, pw::audit::EventType::kPluginInstall, "flaky");
    Expect(installs.size() == 1 && installs[0].severity == Severity::kHigh, "failure audited");
  }

  void TestProfileCompareAndSet() { // TSK174_Profile_CAS
    TempDir root("pw_orch");
    const auto plugin = root.path() / "notes";
    WriteCleanPlugin(plugin, "notes");
    auto config = MakeConfig(root);
    config.runtime.enabled = false;

    SecurityServices services(config);
    auto& orchestration = services.orchestration();
    const auto result = orchestration.ProcessPluginInstallation("notes", plugin, Context());
    Expect(result.allowed && !result.sandbox_id, "runtime disabled skips the sandbox");
    Expect(result.profile_version == 1, "single commit");

    auto profile = *orchestration.GetSecurityProfile("notes");
    profile.security_score = 42;
    ExpectError([&] { (void)orchestration.UpdateSecurityProfile(profile, profile.version + 1); },
                pw::ErrorDomain::State, pw::errors::state::kProfileConflict, "stale version rejected");
    Expect(orchestration.UpdateSecurityProfile(profile, profile.version) == 2, "matching version commits");
    Expect(orchestration.GetSecurityProfile("notes")->security_score == 42, "committed value visible");

    pw::orchestrator::PluginSecurityProfile fresh;
    fresh.plugin_id = "brand-new";
    ExpectError([&] { (void)orchestration.UpdateSecurityProfile(fresh, 3); }, pw::ErrorDomain::State,
                pw::errors::state::kProfileConflict, "new profile must expect version 0");
    Expect(orchestration.UpdateSecurityProfile(fresh, 0) == 1, "new profile created");
    Expect(orchestration.ListSecurityProfiles().size() == 2, "two profiles stored");
  }

  void TestReports() {
    TempDir root("pw_orch");
    const auto plugin = root.path() / "clock";
    WriteCleanPlugin(plugin, "clock");
    auto config = MakeConfig(root);
    config.runtime.enabled = false;

    SecurityServices services(config);
    auto& orchestration = services.orchestration();
    (void)orchestration.ProcessPluginInstallation("clock", plugin, Context());

    const auto compliance = orchestration.GenerateSecurityReport(ReportType::kCompliance);
    Expect(compliance.compliance.size() == 2, "one report per configured framework");
    Expect(compliance.profiles.empty() && compliance.incidents.empty(), "compliance report is scoped");

    const auto trend = orchestration.GenerateSecurityReport(ReportType::kTrend);
    Expect(trend.summary.risk_trend == pw::orchestrator::RiskTrend::kStable && trend.daily_high_events.empty(),
           "no HIGH events gives a stable trend");

    const auto executive = orchestration.GenerateSecurityReport(ReportType::kExecutive);
    Expect(executive.profiles.size() == 1 && executive.compliance.size() == 2, "executive report covers all areas");
    Expect(executive.summary.overall_score > 0.0 && executive.summary.overall_score <= 100.0, "score bounded");

    const auto exported = orchestration.ExportData(pw::audit::ExportKind::kEvents, pw::audit::ExportFormat::kJson);
    Expect(exported.find("PLUGIN_INSTALL") != std::string::npos, "installation exported");
    Expect(orchestration.ApplyAuditRetention() == 0, "fresh events survive retention");
  }

} // namespace

int main() {
  TestPureDecisions();
  TestSignedInstallation();
  TestUnsignedInstallation();
  TestCriticalFindingDenied();
  TestFailClosed();
  TestProfileCompareAndSet();
  TestReports();
  return pw::test::Finish("orchestration");
}

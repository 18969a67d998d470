#include "pw/orchestrator/config.h" // TSK170_Orchestration_Config

#include <chrono>
#include <string>

#include "test_support.h"

namespace {

  using pw::orchestrator::LoadOrchestrationConfig;
  using pw::orchestrator::ParseOrchestrationConfig;
  using pw::test::Expect;
  using pw::test::ExpectError;

  void TestDefaults() {
    const auto config = ParseOrchestrationConfig("");
    Expect(config.static_analysis.enabled && config.static_analysis.strict_mode, "analysis on and strict");
    Expect(config.static_analysis.timeout == std::chrono::minutes(5), "analysis timeout 5 min");
    Expect(config.static_analysis.max_file_size == 10u * 1024u * 1024u, "10 MiB file cap");
    Expect(config.runtime.enabled && config.runtime.auto_isolate, "runtime isolation on");
    Expect(config.runtime.policy == "default-security-policy", "default policy id");
    Expect(!config.signatures.require && config.signatures.allow_unsigned, "unsigned tolerated by default");
    Expect(config.auditing.retention_days == 365, "one year retention");
    Expect(config.compliance_frameworks.size() == 2, "ISO27001 and SOC2 by default");
    Expect(config.incident_response.escalation_threshold == 3, "three correlated events");
    Expect(config.threat_detection.interval == std::chrono::seconds(30), "detection every 30 s");
  }

  void TestParseValues() {
    const auto config = ParseOrchestrationConfig(
        "# deployment overrides\n"
        "\n"
        "static_analysis.strict_mode = false\n"
        "static_analysis.timeout_ms=1500\n"
        "runtime.interpreter=/bin/sh -c\n"
        "runtime.memory_limit=268435456\n"
        "runtime.max_processes=0\n"
        "runtime.monitoring=off\n"
        "signatures.require=yes\r\n"
        "compliance.frameworks=GDPR, NIST\n"
        "incident_response.escalation_threshold=5\n"
        "anchor.corp=ENTERPRISE:/etc/pw/corp-root.pem\n"
        "crl=/etc/pw/a.crl\n"
        "crl=/etc/pw/b.crl\n");
    Expect(!config.static_analysis.strict_mode, "bool false");
    Expect(config.static_analysis.timeout == std::chrono::milliseconds(1500), "millis");
    Expect(config.runtime.sandbox.interpreter.size() == 2 && config.runtime.sandbox.interpreter[0] == "/bin/sh" &&
               config.runtime.sandbox.interpreter[1] == "-c",
           "interpreter split on spaces");
    Expect(config.runtime.sandbox.memory.limit_bytes == 268435456ull, "memory limit");
    Expect(config.runtime.sandbox.max_processes == 0, "process limit may be disabled");
    Expect(!config.runtime.sandbox.monitoring.enabled, "monitoring off");
    Expect(config.signatures.require, "CRLF tolerated");
    Expect(config.compliance_frameworks.size() == 2 &&
               config.compliance_frameworks[0] == pw::audit::ComplianceFramework::kGdpr &&
               config.compliance_frameworks[1] == pw::audit::ComplianceFramework::kNist,
           "framework list");
    Expect(config.incident_response.escalation_threshold == 5, "threshold");
    Expect(config.anchors.size() == 1 && config.anchors[0].name == "corp" &&
               config.anchors[0].level == pw::TrustLevel::kEnterprise &&
               config.anchors[0].pem == "/etc/pw/corp-root.pem",
           "anchor entry");
    Expect(config.crls.size() == 2, "crl is repeatable");
  }

  void TestRejections() {
    ExpectError([] { (void)ParseOrchestrationConfig("static_analysis.enabled"); }, pw::ErrorDomain::Config,
                pw::errors::config::kMalformedLine, "line without '='");
    ExpectError([] { (void)ParseOrchestrationConfig("runtime.colour=blue"); }, pw::ErrorDomain::Config,
                pw::errors::config::kUnknownKey, "unknown key");
    ExpectError([] { (void)ParseOrchestrationConfig("runtime.enabled=true\nruntime.enabled=false"); },
                pw::ErrorDomain::Config, pw::errors::config::kDuplicateKey, "duplicate key");
    ExpectError([] { (void)ParseOrchestrationConfig("runtime.enabled=maybe"); }, pw::ErrorDomain::Config,
                pw::errors::config::kInvalidValue, "bad bool");
    ExpectError([] { (void)ParseOrchestrationConfig("runtime.memory_limit=-1"); }, pw::ErrorDomain::Config,
                pw::errors::config::kInvalidValue, "negative size");
    ExpectError([] { (void)ParseOrchestrationConfig("compliance.frameworks=ISO27001,FOO"); },
                pw::ErrorDomain::Config, pw::errors::config::kInvalidValue, "unknown framework");
    ExpectError([] { (void)ParseOrchestrationConfig("anchor.corp=ROOT:/x.pem"); }, pw::ErrorDomain::Config,
                pw::errors::config::kInvalidValue, "unknown trust level");
    ExpectError([] { (void)ParseOrchestrationConfig("incident_response.escalation_threshold=0"); },
                pw::ErrorDomain::Config, pw::errors::config::kInvalidValue, "zero threshold");
  }

  void TestLoadResolvesRelativePaths() {
    pw::test::TempDir dir("pw_config");
    const auto file = dir.path() / "pw.conf";
    pw::test::WriteFile(file, "anchor.local=HIGH:certs/root.pem\ncrl=revoked.crl\nauditing.log=logs/audit.log\n");
    const auto config = LoadOrchestrationConfig(file);
    Expect(config.anchors.size() == 1 && config.anchors[0].pem == dir.path() / "certs/root.pem",
           "anchor resolved against the config directory");
    Expect(config.crls.size() == 1 && config.crls[0] == dir.path() / "revoked.crl", "crl resolved");
    Expect(config.auditing.log == dir.path() / "logs/audit.log", "log resolved");
    ExpectError([&] { (void)LoadOrchestrationConfig(dir.path() / "absent.conf"); }, pw::ErrorDomain::Config,
                pw::errors::config::kFileMissing, "missing file");
  }

} // namespace

int main() {
  TestDefaults();
  TestParseValues();
  TestRejections();
  TestLoadResolvesRelativePaths();
  return pw::test::Finish("config");
}

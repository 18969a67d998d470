#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "pw/audit/compliance.h"
#include "pw/sandbox/sandbox.h"
#include "pw/security/policy.h"
#include "pw/types.h"

namespace pw::orchestrator {

struct StaticAnalysisSettings {
  bool enabled{true};
  std::chrono::milliseconds timeout{300000};
  std::uintmax_t max_file_size{10u * 1024u * 1024u};
  bool strict_mode{true};  // deny scores below 50
  bool include_tests{false};
  int max_depth{10};
};

struct RuntimeSettings {
  bool enabled{true};
  bool auto_isolate{true};
  std::string policy{std::string(security::kDefaultPolicyId)};
  sandbox::SandboxConfig sandbox;
};

struct SignatureSettings {
  bool enabled{true};
  bool require{false};
  bool allow_unsigned{true};
};

struct AuditSettings {
  bool enabled{true};
  int retention_days{365};
  std::filesystem::path log;  // empty: no durable log
};

struct ThreatDetectionSettings {
  bool enabled{true};
  std::chrono::milliseconds interval{30000};
};

struct IncidentResponseSettings {
  bool enabled{true};
  std::size_t escalation_threshold{3};  // correlated events that open an incident
};

struct AnchorSetting {
  std::string name;
  TrustLevel level{TrustLevel::kUntrusted};
  std::filesystem::path pem;
};

struct OrchestrationConfig {
  StaticAnalysisSettings static_analysis;
  RuntimeSettings runtime;
  SignatureSettings signatures;
  AuditSettings auditing;
  std::vector<audit::ComplianceFramework> compliance_frameworks{audit::ComplianceFramework::kIso27001,
                                                                audit::ComplianceFramework::kSoc2};
  ThreatDetectionSettings threat_detection;
  IncidentResponseSettings incident_response;
  std::vector<AnchorSetting> anchors;
  std::vector<std::filesystem::path> crls;
};

// TSK170_Orchestration_Config
// Line-oriented key=value text. '#' starts a comment line; blank lines are
// skipped. Throws pw::Error(Config) for malformed lines, unknown or repeated
// keys (crl excepted) and values that do not parse.
OrchestrationConfig ParseOrchestrationConfig(std::string_view text);

// Relative anchor and CRL paths resolve against the file's directory.
// Throws pw::Error(Config, kFileMissing) when |path| does not exist.
OrchestrationConfig LoadOrchestrationConfig(const std::filesystem::path& path);

} // namespace pw::orchestrator

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "pw/analysis/code_analyzer.h"
#include "pw/audit/compliance.h"
#include "pw/sandbox/sandbox.h"
#include "pw/security/policy.h"
#include "pw/trust/signature_verifier.h"
#include "pw/types.h"

namespace pw::orchestrator {
class EventBus;
}

namespace pw::audit {
class AuditSystem;
}

namespace pw::security {

enum class ViolationKind : std::uint8_t {
  kPermissionDenied,
  kResourceLimit,
  kCodeInjection,
  kNetworkBlocked,
  kFilesystemViolation,
  kVulnerableDependency,
  kSignatureInvalid,
  kSandboxViolation,
  kInternalError
};

std::string_view ToString(ViolationKind kind) noexcept;

struct PolicyViolation {
  std::string id;
  ViolationKind kind{ViolationKind::kPermissionDenied};
  Severity severity{Severity::kMedium};
  std::string description;
  TimePoint timestamp{};
  std::string plugin_id;
  std::string sandbox_id;
  SecurityContext context;
  std::map<std::string, std::string> details;
  bool blocked{false};  // CRITICAL and HIGH
};

enum class OperationType : std::uint8_t {
  kFileRead,
  kFileWrite,
  kNetworkConnect,
  kProcessSpawn,
  kDataQuery,
  kPermissionUse
};

std::string_view ToString(OperationType type) noexcept;
OperationType ParseOperationType(std::string_view name);

// One plugin operation presented for runtime monitoring. |target| is the
// path, host, executable, table or permission the operation acts on.
struct Operation {
  OperationType type{OperationType::kFileRead};
  std::string target;
  std::uint16_t port{0};
  std::string database;
  std::uint64_t bytes{0};
  std::chrono::milliseconds duration{0};
};

struct MonitorResult {
  bool allowed{true};
  std::optional<PolicyViolation> violation;
};

// Inputs of pre-execution validation. Missing analysis or verification
// results skip the corresponding check.
struct ValidationRequest {
  std::string plugin_id;
  std::string policy_id{std::string(kDefaultPolicyId)};
  const analysis::AnalysisResult* analysis{nullptr};
  const trust::VerificationResult* verification{nullptr};
  std::vector<std::string> requested_permissions;
  std::uint64_t requested_memory{0};
  std::chrono::milliseconds requested_cpu_time{0};
  std::uint32_t requested_processes{0};
  bool unsigned_allowed{true};
  SecurityContext context;
};

struct ValidationResult {
  bool valid{true};  // no CRITICAL or HIGH violation
  std::vector<PolicyViolation> violations;
};

struct FrameworkMetrics {
  std::uint64_t total_violations{0};
  std::uint64_t blocked_requests{0};
  std::uint64_t sandbox_violations{0};
  std::uint64_t resource_exhaustions{0};
  std::uint64_t suspicious_activities{0};
  double compliance_score{100.0};
  TimePoint last_assessment{};
};

enum class FrameworkCompliance : std::uint8_t { kCompliant, kRequiresAttention, kNonCompliant };

std::string_view ToString(FrameworkCompliance status) noexcept;

struct FrameworkReport {
  audit::DateRange period;
  FrameworkMetrics metrics;
  std::vector<PolicyViolation> violations;
  std::map<ViolationKind, std::uint64_t> by_kind;
  std::map<Severity, std::uint64_t> by_severity;
  double compliance_score{100.0};
  FrameworkCompliance status{FrameworkCompliance::kCompliant};
  std::vector<std::string> recommendations;
};

struct FrameworkOptions {
  bool auto_isolate{true};  // contain CRITICAL/HIGH violations by stopping the sandbox
  bool incident_response{true};
  std::chrono::milliseconds detection_interval{30000};  // 0 disables the background pass
  std::chrono::seconds activity_window{60};
  std::size_t denial_threshold{5};
  std::size_t burst_threshold{100};
  std::uint64_t exfiltration_bytes{10ull * 1024 * 1024};
  std::size_t operation_history{1000};
};

// Tightening applied on top of the policy when a sandbox is created.
struct SandboxRestrictions {
  bool deny_network{false};
  std::vector<std::filesystem::path> blocked_paths;
};

struct FrameworkHooks { // TSK160_Framework_Test_Seams
  std::function<TimePoint()> now;
  sandbox::SandboxHooks sandbox;
};

struct SandboxInfo {
  std::string id;
  std::string plugin_id;
  std::string policy_id;
  std::uint64_t policy_version{0};
  sandbox::SandboxState state{sandbox::SandboxState::kCreated};
  TimePoint started_at{};
  TimePoint last_activity{};
};

// Policy engine. Owns the policy store and every sandbox it creates.
class SecurityFramework {
 public:
  SecurityFramework(orchestrator::EventBus& bus, audit::AuditSystem& audit, FrameworkOptions options = {},
                    FrameworkHooks hooks = {});
  ~SecurityFramework();
  SecurityFramework(const SecurityFramework&) = delete;
  SecurityFramework& operator=(const SecurityFramework&) = delete;

  PolicySnapshot RegisterPolicy(SecurityPolicy policy);
  PolicySnapshot UpdatePolicy(SecurityPolicy policy);
  PolicySnapshot GetPolicy(const std::string& id) const;
  std::vector<PolicySnapshot> ListPolicies() const;

  // Phase 1. Aggregates static analysis, dependency, permission, resource
  // and signature checks; invalid only on CRITICAL or HIGH findings.
  ValidationResult ValidatePluginForExecution(const ValidationRequest& request);

  // Phase 2. |base| supplies the limits the policy does not constrain.
  // Throws State kPolicyNotFound and State kSandboxStartFailed.
  std::string CreateSecureSandbox(const std::string& plugin_id, const std::string& policy_id,
                                  const SecurityContext& context, sandbox::SandboxConfig base,
                                  const SandboxRestrictions& restrictions = {});

  // Phase 3. Policy check first, then resource check; resource overruns
  // throttle but stay allowed. Throws State kSandboxNotFound.
  MonitorResult MonitorPluginExecution(const std::string& sandbox_id, const Operation& operation,
                                       const SecurityContext& context);

  // Phase 4. Behaviour, attack-signature and exfiltration checks over the
  // sandbox's operations since the previous pass.
  std::vector<PolicyViolation> DetectSuspiciousActivity(const std::string& sandbox_id,
                                                        const SecurityContext& context);

  // Phase 5. Records |violation|; CRITICAL and HIGH ones are contained,
  // announced and turned into an incident.
  void HandleSecurityViolation(const PolicyViolation& violation);

  FrameworkReport GenerateSecurityReport(const audit::DateRange& period);

  std::shared_ptr<sandbox::Sandbox> GetSandbox(const std::string& sandbox_id) const;
  std::vector<SandboxInfo> ListSandboxes() const;
  // Returns false when the id is unknown. The stopped sandbox stays listed
  // until it is released or its plugin gets a new sandbox.
  bool StopSandbox(const std::string& sandbox_id);
  // Stops the sandbox and forgets it. Returns false when the id is unknown.
  bool ReleaseSandbox(const std::string& sandbox_id);
  void StopAll() noexcept;

  FrameworkMetrics Metrics() const;
  std::vector<PolicyViolation> Violations() const;

 private:
  struct OperationRecord {
    Operation operation;
    TimePoint at{};
    bool denied{false};
    bool sensitive{false};
  };

  struct ManagedSandbox {
    std::shared_ptr<sandbox::Sandbox> sandbox;
    std::string plugin_id;
    PolicySnapshot policy;
    TimePoint started_at{};
    TimePoint last_activity{};
    std::deque<OperationRecord> operations;
    std::size_t scanned{0};  // operations already seen by DetectSuspiciousActivity
    std::uint32_t processes_spawned{0};
    std::uint64_t bytes_written{0};
  };

  TimePoint Now() const;
  PolicyViolation MakeViolation(ViolationKind kind, Severity severity, std::string description,
                                const std::string& plugin_id, const std::string& sandbox_id,
                                const SecurityContext& context) const;
  // Empty when allowed, otherwise the reason.
  std::string CheckPolicy(const SecurityPolicy& policy, const ManagedSandbox& managed,
                          const Operation& operation) const;
  std::string CheckResources(const SecurityPolicy& policy, const ManagedSandbox& managed,
                             const Operation& operation) const;
  void RecordViolation(const PolicyViolation& violation);
  void OnSandboxViolation(const sandbox::SecurityViolation& violation);
  void DetectionLoop();

  orchestrator::EventBus& bus_;
  audit::AuditSystem& audit_;
  const FrameworkOptions options_;
  FrameworkHooks hooks_;
  PolicyStore policies_;

  mutable std::mutex mutex_;
  std::map<std::string, ManagedSandbox> sandboxes_;
  std::vector<PolicyViolation> violations_;
  FrameworkMetrics metrics_;

  std::thread detection_thread_;
  std::mutex detection_mutex_;
  std::condition_variable detection_cv_;
  bool detection_stop_{false};
};

} // namespace pw::security

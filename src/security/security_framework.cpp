#include "pw/security/security_framework.h"

#include <algorithm>
#include <iostream>
#include <regex>
#include <set>

#include "pw/audit/audit_system.h"
#include "pw/error.h"
#include "pw/errors.h"
#include "pw/orchestrator/event_bus.h"

namespace pw::security {

namespace {

struct AttackSignature {
  std::string_view name;
  std::regex pattern;
};

const std::vector<AttackSignature>& AttackSignatures() {
  static const std::vector<AttackSignature> kSignatures = [] {
    const auto flags = std::regex::ECMAScript | std::regex::icase;
    std::vector<AttackSignature> out;
    out.push_back({"path-traversal", std::regex(R"(\.\./)", flags)});
    out.push_back({"credential-file", std::regex(R"(/etc/(passwd|shadow|sudoers))", flags)});
    out.push_back({"sql-union", std::regex(R"(union\s+(all\s+)?select)", flags)});
    out.push_back({"sql-tautology", std::regex(R"('\s*or\s*'?1'?\s*=\s*'?1)", flags)});
    out.push_back({"sql-drop", std::regex(R"(;\s*drop\s+table)", flags)});
    out.push_back({"shell-chain", std::regex(R"((;|&&|\|)\s*(rm|curl|wget|nc|bash|sh)\b)", flags)});
    out.push_back({"command-substitution", std::regex(R"(\$\(|`)", flags)});
    out.push_back({"script-injection", std::regex(R"(<script)", flags)});
    out.push_back({"metadata-endpoint", std::regex(R"(169\.254\.169\.254)", flags)});
    return out;
  }();
  return kSignatures;
}

bool Contains(const std::vector<std::string>& values, std::string_view value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

orchestrator::EventSeverity BusSeverity(Severity severity) noexcept {
  switch (severity) {
  case Severity::kCritical:
    return orchestrator::EventSeverity::kCritical;
  case Severity::kHigh:
    return orchestrator::EventSeverity::kError;
  case Severity::kMedium:
    return orchestrator::EventSeverity::kWarning;
  case Severity::kLow:
  case Severity::kInfo:
    return orchestrator::EventSeverity::kInfo;
  }
  return orchestrator::EventSeverity::kInfo;
}

ViolationKind KindFor(sandbox::ViolationType type) noexcept {
  switch (type) {
  case sandbox::ViolationType::kResourceExhaustion:
    return ViolationKind::kResourceLimit;
  case sandbox::ViolationType::kNetworkViolation:
    return ViolationKind::kNetworkBlocked;
  case sandbox::ViolationType::kFilesystemViolation:
    return ViolationKind::kFilesystemViolation;
  case sandbox::ViolationType::kCodeInjection:
    return ViolationKind::kCodeInjection;
  case sandbox::ViolationType::kPermissionDenied:
    return ViolationKind::kPermissionDenied;
  case sandbox::ViolationType::kProcessViolation:
  case sandbox::ViolationType::kUnitFailure:
    return ViolationKind::kSandboxViolation;
  }
  return ViolationKind::kSandboxViolation;
}

audit::EventType AuditTypeFor(const PolicyViolation& violation) {
  auto signal = violation.details.find("signal");
  if (signal != violation.details.end()) {
    if (signal->second == "exfiltration") {
      return audit::EventType::kDataExfiltration;
    }
    return audit::EventType::kSuspiciousActivity;
  }
  switch (violation.kind) {
  case ViolationKind::kPermissionDenied:
    return audit::EventType::kPermissionDenied;
  case ViolationKind::kResourceLimit:
  case ViolationKind::kSandboxViolation:
    return audit::EventType::kRuntimeViolation;
  case ViolationKind::kNetworkBlocked:
  case ViolationKind::kFilesystemViolation:
    return audit::EventType::kPolicyViolation;
  default:
    return audit::EventType::kSecurityViolation;
  }
}

std::vector<std::string> RecommendationsFor(ViolationKind kind) {
  switch (kind) {
  case ViolationKind::kCodeInjection:
    return {"Review and strengthen input validation mechanisms",
            "Implement code signing verification for all plugins"};
  case ViolationKind::kResourceLimit:
    return {"Optimize plugin resource usage or increase limits",
            "Implement better resource monitoring and alerting"};
  case ViolationKind::kPermissionDenied:
    return {"Review and update plugin permission requirements", "Implement principle of least privilege"};
  case ViolationKind::kNetworkBlocked:
    return {"Restrict plugin network destinations to an explicit allow list"};
  case ViolationKind::kFilesystemViolation:
    return {"Confine plugin file access to the sandbox workspace"};
  case ViolationKind::kVulnerableDependency:
    return {"Upgrade vulnerable dependencies and pin exact versions"};
  case ViolationKind::kSignatureInvalid:
    return {"Sign plugins with a certificate issued by a registered trust anchor"};
  case ViolationKind::kSandboxViolation:
    return {"Investigate sandbox violations and tighten the sandbox configuration"};
  case ViolationKind::kInternalError:
    return {"Investigate internal failures of the security pipeline"};
  }
  return {};
}

} // namespace

std::string_view ToString(ViolationKind kind) noexcept {
  switch (kind) {
  case ViolationKind::kPermissionDenied:
    return "PERMISSION_DENIED";
  case ViolationKind::kResourceLimit:
    return "RESOURCE_LIMIT";
  case ViolationKind::kCodeInjection:
    return "CODE_INJECTION";
  case ViolationKind::kNetworkBlocked:
    return "NETWORK_BLOCKED";
  case ViolationKind::kFilesystemViolation:
    return "FILESYSTEM_VIOLATION";
  case ViolationKind::kVulnerableDependency:
    return "VULNERABLE_DEPENDENCY";
  case ViolationKind::kSignatureInvalid:
    return "SIGNATURE_INVALID";
  case ViolationKind::kSandboxViolation:
    return "SANDBOX_VIOLATION";
  case ViolationKind::kInternalError:
    return "INTERNAL_ERROR";
  }
  return "PERMISSION_DENIED";
}

std::string_view ToString(OperationType type) noexcept {
  switch (type) {
  case OperationType::kFileRead:
    return "FILE_READ";
  case OperationType::kFileWrite:
    return "FILE_WRITE";
  case OperationType::kNetworkConnect:
    return "NETWORK_CONNECT";
  case OperationType::kProcessSpawn:
    return "PROCESS_SPAWN";
  case OperationType::kDataQuery:
    return "DATA_QUERY";
  case OperationType::kPermissionUse:
    return "PERMISSION_USE";
  }
  return "FILE_READ";
}

OperationType ParseOperationType(std::string_view name) {
  for (auto candidate : {OperationType::kFileRead, OperationType::kFileWrite, OperationType::kNetworkConnect,
                         OperationType::kProcessSpawn, OperationType::kDataQuery, OperationType::kPermissionUse}) {
    if (ToString(candidate) == name) {
      return candidate;
    }
  }
  throw Error(ErrorDomain::Validation, errors::validation::kUnknownEnumName,
              "Unknown operation type: " + std::string(name));
}

std::string_view ToString(FrameworkCompliance status) noexcept {
  switch (status) {
  case FrameworkCompliance::kCompliant:
    return "COMPLIANT";
  case FrameworkCompliance::kRequiresAttention:
    return "REQUIRES_ATTENTION";
  case FrameworkCompliance::kNonCompliant:
    return "NON_COMPLIANT";
  }
  return "NON_COMPLIANT";
}

SecurityFramework::SecurityFramework(orchestrator::EventBus& bus, audit::AuditSystem& audit,
                                     FrameworkOptions options, FrameworkHooks hooks)
    : bus_(bus), audit_(audit), options_(std::move(options)), hooks_(std::move(hooks)) {
  metrics_.last_assessment = Now();
  if (options_.detection_interval.count() > 0) {
    detection_thread_ = std::thread([this]() { DetectionLoop(); });
  }
}

SecurityFramework::~SecurityFramework() {
  {
    std::lock_guard<std::mutex> guard(detection_mutex_);
    detection_stop_ = true;
  }
  detection_cv_.notify_all();
  if (detection_thread_.joinable()) {
    detection_thread_.join();
  }
  StopAll();
}

TimePoint SecurityFramework::Now() const {
  return hooks_.now ? hooks_.now() : Clock::now();
}

PolicySnapshot SecurityFramework::RegisterPolicy(SecurityPolicy policy) {
  return policies_.Register(std::move(policy));
}

PolicySnapshot SecurityFramework::UpdatePolicy(SecurityPolicy policy) {
  auto snapshot = policies_.Update(std::move(policy));
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kLifecycle;
  event.event_id = "policy_updated";
  event.message = "Security policy updated";
  event.fields.emplace_back("policy_id", snapshot->id);
  event.fields.emplace_back("version", std::to_string(snapshot->version), orchestrator::FieldPrivacy::kPublic,
                            true);
  bus_.Publish(event);
  return snapshot;
}

PolicySnapshot SecurityFramework::GetPolicy(const std::string& id) const {
  return policies_.Get(id);
}

std::vector<PolicySnapshot> SecurityFramework::ListPolicies() const {
  return policies_.List();
}

PolicyViolation SecurityFramework::MakeViolation(ViolationKind kind, Severity severity, std::string description,
                                                 const std::string& plugin_id, const std::string& sandbox_id,
                                                 const SecurityContext& context) const {
  PolicyViolation violation;
  violation.id = MakeId("vio");
  violation.kind = kind;
  violation.severity = severity;
  violation.description = std::move(description);
  violation.timestamp = Now();
  violation.plugin_id = plugin_id;
  violation.sandbox_id = sandbox_id;
  violation.context = context;
  violation.blocked = severity >= Severity::kHigh;
  return violation;
}

void SecurityFramework::RecordViolation(const PolicyViolation& violation) {
  {
    std::lock_guard<std::mutex> guard(mutex_);
    violations_.push_back(violation);
    ++metrics_.total_violations;
    if (violation.blocked) {
      ++metrics_.blocked_requests;
    }
    if (violation.kind == ViolationKind::kResourceLimit) {
      ++metrics_.resource_exhaustions;
    }
    if (violation.details.count("sandbox_violation") != 0) {
      ++metrics_.sandbox_violations;
    }
  }
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kSecurity;
  event.severity = BusSeverity(violation.severity);
  event.event_id = "policy_violation";
  event.message = violation.description;
  event.fields.emplace_back("violation_id", violation.id);
  event.fields.emplace_back("kind", std::string(ToString(violation.kind)));
  event.fields.emplace_back("severity", std::string(ToString(violation.severity)));
  event.fields.emplace_back("plugin_id", violation.plugin_id);
  if (!violation.sandbox_id.empty()) {
    event.fields.emplace_back("sandbox_id", violation.sandbox_id);
  }
  event.fields.emplace_back("blocked", violation.blocked ? "true" : "false");
  try {
    bus_.Publish(event);
  } catch (const std::exception& ex) {
    std::clog << "[security] violation event not published: " << ex.what() << std::endl;
  }
}

ValidationResult SecurityFramework::ValidatePluginForExecution(const ValidationRequest& request) {
  const auto policy = policies_.Get(request.policy_id);
  ValidationResult result;
  auto add = [&](ViolationKind kind, Severity severity, std::string description,
                 std::map<std::string, std::string> details) {
    auto violation =
        MakeViolation(kind, severity, std::move(description), request.plugin_id, {}, request.context);
    violation.details = std::move(details);
    violation.details.emplace("phase", "pre-execution");
    result.violations.push_back(std::move(violation));
  };

  // Static analysis and dependency scan.
  if (request.analysis) {
    const auto& analysis = *request.analysis;
    if (analysis.status != analysis::AnalysisStatus::kCompleted) {
      add(ViolationKind::kCodeInjection, Severity::kHigh,
          "Static analysis did not complete (" + std::string(analysis::ToString(analysis.status)) +
              (analysis.error.empty() ? "" : ": " + analysis.error) + ")",
          {{"status", std::string(analysis::ToString(analysis.status))}});
    }
    for (const auto& finding : analysis.vulnerabilities) {
      const auto kind = finding.pass == analysis::DetectionPass::kDependency ? ViolationKind::kVulnerableDependency
                                                                            : ViolationKind::kCodeInjection;
      add(kind, finding.severity,
          finding.title + " (" + finding.file + ":" + std::to_string(finding.line) + ")",
          {{"finding_id", finding.id},
           {"type", std::string(analysis::ToString(finding.type))},
           {"cwe", finding.cwe},
           {"file", finding.file},
           {"line", std::to_string(finding.line)},
           {"pass", std::string(analysis::ToString(finding.pass))}});
    }
  }

  // Permissions against the policy grant.
  for (const auto& permission : request.requested_permissions) {
    if (!Contains(policy->permissions, permission)) {
      add(ViolationKind::kPermissionDenied, Severity::kHigh,
          "Permission '" + permission + "' is not granted by policy " + policy->id, {{"permission", permission}});
    }
  }

  // Resource requirements.
  const auto& execution = policy->execution;
  if (request.requested_memory > execution.max_memory) {
    add(ViolationKind::kResourceLimit, Severity::kMedium,
        "Requested memory " + std::to_string(request.requested_memory) + " exceeds policy limit " +
            std::to_string(execution.max_memory),
        {{"resource", "memory"}});
  }
  if (request.requested_cpu_time > execution.max_cpu_time) {
    add(ViolationKind::kResourceLimit, Severity::kMedium,
        "Requested CPU time " + std::to_string(request.requested_cpu_time.count()) + " ms exceeds policy limit " +
            std::to_string(execution.max_cpu_time.count()) + " ms",
        {{"resource", "cpu"}});
  }
  if (request.requested_processes > execution.max_processes) {
    add(ViolationKind::kResourceLimit, Severity::kMedium,
        "Requested " + std::to_string(request.requested_processes) + " processes, policy allows " +
            std::to_string(execution.max_processes),
        {{"resource", "processes"}});
  }

  // Signature.
  if (request.verification && !request.verification->valid) {
    const auto& verification = *request.verification;
    const bool unsigned_plugin = verification.manifest && !verification.manifest->signature;
    for (const auto& issue : verification.errors) {
      Severity severity = issue.severity == trust::IssueSeverity::kFatal ? Severity::kHigh : Severity::kMedium;
      if (unsigned_plugin) {
        severity = request.unsigned_allowed ? Severity::kMedium : Severity::kCritical;
      }
      add(ViolationKind::kSignatureInvalid, severity, issue.message,
          {{"code", std::string(trust::ToString(issue.code))},
           {"severity", std::string(trust::ToString(issue.severity))}});
    }
  }

  result.valid = std::none_of(result.violations.begin(), result.violations.end(),
                              [](const PolicyViolation& v) { return v.severity >= Severity::kHigh; });
  for (const auto& violation : result.violations) {
    RecordViolation(violation);
  }

  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kSecurity;
  event.severity = result.valid ? orchestrator::EventSeverity::kInfo : orchestrator::EventSeverity::kWarning;
  event.event_id = "plugin_validated";
  event.message = result.valid ? "Plugin passed pre-execution validation" : "Plugin failed pre-execution validation";
  event.fields.emplace_back("plugin_id", request.plugin_id);
  event.fields.emplace_back("violations", std::to_string(result.violations.size()),
                            orchestrator::FieldPrivacy::kPublic, true);
  bus_.Publish(event);
  return result;
}

std::string SecurityFramework::CreateSecureSandbox(const std::string& plugin_id, const std::string& policy_id,
                                                   const SecurityContext& context, sandbox::SandboxConfig base,
                                                   const SandboxRestrictions& restrictions) {
  const auto policy = policies_.Get(policy_id);

  sandbox::SandboxConfig config = std::move(base);
  config.plugin_id = plugin_id;
  config.policy_id = policy->id;
  config.memory.limit_bytes = std::min(config.memory.limit_bytes, policy->execution.max_memory);
  config.cpu.cpu_time = std::min(config.cpu.cpu_time, policy->execution.max_cpu_time);
  config.network.allowed_hosts = policy->network.allowed_hosts;
  for (const auto& host : policy->network.blocked_hosts) {
    if (!Contains(config.network.blocked_hosts, host)) {
      config.network.blocked_hosts.push_back(host);
    }
  }
  config.network.max_connections = std::min(config.network.max_connections, policy->network.max_connections);
  for (const auto& path : policy->filesystem.allowed_paths) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
      config.filesystem.writable_paths.push_back(path);
    }
  }
  for (const auto& path : policy->filesystem.blocked_paths) {
    config.filesystem.blocked_paths.push_back(path);
  }
  config.disk.limit_bytes = std::min(config.disk.limit_bytes, policy->filesystem.max_file_size);
  if (restrictions.deny_network) {
    config.network.allowed_hosts.clear();
  }
  for (const auto& path : restrictions.blocked_paths) {
    config.filesystem.blocked_paths.push_back(path);
  }

  const auto id = MakeId("sandbox");
  auto box = std::make_shared<sandbox::Sandbox>(
      id, std::move(config), bus_,
      [this](const sandbox::SecurityViolation& violation) { OnSandboxViolation(violation); }, hooks_.sandbox);
  box->Start();

  const auto now = Now();
  std::vector<std::shared_ptr<sandbox::Sandbox>> retired;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    // Terminated sandboxes of the same plugin are superseded.
    for (auto it = sandboxes_.begin(); it != sandboxes_.end();) {
      if (it->second.plugin_id == plugin_id && it->second.sandbox->state() == sandbox::SandboxState::kTerminated) {
        retired.push_back(std::move(it->second.sandbox));
        it = sandboxes_.erase(it);
      } else {
        ++it;
      }
    }
    ManagedSandbox managed;
    managed.sandbox = box;
    managed.plugin_id = plugin_id;
    managed.policy = policy;
    managed.started_at = now;
    managed.last_activity = now;
    sandboxes_.emplace(id, std::move(managed));
  }

  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kLifecycle;
  event.event_id = "sandbox_created";
  event.message = "Secure sandbox created";
  event.fields.emplace_back("sandbox_id", id);
  event.fields.emplace_back("plugin_id", plugin_id);
  event.fields.emplace_back("policy_id", policy->id);
  event.fields.emplace_back("policy_version", std::to_string(policy->version), orchestrator::FieldPrivacy::kPublic,
                            true);
  event.fields.emplace_back("request_id", context.request_id);
  bus_.Publish(event);
  return id;
}

std::string SecurityFramework::CheckPolicy(const SecurityPolicy& policy, const ManagedSandbox& managed,
                                           const Operation& operation) const {
  switch (operation.type) {
  case OperationType::kFileRead:
  case OperationType::kFileWrite: {
    const std::filesystem::path requested(operation.target);
    const auto path = requested.is_absolute() ? requested : managed.sandbox->workspace() / requested;
    if (PathWithin(path, managed.sandbox->workspace())) {
      return {};
    }
    for (const auto& blocked : policy.filesystem.blocked_paths) {
      if (PathWithin(path, blocked)) {
        return "path is blocked by " + blocked.string();
      }
    }
    if (operation.type == OperationType::kFileWrite &&
        std::none_of(policy.filesystem.allowed_paths.begin(), policy.filesystem.allowed_paths.end(),
                     [&path](const std::filesystem::path& allowed) { return PathWithin(path, allowed); })) {
      return "path is outside the writable area";
    }
    return {};
  }
  case OperationType::kNetworkConnect: {
    const auto& net = policy.network;
    for (const auto& blocked : net.blocked_hosts) {
      if (HostMatches(operation.target, blocked)) {
        return "host is blocked by " + blocked;
      }
    }
    if (!net.allowed_hosts.empty() &&
        std::none_of(net.allowed_hosts.begin(), net.allowed_hosts.end(),
                     [&operation](const std::string& allowed) { return HostMatches(operation.target, allowed); })) {
      return "host is not on the allow list";
    }
    if (!net.allowed_ports.empty() &&
        std::find(net.allowed_ports.begin(), net.allowed_ports.end(), operation.port) == net.allowed_ports.end()) {
      return "port " + std::to_string(operation.port) + " is not allowed";
    }
    return {};
  }
  case OperationType::kProcessSpawn: {
    const auto executable = std::filesystem::path(operation.target).filename().string();
    if (!Contains(policy.execution.allowed_executables, executable)) {
      return "executable '" + executable + "' is not allowed";
    }
    return {};
  }
  case OperationType::kDataQuery:
    if (!Contains(policy.data_access.allowed_databases, operation.database)) {
      return "database '" + operation.database + "' is not allowed";
    }
    if (!Contains(policy.data_access.allowed_tables, operation.target)) {
      return "table '" + operation.target + "' is not allowed";
    }
    return {};
  case OperationType::kPermissionUse:
    if (!Contains(policy.permissions, operation.target)) {
      return "permission '" + operation.target + "' is not granted";
    }
    return {};
  }
  return "unknown operation";
}

std::string SecurityFramework::CheckResources(const SecurityPolicy& policy, const ManagedSandbox& managed,
                                              const Operation& operation) const {
  const auto metrics = managed.sandbox->Metrics();
  if (metrics.memory_bytes > policy.execution.max_memory) {
    return "memory";
  }
  switch (operation.type) {
  case OperationType::kProcessSpawn:
    if (managed.processes_spawned + 1 > policy.execution.max_processes) {
      return "processes";
    }
    break;
  case OperationType::kFileWrite:
    if (operation.bytes > policy.filesystem.max_file_size) {
      return "file size";
    }
    if (managed.bytes_written + operation.bytes > policy.filesystem.max_disk_usage) {
      return "disk usage";
    }
    break;
  case OperationType::kDataQuery:
    if (operation.duration > policy.data_access.max_query_time) {
      return "query time";
    }
    if (operation.bytes > policy.data_access.max_result_size) {
      return "result size";
    }
    break;
  case OperationType::kNetworkConnect: {
    const auto since = Now() - options_.activity_window;
    const auto connections = std::count_if(managed.operations.begin(), managed.operations.end(),
                                           [since](const OperationRecord& record) {
                                             return record.at >= since && !record.denied &&
                                                    record.operation.type == OperationType::kNetworkConnect;
                                           });
    if (static_cast<std::uint64_t>(connections) + 1 > policy.network.max_connections) {
      return "connections";
    }
    break;
  }
  default:
    break;
  }
  return {};
}

MonitorResult SecurityFramework::MonitorPluginExecution(const std::string& sandbox_id, const Operation& operation,
                                                        const SecurityContext& context) {
  std::shared_ptr<sandbox::Sandbox> box;
  std::string plugin_id;
  std::string denial;
  std::string exceeded;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = sandboxes_.find(sandbox_id);
    if (it == sandboxes_.end()) {
      throw Error(ErrorDomain::State, errors::state::kSandboxNotFound,
                  std::string(errors::msg::kSandboxNotFound) + ": " + sandbox_id);
    }
    auto& managed = it->second;
    const auto state = managed.sandbox->state();
    if (state != sandbox::SandboxState::kActive && state != sandbox::SandboxState::kThrottled) {
      throw Error(ErrorDomain::State, errors::state::kSandboxNotActive,
                  std::string(errors::msg::kSandboxNotActive) + ": " + sandbox_id);
    }
    box = managed.sandbox;
    plugin_id = managed.plugin_id;
    denial = CheckPolicy(*managed.policy, managed, operation);
    if (denial.empty()) {
      exceeded = CheckResources(*managed.policy, managed, operation);
    }

    const auto now = Now();
    OperationRecord record;
    record.operation = operation;
    record.at = now;
    record.denied = !denial.empty();
    record.sensitive = operation.type == OperationType::kDataQuery ||
                       (operation.type == OperationType::kFileRead &&
                        !PathWithin(std::filesystem::path(operation.target).is_absolute()
                                        ? std::filesystem::path(operation.target)
                                        : box->workspace() / operation.target,
                                    box->workspace()));
    managed.operations.push_back(std::move(record));
    while (managed.operations.size() > options_.operation_history) {
      managed.operations.pop_front();
      if (managed.scanned > 0) {
        --managed.scanned;
      }
    }
    if (denial.empty()) {
      managed.last_activity = now;
      if (operation.type == OperationType::kProcessSpawn) {
        ++managed.processes_spawned;
      } else if (operation.type == OperationType::kFileWrite) {
        managed.bytes_written += operation.bytes;
      }
    }
  }

  if (!denial.empty()) {
    auto violation = MakeViolation(ViolationKind::kPermissionDenied, Severity::kHigh,
                                   "Operation blocked by security policy: " + std::string(ToString(operation.type)) +
                                       " " + operation.target + " (" + denial + ")",
                                   plugin_id, sandbox_id, context);
    violation.details = {{"operation", std::string(ToString(operation.type))},
                         {"target", operation.target},
                         {"reason", denial}};
    HandleSecurityViolation(violation);
    return {false, violation};
  }

  // The sandbox enforces its own view on top of the policy.
  bool sandbox_allowed = true;
  if (operation.type == OperationType::kNetworkConnect) {
    sandbox_allowed = box->CheckNetworkAccess(operation.target, operation.port);
  } else if (operation.type == OperationType::kFileRead || operation.type == OperationType::kFileWrite) {
    sandbox_allowed = box->CheckFileAccess(operation.target, operation.type == OperationType::kFileWrite);
  }
  if (!sandbox_allowed) {
    const auto violations = box->Violations();
    sandbox::SecurityViolation latest;
    if (!violations.empty()) {
      latest = violations.back();
    } else {
      latest.type = operation.type == OperationType::kNetworkConnect ? sandbox::ViolationType::kNetworkViolation
                                                                      : sandbox::ViolationType::kFilesystemViolation;
      latest.severity = Severity::kHigh;
      latest.description = "Sandbox denied " + operation.target;
      latest.id = MakeId("vio");
    }
    auto violation = MakeViolation(KindFor(latest.type), latest.severity, latest.description, plugin_id, sandbox_id,
                                   context);
    violation.id = latest.id;
    violation.details = {{"operation", std::string(ToString(operation.type))},
                         {"target", operation.target},
                         {"sandbox_violation", std::string(sandbox::ToString(latest.type))}};
    return {false, violation};
  }

  if (!exceeded.empty()) {
    auto violation = MakeViolation(ViolationKind::kResourceLimit, Severity::kMedium,
                                   "Resource limit exceeded: " + exceeded, plugin_id, sandbox_id, context);
    violation.details = {{"operation", std::string(ToString(operation.type))}, {"resource", exceeded}};
    HandleSecurityViolation(violation);
    box->Throttle();
    return {true, violation};
  }
  return {true, std::nullopt};
}

std::vector<PolicyViolation> SecurityFramework::DetectSuspiciousActivity(const std::string& sandbox_id,
                                                                         const SecurityContext& context) {
  std::vector<PolicyViolation> found;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = sandboxes_.find(sandbox_id);
    if (it == sandboxes_.end()) {
      return {};
    }
    auto& managed = it->second;
    if (managed.scanned >= managed.operations.size()) {
      return {};
    }
    const auto now = Now();
    const auto since = now - options_.activity_window;

    std::size_t denials = 0;
    std::size_t recent = 0;
    for (const auto& record : managed.operations) {
      if (record.at < since) {
        continue;
      }
      ++recent;
      if (record.denied) {
        ++denials;
      }
    }
    if (denials >= options_.denial_threshold || recent >= options_.burst_threshold) {
      auto violation = MakeViolation(ViolationKind::kCodeInjection, Severity::kHigh,
                                     "Suspicious behavior pattern detected: " + std::to_string(denials) +
                                         " denied of " + std::to_string(recent) + " recent operations",
                                     managed.plugin_id, sandbox_id, context);
      violation.details = {{"signal", "behavior"},
                           {"denied", std::to_string(denials)},
                           {"operations", std::to_string(recent)}};
      found.push_back(std::move(violation));
    }

    std::set<std::string> matches;
    for (std::size_t i = managed.scanned; i < managed.operations.size(); ++i) {
      const auto& target = managed.operations[i].operation.target;
      for (const auto& signature : AttackSignatures()) {
        if (std::regex_search(target, signature.pattern)) {
          matches.insert(std::string(signature.name));
        }
      }
    }
    if (!matches.empty()) {
      std::string names;
      for (const auto& name : matches) {
        names += (names.empty() ? "" : ", ") + name;
      }
      auto violation = MakeViolation(ViolationKind::kCodeInjection, Severity::kCritical,
                                     "Attack pattern detected: " + names, managed.plugin_id, sandbox_id, context);
      violation.details = {{"signal", "attack"}, {"patterns", names}};
      found.push_back(std::move(violation));
    }

    // Outbound traffic following a sensitive read.
    bool sensitive_seen = false;
    std::uint64_t outbound = 0;
    bool blocked_destination = false;
    for (const auto& record : managed.operations) {
      if (record.at < since) {
        continue;
      }
      if (record.sensitive && !record.denied) {
        sensitive_seen = true;
        continue;
      }
      if (sensitive_seen && record.operation.type == OperationType::kNetworkConnect) {
        outbound += record.operation.bytes;
        blocked_destination = blocked_destination || record.denied;
      }
    }
    if (sensitive_seen && (outbound > options_.exfiltration_bytes || blocked_destination)) {
      auto violation = MakeViolation(ViolationKind::kPermissionDenied, Severity::kCritical,
                                     "Data exfiltration attempt detected", managed.plugin_id, sandbox_id, context);
      violation.details = {{"signal", "exfiltration"},
                           {"outbound_bytes", std::to_string(outbound)},
                           {"blocked_destination", blocked_destination ? "true" : "false"}};
      found.push_back(std::move(violation));
    }
    managed.scanned = managed.operations.size();
    metrics_.suspicious_activities += found.size();
  }

  for (const auto& violation : found) {
    HandleSecurityViolation(violation);
  }
  return found;
}

void SecurityFramework::HandleSecurityViolation(const PolicyViolation& violation) {
  RecordViolation(violation);

  audit::SecurityEvent draft;
  draft.type = AuditTypeFor(violation);
  draft.severity = violation.severity;
  draft.source = {audit::SourceType::kPlugin, "security-framework",
                  violation.sandbox_id.empty() ? std::string("main") : violation.sandbox_id};
  draft.plugin_id = violation.plugin_id;
  if (!violation.sandbox_id.empty()) {
    draft.sandbox_id = violation.sandbox_id;
  }
  draft.context = violation.context;
  draft.description = violation.description;
  draft.details = violation.details;
  draft.details["violation_id"] = violation.id;
  draft.details["kind"] = std::string(ToString(violation.kind));
  draft.tags = {"violation", "security"};
  if (violation.blocked) {
    draft.tags.push_back("blocked");
  }
  const auto event = audit_.RecordEvent(std::move(draft));

  if (violation.severity < Severity::kHigh) {
    return;
  }
  // CRITICAL is always contained; auto_isolate extends containment to HIGH.
  const bool isolate = violation.severity == Severity::kCritical || options_.auto_isolate;
  if (isolate && !violation.sandbox_id.empty()) {
    if (StopSandbox(violation.sandbox_id)) {
      std::clog << "[security] contained sandbox " << violation.sandbox_id << " after "
                << ToString(violation.kind) << std::endl;
    }
  }

  orchestrator::Event notice;
  notice.category = orchestrator::EventCategory::kSecurity;
  notice.severity = orchestrator::EventSeverity::kCritical;
  notice.event_id = "security_team_notified";
  notice.message = violation.description;
  notice.fields.emplace_back("violation_id", violation.id);
  notice.fields.emplace_back("plugin_id", violation.plugin_id);
  notice.fields.emplace_back("severity", std::string(ToString(violation.severity)));
  bus_.Publish(notice);

  if (!options_.incident_response) {
    return;
  }
  for (const auto& incident : audit_.ListIncidents()) {
    if (std::find(incident.event_ids.begin(), incident.event_ids.end(), event.id) != incident.event_ids.end()) {
      return;
    }
  }
  audit::IncidentDraft incident;
  incident.title = std::string(ToString(violation.kind)) + " violation by plugin " + violation.plugin_id;
  incident.description = violation.description;
  incident.severity = violation.severity;
  incident.category = audit::IncidentCategory::kSecurity;
  incident.source = "security-framework";
  incident.event_ids = {event.id};
  audit_.CreateIncident(std::move(incident));
}

void SecurityFramework::OnSandboxViolation(const sandbox::SecurityViolation& violation) {
  try {
    SecurityContext context;
    context.request_id = "sandbox:" + violation.sandbox_id;
    context.timestamp = violation.timestamp;
    auto converted = MakeViolation(KindFor(violation.type), violation.severity, violation.description,
                                   violation.plugin_id, violation.sandbox_id, context);
    converted.id = violation.id;
    converted.blocked = violation.blocked;
    converted.details = {{"sandbox_violation", std::string(sandbox::ToString(violation.type))}};
    RecordViolation(converted);

    audit::SecurityEvent draft;
    draft.type = audit::EventType::kRuntimeViolation;
    draft.severity = violation.severity;
    draft.source = {audit::SourceType::kPlugin, "sandbox", violation.sandbox_id};
    draft.plugin_id = violation.plugin_id;
    draft.sandbox_id = violation.sandbox_id;
    draft.context = context;
    draft.description = "Runtime security violation: " + violation.description;
    draft.details = converted.details;
    draft.details["violation_id"] = violation.id;
    draft.tags = {"runtime", "security", "violation"};
    const auto event = audit_.RecordEvent(std::move(draft));

    // The sandbox has already stopped itself on CRITICAL and throttled on HIGH.
    if (violation.severity == Severity::kCritical && options_.incident_response) {
      for (const auto& incident : audit_.ListIncidents()) {
        if (std::find(incident.event_ids.begin(), incident.event_ids.end(), event.id) != incident.event_ids.end()) {
          return;
        }
      }
      audit::IncidentDraft incident;
      incident.title = "Sandbox " + violation.sandbox_id + " terminated after " +
                       std::string(sandbox::ToString(violation.type));
      incident.description = violation.description;
      incident.severity = Severity::kCritical;
      incident.category = audit::IncidentCategory::kSecurity;
      incident.source = "sandbox";
      incident.event_ids = {event.id};
      audit_.CreateIncident(std::move(incident));
    }
  } catch (const std::exception& ex) {
    std::clog << "{\"event\":\"sandbox_violation_unhandled\",\"sandbox\":\"" << violation.sandbox_id
              << "\",\"message\":\"" << ex.what() << "\"}" << std::endl;
  }
}

FrameworkReport SecurityFramework::GenerateSecurityReport(const audit::DateRange& period) {
  std::lock_guard<std::mutex> guard(mutex_);
  FrameworkReport report;
  report.period = period;
  std::uint64_t critical = 0;
  std::uint64_t high = 0;
  std::set<ViolationKind> kinds;
  for (const auto& violation : violations_) {
    if (!period.Contains(violation.timestamp)) {
      continue;
    }
    report.violations.push_back(violation);
    ++report.by_kind[violation.kind];
    ++report.by_severity[violation.severity];
    kinds.insert(violation.kind);
    if (violation.severity == Severity::kCritical) {
      ++critical;
    } else if (violation.severity == Severity::kHigh) {
      ++high;
    }
  }
  const double deduction = 20.0 * static_cast<double>(critical) + 10.0 * static_cast<double>(high);
  report.compliance_score = std::max(0.0, 100.0 - deduction);
  if (report.compliance_score >= 95.0) {
    report.status = FrameworkCompliance::kCompliant;
  } else if (report.compliance_score >= 80.0) {
    report.status = FrameworkCompliance::kRequiresAttention;
  } else {
    report.status = FrameworkCompliance::kNonCompliant;
  }
  for (auto kind : kinds) {
    for (auto& recommendation : RecommendationsFor(kind)) {
      report.recommendations.push_back(std::move(recommendation));
    }
  }
  metrics_.compliance_score = report.compliance_score;
  metrics_.last_assessment = Now();
  report.metrics = metrics_;
  return report;
}

std::shared_ptr<sandbox::Sandbox> SecurityFramework::GetSandbox(const std::string& sandbox_id) const {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = sandboxes_.find(sandbox_id);
  return it == sandboxes_.end() ? nullptr : it->second.sandbox;
}

std::vector<SandboxInfo> SecurityFramework::ListSandboxes() const {
  std::lock_guard<std::mutex> guard(mutex_);
  std::vector<SandboxInfo> out;
  for (const auto& [id, managed] : sandboxes_) {
    SandboxInfo info;
    info.id = id;
    info.plugin_id = managed.plugin_id;
    info.policy_id = managed.policy->id;
    info.policy_version = managed.policy->version;
    info.state = managed.sandbox->state();
    info.started_at = managed.started_at;
    info.last_activity = managed.last_activity;
    out.push_back(std::move(info));
  }
  return out;
}

bool SecurityFramework::StopSandbox(const std::string& sandbox_id) {
  auto box = GetSandbox(sandbox_id);
  if (!box) {
    return false;
  }
  box->Stop();
  return true;
}

bool SecurityFramework::ReleaseSandbox(const std::string& sandbox_id) {
  std::shared_ptr<sandbox::Sandbox> box;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = sandboxes_.find(sandbox_id);
    if (it == sandboxes_.end()) {
      return false;
    }
    box = std::move(it->second.sandbox);
    sandboxes_.erase(it);
  }
  box->Stop();
  return true;
}

void SecurityFramework::StopAll() noexcept {
  std::vector<std::shared_ptr<sandbox::Sandbox>> boxes;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    for (const auto& [id, managed] : sandboxes_) {
      boxes.push_back(managed.sandbox);
    }
  }
  for (const auto& box : boxes) {
    box->Stop();
  }
}

FrameworkMetrics SecurityFramework::Metrics() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return metrics_;
}

std::vector<PolicyViolation> SecurityFramework::Violations() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return violations_;
}

void SecurityFramework::DetectionLoop() {
  while (true) {
    {
      std::unique_lock<std::mutex> lock(detection_mutex_);
      if (detection_cv_.wait_for(lock, options_.detection_interval, [this]() { return detection_stop_; })) {
        return;
      }
    }
    for (const auto& info : ListSandboxes()) {
      if (info.state != sandbox::SandboxState::kActive && info.state != sandbox::SandboxState::kThrottled) {
        continue;
      }
      SecurityContext context;
      context.request_id = MakeId("detect");
      context.timestamp = Now();
      try {
        DetectSuspiciousActivity(info.id, context);
      } catch (const std::exception& ex) {
        std::clog << "[security] suspicious-activity pass failed for " << info.id << ": " << ex.what() << std::endl;
      }
    }
  }
}

} // namespace pw::security

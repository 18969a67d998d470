#include "pw/sandbox/sandbox.h" // TSK140_Sandbox

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include "pw/orchestrator/event_bus.h"
#include "test_support.h"

namespace {

  using pw::Severity;
  using pw::sandbox::ExecutionStatus;
  using pw::sandbox::MetricSample;
  using pw::sandbox::Sandbox;
  using pw::sandbox::SandboxConfig;
  using pw::sandbox::SandboxState;
  using pw::sandbox::SecurityViolation;
  using pw::sandbox::ViolationType;
  using pw::test::Expect;
  using pw::test::ExpectError;
  using pw::test::TempDir;

  constexpr std::uint64_t kMiB = 1024ull * 1024ull;

  SandboxConfig MakeConfig(const TempDir& root) {
    SandboxConfig config;
    config.plugin_id = "demo-plugin";
    config.root_dir = root.path();
    config.unit_path = pw::test::SandboxUnitPath();
    config.interpreter = {"/bin/sh", "-c"};
    config.monitoring.enabled = false;
    config.max_processes = 0;
    config.memory.limit_bytes = 512 * kMiB;
    config.grace_period = std::chrono::milliseconds(500);
    config.network.allowed_hosts = {"api.example.com"};
    config.network.blocked_hosts = {"evil.example.net"};
    return config;
  }

  void TestExecute() {
    TempDir root("pw_sandbox");
    pw::orchestrator::EventBus bus;
    Sandbox sandbox("sbx-exec", MakeConfig(root), bus);
    ExpectError([&] { (void)sandbox.Execute("echo early"); }, pw::ErrorDomain::State,
                pw::errors::state::kSandboxNotActive, "execute before start");
    sandbox.Start();
    Expect(sandbox.state() == SandboxState::kActive, "started sandbox is active");
    Expect(sandbox.Ping() && sandbox.IsHealthy(), "unit answers");

    auto result = sandbox.Execute("echo hello");
    Expect(result.status == ExecutionStatus::kOk && result.exit_code == 0, "echo succeeds");
    Expect(result.output == "hello\n", "stdout captured");
    Expect(!result.correlation_id.empty(), "correlation id assigned");

    result = sandbox.Execute("echo oops >&2; exit 3");
    Expect(result.exit_code == 3 && result.error_output == "oops\n", "exit code and stderr captured");

    result = sandbox.Execute("printf '%s' \"$PW_CONTEXT\"", "{\"user\":\"alice\"}");
    Expect(result.output == "{\"user\":\"alice\"}", "context passed through the environment");

    result = sandbox.Execute("echo data > marker.txt");
    Expect(result.exit_code == 0 && std::filesystem::exists(sandbox.workspace() / "marker.txt"),
           "code runs inside the workspace");

    const auto metrics = sandbox.Metrics();
    Expect(metrics.executions == 4 && metrics.errors == 1, "executions and errors counted");

    ExpectError([&] { sandbox.Start(); }, pw::ErrorDomain::State, pw::errors::state::kSandboxStartFailed,
                "second start refused");
    sandbox.Stop();
  }

  void TestDeniedCode() {
    TempDir root("pw_sandbox");
    pw::orchestrator::EventBus bus;
    std::vector<SecurityViolation> seen;
    Sandbox sandbox("sbx-deny", MakeConfig(root), bus, [&](const SecurityViolation& v) { seen.push_back(v); });
    sandbox.Start();
    ExpectError([&] { (void)sandbox.Execute("eval('1+1')"); }, pw::ErrorDomain::Security,
                pw::errors::security::kCodeRejected, "eval rejected before reaching the unit");
    ExpectError([&] { (void)sandbox.Execute("const cp = require('child_process');"); },
                pw::ErrorDomain::Security, pw::errors::security::kCodeRejected, "child_process rejected");
    Expect(seen.size() == 2 && seen[0].type == ViolationType::kCodeInjection && seen[0].severity == Severity::kHigh &&
               seen[0].blocked,
           "rejections recorded as blocked HIGH violations");
    Expect(sandbox.state() == SandboxState::kThrottled, "HIGH violation throttles");
    Expect(sandbox.Metrics().executions == 0, "rejected code never executed");

    const auto result = sandbox.Execute("echo still");
    Expect(result.output == "still\n", "throttled sandbox keeps executing");

    sandbox.RecordSample(MetricSample{5.0, 64 * kMiB});
    Expect(sandbox.state() == SandboxState::kActive, "healthy sample lifts throttling");
    sandbox.Stop();
  }

  void TestTimeout() {
    TempDir root("pw_sandbox");
    pw::orchestrator::EventBus bus;
    Sandbox sandbox("sbx-timeout", MakeConfig(root), bus);
    sandbox.Start();
    try {
      (void)sandbox.Execute("sleep 5", "", std::chrono::milliseconds(300));
      Expect(false, "runaway code times out");
    } catch (const pw::Error& err) {
      Expect(err.code == pw::errors::state::kExecutionTimeout, "timeout error code");
      Expect(err.retryability == pw::Retryability::kRetryable, "timeouts are retryable");
    }
    Expect(sandbox.Execute("echo after").output == "after\n", "sandbox usable after a timeout");
    sandbox.Stop();
  }

  void TestNetworkPolicy() {
    TempDir root("pw_sandbox");
    pw::orchestrator::EventBus bus;
    Sandbox sandbox("sbx-net", MakeConfig(root), bus);
    sandbox.Start();
    Expect(sandbox.CheckNetworkAccess("api.example.com", 443), "allow-listed host");
    Expect(sandbox.state() == SandboxState::kActive, "allowed access leaves state alone");
    Expect(!sandbox.CheckNetworkAccess("api.example.com", 22), "blocked port");
    Expect(!sandbox.CheckNetworkAccess("evil.example.net", 443), "blocked host");
    Expect(!sandbox.CheckNetworkAccess("other.example.org", 443), "host outside the allow list");
    const auto violations = sandbox.Violations();
    Expect(violations.size() == 3 && violations[0].type == ViolationType::kNetworkViolation &&
               violations[0].severity == Severity::kHigh,
           "denials recorded as HIGH network violations");
    Expect(sandbox.state() == SandboxState::kThrottled, "denied access throttles");
    sandbox.Stop();

    TempDir closed_root("pw_sandbox");
    auto closed = MakeConfig(closed_root);
    closed.network.allowed_hosts.clear();
    Sandbox offline("sbx-offline", closed, bus);
    offline.Start();
    Expect(!offline.CheckNetworkAccess("api.example.com", 443), "empty allow list disables egress");
    offline.Stop();
  }

  void TestFilePolicy() {
    TempDir root("pw_sandbox");
    pw::orchestrator::EventBus bus;
    Sandbox sandbox("sbx-fs", MakeConfig(root), bus);
    sandbox.Start();
    Expect(sandbox.CheckFileAccess("data/out.json", true), "relative write inside the workspace");
    Expect(sandbox.CheckFileAccess(sandbox.workspace() / "in.txt", false), "absolute read inside the workspace");
    Expect(sandbox.CheckFileAccess("/usr/lib/os-release", false), "system paths readable");
    Expect(sandbox.Violations().empty(), "no violations so far");
    Expect(!sandbox.CheckFileAccess("/usr/lib/os-release", true), "system paths not writable");
    Expect(!sandbox.CheckFileAccess("/etc/shadow", false), "blocked path");
    Expect(!sandbox.CheckFileAccess("../../outside.txt", false), "escape from the workspace");
    Expect(!sandbox.CheckFileAccess("/home/someone/.ssh/id_rsa", false), "unlisted path");
    const auto violations = sandbox.Violations();
    Expect(violations.size() == 4 && violations.back().type == ViolationType::kFilesystemViolation,
           "filesystem denials recorded");
    sandbox.Stop();
  }

  void TestResourceSamples() { // TSK141_Sandbox_Metrics
    TempDir root("pw_sandbox");
    pw::orchestrator::EventBus bus;
    Sandbox sandbox("sbx-metrics", MakeConfig(root), bus);
    sandbox.Start();

    sandbox.RecordSample(MetricSample{10.0, 450 * kMiB});
    auto violations = sandbox.Violations();
    Expect(violations.size() == 1 && violations[0].severity == Severity::kMedium,
           "memory above 80% of the limit is a warning");
    Expect(sandbox.state() == SandboxState::kActive, "warnings do not throttle");

    sandbox.RecordSample(MetricSample{95.0, 100 * kMiB});
    violations = sandbox.Violations();
    Expect(violations.size() == 2 && violations[1].severity == Severity::kMedium, "CPU alert");

    sandbox.RecordSample(MetricSample{10.0, 600 * kMiB});
    violations = sandbox.Violations();
    Expect(violations.size() == 3 && violations[2].severity == Severity::kHigh &&
               violations[2].type == ViolationType::kResourceExhaustion,
           "memory over the limit is HIGH");
    Expect(sandbox.state() == SandboxState::kThrottled, "hard breach throttles");

    sandbox.RecordSample(MetricSample{10.0, 100 * kMiB});
    Expect(sandbox.state() == SandboxState::kActive, "recovery unthrottles");

    const auto metrics = sandbox.Metrics();
    Expect(metrics.samples == 4, "samples counted");
    Expect(metrics.peak_memory_bytes == 600 * kMiB && metrics.memory_bytes == 100 * kMiB, "peak and current memory");
    Expect(metrics.peak_cpu_percent == 95.0, "peak CPU");
    Expect(metrics.warnings == 3, "breaches counted as warnings");
    sandbox.Stop();
  }

  void TestCriticalViolationStops() {
    TempDir root("pw_sandbox");
    pw::orchestrator::EventBus bus;
    int stop_events = 0;
    bus.Subscribe([&](const pw::orchestrator::Event& e) {
      if (e.event_id == "sandbox_stopped") {
        ++stop_events;
      }
    });
    Sandbox sandbox("sbx-critical", MakeConfig(root), bus);
    sandbox.Start();
    const auto workspace = sandbox.workspace();
    Expect(std::filesystem::is_directory(workspace), "workspace created");

    SecurityViolation violation;
    violation.type = ViolationType::kProcessViolation;
    violation.severity = Severity::kCritical;
    violation.description = "fork bomb";
    violation.blocked = true;
    sandbox.ReportViolation(violation);
    Expect(sandbox.state() == SandboxState::kTerminated, "CRITICAL violation terminates");
    Expect(!std::filesystem::exists(workspace), "directories removed on stop");
    ExpectError([&] { (void)sandbox.Execute("echo late"); }, pw::ErrorDomain::State,
                pw::errors::state::kSandboxNotActive, "terminated sandbox refuses work");
    Expect(!sandbox.Ping(std::chrono::milliseconds(100)), "unit gone");

    sandbox.Stop();
    Expect(sandbox.state() == SandboxState::kTerminated, "stop is idempotent");
    Expect(stop_events == 1, "one stop event");
    Expect(sandbox.Violations().size() == 1 && sandbox.Violations()[0].sandbox_id == "sbx-critical",
           "violation attributed to the sandbox");
  }

  void TestStartFailure() {
    TempDir root("pw_sandbox");
    pw::orchestrator::EventBus bus;
    auto config = MakeConfig(root);
    config.unit_path = root.path() / "no-such-unit";
    Sandbox sandbox("sbx-broken", config, bus);
    ExpectError([&] { sandbox.Start(); }, pw::ErrorDomain::State, pw::errors::state::kSandboxStartFailed,
                "missing unit binary");
    Expect(sandbox.state() == SandboxState::kTerminated, "failed start ends terminated");
  }

  void TestStopCancelsConcurrentCalls() {
    TempDir root("pw_sandbox");
    pw::orchestrator::EventBus bus;
    Sandbox sandbox("sbx-race", MakeConfig(root), bus);
    sandbox.Start();

    // An in-flight call is cancelled by Stop.
    pw::ErrorDomain in_flight_domain = pw::ErrorDomain::IO;
    int in_flight_code = 0;
    std::thread slow([&] {
      try {
        (void)sandbox.Execute("sleep 3");
      } catch (const pw::Error& err) {
        in_flight_domain = err.domain;
        in_flight_code = err.code;
      }
    });

    // Calls issued back to back while Stop runs never surface a broken channel.
    std::vector<int> loop_codes;
    pw::ErrorDomain loop_domain = pw::ErrorDomain::State;
    std::thread busy([&] {
      for (;;) {
        try {
          (void)sandbox.Execute("true");
        } catch (const pw::Error& err) {
          loop_domain = err.domain;
          loop_codes.push_back(err.code);
          return;
        }
      }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    sandbox.Stop();
    slow.join();
    busy.join();

    Expect(in_flight_domain == pw::ErrorDomain::State &&
               in_flight_code == pw::errors::state::kSandboxCancelled,
           "in-flight call cancelled by stop");
    Expect(loop_domain == pw::ErrorDomain::State && loop_codes.size() == 1 &&
               (loop_codes.front() == pw::errors::state::kSandboxCancelled ||
                loop_codes.front() == pw::errors::state::kSandboxNotActive),
           "racing call refused as cancelled or inactive");
    Expect(sandbox.state() == SandboxState::kTerminated, "stopped sandbox terminated");
  }

} // namespace

int main() {
  TestExecute();
  TestDeniedCode();
  TestTimeout();
  TestNetworkPolicy();
  TestFilePolicy();
  TestResourceSamples();
  TestCriticalViolationStops();
  TestStartFailure();
  TestStopCancelsConcurrentCalls();
  return pw::test::Finish("sandbox");
}

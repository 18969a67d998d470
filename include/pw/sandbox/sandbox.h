#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <sys/types.h>

#include "pw/sandbox/unit_protocol.h"
#include "pw/types.h"

namespace pw::orchestrator {
class EventBus;
}

namespace pw::sandbox {

enum class SandboxState : std::uint8_t {
  kCreated,
  kStarting,
  kActive,
  kThrottled,
  kStopping,
  kTerminated
};

std::string_view ToString(SandboxState state) noexcept;

enum class ViolationType : std::uint8_t {
  kResourceExhaustion,
  kNetworkViolation,
  kFilesystemViolation,
  kCodeInjection,
  kPermissionDenied,
  kProcessViolation,
  kUnitFailure
};

std::string_view ToString(ViolationType type) noexcept;

struct CpuLimits {
  double cores{1.0};
  std::chrono::milliseconds cpu_time{300000};
  int priority{10};  // nice increment applied to the unit
};

struct MemoryLimits {
  std::uint64_t limit_bytes{512ull * 1024 * 1024};
  std::uint64_t swap_bytes{0};
};

struct DiskLimits {
  std::uint64_t limit_bytes{100ull * 1024 * 1024};
  std::uint32_t iops{1000};
  std::uint32_t max_open_files{256};
};

struct NetworkLimits {
  std::uint64_t bandwidth_bytes_per_sec{1024 * 1024};
  std::uint32_t max_connections{10};
  std::vector<std::string> allowed_hosts;  // empty: no outbound traffic
  std::vector<std::string> blocked_hosts;
  std::vector<std::uint16_t> blocked_ports{22, 23, 25, 53, 135, 137, 138, 139, 445, 1433, 3389};
};

struct FilesystemLimits {
  std::vector<std::filesystem::path> read_only_paths;
  std::vector<std::filesystem::path> writable_paths;
  std::vector<std::filesystem::path> blocked_paths{"/etc/shadow", "/etc/sudoers", "/root",
                                                   "/proc/kcore", "/sys/firmware"};
};

struct AlertThresholds {
  double cpu_percent{80.0};
  double memory_percent{80.0};
  std::uint64_t disk_bytes_per_sec{1024 * 1024};
  std::uint64_t network_bytes_per_sec{1024 * 1024};
  std::uint32_t error_rate{10};  // errors per sampling interval
  std::chrono::milliseconds response_time{5000};
};

struct MonitoringConfig {
  bool enabled{true};
  std::chrono::milliseconds metrics_interval{5000};
  AlertThresholds alerts;
};

// Write-once at construction.
struct SandboxConfig {
  std::string plugin_id;
  std::string policy_id{"default-security-policy"};
  CpuLimits cpu;
  MemoryLimits memory;
  DiskLimits disk;
  NetworkLimits network;
  FilesystemLimits filesystem;
  MonitoringConfig monitoring;
  std::filesystem::path root_dir;  // empty: std::filesystem::temp_directory_path()
  std::vector<std::string> interpreter{"/usr/bin/env", "node", "-e"};
  std::filesystem::path unit_path;  // empty: PW_SANDBOX_UNIT, then beside the executable
  std::chrono::milliseconds grace_period{2000};
  std::uint32_t max_processes{64};
};

// Cumulative; counters only grow while the sandbox lives.
struct SandboxMetrics {
  double cpu_percent{0.0};
  double peak_cpu_percent{0.0};
  std::uint64_t memory_bytes{0};
  std::uint64_t peak_memory_bytes{0};
  std::uint64_t disk_read_bytes{0};
  std::uint64_t disk_write_bytes{0};
  std::uint64_t network_rx_bytes{0};
  std::uint64_t network_tx_bytes{0};
  std::uint64_t executions{0};
  std::uint64_t errors{0};
  std::uint64_t warnings{0};
  std::uint64_t samples{0};
  TimePoint last_sample{};
};

// One observation of the unit's process tree. Counter fields are absolute
// totals as reported by the kernel.
struct MetricSample {
  double cpu_percent{0.0};
  std::uint64_t memory_bytes{0};
  std::uint64_t disk_read_bytes{0};
  std::uint64_t disk_write_bytes{0};
  std::uint64_t network_rx_bytes{0};
  std::uint64_t network_tx_bytes{0};
};

struct SecurityViolation {
  std::string id;
  ViolationType type{ViolationType::kResourceExhaustion};
  Severity severity{Severity::kLow};
  std::string description;
  bool blocked{false};
  TimePoint timestamp{};
  std::string sandbox_id;
  std::string plugin_id;
};

enum class ExecutionStatus : std::uint8_t { kOk, kError, kTimeout };

std::string_view ToString(ExecutionStatus status) noexcept;

struct ExecutionResult {
  std::string correlation_id;
  ExecutionStatus status{ExecutionStatus::kOk};
  int exit_code{0};
  std::string output;
  std::string error_output;
  std::chrono::milliseconds duration{0};
};

using ViolationHandler = std::function<void(const SecurityViolation&)>;

struct SandboxHooks { // TSK140_Sandbox_Test_Seams
  // Replaces the /proc sampler; receives the unit pid.
  std::function<std::optional<MetricSample>(pid_t)> sampler;
};

class Sandbox {
 public:
  Sandbox(std::string id, SandboxConfig config, orchestrator::EventBus& bus,
          ViolationHandler handler = {}, SandboxHooks hooks = {});
  ~Sandbox();
  Sandbox(const Sandbox&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;

  // CREATED -> ACTIVE. Throws State kSandboxStartFailed after cleaning up;
  // the sandbox is then TERMINATED.
  void Start();

  // Runs |code| in the unit. Rejections never reach the unit.
  ExecutionResult Execute(const std::string& code, const std::string& context = {},
                          std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

  // Policy-layer checks. A denial is recorded as a blocked HIGH violation.
  bool CheckNetworkAccess(const std::string& host, std::uint16_t port);
  bool CheckFileAccess(const std::filesystem::path& path, bool write);

  // Records |violation| and applies the response for its severity.
  void ReportViolation(SecurityViolation violation);

  // Folds one sample into the metrics and evaluates the alert thresholds.
  void RecordSample(const MetricSample& sample);

  // ACTIVE <-> THROTTLED. Lowers the unit's priority and soft memory limit;
  // the next sample within limits restores them.
  void Throttle();
  void Unthrottle();

  // Idempotent; never throws.
  void Stop() noexcept;

  bool IsHealthy() const;
  bool Ping(std::chrono::milliseconds timeout = std::chrono::milliseconds(1000));

  SandboxState state() const noexcept { return state_.load(); }
  const std::string& id() const noexcept { return id_; }
  const SandboxConfig& config() const noexcept { return config_; }
  const std::filesystem::path& workspace() const noexcept { return workspace_; }
  pid_t unit_pid() const noexcept { return unit_pid_; }

  SandboxMetrics Metrics() const;
  std::vector<SecurityViolation> Violations() const;
  std::vector<std::string> Warnings() const;

 private:
  struct PendingCall {
    std::promise<protocol::ExecResponse> promise;  // RESULT, or status "pong"
  };

  std::filesystem::path ResolveUnitPath() const;
  void PrepareDirectories();
  void LaunchUnit();
  void ReaderLoop();
  void MetricsLoop();
  void TerminateUnit() noexcept;
  void RemoveDirectories() noexcept;
  void FailPending(int code, std::string_view message);
  std::future<protocol::ExecResponse> Register(const std::string& correlation_id);
  void Send(const std::string& frame);
  void Publish(const SecurityViolation& violation);
  void AddWarning(std::string warning);
  SecurityViolation MakeViolation(ViolationType type, Severity severity, std::string description,
                                  bool blocked) const;

  const std::string id_;
  const SandboxConfig config_;
  orchestrator::EventBus& bus_;
  ViolationHandler handler_;
  SandboxHooks hooks_;

  std::atomic<SandboxState> state_{SandboxState::kCreated};
  std::filesystem::path sandbox_dir_;
  std::filesystem::path workspace_;
  std::filesystem::path temp_dir_;
  std::filesystem::path log_dir_;

  pid_t unit_pid_{-1};
  int channel_fd_{-1};
  std::atomic<bool> unit_exited_{false};
  std::mutex send_mutex_;
  std::thread reader_;

  mutable std::mutex calls_mutex_;
  std::map<std::string, std::shared_ptr<PendingCall>> pending_;

  std::thread metrics_thread_;
  std::mutex metrics_wait_mutex_;
  std::condition_variable metrics_cv_;
  bool metrics_stop_{false};

  mutable std::mutex state_mutex_;
  SandboxMetrics metrics_;
  std::vector<SecurityViolation> violations_;
  std::vector<std::string> warnings_;
  std::uint64_t errors_at_last_sample_{0};
  std::optional<MetricSample> previous_sample_;
  std::chrono::steady_clock::time_point previous_sample_at_{};
  std::uint64_t cpu_ticks_{0};
  std::chrono::steady_clock::time_point cpu_ticks_at_{};

  std::mutex stop_mutex_;
};

// Sums CPU, RSS and I/O over |root| and its descendants from /proc.
// |previous_cpu_ticks| carries the tick total between calls.
std::optional<MetricSample> SampleProcessTree(pid_t root, std::uint64_t& previous_cpu_ticks,
                                              std::chrono::steady_clock::time_point& previous_at);

// |root| followed by every descendant found under /proc.
std::vector<pid_t> ProcessTree(pid_t root);

} // namespace pw::sandbox

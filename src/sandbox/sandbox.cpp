#include "pw/sandbox/sandbox.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <regex>
#include <sstream>

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include "pw/error.h"
#include "pw/errors.h"
#include "pw/orchestrator/event_bus.h"
#include "pw/orchestrator/io_util.h"

namespace pw::sandbox {

namespace {

using Steady = std::chrono::steady_clock;

constexpr auto kStartTimeout = std::chrono::seconds(5);
constexpr auto kResponseMargin = std::chrono::milliseconds(2000);
constexpr double kHealthyCpuCeiling = 90.0;
constexpr int kThrottledNice = 19;
constexpr int kThrottleMemoryPercent = 75;

const std::vector<std::regex>& DenyList() {
  static const std::vector<std::regex> kPatterns = {
      std::regex(R"(require\s*\(\s*['"](child_process|fs)['"]\s*\))"),
      std::regex(R"(process\.exit)"),
      std::regex(R"(process\.kill)"),
      std::regex(R"(\beval\s*\()"),
      std::regex(R"(\bFunction\s*\()"),
      std::regex(R"(\bsetTimeout\s*\()"),
      std::regex(R"(\bsetInterval\s*\()"),
  };
  return kPatterns;
}

bool IsUnder(const std::filesystem::path& path, const std::filesystem::path& base) {
  if (base.empty()) {
    return false;
  }
  const auto rel = path.lexically_relative(base.lexically_normal());
  return !rel.empty() && *rel.begin() != "..";
}

bool HostMatches(const std::string& host, const std::string& pattern) {
  if (host == pattern) {
    return true;
  }
  return host.size() > pattern.size() && host.ends_with(pattern) &&
         host[host.size() - pattern.size() - 1] == '.';
}

orchestrator::EventSeverity EventSeverityFor(Severity severity) {
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

std::string FormatBytes(std::uint64_t bytes) {
  std::ostringstream out;
  out << (bytes / (1024 * 1024)) << "MB";
  return out.str();
}

// Fields after the parenthesised comm of /proc/<pid>/stat; index 0 is the state.
std::optional<std::vector<std::string>> ReadStatFields(pid_t pid) {
  std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
  std::string line;
  if (!in || !std::getline(in, line)) {
    return std::nullopt;
  }
  const auto close = line.rfind(')');
  if (close == std::string::npos) {
    return std::nullopt;
  }
  std::istringstream rest(line.substr(close + 1));
  std::vector<std::string> fields;
  std::string field;
  while (rest >> field) {
    fields.push_back(field);
  }
  if (fields.size() < 22) {
    return std::nullopt;
  }
  return fields;
}

std::uint64_t ToU64(const std::string& text) {
  std::uint64_t value = 0;
  if (!protocol::ParseUint64(text, value)) {
    return 0;
  }
  return value;
}

void ReadIoCounters(pid_t pid, std::uint64_t& read_bytes, std::uint64_t& write_bytes) {
  std::ifstream in("/proc/" + std::to_string(pid) + "/io");
  std::string key;
  std::uint64_t value = 0;
  while (in >> key >> value) {
    if (key == "read_bytes:") {
      read_bytes += value;
    } else if (key == "write_bytes:") {
      write_bytes += value;
    }
  }
}

void ReadNetworkCounters(pid_t pid, std::uint64_t& rx, std::uint64_t& tx) {
  std::ifstream in("/proc/" + std::to_string(pid) + "/net/dev");
  std::string line;
  int skipped = 0;
  while (std::getline(in, line)) {
    if (skipped < 2) {
      ++skipped;
      continue;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    std::string iface = line.substr(0, colon);
    iface.erase(0, iface.find_first_not_of(' '));
    if (iface == "lo") {
      continue;
    }
    std::istringstream counters(line.substr(colon + 1));
    std::array<std::uint64_t, 9> values{};
    for (auto& value : values) {
      if (!(counters >> value)) {
        break;
      }
    }
    rx += values[0];
    tx += values[8];
  }
}

} // namespace

std::string_view ToString(SandboxState state) noexcept {
  switch (state) {
  case SandboxState::kCreated:
    return "CREATED";
  case SandboxState::kStarting:
    return "STARTING";
  case SandboxState::kActive:
    return "ACTIVE";
  case SandboxState::kThrottled:
    return "THROTTLED";
  case SandboxState::kStopping:
    return "STOPPING";
  case SandboxState::kTerminated:
    return "TERMINATED";
  }
  return "UNKNOWN";
}

std::string_view ToString(ViolationType type) noexcept {
  switch (type) {
  case ViolationType::kResourceExhaustion:
    return "RESOURCE_EXHAUSTION";
  case ViolationType::kNetworkViolation:
    return "NETWORK_VIOLATION";
  case ViolationType::kFilesystemViolation:
    return "FILESYSTEM_VIOLATION";
  case ViolationType::kCodeInjection:
    return "CODE_INJECTION";
  case ViolationType::kPermissionDenied:
    return "PERMISSION_DENIED";
  case ViolationType::kProcessViolation:
    return "PROCESS_VIOLATION";
  case ViolationType::kUnitFailure:
    return "UNIT_FAILURE";
  }
  return "UNKNOWN";
}

std::string_view ToString(ExecutionStatus status) noexcept {
  switch (status) {
  case ExecutionStatus::kOk:
    return "OK";
  case ExecutionStatus::kError:
    return "ERROR";
  case ExecutionStatus::kTimeout:
    return "TIMEOUT";
  }
  return "UNKNOWN";
}

std::vector<pid_t> ProcessTree(pid_t root) {
  std::multimap<pid_t, pid_t> children;
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator("/proc", ec)) {
    const auto name = entry.path().filename().string();
    std::uint64_t pid = 0;
    if (!protocol::ParseUint64(name, pid)) {
      continue;
    }
    auto fields = ReadStatFields(static_cast<pid_t>(pid));
    if (!fields) {
      continue;
    }
    children.emplace(static_cast<pid_t>(ToU64((*fields)[1])), static_cast<pid_t>(pid));
  }
  std::vector<pid_t> tree{root};
  for (std::size_t i = 0; i < tree.size(); ++i) {
    auto [begin, end] = children.equal_range(tree[i]);
    for (auto it = begin; it != end; ++it) {
      tree.push_back(it->second);
    }
  }
  return tree;
}

std::optional<MetricSample> SampleProcessTree(pid_t root, std::uint64_t& previous_cpu_ticks,
                                              Steady::time_point& previous_at) {
  if (!ReadStatFields(root)) {
    return std::nullopt;
  }
  static const long kTicksPerSecond = ::sysconf(_SC_CLK_TCK);
  static const long kPageSize = ::sysconf(_SC_PAGESIZE);
  MetricSample sample;
  std::uint64_t ticks = 0;
  for (pid_t pid : ProcessTree(root)) {
    auto fields = ReadStatFields(pid);
    if (!fields) {
      continue;  // exited between the scan and the read
    }
    ticks += ToU64((*fields)[11]) + ToU64((*fields)[12]);
    sample.memory_bytes += ToU64((*fields)[21]) * static_cast<std::uint64_t>(kPageSize);
    ReadIoCounters(pid, sample.disk_read_bytes, sample.disk_write_bytes);
  }
  ReadNetworkCounters(root, sample.network_rx_bytes, sample.network_tx_bytes);

  const auto now = Steady::now();
  if (previous_at != Steady::time_point{} && ticks >= previous_cpu_ticks && kTicksPerSecond > 0) {
    const double elapsed = std::chrono::duration<double>(now - previous_at).count();
    if (elapsed > 0.0) {
      const double cpu_seconds =
          static_cast<double>(ticks - previous_cpu_ticks) / static_cast<double>(kTicksPerSecond);
      sample.cpu_percent = cpu_seconds / elapsed * 100.0;
    }
  }
  previous_cpu_ticks = ticks;
  previous_at = now;
  return sample;
}

Sandbox::Sandbox(std::string id, SandboxConfig config, orchestrator::EventBus& bus,
                 ViolationHandler handler, SandboxHooks hooks)
    : id_(std::move(id)),
      config_(std::move(config)),
      bus_(bus),
      handler_(std::move(handler)),
      hooks_(std::move(hooks)) {
  std::filesystem::path root = config_.root_dir;
  if (root.empty()) {
    root = std::filesystem::temp_directory_path();
  }
  sandbox_dir_ = root / ("pw-sandbox-" + id_);
  workspace_ = sandbox_dir_ / "workspace";
  temp_dir_ = sandbox_dir_ / "temp";
  log_dir_ = sandbox_dir_ / "logs";
}

Sandbox::~Sandbox() {
  Stop();
  if (metrics_thread_.joinable()) {
    metrics_thread_.join();
  }
  if (reader_.joinable()) {
    reader_.join();
  }
  if (channel_fd_ >= 0) {
    ::close(channel_fd_);
  }
}

std::filesystem::path Sandbox::ResolveUnitPath() const {
  if (!config_.unit_path.empty()) {
    return config_.unit_path;
  }
  if (const char* env = std::getenv("PW_SANDBOX_UNIT"); env != nullptr && *env != '\0') {
    return env;
  }
  std::error_code ec;
  auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec) {
    throw Error(ErrorDomain::Dependency, errors::io::kProcessSpawnFailed,
                "Unable to locate pw-sandbox-unit: " + ec.message(), ec.value());
  }
  return self.parent_path() / "pw-sandbox-unit";
}

void Sandbox::PrepareDirectories() {
  orchestrator::EnsurePrivateDirectory(sandbox_dir_);
  orchestrator::EnsurePrivateDirectory(workspace_);
  orchestrator::EnsurePrivateDirectory(temp_dir_);
  orchestrator::EnsurePrivateDirectory(log_dir_);
}

void Sandbox::LaunchUnit() {
  const auto unit = ResolveUnitPath();
  if (::access(unit.c_str(), X_OK) != 0) {
    const int err = errno;
    throw Error(ErrorDomain::Dependency, errors::io::kProcessSpawnFailed,
                "Sandbox unit not executable: " + unit.string(), err);
  }

  // argv is fully built before fork; the child only calls async-signal-safe functions.
  std::vector<std::string> args;
  args.push_back(unit.string());
  args.push_back("--workspace=" + workspace_.string());
  args.push_back("--temp=" + temp_dir_.string());
  args.push_back("--memory=" + std::to_string(config_.memory.limit_bytes));
  const auto cpu_seconds = (config_.cpu.cpu_time.count() + 999) / 1000;
  args.push_back("--cpu-seconds=" + std::to_string(cpu_seconds));
  args.push_back("--file-size=" + std::to_string(config_.disk.limit_bytes));
  args.push_back("--open-files=" + std::to_string(config_.disk.max_open_files));
  args.push_back("--max-processes=" + std::to_string(config_.max_processes));
  args.push_back("--nice=" + std::to_string(config_.cpu.priority));
  if (config_.network.allowed_hosts.empty()) {
    args.push_back("--isolate-network");
  }
  for (const auto& path : config_.filesystem.read_only_paths) {
    args.push_back("--read=" + path.string());
  }
  for (const auto& path : config_.filesystem.writable_paths) {
    args.push_back("--write=" + path.string());
  }
  args.push_back("--");
  for (const auto& part : config_.interpreter) {
    args.push_back(part);
  }
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  int sockets[2];
  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sockets) != 0) {
    const int err = errno;
    throw Error(ErrorDomain::IO, errors::io::kPipeFailed,
                std::string("socketpair failed: ") + std::strerror(err), err);
  }
  const auto log_path = log_dir_ / "unit.log";
  const int log_fd = ::open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
  if (log_fd < 0) {
    const int err = errno;
    ::close(sockets[0]);
    ::close(sockets[1]);
    throw Error(ErrorDomain::IO, errors::io::kFileWriteFailed,
                "Unable to open unit log " + log_path.string(), err);
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int err = errno;
    ::close(sockets[0]);
    ::close(sockets[1]);
    ::close(log_fd);
    throw Error(ErrorDomain::IO, errors::io::kProcessSpawnFailed,
                std::string("fork failed: ") + std::strerror(err), err);
  }
  if (pid == 0) {
    ::setpgid(0, 0);
    ::dup2(sockets[1], STDIN_FILENO);
    ::dup2(sockets[1], STDOUT_FILENO);
    ::dup2(log_fd, STDERR_FILENO);
    ::execv(argv[0], argv.data());
    ::_exit(127);
  }
  (void)::setpgid(pid, pid);  // EACCES once the child has exec'd; it already did this itself
  ::close(sockets[1]);
  ::close(log_fd);
  unit_pid_ = pid;
  channel_fd_ = sockets[0];
}

void Sandbox::Start() {
  auto expected = SandboxState::kCreated;
  if (!state_.compare_exchange_strong(expected, SandboxState::kStarting)) {
    throw Error(ErrorDomain::State, errors::state::kSandboxStartFailed,
                "Sandbox " + id_ + " cannot start from state " + std::string(ToString(expected)));
  }
  try {
    PrepareDirectories();
    LaunchUnit();
    reader_ = std::thread([this] { ReaderLoop(); });
    if (!Ping(std::chrono::duration_cast<std::chrono::milliseconds>(kStartTimeout))) {
      throw Error(ErrorDomain::State, errors::state::kSandboxStartFailed,
                  "Sandbox unit did not answer the startup ping");
    }
    state_.store(SandboxState::kActive);
    if (config_.monitoring.enabled) {
      metrics_thread_ = std::thread([this] { MetricsLoop(); });
    }
  } catch (const std::exception& ex) {
    state_.store(SandboxState::kStopping);
    FailPending(errors::state::kSandboxCancelled, errors::msg::kSandboxStopped);
    TerminateUnit();
    if (channel_fd_ >= 0) {
      ::shutdown(channel_fd_, SHUT_RDWR);
    }
    if (reader_.joinable()) {
      reader_.join();
    }
    if (channel_fd_ >= 0) {
      ::close(channel_fd_);
      channel_fd_ = -1;
    }
    RemoveDirectories();
    state_.store(SandboxState::kTerminated);
    throw Error(ErrorDomain::State, errors::state::kSandboxStartFailed,
                "Sandbox " + id_ + " failed to start: " + ex.what());
  }

  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kLifecycle;
  event.event_id = "sandbox_started";
  event.message = "Sandbox started";
  event.fields.emplace_back("sandbox_id", id_);
  event.fields.emplace_back("plugin_id", config_.plugin_id);
  event.fields.emplace_back("unit_pid", std::to_string(unit_pid_), orchestrator::FieldPrivacy::kPublic,
                            true);
  bus_.Publish(event);
}

std::future<protocol::ExecResponse> Sandbox::Register(const std::string& correlation_id) {
  auto call = std::make_shared<PendingCall>();
  auto future = call->promise.get_future();
  std::lock_guard<std::mutex> guard(calls_mutex_);
  // Stop publishes kStopping before it drains pending_ under this mutex.
  const auto state = state_.load();
  if (state == SandboxState::kStopping || state == SandboxState::kTerminated) {
    throw Error(ErrorDomain::State, errors::state::kSandboxCancelled,
                std::string(errors::msg::kSandboxStopped) + ": " + id_);
  }
  if (unit_exited_.load()) {
    throw Error(ErrorDomain::IO, errors::io::kUnitChannelBroken, std::string(errors::msg::kUnitChannelClosed));
  }
  pending_[correlation_id] = std::move(call);
  return future;
}

void Sandbox::Send(const std::string& frame) {
  std::lock_guard<std::mutex> guard(send_mutex_);
  if (channel_fd_ < 0 || !protocol::WriteAll(channel_fd_, frame)) {
    throw Error(ErrorDomain::IO, errors::io::kUnitChannelBroken, std::string(errors::msg::kUnitChannelClosed),
                errno);
  }
}

void Sandbox::FailPending(int code, std::string_view message) {
  std::map<std::string, std::shared_ptr<PendingCall>> pending;
  {
    std::lock_guard<std::mutex> guard(calls_mutex_);
    pending.swap(pending_);
  }
  const auto domain = code == errors::io::kUnitChannelBroken ? ErrorDomain::IO : ErrorDomain::State;
  for (auto& [id, call] : pending) {
    call->promise.set_exception(std::make_exception_ptr(Error(domain, code, std::string(message))));
  }
}

void Sandbox::ReaderLoop() {
  protocol::FrameReader reader(channel_fd_);
  for (;;) {
    auto line = reader.ReadLine();
    if (!line) {
      break;
    }
    if (line->rfind("WARN ", 0) == 0) {
      AddWarning(line->substr(5));
      continue;
    }
    const auto fields = protocol::SplitFields(*line);
    protocol::ExecResponse response;
    if (fields.size() == 2 && fields[0] == "PONG") {
      response.id = std::string(fields[1]);
      response.status = "pong";
    } else if (fields.size() == 7 && fields[0] == "RESULT") {
      response.id = std::string(fields[1]);
      response.status = std::string(fields[2]);
      std::uint64_t out_len = 0;
      std::uint64_t err_len = 0;
      const std::string_view exit_text = fields[3];
      const bool negative = !exit_text.empty() && exit_text.front() == '-';
      std::uint64_t exit_abs = 0;
      if (!protocol::ParseUint64(negative ? exit_text.substr(1) : exit_text, exit_abs) ||
          !protocol::ParseUint64(fields[4], response.duration_ms) ||
          !protocol::ParseUint64(fields[5], out_len) || !protocol::ParseUint64(fields[6], err_len) ||
          out_len > protocol::kMaxOutputBytes || err_len > protocol::kMaxOutputBytes) {
        std::clog << "[sandbox " << id_ << "] malformed RESULT frame" << std::endl;
        break;
      }
      response.exit_code = negative ? -static_cast<int>(exit_abs) : static_cast<int>(exit_abs);
      if (!reader.ReadExact(out_len, response.out) || !reader.ReadExact(err_len, response.err)) {
        break;
      }
    } else {
      std::clog << "[sandbox " << id_ << "] unexpected frame from unit" << std::endl;
      continue;
    }
    std::shared_ptr<PendingCall> call;
    {
      std::lock_guard<std::mutex> guard(calls_mutex_);
      auto it = pending_.find(response.id);
      if (it != pending_.end()) {
        call = std::move(it->second);
        pending_.erase(it);
      }
    }
    if (call) {
      call->promise.set_value(std::move(response));
    }
  }
  {
    std::lock_guard<std::mutex> guard(calls_mutex_);
    unit_exited_.store(true);
  }
  FailPending(errors::io::kUnitChannelBroken, errors::msg::kUnitChannelClosed);
  const auto state = state_.load();
  if (state == SandboxState::kActive || state == SandboxState::kThrottled) {
    AddWarning("Sandbox unit exited unexpectedly");
  }
}

bool Sandbox::Ping(std::chrono::milliseconds timeout) {
  try {
    const auto correlation_id = MakeId("ping");
    auto future = Register(correlation_id);
    Send("PING " + correlation_id + "\n");
    if (future.wait_for(timeout) != std::future_status::ready) {
      std::lock_guard<std::mutex> guard(calls_mutex_);
      pending_.erase(correlation_id);
      return false;
    }
    return future.get().status == "pong";
  } catch (const Error& err) {
    std::clog << "[sandbox " << id_ << "] ping failed: " << err.what() << std::endl;
    return false;
  }
}

ExecutionResult Sandbox::Execute(const std::string& code, const std::string& context,
                                 std::chrono::milliseconds timeout) {
  const auto state = state_.load();
  if (state != SandboxState::kActive && state != SandboxState::kThrottled) {
    throw Error(ErrorDomain::State, errors::state::kSandboxNotActive,
                std::string(errors::msg::kSandboxNotActive) + ": " + id_);
  }
  if (code.size() > protocol::kMaxCodeBytes) {
    throw Error(ErrorDomain::Security, errors::security::kCodeTooLarge, std::string(errors::msg::kCodeTooLarge));
  }
  if (context.size() > protocol::kMaxContextBytes) {
    throw Error(ErrorDomain::Security, errors::security::kContextTooLarge,
                std::string(errors::msg::kContextTooLarge));
  }
  for (const auto& pattern : DenyList()) {
    if (std::regex_search(code, pattern)) {
      ReportViolation(MakeViolation(ViolationType::kCodeInjection, Severity::kHigh,
                                    "Rejected code containing a denied primitive", true));
      throw Error(ErrorDomain::Security, errors::security::kCodeRejected,
                  std::string(errors::msg::kDangerousCode));
    }
  }

  protocol::ExecRequest request;
  request.id = MakeId("exec");
  request.timeout_ms = static_cast<std::uint32_t>(std::max<std::int64_t>(timeout.count(), 1));
  request.code = code;
  request.context = context;
  const auto started = Steady::now();
  auto future = Register(request.id);
  try {
    Send(protocol::EncodeRequest(request));
  } catch (const Error&) {
    {
      std::lock_guard<std::mutex> guard(calls_mutex_);
      pending_.erase(request.id);
    }
    const auto now_state = state_.load();
    if (now_state == SandboxState::kStopping || now_state == SandboxState::kTerminated) {
      throw Error(ErrorDomain::State, errors::state::kSandboxCancelled,
                  std::string(errors::msg::kSandboxStopped) + ": " + id_);
    }
    throw;
  }

  if (future.wait_for(timeout + kResponseMargin) != std::future_status::ready) {
    {
      std::lock_guard<std::mutex> guard(calls_mutex_);
      pending_.erase(request.id);
    }
    {
      std::lock_guard<std::mutex> guard(state_mutex_);
      ++metrics_.errors;
    }
    throw Error(ErrorDomain::State, errors::state::kExecutionTimeout,
                std::string(errors::msg::kExecutionTimedOut) + " after " + std::to_string(timeout.count()) +
                    "ms",
                std::nullopt, Retryability::kRetryable);
  }
  auto response = future.get();
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Steady::now() - started);

  ExecutionResult result;
  result.correlation_id = request.id;
  result.exit_code = response.exit_code;
  result.output = std::move(response.out);
  result.error_output = std::move(response.err);
  result.duration = elapsed;
  if (response.status == "ok") {
    result.status = ExecutionStatus::kOk;
  } else if (response.status == "timeout") {
    result.status = ExecutionStatus::kTimeout;
  } else {
    result.status = ExecutionStatus::kError;
  }
  {
    std::lock_guard<std::mutex> guard(state_mutex_);
    ++metrics_.executions;
    if (result.status != ExecutionStatus::kOk || result.exit_code != 0) {
      ++metrics_.errors;
    }
  }
  if (result.status == ExecutionStatus::kTimeout) {
    throw Error(ErrorDomain::State, errors::state::kExecutionTimeout,
                std::string(errors::msg::kExecutionTimedOut) + " after " + std::to_string(timeout.count()) +
                    "ms",
                std::nullopt, Retryability::kRetryable);
  }
  if (elapsed > config_.monitoring.alerts.response_time) {
    ReportViolation(MakeViolation(ViolationType::kResourceExhaustion, Severity::kMedium,
                                  "Execution took " + std::to_string(elapsed.count()) + "ms", false));
  }
  return result;
}

bool Sandbox::CheckNetworkAccess(const std::string& host, std::uint16_t port) {
  const auto& net = config_.network;
  std::string reason;
  if (std::find(net.blocked_ports.begin(), net.blocked_ports.end(), port) != net.blocked_ports.end()) {
    reason = "Port " + std::to_string(port) + " is blocked";
  } else if (std::any_of(net.blocked_hosts.begin(), net.blocked_hosts.end(),
                         [&](const std::string& blocked) { return HostMatches(host, blocked); })) {
    reason = "Host " + host + " is blocked";
  } else if (net.allowed_hosts.empty()) {
    reason = "Outbound network access is disabled";
  } else if (std::none_of(net.allowed_hosts.begin(), net.allowed_hosts.end(),
                          [&](const std::string& allowed) { return HostMatches(host, allowed); })) {
    reason = "Host " + host + " is not on the allow list";
  }
  if (reason.empty()) {
    return true;
  }
  ReportViolation(MakeViolation(ViolationType::kNetworkViolation, Severity::kHigh,
                                reason + " (" + host + ":" + std::to_string(port) + ")", true));
  return false;
}

bool Sandbox::CheckFileAccess(const std::filesystem::path& path, bool write) {
  static const std::array<std::filesystem::path, 5> kSystemReadPaths = {"/usr", "/lib", "/lib64", "/bin",
                                                                        "/etc"};
  const auto target =
      (path.is_absolute() ? path : workspace_ / path).lexically_normal();
  const auto& fs = config_.filesystem;
  auto under_any = [&target](const auto& bases) {
    return std::any_of(bases.begin(), bases.end(),
                       [&target](const std::filesystem::path& base) { return IsUnder(target, base); });
  };

  std::string reason;
  if (under_any(fs.blocked_paths)) {
    reason = "Path " + target.string() + " is blocked";
  } else {
    bool allowed = IsUnder(target, workspace_) || IsUnder(target, temp_dir_) || under_any(fs.writable_paths);
    if (!write && !allowed) {
      allowed = under_any(fs.read_only_paths) || under_any(kSystemReadPaths);
    }
    if (!allowed) {
      reason = std::string(write ? "Write" : "Read") + " outside the sandbox view: " + target.string();
    }
  }
  if (reason.empty()) {
    return true;
  }
  ReportViolation(MakeViolation(ViolationType::kFilesystemViolation, Severity::kHigh, reason, true));
  return false;
}

SecurityViolation Sandbox::MakeViolation(ViolationType type, Severity severity, std::string description,
                                         bool blocked) const {
  SecurityViolation violation;
  violation.id = MakeId("violation");
  violation.type = type;
  violation.severity = severity;
  violation.description = std::move(description);
  violation.blocked = blocked;
  violation.timestamp = Clock::now();
  violation.sandbox_id = id_;
  violation.plugin_id = config_.plugin_id;
  return violation;
}

void Sandbox::Publish(const SecurityViolation& violation) {
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kSecurity;
  event.severity = EventSeverityFor(violation.severity);
  event.event_id = "sandbox_violation";
  event.message = violation.description;
  event.fields.emplace_back("sandbox_id", violation.sandbox_id);
  event.fields.emplace_back("plugin_id", violation.plugin_id);
  event.fields.emplace_back("type", std::string(ToString(violation.type)));
  event.fields.emplace_back("severity", std::string(ToString(violation.severity)));
  event.fields.emplace_back("blocked", violation.blocked ? "true" : "false");
  bus_.Publish(event);
}

void Sandbox::ReportViolation(SecurityViolation violation) {
  if (violation.id.empty()) {
    violation.id = MakeId("violation");
  }
  if (violation.timestamp == TimePoint{}) {
    violation.timestamp = Clock::now();
  }
  violation.sandbox_id = id_;
  violation.plugin_id = config_.plugin_id;
  {
    std::lock_guard<std::mutex> guard(state_mutex_);
    violations_.push_back(violation);
  }
  try {
    Publish(violation);
  } catch (const std::exception& ex) {
    std::clog << "[sandbox " << id_ << "] violation event not published: " << ex.what() << std::endl;
  }

  if (violation.severity == Severity::kCritical) {
    Stop();
  } else if (violation.severity == Severity::kHigh) {
    Throttle();
  }
  if (handler_) {
    handler_(violation);
  }
}

void Sandbox::Throttle() {
  auto expected = SandboxState::kActive;
  if (!state_.compare_exchange_strong(expected, SandboxState::kThrottled)) {
    return;
  }
  if (unit_pid_ <= 0 || unit_exited_.load()) {
    return;
  }
  for (pid_t pid : ProcessTree(unit_pid_)) {
    if (::setpriority(PRIO_PROCESS, static_cast<id_t>(pid), kThrottledNice) != 0) {
      AddWarning("setpriority failed for pid " + std::to_string(pid) + ": " + std::strerror(errno));
    }
  }
  if (::setpriority(PRIO_PGRP, static_cast<id_t>(unit_pid_), kThrottledNice) != 0) {
    AddWarning(std::string("setpriority failed for the unit group: ") + std::strerror(errno));
  }
  // Only the soft limit moves so that Unthrottle can raise it again.
  rlimit limit{};
  if (::prlimit(unit_pid_, RLIMIT_AS, nullptr, &limit) == 0) {
    limit.rlim_cur = static_cast<rlim_t>(config_.memory.limit_bytes / 100 * kThrottleMemoryPercent);
    if (::prlimit(unit_pid_, RLIMIT_AS, &limit, nullptr) != 0) {
      AddWarning(std::string("prlimit failed while throttling: ") + std::strerror(errno));
    }
  }
  std::clog << "[sandbox " << id_ << "] throttled" << std::endl;
}

void Sandbox::Unthrottle() {
  auto expected = SandboxState::kThrottled;
  if (!state_.compare_exchange_strong(expected, SandboxState::kActive)) {
    return;
  }
  if (unit_pid_ <= 0 || unit_exited_.load()) {
    return;
  }
  rlimit limit{};
  if (::prlimit(unit_pid_, RLIMIT_AS, nullptr, &limit) == 0) {
    limit.rlim_cur = std::min<rlim_t>(static_cast<rlim_t>(config_.memory.limit_bytes), limit.rlim_max);
    if (::prlimit(unit_pid_, RLIMIT_AS, &limit, nullptr) != 0) {
      AddWarning(std::string("prlimit failed while restoring limits: ") + std::strerror(errno));
    }
  }
  std::clog << "[sandbox " << id_ << "] restored from throttling" << std::endl;
}

void Sandbox::RecordSample(const MetricSample& sample) {
  const auto& alerts = config_.monitoring.alerts;
  const auto now = Steady::now();
  std::vector<SecurityViolation> breaches;
  bool hard_breach = false;
  {
    std::lock_guard<std::mutex> guard(state_mutex_);
    metrics_.cpu_percent = sample.cpu_percent;
    metrics_.peak_cpu_percent = std::max(metrics_.peak_cpu_percent, sample.cpu_percent);
    metrics_.memory_bytes = sample.memory_bytes;
    metrics_.peak_memory_bytes = std::max(metrics_.peak_memory_bytes, sample.memory_bytes);
    metrics_.disk_read_bytes = std::max(metrics_.disk_read_bytes, sample.disk_read_bytes);
    metrics_.disk_write_bytes = std::max(metrics_.disk_write_bytes, sample.disk_write_bytes);
    metrics_.network_rx_bytes = std::max(metrics_.network_rx_bytes, sample.network_rx_bytes);
    metrics_.network_tx_bytes = std::max(metrics_.network_tx_bytes, sample.network_tx_bytes);
    ++metrics_.samples;
    metrics_.last_sample = Clock::now();

    const auto limit = config_.memory.limit_bytes;
    if (sample.memory_bytes > limit) {
      hard_breach = true;
      breaches.push_back(MakeViolation(ViolationType::kResourceExhaustion, Severity::kHigh,
                                       "Memory usage " + FormatBytes(sample.memory_bytes) + " exceeds limit " +
                                           FormatBytes(limit),
                                       false));
    } else if (static_cast<double>(sample.memory_bytes) >
               static_cast<double>(limit) * alerts.memory_percent / 100.0) {
      breaches.push_back(MakeViolation(ViolationType::kResourceExhaustion, Severity::kMedium,
                                       "Memory usage " + FormatBytes(sample.memory_bytes) + " above alert threshold",
                                       false));
    }
    if (sample.cpu_percent > alerts.cpu_percent) {
      breaches.push_back(MakeViolation(ViolationType::kResourceExhaustion, Severity::kMedium,
                                       "CPU usage " + std::to_string(static_cast<int>(sample.cpu_percent)) +
                                           "% above alert threshold",
                                       false));
    }
    if (previous_sample_) {
      const double seconds = std::max(std::chrono::duration<double>(now - previous_sample_at_).count(),
                                      std::chrono::duration<double>(config_.monitoring.metrics_interval).count());
      auto delta = [](std::uint64_t current, std::uint64_t previous) {
        return current > previous ? current - previous : 0;
      };
      const double disk_rate =
          static_cast<double>(delta(sample.disk_read_bytes, previous_sample_->disk_read_bytes) +
                              delta(sample.disk_write_bytes, previous_sample_->disk_write_bytes)) /
          seconds;
      const double net_rate =
          static_cast<double>(delta(sample.network_rx_bytes, previous_sample_->network_rx_bytes) +
                              delta(sample.network_tx_bytes, previous_sample_->network_tx_bytes)) /
          seconds;
      if (disk_rate > static_cast<double>(alerts.disk_bytes_per_sec)) {
        breaches.push_back(MakeViolation(ViolationType::kResourceExhaustion, Severity::kMedium,
                                         "Disk I/O rate " + std::to_string(static_cast<std::uint64_t>(disk_rate)) +
                                             " B/s above alert threshold",
                                         false));
      }
      if (net_rate > static_cast<double>(alerts.network_bytes_per_sec)) {
        breaches.push_back(MakeViolation(ViolationType::kResourceExhaustion, Severity::kMedium,
                                         "Network rate " + std::to_string(static_cast<std::uint64_t>(net_rate)) +
                                             " B/s above alert threshold",
                                         false));
      }
    }
    if (metrics_.errors - errors_at_last_sample_ > alerts.error_rate) {
      breaches.push_back(MakeViolation(ViolationType::kResourceExhaustion, Severity::kMedium,
                                       std::to_string(metrics_.errors - errors_at_last_sample_) +
                                           " execution errors in one sampling interval",
                                       false));
    }
    errors_at_last_sample_ = metrics_.errors;
    metrics_.warnings += breaches.size();
    previous_sample_ = sample;
    previous_sample_at_ = now;
  }

  for (auto& breach : breaches) {
    ReportViolation(std::move(breach));
  }
  if (!hard_breach) {
    Unthrottle();
  }
}

void Sandbox::MetricsLoop() {
  for (;;) {
    {
      std::unique_lock<std::mutex> lock(metrics_wait_mutex_);
      if (metrics_cv_.wait_for(lock, config_.monitoring.metrics_interval, [this] { return metrics_stop_; })) {
        return;
      }
    }
    try {
      std::optional<MetricSample> sample;
      if (hooks_.sampler) {
        sample = hooks_.sampler(unit_pid_);
      } else {
        sample = SampleProcessTree(unit_pid_, cpu_ticks_, cpu_ticks_at_);
      }
      if (sample) {
        RecordSample(*sample);
      }
    } catch (const std::exception& ex) {
      AddWarning(std::string("Metrics sample failed: ") + ex.what());
    }
  }
}

void Sandbox::AddWarning(std::string warning) {
  std::clog << "[sandbox " << id_ << "] " << warning << std::endl;
  std::lock_guard<std::mutex> guard(state_mutex_);
  warnings_.push_back(std::move(warning));
}

void Sandbox::TerminateUnit() noexcept {
  if (unit_pid_ <= 0) {
    return;
  }
  // The tree is captured before the unit dies; orphans are reparented afterwards.
  std::vector<pid_t> tree;
  try {
    tree = ProcessTree(unit_pid_);
    std::lock_guard<std::mutex> guard(send_mutex_);
    if (channel_fd_ >= 0 && !unit_exited_.load() && !protocol::WriteAll(channel_fd_, "QUIT\n")) {
      std::clog << "[sandbox " << id_ << "] unit channel closed before QUIT" << std::endl;
    }
  } catch (const std::exception& ex) {
    std::clog << "[sandbox " << id_ << "] process scan failed: " << ex.what() << std::endl;
  }
  ::kill(-unit_pid_, SIGTERM);
  int status = 0;
  bool reaped = false;
  const auto deadline = Steady::now() + config_.grace_period;
  while (Steady::now() < deadline) {
    const pid_t rc = ::waitpid(unit_pid_, &status, WNOHANG);
    if (rc == unit_pid_ || (rc < 0 && errno == ECHILD)) {
      reaped = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  for (pid_t pid : tree) {
    if (pid != unit_pid_) {
      ::kill(pid, SIGKILL);
      ::kill(-pid, SIGKILL);
    }
  }
  if (!reaped) {
    ::kill(-unit_pid_, SIGKILL);
    ::kill(unit_pid_, SIGKILL);
    while (::waitpid(unit_pid_, &status, 0) < 0 && errno == EINTR) {
    }
  }
  unit_exited_.store(true);
}

void Sandbox::RemoveDirectories() noexcept {
  std::error_code ec;
  std::filesystem::remove_all(sandbox_dir_, ec);
  if (ec) {
    std::clog << "{\"event\":\"sandbox_cleanup_failed\",\"sandbox_id\":\"" << id_ << "\",\"error_code\":"
              << ec.value() << "}" << std::endl;
  }
}

void Sandbox::Stop() noexcept {
  {
    std::lock_guard<std::mutex> stop_guard(stop_mutex_);
    const auto current = state_.load();
    if (current == SandboxState::kTerminated || current == SandboxState::kStopping) {
      return;
    }
    if (current == SandboxState::kCreated) {
      state_.store(SandboxState::kTerminated);
      return;
    }
    state_.store(SandboxState::kStopping);
    try {
      FailPending(errors::state::kSandboxCancelled, errors::msg::kSandboxStopped);
      {
        std::lock_guard<std::mutex> guard(metrics_wait_mutex_);
        metrics_stop_ = true;
      }
      metrics_cv_.notify_all();
      // Joined by the destructor when Stop runs on the thread itself.
      if (metrics_thread_.joinable() && metrics_thread_.get_id() != std::this_thread::get_id()) {
        metrics_thread_.join();
      }
      TerminateUnit();
      bool reader_joined = true;
      if (reader_.joinable()) {
        if (reader_.get_id() == std::this_thread::get_id()) {
          reader_joined = false;
        } else {
          if (channel_fd_ >= 0) {
            ::shutdown(channel_fd_, SHUT_RDWR);
          }
          reader_.join();
        }
      }
      if (reader_joined && channel_fd_ >= 0) {
        ::close(channel_fd_);
        channel_fd_ = -1;
      }
    } catch (const std::exception& ex) {
      std::clog << "{\"event\":\"sandbox_stop_error\",\"sandbox_id\":\"" << id_ << "\",\"message\":\""
                << ex.what() << "\"}" << std::endl;
    }
    RemoveDirectories();
    state_.store(SandboxState::kTerminated);
  }

  try {
    orchestrator::Event event;
    event.category = orchestrator::EventCategory::kLifecycle;
    event.event_id = "sandbox_stopped";
    event.message = "Sandbox stopped";
    event.fields.emplace_back("sandbox_id", id_);
    event.fields.emplace_back("plugin_id", config_.plugin_id);
    bus_.Publish(event);
  } catch (const std::exception& ex) {
    std::clog << "[sandbox " << id_ << "] stop event not published: " << ex.what() << std::endl;
  }
}

bool Sandbox::IsHealthy() const {
  const auto state = state_.load();
  if (state != SandboxState::kActive && state != SandboxState::kThrottled) {
    return false;
  }
  {
    std::lock_guard<std::mutex> guard(state_mutex_);
    if (metrics_.memory_bytes >= config_.memory.limit_bytes || metrics_.cpu_percent > kHealthyCpuCeiling) {
      return false;
    }
  }
  return !unit_exited_.load() && unit_pid_ > 0 && ::kill(unit_pid_, 0) == 0;
}

SandboxMetrics Sandbox::Metrics() const {
  std::lock_guard<std::mutex> guard(state_mutex_);
  return metrics_;
}

std::vector<SecurityViolation> Sandbox::Violations() const {
  std::lock_guard<std::mutex> guard(state_mutex_);
  return violations_;
}

std::vector<std::string> Sandbox::Warnings() const {
  std::lock_guard<std::mutex> guard(state_mutex_);
  return warnings_;
}

} // namespace pw::sandbox

// pw-sandbox-unit: the isolated execution unit started by pw::sandbox::Sandbox.
// It confines itself (rlimits, priority, network namespace, Landlock), then
// serves EXEC/PING requests on stdin/stdout, running each request in a fresh
// interpreter process.

#include <algorithm>
#include <array>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fcntl.h>
#include <linux/landlock.h>
#include <poll.h>
#include <sched.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include "pw/sandbox/unit_protocol.h"

namespace {

namespace protocol = pw::sandbox::protocol;

constexpr int kExitOk = 0;
constexpr int kExitUsage = 64;
constexpr int kExitIO = 74;

volatile sig_atomic_t g_worker_pgid = 0;

struct UnitOptions {
  std::filesystem::path workspace;
  std::filesystem::path temp;
  std::uint64_t memory_bytes{0};
  std::uint64_t cpu_seconds{0};
  std::uint64_t file_size_bytes{0};
  std::uint64_t open_files{0};
  std::uint64_t max_processes{0};
  int nice_value{0};
  bool isolate_network{false};
  std::vector<std::filesystem::path> read_paths;
  std::vector<std::filesystem::path> write_paths;
  std::vector<std::string> interpreter;
};

void PrintUsage() {
  std::cerr << "Usage: pw-sandbox-unit --workspace=<dir> --temp=<dir> [--memory=<bytes>]\n"
               "       [--cpu-seconds=<n>] [--file-size=<bytes>] [--open-files=<n>]\n"
               "       [--max-processes=<n>] [--nice=<n>] [--isolate-network]\n"
               "       [--read=<path>]... [--write=<path>]... -- <interpreter> [args...]\n";
}

bool ParseNumber(std::string_view text, std::uint64_t& value) {
  return protocol::ParseUint64(text, value);
}

std::optional<UnitOptions> ParseArgs(int argc, char** argv) {
  UnitOptions options;
  int index = 1;
  for (; index < argc; ++index) {
    std::string_view arg = argv[index];
    if (arg == "--") {
      ++index;
      break;
    }
    auto value_of = [&arg](std::string_view flag) -> std::optional<std::string_view> {
      if (arg.rfind(flag, 0) == 0) {
        return arg.substr(flag.size());
      }
      return std::nullopt;
    };
    if (auto v = value_of("--workspace=")) {
      options.workspace = std::string(*v);
    } else if (auto v = value_of("--temp=")) {
      options.temp = std::string(*v);
    } else if (auto v = value_of("--memory=")) {
      if (!ParseNumber(*v, options.memory_bytes)) return std::nullopt;
    } else if (auto v = value_of("--cpu-seconds=")) {
      if (!ParseNumber(*v, options.cpu_seconds)) return std::nullopt;
    } else if (auto v = value_of("--file-size=")) {
      if (!ParseNumber(*v, options.file_size_bytes)) return std::nullopt;
    } else if (auto v = value_of("--open-files=")) {
      if (!ParseNumber(*v, options.open_files)) return std::nullopt;
    } else if (auto v = value_of("--max-processes=")) {
      if (!ParseNumber(*v, options.max_processes)) return std::nullopt;
    } else if (auto v = value_of("--nice=")) {
      auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), options.nice_value);
      if (ec != std::errc() || ptr != v->data() + v->size()) return std::nullopt;
    } else if (arg == "--isolate-network") {
      options.isolate_network = true;
    } else if (auto v = value_of("--read=")) {
      options.read_paths.emplace_back(std::string(*v));
    } else if (auto v = value_of("--write=")) {
      options.write_paths.emplace_back(std::string(*v));
    } else {
      return std::nullopt;
    }
  }
  for (; index < argc; ++index) {
    options.interpreter.emplace_back(argv[index]);
  }
  if (options.workspace.empty() || options.temp.empty() || options.interpreter.empty()) {
    return std::nullopt;
  }
  return options;
}

void Warn(const std::string& text) {
  std::string line = "WARN " + text;
  for (auto& c : line) {
    if (c == '\n') c = ' ';
  }
  line.push_back('\n');
  if (!protocol::WriteAll(STDOUT_FILENO, line)) {
    std::cerr << "[sandbox-unit] host channel unavailable" << std::endl;
  }
  std::cerr << "[sandbox-unit] " << text << std::endl;
}

void ApplyLimit(int resource, std::uint64_t value, const char* name) {
  if (value == 0) {
    return;
  }
  rlimit limit{};
  limit.rlim_cur = static_cast<rlim_t>(value);
  limit.rlim_max = static_cast<rlim_t>(value);
  if (::setrlimit(resource, &limit) != 0) {
    Warn(std::string("setrlimit ") + name + " failed: " + std::strerror(errno));
  }
}

void IsolateNetwork() {
  int flags = CLONE_NEWNET;
  if (::geteuid() != 0) {
    flags |= CLONE_NEWUSER;
  }
  if (::unshare(flags) != 0) {
    Warn(std::string("network namespace unavailable: ") + std::strerror(errno));
  }
}

#ifdef SYS_landlock_create_ruleset
constexpr std::uint64_t kReadExecAccess =
    LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_READ_FILE | LANDLOCK_ACCESS_FS_READ_DIR;
constexpr std::uint64_t kFileAccess = LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_WRITE_FILE |
                                      LANDLOCK_ACCESS_FS_READ_FILE;
constexpr std::uint64_t kAllAccess =
    LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_WRITE_FILE | LANDLOCK_ACCESS_FS_READ_FILE |
    LANDLOCK_ACCESS_FS_READ_DIR | LANDLOCK_ACCESS_FS_REMOVE_DIR | LANDLOCK_ACCESS_FS_REMOVE_FILE |
    LANDLOCK_ACCESS_FS_MAKE_CHAR | LANDLOCK_ACCESS_FS_MAKE_DIR | LANDLOCK_ACCESS_FS_MAKE_REG |
    LANDLOCK_ACCESS_FS_MAKE_SOCK | LANDLOCK_ACCESS_FS_MAKE_FIFO | LANDLOCK_ACCESS_FS_MAKE_BLOCK |
    LANDLOCK_ACCESS_FS_MAKE_SYM;

bool AddPathRule(int ruleset_fd, const std::filesystem::path& path, std::uint64_t access) {
  const int fd = ::open(path.c_str(), O_PATH | O_CLOEXEC);
  if (fd < 0) {
    return false;  // missing system paths are skipped
  }
  std::error_code ec;
  if (!std::filesystem::is_directory(path, ec)) {
    access &= kFileAccess;
  }
  landlock_path_beneath_attr attr{};
  attr.allowed_access = access;
  attr.parent_fd = fd;
  const long rc = ::syscall(SYS_landlock_add_rule, ruleset_fd, LANDLOCK_RULE_PATH_BENEATH, &attr, 0);
  ::close(fd);
  return rc == 0;
}

void RestrictFilesystem(const UnitOptions& options) {
  landlock_ruleset_attr ruleset{};
  ruleset.handled_access_fs = kAllAccess;
  const long ruleset_fd =
      ::syscall(SYS_landlock_create_ruleset, &ruleset, sizeof(ruleset), 0);
  if (ruleset_fd < 0) {
    Warn(std::string("Landlock unavailable: ") + std::strerror(errno));
    return;
  }
  const int fd = static_cast<int>(ruleset_fd);
  static constexpr std::array<const char*, 8> kSystemPaths = {
      "/usr", "/lib", "/lib64", "/bin", "/sbin", "/etc", "/proc", "/dev"};
  for (const char* path : kSystemPaths) {
    AddPathRule(fd, path, kReadExecAccess);
  }
  AddPathRule(fd, "/dev/null", kFileAccess);
  const std::filesystem::path interpreter_dir =
      std::filesystem::path(options.interpreter.front()).parent_path();
  if (!interpreter_dir.empty()) {
    AddPathRule(fd, interpreter_dir, kReadExecAccess);
  }
  for (const auto& path : options.read_paths) {
    AddPathRule(fd, path, kReadExecAccess);
  }
  bool writable_ok = AddPathRule(fd, options.workspace, kAllAccess);
  writable_ok = AddPathRule(fd, options.temp, kAllAccess) && writable_ok;
  for (const auto& path : options.write_paths) {
    AddPathRule(fd, path, kAllAccess);
  }
  if (!writable_ok) {
    Warn("Landlock rule for workspace could not be added");
  }
  if (::syscall(SYS_landlock_restrict_self, fd, 0) != 0) {
    Warn(std::string("Landlock restriction failed: ") + std::strerror(errno));
  }
  ::close(fd);
}
#else
void RestrictFilesystem(const UnitOptions&) {
  Warn("Landlock not supported by this build");
}
#endif

void Confine(const UnitOptions& options) {
  ApplyLimit(RLIMIT_AS, options.memory_bytes, "RLIMIT_AS");
  ApplyLimit(RLIMIT_CPU, options.cpu_seconds, "RLIMIT_CPU");
  ApplyLimit(RLIMIT_FSIZE, options.file_size_bytes, "RLIMIT_FSIZE");
  ApplyLimit(RLIMIT_NOFILE, options.open_files, "RLIMIT_NOFILE");
  ApplyLimit(RLIMIT_NPROC, options.max_processes, "RLIMIT_NPROC");
  if (options.nice_value != 0) {
    errno = 0;
    if (::nice(options.nice_value) == -1 && errno != 0) {
      Warn(std::string("nice failed: ") + std::strerror(errno));
    }
  }
  if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
    Warn(std::string("PR_SET_NO_NEW_PRIVS failed: ") + std::strerror(errno));
  }
  if (options.isolate_network) {
    IsolateNetwork();
  }
  RestrictFilesystem(options);
}

void HandleTerminate(int) {
  const pid_t worker = static_cast<pid_t>(g_worker_pgid);
  if (worker > 0) {
    ::kill(-worker, SIGKILL);
  }
  ::_exit(0);
}

std::uint64_t ElapsedMs(std::chrono::steady_clock::time_point started) {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::steady_clock::now() - started)
                                        .count());
}

void AppendCapped(std::string& target, const char* data, std::size_t size) {
  if (target.size() < protocol::kMaxOutputBytes) {
    target.append(data, std::min(size, protocol::kMaxOutputBytes - target.size()));
  }
}

protocol::ExecResponse RunRequest(const UnitOptions& options, const protocol::ExecRequest& request) {
  protocol::ExecResponse response;
  response.id = request.id;
  const auto started = std::chrono::steady_clock::now();

  int out_pipe[2];
  int err_pipe[2];
  if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
    response.status = "error";
    response.exit_code = -1;
    response.err = std::string("pipe failed: ") + std::strerror(errno);
    return response;
  }
  if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
    response.status = "error";
    response.exit_code = -1;
    response.err = std::string("pipe failed: ") + std::strerror(errno);
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    return response;
  }

  // argv and envp are built before fork.
  std::vector<std::string> args = options.interpreter;
  args.push_back(request.code);
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  std::vector<std::string> env = {
      "PATH=/usr/local/bin:/usr/bin:/bin",
      "HOME=" + options.workspace.string(),
      "TMPDIR=" + options.temp.string(),
      "PW_CONTEXT=" + request.context,
  };
  std::vector<char*> envp;
  for (auto& entry : env) {
    envp.push_back(entry.data());
  }
  envp.push_back(nullptr);
  const int null_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

  const pid_t pid = ::fork();
  if (pid < 0) {
    response.status = "error";
    response.exit_code = -1;
    response.err = std::string("fork failed: ") + std::strerror(errno);
  } else if (pid == 0) {
    ::setpgid(0, 0);
    if (null_fd >= 0) {
      ::dup2(null_fd, STDIN_FILENO);
    }
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    if (::chdir(options.workspace.c_str()) != 0) {
      ::_exit(126);
    }
    ::execve(argv[0], argv.data(), envp.data());
    ::_exit(127);
  }
  if (null_fd >= 0) {
    ::close(null_fd);
  }
  ::close(out_pipe[1]);
  ::close(err_pipe[1]);
  if (pid < 0) {
    ::close(out_pipe[0]);
    ::close(err_pipe[0]);
    return response;
  }
  ::setpgid(pid, pid);
  g_worker_pgid = pid;

  const auto deadline = started + std::chrono::milliseconds(request.timeout_ms);
  std::array<pollfd, 2> fds{{{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}}};
  int open_streams = 2;
  bool timed_out = false;
  char chunk[8192];
  while (open_streams > 0) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      timed_out = true;
      break;
    }
    const int ready = ::poll(fds.data(), fds.size(), static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    for (std::size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      const ssize_t got = ::read(fds[i].fd, chunk, sizeof(chunk));
      if (got > 0) {
        AppendCapped(i == 0 ? response.out : response.err, chunk, static_cast<std::size_t>(got));
      } else if (got == 0 || errno != EINTR) {
        ::close(fds[i].fd);
        fds[i].fd = -1;
        --open_streams;
      }
    }
  }
  if (timed_out) {
    ::kill(-pid, SIGKILL);
  }
  for (auto& entry : fds) {
    if (entry.fd >= 0) {
      ::close(entry.fd);
    }
  }
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
  g_worker_pgid = 0;

  response.duration_ms = ElapsedMs(started);
  if (timed_out) {
    response.status = "timeout";
    response.exit_code = -1;
  } else if (WIFEXITED(status)) {
    response.status = "ok";
    response.exit_code = WEXITSTATUS(status);
  } else {
    response.status = "error";
    response.exit_code = WIFSIGNALED(status) ? 128 + WTERMSIG(status) : -1;
  }
  return response;
}

int Serve(const UnitOptions& options) {
  protocol::FrameReader reader(STDIN_FILENO);
  for (;;) {
    auto line = reader.ReadLine();
    if (!line) {
      return kExitOk;
    }
    const auto fields = protocol::SplitFields(*line);
    if (fields.empty()) {
      continue;
    }
    if (fields[0] == "QUIT") {
      return kExitOk;
    }
    if (fields[0] == "PING" && fields.size() == 2) {
      if (!protocol::WriteAll(STDOUT_FILENO, "PONG " + std::string(fields[1]) + "\n")) {
        return kExitIO;
      }
      continue;
    }
    if (fields[0] != "EXEC" || fields.size() != 5) {
      std::cerr << "[sandbox-unit] unknown request: " << fields[0] << std::endl;
      return kExitUsage;
    }
    protocol::ExecRequest request;
    request.id = std::string(fields[1]);
    std::uint64_t timeout_ms = 0;
    std::uint64_t code_len = 0;
    std::uint64_t ctx_len = 0;
    if (!protocol::ParseUint64(fields[2], timeout_ms) || !protocol::ParseUint64(fields[3], code_len) ||
        !protocol::ParseUint64(fields[4], ctx_len) || code_len > protocol::kMaxCodeBytes ||
        ctx_len > protocol::kMaxContextBytes) {
      std::cerr << "[sandbox-unit] malformed EXEC header" << std::endl;
      return kExitUsage;
    }
    request.timeout_ms = static_cast<std::uint32_t>(std::min<std::uint64_t>(timeout_ms, UINT32_MAX));
    if (!reader.ReadExact(code_len, request.code) || !reader.ReadExact(ctx_len, request.context)) {
      return kExitIO;
    }
    const auto response = RunRequest(options, request);
    if (!protocol::WriteAll(STDOUT_FILENO, protocol::EncodeResponse(response))) {
      return kExitIO;
    }
  }
}

} // namespace

int main(int argc, char** argv) {
  try {
    auto options = ParseArgs(argc, argv);
    if (!options) {
      PrintUsage();
      return kExitUsage;
    }
    struct sigaction action{};
    action.sa_handler = HandleTerminate;
    sigemptyset(&action.sa_mask);
    ::sigaction(SIGTERM, &action, nullptr);
    ::signal(SIGPIPE, SIG_IGN);

    Confine(*options);
    return Serve(*options);
  } catch (const std::exception& ex) {
    std::cerr << "[sandbox-unit] fatal: " << ex.what() << std::endl;
    return kExitIO;
  }
}

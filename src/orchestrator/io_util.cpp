#include "pw/orchestrator/io_util.h"

#include "pw/crypto/random.h"  // TSK140_Temporary_File_Security entropy for temp tokens

#include <array>
#include <cerrno>
#include <chrono>   // TSK101_File_IO_Persistence retry backoff
#include <cstdio>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "pw/types.h"

namespace pw::orchestrator {
namespace {

constexpr const char* kAtomicReplaceErrorMessage = "Atomic file replace failed";

class ErrorContext { // TSK109_Error_Code_Handling accumulate nested call context
 public:
  void Push(std::string context) { context_stack_.push_back(std::move(context)); }
  void Pop() {
    if (!context_stack_.empty()) {
      context_stack_.pop_back();
    }
  }
  [[nodiscard]] std::vector<std::string> Stack() const { return context_stack_; }
  [[nodiscard]] std::string Format(std::string_view message) const {
    std::ostringstream oss;
    oss << message;
    for (auto it = context_stack_.rbegin(); it != context_stack_.rend(); ++it) {
      oss << "\n  while: " << *it;
    }
    return oss.str();
  }

 private:
  std::vector<std::string> context_stack_;
};

class ScopedErrorContext {
 public:
  ScopedErrorContext(ErrorContext& ctx, std::string description) : ctx_(ctx) {
    ctx_.Push(std::move(description));
  }
  ScopedErrorContext(const ScopedErrorContext&) = delete;
  ScopedErrorContext& operator=(const ScopedErrorContext&) = delete;
  ~ScopedErrorContext() { ctx_.Pop(); }

 private:
  ErrorContext& ctx_;
};

Retryability ClassifyNativeError(int native) { // TSK109_Error_Code_Handling retry taxonomy
  switch (native) {
    case EINTR:
    case EAGAIN:
      return Retryability::kRetryable;
    case EBUSY:
    case ETIMEDOUT:
      return Retryability::kTransient;
    default:
      break;
  }
  return Retryability::kFatal;
}

[[noreturn]] void ThrowIoError(const ErrorContext& ctx, int code, std::string message,
                               std::optional<int> native = std::nullopt) {
  const Retryability retry = native ? ClassifyNativeError(*native) : Retryability::kFatal;
  throw Error{ErrorDomain::IO, code, ctx.Format(std::move(message)), native, retry, ctx.Stack()};
}

void SyncDirectory(const std::filesystem::path& dir, const ErrorContext& ctx) {
  int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dir_fd < 0) {
    const int saved_errno = errno;
    ThrowIoError(ctx, errors::io::kFileWriteFailed,
                 std::string(kAtomicReplaceErrorMessage) + ": open directory failed", saved_errno);
  }
  if (::fsync(dir_fd) != 0) {
    const int err = errno;  // snapshot before close
    ::close(dir_fd);
    ThrowIoError(ctx, errors::io::kFileWriteFailed,
                 std::string(kAtomicReplaceErrorMessage) + ": directory flush failed", err);
  }
  ::close(dir_fd);
}

void SyncFileWithRetry(int fd, const ErrorContext& ctx) { // TSK101_File_IO_Persistence durability retry loop
  constexpr int kMaxRetries = 4;
  std::chrono::milliseconds backoff{5};
  for (int attempt = 0;; ++attempt) {
    if (::fsync(fd) == 0) {
      return;
    }
    const int saved_errno = errno;
    if (saved_errno == EINTR) {
      continue;
    }
    if (attempt >= kMaxRetries || (saved_errno != EAGAIN && saved_errno != EBUSY)) {
      ThrowIoError(ctx, errors::io::kFileWriteFailed,
                   std::string(kAtomicReplaceErrorMessage) + ": fsync failed", saved_errno);
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

void WriteAll(int fd, std::span<const std::uint8_t> payload, const ErrorContext& ctx) {
  std::size_t written = 0;
  while (written < payload.size()) {
    const ssize_t chunk = ::write(fd, payload.data() + written, payload.size() - written);
    if (chunk < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      ThrowIoError(ctx, errors::io::kFileWriteFailed,
                   std::string(kAtomicReplaceErrorMessage) + ": write failed", saved_errno);
    }
    written += static_cast<std::size_t>(chunk);
  }
}

std::filesystem::path TempSibling(const std::filesystem::path& target) { // TSK140_Temporary_File_Security
  std::array<std::uint8_t, 8> token{};
  crypto::SystemRandomBytes(token);
  auto name = target.filename().string() + ".tmp-" + HexEncode(token.data(), token.size());
  return target.parent_path() / name;
}

} // namespace

void AtomicReplace(const std::filesystem::path& target, std::span<const std::uint8_t> payload,
                   const AtomicReplaceHooks& hooks) {
  ErrorContext ctx;
  ScopedErrorContext scoped(ctx, "replacing " + target.string());
  auto dir = target.parent_path();
  if (dir.empty()) {
    dir = std::filesystem::current_path();
  }
  const auto temp = TempSibling(target);
  int fd = ::open(temp.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_TRUNC | O_CLOEXEC, 0600);
  if (fd < 0) {
    const int saved_errno = errno;
    ThrowIoError(ctx, errors::io::kFileWriteFailed,
                 std::string(kAtomicReplaceErrorMessage) + ": temp create failed", saved_errno);
  }
  try {
    WriteAll(fd, payload, ctx);
    SyncFileWithRetry(fd, ctx);
  } catch (const Error&) {
    ::close(fd);
    std::error_code ec;
    std::filesystem::remove(temp, ec);
    throw;
  }
  if (::close(fd) != 0) {
    const int saved_errno = errno;
    std::error_code ec;
    std::filesystem::remove(temp, ec);
    ThrowIoError(ctx, errors::io::kFileWriteFailed,
                 std::string(kAtomicReplaceErrorMessage) + ": close failed", saved_errno);
  }
  if (hooks.before_rename) {
    hooks.before_rename(temp, target);
  }
  if (::rename(temp.c_str(), target.c_str()) != 0) {
    const int saved_errno = errno;
    std::error_code ec;
    std::filesystem::remove(temp, ec);
    ThrowIoError(ctx, errors::io::kFileWriteFailed,
                 std::string(kAtomicReplaceErrorMessage) + ": rename failed", saved_errno);
  }
  SyncDirectory(dir, ctx);
}

void AtomicReplace(const std::filesystem::path& target, std::string_view text,
                   const AtomicReplaceHooks& hooks) {
  AtomicReplace(target,
                std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()),
                                              text.size()),
                hooks);
}

std::string ReadFileText(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    const int saved_errno = errno;
    throw Error{ErrorDomain::IO, errors::io::kFileUnreadable, "Unable to open " + path.string(),
                saved_errno != 0 ? std::optional<int>(saved_errno) : std::nullopt};
  }
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw Error{ErrorDomain::IO, errors::io::kFileUnreadable, "Unable to read " + path.string()};
  }
  return content;
}

void EnsurePrivateDirectory(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kDirectoryCreateFailed,
                "Unable to create directory " + dir.string() + ": " + ec.message(), ec.value(),
                ClassifyNativeError(ec.value())};
  }
  std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kDirectoryCreateFailed,
                "Unable to restrict directory " + dir.string() + ": " + ec.message(), ec.value()};
  }
}

}  // namespace pw::orchestrator

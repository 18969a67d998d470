#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Line-framed protocol between the sandbox host and pw-sandbox-unit:
//   host -> unit   EXEC <id> <timeout_ms> <code_len> <ctx_len>\n<code><ctx>
//                  PING <id>\n
//                  QUIT\n
//   unit -> host   RESULT <id> <ok|error|timeout> <exit> <duration_ms> <out_len> <err_len>\n<out><err>
//                  PONG <id>\n
//                  WARN <text>\n
namespace pw::sandbox::protocol {

inline constexpr std::size_t kMaxCodeBytes = 1000000;
inline constexpr std::size_t kMaxContextBytes = 10 * 1024;
inline constexpr std::size_t kMaxOutputBytes = 1024 * 1024;
inline constexpr std::size_t kMaxLineBytes = 4096;

struct ExecRequest {
  std::string id;
  std::uint32_t timeout_ms{0};
  std::string code;
  std::string context;
};

struct ExecResponse {
  std::string id;
  std::string status;  // ok, error, timeout
  int exit_code{0};
  std::uint64_t duration_ms{0};
  std::string out;
  std::string err;
};

std::string EncodeRequest(const ExecRequest& request);
std::string EncodeResponse(const ExecResponse& response);

std::vector<std::string_view> SplitFields(std::string_view line);
bool ParseUint64(std::string_view text, std::uint64_t& value);

// Blocking buffered reader over a file descriptor.
class FrameReader {
 public:
  explicit FrameReader(int fd) : fd_(fd) {}

  // nullopt on EOF, error or an over-long line.
  std::optional<std::string> ReadLine();
  bool ReadExact(std::size_t size, std::string& out);

 private:
  bool Fill();

  int fd_;
  std::string buffer_;
  std::size_t offset_{0};
};

// Writes everything, retrying on EINTR; never raises SIGPIPE on sockets.
bool WriteAll(int fd, std::string_view data);

} // namespace pw::sandbox::protocol

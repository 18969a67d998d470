#include "pw/sandbox/unit_protocol.h"

#include <cerrno>
#include <charconv>

#include <sys/socket.h>
#include <unistd.h>

namespace pw::sandbox::protocol {

std::string EncodeRequest(const ExecRequest& request) {
  std::string out = "EXEC " + request.id + " " + std::to_string(request.timeout_ms) + " " +
                    std::to_string(request.code.size()) + " " +
                    std::to_string(request.context.size()) + "\n";
  out += request.code;
  out += request.context;
  return out;
}

std::string EncodeResponse(const ExecResponse& response) {
  std::string out = "RESULT " + response.id + " " + response.status + " " +
                    std::to_string(response.exit_code) + " " +
                    std::to_string(response.duration_ms) + " " +
                    std::to_string(response.out.size()) + " " + std::to_string(response.err.size()) +
                    "\n";
  out += response.out;
  out += response.err;
  return out;
}

std::vector<std::string_view> SplitFields(std::string_view line) {
  std::vector<std::string_view> fields;
  std::size_t pos = 0;
  while (pos < line.size()) {
    const auto start = line.find_first_not_of(' ', pos);
    if (start == std::string_view::npos) {
      break;
    }
    const auto end = line.find(' ', start);
    fields.push_back(line.substr(start, end == std::string_view::npos ? end : end - start));
    pos = end == std::string_view::npos ? line.size() : end;
  }
  return fields;
}

bool ParseUint64(std::string_view text, std::uint64_t& value) {
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  return ec == std::errc() && ptr == text.data() + text.size();
}

bool FrameReader::Fill() {
  if (offset_ > 0) {
    buffer_.erase(0, offset_);
    offset_ = 0;
  }
  char chunk[8192];
  for (;;) {
    const ssize_t got = ::read(fd_, chunk, sizeof(chunk));
    if (got > 0) {
      buffer_.append(chunk, static_cast<std::size_t>(got));
      return true;
    }
    if (got < 0 && errno == EINTR) {
      continue;
    }
    return false;
  }
}

std::optional<std::string> FrameReader::ReadLine() {
  for (;;) {
    const auto eol = buffer_.find('\n', offset_);
    if (eol != std::string::npos) {
      std::string line = buffer_.substr(offset_, eol - offset_);
      offset_ = eol + 1;
      return line;
    }
    if (buffer_.size() - offset_ > kMaxLineBytes || !Fill()) {
      return std::nullopt;
    }
  }
}

bool FrameReader::ReadExact(std::size_t size, std::string& out) {
  while (buffer_.size() - offset_ < size) {
    if (!Fill()) {
      return false;
    }
  }
  out.assign(buffer_, offset_, size);
  offset_ += size;
  return true;
}

bool WriteAll(int fd, std::string_view data) {
  std::size_t written = 0;
  while (written < data.size()) {
    ssize_t chunk = ::send(fd, data.data() + written, data.size() - written, MSG_NOSIGNAL);
    if (chunk < 0 && errno == ENOTSOCK) {
      chunk = ::write(fd, data.data() + written, data.size() - written);
    }
    if (chunk < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    written += static_cast<std::size_t>(chunk);
  }
  return true;
}

} // namespace pw::sandbox::protocol

#include "pw/orchestrator/event_bus.h"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <limits>
#include <optional>
#include <span>
#include <sstream>
#include <system_error>

#include "pw/crypto/random.h"
#include "pw/crypto/sha256.h"
#include "pw/error.h"
#include "pw/types.h"

namespace pw::orchestrator {
namespace {

constexpr std::size_t kHmacSize = crypto::HMAC_SHA256::TAG_SIZE;
constexpr std::size_t kMaxEventBytes = 16 * 1024;
constexpr std::string_view kStateLabel{"PW_AUDIT_STATE_V1"};

using Mac = std::array<std::uint8_t, kHmacSize>;

struct PublishReentrancyGuard {
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  bool& flag_;
};

bool AppendWithLimit(std::string& out, std::string_view chunk, std::size_t limit) {
  if (out.size() > limit || chunk.size() > limit - out.size()) {
    return false;
  }
  out.append(chunk.data(), chunk.size());
  return true;
}

bool AppendEscapedWithLimit(std::string& out, std::string_view text, std::size_t limit) {
  for (unsigned char c : text) {
    std::string_view replacement;
    char plain = static_cast<char>(c);
    char buffer[7];
    switch (c) {
    case '\\':
      replacement = "\\\\";
      break;
    case '"':
      replacement = "\\\"";
      break;
    case '\n':
      replacement = "\\n";
      break;
    case '\r':
      replacement = "\\r";
      break;
    case '\t':
      replacement = "\\t";
      break;
    default:
      if (c < 0x20) {
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<int>(c));
        replacement = std::string_view(buffer, 6);
      } else {
        replacement = std::string_view(&plain, 1);
      }
      break;
    }
    if (!AppendWithLimit(out, replacement, limit)) {
      return false;
    }
  }
  return true;
}

const char* SeverityToString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

const char* CategoryToString(EventCategory category) {
  switch (category) {
  case EventCategory::kTelemetry:
    return "telemetry";
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

bool HexDecode(std::string_view text, std::span<std::uint8_t> out) {
  if (text.size() != out.size() * 2) {
    return false;
  }
  auto nibble = [](char ch) -> int {
    if (ch >= '0' && ch <= '9') {
      return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
      return 10 + (ch - 'a');
    }
    if (ch >= 'A' && ch <= 'F') {
      return 10 + (ch - 'A');
    }
    return -1;
  };
  for (std::size_t i = 0; i < out.size(); ++i) {
    const int high = nibble(text[i * 2]);
    const int low = nibble(text[i * 2 + 1]);
    if (high < 0 || low < 0) {
      return false;
    }
    out[i] = static_cast<std::uint8_t>((high << 4) | low);
  }
  return true;
}

void AppendBigEndian64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
  for (int shift = 56; shift >= 0; shift -= 8) {
    buffer.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
  }
}

Mac ComputeChainedMac(const Mac& key, const Mac& previous, std::uint64_t previous_count,
                      std::uint64_t sequence, std::string_view canonical) {
  std::vector<std::uint8_t> buffer;
  buffer.reserve(previous.size() + 16 + canonical.size());
  buffer.insert(buffer.end(), previous.begin(), previous.end());
  AppendBigEndian64(buffer, previous_count);
  AppendBigEndian64(buffer, sequence);
  buffer.insert(buffer.end(), canonical.begin(), canonical.end());
  return crypto::HMAC_SHA256::Compute(std::span<const std::uint8_t>(key.data(), key.size()),
                                      std::span<const std::uint8_t>(buffer.data(), buffer.size()));
}

Mac ComputeStateMac(const Mac& key, std::uint64_t entry_counter, const Mac& last_mac,
                    std::uint64_t generation_start, const Mac& generation_mac) {
  std::vector<std::uint8_t> buffer(kStateLabel.begin(), kStateLabel.end());
  AppendBigEndian64(buffer, entry_counter);
  buffer.insert(buffer.end(), last_mac.begin(), last_mac.end());
  AppendBigEndian64(buffer, generation_start);
  buffer.insert(buffer.end(), generation_mac.begin(), generation_mac.end());
  return crypto::HMAC_SHA256::Compute(std::span<const std::uint8_t>(key.data(), key.size()),
                                      std::span<const std::uint8_t>(buffer.data(), buffer.size()));
}

std::optional<std::uint64_t> ParseNumberAfter(std::string_view line, std::string_view marker,
                                              std::size_t& cursor) {
  auto pos = line.find(marker, cursor);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  pos += marker.size();
  std::size_t end = pos;
  while (end < line.size() && std::isdigit(static_cast<unsigned char>(line[end]))) {
    ++end;
  }
  std::uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(line.data() + pos, line.data() + end, value);
  if (end == pos || ec != std::errc() || ptr != line.data() + end) {
    return std::nullopt;
  }
  cursor = end;
  return value;
}

Event BuildOversizeEvent(const Event& original) {
  Event replacement;
  replacement.category = EventCategory::kDiagnostics;
  replacement.severity = EventSeverity::kWarning;
  replacement.event_id = "event_too_large";
  replacement.message = "Event payload exceeded logger limits";
  if (!original.event_id.empty()) {
    replacement.fields.emplace_back("original_event_id", original.event_id);
  }
  replacement.fields.emplace_back("limit_bytes", std::to_string(kMaxEventBytes),
                                  FieldPrivacy::kPublic, true);
  return replacement;
}

}  // namespace

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  return "hash:" + crypto::SHA256_Hex(input).substr(0, 16);
}

std::string BuildEventJson(const Event& event, const std::string& timestamp, std::size_t max_bytes) {
  std::string payload;
  payload.reserve(std::min<std::size_t>(max_bytes, 256));
  bool ok = AppendWithLimit(payload, "{\"ts\":\"", max_bytes) &&
            AppendEscapedWithLimit(payload, timestamp, max_bytes) &&
            AppendWithLimit(payload, "\",\"severity\":\"", max_bytes) &&
            AppendWithLimit(payload, SeverityToString(event.severity), max_bytes) &&
            AppendWithLimit(payload, "\",\"category\":\"", max_bytes) &&
            AppendWithLimit(payload, CategoryToString(event.category), max_bytes) &&
            AppendWithLimit(payload, "\"", max_bytes);
  if (ok && !event.event_id.empty()) {
    ok = AppendWithLimit(payload, ",\"event_id\":\"", max_bytes) &&
         AppendEscapedWithLimit(payload, event.event_id, max_bytes) &&
         AppendWithLimit(payload, "\"", max_bytes);
  }
  if (ok && !event.message.empty()) {
    ok = AppendWithLimit(payload, ",\"message\":\"", max_bytes) &&
         AppendEscapedWithLimit(payload, event.message, max_bytes) &&
         AppendWithLimit(payload, "\"", max_bytes);
  }
  for (const auto& field : event.fields) {
    if (!ok) {
      break;
    }
    std::string value = field.value;
    if (field.privacy == FieldPrivacy::kRedact) {
      value = "[REDACTED]";
    } else if (field.privacy == FieldPrivacy::kHash) {
      value = HashForTelemetry(field.value);
    }
    ok = AppendWithLimit(payload, ",\"", max_bytes) &&
         AppendEscapedWithLimit(payload, field.key, max_bytes) &&
         AppendWithLimit(payload, "\":", max_bytes);
    if (!ok) {
      break;
    }
    if (field.numeric && field.privacy == FieldPrivacy::kPublic) {
      ok = AppendWithLimit(payload, value, max_bytes);
    } else {
      ok = AppendWithLimit(payload, "\"", max_bytes) &&
           AppendEscapedWithLimit(payload, value, max_bytes) &&
           AppendWithLimit(payload, "\"", max_bytes);
    }
  }
  if (!ok || !AppendWithLimit(payload, "}", max_bytes)) {
    return {};
  }
  return payload;
}

JsonLineLogger::JsonLineLogger(std::filesystem::path log_path)
    : log_path_(std::move(log_path)),
      key_path_(log_path_.string() + ".key"),
      state_path_(log_path_.string() + ".state"),
      max_bytes_(ResolveMaxBytes()) {
  last_mac_.fill(0);
  std::error_code ec;
  auto parent = log_path_.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw Error(ErrorDomain::IO, errors::io::kDirectoryCreateFailed,
                  "Failed to create audit log directory " + parent.string() + ": " + ec.message(),
                  ec.value(), Retryability::kRetryable);
    }
  }
  EnsureKey();
  std::lock_guard<std::mutex> guard(mutex_);
  const bool state_loaded = LoadStateLocked();
  Mac existing_mac{};
  std::uint64_t existing_seq = 0;
  if (!ParseLog(existing_mac, existing_seq)) {
    std::clog << "{\"event\":\"logger_integrity_failure\",\"message\":\"unable to verify existing audit log\"}"
              << std::endl;
    integrity_ok_ = false;
    return;
  }
  if (state_loaded && (existing_seq != entry_counter_ || existing_mac != last_mac_)) {
    std::clog << "{\"event\":\"logger_integrity_failure\",\"message\":\"audit chain mismatch\"}"
              << std::endl;
    integrity_ok_ = false;
    return;
  }
  last_mac_ = existing_mac;
  entry_counter_ = existing_seq;
  PersistStateLocked();
}

std::size_t JsonLineLogger::ResolveMaxBytes() const {
  constexpr std::size_t kDefault = 10 * 1024 * 1024;
  const char* env = std::getenv("PW_AUDIT_LOG_MAX_SIZE");
  if (!env || *env == '\0') {
    return kDefault;
  }
  unsigned long long value = 0;
  const char* end = env + std::strlen(env);
  auto [ptr, ec] = std::from_chars(env, end, value);
  if (ec != std::errc() || ptr != end || value == 0) {
    return kDefault;
  }
  return static_cast<std::size_t>(
      std::min<unsigned long long>(value, std::numeric_limits<std::size_t>::max()));
}

void JsonLineLogger::EnsureKey() {
  if (key_loaded_) {
    return;
  }
  std::ifstream in(key_path_, std::ios::binary);
  if (in) {
    in.read(reinterpret_cast<char*>(hmac_key_.data()), static_cast<std::streamsize>(hmac_key_.size()));
    if (in.gcount() == static_cast<std::streamsize>(hmac_key_.size())) {
      key_loaded_ = true;
      return;
    }
    std::clog << "{\"event\":\"logger_error\",\"message\":\"audit key truncated\"}" << std::endl;
    integrity_ok_ = false;
    return;
  }
  crypto::SystemRandomBytes(std::span<std::uint8_t>(hmac_key_.data(), hmac_key_.size()));
  std::ofstream out(key_path_, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw Error(ErrorDomain::IO, errors::io::kFileWriteFailed,
                "Failed to create audit key " + key_path_.string(), errno);
  }
  out.write(reinterpret_cast<const char*>(hmac_key_.data()),
            static_cast<std::streamsize>(hmac_key_.size()));
  out.close();
  std::error_code ec;
  std::filesystem::permissions(key_path_,
                               std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"audit key chmod failed\",\"error_code\":"
              << ec.value() << "}" << std::endl;
  }
  key_loaded_ = true;
}

bool JsonLineLogger::LoadStateLocked() {
  std::ifstream in(state_path_);
  if (!in) {
    return false;
  }
  std::string label;
  std::uint64_t counter = 0;
  std::string last_hex;
  std::uint64_t generation_start = 0;
  std::string generation_hex;
  std::string mac_hex;
  if (!(in >> label >> counter >> last_hex >> generation_start >> generation_hex >> mac_hex) ||
      label != kStateLabel) {
    return false;
  }
  Mac last{};
  Mac generation{};
  Mac stored{};
  if (!HexDecode(last_hex, last) || !HexDecode(generation_hex, generation) ||
      !HexDecode(mac_hex, stored)) {
    return false;
  }
  if (ComputeStateMac(hmac_key_, counter, last, generation_start, generation) != stored) {
    std::clog << "{\"event\":\"logger_integrity_failure\",\"message\":\"audit state tampered\"}"
              << std::endl;
    return false;
  }
  entry_counter_ = counter;
  last_mac_ = last;
  generation_start_ = generation_start;
  generation_mac_ = generation;
  return true;
}

void JsonLineLogger::PersistStateLocked() {
  auto mac = ComputeStateMac(hmac_key_, entry_counter_, last_mac_, generation_start_, generation_mac_);
  std::ofstream out(state_path_, std::ios::trunc);
  if (!out) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"audit state persist failed\"}" << std::endl;
    return;
  }
  out << kStateLabel << ' ' << entry_counter_ << ' ' << HexEncode(last_mac_.data(), last_mac_.size())
      << ' ' << generation_start_ << ' '
      << HexEncode(generation_mac_.data(), generation_mac_.size()) << ' '
      << HexEncode(mac.data(), mac.size()) << '\n';
}

// Verifies the current generation. A rotated generation chains from the
// (sequence, MAC) head recorded in the state file at rotation time.
bool JsonLineLogger::ParseLog(Mac& mac, std::uint64_t& sequence) {
  std::ifstream in(log_path_);
  Mac previous = generation_mac_;
  std::uint64_t seq = generation_start_;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    if (line.size() > kMaxEventBytes + 256) {
      return false;
    }
    std::string_view view(line);
    constexpr std::string_view kMacMarker = ",\"audit_mac\":\"";
    auto mac_pos = view.find(kMacMarker);
    if (mac_pos == std::string_view::npos) {
      return false;
    }
    auto mac_start = mac_pos + kMacMarker.size();
    auto mac_end = view.find('"', mac_start);
    Mac parsed{};
    if (mac_end == std::string_view::npos ||
        !HexDecode(view.substr(mac_start, mac_end - mac_start), parsed)) {
      return false;
    }
    std::size_t cursor = 0;
    auto prev = ParseNumberAfter(view, "\"audit_prev_count\":", cursor);
    auto current = ParseNumberAfter(view, "\"audit_seq\":", cursor);
    if (!prev || !current || *prev != seq || *current != seq + 1) {
      return false;
    }
    std::string canonical(view.substr(0, mac_pos));
    canonical.push_back('}');
    auto expected = ComputeChainedMac(hmac_key_, previous, seq, *current, canonical);
    if (expected != parsed) {
      return false;
    }
    previous = expected;
    seq = *current;
  }
  if (in.bad()) {
    return false;
  }
  mac = previous;
  sequence = seq;
  return true;
}

bool JsonLineLogger::Verify() {
  std::lock_guard<std::mutex> guard(mutex_);
  if (!integrity_ok_) {
    return false;
  }
  Mac mac{};
  std::uint64_t sequence = 0;
  if (!ParseLog(mac, sequence)) {
    return false;
  }
  return sequence == entry_counter_ && mac == last_mac_;
}

std::uint64_t JsonLineLogger::EntryCount() {
  std::lock_guard<std::mutex> guard(mutex_);
  return entry_counter_;
}

bool JsonLineLogger::IntegrityOk() {
  std::lock_guard<std::mutex> guard(mutex_);
  return integrity_ok_;
}

void JsonLineLogger::EnsureOpen() {
  if (stream_.is_open()) {
    return;
  }
  stream_.open(log_path_, std::ios::out | std::ios::app);
}

void JsonLineLogger::RotateIfNeeded(std::size_t incoming_bytes) {
  std::error_code ec;
  auto current_size = std::filesystem::file_size(log_path_, ec);
  if (ec) {
    current_size = 0;
  }
  if (current_size + incoming_bytes <= max_bytes_) {
    return;
  }
  if (stream_.is_open()) {
    stream_.close();
  }
  for (std::size_t idx = max_files_; idx > 0; --idx) {
    std::filesystem::path src =
        idx == 1 ? log_path_ : std::filesystem::path(log_path_.string() + "." + std::to_string(idx - 1));
    std::filesystem::path dst(log_path_.string() + "." + std::to_string(idx));
    std::error_code rotate_ec;
    if (!std::filesystem::exists(src, rotate_ec)) {
      continue;
    }
    std::filesystem::remove(dst, rotate_ec);
    std::filesystem::rename(src, dst, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"audit log rotate rename failed\",\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
    }
  }
  generation_start_ = entry_counter_;
  generation_mac_ = last_mac_;
  PersistStateLocked();
}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (!integrity_ok_ || !key_loaded_) {
    return;
  }
  auto timestamp = FormatTimestamp(Clock::now());
  auto base = BuildEventJson(event, timestamp, kMaxEventBytes);
  if (base.empty()) {
    base = BuildEventJson(BuildOversizeEvent(event), timestamp, kMaxEventBytes);
    if (base.empty()) {
      return;
    }
  }
  const std::uint64_t previous_count = entry_counter_;
  const std::uint64_t next_sequence = previous_count + 1;
  std::string prefix = base.substr(0, base.size() - 1);
  prefix.append(",\"audit_prev_count\":");
  prefix.append(std::to_string(previous_count));
  prefix.append(",\"audit_seq\":");
  prefix.append(std::to_string(next_sequence));
  std::string canonical = prefix;
  canonical.push_back('}');
  auto mac = ComputeChainedMac(hmac_key_, last_mac_, previous_count, next_sequence, canonical);
  std::string line = prefix;
  line.append(",\"audit_mac\":\"");
  line.append(HexEncode(mac.data(), mac.size()));
  line.append("\"}");

  RotateIfNeeded(line.size() + 1);
  EnsureOpen();
  if (!stream_.is_open()) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"failed to open log file\"}" << std::endl;
    return;
  }
  stream_ << line << '\n';
  stream_.flush();
  last_mac_ = mac;
  entry_counter_ = next_sequence;
  PersistStateLocked();
}

bool VerifyJsonLineLog(const std::filesystem::path& log_path) {
  std::error_code ec;
  if (!std::filesystem::exists(log_path, ec) ||
      !std::filesystem::exists(std::filesystem::path(log_path.string() + ".key"), ec)) {
    return false;
  }
  JsonLineLogger logger(log_path);
  return logger.Verify();
}

EventBus::EventBus() {
  std::atomic_store_explicit(&subscribers_snapshot_,
                             std::shared_ptr<const SubscriberList>(std::make_shared<SubscriberList>()),
                             std::memory_order_release);
}

EventBus::~EventBus() {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  std::atomic_store_explicit(&subscribers_snapshot_, std::shared_ptr<const SubscriberList>{},
                             std::memory_order_release);
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  PublishReentrancyGuard guard(in_publish);
  published_.fetch_add(1, std::memory_order_relaxed);
  auto targets = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  if (!targets) {
    return;
  }
  for (const auto& subscriber : *targets) {
    if (subscriber) {
      subscriber(event);
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  auto updated = current ? std::make_shared<SubscriberList>(*current) : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(updated),
                             std::memory_order_release);
}

void EventBus::AttachLogger(std::shared_ptr<JsonLineLogger> logger) {
  if (!logger) {
    return;
  }
  Subscribe([logger](const Event& event) { logger->Log(event); });
}

} // namespace pw::orchestrator

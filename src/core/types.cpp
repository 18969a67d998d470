#include "pw/types.h"

#include <array>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <span>
#include <sstream>

#include "pw/crypto/random.h"
#include "pw/error.h"

namespace pw {

namespace {

[[noreturn]] void ThrowUnknownName(std::string_view kind, std::string_view name) {
  throw Error(ErrorDomain::Validation, errors::validation::kUnknownEnumName,
              "Unknown " + std::string(kind) + ": " + std::string(name));
}

} // namespace

std::string_view ToString(Severity severity) noexcept {
  switch (severity) {
  case Severity::kInfo:
    return "INFO";
  case Severity::kLow:
    return "LOW";
  case Severity::kMedium:
    return "MEDIUM";
  case Severity::kHigh:
    return "HIGH";
  case Severity::kCritical:
    return "CRITICAL";
  }
  return "INFO";
}

std::string_view ToString(TrustLevel level) noexcept {
  switch (level) {
  case TrustLevel::kUntrusted:
    return "UNTRUSTED";
  case TrustLevel::kLow:
    return "LOW";
  case TrustLevel::kMedium:
    return "MEDIUM";
  case TrustLevel::kHigh:
    return "HIGH";
  case TrustLevel::kEnterprise:
    return "ENTERPRISE";
  case TrustLevel::kSystem:
    return "SYSTEM";
  }
  return "UNTRUSTED";
}

std::string_view ToString(RiskLevel level) noexcept {
  switch (level) {
  case RiskLevel::kLow:
    return "LOW";
  case RiskLevel::kMedium:
    return "MEDIUM";
  case RiskLevel::kHigh:
    return "HIGH";
  case RiskLevel::kCritical:
    return "CRITICAL";
  }
  return "LOW";
}

Severity ParseSeverity(std::string_view name) {
  for (auto candidate : {Severity::kInfo, Severity::kLow, Severity::kMedium, Severity::kHigh,
                         Severity::kCritical}) {
    if (ToString(candidate) == name) {
      return candidate;
    }
  }
  ThrowUnknownName("severity", name);
}

TrustLevel ParseTrustLevel(std::string_view name) {
  for (auto candidate : {TrustLevel::kUntrusted, TrustLevel::kLow, TrustLevel::kMedium,
                         TrustLevel::kHigh, TrustLevel::kEnterprise, TrustLevel::kSystem}) {
    if (ToString(candidate) == name) {
      return candidate;
    }
  }
  ThrowUnknownName("trust level", name);
}

RiskLevel ParseRiskLevel(std::string_view name) {
  for (auto candidate : {RiskLevel::kLow, RiskLevel::kMedium, RiskLevel::kHigh,
                         RiskLevel::kCritical}) {
    if (ToString(candidate) == name) {
      return candidate;
    }
  }
  ThrowUnknownName("risk level", name);
}

std::string FormatTimestamp(TimePoint tp) {
  auto time = Clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&time, &tm);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                std::chrono::seconds(1);
  if (micros.count() < 0) {
    micros += std::chrono::seconds(1);
  }
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0')
      << micros.count() << 'Z';
  return oss.str();
}

std::optional<TimePoint> ParseTimestamp(std::string_view text) {
  std::tm tm{};
  int consumed = 0;
  const std::string buffer(text);
  if (std::sscanf(buffer.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                  &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
    return std::nullopt;
  }
  tm.tm_year -= 1900;
  tm.tm_mon -= 1;
  std::int64_t micros = 0;
  std::size_t pos = static_cast<std::size_t>(consumed);
  if (pos < buffer.size() && buffer[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < buffer.size() && std::isdigit(static_cast<unsigned char>(buffer[pos]))) {
      if (digits < 6) {
        micros = micros * 10 + (buffer[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    for (; digits < 6; ++digits) {
      micros *= 10;
    }
  }
  if (pos >= buffer.size() || buffer[pos] != 'Z' || pos + 1 != buffer.size()) {
    return std::nullopt;
  }
  const std::time_t seconds = timegm(&tm);
  if (seconds == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(seconds) +
                                                               std::chrono::microseconds(micros)));
}

std::int64_t ToUnixMillis(TimePoint tp) noexcept {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixSeconds(std::int64_t seconds) noexcept {
  return TimePoint(std::chrono::seconds(seconds));
}

std::string HexEncode(const std::uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHex[(data[i] >> 4) & 0x0F]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
  return out;
}

std::string MakeId(std::string_view prefix) {
  std::array<std::uint8_t, 4> suffix{};
  crypto::SystemRandomBytes(std::span<std::uint8_t>(suffix.data(), suffix.size()));
  std::string id(prefix);
  id.push_back('-');
  id += std::to_string(ToUnixMillis(Clock::now()));
  id.push_back('-');
  id += HexEncode(suffix.data(), suffix.size());
  return id;
}

} // namespace pw

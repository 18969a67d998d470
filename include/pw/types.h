#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pw {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Ordered: comparisons between severities are meaningful.
enum class Severity : std::uint8_t { kInfo = 0, kLow, kMedium, kHigh, kCritical };

enum class TrustLevel : std::uint8_t {
  kUntrusted = 0,
  kLow,
  kMedium,
  kHigh,
  kEnterprise,
  kSystem
};

enum class RiskLevel : std::uint8_t { kLow = 0, kMedium, kHigh, kCritical };

// Request-scoped caller description, copied verbatim into every audit record.
struct SecurityContext {
  std::string request_id;
  std::optional<std::string> user_id;
  TimePoint timestamp{};
  std::string ip_address{"0.0.0.0"};
  std::optional<std::string> user_agent;
  std::optional<std::string> session_id;
};

std::string_view ToString(Severity severity) noexcept;
std::string_view ToString(TrustLevel level) noexcept;
std::string_view ToString(RiskLevel level) noexcept;

// Parsers accept the canonical upper-case names; anything else is a
// Validation error.
Severity ParseSeverity(std::string_view name);
TrustLevel ParseTrustLevel(std::string_view name);
RiskLevel ParseRiskLevel(std::string_view name);

// ISO-8601 UTC with microseconds, e.g. 2024-01-02T03:04:05.000006Z.
std::string FormatTimestamp(TimePoint tp);
// Accepts the FormatTimestamp form with or without the fraction.
std::optional<TimePoint> ParseTimestamp(std::string_view text);
std::int64_t ToUnixMillis(TimePoint tp) noexcept;
TimePoint FromUnixSeconds(std::int64_t seconds) noexcept;

// <prefix>-<unix millis>-<8 random hex digits>
std::string MakeId(std::string_view prefix);

std::string HexEncode(const std::uint8_t* data, std::size_t size);

} // namespace pw

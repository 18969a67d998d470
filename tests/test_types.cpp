#include "pw/types.h" // TSK101_Shared_Model
#include "pw/error.h"

#include <chrono>
#include <set>
#include <string>

#include "test_support.h"

namespace {

  using pw::test::Expect;

  void TestSeverityOrdering() { // TSK101_Shared_Model
    Expect(pw::Severity::kInfo < pw::Severity::kLow, "INFO < LOW");
    Expect(pw::Severity::kHigh < pw::Severity::kCritical, "HIGH < CRITICAL");
    Expect(pw::TrustLevel::kHigh < pw::TrustLevel::kEnterprise, "HIGH < ENTERPRISE trust");
    Expect(pw::RiskLevel::kMedium < pw::RiskLevel::kHigh, "MEDIUM < HIGH risk");
  }

  void TestEnumNames() {
    Expect(pw::ParseSeverity("CRITICAL") == pw::Severity::kCritical, "severity parse");
    Expect(pw::ToString(pw::ParseTrustLevel("ENTERPRISE")) == "ENTERPRISE", "trust level round trip");
    Expect(pw::ParseRiskLevel("LOW") == pw::RiskLevel::kLow, "risk parse");
    pw::test::ExpectError([] { (void)pw::ParseSeverity("critical"); }, pw::ErrorDomain::Validation,
                          pw::errors::validation::kUnknownEnumName, "names are case sensitive");
    pw::test::ExpectError([] { (void)pw::ParseTrustLevel("ROOT"); }, pw::ErrorDomain::Validation,
                          pw::errors::validation::kUnknownEnumName, "unknown trust level");
  }

  void TestTimestamps() {
    const auto epoch = pw::FromUnixSeconds(1704164645);  // 2024-01-02T03:04:05Z
    const auto tp = epoch + std::chrono::microseconds(6);
    const auto text = pw::FormatTimestamp(tp);
    Expect(text == "2024-01-02T03:04:05.000006Z", "timestamp format");
    auto parsed = pw::ParseTimestamp(text);
    Expect(parsed.has_value() && *parsed == tp, "timestamp parse keeps microseconds");
    parsed = pw::ParseTimestamp("2024-01-02T03:04:05Z");
    Expect(parsed.has_value() && *parsed == epoch, "fraction is optional");
    Expect(!pw::ParseTimestamp("2024-01-02 03:04:05").has_value(), "missing T rejected");
    Expect(!pw::ParseTimestamp("2024-01-02T03:04:05.1+01:00").has_value(), "offsets rejected");
    Expect(pw::ToUnixMillis(epoch) == 1704164645000LL, "unix millis");
  }

  void TestIds() {
    std::set<std::string> ids;
    for (int i = 0; i < 64; ++i) {
      const auto id = pw::MakeId("event");
      Expect(id.rfind("event-", 0) == 0, "id prefix");
      Expect(id.size() > 6 + 8 + 1, "id carries millis and suffix");
      ids.insert(id);
    }
    Expect(ids.size() == 64, "ids are unique");
    const std::uint8_t bytes[] = {0x00, 0xAB, 0x7F};
    Expect(pw::HexEncode(bytes, sizeof(bytes)) == "00ab7f", "hex encode");
  }

  void TestErrorCodes() {
    pw::Error err(pw::ErrorDomain::State, pw::errors::state::kProfileConflict, "conflict", std::nullopt,
                  pw::Retryability::kRetryable);
    Expect(pw::IsFrameworkErrorCode(err.domain, err.code), "framework code inside its span");
    Expect(!pw::IsFrameworkErrorCode(pw::ErrorDomain::IO, err.code), "span is per domain");
    Expect(err.retryability == pw::Retryability::kRetryable, "retryability kept");
    Expect(std::string(err.what()) == "conflict", "message kept");
  }

} // namespace

int main() {
  TestSeverityOrdering();
  TestEnumNames();
  TestTimestamps();
  TestIds();
  TestErrorCodes();
  return pw::test::Finish("types");
}

#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pw {
  // TSK001_Error_Model
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    Dependency = 0x06,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes so that propagated errno values never
  // collide with framework codes. Codes inside a span are stable.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Dependency:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0;
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace io {
      inline constexpr int kFileUnreadable = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kFileWriteFailed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kDirectoryCreateFailed = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kPipeFailed = Make(ErrorDomain::IO, 0x04);
      inline constexpr int kProcessSpawnFailed = Make(ErrorDomain::IO, 0x05);
      inline constexpr int kUnitChannelBroken = Make(ErrorDomain::IO, 0x06);
    } // namespace io

    namespace validation {
      inline constexpr int kManifestInvalid = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kCertificateInvalid = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kTrustAnchorNotSelfSigned = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kUnknownEnumName = Make(ErrorDomain::Validation, 0x04);
      inline constexpr int kPolicyInvalid = Make(ErrorDomain::Validation, 0x05);
      inline constexpr int kRuleConditionInvalid = Make(ErrorDomain::Validation, 0x06);
      inline constexpr int kPrivateKeyInvalid = Make(ErrorDomain::Validation, 0x07);
      inline constexpr int kCrlInvalid = Make(ErrorDomain::Validation, 0x08);
    } // namespace validation

    namespace security {
      inline constexpr int kCodeRejected = Make(ErrorDomain::Security, 0x01);
      inline constexpr int kContextTooLarge = Make(ErrorDomain::Security, 0x02);
      inline constexpr int kCodeTooLarge = Make(ErrorDomain::Security, 0x03);
      inline constexpr int kUnsupportedAlgorithm = Make(ErrorDomain::Security, 0x04);
    } // namespace security

    namespace config {
      inline constexpr int kMalformedLine = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kUnknownKey = Make(ErrorDomain::Config, 0x02);
      inline constexpr int kDuplicateKey = Make(ErrorDomain::Config, 0x03);
      inline constexpr int kInvalidValue = Make(ErrorDomain::Config, 0x04);
      inline constexpr int kFileMissing = Make(ErrorDomain::Config, 0x05);
    } // namespace config

    namespace state {
      inline constexpr int kSandboxNotActive = Make(ErrorDomain::State, 0x01);
      inline constexpr int kSandboxCancelled = Make(ErrorDomain::State, 0x02);
      inline constexpr int kExecutionTimeout = Make(ErrorDomain::State, 0x03);
      inline constexpr int kSandboxNotFound = Make(ErrorDomain::State, 0x04);
      inline constexpr int kInvalidIncidentTransition = Make(ErrorDomain::State, 0x05);
      inline constexpr int kIncidentNotFound = Make(ErrorDomain::State, 0x06);
      inline constexpr int kPolicyNotFound = Make(ErrorDomain::State, 0x07);
      inline constexpr int kProfileConflict = Make(ErrorDomain::State, 0x08);
      inline constexpr int kSandboxStartFailed = Make(ErrorDomain::State, 0x09);
      inline constexpr int kTrustAnchorNotFound = Make(ErrorDomain::State, 0x0A);
    } // namespace state

    namespace internal {
      inline constexpr int kUnexpected = Make(ErrorDomain::Internal, 0x01);
    } // namespace internal

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };
} // namespace pw

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pw/crypto/x509.h"
#include "pw/trust/manifest.h"
#include "pw/types.h"

namespace pw::orchestrator {
class EventBus;
}

namespace pw::trust {

enum class IssueSeverity : std::uint8_t { kWarning, kError, kFatal };

enum class VerificationCode : std::uint8_t {
  kManifestInvalid,
  kSignatureInvalid,
  kAlgorithmNotSupported,
  kHashMismatch,
  kCertificateInvalid,
  kChainIncomplete,
  kTrustAnchorNotFound,
  kTimeValidationFailed,
  kCertificateExpired,
  kCertificateExpiringSoon,
  kCertificateRevoked,
  kUnknownIssuer,
  kPermissionMismatch,
  kWeakAlgorithm,
  kSelfSignedCertificate,
  kLongCertificateChain,
  kExcessivePermissions,
  kVerificationError
};

std::string_view ToString(VerificationCode code) noexcept;
std::string_view ToString(IssueSeverity severity) noexcept;

struct VerificationIssue {
  VerificationCode code;
  IssueSeverity severity;
  std::string message;
};

// Verification step reached; FATAL errors stop the machine at the failing step.
enum class VerificationStep : std::uint8_t {
  kLoadManifest,
  kCheckSignature,
  kParseCertificate,
  kBuildChain,
  kCheckTimeValidity,
  kCheckRevocation,
  kValidateTrust,
  kVerifyContentHash,
  kValidatePermissions,
  kWarnings,
  kDone
};

std::string_view ToString(VerificationStep step) noexcept;

struct PluginCertificate {
  std::string subject;
  std::string issuer;
  std::string serial;
  TimePoint valid_from{};
  TimePoint valid_to{};
  std::string public_key_type;
  int public_key_bits{0};
  std::string fingerprint;
  std::vector<std::string> permissions;
  TrustLevel trust_level{TrustLevel::kUntrusted};
  bool revoked{false};
  std::string revocation_reason;
};

struct VerificationResult {
  bool valid{false};
  TrustLevel trust_level{TrustLevel::kUntrusted};
  std::vector<PluginCertificate> chain;
  bool chain_complete{false};
  std::vector<VerificationIssue> errors;    // ERROR and FATAL
  std::vector<VerificationIssue> warnings;
  VerificationStep reached{VerificationStep::kLoadManifest};
  std::optional<PluginManifest> manifest;
  std::optional<PluginSignature> signature;
  TimePoint verified_at{};
  bool from_cache{false};

  bool HasFatal() const noexcept;
  bool Has(VerificationCode code) const noexcept;
};

struct TrustAnchor {
  std::string name;
  crypto::Certificate certificate;
  TrustLevel trust_level{TrustLevel::kUntrusted};
  TimePoint added_at{};
};

struct RevocationEntry {
  std::string issuer;  // empty: matches any issuer
  std::string serial_hex;
  std::string reason;
  TimePoint revoked_at{};
};

struct SignOptions {
  crypto::HashAlgorithm hash_algorithm{crypto::HashAlgorithm::kSha256};
  std::optional<std::filesystem::path> manifest_path;
  std::optional<TimePoint> signing_time;
};

struct VerifierHooks { // TSK131_Verifier_Clock test seam for TTL and validity windows
  std::function<TimePoint()> now;
};

class SignatureVerifier {
 public:
  static constexpr std::chrono::minutes kCacheTtl{5};
  static constexpr std::size_t kCacheCapacity = 256;
  static constexpr std::chrono::hours kExpiryWarningWindow{24 * 30};
  static constexpr std::size_t kMaxChainLength = 5;

  explicit SignatureVerifier(orchestrator::EventBus& bus, VerifierHooks hooks = {});
  SignatureVerifier(const SignatureVerifier&) = delete;
  SignatureVerifier& operator=(const SignatureVerifier&) = delete;

  // Never throws; every failure is reported inside the result.
  VerificationResult Verify(const std::filesystem::path& plugin_path,
                            const std::optional<std::filesystem::path>& manifest_path = std::nullopt);

  // Computes the content hash of |plugin_path| and signs it. The manifest is
  // not modified; see WriteSignature.
  PluginSignature Sign(const std::filesystem::path& plugin_path,
                       const crypto::Certificate& certificate, const crypto::PrivateKey& key,
                       const std::vector<crypto::Certificate>& chain = {},
                       const SignOptions& options = {}) const;
  PluginSignature Sign(const std::filesystem::path& plugin_path, std::string_view certificate_pem,
                       std::string_view key_pem, std::optional<std::string_view> passphrase,
                       std::string_view chain_pem = {}, const SignOptions& options = {}) const;

  // Embeds |signature| into the manifest atomically.
  static void WriteSignature(const std::filesystem::path& manifest_path,
                             const PluginSignature& signature);

  // Throws pw::Error(Validation, kTrustAnchorNotSelfSigned) for non-root
  // certificates. Replaces an anchor of the same name.
  void AddTrustAnchor(const std::string& name, const crypto::Certificate& certificate,
                      TrustLevel level);
  bool RemoveTrustAnchor(const std::string& name);
  std::vector<TrustAnchor> ListTrustAnchors() const;

  void AddRevocation(const std::string& issuer, const std::string& serial_hex,
                     const std::string& reason);
  // Returns the number of entries added. The CRL signature is checked when
  // its issuer is a registered anchor.
  std::size_t ImportCrl(std::string_view pem);
  std::vector<RevocationEntry> ListRevocations() const;

  void ClearCache();
  std::size_t CacheSize() const;

 private:
  struct CacheEntry {
    VerificationResult result;
    TimePoint stored_at;
  };

  struct Snapshot {
    std::vector<TrustAnchor> anchors;
    std::vector<RevocationEntry> revocations;
    std::uint64_t generation{0};
  };

  TimePoint Now() const;
  Snapshot TakeSnapshot() const;
  VerificationResult VerifyUncached(const std::filesystem::path& plugin_path,
                                    const std::filesystem::path& manifest_path,
                                    const Snapshot& snapshot) const;
  void PublishOutcome(const std::filesystem::path& plugin_path, const VerificationResult& result);
  void PruneCacheLocked(TimePoint now);

  orchestrator::EventBus& bus_;
  VerifierHooks hooks_;

  mutable std::mutex mutex_;
  std::map<std::string, TrustAnchor> anchors_;
  std::vector<RevocationEntry> revocations_;
  std::map<std::string, CacheEntry> cache_;
  std::uint64_t anchor_generation_{0};
};

} // namespace pw::trust

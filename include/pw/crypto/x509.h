#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "pw/crypto/digest.h"
#include "pw/types.h"

struct x509_st;
struct evp_pkey_st;

namespace pw::crypto {

// Permissions are granted to a plugin signer through subjectAltName URIs of
// the form urn:pw:permission:<name>.
inline constexpr std::string_view kPermissionUriPrefix{"urn:pw:permission:"};

enum class KeyType : std::uint8_t { kEc = 0, kRsa, kEd25519 };

enum class SignatureAlgorithm : std::uint8_t { kRsaPss = 0, kEcdsa, kEd25519 };

std::string_view ToString(SignatureAlgorithm algorithm) noexcept;
SignatureAlgorithm ParseSignatureAlgorithm(std::string_view name);

// Immutable, cheaply copyable handle to a parsed X.509 certificate.
class Certificate {
public:
  static Certificate FromPem(std::string_view pem);
  // Parses every certificate in a PEM bundle, in order.
  static std::vector<Certificate> BundleFromPem(std::string_view pem);

  std::string ToPem() const;
  std::vector<std::uint8_t> ToDer() const;

  std::string Subject() const;
  std::string Issuer() const;
  std::string SerialHex() const;
  TimePoint NotBefore() const;
  TimePoint NotAfter() const;
  std::string FingerprintSha256() const;
  std::vector<std::string> Permissions() const;

  // "RSA", "EC" or "ED25519"
  std::string PublicKeyType() const;
  int PublicKeyBits() const;
  // Long name of the algorithm the issuer used to sign this certificate.
  std::string SignatureAlgorithmName() const;

  bool IsSelfSigned() const;
  // Name chaining plus a cryptographic check of this certificate's signature
  // against |issuer|'s public key.
  bool IsIssuedBy(const Certificate& issuer) const;
  bool Equals(const Certificate& other) const;

  x509_st* native() const noexcept { return cert_.get(); }

private:
  explicit Certificate(std::shared_ptr<x509_st> cert) : cert_(std::move(cert)) {}
  std::shared_ptr<x509_st> cert_;
};

class PrivateKey {
public:
  // |passphrase| is required for encrypted PEM; without one an encrypted key
  // fails to load instead of prompting.
  static PrivateKey FromPem(std::string_view pem,
                            std::optional<std::string_view> passphrase = std::nullopt);
  static PrivateKey Generate(KeyType type, int rsa_bits = 3072);

  std::string ToPem(std::optional<std::string_view> passphrase = std::nullopt) const;
  KeyType type() const;

  evp_pkey_st* native() const noexcept { return key_.get(); }

private:
  explicit PrivateKey(std::shared_ptr<evp_pkey_st> key) : key_(std::move(key)) {}
  std::shared_ptr<evp_pkey_st> key_;
};

SignatureAlgorithm AlgorithmForKey(KeyType type) noexcept;

std::vector<std::uint8_t> SignMessage(const PrivateKey& key, SignatureAlgorithm algorithm,
                                      HashAlgorithm hash, std::span<const std::uint8_t> message);
// Returns false for a signature that does not verify; throws only when the
// certificate key cannot be used with |algorithm|.
bool VerifyMessage(const Certificate& signer, SignatureAlgorithm algorithm, HashAlgorithm hash,
                   std::span<const std::uint8_t> message,
                   std::span<const std::uint8_t> signature);

std::string Base64Encode(std::span<const std::uint8_t> data);
std::vector<std::uint8_t> Base64Decode(std::string_view text);

struct CertificateRequest {
  std::string common_name;
  std::string organization{"PluginWarden"};
  KeyType key_type{KeyType::kEc};
  std::optional<TimePoint> not_before;
  int validity_days{365};
  std::vector<std::string> permissions;
  bool is_ca{false};
};

struct IssuedCertificate {
  Certificate certificate;
  PrivateKey key;
};

// Self-signed when |issuer| is null, otherwise signed by the issuer's key.
IssuedCertificate GenerateCertificate(const CertificateRequest& request,
                                      const IssuedCertificate* issuer = nullptr);

struct CrlEntry {
  std::string issuer;
  std::string serial_hex;
  std::string reason;
  TimePoint revoked_at{};
};

// When |issuer| is supplied the CRL signature must verify against it.
std::vector<CrlEntry> ParseCrlPem(std::string_view pem, const Certificate* issuer);
std::string CrlIssuer(std::string_view pem);
std::string IssueCrl(const IssuedCertificate& issuer, const std::vector<std::string>& serials_hex,
                     int next_update_days = 7);

}  // namespace pw::crypto

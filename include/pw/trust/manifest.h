#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pw/crypto/digest.h"
#include "pw/crypto/x509.h"
#include "pw/types.h"

namespace pw::trust {

inline constexpr std::string_view kDefaultManifestName{"plugin.json"};
inline constexpr std::string_view kPluginContentType{"application/vnd.pw.plugin"};
inline constexpr std::string_view kSignedDataTag{"PW-PLUGIN-SIGNATURE-V1"};

namespace oid {
inline constexpr std::string_view kContentType{"1.2.840.113549.1.9.3"};
inline constexpr std::string_view kMessageDigest{"1.2.840.113549.1.9.4"};
inline constexpr std::string_view kSigningTime{"1.2.840.113549.1.9.5"};
} // namespace oid

struct SignedAttribute {
  std::string oid;
  std::string value;
  bool critical{false};
};

// Signature block exactly as written in the manifest; decoding into typed
// values is a separate step so that unsupported algorithms can be reported
// distinctly from malformed JSON.
struct SignatureBlock {
  std::string algorithm;
  std::string hash_algorithm;
  std::string content_hash;
  std::string signature;  // base64
  std::string signing_time;
  std::string certificate;  // PEM
  std::vector<std::string> certificate_chain;  // PEM, leaf's issuer first
  std::vector<SignedAttribute> signed_attributes;
};

struct PluginManifest {
  std::string id;
  std::string name;
  std::string version;
  std::string entry;
  std::vector<std::string> permissions;
  std::optional<SignatureBlock> signature;
};

// Typed, immutable signature. A re-sign produces a new object.
struct PluginSignature {
  crypto::SignatureAlgorithm algorithm{crypto::SignatureAlgorithm::kEcdsa};
  crypto::HashAlgorithm hash_algorithm{crypto::HashAlgorithm::kSha256};
  std::string content_hash;  // lowercase hex
  std::vector<std::uint8_t> signature;
  TimePoint signing_time{};
  std::string certificate_pem;
  std::vector<std::string> chain_pem;
  std::vector<SignedAttribute> signed_attributes;
};

// Throws pw::Error(Validation, kManifestInvalid) for malformed documents.
PluginManifest ParseManifest(std::string_view json_text);

// Throws pw::Error(Security, kUnsupportedAlgorithm) for unknown algorithm
// names and pw::Error(Validation, kManifestInvalid) for undecodable values.
PluginSignature DecodeSignatureBlock(const SignatureBlock& block);
SignatureBlock EncodeSignatureBlock(const PluginSignature& signature);

// Returns |manifest_json| with its "signature" member replaced; all other
// members are preserved.
std::string EmbedSignatureBlock(std::string_view manifest_json, const SignatureBlock& block);

// Digest over every regular file below |root| except |manifest_path|, in
// relative-path order; each file contributes its '/'-separated relative path
// followed by its content. Returns lowercase hex.
std::string ComputeContentHash(const std::filesystem::path& root,
                               const std::filesystem::path& manifest_path,
                               crypto::HashAlgorithm algorithm);

// Canonical bytes covered by the signature.
std::vector<std::uint8_t> CanonicalSignedData(crypto::SignatureAlgorithm algorithm,
                                              crypto::HashAlgorithm hash,
                                              std::string_view content_hash,
                                              const std::vector<SignedAttribute>& attributes);

} // namespace pw::trust

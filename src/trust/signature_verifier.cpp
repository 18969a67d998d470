#include "pw/trust/signature_verifier.h"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "pw/crypto/ct.h"
#include "pw/error.h"
#include "pw/errors.h"
#include "pw/orchestrator/event_bus.h"
#include "pw/orchestrator/io_util.h"

namespace pw::trust {

namespace {

constexpr int kMinimumRsaBits = 2048;

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

PluginCertificate Describe(const crypto::Certificate& cert) {
  PluginCertificate out;
  out.subject = cert.Subject();
  out.issuer = cert.Issuer();
  out.serial = cert.SerialHex();
  out.valid_from = cert.NotBefore();
  out.valid_to = cert.NotAfter();
  out.public_key_type = cert.PublicKeyType();
  out.public_key_bits = cert.PublicKeyBits();
  out.fingerprint = cert.FingerprintSha256();
  out.permissions = cert.Permissions();
  return out;
}

bool IsExcessivePermission(std::string_view permission) {
  return permission.find('*') != std::string_view::npos || permission == "admin" ||
         permission == "system" || permission == "all";
}

std::string CacheKey(const std::filesystem::path& plugin, const std::filesystem::path& manifest) {
  return plugin.lexically_normal().string() + "|" + manifest.lexically_normal().string();
}

class IssueCollector {
 public:
  explicit IssueCollector(VerificationResult& result) : result_(result) {}

  void Fatal(VerificationCode code, std::string message) {
    result_.errors.push_back({code, IssueSeverity::kFatal, std::move(message)});
  }
  void Fail(VerificationCode code, std::string message) {
    result_.errors.push_back({code, IssueSeverity::kError, std::move(message)});
  }
  void Warn(VerificationCode code, std::string message) {
    result_.warnings.push_back({code, IssueSeverity::kWarning, std::move(message)});
  }

  VerificationResult Finish() {
    result_.valid = result_.errors.empty();
    if (!result_.valid) {
      result_.trust_level = TrustLevel::kUntrusted;
    }
    return result_;
  }

 private:
  VerificationResult& result_;
};

} // namespace

std::string_view ToString(VerificationCode code) noexcept {
  switch (code) {
    case VerificationCode::kManifestInvalid:
      return "MANIFEST_INVALID";
    case VerificationCode::kSignatureInvalid:
      return "SIGNATURE_INVALID";
    case VerificationCode::kAlgorithmNotSupported:
      return "ALGORITHM_NOT_SUPPORTED";
    case VerificationCode::kHashMismatch:
      return "HASH_MISMATCH";
    case VerificationCode::kCertificateInvalid:
      return "CERTIFICATE_INVALID";
    case VerificationCode::kChainIncomplete:
      return "CHAIN_INCOMPLETE";
    case VerificationCode::kTrustAnchorNotFound:
      return "TRUST_ANCHOR_NOT_FOUND";
    case VerificationCode::kTimeValidationFailed:
      return "TIME_VALIDATION_FAILED";
    case VerificationCode::kCertificateExpired:
      return "CERTIFICATE_EXPIRED";
    case VerificationCode::kCertificateExpiringSoon:
      return "CERTIFICATE_EXPIRING_SOON";
    case VerificationCode::kCertificateRevoked:
      return "CERTIFICATE_REVOKED";
    case VerificationCode::kUnknownIssuer:
      return "UNKNOWN_ISSUER";
    case VerificationCode::kPermissionMismatch:
      return "PERMISSION_MISMATCH";
    case VerificationCode::kWeakAlgorithm:
      return "WEAK_ALGORITHM";
    case VerificationCode::kSelfSignedCertificate:
      return "SELF_SIGNED_CERTIFICATE";
    case VerificationCode::kLongCertificateChain:
      return "LONG_CERTIFICATE_CHAIN";
    case VerificationCode::kExcessivePermissions:
      return "EXCESSIVE_PERMISSIONS";
    case VerificationCode::kVerificationError:
      return "VERIFICATION_ERROR";
  }
  return "UNKNOWN";
}

std::string_view ToString(IssueSeverity severity) noexcept {
  switch (severity) {
    case IssueSeverity::kWarning:
      return "WARNING";
    case IssueSeverity::kError:
      return "ERROR";
    case IssueSeverity::kFatal:
      return "FATAL";
  }
  return "UNKNOWN";
}

std::string_view ToString(VerificationStep step) noexcept {
  switch (step) {
    case VerificationStep::kLoadManifest:
      return "LOAD_MANIFEST";
    case VerificationStep::kCheckSignature:
      return "CHECK_SIGNATURE";
    case VerificationStep::kParseCertificate:
      return "PARSE_CERT";
    case VerificationStep::kBuildChain:
      return "BUILD_CHAIN";
    case VerificationStep::kCheckTimeValidity:
      return "CHECK_TIME_VALIDITY";
    case VerificationStep::kCheckRevocation:
      return "CHECK_REVOCATION";
    case VerificationStep::kValidateTrust:
      return "VALIDATE_TRUST";
    case VerificationStep::kVerifyContentHash:
      return "VERIFY_CONTENT_HASH";
    case VerificationStep::kValidatePermissions:
      return "VALIDATE_PERMISSIONS";
    case VerificationStep::kWarnings:
      return "WARNINGS";
    case VerificationStep::kDone:
      return "DONE";
  }
  return "UNKNOWN";
}

bool VerificationResult::HasFatal() const noexcept {
  return std::any_of(errors.begin(), errors.end(),
                     [](const auto& issue) { return issue.severity == IssueSeverity::kFatal; });
}

bool VerificationResult::Has(VerificationCode code) const noexcept {
  auto match = [code](const auto& issue) { return issue.code == code; };
  return std::any_of(errors.begin(), errors.end(), match) ||
         std::any_of(warnings.begin(), warnings.end(), match);
}

SignatureVerifier::SignatureVerifier(orchestrator::EventBus& bus, VerifierHooks hooks)
    : bus_(bus), hooks_(std::move(hooks)) {}

TimePoint SignatureVerifier::Now() const { return hooks_.now ? hooks_.now() : Clock::now(); }

SignatureVerifier::Snapshot SignatureVerifier::TakeSnapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Snapshot snapshot;
  snapshot.anchors.reserve(anchors_.size());
  for (const auto& [name, anchor] : anchors_) {
    snapshot.anchors.push_back(anchor);
  }
  snapshot.revocations = revocations_;
  snapshot.generation = anchor_generation_;
  return snapshot;
}

VerificationResult SignatureVerifier::Verify(
    const std::filesystem::path& plugin_path,
    const std::optional<std::filesystem::path>& manifest_path) {
  const auto manifest = manifest_path ? *manifest_path : plugin_path / kDefaultManifestName;
  const std::string key = CacheKey(plugin_path, manifest);
  const auto now = Now();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
      if (now - it->second.stored_at < kCacheTtl) {
        VerificationResult cached = it->second.result;
        cached.from_cache = true;
        return cached;
      }
      cache_.erase(it);
    }
  }

  VerificationResult result;
  Snapshot snapshot;
  try {
    snapshot = TakeSnapshot();
    result = VerifyUncached(plugin_path, manifest, snapshot);
  } catch (const std::exception& ex) {
    result = VerificationResult{};
    result.verified_at = now;
    IssueCollector issues(result);
    issues.Fatal(VerificationCode::kVerificationError,
                 std::string("Verification aborted: ") + ex.what());
    result = issues.Finish();
  }

  try {
    std::lock_guard<std::mutex> lock(mutex_);
    if (snapshot.generation == anchor_generation_) {
      PruneCacheLocked(now);
      cache_.insert_or_assign(key, CacheEntry{result, now});
    }
  } catch (const std::exception& ex) {
    std::clog << "{\"event\":\"verification_cache_error\",\"detail\":\"" << ex.what() << "\"}"
              << std::endl;
  }
  PublishOutcome(plugin_path, result);
  return result;
}

VerificationResult SignatureVerifier::VerifyUncached(const std::filesystem::path& plugin_path,
                                                     const std::filesystem::path& manifest_path,
                                                     const Snapshot& snapshot) const {
  const TimePoint now = Now();
  VerificationResult r;
  r.verified_at = now;
  IssueCollector issues(r);

  // LOAD_MANIFEST
  r.reached = VerificationStep::kLoadManifest;
  PluginManifest manifest;
  try {
    manifest = ParseManifest(orchestrator::ReadFileText(manifest_path));
  } catch (const Error& err) {
    const bool missing = err.domain == ErrorDomain::IO;
    issues.Fatal(VerificationCode::kManifestInvalid,
                 missing ? std::string(errors::msg::kManifestMissing) + ": " + manifest_path.string()
                         : std::string(err.what()));
    return issues.Finish();
  }
  r.manifest = manifest;

  // CHECK_SIGNATURE
  r.reached = VerificationStep::kCheckSignature;
  if (!manifest.signature) {
    issues.Fatal(VerificationCode::kSignatureInvalid, std::string(errors::msg::kSignatureBlockMissing));
    return issues.Finish();
  }
  PluginSignature signature;
  try {
    signature = DecodeSignatureBlock(*manifest.signature);
  } catch (const Error& err) {
    if (err.domain == ErrorDomain::Security && err.code == errors::security::kUnsupportedAlgorithm) {
      issues.Fatal(VerificationCode::kAlgorithmNotSupported, err.what());
    } else {
      issues.Fatal(VerificationCode::kSignatureInvalid,
                   std::string(errors::msg::kSignatureBlockMalformed) + ": " + err.what());
    }
    return issues.Finish();
  }
  r.signature = signature;

  // PARSE_CERT
  r.reached = VerificationStep::kParseCertificate;
  std::vector<crypto::Certificate> chain;
  try {
    chain.push_back(crypto::Certificate::FromPem(signature.certificate_pem));
    for (const auto& pem : signature.chain_pem) {
      auto bundle = crypto::Certificate::BundleFromPem(pem);
      chain.insert(chain.end(), bundle.begin(), bundle.end());
    }
  } catch (const Error& err) {
    issues.Fatal(VerificationCode::kCertificateInvalid,
                 std::string(errors::msg::kCertificateUnparseable) + ": " + err.what());
    return issues.Finish();
  }
  const crypto::Certificate leaf = chain.front();

  // BUILD_CHAIN
  r.reached = VerificationStep::kBuildChain;
  auto anchor_for = [&snapshot](const crypto::Certificate& cert) -> const TrustAnchor* {
    for (const auto& anchor : snapshot.anchors) {
      if (cert.Equals(anchor.certificate)) {
        return &anchor;
      }
    }
    return nullptr;
  };
  const bool provided_has_anchor = std::any_of(chain.begin(), chain.end(), [&](const auto& cert) {
    return anchor_for(cert) != nullptr;
  });
  if (!provided_has_anchor) {
    const auto& top = chain.back();
    for (const auto& anchor : snapshot.anchors) {
      if (top.IsIssuedBy(anchor.certificate)) {
        chain.push_back(anchor.certificate);
        break;
      }
    }
  }
  std::optional<std::size_t> anchor_index;
  const TrustAnchor* matched = nullptr;
  for (std::size_t i = 0; i < chain.size() && !anchor_index; ++i) {
    if (const auto* anchor = anchor_for(chain[i])) {
      anchor_index = i;
      matched = anchor;
    }
  }
  bool complete = anchor_index.has_value();
  if (complete) {
    for (std::size_t j = 0; j < *anchor_index; ++j) {
      if (!chain[j].IsIssuedBy(chain[j + 1])) {
        complete = false;
        break;
      }
    }
  }
  if (!anchor_index) {
    issues.Fail(VerificationCode::kChainIncomplete, std::string(errors::msg::kTrustAnchorMissing));
    const auto& top = chain.back();
    const bool issuer_known =
        top.IsSelfSigned() || std::any_of(snapshot.anchors.begin(), snapshot.anchors.end(),
                                          [&top](const auto& anchor) {
                                            return anchor.certificate.Subject() == top.Issuer();
                                          });
    if (!issuer_known) {
      issues.Warn(VerificationCode::kUnknownIssuer, "Issuer '" + top.Issuer() + "' is not known");
    }
  } else if (!complete) {
    issues.Fail(VerificationCode::kChainIncomplete, std::string(errors::msg::kChainIncomplete));
  }
  if (chain.size() > kMaxChainLength) {
    issues.Warn(VerificationCode::kLongCertificateChain,
                "Certificate chain has " + std::to_string(chain.size()) + " certificates");
  }
  r.chain_complete = complete;
  for (const auto& cert : chain) {
    r.chain.push_back(Describe(cert));
  }

  // CHECK_TIME_VALIDITY
  r.reached = VerificationStep::kCheckTimeValidity;
  for (std::size_t i = 0; i < chain.size(); ++i) {
    const auto& cert = r.chain[i];
    if (now < cert.valid_from) {
      issues.Fail(VerificationCode::kTimeValidationFailed,
                   std::string(errors::msg::kCertificateNotYetValid) + ": " + cert.subject);
    } else if (now > cert.valid_to) {
      issues.Fail(VerificationCode::kCertificateExpired,
                   std::string(errors::msg::kCertificateExpired) + ": " + cert.subject);
    } else if (i == 0 && cert.valid_to - now < kExpiryWarningWindow) {
      issues.Warn(VerificationCode::kCertificateExpiringSoon,
                  "Signer certificate expires " + FormatTimestamp(cert.valid_to));
    }
  }

  // CHECK_REVOCATION
  r.reached = VerificationStep::kCheckRevocation;
  bool revoked = false;
  for (auto& cert : r.chain) {
    for (const auto& entry : snapshot.revocations) {
      if (Lower(entry.serial_hex) == cert.serial &&
          (entry.issuer.empty() || entry.issuer == cert.issuer)) {
        cert.revoked = true;
        cert.revocation_reason = entry.reason;
        issues.Fatal(VerificationCode::kCertificateRevoked,
                     std::string(errors::msg::kCertificateRevoked) + ": " + cert.subject +
                         (entry.reason.empty() ? "" : " (" + entry.reason + ")"));
        revoked = true;
        break;
      }
    }
  }
  if (revoked) {
    return issues.Finish();
  }

  // VALIDATE_TRUST
  r.reached = VerificationStep::kValidateTrust;
  const TrustLevel trust = complete && matched != nullptr ? matched->trust_level : TrustLevel::kUntrusted;
  r.trust_level = trust;
  for (auto& cert : r.chain) {
    cert.trust_level = trust;
  }

  // VERIFY_CONTENT_HASH
  r.reached = VerificationStep::kVerifyContentHash;
  std::string actual;
  try {
    actual = ComputeContentHash(plugin_path, manifest_path, signature.hash_algorithm);
  } catch (const Error& err) {
    issues.Fatal(VerificationCode::kVerificationError, err.what());
    return issues.Finish();
  }
  if (!crypto::ct::StringCompare(actual, signature.content_hash)) {
    issues.Fatal(VerificationCode::kHashMismatch, std::string(errors::msg::kContentHashMismatch));
    return issues.Finish();
  }
  for (const auto& attr : signature.signed_attributes) {
    if (attr.oid == oid::kContentType && attr.value != kPluginContentType) {
      issues.Fatal(VerificationCode::kSignatureInvalid,
                   "Signed content type '" + attr.value + "' is not a plugin");
      return issues.Finish();
    }
    if (attr.oid == oid::kMessageDigest && !crypto::ct::StringCompare(Lower(attr.value), actual)) {
      issues.Fatal(VerificationCode::kHashMismatch, std::string(errors::msg::kContentHashMismatch));
      return issues.Finish();
    }
    const bool known = attr.oid == oid::kContentType || attr.oid == oid::kMessageDigest ||
                       attr.oid == oid::kSigningTime;
    if (attr.critical && !known) {
      issues.Fatal(VerificationCode::kSignatureInvalid,
                   "Unrecognized critical signed attribute " + attr.oid);
      return issues.Finish();
    }
  }
  const auto data = CanonicalSignedData(signature.algorithm, signature.hash_algorithm,
                                        signature.content_hash, signature.signed_attributes);
  bool signature_ok = false;
  try {
    signature_ok = crypto::VerifyMessage(leaf, signature.algorithm, signature.hash_algorithm, data,
                                         signature.signature);
  } catch (const Error& err) {
    issues.Fatal(VerificationCode::kSignatureInvalid,
                 std::string(errors::msg::kSignatureMismatch) + ": " + err.what());
    return issues.Finish();
  }
  if (!signature_ok) {
    issues.Fatal(VerificationCode::kSignatureInvalid, std::string(errors::msg::kSignatureMismatch));
    return issues.Finish();
  }

  // VALIDATE_PERMISSIONS
  r.reached = VerificationStep::kValidatePermissions;
  const auto& granted = r.chain.front().permissions;
  std::vector<std::string> excess;
  for (const auto& permission : manifest.permissions) {
    if (std::find(granted.begin(), granted.end(), permission) == granted.end()) {
      excess.push_back(permission);
    }
    if (IsExcessivePermission(permission)) {
      issues.Warn(VerificationCode::kExcessivePermissions,
                  "Permission '" + permission + "' grants broad access");
    }
  }
  if (!excess.empty()) {
    std::string list;
    for (const auto& permission : excess) {
      list += list.empty() ? permission : ", " + permission;
    }
    issues.Fail(VerificationCode::kPermissionMismatch,
                 std::string(errors::msg::kPermissionsExceedGrant) + ": " + list);
  }

  // WARNINGS
  r.reached = VerificationStep::kWarnings;
  if (leaf.IsSelfSigned()) {
    issues.Warn(VerificationCode::kSelfSignedCertificate, "Signer certificate is self-signed");
  }
  for (std::size_t i = 0; i < chain.size(); ++i) {
    const auto& cert = r.chain[i];
    const std::string sig_alg = Lower(chain[i].SignatureAlgorithmName());
    if ((cert.public_key_type == "RSA" && cert.public_key_bits < kMinimumRsaBits) ||
        sig_alg.find("sha1") != std::string::npos || sig_alg.find("md5") != std::string::npos) {
      issues.Warn(VerificationCode::kWeakAlgorithm, "Weak key or signature algorithm in " + cert.subject);
    }
  }

  r.reached = VerificationStep::kDone;
  return issues.Finish();
}

void SignatureVerifier::PublishOutcome(const std::filesystem::path& plugin_path,
                                       const VerificationResult& result) {
  try {
    orchestrator::Event event;
    event.category = orchestrator::EventCategory::kSecurity;
    event.severity = result.valid ? orchestrator::EventSeverity::kInfo
                                  : orchestrator::EventSeverity::kWarning;
    event.event_id = "signature_verified";
    event.message = result.valid ? "Plugin signature verified" : "Plugin signature rejected";
    event.fields.emplace_back("plugin_path", plugin_path.string(), orchestrator::FieldPrivacy::kHash);
    event.fields.emplace_back("trust_level", std::string(ToString(result.trust_level)));
    event.fields.emplace_back("step", std::string(ToString(result.reached)));
    event.fields.emplace_back("errors", std::to_string(result.errors.size()),
                              orchestrator::FieldPrivacy::kPublic, true);
    if (!result.errors.empty()) {
      event.fields.emplace_back("first_error", std::string(ToString(result.errors.front().code)));
    }
    bus_.Publish(event);
  } catch (const std::exception& ex) {
    std::clog << "[trust] verification event dropped: " << ex.what() << std::endl;
  }
}

PluginSignature SignatureVerifier::Sign(const std::filesystem::path& plugin_path,
                                        const crypto::Certificate& certificate,
                                        const crypto::PrivateKey& key,
                                        const std::vector<crypto::Certificate>& chain,
                                        const SignOptions& options) const {
  const auto manifest_path =
      options.manifest_path ? *options.manifest_path : plugin_path / kDefaultManifestName;
  PluginSignature signature;
  signature.algorithm = crypto::AlgorithmForKey(key.type());
  signature.hash_algorithm = options.hash_algorithm;
  signature.content_hash = ComputeContentHash(plugin_path, manifest_path, options.hash_algorithm);
  signature.signing_time = options.signing_time ? *options.signing_time : Now();
  signature.signed_attributes = {
      {std::string(oid::kSigningTime), FormatTimestamp(signature.signing_time), false},
      {std::string(oid::kMessageDigest), signature.content_hash, false},
      {std::string(oid::kContentType), std::string(kPluginContentType), true},
  };
  const auto data = CanonicalSignedData(signature.algorithm, signature.hash_algorithm,
                                        signature.content_hash, signature.signed_attributes);
  signature.signature = crypto::SignMessage(key, signature.algorithm, signature.hash_algorithm, data);
  if (!crypto::VerifyMessage(certificate, signature.algorithm, signature.hash_algorithm, data,
                             signature.signature)) {
    throw Error(ErrorDomain::Validation, errors::validation::kPrivateKeyInvalid,
                "Private key does not belong to the signing certificate");
  }
  signature.certificate_pem = certificate.ToPem();
  for (const auto& cert : chain) {
    signature.chain_pem.push_back(cert.ToPem());
  }
  return signature;
}

PluginSignature SignatureVerifier::Sign(const std::filesystem::path& plugin_path,
                                        std::string_view certificate_pem, std::string_view key_pem,
                                        std::optional<std::string_view> passphrase,
                                        std::string_view chain_pem,
                                        const SignOptions& options) const {
  const auto certificate = crypto::Certificate::FromPem(certificate_pem);
  const auto key = crypto::PrivateKey::FromPem(key_pem, passphrase);
  std::vector<crypto::Certificate> chain;
  if (!chain_pem.empty()) {
    chain = crypto::Certificate::BundleFromPem(chain_pem);
  }
  return Sign(plugin_path, certificate, key, chain, options);
}

void SignatureVerifier::WriteSignature(const std::filesystem::path& manifest_path,
                                       const PluginSignature& signature) {
  const auto current = orchestrator::ReadFileText(manifest_path);
  const auto updated = EmbedSignatureBlock(current, EncodeSignatureBlock(signature));
  orchestrator::AtomicReplace(manifest_path, updated);
}

void SignatureVerifier::AddTrustAnchor(const std::string& name,
                                       const crypto::Certificate& certificate, TrustLevel level) {
  if (!certificate.IsSelfSigned()) {
    throw Error(ErrorDomain::Validation, errors::validation::kTrustAnchorNotSelfSigned,
                std::string(errors::msg::kAnchorNotSelfSigned) + ": " + certificate.Subject());
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    anchors_.insert_or_assign(name, TrustAnchor{name, certificate, level, Now()});
    ++anchor_generation_;
    cache_.clear();
  }
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kLifecycle;
  event.severity = orchestrator::EventSeverity::kInfo;
  event.event_id = "trust_anchor_added";
  event.message = "Trust anchor registered";
  event.fields.emplace_back("name", name);
  event.fields.emplace_back("fingerprint", certificate.FingerprintSha256());
  event.fields.emplace_back("trust_level", std::string(ToString(level)));
  bus_.Publish(event);
}

bool SignatureVerifier::RemoveTrustAnchor(const std::string& name) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (anchors_.erase(name) == 0) {
      return false;
    }
    ++anchor_generation_;
    cache_.clear();
  }
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kLifecycle;
  event.severity = orchestrator::EventSeverity::kInfo;
  event.event_id = "trust_anchor_removed";
  event.message = "Trust anchor removed";
  event.fields.emplace_back("name", name);
  bus_.Publish(event);
  return true;
}

std::vector<TrustAnchor> SignatureVerifier::ListTrustAnchors() const {
  return TakeSnapshot().anchors;
}

void SignatureVerifier::AddRevocation(const std::string& issuer, const std::string& serial_hex,
                                      const std::string& reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  revocations_.push_back(RevocationEntry{issuer, Lower(serial_hex), reason, Now()});
  ++anchor_generation_;
  cache_.clear();
}

std::size_t SignatureVerifier::ImportCrl(std::string_view pem) {
  const std::string issuer = crypto::CrlIssuer(pem);
  const auto snapshot = TakeSnapshot();
  const crypto::Certificate* verifier = nullptr;
  for (const auto& anchor : snapshot.anchors) {
    if (anchor.certificate.Subject() == issuer) {
      verifier = &anchor.certificate;
      break;
    }
  }
  if (verifier == nullptr) {
    std::clog << "[trust] CRL issuer '" << issuer
              << "' is not a registered anchor; signature not checked" << std::endl;
  }
  const auto entries = crypto::ParseCrlPem(pem, verifier);
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t added = 0;
  for (const auto& entry : entries) {
    const std::string serial = Lower(entry.serial_hex);
    const bool known = std::any_of(revocations_.begin(), revocations_.end(), [&](const auto& r) {
      return r.serial_hex == serial && r.issuer == entry.issuer;
    });
    if (!known) {
      revocations_.push_back(RevocationEntry{entry.issuer, serial, entry.reason, entry.revoked_at});
      ++added;
    }
  }
  if (added != 0) {
    ++anchor_generation_;
    cache_.clear();
  }
  return added;
}

std::vector<RevocationEntry> SignatureVerifier::ListRevocations() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return revocations_;
}

// Drops expired entries, then the oldest ones until an insert fits.
void SignatureVerifier::PruneCacheLocked(TimePoint now) {
  for (auto it = cache_.begin(); it != cache_.end();) {
    if (now - it->second.stored_at >= kCacheTtl) {
      it = cache_.erase(it);
    } else {
      ++it;
    }
  }
  while (cache_.size() >= kCacheCapacity) {
    auto oldest = std::min_element(cache_.begin(), cache_.end(), [](const auto& a, const auto& b) {
      return a.second.stored_at < b.second.stored_at;
    });
    cache_.erase(oldest);
  }
}

void SignatureVerifier::ClearCache() {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_.clear();
}

std::size_t SignatureVerifier::CacheSize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.size();
}

} // namespace pw::trust

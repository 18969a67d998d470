#include "pw/trust/signature_verifier.h" // TSK131_Signature_Verifier

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

#include "pw/crypto/x509.h"
#include "pw/orchestrator/event_bus.h"
#include "test_support.h"

namespace {

  using pw::TrustLevel;
  using pw::crypto::CertificateRequest;
  using pw::crypto::GenerateCertificate;
  using pw::crypto::IssuedCertificate;
  using pw::trust::SignatureVerifier;
  using pw::trust::VerificationCode;
  using pw::trust::VerificationStep;
  using pw::test::Expect;
  using pw::test::TempDir;
  using pw::test::WriteFile;

  struct Pki {
    IssuedCertificate root;
    IssuedCertificate leaf;
  };

  Pki MakePki() {
    CertificateRequest root_req;
    root_req.common_name = "PW Test Root";
    root_req.is_ca = true;
    root_req.validity_days = 3650;
    auto root = GenerateCertificate(root_req);

    CertificateRequest leaf_req;
    leaf_req.common_name = "Plugin Signer";
    leaf_req.permissions = {"storage.read", "network.https"};
    auto leaf = GenerateCertificate(leaf_req, &root);
    return Pki{std::move(root), std::move(leaf)};
  }

  void WritePlugin(const std::filesystem::path& dir, const std::string& permissions_json) {
    WriteFile(dir / "index.js", "module.exports = require('./lib/util');\n");
    WriteFile(dir / "lib" / "util.js", "module.exports = function add(a, b) { return a + b; };\n");
    WriteFile(dir / "plugin.json", "{\"id\":\"demo\",\"name\":\"Demo\",\"version\":\"1.0.0\","
                                   "\"entry\":\"index.js\",\"permissions\":" +
                                       permissions_json + "}");
  }

  void SignPlugin(const SignatureVerifier& verifier, const std::filesystem::path& dir, const Pki& pki,
                  bool include_chain = true) {
    std::vector<pw::crypto::Certificate> chain;
    if (include_chain) {
      chain.push_back(pki.root.certificate);
    }
    const auto signature = verifier.Sign(dir, pki.leaf.certificate, pki.leaf.key, chain);
    SignatureVerifier::WriteSignature(dir / "plugin.json", signature);
  }

  void TestValidSignature() {
    const auto pki = MakePki();
    TempDir dir("pw_verifier");
    WritePlugin(dir.path(), "[\"storage.read\"]");
    pw::orchestrator::EventBus bus;
    int verified_events = 0;
    bus.Subscribe([&](const pw::orchestrator::Event& e) {
      if (e.event_id == "signature_verified") {
        ++verified_events;
      }
    });
    SignatureVerifier verifier(bus);
    SignPlugin(verifier, dir.path(), pki);
    verifier.AddTrustAnchor("corp", pki.root.certificate, TrustLevel::kEnterprise);

    const auto result = verifier.Verify(dir.path());
    Expect(result.valid, "signed plugin verifies");
    Expect(result.errors.empty(), "no verification errors");
    Expect(result.trust_level == TrustLevel::kEnterprise, "trust level taken from the anchor");
    Expect(result.chain_complete && result.chain.size() == 2, "leaf chains to the anchor");
    Expect(result.reached == VerificationStep::kDone, "every step ran");
    Expect(!result.chain.empty() && result.chain[0].subject.find("Plugin Signer") != std::string::npos,
           "leaf described first");
    Expect(!result.chain.empty() &&
               std::find(result.chain[0].permissions.begin(), result.chain[0].permissions.end(),
                         "network.https") != result.chain[0].permissions.end(),
           "certificate permissions exposed");
    Expect(result.manifest.has_value() && result.manifest->id == "demo", "manifest carried in result");
    Expect(!result.Has(VerificationCode::kSelfSignedCertificate), "CA-issued signer is not self-signed");
    Expect(verified_events == 1, "outcome published");

    // The content hash excludes the manifest, so re-embedding keeps it valid.
    Expect(pw::test::ReadFile(dir.path() / "plugin.json").find("\"contentHash\"") != std::string::npos,
           "signature embedded in the manifest");
  }

  void TestAnchorAppendedWhenChainOmitted() {
    const auto pki = MakePki();
    TempDir dir("pw_verifier");
    WritePlugin(dir.path(), "[]");
    pw::orchestrator::EventBus bus;
    SignatureVerifier verifier(bus);
    SignPlugin(verifier, dir.path(), pki, false);
    verifier.AddTrustAnchor("corp", pki.root.certificate, TrustLevel::kHigh);
    const auto result = verifier.Verify(dir.path());
    Expect(result.valid && result.chain_complete && result.chain.size() == 2,
           "registered anchor completes a leaf-only chain");
    Expect(result.trust_level == TrustLevel::kHigh, "anchor level applied");
  }

  void TestCache() { // TSK131_Verifier_Clock
    const auto pki = MakePki();
    TempDir dir("pw_verifier");
    WritePlugin(dir.path(), "[]");
    pw::orchestrator::EventBus bus;
    auto now = pw::Clock::now();
    pw::trust::VerifierHooks hooks;
    hooks.now = [&now] { return now; };
    SignatureVerifier verifier(bus, hooks);
    SignPlugin(verifier, dir.path(), pki);
    verifier.AddTrustAnchor("corp", pki.root.certificate, TrustLevel::kEnterprise);

    auto first = verifier.Verify(dir.path());
    auto second = verifier.Verify(dir.path());
    Expect(!first.from_cache && second.from_cache, "second verification served from cache");
    Expect(verifier.CacheSize() == 1, "one cache entry");

    now += std::chrono::minutes(6);
    Expect(!verifier.Verify(dir.path()).from_cache, "entries expire after the TTL");

    verifier.AddTrustAnchor("other", MakePki().root.certificate, TrustLevel::kLow);
    Expect(verifier.CacheSize() == 0, "anchor change invalidates the cache");
    verifier.Verify(dir.path());
    verifier.ClearCache();
    Expect(verifier.CacheSize() == 0, "cache cleared");
  }

  void TestCacheBounded() {
    TempDir first("pw_verifier");
    TempDir second("pw_verifier");
    WritePlugin(first.path(), "[]");
    WritePlugin(second.path(), "[]");
    pw::orchestrator::EventBus bus;
    auto now = pw::Clock::now();
    pw::trust::VerifierHooks hooks;
    hooks.now = [&now] { return now; };
    SignatureVerifier verifier(bus, hooks);

    verifier.Verify(first.path());
    now += std::chrono::minutes(6);
    verifier.Verify(second.path());
    Expect(verifier.CacheSize() == 1, "expired entries dropped when a new result is cached");

    for (std::size_t i = 0; i < SignatureVerifier::kCacheCapacity + 20; ++i) {
      now += std::chrono::milliseconds(1);
      verifier.Verify(first.path(), first.path() / ("manifest-" + std::to_string(i) + ".json"));
    }
    Expect(verifier.CacheSize() == SignatureVerifier::kCacheCapacity, "cache size capped");
    const auto latest = verifier.Verify(
        first.path(), first.path() / ("manifest-" + std::to_string(SignatureVerifier::kCacheCapacity + 19) + ".json"));
    Expect(latest.from_cache, "newest entries survive eviction");
  }

  void TestTamperedContent() {
    const auto pki = MakePki();
    TempDir dir("pw_verifier");
    WritePlugin(dir.path(), "[]");
    pw::orchestrator::EventBus bus;
    SignatureVerifier verifier(bus);
    SignPlugin(verifier, dir.path(), pki);
    verifier.AddTrustAnchor("corp", pki.root.certificate, TrustLevel::kEnterprise);
    WriteFile(dir.path() / "lib" / "util.js", "module.exports = function add(a, b) { return a - b; };\n");

    const auto result = verifier.Verify(dir.path());
    Expect(!result.valid && result.HasFatal(), "modified file is fatal");
    Expect(result.Has(VerificationCode::kHashMismatch), "hash mismatch reported");
    Expect(result.reached == VerificationStep::kVerifyContentHash, "stopped at the content hash");
    Expect(result.trust_level == TrustLevel::kUntrusted, "invalid result carries no trust");

    WriteFile(dir.path() / "lib" / "util.js", "module.exports = function add(a, b) { return a + b; };\n");
    WriteFile(dir.path() / "extra.js", "1;\n");
    verifier.ClearCache();
    Expect(verifier.Verify(dir.path()).Has(VerificationCode::kHashMismatch), "added file breaks the hash");
  }

  void TestManifestProblems() {
    pw::orchestrator::EventBus bus;
    SignatureVerifier verifier(bus);
    TempDir dir("pw_verifier");
    auto result = verifier.Verify(dir.path());
    Expect(!result.valid && result.Has(VerificationCode::kManifestInvalid) &&
               result.reached == VerificationStep::kLoadManifest,
           "missing manifest");

    TempDir unsigned_dir("pw_verifier");
    WritePlugin(unsigned_dir.path(), "[]");
    result = verifier.Verify(unsigned_dir.path());
    Expect(!result.valid && result.Has(VerificationCode::kSignatureInvalid) &&
               result.reached == VerificationStep::kCheckSignature,
           "unsigned manifest");

    TempDir bad_alg("pw_verifier");
    WriteFile(bad_alg.path() / "plugin.json",
              "{\"id\":\"x\",\"signature\":{\"algorithm\":\"DSA\",\"hashAlgorithm\":\"SHA-256\","
              "\"contentHash\":\"00\",\"signature\":\"AA==\",\"certificate\":\"\"}}");
    result = verifier.Verify(bad_alg.path());
    Expect(result.Has(VerificationCode::kAlgorithmNotSupported), "unknown algorithm named distinctly");
  }

  void TestUntrustedChain() {
    const auto pki = MakePki();
    TempDir dir("pw_verifier");
    WritePlugin(dir.path(), "[]");
    pw::orchestrator::EventBus bus;
    SignatureVerifier verifier(bus);
    SignPlugin(verifier, dir.path(), pki, false);
    const auto result = verifier.Verify(dir.path());
    Expect(!result.valid && !result.chain_complete, "no anchor means an incomplete chain");
    Expect(result.Has(VerificationCode::kChainIncomplete), "chain error reported");
    Expect(result.Has(VerificationCode::kUnknownIssuer), "issuer unknown");
    Expect(!result.HasFatal() && result.reached == VerificationStep::kDone, "non-fatal errors keep going");
    Expect(result.trust_level == TrustLevel::kUntrusted, "untrusted");
  }

  void TestPermissionMismatch() {
    const auto pki = MakePki();
    TempDir dir("pw_verifier");
    WritePlugin(dir.path(), "[\"storage.read\",\"admin\"]");
    pw::orchestrator::EventBus bus;
    SignatureVerifier verifier(bus);
    SignPlugin(verifier, dir.path(), pki);
    verifier.AddTrustAnchor("corp", pki.root.certificate, TrustLevel::kEnterprise);
    const auto result = verifier.Verify(dir.path());
    Expect(!result.valid && result.Has(VerificationCode::kPermissionMismatch),
           "permission outside the certificate grant");
    Expect(result.Has(VerificationCode::kExcessivePermissions), "broad permission warned");
  }

  void TestRevocation() {
    const auto pki = MakePki();
    TempDir dir("pw_verifier");
    WritePlugin(dir.path(), "[]");
    pw::orchestrator::EventBus bus;
    SignatureVerifier verifier(bus);
    SignPlugin(verifier, dir.path(), pki);
    verifier.AddTrustAnchor("corp", pki.root.certificate, TrustLevel::kEnterprise);
    Expect(verifier.Verify(dir.path()).valid, "valid before revocation");

    const auto crl = pw::crypto::IssueCrl(pki.root, {pki.leaf.certificate.SerialHex()});
    Expect(verifier.ImportCrl(crl) == 1, "one revoked serial imported");
    Expect(verifier.ImportCrl(crl) == 0, "re-import adds nothing");
    const auto result = verifier.Verify(dir.path());
    Expect(!result.valid && result.Has(VerificationCode::kCertificateRevoked), "revoked signer rejected");
    Expect(result.reached == VerificationStep::kCheckRevocation, "stopped at revocation");
    Expect(!result.chain.empty() && result.chain[0].revoked, "leaf marked revoked");

    const auto other = MakePki();
    TempDir second("pw_verifier");
    WritePlugin(second.path(), "[]");
    SignPlugin(verifier, second.path(), other);
    verifier.AddTrustAnchor("other", other.root.certificate, TrustLevel::kMedium);
    verifier.AddRevocation("", other.leaf.certificate.SerialHex(), "key compromise");
    const auto manual = verifier.Verify(second.path());
    Expect(manual.Has(VerificationCode::kCertificateRevoked), "manual revocation applies");
    Expect(!manual.chain.empty() && manual.chain[0].revocation_reason == "key compromise", "reason kept");
  }

  void TestAnchorMustBeSelfSigned() {
    const auto pki = MakePki();
    pw::orchestrator::EventBus bus;
    SignatureVerifier verifier(bus);
    pw::test::ExpectError([&] { verifier.AddTrustAnchor("leaf", pki.leaf.certificate, TrustLevel::kHigh); },
                          pw::ErrorDomain::Validation, pw::errors::validation::kTrustAnchorNotSelfSigned,
                          "intermediate rejected as anchor");
    verifier.AddTrustAnchor("corp", pki.root.certificate, TrustLevel::kHigh);
    Expect(verifier.ListTrustAnchors().size() == 1, "anchor listed");
    Expect(verifier.RemoveTrustAnchor("corp") && !verifier.RemoveTrustAnchor("corp"), "remove once");
  }

  void TestSelfSignedSigner() {
    CertificateRequest request;
    request.common_name = "Solo Developer";
    request.key_type = pw::crypto::KeyType::kEd25519;
    request.permissions = {"storage.read"};
    const auto solo = GenerateCertificate(request);
    TempDir dir("pw_verifier");
    WritePlugin(dir.path(), "[\"storage.read\"]");
    pw::orchestrator::EventBus bus;
    SignatureVerifier verifier(bus);
    const auto signature = verifier.Sign(dir.path(), solo.certificate, solo.key);
    Expect(signature.algorithm == pw::crypto::SignatureAlgorithm::kEd25519, "algorithm follows the key");
    SignatureVerifier::WriteSignature(dir.path() / "plugin.json", signature);
    verifier.AddTrustAnchor("solo", solo.certificate, TrustLevel::kLow);
    const auto result = verifier.Verify(dir.path());
    Expect(result.valid && result.trust_level == TrustLevel::kLow, "self-signed anchor trusted at its level");
    Expect(result.Has(VerificationCode::kSelfSignedCertificate), "self-signed signer warned");
  }

  void TestExpiredCertificate() {
    const auto pki = MakePki();
    TempDir dir("pw_verifier");
    WritePlugin(dir.path(), "[]");
    pw::orchestrator::EventBus bus;
    pw::trust::VerifierHooks hooks;
    hooks.now = [] { return pw::Clock::now() + std::chrono::hours(24 * 400); };
    SignatureVerifier later(bus, hooks);
    SignPlugin(SignatureVerifier(bus), dir.path(), pki);
    later.AddTrustAnchor("corp", pki.root.certificate, TrustLevel::kEnterprise);
    const auto result = later.Verify(dir.path());
    Expect(!result.valid && result.Has(VerificationCode::kCertificateExpired), "expired signer rejected");

    pw::trust::VerifierHooks soon;
    soon.now = [] { return pw::Clock::now() + std::chrono::hours(24 * 350); };
    SignatureVerifier near_expiry(bus, soon);
    near_expiry.AddTrustAnchor("corp", pki.root.certificate, TrustLevel::kEnterprise);
    const auto warned = near_expiry.Verify(dir.path());
    Expect(warned.valid && warned.Has(VerificationCode::kCertificateExpiringSoon), "expiry warning window");
  }

  void TestSigningErrors() {
    const auto pki = MakePki();
    const auto other = MakePki();
    TempDir dir("pw_verifier");
    WritePlugin(dir.path(), "[]");
    pw::orchestrator::EventBus bus;
    SignatureVerifier verifier(bus);
    pw::test::ExpectError([&] { (void)verifier.Sign(dir.path(), pki.leaf.certificate, other.leaf.key); },
                          pw::ErrorDomain::Validation, pw::errors::validation::kPrivateKeyInvalid,
                          "key from another certificate");

    const auto key_pem = pki.leaf.key.ToPem(std::string_view("correct horse"));
    const auto signature = verifier.Sign(dir.path(), pki.leaf.certificate.ToPem(), key_pem,
                                         std::string_view("correct horse"), pki.root.certificate.ToPem());
    Expect(signature.chain_pem.size() == 1, "chain bundle carried");
    Expect(signature.content_hash.size() == 64, "SHA-256 content hash");
  }

} // namespace

int main() {
  TestValidSignature();
  TestAnchorAppendedWhenChainOmitted();
  TestCache();
  TestCacheBounded();
  TestTamperedContent();
  TestManifestProblems();
  TestUntrustedChain();
  TestPermissionMismatch();
  TestRevocation();
  TestAnchorMustBeSelfSigned();
  TestSelfSignedSigner();
  TestExpiredCertificate();
  TestSigningErrors();
  return pw::test::Finish("signature verifier");
}

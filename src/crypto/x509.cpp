#include "pw/crypto/x509.h"

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#if PW_HAVE_SODIUM
#include <sodium.h>
#endif

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <string>
#include <utility>

#include "pw/crypto/provider.h"
#include "pw/crypto/random.h"
#include "pw/crypto/sha256.h"
#include "pw/error.h"
#include "pw/errors.h"

namespace pw::crypto {

namespace {

struct OpenSSLDeleter {
  void operator()(BIO* bio) const noexcept { BIO_free(bio); }
  void operator()(EVP_PKEY_CTX* ctx) const noexcept { EVP_PKEY_CTX_free(ctx); }
  void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
  void operator()(BIGNUM* bn) const noexcept { BN_free(bn); }
  // ASN1_INTEGER and ASN1_TIME are both ASN1_STRING.
  void operator()(ASN1_STRING* value) const noexcept { ASN1_STRING_free(value); }
  void operator()(X509_CRL* crl) const noexcept { X509_CRL_free(crl); }
  void operator()(X509_REVOKED* rev) const noexcept { X509_REVOKED_free(rev); }
  void operator()(X509_EXTENSION* ext) const noexcept { X509_EXTENSION_free(ext); }
  void operator()(GENERAL_NAMES* names) const noexcept { GENERAL_NAMES_free(names); }
};

template <typename T>
using OsslPtr = std::unique_ptr<T, OpenSSLDeleter>;

std::shared_ptr<X509> WrapX509(X509* cert) {
  return std::shared_ptr<X509>(cert, [](X509* c) { X509_free(c); });
}

std::shared_ptr<EVP_PKEY> WrapKey(EVP_PKEY* key) {
  return std::shared_ptr<EVP_PKEY>(key, [](EVP_PKEY* k) { EVP_PKEY_free(k); });
}

OsslPtr<BIO> MemoryBio(std::string_view data) {
  OsslPtr<BIO> bio(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())));
  if (!bio) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("BIO_new_mem_buf"));
  }
  return bio;
}

OsslPtr<BIO> WritableBio() {
  OsslPtr<BIO> bio(BIO_new(BIO_s_mem()));
  if (!bio) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("BIO_new"));
  }
  return bio;
}

std::string DrainBio(BIO* bio) {
  char* data = nullptr;
  long len = BIO_get_mem_data(bio, &data);
  if (len <= 0 || data == nullptr) {
    return {};
  }
  return std::string(data, static_cast<std::size_t>(len));
}

[[noreturn]] void ThrowInvalidCertificate(const std::string& detail) {
  throw Error(ErrorDomain::Validation, errors::validation::kCertificateInvalid,
              std::string(errors::msg::kCertificateUnparseable) + ": " + detail);
}

std::string NameToString(const X509_NAME* name) {
  auto bio = WritableBio();
  if (X509_NAME_print_ex(bio.get(), name, 0, XN_FLAG_RFC2253) < 0) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("X509_NAME_print_ex"));
  }
  return DrainBio(bio.get());
}

TimePoint Asn1TimeToTimePoint(const ASN1_TIME* time) {
  std::tm tm{};
  if (time == nullptr || ASN1_TIME_to_tm(time, &tm) != 1) {
    ThrowInvalidCertificate("unreadable validity time");
  }
  return Clock::from_time_t(timegm(&tm));
}

std::string SerialToHex(const ASN1_INTEGER* serial) {
  OsslPtr<BIGNUM> bn(ASN1_INTEGER_to_BN(serial, nullptr));
  if (!bn) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("ASN1_INTEGER_to_BN"));
  }
  char* hex = BN_bn2hex(bn.get());
  if (hex == nullptr) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("BN_bn2hex"));
  }
  std::string out(hex);
  OPENSSL_free(hex);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

OsslPtr<ASN1_INTEGER> RandomSerial() {
  std::array<std::uint8_t, 16> bytes{};
  SystemRandomBytes(std::span<std::uint8_t>(bytes.data(), bytes.size()));
  bytes[0] &= 0x7F; // keep the serial positive
  bytes[0] |= 0x01;
  OsslPtr<BIGNUM> bn(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr));
  if (!bn) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("BN_bin2bn"));
  }
  OsslPtr<ASN1_INTEGER> serial(BN_to_ASN1_INTEGER(bn.get(), nullptr));
  if (!serial) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("BN_to_ASN1_INTEGER"));
  }
  return serial;
}

OsslPtr<ASN1_INTEGER> SerialFromHex(const std::string& hex) {
  BIGNUM* raw = nullptr;
  if (BN_hex2bn(&raw, hex.c_str()) == 0) {
    throw Error(ErrorDomain::Validation, errors::validation::kCrlInvalid,
                "Invalid serial number: " + hex);
  }
  OsslPtr<BIGNUM> bn(raw);
  OsslPtr<ASN1_INTEGER> serial(BN_to_ASN1_INTEGER(bn.get(), nullptr));
  if (!serial) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("BN_to_ASN1_INTEGER"));
  }
  return serial;
}

const EVP_MD* MessageDigest(HashAlgorithm hash) {
  switch (hash) {
  case HashAlgorithm::kSha256:
    return EVP_sha256();
  case HashAlgorithm::kSha384:
    return EVP_sha384();
  case HashAlgorithm::kSha512:
    return EVP_sha512();
  }
  return EVP_sha256();
}

KeyType KeyTypeOf(const EVP_PKEY* key) {
  switch (EVP_PKEY_base_id(key)) {
  case EVP_PKEY_RSA:
  case EVP_PKEY_RSA_PSS:
    return KeyType::kRsa;
  case EVP_PKEY_EC:
    return KeyType::kEc;
  case EVP_PKEY_ED25519:
    return KeyType::kEd25519;
  default:
    break;
  }
  throw Error(ErrorDomain::Security, errors::security::kUnsupportedAlgorithm,
              std::string(errors::msg::kUnsupportedSignatureAlgorithm));
}

bool KeyMatchesAlgorithm(KeyType type, SignatureAlgorithm algorithm) {
  return AlgorithmForKey(type) == algorithm;
}

// Configures RSA-PSS padding on a sign/verify context; no-op for other keys.
void ConfigurePadding(EVP_PKEY_CTX* pctx, SignatureAlgorithm algorithm) {
  if (algorithm != SignatureAlgorithm::kRsaPss) {
    return;
  }
  if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) <= 0 ||
      EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, RSA_PSS_SALTLEN_DIGEST) <= 0) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("RSA-PSS padding"));
  }
}

int PassphraseCallback(char* buf, int size, int /*rwflag*/, void* userdata) {
  if (userdata == nullptr || size <= 0) {
    return 0;
  }
  const auto* passphrase = static_cast<const std::string*>(userdata);
  int len = static_cast<int>(std::min<std::size_t>(passphrase->size(),
                                                   static_cast<std::size_t>(size)));
  std::copy_n(passphrase->data(), len, buf);
  return len;
}

void AddExtension(X509* cert, X509V3_CTX* ctx, int nid, const std::string& value) {
  OsslPtr<X509_EXTENSION> ext(X509V3_EXT_conf_nid(nullptr, ctx, nid, value.c_str()));
  if (!ext) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("X509V3_EXT_conf_nid"));
  }
  if (X509_add_ext(cert, ext.get(), -1) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("X509_add_ext"));
  }
}

std::string CrlReasonName(long code) {
  switch (code) {
  case 0:
    return "unspecified";
  case 1:
    return "keyCompromise";
  case 2:
    return "cACompromise";
  case 3:
    return "affiliationChanged";
  case 4:
    return "superseded";
  case 5:
    return "cessationOfOperation";
  case 6:
    return "certificateHold";
  case 8:
    return "removeFromCRL";
  case 9:
    return "privilegeWithdrawn";
  case 10:
    return "aACompromise";
  default:
    return "unspecified";
  }
}

OsslPtr<X509_CRL> ReadCrl(std::string_view pem) {
  auto bio = MemoryBio(pem);
  OsslPtr<X509_CRL> crl(PEM_read_bio_X509_CRL(bio.get(), nullptr, nullptr, nullptr));
  if (!crl) {
    throw Error(ErrorDomain::Validation, errors::validation::kCrlInvalid,
                BuildOpenSSLErrorMessage("PEM_read_bio_X509_CRL"));
  }
  return crl;
}

}  // namespace

std::string_view ToString(SignatureAlgorithm algorithm) noexcept {
  switch (algorithm) {
  case SignatureAlgorithm::kRsaPss:
    return "RSA-PSS";
  case SignatureAlgorithm::kEcdsa:
    return "ECDSA";
  case SignatureAlgorithm::kEd25519:
    return "Ed25519";
  }
  return "ECDSA";
}

SignatureAlgorithm ParseSignatureAlgorithm(std::string_view name) {
  if (name == "RSA-PSS") {
    return SignatureAlgorithm::kRsaPss;
  }
  if (name == "ECDSA") {
    return SignatureAlgorithm::kEcdsa;
  }
  if (name == "Ed25519" || name == "EdDSA") {
    return SignatureAlgorithm::kEd25519;
  }
  throw Error(ErrorDomain::Security, errors::security::kUnsupportedAlgorithm,
              std::string(errors::msg::kUnsupportedSignatureAlgorithm) + ": " + std::string(name));
}

SignatureAlgorithm AlgorithmForKey(KeyType type) noexcept {
  switch (type) {
  case KeyType::kRsa:
    return SignatureAlgorithm::kRsaPss;
  case KeyType::kEc:
    return SignatureAlgorithm::kEcdsa;
  case KeyType::kEd25519:
    return SignatureAlgorithm::kEd25519;
  }
  return SignatureAlgorithm::kEcdsa;
}

// --- Certificate -----------------------------------------------------------

Certificate Certificate::FromPem(std::string_view pem) {
  auto bio = MemoryBio(pem);
  X509* raw = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
  if (raw == nullptr) {
    ThrowInvalidCertificate(BuildOpenSSLErrorMessage("PEM_read_bio_X509"));
  }
  return Certificate(WrapX509(raw));
}

std::vector<Certificate> Certificate::BundleFromPem(std::string_view pem) {
  std::vector<Certificate> out;
  auto bio = MemoryBio(pem);
  while (true) {
    X509* raw = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
    if (raw == nullptr) {
      break;
    }
    out.push_back(Certificate(WrapX509(raw)));
  }
  ERR_clear_error(); // end of bundle reports PEM_R_NO_START_LINE
  return out;
}

std::string Certificate::ToPem() const {
  auto bio = WritableBio();
  if (PEM_write_bio_X509(bio.get(), cert_.get()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("PEM_write_bio_X509"));
  }
  return DrainBio(bio.get());
}

std::vector<std::uint8_t> Certificate::ToDer() const {
  int len = i2d_X509(cert_.get(), nullptr);
  if (len <= 0) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("i2d_X509"));
  }
  std::vector<std::uint8_t> der(static_cast<std::size_t>(len));
  unsigned char* cursor = der.data();
  i2d_X509(cert_.get(), &cursor);
  return der;
}

std::string Certificate::Subject() const {
  return NameToString(X509_get_subject_name(cert_.get()));
}

std::string Certificate::Issuer() const {
  return NameToString(X509_get_issuer_name(cert_.get()));
}

std::string Certificate::SerialHex() const {
  return SerialToHex(X509_get0_serialNumber(cert_.get()));
}

TimePoint Certificate::NotBefore() const {
  return Asn1TimeToTimePoint(X509_get0_notBefore(cert_.get()));
}

TimePoint Certificate::NotAfter() const {
  return Asn1TimeToTimePoint(X509_get0_notAfter(cert_.get()));
}

std::string Certificate::FingerprintSha256() const {
  auto digest = SHA256_Hash(ToDer());
  return HexEncode(digest.data(), digest.size());
}

std::vector<std::string> Certificate::Permissions() const {
  std::vector<std::string> permissions;
  OsslPtr<GENERAL_NAMES> names(static_cast<GENERAL_NAMES*>(
      X509_get_ext_d2i(cert_.get(), NID_subject_alt_name, nullptr, nullptr)));
  if (!names) {
    return permissions;
  }
  for (int i = 0; i < sk_GENERAL_NAME_num(names.get()); ++i) {
    const GENERAL_NAME* name = sk_GENERAL_NAME_value(names.get(), i);
    if (name->type != GEN_URI) {
      continue;
    }
    const ASN1_IA5STRING* uri = name->d.uniformResourceIdentifier;
    std::string value(reinterpret_cast<const char*>(ASN1_STRING_get0_data(uri)),
                      static_cast<std::size_t>(ASN1_STRING_length(uri)));
    if (value.rfind(kPermissionUriPrefix, 0) == 0) {
      permissions.push_back(value.substr(kPermissionUriPrefix.size()));
    }
  }
  return permissions;
}

std::string Certificate::PublicKeyType() const {
  EVP_PKEY* key = X509_get0_pubkey(cert_.get());
  if (key == nullptr) {
    ThrowInvalidCertificate("missing public key");
  }
  switch (EVP_PKEY_base_id(key)) {
  case EVP_PKEY_RSA:
  case EVP_PKEY_RSA_PSS:
    return "RSA";
  case EVP_PKEY_EC:
    return "EC";
  case EVP_PKEY_ED25519:
    return "ED25519";
  default:
    return OBJ_nid2sn(EVP_PKEY_base_id(key));
  }
}

int Certificate::PublicKeyBits() const {
  EVP_PKEY* key = X509_get0_pubkey(cert_.get());
  return key == nullptr ? 0 : EVP_PKEY_bits(key);
}

std::string Certificate::SignatureAlgorithmName() const {
  int nid = X509_get_signature_nid(cert_.get());
  const char* name = OBJ_nid2ln(nid);
  return name == nullptr ? std::string("unknown") : std::string(name);
}

bool Certificate::IsSelfSigned() const {
  return IsIssuedBy(*this);
}

bool Certificate::IsIssuedBy(const Certificate& issuer) const {
  if (X509_NAME_cmp(X509_get_issuer_name(cert_.get()),
                    X509_get_subject_name(issuer.cert_.get())) != 0) {
    return false;
  }
  EVP_PKEY* key = X509_get0_pubkey(issuer.cert_.get());
  if (key == nullptr) {
    return false;
  }
  bool ok = X509_verify(cert_.get(), key) == 1;
  ERR_clear_error();
  return ok;
}

bool Certificate::Equals(const Certificate& other) const {
  return X509_cmp(cert_.get(), other.cert_.get()) == 0;
}

// --- PrivateKey ------------------------------------------------------------

PrivateKey PrivateKey::FromPem(std::string_view pem, std::optional<std::string_view> passphrase) {
  auto bio = MemoryBio(pem);
  std::string secret = passphrase ? std::string(*passphrase) : std::string();
  EVP_PKEY* raw = PEM_read_bio_PrivateKey(bio.get(), nullptr, PassphraseCallback,
                                          passphrase ? static_cast<void*>(&secret) : nullptr);
  OPENSSL_cleanse(secret.data(), secret.size());
  if (raw == nullptr) {
    throw Error(ErrorDomain::Validation, errors::validation::kPrivateKeyInvalid,
                std::string(errors::msg::kPrivateKeyUnreadable) + ": " +
                    BuildOpenSSLErrorMessage("PEM_read_bio_PrivateKey"));
  }
  return PrivateKey(WrapKey(raw));
}

PrivateKey PrivateKey::Generate(KeyType type, int rsa_bits) {
  int id = EVP_PKEY_EC;
  if (type == KeyType::kRsa) {
    id = EVP_PKEY_RSA;
  } else if (type == KeyType::kEd25519) {
    id = EVP_PKEY_ED25519;
  }
  OsslPtr<EVP_PKEY_CTX> ctx(EVP_PKEY_CTX_new_id(id, nullptr));
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_PKEY_keygen_init"));
  }
  if (type == KeyType::kEc) {
    if (EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_X9_62_prime256v1) <= 0 ||
        EVP_PKEY_CTX_set_ec_param_enc(ctx.get(), OPENSSL_EC_NAMED_CURVE) <= 0) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EC curve selection"));
    }
  } else if (type == KeyType::kRsa) {
    if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), rsa_bits) <= 0) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("RSA key size"));
    }
  }
  EVP_PKEY* raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) != 1 || raw == nullptr) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_PKEY_keygen"));
  }
  return PrivateKey(WrapKey(raw));
}

std::string PrivateKey::ToPem(std::optional<std::string_view> passphrase) const {
  auto bio = WritableBio();
  std::string secret = passphrase ? std::string(*passphrase) : std::string();
  int rc = PEM_write_bio_PrivateKey(
      bio.get(), key_.get(), passphrase ? EVP_aes_256_cbc() : nullptr,
      passphrase ? reinterpret_cast<unsigned char*>(secret.data()) : nullptr,
      passphrase ? static_cast<int>(secret.size()) : 0, nullptr, nullptr);
  OPENSSL_cleanse(secret.data(), secret.size());
  if (rc != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("PEM_write_bio_PrivateKey"));
  }
  return DrainBio(bio.get());
}

KeyType PrivateKey::type() const {
  return KeyTypeOf(key_.get());
}

// --- Signing ---------------------------------------------------------------

std::vector<std::uint8_t> SignMessage(const PrivateKey& key, SignatureAlgorithm algorithm,
                                      HashAlgorithm hash, std::span<const std::uint8_t> message) {
  if (!KeyMatchesAlgorithm(key.type(), algorithm)) {
    throw Error(ErrorDomain::Security, errors::security::kUnsupportedAlgorithm,
                std::string(errors::msg::kUnsupportedSignatureAlgorithm) + ": key type mismatch");
  }
  OsslPtr<EVP_MD_CTX> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate signing context");
  }
  EVP_PKEY_CTX* pctx = nullptr;
  const EVP_MD* md = algorithm == SignatureAlgorithm::kEd25519 ? nullptr : MessageDigest(hash);
  if (EVP_DigestSignInit(ctx.get(), &pctx, md, nullptr, key.native()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestSignInit"));
  }
  ConfigurePadding(pctx, algorithm);
  std::size_t len = 0;
  if (EVP_DigestSign(ctx.get(), nullptr, &len, message.data(), message.size()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestSign(size)"));
  }
  std::vector<std::uint8_t> signature(len);
  if (EVP_DigestSign(ctx.get(), signature.data(), &len, message.data(), message.size()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestSign"));
  }
  signature.resize(len);
  return signature;
}

bool VerifyMessage(const Certificate& signer, SignatureAlgorithm algorithm, HashAlgorithm hash,
                   std::span<const std::uint8_t> message,
                   std::span<const std::uint8_t> signature) {
  EVP_PKEY* key = X509_get0_pubkey(signer.native());
  if (key == nullptr) {
    ThrowInvalidCertificate("missing public key");
  }
  if (!KeyMatchesAlgorithm(KeyTypeOf(key), algorithm)) {
    throw Error(ErrorDomain::Security, errors::security::kUnsupportedAlgorithm,
                std::string(errors::msg::kUnsupportedSignatureAlgorithm) + ": key type mismatch");
  }
#if PW_HAVE_SODIUM
  if (algorithm == SignatureAlgorithm::kEd25519) {
    std::array<std::uint8_t, crypto_sign_PUBLICKEYBYTES> raw{};
    std::size_t raw_len = raw.size();
    if (EVP_PKEY_get_raw_public_key(key, raw.data(), &raw_len) != 1 || raw_len != raw.size()) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_PKEY_get_raw_public_key"));
    }
    if (signature.size() != crypto_sign_BYTES) {
      return false;
    }
    return crypto_sign_verify_detached(signature.data(), message.data(), message.size(),
                                       raw.data()) == 0;
  }
#endif
  OsslPtr<EVP_MD_CTX> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate verification context");
  }
  EVP_PKEY_CTX* pctx = nullptr;
  const EVP_MD* md = algorithm == SignatureAlgorithm::kEd25519 ? nullptr : MessageDigest(hash);
  if (EVP_DigestVerifyInit(ctx.get(), &pctx, md, nullptr, key) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestVerifyInit"));
  }
  ConfigurePadding(pctx, algorithm);
  int rc = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), message.data(),
                            message.size());
  ERR_clear_error();
  return rc == 1;
}

std::string Base64Encode(std::span<const std::uint8_t> data) {
  if (data.empty()) {
    return {};
  }
  std::string out(4 * ((data.size() + 2) / 3), '\0');
  int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data.data(),
                            static_cast<int>(data.size()));
  out.resize(static_cast<std::size_t>(len));
  return out;
}

std::vector<std::uint8_t> Base64Decode(std::string_view text) {
  std::string compact;
  compact.reserve(text.size());
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      compact.push_back(c);
    }
  }
  if (compact.empty()) {
    return {};
  }
  if (compact.size() % 4 != 0) {
    throw Error(ErrorDomain::Validation, errors::validation::kManifestInvalid,
                "Base64 input length is not a multiple of 4");
  }
  std::vector<std::uint8_t> out(3 * compact.size() / 4);
  int len = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(compact.data()),
                            static_cast<int>(compact.size()));
  if (len < 0) {
    throw Error(ErrorDomain::Validation, errors::validation::kManifestInvalid,
                "Invalid base64 input");
  }
  std::size_t padding = 0;
  if (compact.back() == '=') {
    ++padding;
    if (compact[compact.size() - 2] == '=') {
      ++padding;
    }
  }
  out.resize(static_cast<std::size_t>(len) - padding);
  return out;
}

// --- Certificate issuance ------------------------------------------------

IssuedCertificate GenerateCertificate(const CertificateRequest& request,
                                      const IssuedCertificate* issuer) {
  PrivateKey key = PrivateKey::Generate(request.key_type);
  std::shared_ptr<X509> cert = WrapX509(X509_new());
  if (!cert) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("X509_new"));
  }
  X509* x = cert.get();
  if (X509_set_version(x, 2) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("X509_set_version"));
  }
  auto serial = RandomSerial();
  if (X509_set_serialNumber(x, serial.get()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("X509_set_serialNumber"));
  }
  TimePoint not_before = request.not_before.value_or(Clock::now() - std::chrono::minutes(5));
  TimePoint not_after = not_before + std::chrono::hours(24) * request.validity_days;
  if (ASN1_TIME_set(X509_getm_notBefore(x), Clock::to_time_t(not_before)) == nullptr ||
      ASN1_TIME_set(X509_getm_notAfter(x), Clock::to_time_t(not_after)) == nullptr) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("ASN1_TIME_set"));
  }
  X509_NAME* name = X509_get_subject_name(x);
  if (X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_UTF8,
                                 reinterpret_cast<const unsigned char*>(request.common_name.c_str()),
                                 -1, -1, 0) != 1 ||
      X509_NAME_add_entry_by_txt(name, "O", MBSTRING_UTF8,
                                 reinterpret_cast<const unsigned char*>(request.organization.c_str()),
                                 -1, -1, 0) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("X509_NAME_add_entry_by_txt"));
  }
  X509* issuer_cert = issuer ? issuer->certificate.native() : x;
  if (X509_set_issuer_name(x, X509_get_subject_name(issuer_cert)) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("X509_set_issuer_name"));
  }
  if (X509_set_pubkey(x, key.native()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("X509_set_pubkey"));
  }

  X509V3_CTX ctx;
  X509V3_set_ctx_nodb(&ctx);
  X509V3_set_ctx(&ctx, issuer_cert, x, nullptr, nullptr, 0);
  AddExtension(x, &ctx, NID_basic_constraints, request.is_ca ? "critical,CA:TRUE" : "CA:FALSE");
  AddExtension(x, &ctx, NID_key_usage,
               request.is_ca ? "critical,keyCertSign,cRLSign" : "critical,digitalSignature");
  AddExtension(x, &ctx, NID_subject_key_identifier, "hash");
  if (!request.permissions.empty()) {
    std::string san;
    for (const auto& permission : request.permissions) {
      if (!san.empty()) {
        san.push_back(',');
      }
      san += "URI:";
      san += kPermissionUriPrefix;
      san += permission;
    }
    AddExtension(x, &ctx, NID_subject_alt_name, san);
  }

  const PrivateKey& signing_key = issuer ? issuer->key : key;
  const EVP_MD* md = signing_key.type() == KeyType::kEd25519 ? nullptr : EVP_sha256();
  if (X509_sign(x, signing_key.native(), md) <= 0) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("X509_sign"));
  }
  auto bio = WritableBio();
  if (PEM_write_bio_X509(bio.get(), x) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("PEM_write_bio_X509"));
  }
  return IssuedCertificate{Certificate::FromPem(DrainBio(bio.get())), key};
}

// --- CRLs ------------------------------------------------------------------

std::vector<CrlEntry> ParseCrlPem(std::string_view pem, const Certificate* issuer) {
  auto crl = ReadCrl(pem);
  if (issuer != nullptr) {
    EVP_PKEY* key = X509_get0_pubkey(issuer->native());
    if (key == nullptr || X509_CRL_verify(crl.get(), key) != 1) {
      ERR_clear_error();
      throw Error(ErrorDomain::Validation, errors::validation::kCrlInvalid,
                  "CRL signature does not verify against issuer " + issuer->Subject());
    }
  }
  std::string issuer_name = NameToString(X509_CRL_get_issuer(crl.get()));
  std::vector<CrlEntry> entries;
  STACK_OF(X509_REVOKED)* revoked = X509_CRL_get_REVOKED(crl.get());
  for (int i = 0; revoked != nullptr && i < sk_X509_REVOKED_num(revoked); ++i) {
    X509_REVOKED* rev = sk_X509_REVOKED_value(revoked, i);
    CrlEntry entry;
    entry.issuer = issuer_name;
    entry.serial_hex = SerialToHex(X509_REVOKED_get0_serialNumber(rev));
    entry.revoked_at = Asn1TimeToTimePoint(X509_REVOKED_get0_revocationDate(rev));
    auto* reason = static_cast<ASN1_ENUMERATED*>(
        X509_REVOKED_get_ext_d2i(rev, NID_crl_reason, nullptr, nullptr));
    if (reason != nullptr) {
      entry.reason = CrlReasonName(ASN1_ENUMERATED_get(reason));
      ASN1_ENUMERATED_free(reason);
    } else {
      entry.reason = "unspecified";
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

std::string CrlIssuer(std::string_view pem) {
  auto crl = ReadCrl(pem);
  return NameToString(X509_CRL_get_issuer(crl.get()));
}

std::string IssueCrl(const IssuedCertificate& issuer, const std::vector<std::string>& serials_hex,
                     int next_update_days) {
  OsslPtr<X509_CRL> crl(X509_CRL_new());
  if (!crl) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("X509_CRL_new"));
  }
  if (X509_CRL_set_version(crl.get(), 1) != 1 ||
      X509_CRL_set_issuer_name(crl.get(),
                               X509_get_subject_name(issuer.certificate.native())) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("X509_CRL header"));
  }
  auto now = Clock::to_time_t(Clock::now());
  OsslPtr<ASN1_TIME> last_update(ASN1_TIME_set(nullptr, now));
  OsslPtr<ASN1_TIME> next_update(
      ASN1_TIME_set(nullptr, now + static_cast<std::time_t>(next_update_days) * 86400));
  if (!last_update || !next_update || X509_CRL_set1_lastUpdate(crl.get(), last_update.get()) != 1 ||
      X509_CRL_set1_nextUpdate(crl.get(), next_update.get()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("X509_CRL validity"));
  }
  for (const auto& serial_hex : serials_hex) {
    OsslPtr<X509_REVOKED> rev(X509_REVOKED_new());
    auto serial = SerialFromHex(serial_hex);
    if (!rev || X509_REVOKED_set_serialNumber(rev.get(), serial.get()) != 1 ||
        X509_REVOKED_set_revocationDate(rev.get(), last_update.get()) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("X509_REVOKED"));
    }
    if (X509_CRL_add0_revoked(crl.get(), rev.get()) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("X509_CRL_add0_revoked"));
    }
    rev.release(); // owned by the CRL now
  }
  X509_CRL_sort(crl.get());
  const EVP_MD* md = issuer.key.type() == KeyType::kEd25519 ? nullptr : EVP_sha256();
  if (X509_CRL_sign(crl.get(), issuer.key.native(), md) <= 0) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("X509_CRL_sign"));
  }
  auto bio = WritableBio();
  if (PEM_write_bio_X509_CRL(bio.get(), crl.get()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("PEM_write_bio_X509_CRL"));
  }
  return DrainBio(bio.get());
}

}  // namespace pw::crypto

#include "pw/crypto/digest.h"

#include <openssl/evp.h>

#include <string>

#include "pw/crypto/provider.h"
#include "pw/error.h"
#include "pw/errors.h"

namespace pw::crypto {

namespace {

const EVP_MD* DigestFor(HashAlgorithm algorithm) {
  switch (algorithm) {
  case HashAlgorithm::kSha256:
    return EVP_sha256();
  case HashAlgorithm::kSha384:
    return EVP_sha384();
  case HashAlgorithm::kSha512:
    return EVP_sha512();
  }
  return EVP_sha256();
}

}  // namespace

std::string_view ToString(HashAlgorithm algorithm) noexcept {
  switch (algorithm) {
  case HashAlgorithm::kSha256:
    return "SHA-256";
  case HashAlgorithm::kSha384:
    return "SHA-384";
  case HashAlgorithm::kSha512:
    return "SHA-512";
  }
  return "SHA-256";
}

HashAlgorithm ParseHashAlgorithm(std::string_view name) {
  std::string normalized;
  for (char c : name) {
    if (c == '-' || c == '_') {
      continue;
    }
    normalized.push_back(static_cast<char>((c >= 'a' && c <= 'z') ? c - 'a' + 'A' : c));
  }
  if (normalized == "SHA256") {
    return HashAlgorithm::kSha256;
  }
  if (normalized == "SHA384") {
    return HashAlgorithm::kSha384;
  }
  if (normalized == "SHA512") {
    return HashAlgorithm::kSha512;
  }
  throw Error(ErrorDomain::Security, errors::security::kUnsupportedAlgorithm,
              std::string(errors::msg::kUnsupportedHashAlgorithm) + ": " + std::string(name));
}

void Digest::CtxDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
  EVP_MD_CTX_free(ctx);
}

Digest::Digest(HashAlgorithm algorithm) : algorithm_(algorithm), ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    ThrowCryptoError("Failed to allocate digest context");
  }
  if (EVP_DigestInit_ex(ctx_.get(), DigestFor(algorithm), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestInit_ex"));
  }
}

Digest::~Digest() = default;
Digest::Digest(Digest&&) noexcept = default;
Digest& Digest::operator=(Digest&&) noexcept = default;

void Digest::Update(std::span<const std::uint8_t> data) {
  if (finalized_ || !ctx_) {
    ThrowCryptoError("Digest already finalized");
  }
  if (data.empty()) {
    return;
  }
  if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestUpdate"));
  }
}

void Digest::Update(std::string_view text) {
  Update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()),
                                       text.size()));
}

std::vector<std::uint8_t> Digest::Final() {
  if (finalized_ || !ctx_) {
    ThrowCryptoError("Digest already finalized");
  }
  std::vector<std::uint8_t> out(EVP_MAX_MD_SIZE);
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestFinal_ex"));
  }
  finalized_ = true;
  out.resize(len);
  return out;
}

}  // namespace pw::crypto

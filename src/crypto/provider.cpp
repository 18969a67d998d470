#include "pw/crypto/provider.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#if PW_HAVE_SODIUM
#include <sodium.h>
#endif

#include <array>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "pw/crypto/ct.h"
#include "pw/error.h"

namespace pw::crypto {

namespace {

struct RuntimeState {
  std::once_flag once;
  bool kat_passed{false};
};

RuntimeState& MutableRuntimeState() {
  static RuntimeState state{};
  return state;
}

std::mutex& ProviderMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<CryptoProvider>& ProviderInstance() {
  static std::shared_ptr<CryptoProvider> instance;
  return instance;
}

// TSK011_Crypto_Selftest SHA-256("abc"), FIPS 180-2 appendix B.1
void RunSHA256KnownAnswerTest() {
  static constexpr std::array<std::uint8_t, 3> kMessage{'a', 'b', 'c'};
  static constexpr std::array<std::uint8_t, 32> kExpected{
      0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea, 0x41, 0x41, 0x40, 0xde, 0x5d, 0xae, 0x22, 0x23,
      0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17, 0x7a, 0x9c, 0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad};
  OpenSSLCryptoProvider provider;
  auto digest = provider.SHA256(std::span<const std::uint8_t>(kMessage.data(), kMessage.size()));
  if (!ct::CompareEqual(digest, kExpected)) {
    ThrowCryptoError("SHA-256 KAT mismatch");
  }
}

void EnsureCryptoRuntimeConfigured() {
  auto& state = MutableRuntimeState();
  std::call_once(state.once, [&state]() {
#if PW_HAVE_SODIUM
    if (sodium_init() < 0) {
      ThrowCryptoError("sodium_init failed");
    }
#endif
    RunSHA256KnownAnswerTest();
    state.kat_passed = true;
    std::clog << "[crypto] SHA-256 known-answer test passed" << std::endl;
  });
}

}  // namespace

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }
  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  ERR_clear_error();
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

void ThrowCryptoError(const std::string& message, int code) {
  throw pw::Error(pw::ErrorDomain::Crypto,
                  code == 0 ? errors::Make(ErrorDomain::Crypto, 0x01) : code, message);
}

void EnsureCryptoProviderInitialized() {
  EnsureCryptoRuntimeConfigured();
}

std::array<std::uint8_t, 32> OpenSSLCryptoProvider::HMACSHA256(
    std::span<const std::uint8_t> key,
    std::span<const std::uint8_t> message) {
  std::array<std::uint8_t, 32> out{};
  unsigned int len = 0;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), message.data(),
           message.size(), out.data(), &len) == nullptr) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("HMAC(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected HMAC-SHA256 length", static_cast<int>(len));
  }
  return out;
}

std::array<std::uint8_t, 32> OpenSSLCryptoProvider::SHA256(
    std::span<const std::uint8_t> data) {
  std::array<std::uint8_t, 32> out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_Digest(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected SHA-256 length", static_cast<int>(len));
  }
  return out;
}

std::vector<std::uint8_t> OpenSSLCryptoProvider::Hash(HashAlgorithm algorithm,
                                                      std::span<const std::uint8_t> data) {
  Digest digest(algorithm);
  digest.Update(data);
  return digest.Final();
}

std::shared_ptr<CryptoProvider> GetCryptoProviderShared() {
  EnsureCryptoRuntimeConfigured();
  std::lock_guard<std::mutex> lock(ProviderMutex());
  auto& provider = ProviderInstance();
  if (!provider) {
    provider = std::make_shared<OpenSSLCryptoProvider>();
  }
  return provider;
}

CryptoProvider& GetCryptoProvider() {
  return *GetCryptoProviderShared();
}

void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider) {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance() = std::move(provider);
}

void ResetCryptoProviderForTesting() {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance().reset();
}

}  // namespace pw::crypto

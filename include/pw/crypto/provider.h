#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "pw/crypto/digest.h"

namespace pw::crypto {

class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  virtual std::array<std::uint8_t, 32> HMACSHA256(
      std::span<const std::uint8_t> key,
      std::span<const std::uint8_t> message) = 0;

  virtual std::array<std::uint8_t, 32> SHA256(
      std::span<const std::uint8_t> data) = 0;

  virtual std::vector<std::uint8_t> Hash(HashAlgorithm algorithm,
                                         std::span<const std::uint8_t> data) = 0;
};

class OpenSSLCryptoProvider : public CryptoProvider {
public:
  std::array<std::uint8_t, 32> HMACSHA256(
      std::span<const std::uint8_t> key,
      std::span<const std::uint8_t> message) override;

  std::array<std::uint8_t, 32> SHA256(
      std::span<const std::uint8_t> data) override;

  std::vector<std::uint8_t> Hash(HashAlgorithm algorithm,
                                 std::span<const std::uint8_t> data) override;
};

std::shared_ptr<CryptoProvider> GetCryptoProviderShared();
CryptoProvider& GetCryptoProvider();
void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider);
void EnsureCryptoProviderInitialized();
void ResetCryptoProviderForTesting();

// Formats the oldest queued OpenSSL error as "<context>: <reason>" and clears
// the rest of the queue.
std::string BuildOpenSSLErrorMessage(const char* context);
[[noreturn]] void ThrowCryptoError(const std::string& message, int code = 0);

}  // namespace pw::crypto

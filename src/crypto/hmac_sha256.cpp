#include "pw/crypto/hmac_sha256.h"

#include "pw/crypto/provider.h"

using namespace pw::crypto;

std::array<std::uint8_t, HMAC_SHA256::TAG_SIZE>
HMAC_SHA256::Compute(std::span<const std::uint8_t> key, std::span<const std::uint8_t> msg) {
  auto provider = GetCryptoProviderShared();
  return provider->HMACSHA256(key, msg);
}

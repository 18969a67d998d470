#include "pw/crypto/sha256.h"

#include "pw/crypto/provider.h"
#include "pw/types.h"

namespace pw::crypto {

std::array<std::uint8_t, 32> SHA256_Hash(std::span<const std::uint8_t> data) {
  auto provider = GetCryptoProviderShared();
  return provider->SHA256(data);
}

std::array<std::uint8_t, 32> SHA256_Hash(const std::vector<std::uint8_t>& data) {
  return SHA256_Hash(std::span<const std::uint8_t>(data.data(), data.size()));
}

std::string SHA256_Hex(std::string_view text) {
  auto digest = SHA256_Hash(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
  return HexEncode(digest.data(), digest.size());
}

}  // namespace pw::crypto

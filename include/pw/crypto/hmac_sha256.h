#pragma once
#include <array>
#include <cstdint>
#include <span>

namespace pw::crypto {
struct HMAC_SHA256 {
  static constexpr std::size_t TAG_SIZE = 32;
  // Computes HMAC-SHA256 using the active CryptoProvider implementation.
  static std::array<std::uint8_t, TAG_SIZE> Compute(std::span<const std::uint8_t> key,
                                                    std::span<const std::uint8_t> msg);
};
} // namespace pw::crypto

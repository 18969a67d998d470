#pragma once
#include <algorithm>
#include <array>
#include <atomic>
#include <cstdint>
#include <span>
#include <string_view>

namespace pw::crypto::ct {

template <std::size_t N>
inline bool CompareEqual(const std::array<std::uint8_t, N>& a,
                         const std::array<std::uint8_t, N>& b) noexcept {
  volatile std::uint8_t diff = 0;
  for (std::size_t i = 0; i < N; ++i)
    diff |= (a[i] ^ b[i]);
  return diff == 0;
}

// Length is not secret; only the contents are compared without early exit.
inline bool CompareEqual(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  volatile std::uint8_t diff = 0;
  for (std::size_t i = 0; i < a.size(); ++i)
    diff |= (a[i] ^ b[i]);
  std::atomic_signal_fence(std::memory_order_seq_cst);
  return diff == 0;
}

inline bool StringCompare(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  volatile std::uint8_t diff = 0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    diff |= static_cast<std::uint8_t>(a[i] ^ b[i]);
  }
  std::atomic_signal_fence(std::memory_order_seq_cst);
  return diff == 0;
}

} // namespace pw::crypto::ct

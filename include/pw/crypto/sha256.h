#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pw::crypto {
std::array<std::uint8_t, 32> SHA256_Hash(std::span<const std::uint8_t> data);
std::array<std::uint8_t, 32> SHA256_Hash(const std::vector<std::uint8_t>& data);
// Lower-case hex digest of the UTF-8 bytes of |text|.
std::string SHA256_Hex(std::string_view text);
} // namespace pw::crypto

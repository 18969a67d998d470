#pragma once

#include <cstdint>
#include <span>

namespace pw::crypto {

void SystemRandomBytes(std::span<std::uint8_t> out);

}  // namespace pw::crypto

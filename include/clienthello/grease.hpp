#pragma once

#include <cstdint>

namespace clienthello {

// RFC 8701 GREASE check.
// True for exactly the 16 values 0x0A0A, 0x1A1A, ..., 0xFAFA: both bytes
// equal, each with low nibble 0xA. 0x0A1A and friends are not GREASE.
constexpr bool is_grease(std::uint16_t value) noexcept {
    return (value & 0x0F0F) == 0x0A0A && (value >> 8) == (value & 0xFF);
}

}  // namespace clienthello

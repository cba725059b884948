#pragma once
#include <cstdint>
#include <string_view>
#include "auditchain/core/hash.hpp"

namespace auditchain::core::pow {
  inline constexpr uint32_t MAX_DIFFICULTY = 64;

  // Difficulty counts leading zero hex digits (nibbles) of the block hash.
  uint32_t leading_zero_nibbles(const Hash256& hash);
  uint32_t leading_zero_hex_digits(std::string_view hex);

  inline bool meets_difficulty(uint32_t difficulty, const Hash256& hash) {
    return leading_zero_nibbles(hash) >= difficulty;
  }

  inline bool meets_difficulty(uint32_t difficulty, std::string_view hex) {
    return leading_zero_hex_digits(hex) >= difficulty;
  }
}

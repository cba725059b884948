#include "auditchain/core/pow.hpp"

namespace auditchain::core::pow {
  uint32_t leading_zero_nibbles(const Hash256& hash) {
    uint32_t z = 0;
    for (size_t i = 0; i < hash.size(); ++i) {
      if (hash[i] == 0) { z += 2; continue; }
      if ((hash[i] & 0xF0) == 0) z += 1;
      break;
    }
    return z;
  }

  uint32_t leading_zero_hex_digits(std::string_view hex) {
    uint32_t z = 0;
    for (char c : hex) {
      if (c != '0') break;
      ++z;
    }
    return z;
  }
}

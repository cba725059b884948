#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace auditchain::core {
  using Hash256 = std::array<uint8_t, 32>;

  auto sha256(std::span<const uint8_t> data) -> Hash256;

  inline auto sha256(const std::string& data) -> Hash256 {
    return sha256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
  }

  auto to_hex(std::span<const uint8_t> data) -> std::string;

  // Returns nullopt on odd length or a non-hex character.
  auto from_hex(std::string_view hex) -> std::optional<std::vector<uint8_t>>;

  // Fills the buffer from OpenSSL's CSPRNG. Throws std::runtime_error on failure.
  void random_bytes(std::span<uint8_t> out);
}

#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "auditchain/core/event.hpp"
#include "auditchain/core/hash.hpp"

namespace auditchain::core {
  // previous_hash of the genesis block.
  inline const std::string GENESIS_PREVIOUS_HASH(64, '0');

  struct Block {
    uint64_t index = 0;
    uint64_t timestamp = 0;   // unix ms
    std::vector<Event> transactions;
    std::string previous_hash;
    uint64_t nonce = 0;
    std::string hash;

    // u32 count, then each event encoding length-prefixed.
    std::vector<uint8_t> serialize_transactions() const;

    std::string compute_hash() const;
  };

  std::vector<Event> deserialize_transactions(std::span<const uint8_t> bytes);

  // index || timestamp || transactions || previous_hash || nonce. The nonce is always the
  // trailing 8 bytes so a miner can rewrite it in place.
  std::vector<uint8_t> block_preimage(uint64_t index, uint64_t timestamp,
                                      std::span<const uint8_t> serialized_transactions,
                                      std::string_view previous_hash, uint64_t nonce);

  inline constexpr size_t NONCE_SIZE = sizeof(uint64_t);

  void write_preimage_nonce(std::vector<uint8_t>& preimage, uint64_t nonce);

  std::string compute_block_hash(uint64_t index, uint64_t timestamp,
                                 std::span<const uint8_t> serialized_transactions,
                                 std::string_view previous_hash, uint64_t nonce);

  Block make_genesis_block(uint64_t unix_time_ms);

  Block build_candidate_block(const Block& tip, std::vector<Event> transactions, uint64_t unix_time_ms);
}

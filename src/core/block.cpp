#include "auditchain/core/block.hpp"
#include "auditchain/core/serializer.hpp"
#include "auditchain/core/hash.hpp"

#include <algorithm>

namespace auditchain::core {

  std::vector<uint8_t> Block::serialize_transactions() const {
    ByteWriter writer;
    writer.write_u32(static_cast<uint32_t>(transactions.size()));
    for (const auto& event : transactions) {
      auto event_bytes = event.serialize();
      writer.write_bytes(std::span<const uint8_t>(event_bytes.data(), event_bytes.size()));
    }
    return writer.take();
  }

  std::string Block::compute_hash() const {
    auto tx_bytes = serialize_transactions();
    return compute_block_hash(index, timestamp, tx_bytes, previous_hash, nonce);
  }

  std::vector<Event> deserialize_transactions(std::span<const uint8_t> bytes) {
    ByteReader reader(bytes);
    auto count = reader.read_u32();
    std::vector<Event> events;
    events.reserve(std::min<size_t>(count, reader.remaining_bytes() / 4));
    for (uint32_t i = 0; i < count; ++i) {
      auto event_bytes = reader.read_bytes();
      events.push_back(Event::deserialize(std::span<const uint8_t>(event_bytes.data(), event_bytes.size())));
    }
    reader.expect_end();
    return events;
  }

  std::vector<uint8_t> block_preimage(uint64_t index, uint64_t timestamp,
                                      std::span<const uint8_t> serialized_transactions,
                                      std::string_view previous_hash, uint64_t nonce) {
    ByteWriter writer;
    writer.write_u64(index);
    writer.write_u64(timestamp);
    writer.write_bytes(serialized_transactions);
    writer.write_string(previous_hash);
    writer.write_u64(nonce);
    return writer.take();
  }

  void write_preimage_nonce(std::vector<uint8_t>& preimage, uint64_t nonce) {
    auto offset = preimage.size() - NONCE_SIZE;
    for (size_t i = 0; i < NONCE_SIZE; ++i) {
      preimage[offset + i] = static_cast<uint8_t>((nonce >> (8 * i)) & 0xFF);
    }
  }

  std::string compute_block_hash(uint64_t index, uint64_t timestamp,
                                 std::span<const uint8_t> serialized_transactions,
                                 std::string_view previous_hash, uint64_t nonce) {
    auto preimage = block_preimage(index, timestamp, serialized_transactions, previous_hash, nonce);
    auto digest = sha256(std::span<const uint8_t>(preimage.data(), preimage.size()));
    return to_hex(digest);
  }

  Block make_genesis_block(uint64_t unix_time_ms) {
    Block block;
    block.index = 0;
    block.timestamp = unix_time_ms;
    block.previous_hash = GENESIS_PREVIOUS_HASH;
    block.nonce = 0;
    block.hash = block.compute_hash();
    return block;
  }

  Block build_candidate_block(const Block& tip, std::vector<Event> transactions, uint64_t unix_time_ms) {
    Block block;
    block.index = tip.index + 1;
    block.timestamp = unix_time_ms;
    block.transactions = std::move(transactions);
    block.previous_hash = tip.hash;
    block.nonce = 0;
    return block;
  }
}

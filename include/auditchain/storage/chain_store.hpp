#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "auditchain/core/block.hpp"
#include "auditchain/core/event.hpp"
#include "auditchain/storage/sqlite.hpp"

namespace auditchain::storage {

  // A block row as persisted. The transaction bytes are kept raw so the verifier
  // hashes exactly what is on disk.
  struct StoredBlock {
    uint64_t index = 0;
    uint64_t timestamp = 0;
    std::string previous_hash;
    uint64_t nonce = 0;
    std::string hash;
    std::vector<uint8_t> serialized_transactions;

    core::Block to_block() const;
  };

  // Oldest retained block after a prune.
  struct Checkpoint {
    uint64_t index = 0;
    std::string hash;
    uint64_t pruned_at = 0;
  };

  enum class EnqueueResult { Inserted, Duplicate };

  struct EventFilter {
    std::optional<core::EventKind> kind;
    std::optional<uint64_t> start_time;   // inclusive, unix ms
    std::optional<uint64_t> end_time;     // inclusive, unix ms
    // Keyset position: only events strictly after (block, position) are returned.
    std::optional<std::pair<uint64_t, uint32_t>> after;
    size_t limit = 100;
  };

  struct CommittedEvent {
    core::Event event;
    uint64_t block_index = 0;
    uint32_t position = 0;
    std::string block_hash;
  };

  // One committed_events row. It must agree with the transaction at `position`
  // in the block it names.
  struct IndexRow {
    std::string event_id;
    uint32_t position = 0;
    core::EventKind kind = core::EventKind::Trade;
    uint64_t created_at = 0;
  };

  // First block index -> difficulty blocks from that index on were mined at.
  using DifficultySchedule = std::map<uint64_t, uint32_t>;

  std::optional<uint32_t> difficulty_at(const DifficultySchedule& schedule, uint64_t block_index);

  struct PruneResult {
    uint64_t blocks_removed = 0;
    uint64_t events_removed = 0;
    std::optional<Checkpoint> checkpoint;
  };

  // Lazy walk over [start, end) in index order. Owns a read-only connection held in one
  // read transaction, so every step and every reset() sees the same snapshot.
  class BlockCursor {
    public:
      BlockCursor(const std::filesystem::path& db_path, uint64_t start, std::optional<uint64_t> end);

      BlockCursor(BlockCursor&&) noexcept = default;
      BlockCursor& operator=(BlockCursor&&) noexcept = default;

      std::optional<StoredBlock> next();
      void reset();

      // Index rows of one block, ordered by position, from the same snapshot.
      std::vector<IndexRow> index_rows(uint64_t block_index);
      uint64_t index_row_count();

      // Checkpoint as of the cursor's snapshot.
      const std::optional<Checkpoint>& checkpoint() const { return checkpoint_; }
      const DifficultySchedule& difficulty_schedule() const { return difficulty_schedule_; }

    private:
      void bind_range();

      sqlite::Database db_;
      std::optional<sqlite::Statement> stmt_;
      std::optional<sqlite::Statement> rows_stmt_;
      uint64_t start_;
      std::optional<uint64_t> end_;
      std::optional<Checkpoint> checkpoint_;
      DifficultySchedule difficulty_schedule_;
  };

  class ChainStore {
    public:
      explicit ChainStore(std::filesystem::path db_path);

      const std::filesystem::path& path() const { return db_path_; }

      bool empty() const;
      // Writes the genesis block and the difficulty the chain is mined at.
      void initialize(const core::Block& genesis, uint32_t difficulty);
      // Difficulty of the newest epoch, i.e. the one the next block is mined at.
      std::optional<uint32_t> stored_difficulty() const;
      // Starts a new epoch at the block after the tip. Returns false if the
      // current epoch already has this difficulty.
      bool record_difficulty(uint32_t difficulty);
      DifficultySchedule difficulty_schedule() const;

      EnqueueResult enqueue(const core::Event& event);
      std::vector<core::Event> pending(size_t limit) const;
      uint64_t pending_count() const;

      // Commits the block, its index rows and the removal of its events from the
      // pending pool in one transaction.
      void append(const core::Block& block);

      std::optional<core::Block> get_block(uint64_t index) const;
      std::optional<StoredBlock> get_stored_block(uint64_t index) const;
      core::Block get_tip() const;
      // Tip row without decoding its transactions.
      std::optional<StoredBlock> get_stored_tip() const;
      uint64_t block_count() const;
      uint64_t transaction_count() const;
      std::optional<Checkpoint> checkpoint() const;
      std::optional<std::pair<uint64_t, uint64_t>> timestamp_range() const;

      BlockCursor iterate(uint64_t start = 0, std::optional<uint64_t> end = std::nullopt) const;

      std::vector<CommittedEvent> query_events(const EventFilter& filter) const;
      std::map<core::EventKind, uint64_t> count_by_kind() const;
      uint64_t storage_bytes() const;

      // Neither ever removes the tip.
      PruneResult prune_before(uint64_t cutoff_ms);
      PruneResult prune_to_size(uint64_t max_blocks);

    private:
      void create_schema();
      void load_tip();
      std::optional<std::string> get_meta(const std::string& key) const;
      void set_meta(const std::string& key, const std::string& value);
      std::optional<StoredBlock> read_block(uint64_t index) const;
      PruneResult prune_below(uint64_t new_start);

      struct TipRef {
        uint64_t index;
        std::string hash;
      };

      std::filesystem::path db_path_;
      mutable std::mutex mutex_;
      sqlite::Database db_;
      std::optional<TipRef> tip_;
  };
}

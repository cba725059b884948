#include "auditchain/storage/chain_store.hpp"
#include "auditchain/core/errors.hpp"
#include "auditchain/core/serializer.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <system_error>

namespace auditchain::storage {
  namespace {
    constexpr auto tip_index_key = "tip_index";
    constexpr auto tip_hash_key = "tip_hash";
    constexpr auto checkpoint_index_key = "checkpoint_index";
    constexpr auto checkpoint_hash_key = "checkpoint_hash";
    constexpr auto checkpoint_pruned_at_key = "checkpoint_pruned_at";

    constexpr auto schema = R"sql(
      CREATE TABLE IF NOT EXISTS blocks (
        block_index INTEGER PRIMARY KEY,
        timestamp INTEGER NOT NULL,
        previous_hash TEXT NOT NULL,
        nonce INTEGER NOT NULL,
        hash TEXT NOT NULL,
        serialized_transactions BLOB NOT NULL
      );
      CREATE TABLE IF NOT EXISTS pending_events (
        seq INTEGER PRIMARY KEY AUTOINCREMENT,
        event_id TEXT NOT NULL UNIQUE,
        kind INTEGER NOT NULL,
        payload BLOB NOT NULL,
        created_at INTEGER NOT NULL
      );
      CREATE TABLE IF NOT EXISTS committed_events (
        event_id TEXT PRIMARY KEY,
        block_index INTEGER NOT NULL,
        position INTEGER NOT NULL,
        kind INTEGER NOT NULL,
        created_at INTEGER NOT NULL,
        UNIQUE (block_index, position)
      );
      CREATE INDEX IF NOT EXISTS committed_events_kind_time ON committed_events (kind, created_at);
      CREATE INDEX IF NOT EXISTS committed_events_time ON committed_events (created_at);
      CREATE TABLE IF NOT EXISTS pruned_event_ids (
        event_id TEXT PRIMARY KEY
      );
      CREATE TABLE IF NOT EXISTS difficulty_epochs (
        start_index INTEGER PRIMARY KEY,
        difficulty INTEGER NOT NULL
      );
      CREATE TABLE IF NOT EXISTS ledger_meta (
        key TEXT PRIMARY KEY,
        value TEXT NOT NULL
      );
    )sql";

    constexpr auto select_block_columns =
      "SELECT block_index, timestamp, previous_hash, nonce, hash, serialized_transactions FROM blocks ";

    // Indices, timestamps and nonces are stored in INTEGER columns (signed 64-bit).
    int64_t to_sql(uint64_t value) { return static_cast<int64_t>(value); }
    uint64_t from_sql(int64_t value) { return static_cast<uint64_t>(value); }

    StoredBlock read_block_row(const sqlite::Statement& stmt) {
      StoredBlock block;
      block.index = from_sql(stmt.column_int64(0));
      block.timestamp = from_sql(stmt.column_int64(1));
      block.previous_hash = stmt.column_text(2);
      block.nonce = from_sql(stmt.column_int64(3));
      block.hash = stmt.column_text(4);
      block.serialized_transactions = stmt.column_blob(5);
      return block;
    }

    IndexRow read_index_row(const sqlite::Statement& stmt) {
      IndexRow row;
      row.event_id = stmt.column_text(0);
      row.position = static_cast<uint32_t>(stmt.column_int64(1));
      row.kind = static_cast<core::EventKind>(stmt.column_int64(2));
      row.created_at = from_sql(stmt.column_int64(3));
      return row;
    }

    DifficultySchedule read_difficulty_schedule(const sqlite::Database& db) {
      auto stmt = db.prepare("SELECT start_index, difficulty FROM difficulty_epochs ORDER BY start_index");
      DifficultySchedule schedule;
      while (stmt.step()) {
        schedule[from_sql(stmt.column_int64(0))] = static_cast<uint32_t>(stmt.column_int64(1));
      }
      return schedule;
    }

    core::Event decode_event(const std::vector<uint8_t>& payload) {
      return core::Event::deserialize(std::span<const uint8_t>(payload.data(), payload.size()));
    }

    uint64_t parse_meta_u64(const std::string& key, const std::string& value) {
      try {
        size_t used = 0;
        auto parsed = std::stoull(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return parsed;
      } catch (const std::logic_error&) {
        throw core::PersistenceError("ledger_meta: invalid value for " + key + ": '" + value + "'");
      }
    }

    std::optional<Checkpoint> read_checkpoint(const sqlite::Database& db) {
      auto stmt = db.prepare("SELECT key, value FROM ledger_meta WHERE key IN (?1, ?2, ?3)");
      stmt.bind(1, std::string_view(checkpoint_index_key))
          .bind(2, std::string_view(checkpoint_hash_key))
          .bind(3, std::string_view(checkpoint_pruned_at_key));
      std::optional<uint64_t> index;
      std::optional<std::string> hash;
      uint64_t pruned_at = 0;
      while (stmt.step()) {
        auto key = stmt.column_text(0);
        auto value = stmt.column_text(1);
        if (key == checkpoint_index_key) index = parse_meta_u64(key, value);
        else if (key == checkpoint_hash_key) hash = value;
        else pruned_at = parse_meta_u64(key, value);
      }
      if (!index || !hash) return std::nullopt;
      return Checkpoint{.index = *index, .hash = *hash, .pruned_at = pruned_at};
    }
  }

  std::optional<uint32_t> difficulty_at(const DifficultySchedule& schedule, uint64_t block_index) {
    auto it = schedule.upper_bound(block_index);
    if (it == schedule.begin()) return std::nullopt;
    return std::prev(it)->second;
  }

  core::Block StoredBlock::to_block() const {
    core::Block block;
    block.index = index;
    block.timestamp = timestamp;
    block.previous_hash = previous_hash;
    block.nonce = nonce;
    block.hash = hash;
    try {
      block.transactions = core::deserialize_transactions(
        std::span<const uint8_t>(serialized_transactions.data(), serialized_transactions.size()));
    } catch (const core::SerializeError& e) {
      throw core::ChainIntegrityError(core::IntegrityCheck::Unreadable, index,
                                      "block " + std::to_string(index) + ": unreadable transactions: " + e.what());
    }
    return block;
  }

  BlockCursor::BlockCursor(const std::filesystem::path& db_path, uint64_t start, std::optional<uint64_t> end)
    : db_(db_path, SQLITE_OPEN_READONLY), start_(start), end_(end) {
    db_.exec("BEGIN");
    // The first read pins the snapshot; the checkpoint and the blocks come from it.
    checkpoint_ = read_checkpoint(db_);
    difficulty_schedule_ = read_difficulty_schedule(db_);
    rows_stmt_.emplace(db_.prepare("SELECT event_id, position, kind, created_at FROM committed_events "
                                   "WHERE block_index = ?1 ORDER BY position"));
    stmt_.emplace(db_.prepare(std::string(select_block_columns) +
                              "WHERE block_index >= ?1 AND block_index < ?2 ORDER BY block_index"));
    bind_range();
  }

  void BlockCursor::bind_range() {
    stmt_->bind(1, to_sql(start_));
    stmt_->bind(2, end_ ? to_sql(*end_) : std::numeric_limits<int64_t>::max());
  }

  std::optional<StoredBlock> BlockCursor::next() {
    if (!stmt_->step()) return std::nullopt;
    return read_block_row(*stmt_);
  }

  void BlockCursor::reset() {
    stmt_->reset();
    bind_range();
  }

  std::vector<IndexRow> BlockCursor::index_rows(uint64_t block_index) {
    rows_stmt_->reset();
    rows_stmt_->bind(1, to_sql(block_index));
    std::vector<IndexRow> rows;
    while (rows_stmt_->step()) {
      rows.push_back(read_index_row(*rows_stmt_));
    }
    return rows;
  }

  uint64_t BlockCursor::index_row_count() {
    auto stmt = db_.prepare("SELECT COUNT(*) FROM committed_events");
    stmt.step();
    return from_sql(stmt.column_int64(0));
  }

  ChainStore::ChainStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)),
      db_([this]() {
        if (db_path_.has_parent_path()) {
          std::error_code ec;
          std::filesystem::create_directories(db_path_.parent_path(), ec);
          if (ec) throw core::PersistenceError("create " + db_path_.parent_path().string() + ": " + ec.message());
        }
        return db_path_;
      }(), SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX) {
    db_.exec("PRAGMA journal_mode=WAL");
    db_.exec("PRAGMA synchronous=FULL");
    create_schema();
    load_tip();
  }

  void ChainStore::create_schema() {
    db_.exec(schema);
  }

  void ChainStore::load_tip() {
    auto index = get_meta(tip_index_key);
    auto hash = get_meta(tip_hash_key);
    if (!index || !hash) {
      tip_.reset();
      return;
    }
    tip_ = TipRef{parse_meta_u64(tip_index_key, *index), *hash};
  }

  std::optional<std::string> ChainStore::get_meta(const std::string& key) const {
    auto stmt = db_.prepare("SELECT value FROM ledger_meta WHERE key = ?1");
    stmt.bind(1, std::string_view(key));
    if (!stmt.step()) return std::nullopt;
    return stmt.column_text(0);
  }

  void ChainStore::set_meta(const std::string& key, const std::string& value) {
    auto stmt = db_.prepare("INSERT INTO ledger_meta (key, value) VALUES (?1, ?2) "
                            "ON CONFLICT(key) DO UPDATE SET value = excluded.value");
    stmt.bind(1, std::string_view(key)).bind(2, std::string_view(value));
    stmt.step();
  }

  bool ChainStore::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !tip_.has_value();
  }

  void ChainStore::initialize(const core::Block& genesis, uint32_t difficulty) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tip_) throw core::LedgerError("chain store already initialized: " + db_path_.string());
    if (genesis.index != 0 || genesis.previous_hash != core::GENESIS_PREVIOUS_HASH || !genesis.transactions.empty()) {
      throw core::ChainIntegrityError(core::IntegrityCheck::BrokenLink, genesis.index, "not a genesis block");
    }

    sqlite::Transaction txn(db_);
    auto tx_bytes = genesis.serialize_transactions();
    auto insert = db_.prepare("INSERT INTO blocks (block_index, timestamp, previous_hash, nonce, hash, "
                              "serialized_transactions) VALUES (?1, ?2, ?3, ?4, ?5, ?6)");
    insert.bind(1, to_sql(genesis.index))
          .bind(2, to_sql(genesis.timestamp))
          .bind(3, std::string_view(genesis.previous_hash))
          .bind(4, to_sql(genesis.nonce))
          .bind(5, std::string_view(genesis.hash))
          .bind(6, std::span<const uint8_t>(tx_bytes.data(), tx_bytes.size()));
    insert.step();
    set_meta(tip_index_key, std::to_string(genesis.index));
    set_meta(tip_hash_key, genesis.hash);
    auto epoch = db_.prepare("INSERT INTO difficulty_epochs (start_index, difficulty) VALUES (?1, ?2)");
    epoch.bind(1, to_sql(genesis.index)).bind(2, static_cast<int64_t>(difficulty));
    epoch.step();
    txn.commit();

    tip_ = TipRef{genesis.index, genesis.hash};
  }

  std::optional<uint32_t> ChainStore::stored_difficulty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare("SELECT difficulty FROM difficulty_epochs ORDER BY start_index DESC LIMIT 1");
    if (!stmt.step()) return std::nullopt;
    return static_cast<uint32_t>(stmt.column_int64(0));
  }

  bool ChainStore::record_difficulty(uint32_t difficulty) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!tip_) throw core::LedgerError("chain store not initialized: " + db_path_.string());

    sqlite::Transaction txn(db_);
    auto latest = db_.prepare("SELECT difficulty FROM difficulty_epochs ORDER BY start_index DESC LIMIT 1");
    if (latest.step() && static_cast<uint32_t>(latest.column_int64(0)) == difficulty) return false;

    // An epoch that has not mined a block yet is replaced rather than stacked.
    auto epoch = db_.prepare("INSERT INTO difficulty_epochs (start_index, difficulty) VALUES (?1, ?2) "
                             "ON CONFLICT(start_index) DO UPDATE SET difficulty = excluded.difficulty");
    epoch.bind(1, to_sql(tip_->index + 1)).bind(2, static_cast<int64_t>(difficulty));
    epoch.step();
    txn.commit();
    return true;
  }

  DifficultySchedule ChainStore::difficulty_schedule() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return read_difficulty_schedule(db_);
  }

  EnqueueResult ChainStore::enqueue(const core::Event& event) {
    auto payload = event.serialize();

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite::Transaction txn(db_);

    auto seen = db_.prepare("SELECT 1 FROM committed_events WHERE event_id = ?1 "
                            "UNION ALL SELECT 1 FROM pruned_event_ids WHERE event_id = ?1 LIMIT 1");
    seen.bind(1, std::string_view(event.id));
    if (seen.step()) return EnqueueResult::Duplicate;

    auto insert = db_.prepare("INSERT OR IGNORE INTO pending_events (event_id, kind, payload, created_at) "
                              "VALUES (?1, ?2, ?3, ?4)");
    insert.bind(1, std::string_view(event.id))
          .bind(2, static_cast<int64_t>(event.kind()))
          .bind(3, std::span<const uint8_t>(payload.data(), payload.size()))
          .bind(4, to_sql(event.created_at));
    insert.step();
    if (db_.changes() == 0) return EnqueueResult::Duplicate;

    txn.commit();
    return EnqueueResult::Inserted;
  }

  std::vector<core::Event> ChainStore::pending(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare("SELECT payload FROM pending_events ORDER BY seq LIMIT ?1");
    stmt.bind(1, static_cast<int64_t>(std::min<size_t>(limit, std::numeric_limits<int64_t>::max())));
    std::vector<core::Event> events;
    while (stmt.step()) {
      events.push_back(decode_event(stmt.column_blob(0)));
    }
    return events;
  }

  uint64_t ChainStore::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare("SELECT COUNT(*) FROM pending_events");
    stmt.step();
    return from_sql(stmt.column_int64(0));
  }

  void ChainStore::append(const core::Block& block) {
    auto tx_bytes = block.serialize_transactions();
    auto recomputed = core::compute_block_hash(block.index, block.timestamp, tx_bytes, block.previous_hash, block.nonce);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!tip_) throw core::LedgerError("chain store not initialized: " + db_path_.string());
    if (block.index != tip_->index + 1) {
      throw core::ChainIntegrityError(core::IntegrityCheck::IndexGap, block.index,
                                      "append: block " + std::to_string(block.index) + " does not follow tip " +
                                      std::to_string(tip_->index));
    }
    if (block.previous_hash != tip_->hash) {
      throw core::ChainIntegrityError(core::IntegrityCheck::BrokenLink, block.index,
                                      "append: block " + std::to_string(block.index) + " does not link to the tip");
    }
    if (recomputed != block.hash) {
      throw core::ChainIntegrityError(core::IntegrityCheck::HashMismatch, block.index,
                                      "append: block " + std::to_string(block.index) + " hash does not match contents");
    }

    sqlite::Transaction txn(db_);

    auto insert_block = db_.prepare("INSERT INTO blocks (block_index, timestamp, previous_hash, nonce, hash, "
                                    "serialized_transactions) VALUES (?1, ?2, ?3, ?4, ?5, ?6)");
    insert_block.bind(1, to_sql(block.index))
                .bind(2, to_sql(block.timestamp))
                .bind(3, std::string_view(block.previous_hash))
                .bind(4, to_sql(block.nonce))
                .bind(5, std::string_view(block.hash))
                .bind(6, std::span<const uint8_t>(tx_bytes.data(), tx_bytes.size()));
    insert_block.step();

    auto insert_event = db_.prepare("INSERT INTO committed_events (event_id, block_index, position, kind, "
                                    "created_at) VALUES (?1, ?2, ?3, ?4, ?5)");
    auto remove_pending = db_.prepare("DELETE FROM pending_events WHERE event_id = ?1");
    for (size_t position = 0; position < block.transactions.size(); ++position) {
      const auto& event = block.transactions[position];
      insert_event.reset();
      insert_event.bind(1, std::string_view(event.id))
                  .bind(2, to_sql(block.index))
                  .bind(3, static_cast<int64_t>(position))
                  .bind(4, static_cast<int64_t>(event.kind()))
                  .bind(5, to_sql(event.created_at));
      insert_event.step();

      remove_pending.reset();
      remove_pending.bind(1, std::string_view(event.id));
      remove_pending.step();
    }

    set_meta(tip_index_key, std::to_string(block.index));
    set_meta(tip_hash_key, block.hash);
    txn.commit();

    tip_ = TipRef{block.index, block.hash};
  }

  std::optional<StoredBlock> ChainStore::read_block(uint64_t index) const {
    auto stmt = db_.prepare(std::string(select_block_columns) + "WHERE block_index = ?1");
    stmt.bind(1, to_sql(index));
    if (!stmt.step()) return std::nullopt;
    return read_block_row(stmt);
  }

  std::optional<StoredBlock> ChainStore::get_stored_block(uint64_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return read_block(index);
  }

  std::optional<core::Block> ChainStore::get_block(uint64_t index) const {
    auto stored = get_stored_block(index);
    if (!stored) return std::nullopt;
    return stored->to_block();
  }

  core::Block ChainStore::get_tip() const {
    std::optional<StoredBlock> stored;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!tip_) throw core::LedgerError("chain store not initialized: " + db_path_.string());
      stored = read_block(tip_->index);
    }
    if (!stored) throw core::PersistenceError("tip block missing from " + db_path_.string());
    return stored->to_block();
  }

  std::optional<StoredBlock> ChainStore::get_stored_tip() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!tip_) return std::nullopt;
    return read_block(tip_->index);
  }

  uint64_t ChainStore::block_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare("SELECT COUNT(*) FROM blocks");
    stmt.step();
    return from_sql(stmt.column_int64(0));
  }

  uint64_t ChainStore::transaction_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare("SELECT COUNT(*) FROM committed_events");
    stmt.step();
    return from_sql(stmt.column_int64(0));
  }

  std::optional<Checkpoint> ChainStore::checkpoint() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return read_checkpoint(db_);
  }

  std::optional<std::pair<uint64_t, uint64_t>> ChainStore::timestamp_range() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare("SELECT MIN(timestamp), MAX(timestamp) FROM blocks");
    if (!stmt.step() || stmt.column_is_null(0)) return std::nullopt;
    return std::make_pair(from_sql(stmt.column_int64(0)), from_sql(stmt.column_int64(1)));
  }

  BlockCursor ChainStore::iterate(uint64_t start, std::optional<uint64_t> end) const {
    return BlockCursor(db_path_, start, end);
  }

  std::vector<CommittedEvent> ChainStore::query_events(const EventFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare(
      "SELECT e.event_id, e.position, e.kind, e.created_at, e.block_index "
      "FROM committed_events e JOIN blocks b ON b.block_index = e.block_index "
      "WHERE (?1 IS NULL OR e.kind = ?1) "
      "AND (?2 IS NULL OR e.created_at >= ?2) "
      "AND (?3 IS NULL OR e.created_at <= ?3) "
      "AND (e.block_index > ?4 OR (e.block_index = ?4 AND e.position > ?5)) "
      "ORDER BY e.block_index, e.position LIMIT ?6");

    if (filter.kind) stmt.bind(1, static_cast<int64_t>(*filter.kind));
    else stmt.bind_null(1);
    if (filter.start_time) stmt.bind(2, to_sql(*filter.start_time));
    else stmt.bind_null(2);
    if (filter.end_time) stmt.bind(3, to_sql(*filter.end_time));
    else stmt.bind_null(3);
    if (filter.after) {
      stmt.bind(4, to_sql(filter.after->first));
      stmt.bind(5, static_cast<int64_t>(filter.after->second));
    } else {
      stmt.bind(4, int64_t{-1});
      stmt.bind(5, int64_t{-1});
    }
    stmt.bind(6, static_cast<int64_t>(std::min<size_t>(filter.limit, std::numeric_limits<int64_t>::max())));

    // The index only selects; every event is read back from its hash-checked block.
    std::vector<CommittedEvent> events;
    std::optional<core::Block> block;
    while (stmt.step()) {
      auto row = read_index_row(stmt);
      auto block_index = from_sql(stmt.column_int64(4));
      if (!block || block->index != block_index) {
        auto stored = read_block(block_index);
        if (!stored) throw core::PersistenceError("block " + std::to_string(block_index) + " missing");
        block = stored->to_block();
      }

      if (row.position >= block->transactions.size()) {
        throw core::ChainIntegrityError(core::IntegrityCheck::IndexMismatch, block_index,
                                        "block " + std::to_string(block_index) + ": no transaction at position " +
                                        std::to_string(row.position));
      }
      const auto& event = block->transactions[row.position];
      if (event.id != row.event_id || event.kind() != row.kind || event.created_at != row.created_at) {
        throw core::ChainIntegrityError(core::IntegrityCheck::IndexMismatch, block_index,
                                        "block " + std::to_string(block_index) + ": index row for " + row.event_id +
                                        " does not match position " + std::to_string(row.position));
      }

      CommittedEvent record;
      record.event = event;
      record.block_index = block_index;
      record.position = row.position;
      record.block_hash = block->hash;
      events.push_back(std::move(record));
    }
    return events;
  }

  std::map<core::EventKind, uint64_t> ChainStore::count_by_kind() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<core::EventKind, uint64_t> counts;
    for (auto kind : core::all_event_kinds) counts[kind] = 0;
    auto stmt = db_.prepare("SELECT kind, COUNT(*) FROM committed_events GROUP BY kind");
    while (stmt.step()) {
      auto kind = static_cast<core::EventKind>(stmt.column_int64(0));
      counts[kind] = from_sql(stmt.column_int64(1));
    }
    return counts;
  }

  uint64_t ChainStore::storage_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto pages = db_.prepare("PRAGMA page_count");
    pages.step();
    auto page_size = db_.prepare("PRAGMA page_size");
    page_size.step();
    return from_sql(pages.column_int64(0)) * from_sql(page_size.column_int64(0));
  }

  PruneResult ChainStore::prune_before(uint64_t cutoff_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!tip_) return {};
    // Blocks are pruned as a prefix so the retained chain stays contiguous.
    auto stmt = db_.prepare("SELECT MIN(block_index) FROM blocks WHERE timestamp >= ?1 OR block_index = ?2");
    stmt.bind(1, to_sql(cutoff_ms)).bind(2, to_sql(tip_->index));
    if (!stmt.step() || stmt.column_is_null(0)) return {};
    return prune_below(from_sql(stmt.column_int64(0)));
  }

  PruneResult ChainStore::prune_to_size(uint64_t max_blocks) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!tip_ || max_blocks == 0 || tip_->index + 1 <= max_blocks) return {};
    return prune_below(tip_->index + 1 - max_blocks);
  }

  PruneResult ChainStore::prune_below(uint64_t new_start) {
    PruneResult result;

    sqlite::Transaction txn(db_);
    auto oldest = db_.prepare("SELECT MIN(block_index) FROM blocks");
    if (!oldest.step() || oldest.column_is_null(0) || from_sql(oldest.column_int64(0)) >= new_start) {
      return result;
    }

    auto anchor = read_block(new_start);
    if (!anchor) throw core::PersistenceError("prune: block " + std::to_string(new_start) + " missing");

    auto retire_ids = db_.prepare("INSERT OR IGNORE INTO pruned_event_ids (event_id) "
                                  "SELECT event_id FROM committed_events WHERE block_index < ?1");
    retire_ids.bind(1, to_sql(new_start));
    retire_ids.step();

    auto drop_events = db_.prepare("DELETE FROM committed_events WHERE block_index < ?1");
    drop_events.bind(1, to_sql(new_start));
    drop_events.step();
    result.events_removed = from_sql(db_.changes());

    auto drop_blocks = db_.prepare("DELETE FROM blocks WHERE block_index < ?1");
    drop_blocks.bind(1, to_sql(new_start));
    drop_blocks.step();
    result.blocks_removed = from_sql(db_.changes());

    Checkpoint checkpoint{.index = anchor->index, .hash = anchor->hash, .pruned_at = core::unix_time_ms()};
    set_meta(checkpoint_index_key, std::to_string(checkpoint.index));
    set_meta(checkpoint_hash_key, checkpoint.hash);
    set_meta(checkpoint_pruned_at_key, std::to_string(checkpoint.pruned_at));
    txn.commit();

    result.checkpoint = checkpoint;
    return result;
  }
}

#include <gtest/gtest.h>
#include <filesystem>
#include "auditchain/storage/chain_store.hpp"
#include "auditchain/core/errors.hpp"

using namespace auditchain::core;
using auditchain::storage::ChainStore;
using auditchain::storage::EnqueueResult;
using auditchain::storage::EventFilter;
namespace fs = std::filesystem;
namespace sqlite = auditchain::storage::sqlite;

static fs::path tmpdir(const char* name) {
  auto p = fs::temp_directory_path() / (std::string("auditchain_") + name);
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

static Event trade(const std::string& id, uint64_t created_at = 1700000000000ULL) {
  return make_event(TradeEvent{.symbol = "BTC/USDT", .side = Side::Buy, .quantity = 1, .price = 100,
                               .order_id = "o-" + id}, id, created_at);
}

static Event login(const std::string& id, uint64_t created_at = 1700000000000ULL) {
  return make_event(LoginEvent{.username = "alice", .success = true, .source = "ssh"}, id, created_at);
}

// Appends a block (no proof-of-work; the store does not check difficulty).
static Block append_block(ChainStore& store, std::vector<Event> events, uint64_t timestamp) {
  auto block = build_candidate_block(store.get_tip(), std::move(events), timestamp);
  block.hash = block.compute_hash();
  store.append(block);
  return block;
}

static void init(ChainStore& store, uint64_t timestamp = 1000) {
  store.initialize(make_genesis_block(timestamp), 2);
}

TEST(Store, InitializeWritesGenesis) {
  auto dir = tmpdir("store_init");
  ChainStore store(dir / "nested" / "chain.db");
  EXPECT_TRUE(store.empty());
  init(store);
  EXPECT_FALSE(store.empty());
  EXPECT_EQ(store.block_count(), 1u);
  EXPECT_EQ(store.get_tip().index, 0u);
  EXPECT_EQ(store.get_tip().previous_hash, GENESIS_PREVIOUS_HASH);
  EXPECT_EQ(store.stored_difficulty(), std::optional<uint32_t>(2));
  EXPECT_THROW(init(store), LedgerError);
}

TEST(Store, AppendRestoreRoundTrip) {
  auto dir = tmpdir("store_restore");
  Block b1;
  {
    ChainStore store(dir / "chain.db");
    init(store);
    b1 = append_block(store, {trade("a"), login("b")}, 2000);
  }

  ChainStore reopened(dir / "chain.db");
  EXPECT_FALSE(reopened.empty());
  EXPECT_EQ(reopened.block_count(), 2u);
  auto tip = reopened.get_tip();
  EXPECT_EQ(tip.index, 1u);
  EXPECT_EQ(tip.hash, b1.hash);
  ASSERT_EQ(tip.transactions.size(), 2u);
  EXPECT_EQ(tip.transactions[1].id, "b");
  EXPECT_EQ(reopened.transaction_count(), 2u);
}

TEST(Store, AppendRejectsBlocksThatDoNotExtendTip) {
  auto dir = tmpdir("store_reject");
  ChainStore store(dir / "chain.db");
  init(store);
  auto genesis = store.get_tip();

  auto gap = build_candidate_block(genesis, {trade("a")}, 2000);
  gap.index = 2;
  gap.hash = gap.compute_hash();
  try {
    store.append(gap);
    FAIL() << "expected ChainIntegrityError";
  } catch (const ChainIntegrityError& e) {
    EXPECT_EQ(e.check, IntegrityCheck::IndexGap);
  }

  auto unlinked = build_candidate_block(genesis, {trade("a")}, 2000);
  unlinked.previous_hash = std::string(64, 'f');
  unlinked.hash = unlinked.compute_hash();
  try {
    store.append(unlinked);
    FAIL() << "expected ChainIntegrityError";
  } catch (const ChainIntegrityError& e) {
    EXPECT_EQ(e.check, IntegrityCheck::BrokenLink);
  }

  auto forged = build_candidate_block(genesis, {trade("a")}, 2000);
  forged.hash = std::string(64, '0');
  EXPECT_THROW(store.append(forged), ChainIntegrityError);

  EXPECT_EQ(store.block_count(), 1u);
  EXPECT_EQ(store.transaction_count(), 0u);
}

TEST(Store, EnqueueIsIdempotent) {
  auto dir = tmpdir("store_enqueue");
  ChainStore store(dir / "chain.db");
  init(store);

  EXPECT_EQ(store.enqueue(trade("a")), EnqueueResult::Inserted);
  EXPECT_EQ(store.enqueue(trade("a")), EnqueueResult::Duplicate);
  EXPECT_EQ(store.enqueue(trade("b")), EnqueueResult::Inserted);
  EXPECT_EQ(store.pending_count(), 2u);

  // Once committed, the id is still a duplicate.
  append_block(store, store.pending(10), 2000);
  EXPECT_EQ(store.pending_count(), 0u);
  EXPECT_EQ(store.enqueue(trade("a")), EnqueueResult::Duplicate);
  EXPECT_EQ(store.pending_count(), 0u);
}

TEST(Store, PendingIsOldestFirst) {
  auto dir = tmpdir("store_pending");
  ChainStore store(dir / "chain.db");
  init(store);
  for (const char* id : {"c", "a", "b"}) store.enqueue(trade(id));

  auto two = store.pending(2);
  ASSERT_EQ(two.size(), 2u);
  EXPECT_EQ(two[0].id, "c");
  EXPECT_EQ(two[1].id, "a");
  // Reading does not consume.
  EXPECT_EQ(store.pending_count(), 3u);
}

TEST(Store, AppendRemovesOnlyCommittedEventsFromPool) {
  auto dir = tmpdir("store_drain");
  ChainStore store(dir / "chain.db");
  init(store);
  for (const char* id : {"a", "b", "c"}) store.enqueue(trade(id));

  append_block(store, store.pending(2), 2000);
  auto left = store.pending(10);
  ASSERT_EQ(left.size(), 1u);
  EXPECT_EQ(left[0].id, "c");
}

TEST(Store, CursorSeesOneSnapshot) {
  auto dir = tmpdir("store_cursor");
  ChainStore store(dir / "chain.db");
  init(store);
  append_block(store, {trade("a")}, 2000);

  auto cursor = store.iterate();
  append_block(store, {trade("b")}, 3000);

  uint64_t seen = 0;
  while (auto block = cursor.next()) {
    EXPECT_EQ(block->index, seen);
    ++seen;
  }
  EXPECT_EQ(seen, 2u);

  cursor.reset();
  auto first = cursor.next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->index, 0u);

  // A new cursor sees the later commit.
  auto fresh = store.iterate(1);
  uint64_t count = 0;
  while (fresh.next()) ++count;
  EXPECT_EQ(count, 2u);
}

TEST(Store, CursorRangeIsHalfOpen) {
  auto dir = tmpdir("store_range");
  ChainStore store(dir / "chain.db");
  init(store);
  for (uint64_t i = 1; i <= 4; ++i) append_block(store, {trade("t" + std::to_string(i))}, 1000 + i);

  auto cursor = store.iterate(1, 3);
  auto b1 = cursor.next();
  auto b2 = cursor.next();
  ASSERT_TRUE(b1 && b2);
  EXPECT_EQ(b1->index, 1u);
  EXPECT_EQ(b2->index, 2u);
  EXPECT_FALSE(cursor.next().has_value());

  auto decoded = b2->to_block();
  ASSERT_EQ(decoded.transactions.size(), 1u);
  EXPECT_EQ(decoded.transactions[0].id, "t2");
}

TEST(Store, QueryEventsFiltersAndPages) {
  auto dir = tmpdir("store_query");
  ChainStore store(dir / "chain.db");
  init(store);
  auto b1 = append_block(store, {trade("t1", 100), login("l1", 200), trade("t2", 300)}, 2000);
  append_block(store, {login("l2", 400), trade("t3", 500)}, 3000);

  EventFilter all;
  auto rows = store.query_events(all);
  ASSERT_EQ(rows.size(), 5u);
  EXPECT_EQ(rows[0].event.id, "t1");
  EXPECT_EQ(rows[0].block_hash, b1.hash);
  EXPECT_EQ(rows[2].position, 2u);
  EXPECT_EQ(rows[3].block_index, 2u);

  EventFilter trades;
  trades.kind = EventKind::Trade;
  trades.start_time = 300;
  rows = store.query_events(trades);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].event.id, "t2");
  EXPECT_EQ(rows[1].event.id, "t3");

  EventFilter window;
  window.start_time = 200;
  window.end_time = 400;
  EXPECT_EQ(store.query_events(window).size(), 3u);

  EventFilter after;
  after.after = std::make_pair(uint64_t{1}, uint32_t{1});
  after.limit = 2;
  rows = store.query_events(after);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].event.id, "t2");
  EXPECT_EQ(rows[1].event.id, "l2");

  auto by_kind = store.count_by_kind();
  EXPECT_EQ(by_kind[EventKind::Trade], 3u);
  EXPECT_EQ(by_kind[EventKind::Login], 2u);
  EXPECT_EQ(by_kind[EventKind::Order], 0u);
}

TEST(Store, QueryEventsReadsPayloadsFromBlocks) {
  auto dir = tmpdir("store_query_source");
  ChainStore store(dir / "chain.db");
  init(store);
  append_block(store, {trade("t1", 100), login("l1", 200)}, 2000);

  {
    // Repoint the index row for t1 at l1's slot.
    sqlite::Database raw(dir / "chain.db", SQLITE_OPEN_READWRITE);
    raw.exec("UPDATE committed_events SET position = 5 WHERE event_id = 'l1'");
    raw.exec("UPDATE committed_events SET position = 1 WHERE event_id = 't1'");
  }
  try {
    store.query_events(EventFilter{});
    FAIL() << "expected ChainIntegrityError";
  } catch (const ChainIntegrityError& e) {
    EXPECT_EQ(e.check, IntegrityCheck::IndexMismatch);
    EXPECT_EQ(e.block_index, std::optional<uint64_t>(1));
  }

  {
    sqlite::Database raw(dir / "chain.db", SQLITE_OPEN_READWRITE);
    raw.exec("UPDATE committed_events SET position = 0 WHERE event_id = 't1'");
    raw.exec("UPDATE committed_events SET position = 1 WHERE event_id = 'l1'");
  }
  auto rows = store.query_events(EventFilter{});
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(std::get<TradeEvent>(rows[0].event.payload).order_id, "o-t1");
  EXPECT_EQ(rows[1].event.kind(), EventKind::Login);
}

TEST(Store, DifficultyEpochsStartAfterTheTip) {
  auto dir = tmpdir("store_difficulty");
  ChainStore store(dir / "chain.db");
  init(store);
  append_block(store, {trade("t1")}, 2000);

  EXPECT_FALSE(store.record_difficulty(2));
  EXPECT_TRUE(store.record_difficulty(4));
  // Replaces the epoch that has not mined anything yet.
  EXPECT_TRUE(store.record_difficulty(3));
  EXPECT_EQ(store.stored_difficulty(), std::optional<uint32_t>(3));

  auto schedule = store.difficulty_schedule();
  ASSERT_EQ(schedule.size(), 2u);
  EXPECT_EQ(auditchain::storage::difficulty_at(schedule, 0), std::optional<uint32_t>(2));
  EXPECT_EQ(auditchain::storage::difficulty_at(schedule, 1), std::optional<uint32_t>(2));
  EXPECT_EQ(auditchain::storage::difficulty_at(schedule, 2), std::optional<uint32_t>(3));
  EXPECT_EQ(auditchain::storage::difficulty_at(schedule, 50), std::optional<uint32_t>(3));
  EXPECT_FALSE(auditchain::storage::difficulty_at({}, 1).has_value());

  auto cursor = store.iterate();
  EXPECT_EQ(cursor.difficulty_schedule(), schedule);
}

TEST(Store, PruneBeforeKeepsTipAndWritesCheckpoint) {
  auto dir = tmpdir("store_prune");
  ChainStore store(dir / "chain.db");
  init(store, 1000);
  append_block(store, {trade("a")}, 2000);
  auto b2 = append_block(store, {trade("b")}, 3000);
  auto b3 = append_block(store, {trade("c")}, 4000);

  auto result = store.prune_before(2500);
  EXPECT_EQ(result.blocks_removed, 2u);
  EXPECT_EQ(result.events_removed, 1u);
  ASSERT_TRUE(result.checkpoint.has_value());
  EXPECT_EQ(result.checkpoint->index, 2u);
  EXPECT_EQ(result.checkpoint->hash, b2.hash);

  auto checkpoint = store.checkpoint();
  ASSERT_TRUE(checkpoint.has_value());
  EXPECT_EQ(checkpoint->index, 2u);
  EXPECT_EQ(store.block_count(), 2u);
  EXPECT_FALSE(store.get_block(1).has_value());
  EXPECT_EQ(store.timestamp_range(), std::make_optional(std::make_pair(uint64_t{3000}, uint64_t{4000})));

  // Pruned ids stay known.
  EXPECT_EQ(store.enqueue(trade("a")), EnqueueResult::Duplicate);

  // Never the tip, even when everything is old.
  result = store.prune_before(1000000);
  EXPECT_EQ(result.blocks_removed, 1u);
  EXPECT_EQ(store.get_tip().hash, b3.hash);
  EXPECT_EQ(store.block_count(), 1u);

  result = store.prune_before(1000000);
  EXPECT_EQ(result.blocks_removed, 0u);
  EXPECT_FALSE(result.checkpoint.has_value());
}

TEST(Store, PruneToSizeKeepsNewest) {
  auto dir = tmpdir("store_prune_size");
  ChainStore store(dir / "chain.db");
  init(store);
  for (uint64_t i = 1; i <= 5; ++i) append_block(store, {trade("t" + std::to_string(i))}, 1000 + i);

  EXPECT_EQ(store.prune_to_size(0).blocks_removed, 0u);
  EXPECT_EQ(store.prune_to_size(10).blocks_removed, 0u);

  auto result = store.prune_to_size(2);
  EXPECT_EQ(result.blocks_removed, 4u);
  EXPECT_EQ(store.block_count(), 2u);
  ASSERT_TRUE(store.checkpoint().has_value());
  EXPECT_EQ(store.checkpoint()->index, 4u);

  auto cursor = store.iterate();
  EXPECT_EQ(cursor.checkpoint()->index, 4u);
  EXPECT_EQ(cursor.next()->index, 4u);
}

TEST(Store, StorageBytesIsNonZero) {
  auto dir = tmpdir("store_size");
  ChainStore store(dir / "chain.db");
  init(store);
  EXPECT_GT(store.storage_bytes(), 0u);
}

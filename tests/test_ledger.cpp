#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <map>
#include <sstream>
#include <thread>
#include "auditchain/core/ledger.hpp"

using namespace auditchain::core;
namespace fs = std::filesystem;
namespace sqlite = auditchain::storage::sqlite;

static fs::path tmpdir(const char* name) {
  auto p = fs::temp_directory_path() / (std::string("auditchain_") + name);
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

static std::shared_ptr<auditchain::logging::log> quiet_log() {
  return std::make_shared<auditchain::logging::log>(auditchain::logging::log_level::fatal, false);
}

static auditchain::config::LedgerConfig test_config(const fs::path& dir) {
  auditchain::config::LedgerConfig cfg;
  cfg.db_path = dir / "audit_chain.db";
  cfg.difficulty = 1;
  cfg.auto_mine = false;
  cfg.mine_on_shutdown = false;
  cfg.mining_timeout = std::chrono::seconds(10);
  return cfg;
}

static TradeEvent btc_trade() {
  return TradeEvent{.symbol = "BTC/USDT", .side = Side::Buy, .quantity = 0.25, .price = 61000, .order_id = "o-1"};
}

// Every committed event id mapped to how many times it appears in the chain.
static std::map<std::string, int> committed_ids(const AuditLedger& ledger) {
  std::map<std::string, int> ids;
  AuditQuery q{.limit = MAX_PAGE_SIZE};
  for (;;) {
    auto page = ledger.get_audit_trail(q);
    for (const auto& record : page.records) ++ids[record.event.id];
    if (!page.has_more) break;
    q.cursor = page.next_cursor;
  }
  return ids;
}

TEST(Ledger, NewDatabaseStartsWithGenesis) {
  auto dir = tmpdir("ledger_genesis");
  std::string genesis_hash;
  {
    AuditLedger ledger(test_config(dir), quiet_log());
    auto tip = ledger.get_tip();
    EXPECT_EQ(tip.index, 0u);
    EXPECT_EQ(tip.previous_hash, GENESIS_PREVIOUS_HASH);
    EXPECT_TRUE(tip.transactions.empty());
    genesis_hash = tip.hash;
    EXPECT_TRUE(ledger.verify_chain().is_valid);
  }
  AuditLedger reopened(test_config(dir), quiet_log());
  EXPECT_EQ(reopened.get_tip().hash, genesis_hash);
  EXPECT_EQ(reopened.get_stats().block_count, 1u);
}

TEST(Ledger, RecordedTradesMineIntoOneBlock) {
  auto dir = tmpdir("ledger_mine");
  AuditLedger ledger(test_config(dir), quiet_log());
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(ledger.record_trade(btc_trade()), RecordStatus::Queued);
  }
  EXPECT_EQ(ledger.pending_count(), 3u);

  auto result = ledger.force_mine();
  ASSERT_EQ(result.outcome, MineOutcome::Committed);
  ASSERT_TRUE(result.block.has_value());
  EXPECT_EQ(result.block->index, 1u);
  EXPECT_EQ(result.block->hash.front(), '0');
  EXPECT_EQ(result.block->transactions.size(), 3u);
  EXPECT_EQ(ledger.pending_count(), 0u);
  EXPECT_EQ(ledger.get_block(1)->hash, result.block->hash);

  auto stats = ledger.get_stats();
  EXPECT_EQ(stats.miner.blocks_mined, 1u);
  EXPECT_EQ(stats.transactions_by_kind.at(EventKind::Trade), 3u);
}

TEST(Ledger, InvalidTradeIsRejectedWithoutQueueing) {
  auto dir = tmpdir("ledger_invalid");
  AuditLedger ledger(test_config(dir), quiet_log());
  ledger.record_trade(btc_trade());

  auto bad = btc_trade();
  bad.symbol.clear();
  EXPECT_THROW(ledger.record_trade(bad), InvalidEventError);
  EXPECT_EQ(ledger.pending_count(), 1u);
}

TEST(Ledger, EventIdsAreIdempotentAcrossMining) {
  auto dir = tmpdir("ledger_idempotent");
  AuditLedger ledger(test_config(dir), quiet_log());
  EXPECT_EQ(ledger.record_trade(btc_trade(), "trade-7"), RecordStatus::Queued);
  EXPECT_EQ(ledger.record_trade(btc_trade(), "trade-7"), RecordStatus::Duplicate);
  EXPECT_EQ(ledger.pending_count(), 1u);

  ASSERT_EQ(ledger.force_mine().outcome, MineOutcome::Committed);
  EXPECT_EQ(ledger.record_trade(btc_trade(), "trade-7"), RecordStatus::Duplicate);
  EXPECT_EQ(ledger.pending_count(), 0u);
  EXPECT_EQ(ledger.force_mine().outcome, MineOutcome::NothingPending);
  EXPECT_EQ(committed_ids(ledger).at("trade-7"), 1);
}

TEST(Ledger, PendingEventsSurviveRestart) {
  auto dir = tmpdir("ledger_restart");
  {
    AuditLedger ledger(test_config(dir), quiet_log());
    ledger.record_trade(btc_trade(), "a");
    ASSERT_EQ(ledger.force_mine().outcome, MineOutcome::Committed);
    ledger.record_trade(btc_trade(), "b");
    ledger.record_login(LoginEvent{.username = "ops", .success = false, .source = "vpn"}, "c");
  }

  AuditLedger ledger(test_config(dir), quiet_log());
  auto pending = ledger.peek_pending();
  ASSERT_EQ(pending.size(), 2u);
  EXPECT_EQ(pending[0].id, "b");
  EXPECT_EQ(pending[1].id, "c");

  ASSERT_EQ(ledger.force_mine().outcome, MineOutcome::Committed);
  auto ids = committed_ids(ledger);
  EXPECT_EQ(ids, (std::map<std::string, int>{{"a", 1}, {"b", 1}, {"c", 1}}));
  EXPECT_TRUE(ledger.verify_chain().is_valid);
}

TEST(Ledger, ShutdownMinesRemainingEvents) {
  auto dir = tmpdir("ledger_shutdown");
  auto cfg = test_config(dir);
  cfg.mine_on_shutdown = true;
  {
    AuditLedger ledger(cfg, quiet_log());
    ledger.record_system_change(SystemChangeEvent{.component = "risk", .change_type = "limit", .description = ""});
  }
  AuditLedger ledger(test_config(dir), quiet_log());
  EXPECT_EQ(ledger.pending_count(), 0u);
  EXPECT_EQ(ledger.get_tip().index, 1u);
  EXPECT_EQ(ledger.get_tip().transactions.size(), 1u);
}

TEST(Ledger, DisabledKindsAreSkipped) {
  auto dir = tmpdir("ledger_kinds");
  auto cfg = test_config(dir);
  cfg.record_types = {EventKind::Trade};
  AuditLedger ledger(cfg, quiet_log());

  EXPECT_EQ(ledger.record_login(LoginEvent{.username = "ops", .success = true, .source = ""}),
            RecordStatus::KindDisabled);
  EXPECT_EQ(ledger.record_trade(btc_trade()), RecordStatus::Queued);
  EXPECT_EQ(ledger.pending_count(), 1u);
}

TEST(Ledger, PruneKeepsDedupAndVerification) {
  auto dir = tmpdir("ledger_prune");
  AuditLedger ledger(test_config(dir), quiet_log());
  for (int b = 1; b <= 3; ++b) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    ledger.record_trade(btc_trade(), "block" + std::to_string(b));
    ASSERT_EQ(ledger.force_mine().outcome, MineOutcome::Committed);
  }

  auto cutoff = ledger.get_block(3)->timestamp;
  auto result = ledger.prune(cutoff);
  EXPECT_EQ(result.blocks_removed, 3u);
  EXPECT_EQ(result.events_removed, 2u);
  ASSERT_TRUE(result.checkpoint.has_value());
  EXPECT_EQ(result.checkpoint->index, 3u);
  EXPECT_EQ(result.checkpoint->hash, ledger.get_tip().hash);

  EXPECT_FALSE(ledger.get_block(1).has_value());
  EXPECT_EQ(ledger.record_trade(btc_trade(), "block1"), RecordStatus::Duplicate);

  auto report = ledger.verify_chain();
  EXPECT_TRUE(report.is_valid) << report.message;
  EXPECT_EQ(report.first_index, std::optional<uint64_t>(3));

  // The chain keeps growing from the retained tip.
  ledger.record_trade(btc_trade(), "block4");
  ASSERT_EQ(ledger.force_mine().outcome, MineOutcome::Committed);
  EXPECT_TRUE(ledger.verify_chain().is_valid);
}

TEST(Ledger, PruneNeverRemovesTheTip) {
  auto dir = tmpdir("ledger_prune_tip");
  AuditLedger ledger(test_config(dir), quiet_log());
  ledger.record_trade(btc_trade());
  ASSERT_EQ(ledger.force_mine().outcome, MineOutcome::Committed);

  auto result = ledger.prune(unix_time_ms() + 60000);
  EXPECT_EQ(result.blocks_removed, 1u);
  EXPECT_EQ(ledger.get_tip().index, 1u);
  EXPECT_EQ(ledger.get_stats().block_count, 1u);
  EXPECT_TRUE(ledger.verify_chain().is_valid);
}

TEST(Ledger, RetentionCapsChainLength) {
  auto dir = tmpdir("ledger_retention");
  auto cfg = test_config(dir);
  cfg.max_chain_size = 2;
  AuditLedger ledger(cfg, quiet_log());
  for (int b = 0; b < 4; ++b) {
    ledger.record_trade(btc_trade());
    ASSERT_EQ(ledger.force_mine().outcome, MineOutcome::Committed);
  }

  auto result = ledger.apply_retention();
  EXPECT_EQ(result.blocks_removed, 3u);
  EXPECT_EQ(ledger.get_stats().block_count, 2u);
  ASSERT_TRUE(ledger.get_stats().checkpoint.has_value());
  EXPECT_EQ(ledger.get_stats().checkpoint->index, 3u);

  EXPECT_EQ(ledger.apply_retention().blocks_removed, 0u);
}

TEST(Ledger, FailedVerificationHaltsMining) {
  auto dir = tmpdir("ledger_halt");
  AuditLedger ledger(test_config(dir), quiet_log());
  ledger.record_trade(btc_trade());
  ASSERT_EQ(ledger.force_mine().outcome, MineOutcome::Committed);

  auto tip = ledger.get_tip();
  {
    sqlite::Database raw(ledger.config().db_path, SQLITE_OPEN_READWRITE);
    raw.exec("UPDATE blocks SET nonce = nonce + 1 WHERE block_index = 1");
  }

  auto report = ledger.verify_chain();
  EXPECT_FALSE(report.is_valid);
  EXPECT_EQ(report.failed_check, IntegrityCheck::HashMismatch);
  EXPECT_TRUE(ledger.mining_halted());

  ledger.record_trade(btc_trade());
  EXPECT_EQ(ledger.force_mine().outcome, MineOutcome::Halted);
  EXPECT_EQ(ledger.pending_count(), 1u);
  EXPECT_TRUE(ledger.get_stats().miner.halted);

  {
    sqlite::Database raw(ledger.config().db_path, SQLITE_OPEN_READWRITE);
    raw.exec("UPDATE blocks SET nonce = " + std::to_string(tip.nonce) + " WHERE block_index = 1");
  }
  EXPECT_TRUE(ledger.verify_chain().is_valid);
  ledger.clear_integrity_halt();
  EXPECT_FALSE(ledger.mining_halted());
  EXPECT_EQ(ledger.force_mine().outcome, MineOutcome::Committed);
}

TEST(Ledger, TamperedChainHaltsOnOpen) {
  auto dir = tmpdir("ledger_open_tampered");
  {
    AuditLedger ledger(test_config(dir), quiet_log());
    ledger.record_trade(btc_trade());
    ASSERT_EQ(ledger.force_mine().outcome, MineOutcome::Committed);
  }
  {
    sqlite::Database raw(dir / "audit_chain.db", SQLITE_OPEN_READWRITE);
    raw.exec("UPDATE blocks SET timestamp = timestamp + 1 WHERE block_index = 1");
  }

  AuditLedger ledger(test_config(dir), quiet_log());
  EXPECT_TRUE(ledger.mining_halted());
  auto last = ledger.get_stats().last_verification;
  ASSERT_TRUE(last.has_value());
  EXPECT_FALSE(last->is_valid);
  EXPECT_EQ(last->block_index, std::optional<uint64_t>(1));
}

TEST(Ledger, DifficultyChangeOnReopenIsTolerated) {
  auto dir = tmpdir("ledger_difficulty");
  {
    AuditLedger ledger(test_config(dir), quiet_log());
    ledger.record_trade(btc_trade());
    ASSERT_EQ(ledger.force_mine().outcome, MineOutcome::Committed);
  }

  // Raised: blocks mined before the change are still held to difficulty 1.
  {
    auto cfg = test_config(dir);
    cfg.difficulty = 3;
    cfg.verify_on_open = true;
    AuditLedger ledger(cfg, quiet_log());
    EXPECT_FALSE(ledger.mining_halted());
    EXPECT_EQ(ledger.get_stats().difficulty, 3u);
    ledger.record_trade(btc_trade());
    auto result = ledger.force_mine();
    ASSERT_EQ(result.outcome, MineOutcome::Committed);
    EXPECT_EQ(result.block->hash.substr(0, 3), "000");
    EXPECT_TRUE(ledger.verify_chain().is_valid);
  }

  // Lowered again: block 2 keeps its difficulty 3 epoch.
  auto cfg = test_config(dir);
  cfg.verify_on_open = true;
  AuditLedger ledger(cfg, quiet_log());
  EXPECT_FALSE(ledger.mining_halted());
  ledger.record_trade(btc_trade());
  ASSERT_EQ(ledger.force_mine().outcome, MineOutcome::Committed);
  auto report = ledger.verify_chain();
  EXPECT_TRUE(report.is_valid) << report.message;
  EXPECT_EQ(report.chain_length, 4u);
}

TEST(Ledger, ExportCoversWholeChain) {
  auto dir = tmpdir("ledger_export");
  AuditLedger ledger(test_config(dir), quiet_log());
  ledger.record_trade(btc_trade(), "x");
  ledger.record_config_change(ConfigChangeEvent{.component = "strategy", .key = "max_position",
                                                .old_value = "1", .new_value = "2"}, "y");
  ASSERT_EQ(ledger.force_mine().outcome, MineOutcome::Committed);

  std::stringstream csv;
  ledger.export_chain(ExportFormat::Csv, csv);
  std::string line;
  int rows = 0;
  while (std::getline(csv, line)) ++rows;
  EXPECT_EQ(rows, 3);
}

#include "auditchain/core/ledger.hpp"
#include "auditchain/core/errors.hpp"

namespace auditchain::core {
  namespace {
    constexpr uint64_t ms_per_day = 24ULL * 60 * 60 * 1000;

    MinerConfig miner_config(const config::LedgerConfig& config) {
      return MinerConfig{
        .mining_interval = config.mining_interval,
        .difficulty = config.difficulty,
        .max_block_size = config.max_block_size,
        .max_nonce_attempts = config.max_nonce_attempts,
        .mining_timeout = config.mining_timeout,
      };
    }

    void merge(storage::PruneResult& total, const storage::PruneResult& step) {
      total.blocks_removed += step.blocks_removed;
      total.events_removed += step.events_removed;
      if (step.checkpoint) total.checkpoint = step.checkpoint;
    }
  }

  AuditLedger::AuditLedger(config::LedgerConfig config, std::shared_ptr<logging::log> log)
    : config_(std::move(config)),
      log_(std::move(log)),
      store_(config_.db_path),
      pool_(store_, config_.record_types, log_),
      miner_(store_, miner_config(config_), log_),
      verifier_(store_, config_.difficulty, log_),
      query_(store_, verifier_, config_.difficulty) {
    if (store_.empty()) {
      auto genesis = make_genesis_block(unix_time_ms());
      store_.initialize(genesis, config_.difficulty);
      log_->info("ledger: created", config_.db_path.string(), "genesis", genesis.hash);
    } else {
      auto stored = store_.stored_difficulty();
      if (store_.record_difficulty(config_.difficulty)) {
        log_->warn("ledger: difficulty changes from", stored.value_or(0), "to", config_.difficulty,
                   "at block", store_.get_stored_tip()->index + 1);
      }
    }

    if (config_.verify_on_open) {
      verify_chain();
    }
    if (config_.auto_mine) {
      miner_.start();
    }
  }

  AuditLedger::~AuditLedger() {
    miner_.stop();
    if (!config_.mine_on_shutdown || miner_.halted()) return;
    try {
      if (pool_.pending_count() > 0) {
        auto result = miner_.force_mine();
        log_->info("ledger: shutdown mining", to_string(result.outcome));
      }
    } catch (const LedgerError& e) {
      log_->error("ledger: shutdown mining failed:", e.what());
    }
  }

  RecordStatus AuditLedger::record(const Event& event) {
    return pool_.record(event);
  }

  RecordStatus AuditLedger::record_trade(TradeEvent trade, std::string id) {
    return record(make_event(std::move(trade), std::move(id)));
  }

  RecordStatus AuditLedger::record_order(OrderEvent order, std::string id) {
    return record(make_event(std::move(order), std::move(id)));
  }

  RecordStatus AuditLedger::record_system_change(SystemChangeEvent change, std::string id) {
    return record(make_event(std::move(change), std::move(id)));
  }

  RecordStatus AuditLedger::record_login(LoginEvent login, std::string id) {
    return record(make_event(std::move(login), std::move(id)));
  }

  RecordStatus AuditLedger::record_config_change(ConfigChangeEvent change, std::string id) {
    return record(make_event(std::move(change), std::move(id)));
  }

  std::vector<Event> AuditLedger::peek_pending(size_t limit) const {
    return pool_.peek_pending(limit);
  }

  uint64_t AuditLedger::pending_count() const {
    return pool_.pending_count();
  }

  MineResult AuditLedger::force_mine() {
    return miner_.force_mine();
  }

  VerificationReport AuditLedger::verify_chain() {
    auto report = verifier_.verify_chain();
    if (!report.is_valid) miner_.halt(report.message);
    return report;
  }

  void AuditLedger::clear_integrity_halt() {
    miner_.clear_halt();
  }

  bool AuditLedger::mining_halted() const {
    return miner_.halted();
  }

  LedgerStats AuditLedger::get_stats() const {
    auto stats = query_.get_stats();
    stats.miner = miner_.stats();
    return stats;
  }

  AuditPage AuditLedger::get_audit_trail(const AuditQuery& query) const {
    return query_.get_audit_trail(query);
  }

  void AuditLedger::export_chain(ExportFormat format, std::ostream& out) const {
    query_.export_chain(format, out);
  }

  storage::PruneResult AuditLedger::prune(uint64_t older_than_ms) {
    auto result = store_.prune_before(older_than_ms);
    if (result.blocks_removed > 0) {
      log_->info("ledger: pruned", result.blocks_removed, "blocks and", result.events_removed,
                 "events, checkpoint at block", result.checkpoint->index);
    } else {
      log_->debug("ledger: nothing to prune before", older_than_ms);
    }
    return result;
  }

  storage::PruneResult AuditLedger::apply_retention() {
    storage::PruneResult total;
    if (config_.max_chain_size > 0) {
      merge(total, store_.prune_to_size(config_.max_chain_size));
    }
    if (config_.prune_older_than_days > 0) {
      auto now = unix_time_ms();
      auto window = config_.prune_older_than_days * ms_per_day;
      if (window < now) merge(total, store_.prune_before(now - window));
    }
    log_->info("ledger: retention removed", total.blocks_removed, "blocks and", total.events_removed, "events");
    return total;
  }

  std::optional<Block> AuditLedger::get_block(uint64_t index) const {
    return store_.get_block(index);
  }

  Block AuditLedger::get_tip() const {
    return store_.get_tip();
  }
}

#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "auditchain/core/block.hpp"
#include "auditchain/core/config.hpp"
#include "auditchain/core/event.hpp"
#include "auditchain/core/logging.hpp"
#include "auditchain/core/miner.hpp"
#include "auditchain/core/pending_pool.hpp"
#include "auditchain/core/query.hpp"
#include "auditchain/core/verifier.hpp"
#include "auditchain/storage/chain_store.hpp"

namespace auditchain::core {
  // The audit ledger: one store shared by the pool, the miner, the verifier and the
  // query service. Opening creates the genesis block for a new database.
  class AuditLedger {
    public:
      AuditLedger(config::LedgerConfig config, std::shared_ptr<logging::log> log);
      // Stops the miner and, with mine_on_shutdown, flushes the pool into one last block.
      ~AuditLedger();

      AuditLedger(const AuditLedger&) = delete;
      AuditLedger& operator=(const AuditLedger&) = delete;

      RecordStatus record(const Event& event);
      RecordStatus record_trade(TradeEvent trade, std::string id = {});
      RecordStatus record_order(OrderEvent order, std::string id = {});
      RecordStatus record_system_change(SystemChangeEvent change, std::string id = {});
      RecordStatus record_login(LoginEvent login, std::string id = {});
      RecordStatus record_config_change(ConfigChangeEvent change, std::string id = {});

      std::vector<Event> peek_pending(size_t limit = DEFAULT_PAGE_SIZE) const;
      uint64_t pending_count() const;

      MineResult force_mine();

      // A failed verification halts mining until clear_integrity_halt().
      VerificationReport verify_chain();
      void clear_integrity_halt();
      bool mining_halted() const;

      LedgerStats get_stats() const;
      AuditPage get_audit_trail(const AuditQuery& query) const;
      void export_chain(ExportFormat format, std::ostream& out) const;

      storage::PruneResult prune(uint64_t older_than_ms);
      storage::PruneResult apply_retention();

      std::optional<Block> get_block(uint64_t index) const;
      Block get_tip() const;

      const config::LedgerConfig& config() const { return config_; }

    private:
      config::LedgerConfig config_;
      std::shared_ptr<logging::log> log_;
      storage::ChainStore store_;
      PendingPool pool_;
      Miner miner_;
      Verifier verifier_;
      QueryService query_;
  };
}

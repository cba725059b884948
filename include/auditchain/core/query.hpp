#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "auditchain/core/event.hpp"
#include "auditchain/core/miner.hpp"
#include "auditchain/core/verifier.hpp"
#include "auditchain/storage/chain_store.hpp"

namespace auditchain::core {
  inline constexpr size_t DEFAULT_PAGE_SIZE = 100;
  inline constexpr size_t MAX_PAGE_SIZE = 1000;

  struct AuditQuery {
    std::optional<EventKind> kind;
    std::optional<uint64_t> start_time;   // inclusive, unix ms
    std::optional<uint64_t> end_time;     // inclusive, unix ms
    size_t limit = DEFAULT_PAGE_SIZE;     // clamped to [1, MAX_PAGE_SIZE]
    std::optional<std::string> cursor;
  };

  struct AuditRecord {
    Event event;
    uint64_t block_index = 0;
    uint32_t position = 0;
    std::string block_hash;
  };

  struct AuditPage {
    std::vector<AuditRecord> records;
    std::optional<std::string> next_cursor;
    bool has_more = false;
  };

  struct LedgerStats {
    uint64_t block_count = 0;
    uint64_t tip_index = 0;
    std::string tip_hash;
    uint64_t transaction_count = 0;
    std::map<EventKind, uint64_t> transactions_by_kind;
    uint64_t pending_count = 0;
    uint64_t storage_bytes = 0;
    std::optional<uint64_t> first_block_at;
    std::optional<uint64_t> last_block_at;
    uint32_t difficulty = 0;
    std::optional<storage::Checkpoint> checkpoint;
    std::optional<VerificationReport> last_verification;
    MinerStats miner;
  };

  enum class ExportFormat { Json, Csv };

  std::optional<ExportFormat> parse_export_format(std::string_view name);

  // Opaque, hex encoded position of the last record of a page.
  std::string encode_cursor(uint64_t block_index, uint32_t position);
  // Throws InvalidCursorError.
  std::pair<uint64_t, uint32_t> decode_cursor(std::string_view cursor);

  // Read side of the ledger. Serves committed state only and never waits on the miner.
  class QueryService {
    public:
      QueryService(const storage::ChainStore& store, const Verifier& verifier, uint32_t difficulty);

      AuditPage get_audit_trail(const AuditQuery& query) const;

      // Storage and verification figures; miner counters are filled in by the owner.
      LedgerStats get_stats() const;

      void export_chain(ExportFormat format, std::ostream& out) const;

    private:
      void export_json(std::ostream& out) const;
      void export_csv(std::ostream& out) const;

      const storage::ChainStore& store_;
      const Verifier& verifier_;
      uint32_t difficulty_;
  };
}

#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "auditchain/core/errors.hpp"
#include "auditchain/core/logging.hpp"
#include "auditchain/storage/chain_store.hpp"

namespace auditchain::core {
  struct VerificationReport {
    bool is_valid = false;
    IntegrityCheck failed_check = IntegrityCheck::None;
    std::optional<uint64_t> block_index;   // first offending block
    uint64_t chain_length = 0;             // blocks checked
    uint64_t transaction_count = 0;
    std::optional<uint64_t> first_index;   // 0, or the checkpoint after a prune
    uint64_t checked_at = 0;               // unix ms
    std::string message;
  };

  // Walks the persisted chain and re-derives every hash. Reports the first violation;
  // never repairs anything. `difficulty` applies only to blocks the store has no
  // difficulty epoch for.
  class Verifier {
    public:
      Verifier(const storage::ChainStore& store, uint32_t difficulty, std::shared_ptr<logging::log> log);

      VerificationReport verify_chain();
      std::optional<VerificationReport> last_report() const;

      // Throws ChainIntegrityError when the chain does not verify.
      void ensure_intact();

    private:
      const storage::ChainStore& store_;
      uint32_t difficulty_;
      std::shared_ptr<logging::log> log_;
      mutable std::mutex report_mutex_;
      std::optional<VerificationReport> last_report_;
  };
}

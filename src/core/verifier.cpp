#include "auditchain/core/verifier.hpp"
#include "auditchain/core/block.hpp"
#include "auditchain/core/pow.hpp"
#include "auditchain/core/serializer.hpp"

#include <span>
#include <vector>

namespace auditchain::core {
  namespace {
    std::optional<std::string> index_mismatch(const std::vector<Event>& transactions,
                                              const std::vector<storage::IndexRow>& rows) {
      if (rows.size() != transactions.size()) {
        return std::to_string(rows.size()) + " index rows for " + std::to_string(transactions.size()) + " events";
      }
      for (size_t i = 0; i < rows.size(); ++i) {
        const auto& row = rows[i];
        const auto& event = transactions[i];
        if (row.position != i || row.event_id != event.id || row.kind != event.kind() ||
            row.created_at != event.created_at) {
          return "index row " + std::to_string(row.position) + " (" + row.event_id + ") does not match event " +
                 event.id + " at position " + std::to_string(i);
        }
      }
      return std::nullopt;
    }
  }

  Verifier::Verifier(const storage::ChainStore& store, uint32_t difficulty, std::shared_ptr<logging::log> log)
    : store_(store), difficulty_(difficulty), log_(std::move(log)) {}

  VerificationReport Verifier::verify_chain() {
    VerificationReport report;
    auto fail = [&report](IntegrityCheck check, uint64_t index, const std::string& detail) {
      report.is_valid = false;
      report.failed_check = check;
      report.block_index = index;
      report.message = "block " + std::to_string(index) + ": " + std::string(to_string(check)) + ": " + detail;
    };

    auto cursor = store_.iterate();
    const auto& checkpoint = cursor.checkpoint();
    const auto& schedule = cursor.difficulty_schedule();
    uint64_t expected_index = checkpoint ? checkpoint->index : 0;
    report.first_index = expected_index;
    std::string previous_hash;
    bool ok = true;

    while (ok) {
      auto block = cursor.next();
      if (!block) break;
      std::span<const uint8_t> tx_bytes(block->serialized_transactions.data(), block->serialized_transactions.size());

      auto recomputed = compute_block_hash(block->index, block->timestamp, tx_bytes, block->previous_hash, block->nonce);
      // Each block is held to the difficulty in force when it was mined.
      auto difficulty = storage::difficulty_at(schedule, block->index).value_or(difficulty_);
      if (recomputed != block->hash) {
        fail(IntegrityCheck::HashMismatch, block->index, "stored " + block->hash + ", computed " + recomputed);
        ok = false;
      } else if (block->index > 0 && !pow::meets_difficulty(difficulty, block->hash)) {
        fail(IntegrityCheck::InsufficientWork, block->index,
             "hash does not have " + std::to_string(difficulty) + " leading zero digits");
        ok = false;
      } else if (report.chain_length == 0 && checkpoint &&
                 (block->index != checkpoint->index || block->hash != checkpoint->hash)) {
        fail(IntegrityCheck::CheckpointMismatch, block->index,
             "checkpoint is block " + std::to_string(checkpoint->index) + " " + checkpoint->hash);
        ok = false;
      } else if (report.chain_length == 0 && !checkpoint && block->previous_hash != GENESIS_PREVIOUS_HASH) {
        fail(IntegrityCheck::BrokenLink, block->index, "first block does not start from genesis");
        ok = false;
      } else if (report.chain_length > 0 && block->previous_hash != previous_hash) {
        fail(IntegrityCheck::BrokenLink, block->index, "previous_hash does not match block " +
             std::to_string(expected_index - 1));
        ok = false;
      } else if (block->index != expected_index) {
        fail(IntegrityCheck::IndexGap, block->index, "expected index " + std::to_string(expected_index));
        ok = false;
      } else {
        std::vector<Event> transactions;
        try {
          transactions = deserialize_transactions(tx_bytes);
        } catch (const SerializeError& e) {
          fail(IntegrityCheck::Unreadable, block->index, e.what());
          ok = false;
        }
        if (ok) {
          if (auto detail = index_mismatch(transactions, cursor.index_rows(block->index))) {
            fail(IntegrityCheck::IndexMismatch, block->index, *detail);
            ok = false;
          } else {
            report.transaction_count += transactions.size();
          }
        }
      }

      if (ok) {
        previous_hash = block->hash;
        ++expected_index;
        ++report.chain_length;
      }
    }

    if (ok && report.chain_length == 0) {
      report.failed_check = IntegrityCheck::IndexGap;
      report.message = "chain has no blocks";
      ok = false;
    }
    if (ok) {
      // Rows pointing at no retained block would still block their ids from being recorded.
      auto rows = cursor.index_row_count();
      if (rows != report.transaction_count) {
        report.failed_check = IntegrityCheck::IndexMismatch;
        report.message = std::string(to_string(IntegrityCheck::IndexMismatch)) + ": " + std::to_string(rows) +
                         " index rows for " + std::to_string(report.transaction_count) + " committed events";
        ok = false;
      }
    }
    report.is_valid = ok;
    report.checked_at = unix_time_ms();

    if (ok) {
      log_->info("verifier: chain valid,", report.chain_length, "blocks,", report.transaction_count, "events");
    } else {
      log_->error("verifier: chain invalid:", report.message);
    }

    std::lock_guard<std::mutex> lock(report_mutex_);
    last_report_ = report;
    return report;
  }

  std::optional<VerificationReport> Verifier::last_report() const {
    std::lock_guard<std::mutex> lock(report_mutex_);
    return last_report_;
  }

  void Verifier::ensure_intact() {
    auto report = verify_chain();
    if (!report.is_valid) {
      throw ChainIntegrityError(report.failed_check, report.block_index, report.message);
    }
  }
}

#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace auditchain::core {

  struct LedgerError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  // Malformed or incomplete event; never enters the pending pool.
  struct InvalidEventError : LedgerError {
    using LedgerError::LedgerError;
  };

  // The durable pool append failed. Transient; the caller may retry.
  struct QueueWriteError : LedgerError {
    using LedgerError::LedgerError;
  };

  // A storage operation failed. Nothing was committed.
  struct PersistenceError : LedgerError {
    using LedgerError::LedgerError;
  };

  struct InvalidCursorError : LedgerError {
    using LedgerError::LedgerError;
  };

  struct MiningTimeoutError : LedgerError {
    MiningTimeoutError(uint64_t attempts, std::chrono::milliseconds elapsed)
      : LedgerError("mining: no valid nonce after " + std::to_string(attempts) +
                    " attempts in " + std::to_string(elapsed.count()) + "ms"),
        attempts(attempts), elapsed(elapsed) {}

    uint64_t attempts;
    std::chrono::milliseconds elapsed;
  };

  struct MiningCancelledError : LedgerError {
    using LedgerError::LedgerError;
  };

  enum class IntegrityCheck {
    None = 0,
    HashMismatch,
    InsufficientWork,
    BrokenLink,
    IndexGap,
    CheckpointMismatch,
    Unreadable,
    // committed_events rows disagree with the block's own transactions
    IndexMismatch,
  };

  std::string_view to_string(IntegrityCheck check);

  struct ChainIntegrityError : LedgerError {
    ChainIntegrityError(IntegrityCheck check, std::optional<uint64_t> block_index, const std::string& what)
      : LedgerError(what), check(check), block_index(block_index) {}

    IntegrityCheck check;
    std::optional<uint64_t> block_index;
  };
}

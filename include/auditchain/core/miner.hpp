#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include "auditchain/core/block.hpp"
#include "auditchain/core/logging.hpp"
#include "auditchain/storage/chain_store.hpp"

namespace auditchain::core {
  using MinerProgressCallback = std::function<void(uint64_t, uint32_t, const std::string&)>;

  struct MiningLimits {
    uint32_t difficulty = 0;
    uint64_t max_attempts = 0;   // 0 = bounded by the timeout only
    std::chrono::milliseconds timeout{30000};
  };

// Searches nonces from 0 upward until the candidate's hash has `difficulty` leading zero
// hex digits. Returns the sealed block (nonce and hash set). Throws MiningTimeoutError when
// the attempt ceiling or the timeout is reached and MiningCancelledError on cancel.
  Block mine_block(Block candidate, const MiningLimits& limits, const std::atomic<bool>& cancel_flag,
                   MinerProgressCallback on_progress = nullptr, uint64_t tick_every = 50000);

  enum class MineOutcome {
    Committed,
    NothingPending,
    TimedOut,
    PersistenceFailed,
    Halted,
    Cancelled,
  };

  std::string_view to_string(MineOutcome outcome);

  struct MineResult {
    MineOutcome outcome = MineOutcome::NothingPending;
    std::optional<Block> block;
    std::string message;
  };

  struct MinerConfig {
    std::chrono::seconds mining_interval{300};
    uint32_t difficulty = 2;
    size_t max_block_size = 500;
    uint64_t max_nonce_attempts = 0;
    std::chrono::milliseconds mining_timeout{30000};
  };

  struct MinerStats {
    uint64_t blocks_mined = 0;
    uint64_t timeouts = 0;
    uint64_t cancellations = 0;
    uint64_t persistence_failures = 0;
    uint32_t consecutive_failures = 0;
    std::optional<uint64_t> last_block_at;
    bool running = false;
    bool halted = false;
    std::string halt_reason;
  };

  inline constexpr uint32_t MAX_BACKOFF_EXPONENT = 6;

  // Drains the pending pool into proof-of-work blocks, either on demand or from a
  // background timer. Only one attempt runs at a time.
  class Miner {
    public:
      Miner(storage::ChainStore& store, MinerConfig config, std::shared_ptr<logging::log> log);
      ~Miner();

      Miner(const Miner&) = delete;
      Miner& operator=(const Miner&) = delete;

      MineResult force_mine();

      void start();
      // Cancels an in-flight search and joins the background thread.
      void stop();
      bool running() const;

      void halt(const std::string& reason);
      void clear_halt();
      bool halted() const;

      MinerStats stats() const;

      // Interval until the next background attempt, backed off after persistence failures.
      std::chrono::milliseconds next_delay() const;

    private:
      void run();
      MineResult mine_once();

      storage::ChainStore& store_;
      MinerConfig config_;
      std::shared_ptr<logging::log> log_;

      std::mutex mining_mutex_;
      mutable std::mutex state_mutex_;
      std::condition_variable wake_;
      std::atomic<bool> cancel_{false};
      bool stop_requested_ = false;
      MinerStats stats_;
      std::thread thread_;
  };
}

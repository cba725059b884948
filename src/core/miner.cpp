#include "auditchain/core/miner.hpp"
#include "auditchain/core/errors.hpp"
#include "auditchain/core/hash.hpp"
#include "auditchain/core/pow.hpp"
#include "auditchain/core/serializer.hpp"

#include <algorithm>
#include <span>

namespace auditchain::core {
  namespace {
    // The clock and the cancel flag are polled once per this many attempts.
    constexpr uint64_t poll_every = 4096;
  }

  Block mine_block(Block candidate, const MiningLimits& limits, const std::atomic<bool>& cancel_flag,
                   MinerProgressCallback on_progress, uint64_t tick_every) {
    auto started = std::chrono::steady_clock::now();
    auto elapsed = [&]() {
      return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    };

    auto tx_bytes = candidate.serialize_transactions();
    auto preimage = block_preimage(candidate.index, candidate.timestamp, tx_bytes, candidate.previous_hash, 0);

    uint64_t attempts = 0;
    for (uint64_t nonce = 0;; ++nonce) {
      if (attempts % poll_every == 0) {
        if (cancel_flag) throw MiningCancelledError("mining: cancelled after " + std::to_string(attempts) + " attempts");
        if (attempts > 0 && elapsed() >= limits.timeout) throw MiningTimeoutError(attempts, elapsed());
      }

      write_preimage_nonce(preimage, nonce);
      auto hash = sha256(std::span<const uint8_t>(preimage.data(), preimage.size()));
      ++attempts;

      auto leading_zeros = pow::leading_zero_nibbles(hash);
      if (leading_zeros >= limits.difficulty) {
        candidate.nonce = nonce;
        candidate.hash = to_hex(std::span<const uint8_t>(hash.data(), hash.size()));
        return candidate;
      }

      if (on_progress && tick_every > 0 && attempts % tick_every == 0) {
        on_progress(attempts, leading_zeros, to_hex(std::span<const uint8_t>(hash.data(), hash.size())));
      }

      if (limits.max_attempts != 0 && attempts >= limits.max_attempts) {
        throw MiningTimeoutError(attempts, elapsed());
      }
    }
  }

  std::string_view to_string(MineOutcome outcome) {
    switch (outcome) {
      case MineOutcome::Committed: return "committed";
      case MineOutcome::NothingPending: return "nothing_pending";
      case MineOutcome::TimedOut: return "timed_out";
      case MineOutcome::PersistenceFailed: return "persistence_failed";
      case MineOutcome::Halted: return "halted";
      case MineOutcome::Cancelled: return "cancelled";
    }
    return "unknown";
  }

  Miner::Miner(storage::ChainStore& store, MinerConfig config, std::shared_ptr<logging::log> log)
    : store_(store), config_(config), log_(std::move(log)) {}

  Miner::~Miner() {
    stop();
  }

  MineResult Miner::force_mine() {
    std::lock_guard<std::mutex> mining_lock(mining_mutex_);
    auto result = mine_once();

    std::lock_guard<std::mutex> lock(state_mutex_);
    switch (result.outcome) {
      case MineOutcome::Committed:
        ++stats_.blocks_mined;
        stats_.last_block_at = result.block->timestamp;
        stats_.consecutive_failures = 0;
        break;
      case MineOutcome::NothingPending:
        stats_.consecutive_failures = 0;
        break;
      case MineOutcome::TimedOut:
        ++stats_.timeouts;
        break;
      case MineOutcome::Cancelled:
        ++stats_.cancellations;
        break;
      case MineOutcome::PersistenceFailed:
        ++stats_.persistence_failures;
        stats_.consecutive_failures = std::min(stats_.consecutive_failures + 1, MAX_BACKOFF_EXPONENT);
        break;
      case MineOutcome::Halted:
        break;
    }
    return result;
  }

  MineResult Miner::mine_once() {
    if (halted()) {
      return MineResult{.outcome = MineOutcome::Halted, .block = std::nullopt, .message = stats().halt_reason};
    }

    try {
      auto events = store_.pending(config_.max_block_size);
      if (events.empty()) {
        log_->debug("miner: nothing pending");
        return MineResult{.outcome = MineOutcome::NothingPending, .block = std::nullopt, .message = {}};
      }

      auto tip = store_.get_tip();
      auto count = events.size();
      auto candidate = build_candidate_block(tip, std::move(events), unix_time_ms());
      log_->debug("miner: mining block", candidate.index, "with", count, "events at difficulty", config_.difficulty);

      MiningLimits limits{
        .difficulty = config_.difficulty,
        .max_attempts = config_.max_nonce_attempts,
        .timeout = config_.mining_timeout,
      };
      auto block = mine_block(std::move(candidate), limits, cancel_,
                              [this](uint64_t attempts, uint32_t zeros, const std::string& hash) {
                                log_->trace("miner:", attempts, "attempts, best", zeros, "zeros, last", hash);
                              });

      store_.append(block);
      log_->info("miner: committed block", block.index, "hash", block.hash, "nonce", block.nonce,
                 "events", block.transactions.size());
      return MineResult{.outcome = MineOutcome::Committed, .block = std::move(block), .message = {}};
    } catch (const MiningTimeoutError& e) {
      log_->warn(e.what());
      return MineResult{.outcome = MineOutcome::TimedOut, .block = std::nullopt, .message = e.what()};
    } catch (const MiningCancelledError& e) {
      log_->info(e.what());
      return MineResult{.outcome = MineOutcome::Cancelled, .block = std::nullopt, .message = e.what()};
    } catch (const ChainIntegrityError& e) {
      log_->error("miner:", e.what());
      halt(e.what());
      return MineResult{.outcome = MineOutcome::Halted, .block = std::nullopt, .message = e.what()};
    } catch (const PersistenceError& e) {
      log_->error("miner:", e.what());
      return MineResult{.outcome = MineOutcome::PersistenceFailed, .block = std::nullopt, .message = e.what()};
    } catch (const SerializeError& e) {
      log_->error("miner: unreadable pending event:", e.what());
      return MineResult{.outcome = MineOutcome::PersistenceFailed, .block = std::nullopt, .message = e.what()};
    } catch (const std::exception& e) {
      // Hashing, randomness or an unready store. Nothing was committed; retried with backoff.
      log_->error("miner: mining failed:", e.what());
      return MineResult{.outcome = MineOutcome::PersistenceFailed, .block = std::nullopt, .message = e.what()};
    }
  }

  void Miner::start() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (thread_.joinable()) return;
    stop_requested_ = false;
    cancel_ = false;
    stats_.running = true;
    thread_ = std::thread([this]() { run(); });
    log_->info("miner: started, interval", config_.mining_interval.count(), "s");
  }

  void Miner::stop() {
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (!thread_.joinable()) return;
      stop_requested_ = true;
      cancel_ = true;
    }
    wake_.notify_all();
    thread_.join();

    std::lock_guard<std::mutex> lock(state_mutex_);
    stats_.running = false;
    cancel_ = false;
    log_->info("miner: stopped");
  }

  bool Miner::running() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return stats_.running;
  }

  void Miner::halt(const std::string& reason) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!stats_.halted) log_->error("miner: halted:", reason);
    stats_.halted = true;
    stats_.halt_reason = reason;
  }

  void Miner::clear_halt() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (stats_.halted) log_->warn("miner: integrity halt cleared");
    stats_.halted = false;
    stats_.halt_reason.clear();
  }

  bool Miner::halted() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return stats_.halted;
  }

  MinerStats Miner::stats() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return stats_;
  }

  std::chrono::milliseconds Miner::next_delay() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto base = std::chrono::duration_cast<std::chrono::milliseconds>(config_.mining_interval);
    return base * (int64_t{1} << stats_.consecutive_failures);
  }

  void Miner::run() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    while (!stop_requested_) {
      auto base = std::chrono::duration_cast<std::chrono::milliseconds>(config_.mining_interval);
      auto delay = base * (int64_t{1} << stats_.consecutive_failures);
      if (stats_.consecutive_failures > 0) {
        log_->warn("miner: backing off", delay.count(), "ms after", stats_.consecutive_failures, "failures");
      }
      wake_.wait_for(lock, delay, [this]() { return stop_requested_; });
      if (stop_requested_) break;
      if (stats_.halted) continue;

      lock.unlock();
      force_mine();
      lock.lock();
    }
  }
}

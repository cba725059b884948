#include "auditchain/core/pending_pool.hpp"
#include "auditchain/core/errors.hpp"

namespace auditchain::core {

  std::string_view to_string(RecordStatus status) {
    switch (status) {
      case RecordStatus::Queued: return "queued";
      case RecordStatus::Duplicate: return "duplicate";
      case RecordStatus::KindDisabled: return "kind_disabled";
    }
    return "unknown";
  }

  PendingPool::PendingPool(storage::ChainStore& store, std::set<EventKind> record_types,
                           std::shared_ptr<logging::log> log)
    : store_(store), record_types_(std::move(record_types)), log_(std::move(log)) {}

  RecordStatus PendingPool::record(const Event& event) {
    validate_event(event);

    if (!records(event.kind())) {
      log_->debug("pool: skipping", to_string(event.kind()), "event", event.id, "(kind disabled)");
      return RecordStatus::KindDisabled;
    }

    storage::EnqueueResult result;
    try {
      result = store_.enqueue(event);
    } catch (const PersistenceError& e) {
      log_->error("pool: failed to queue event", event.id, ":", e.what());
      throw QueueWriteError("queue write failed for event " + event.id + ": " + e.what());
    }

    if (result == storage::EnqueueResult::Duplicate) {
      log_->debug("pool: duplicate event", event.id);
      return RecordStatus::Duplicate;
    }
    log_->trace("pool: queued", to_string(event.kind()), "event", event.id);
    return RecordStatus::Queued;
  }

  std::vector<Event> PendingPool::peek_pending(size_t limit) const {
    return store_.pending(limit);
  }

  uint64_t PendingPool::pending_count() const {
    return store_.pending_count();
  }
}

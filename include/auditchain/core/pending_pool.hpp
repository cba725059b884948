#pragma once
#include <cstdint>
#include <memory>
#include <set>
#include <string_view>
#include <vector>
#include "auditchain/core/event.hpp"
#include "auditchain/core/logging.hpp"
#include "auditchain/storage/chain_store.hpp"

namespace auditchain::core {
  enum class RecordStatus {
    Queued,
    Duplicate,      // id already pending, committed or pruned
    KindDisabled,   // kind not in record_types
  };

  std::string_view to_string(RecordStatus status);

  // Validated, durable intake of events waiting to be mined.
  class PendingPool {
    public:
      PendingPool(storage::ChainStore& store, std::set<EventKind> record_types, std::shared_ptr<logging::log> log);

      // Throws InvalidEventError or QueueWriteError. Safe to call from many threads.
      RecordStatus record(const Event& event);

      std::vector<Event> peek_pending(size_t limit) const;
      uint64_t pending_count() const;

      bool records(EventKind kind) const { return record_types_.contains(kind); }

    private:
      storage::ChainStore& store_;
      std::set<EventKind> record_types_;
      std::shared_ptr<logging::log> log_;
  };
}

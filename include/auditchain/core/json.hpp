#pragma once
#include <json/json.h>

#include <string>
#include "auditchain/core/block.hpp"
#include "auditchain/core/event.hpp"
#include "auditchain/core/miner.hpp"
#include "auditchain/core/query.hpp"
#include "auditchain/core/verifier.hpp"
#include "auditchain/storage/chain_store.hpp"

namespace auditchain::core {
  Json::Value to_json(const EventPayload& payload);
  Json::Value to_json(const Event& event);
  Json::Value to_json(const Block& block);
  Json::Value to_json(const storage::Checkpoint& checkpoint);
  Json::Value to_json(const AuditRecord& record);
  Json::Value to_json(const AuditPage& page);
  Json::Value to_json(const VerificationReport& report);
  Json::Value to_json(const MinerStats& stats);
  Json::Value to_json(const MineResult& result);
  Json::Value to_json(const LedgerStats& stats);
  Json::Value to_json(const storage::PruneResult& result);

  // Single-line rendering, used for CSV payload cells.
  std::string write_compact(const Json::Value& value);
  std::string write_styled(const Json::Value& value);
}

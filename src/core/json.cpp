#include "auditchain/core/json.hpp"
#include "auditchain/core/errors.hpp"
#include "auditchain/core/variant_overloaded.hpp"

namespace auditchain::core {
  namespace {
    Json::Value u64(uint64_t value) {
      return Json::Value(static_cast<Json::UInt64>(value));
    }

    template <typename T>
    Json::Value optional_u64(const std::optional<T>& value) {
      return value ? u64(*value) : Json::Value(Json::nullValue);
    }
  }

  Json::Value to_json(const EventPayload& payload) {
    Json::Value data(Json::objectValue);
    std::visit(overloaded{
      [&](const TradeEvent& e) {
        data["symbol"] = e.symbol;
        data["side"] = std::string(to_string(e.side));
        data["quantity"] = e.quantity;
        data["price"] = e.price;
        data["order_id"] = e.order_id;
      },
      [&](const OrderEvent& e) {
        data["order_id"] = e.order_id;
        data["symbol"] = e.symbol;
        data["side"] = std::string(to_string(e.side));
        data["order_type"] = e.order_type;
        data["quantity"] = e.quantity;
        data["limit_price"] = e.limit_price ? Json::Value(*e.limit_price) : Json::Value(Json::nullValue);
        data["status"] = e.status;
      },
      [&](const SystemChangeEvent& e) {
        data["component"] = e.component;
        data["change_type"] = e.change_type;
        data["description"] = e.description;
      },
      [&](const LoginEvent& e) {
        data["username"] = e.username;
        data["success"] = e.success;
        data["source"] = e.source;
      },
      [&](const ConfigChangeEvent& e) {
        data["component"] = e.component;
        data["key"] = e.key;
        data["old_value"] = e.old_value;
        data["new_value"] = e.new_value;
      },
    }, payload);
    return data;
  }

  Json::Value to_json(const Event& event) {
    Json::Value value(Json::objectValue);
    value["id"] = event.id;
    value["kind"] = std::string(to_string(event.kind()));
    value["created_at"] = u64(event.created_at);
    value["data"] = to_json(event.payload);
    return value;
  }

  Json::Value to_json(const Block& block) {
    Json::Value value(Json::objectValue);
    value["index"] = u64(block.index);
    value["timestamp"] = u64(block.timestamp);
    value["previous_hash"] = block.previous_hash;
    value["nonce"] = u64(block.nonce);
    value["hash"] = block.hash;
    Json::Value transactions(Json::arrayValue);
    for (const auto& event : block.transactions) transactions.append(to_json(event));
    value["transactions"] = transactions;
    return value;
  }

  Json::Value to_json(const storage::Checkpoint& checkpoint) {
    Json::Value value(Json::objectValue);
    value["index"] = u64(checkpoint.index);
    value["hash"] = checkpoint.hash;
    value["pruned_at"] = u64(checkpoint.pruned_at);
    return value;
  }

  Json::Value to_json(const AuditRecord& record) {
    Json::Value value = to_json(record.event);
    value["block_index"] = u64(record.block_index);
    value["position"] = record.position;
    value["block_hash"] = record.block_hash;
    return value;
  }

  Json::Value to_json(const AuditPage& page) {
    Json::Value value(Json::objectValue);
    Json::Value records(Json::arrayValue);
    for (const auto& record : page.records) records.append(to_json(record));
    value["records"] = records;
    value["next_cursor"] = page.next_cursor ? Json::Value(*page.next_cursor) : Json::Value(Json::nullValue);
    value["has_more"] = page.has_more;
    return value;
  }

  Json::Value to_json(const VerificationReport& report) {
    Json::Value value(Json::objectValue);
    value["is_valid"] = report.is_valid;
    value["chain_length"] = u64(report.chain_length);
    value["transaction_count"] = u64(report.transaction_count);
    value["first_index"] = optional_u64(report.first_index);
    value["checked_at"] = u64(report.checked_at);
    if (!report.is_valid) {
      value["failed_check"] = std::string(to_string(report.failed_check));
      value["block_index"] = optional_u64(report.block_index);
      value["message"] = report.message;
    }
    return value;
  }

  Json::Value to_json(const MinerStats& stats) {
    Json::Value value(Json::objectValue);
    value["running"] = stats.running;
    value["halted"] = stats.halted;
    if (stats.halted) value["halt_reason"] = stats.halt_reason;
    value["blocks_mined"] = u64(stats.blocks_mined);
    value["timeouts"] = u64(stats.timeouts);
    value["cancellations"] = u64(stats.cancellations);
    value["persistence_failures"] = u64(stats.persistence_failures);
    value["consecutive_failures"] = stats.consecutive_failures;
    value["last_block_at"] = optional_u64(stats.last_block_at);
    return value;
  }

  Json::Value to_json(const MineResult& result) {
    Json::Value value(Json::objectValue);
    value["outcome"] = std::string(to_string(result.outcome));
    if (result.block) value["block"] = to_json(*result.block);
    if (!result.message.empty()) value["message"] = result.message;
    return value;
  }

  Json::Value to_json(const LedgerStats& stats) {
    Json::Value value(Json::objectValue);
    value["block_count"] = u64(stats.block_count);
    value["tip_index"] = u64(stats.tip_index);
    value["tip_hash"] = stats.tip_hash;
    value["transaction_count"] = u64(stats.transaction_count);
    Json::Value by_kind(Json::objectValue);
    for (const auto& [kind, count] : stats.transactions_by_kind) by_kind[std::string(to_string(kind))] = u64(count);
    value["transactions_by_kind"] = by_kind;
    value["pending_count"] = u64(stats.pending_count);
    value["storage_bytes"] = u64(stats.storage_bytes);
    value["first_block_at"] = optional_u64(stats.first_block_at);
    value["last_block_at"] = optional_u64(stats.last_block_at);
    value["difficulty"] = stats.difficulty;
    value["checkpoint"] = stats.checkpoint ? to_json(*stats.checkpoint) : Json::Value(Json::nullValue);
    value["last_verification"] =
      stats.last_verification ? to_json(*stats.last_verification) : Json::Value(Json::nullValue);
    value["miner"] = to_json(stats.miner);
    return value;
  }

  Json::Value to_json(const storage::PruneResult& result) {
    Json::Value value(Json::objectValue);
    value["blocks_removed"] = u64(result.blocks_removed);
    value["events_removed"] = u64(result.events_removed);
    value["checkpoint"] = result.checkpoint ? to_json(*result.checkpoint) : Json::Value(Json::nullValue);
    return value;
  }

  std::string write_compact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
  }

  std::string write_styled(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
  }
}

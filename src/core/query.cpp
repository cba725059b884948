#include "auditchain/core/query.hpp"
#include "auditchain/core/errors.hpp"
#include "auditchain/core/hash.hpp"
#include "auditchain/core/json.hpp"
#include "auditchain/core/serializer.hpp"

#include <algorithm>
#include <memory>

namespace auditchain::core {
  namespace {
    constexpr uint8_t cursor_version = 1;

    // RFC 4180 quoting for a single CSV cell.
    std::string csv_cell(const std::string& value) {
      if (value.find_first_of(",\"\r\n") == std::string::npos) return value;
      std::string quoted = "\"";
      for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
      }
      quoted += '"';
      return quoted;
    }

    // Decodes every block once and rewinds, so an unreadable block throws before
    // anything has been written.
    void ensure_decodable(storage::BlockCursor& cursor) {
      while (auto stored = cursor.next()) {
        stored->to_block();
      }
      cursor.reset();
    }
  }

  std::optional<ExportFormat> parse_export_format(std::string_view name) {
    if (name == "json") return ExportFormat::Json;
    if (name == "csv") return ExportFormat::Csv;
    return std::nullopt;
  }

  std::string encode_cursor(uint64_t block_index, uint32_t position) {
    ByteWriter writer;
    writer.write_u8(cursor_version);
    writer.write_u64(block_index);
    writer.write_u32(position);
    auto bytes = writer.take();
    return to_hex(std::span<const uint8_t>(bytes.data(), bytes.size()));
  }

  std::pair<uint64_t, uint32_t> decode_cursor(std::string_view cursor) {
    auto bytes = from_hex(cursor);
    if (!bytes) throw InvalidCursorError("invalid cursor: not hex");
    try {
      ByteReader reader(std::span<const uint8_t>(bytes->data(), bytes->size()));
      if (reader.read_u8() != cursor_version) throw InvalidCursorError("invalid cursor: unknown version");
      auto block_index = reader.read_u64();
      auto position = reader.read_u32();
      reader.expect_end();
      return {block_index, position};
    } catch (const SerializeError& e) {
      throw InvalidCursorError(std::string("invalid cursor: ") + e.what());
    }
  }

  QueryService::QueryService(const storage::ChainStore& store, const Verifier& verifier, uint32_t difficulty)
    : store_(store), verifier_(verifier), difficulty_(difficulty) {}

  AuditPage QueryService::get_audit_trail(const AuditQuery& query) const {
    storage::EventFilter filter;
    filter.kind = query.kind;
    filter.start_time = query.start_time;
    filter.end_time = query.end_time;
    if (query.cursor) filter.after = decode_cursor(*query.cursor);

    auto limit = std::clamp<size_t>(query.limit, 1, MAX_PAGE_SIZE);
    // One extra row tells whether another page exists.
    filter.limit = limit + 1;

    auto rows = store_.query_events(filter);

    AuditPage page;
    page.has_more = rows.size() > limit;
    if (page.has_more) rows.resize(limit);
    page.records.reserve(rows.size());
    for (auto& row : rows) {
      page.records.push_back(AuditRecord{
        .event = std::move(row.event),
        .block_index = row.block_index,
        .position = row.position,
        .block_hash = std::move(row.block_hash),
      });
    }
    if (!page.records.empty()) {
      const auto& last = page.records.back();
      page.next_cursor = encode_cursor(last.block_index, last.position);
    }
    return page;
  }

  LedgerStats QueryService::get_stats() const {
    LedgerStats stats;
    stats.block_count = store_.block_count();
    if (auto tip = store_.get_stored_tip()) {
      stats.tip_index = tip->index;
      stats.tip_hash = tip->hash;
    }
    stats.transaction_count = store_.transaction_count();
    stats.transactions_by_kind = store_.count_by_kind();
    stats.pending_count = store_.pending_count();
    stats.storage_bytes = store_.storage_bytes();
    if (auto range = store_.timestamp_range()) {
      stats.first_block_at = range->first;
      stats.last_block_at = range->second;
    }
    stats.difficulty = difficulty_;
    stats.checkpoint = store_.checkpoint();
    stats.last_verification = verifier_.last_report();
    return stats;
  }

  void QueryService::export_chain(ExportFormat format, std::ostream& out) const {
    switch (format) {
      case ExportFormat::Json:
        export_json(out);
        break;
      case ExportFormat::Csv:
        export_csv(out);
        break;
    }
  }

  void QueryService::export_json(std::ostream& out) const {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());

    auto cursor = store_.iterate();
    const auto& checkpoint = cursor.checkpoint();
    ensure_decodable(cursor);

    // Blocks are written one at a time so the whole chain is never held in memory.
    out << "{\"difficulty\":" << difficulty_ << ",\"checkpoint\":";
    writer->write(checkpoint ? to_json(*checkpoint) : Json::Value(Json::nullValue), &out);
    out << ",\"chain\":[";
    bool first = true;
    while (auto stored = cursor.next()) {
      if (!first) out << ",";
      first = false;
      writer->write(to_json(stored->to_block()), &out);
    }
    out << "]}\n";
  }

  void QueryService::export_csv(std::ostream& out) const {
    auto cursor = store_.iterate();
    ensure_decodable(cursor);
    out << "block_index,block_hash,position,event_id,kind,created_at,payload\n";
    while (auto stored = cursor.next()) {
      auto block = stored->to_block();
      for (size_t position = 0; position < block.transactions.size(); ++position) {
        const auto& event = block.transactions[position];
        out << block.index << ',' << block.hash << ',' << position << ',' << csv_cell(event.id) << ','
            << to_string(event.kind()) << ',' << event.created_at << ','
            << csv_cell(write_compact(to_json(event.payload))) << '\n';
      }
    }
  }
}

#include "auditchain/core/event.hpp"
#include "auditchain/core/errors.hpp"
#include "auditchain/core/hash.hpp"
#include "auditchain/core/serializer.hpp"
#include "auditchain/core/variant_overloaded.hpp"

#include <array>
#include <chrono>
#include <cctype>
#include <cmath>

namespace auditchain::core {

  namespace {
    constexpr uint8_t EVENT_TAG = 0xE1;
    constexpr uint8_t EVENT_FORMAT = 0x01;
    constexpr size_t MAX_ID_LENGTH = 128;
    constexpr size_t MAX_SYMBOL_LENGTH = 32;
    constexpr size_t MAX_FIELD_LENGTH = 4096;

    [[noreturn]] void reject(const Event& event, const std::string& reason) {
      throw InvalidEventError(std::string(to_string(event.kind())) + " event '" + event.id + "': " + reason);
    }

    void require_text(const Event& event, std::string_view field, const std::string& value) {
      if (value.empty()) reject(event, "missing required field '" + std::string(field) + "'");
      if (value.size() > MAX_FIELD_LENGTH) reject(event, "field '" + std::string(field) + "' is too long");
    }

    void limit_text(const Event& event, std::string_view field, const std::string& value) {
      if (value.size() > MAX_FIELD_LENGTH) reject(event, "field '" + std::string(field) + "' is too long");
    }

    void require_positive(const Event& event, std::string_view field, double value) {
      if (!std::isfinite(value) || value <= 0) {
        reject(event, "field '" + std::string(field) + "' must be a positive finite number");
      }
    }

    void require_symbol(const Event& event, const std::string& symbol) {
      require_text(event, "symbol", symbol);
      if (symbol.size() > MAX_SYMBOL_LENGTH) reject(event, "field 'symbol' is too long");
      for (unsigned char c : symbol) {
        if (std::isspace(c) || !std::isprint(c)) reject(event, "field 'symbol' contains invalid characters");
      }
    }

    void require_side(const Event& event, Side side) {
      if (side != Side::Buy && side != Side::Sell) reject(event, "field 'side' must be buy or sell");
    }

    bool order_type_needs_limit(std::string_view order_type) {
      return order_type == "limit" || order_type == "stop_limit";
    }

    bool known_order_type(std::string_view order_type) {
      static constexpr std::array<std::string_view, 5> types = {
        "market", "limit", "stop", "stop_limit", "trailing_stop"};
      for (auto type : types) if (type == order_type) return true;
      return false;
    }
  }

  std::string_view to_string(EventKind kind) {
    switch (kind) {
      case EventKind::Trade: return "trade";
      case EventKind::Order: return "order";
      case EventKind::SystemChange: return "system_change";
      case EventKind::Login: return "login";
      case EventKind::ConfigChange: return "config_change";
    }
    return "unknown";
  }

  std::optional<EventKind> parse_event_kind(std::string_view name) {
    for (auto kind : all_event_kinds) {
      if (to_string(kind) == name) return kind;
    }
    return std::nullopt;
  }

  std::string_view to_string(Side side) {
    switch (side) {
      case Side::Buy: return "buy";
      case Side::Sell: return "sell";
    }
    return "unknown";
  }

  std::optional<Side> parse_side(std::string_view name) {
    if (name == "buy") return Side::Buy;
    if (name == "sell") return Side::Sell;
    return std::nullopt;
  }

  void validate_event(const Event& event) {
    if (event.id.empty()) reject(event, "missing event id");
    if (event.id.size() > MAX_ID_LENGTH) reject(event, "event id is too long");
    for (unsigned char c : event.id) {
      if (!std::isprint(c)) reject(event, "event id contains non-printable characters");
    }
    if (event.created_at == 0) reject(event, "missing created_at");

    std::visit(overloaded{
      [&](const TradeEvent& trade) {
        require_symbol(event, trade.symbol);
        require_side(event, trade.side);
        require_positive(event, "quantity", trade.quantity);
        require_positive(event, "price", trade.price);
        limit_text(event, "order_id", trade.order_id);
      },
      [&](const OrderEvent& order) {
        require_text(event, "order_id", order.order_id);
        require_symbol(event, order.symbol);
        require_side(event, order.side);
        require_text(event, "order_type", order.order_type);
        if (!known_order_type(order.order_type)) reject(event, "unknown order_type '" + order.order_type + "'");
        require_positive(event, "quantity", order.quantity);
        if (order.limit_price) {
          require_positive(event, "limit_price", *order.limit_price);
        } else if (order_type_needs_limit(order.order_type)) {
          reject(event, "missing required field 'limit_price' for " + order.order_type + " order");
        }
        require_text(event, "status", order.status);
      },
      [&](const SystemChangeEvent& change) {
        require_text(event, "component", change.component);
        require_text(event, "change_type", change.change_type);
        limit_text(event, "description", change.description);
      },
      [&](const LoginEvent& login) {
        require_text(event, "username", login.username);
        limit_text(event, "source", login.source);
      },
      [&](const ConfigChangeEvent& change) {
        require_text(event, "component", change.component);
        require_text(event, "key", change.key);
        limit_text(event, "old_value", change.old_value);
        limit_text(event, "new_value", change.new_value);
      },
    }, event.payload);
  }

  std::vector<uint8_t> Event::serialize() const {
    ByteWriter writer;
    writer.write_u8(EVENT_TAG);
    writer.write_u8(EVENT_FORMAT);
    writer.write_string(id);
    writer.write_u8(static_cast<uint8_t>(kind()));
    writer.write_u64(created_at);

    std::visit(overloaded{
      [&](const TradeEvent& trade) {
        writer.write_string(trade.symbol);
        writer.write_u8(static_cast<uint8_t>(trade.side));
        writer.write_f64(trade.quantity);
        writer.write_f64(trade.price);
        writer.write_string(trade.order_id);
      },
      [&](const OrderEvent& order) {
        writer.write_string(order.order_id);
        writer.write_string(order.symbol);
        writer.write_u8(static_cast<uint8_t>(order.side));
        writer.write_string(order.order_type);
        writer.write_f64(order.quantity);
        writer.write_optional_f64(order.limit_price);
        writer.write_string(order.status);
      },
      [&](const SystemChangeEvent& change) {
        writer.write_string(change.component);
        writer.write_string(change.change_type);
        writer.write_string(change.description);
      },
      [&](const LoginEvent& login) {
        writer.write_string(login.username);
        writer.write_bool(login.success);
        writer.write_string(login.source);
      },
      [&](const ConfigChangeEvent& change) {
        writer.write_string(change.component);
        writer.write_string(change.key);
        writer.write_string(change.old_value);
        writer.write_string(change.new_value);
      },
    }, payload);
    return writer.take();
  }

  Event Event::deserialize(std::span<const uint8_t> bytes) {
    ByteReader reader(bytes);
    if (reader.read_u8() != EVENT_TAG || reader.read_u8() != EVENT_FORMAT) {
      throw SerializeError("event: bad tag or format version");
    }

    Event event;
    event.id = reader.read_string();
    auto kind = reader.read_u8();
    event.created_at = reader.read_u64();

    switch (static_cast<EventKind>(kind)) {
      case EventKind::Trade: {
        TradeEvent trade;
        trade.symbol = reader.read_string();
        trade.side = static_cast<Side>(reader.read_u8());
        trade.quantity = reader.read_f64();
        trade.price = reader.read_f64();
        trade.order_id = reader.read_string();
        event.payload = std::move(trade);
        break;
      }
      case EventKind::Order: {
        OrderEvent order;
        order.order_id = reader.read_string();
        order.symbol = reader.read_string();
        order.side = static_cast<Side>(reader.read_u8());
        order.order_type = reader.read_string();
        order.quantity = reader.read_f64();
        order.limit_price = reader.read_optional_f64();
        order.status = reader.read_string();
        event.payload = std::move(order);
        break;
      }
      case EventKind::SystemChange: {
        SystemChangeEvent change;
        change.component = reader.read_string();
        change.change_type = reader.read_string();
        change.description = reader.read_string();
        event.payload = std::move(change);
        break;
      }
      case EventKind::Login: {
        LoginEvent login;
        login.username = reader.read_string();
        login.success = reader.read_bool();
        login.source = reader.read_string();
        event.payload = std::move(login);
        break;
      }
      case EventKind::ConfigChange: {
        ConfigChangeEvent change;
        change.component = reader.read_string();
        change.key = reader.read_string();
        change.old_value = reader.read_string();
        change.new_value = reader.read_string();
        event.payload = std::move(change);
        break;
      }
      default:
        throw SerializeError("event: unknown kind " + std::to_string(kind));
    }
    reader.expect_end();
    return event;
  }

  std::string generate_event_id() {
    std::array<uint8_t, 16> raw{};
    random_bytes(raw);
    return to_hex(raw);
  }

  uint64_t unix_time_ms() {
    return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
  }

  Event make_event(EventPayload payload, std::string id, uint64_t created_at) {
    Event event;
    event.id = id.empty() ? generate_event_id() : std::move(id);
    event.created_at = created_at == 0 ? unix_time_ms() : created_at;
    event.payload = std::move(payload);
    validate_event(event);
    return event;
  }
}

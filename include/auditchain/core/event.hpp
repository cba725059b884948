#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace auditchain::core {

  enum class EventKind : uint8_t {
    Trade = 1,
    Order = 2,
    SystemChange = 3,
    Login = 4,
    ConfigChange = 5,
  };

  inline constexpr EventKind all_event_kinds[] = {
    EventKind::Trade, EventKind::Order, EventKind::SystemChange,
    EventKind::Login, EventKind::ConfigChange,
  };

  std::string_view to_string(EventKind kind);
  std::optional<EventKind> parse_event_kind(std::string_view name);

  enum class Side : uint8_t { Buy = 1, Sell = 2 };

  std::string_view to_string(Side side);
  std::optional<Side> parse_side(std::string_view name);

  struct TradeEvent {
    std::string symbol;
    Side side = Side::Buy;
    double quantity = 0;
    double price = 0;
    std::string order_id;
  };

  struct OrderEvent {
    std::string order_id;
    std::string symbol;
    Side side = Side::Buy;
    std::string order_type;           // market, limit, stop, stop_limit, trailing_stop
    double quantity = 0;
    std::optional<double> limit_price;
    std::string status;               // placed, cancelled, filled, ...
  };

  struct SystemChangeEvent {
    std::string component;
    std::string change_type;
    std::string description;
  };

  struct LoginEvent {
    std::string username;
    bool success = false;
    std::string source;
  };

  struct ConfigChangeEvent {
    std::string component;
    std::string key;
    std::string old_value;
    std::string new_value;
  };

  // Alternative order matches EventKind minus one.
  using EventPayload = std::variant<TradeEvent, OrderEvent, SystemChangeEvent, LoginEvent, ConfigChangeEvent>;

  struct Event {
    std::string id;
    uint64_t created_at = 0;   // unix ms
    EventPayload payload;

    EventKind kind() const { return static_cast<EventKind>(payload.index() + 1); }

    std::vector<uint8_t> serialize() const;
    static Event deserialize(std::span<const uint8_t> bytes);
  };

  // Throws InvalidEventError naming the first offending field.
  void validate_event(const Event& event);

  // Builds and validates an event. An empty id is replaced by a random 128-bit hex id,
  // a zero created_at by the current time.
  Event make_event(EventPayload payload, std::string id = {}, uint64_t created_at = 0);

  std::string generate_event_id();

  uint64_t unix_time_ms();
}

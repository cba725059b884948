#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <variant>
#include "auditchain/core/event.hpp"
#include "auditchain/core/logging.hpp"

namespace auditchain::config {
  namespace defaults {
    inline const std::filesystem::path db_path = "data/blockchain/audit_chain.db";
    static constexpr uint64_t mining_interval_seconds{300};
    static constexpr uint32_t difficulty{2};
    static constexpr size_t max_block_size{500};
    static constexpr bool auto_mine{true};
    static constexpr double mining_timeout_seconds{30.0};
    static constexpr uint64_t max_nonce_attempts{0};
    static constexpr uint64_t max_chain_size{0};
    static constexpr uint64_t prune_older_than_days{0};
    static constexpr bool verify_on_open{true};
    static constexpr bool mine_on_shutdown{true};
    static constexpr auto log_level = logging::log_level::info;
  }

  static constexpr auto db_path_key = "db_path";
  static constexpr auto mining_interval_key = "mining_interval";
  static constexpr auto difficulty_key = "difficulty";
  static constexpr auto max_block_size_key = "max_block_size";
  static constexpr auto auto_mine_key = "auto_mine";
  static constexpr auto mining_timeout_key = "mining_timeout";
  static constexpr auto max_nonce_attempts_key = "max_nonce_attempts";
  static constexpr auto record_types_key = "record_types";
  static constexpr auto max_chain_size_key = "max_chain_size";
  static constexpr auto prune_older_than_days_key = "prune_older_than_days";
  static constexpr auto verify_on_open_key = "verify_on_open";
  static constexpr auto mine_on_shutdown_key = "mine_on_shutdown";
  static constexpr auto loglevel_key = "loglevel";
  static constexpr auto log_file_key = "log_file";

  // Environment overrides use this prefix and the upper-cased key.
  static constexpr auto env_prefix = "AUDITCHAIN_";

  struct LedgerConfig {
    std::filesystem::path db_path = defaults::db_path;
    std::chrono::seconds mining_interval{defaults::mining_interval_seconds};
    uint32_t difficulty = defaults::difficulty;
    size_t max_block_size = defaults::max_block_size;
    bool auto_mine = defaults::auto_mine;
    std::chrono::milliseconds mining_timeout{static_cast<int64_t>(defaults::mining_timeout_seconds * 1000)};
    uint64_t max_nonce_attempts = defaults::max_nonce_attempts;   // 0 = no attempt ceiling
    std::set<core::EventKind> record_types{std::begin(core::all_event_kinds), std::end(core::all_event_kinds)};
    uint64_t max_chain_size = defaults::max_chain_size;           // 0 = keep everything
    uint64_t prune_older_than_days = defaults::prune_older_than_days;
    bool verify_on_open = defaults::verify_on_open;
    bool mine_on_shutdown = defaults::mine_on_shutdown;
    logging::log_level log_level = defaults::log_level;
    std::optional<std::filesystem::path> log_file;
  };

  // Reads key=value lines. Quoted values are strings, unquoted values are parsed as
  // unsigned integers, then decimals, then kept as strings. Blank lines and lines
  // starting with '#' are skipped.
  class parser {
    public:
      explicit parser(const std::string& filename);
      explicit parser(std::istream& stream);

      [[nodiscard]] std::optional<std::string> get_string(const std::string& key) const;
      [[nodiscard]] std::optional<uint64_t> get_ulong(const std::string& key) const;
      [[nodiscard]] std::optional<double> get_decimal(const std::string& key) const;
      [[nodiscard]] std::optional<bool> get_flag(const std::string& key) const;
      [[nodiscard]] std::optional<logging::log_level> get_loglevel(const std::string& key) const;
      [[nodiscard]] bool contains(const std::string& key) const { return find_or_env(key).has_value(); }
      [[nodiscard]] bool good() const { return good_; }

    private:
      using value_t = std::variant<std::string, uint64_t, double>;

      void init(std::istream& stream);
      [[nodiscard]] std::optional<value_t> find_or_env(const std::string& key) const;
      static value_t parse_value(const std::string& value);

      std::unordered_map<std::string, value_t> options_;
      bool good_ = true;
  };

  // Returns the config, or a message naming the first invalid option.
  std::variant<LedgerConfig, std::string> read_config(const parser& cfg);
  std::variant<LedgerConfig, std::string> load_config(const std::string& config_file);

  std::optional<std::set<core::EventKind>> parse_record_types(const std::string& csv);
}

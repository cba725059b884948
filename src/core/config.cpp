#include "auditchain/core/config.hpp"
#include "auditchain/core/pow.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace auditchain::config {
  namespace {
    std::string trim(const std::string& in) {
      auto begin = std::find_if_not(in.begin(), in.end(), [](unsigned char c) { return std::isspace(c); });
      auto end = std::find_if_not(in.rbegin(), in.rend(), [](unsigned char c) { return std::isspace(c); }).base();
      return begin < end ? std::string(begin, end) : std::string();
    }
  }

  parser::parser(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.good()) {
      good_ = false;
      return;
    }
    init(file);
  }

  parser::parser(std::istream& stream) { init(stream); }

  void parser::init(std::istream& stream) {
    std::string line;
    while (std::getline(stream, line)) {
      auto trimmed = trim(line);
      if (trimmed.empty() || trimmed.front() == '#') continue;
      auto eq = trimmed.find('=');
      if (eq == std::string::npos) continue;
      auto key = trim(trimmed.substr(0, eq));
      auto value = trim(trimmed.substr(eq + 1));
      if (key.empty() || value.empty()) continue;
      options_.insert_or_assign(key, parse_value(value));
    }
  }

  parser::value_t parser::parse_value(const std::string& value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
      return value.substr(1, value.size() - 2);
    }
    if (std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
      try {
        return static_cast<uint64_t>(std::stoull(value));
      } catch (const std::out_of_range&) {
        return value;
      }
    }
    try {
      size_t consumed = 0;
      auto number = std::stod(value, &consumed);
      if (consumed == value.size()) return number;
    } catch (const std::logic_error&) {
      // not a number, keep as string
    }
    return value;
  }

  std::optional<parser::value_t> parser::find_or_env(const std::string& key) const {
    auto env_key = std::string(env_prefix) + key;
    std::transform(env_key.begin(), env_key.end(), env_key.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    if (const auto* env_v = std::getenv(env_key.c_str())) {
      return parse_value(env_v);
    }
    auto it = options_.find(key);
    if (it != options_.end()) return it->second;
    return std::nullopt;
  }

  std::optional<std::string> parser::get_string(const std::string& key) const {
    auto value = find_or_env(key);
    if (!value) return std::nullopt;
    if (const auto* str = std::get_if<std::string>(&*value)) return *str;
    return std::nullopt;
  }

  std::optional<uint64_t> parser::get_ulong(const std::string& key) const {
    auto value = find_or_env(key);
    if (!value) return std::nullopt;
    if (const auto* number = std::get_if<uint64_t>(&*value)) return *number;
    return std::nullopt;
  }

  std::optional<double> parser::get_decimal(const std::string& key) const {
    auto value = find_or_env(key);
    if (!value) return std::nullopt;
    if (const auto* number = std::get_if<double>(&*value)) return *number;
    if (const auto* integer = std::get_if<uint64_t>(&*value)) return static_cast<double>(*integer);
    return std::nullopt;
  }

  std::optional<bool> parser::get_flag(const std::string& key) const {
    auto value = find_or_env(key);
    if (!value) return std::nullopt;
    if (const auto* number = std::get_if<uint64_t>(&*value)) {
      if (*number <= 1) return *number == 1;
      return std::nullopt;
    }
    if (const auto* str = std::get_if<std::string>(&*value)) {
      if (*str == "true") return true;
      if (*str == "false") return false;
    }
    return std::nullopt;
  }

  std::optional<logging::log_level> parser::get_loglevel(const std::string& key) const {
    auto value = get_string(key);
    if (!value) return std::nullopt;
    return logging::parse_loglevel(*value);
  }

  std::optional<std::set<core::EventKind>> parse_record_types(const std::string& csv) {
    std::set<core::EventKind> kinds;
    std::istringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
      auto name = trim(item);
      if (name.empty()) continue;
      auto kind = core::parse_event_kind(name);
      if (!kind) return std::nullopt;
      kinds.insert(*kind);
    }
    return kinds;
  }

  namespace {
    // Present-but-unparsable values are errors; absent values keep the default.
    template <typename T, typename Getter>
    bool read_option(const parser& cfg, const std::string& key, Getter getter, T& out, std::string& error) {
      if (!cfg.contains(key)) return true;
      auto value = (cfg.*getter)(key);
      if (!value) {
        error = "Invalid value for option '" + key + "'";
        return false;
      }
      out = static_cast<T>(*value);
      return true;
    }
  }

  std::variant<LedgerConfig, std::string> read_config(const parser& cfg) {
    LedgerConfig config;
    std::string error;

    if (auto db_path = cfg.get_string(db_path_key)) config.db_path = *db_path;

    uint64_t interval = defaults::mining_interval_seconds;
    if (!read_option(cfg, mining_interval_key, &parser::get_ulong, interval, error)) return error;
    if (interval == 0) return std::string("mining_interval must be at least 1 second");
    config.mining_interval = std::chrono::seconds(interval);

    uint64_t difficulty = defaults::difficulty;
    if (!read_option(cfg, difficulty_key, &parser::get_ulong, difficulty, error)) return error;
    if (difficulty > core::pow::MAX_DIFFICULTY) {
      return "difficulty must not exceed " + std::to_string(core::pow::MAX_DIFFICULTY);
    }
    config.difficulty = static_cast<uint32_t>(difficulty);

    if (!read_option(cfg, max_block_size_key, &parser::get_ulong, config.max_block_size, error)) return error;
    if (config.max_block_size == 0) return std::string("max_block_size must be positive");

    if (!read_option(cfg, auto_mine_key, &parser::get_flag, config.auto_mine, error)) return error;

    double timeout_seconds = defaults::mining_timeout_seconds;
    if (!read_option(cfg, mining_timeout_key, &parser::get_decimal, timeout_seconds, error)) return error;
    if (timeout_seconds <= 0) return std::string("mining_timeout must be positive");
    config.mining_timeout = std::chrono::milliseconds(static_cast<int64_t>(timeout_seconds * 1000));

    if (!read_option(cfg, max_nonce_attempts_key, &parser::get_ulong, config.max_nonce_attempts, error)) return error;

    if (auto types = cfg.get_string(record_types_key)) {
      auto kinds = parse_record_types(*types);
      if (!kinds) return "Invalid value for option '" + std::string(record_types_key) + "'";
      config.record_types = std::move(*kinds);
    }

    if (!read_option(cfg, max_chain_size_key, &parser::get_ulong, config.max_chain_size, error)) return error;
    if (!read_option(cfg, prune_older_than_days_key, &parser::get_ulong, config.prune_older_than_days, error)) return error;
    if (!read_option(cfg, verify_on_open_key, &parser::get_flag, config.verify_on_open, error)) return error;
    if (!read_option(cfg, mine_on_shutdown_key, &parser::get_flag, config.mine_on_shutdown, error)) return error;
    if (!read_option(cfg, loglevel_key, &parser::get_loglevel, config.log_level, error)) return error;

    if (auto log_file = cfg.get_string(log_file_key)) config.log_file = *log_file;

    return config;
  }

  std::variant<LedgerConfig, std::string> load_config(const std::string& config_file) {
    parser cfg(config_file);
    if (!cfg.good()) return "Unable to read config file '" + config_file + "'";
    return read_config(cfg);
  }
}

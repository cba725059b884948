#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include <auditchain/core/config.hpp>
#include <auditchain/core/errors.hpp>
#include <auditchain/core/json.hpp>
#include <auditchain/core/ledger.hpp>
#include <auditchain/core/logging.hpp>

using namespace auditchain::core;
namespace config = auditchain::config;
namespace logging = auditchain::logging;

static void print_usage() {
  std::printf(
    "Audit ledger admin\n\n"
    "Usage:\n"
    "  auditchain-admin [--config FILE] <command> [args]\n\n"
    "Commands:\n"
    "  stats                          Chain, pool and miner statistics\n"
    "  verify                         Verify the whole retained chain\n"
    "  mine                           Mine pending events into one block now\n"
    "  tip                            Print the tip block\n"
    "  block N                        Print block N\n"
    "  pending [N]                    Print up to N pending events (default: 100)\n"
    "  trail [--kind K] [--since MS] [--until MS] [--limit N] [--cursor C]\n"
    "                                 Page through committed events\n"
    "  export json|csv [FILE]         Export the chain (default: stdout)\n"
    "  prune DAYS                     Remove blocks older than DAYS days\n"
    "  retention                      Apply max_chain_size and prune_older_than_days\n"
    "  demo-record N                  Record N sample trades\n\n"
    "Options:\n"
    "  --config   key=value config file; AUDITCHAIN_<KEY> environment variables override it\n"
  );
}

static uint64_t parse_u64(const std::string& name, const std::string& value) {
  size_t used = 0;
  uint64_t parsed = 0;
  try {
    parsed = std::stoull(value, &used);
  } catch (const std::logic_error&) {
    used = 0;
  }
  if (used == 0 || used != value.size() || value.front() == '-') {
    throw std::invalid_argument("invalid " + name + ": '" + value + "'");
  }
  return parsed;
}

static void print_json(const Json::Value& value) {
  std::cout << write_styled(value) << "\n";
}

static std::variant<config::LedgerConfig, std::string> resolve_config(const std::string& config_file) {
  if (!config_file.empty()) return config::load_config(config_file);
  // No file: defaults plus environment overrides.
  std::istringstream empty;
  return config::read_config(config::parser(empty));
}

static int run_command(AuditLedger& ledger, const std::vector<std::string>& args) {
  const std::string& command = args[0];

  if (command == "stats") {
    print_json(to_json(ledger.get_stats()));
    return 0;
  }

  if (command == "verify") {
    auto report = ledger.verify_chain();
    print_json(to_json(report));
    return report.is_valid ? 0 : 2;
  }

  if (command == "mine") {
    auto result = ledger.force_mine();
    print_json(to_json(result));
    return result.outcome == MineOutcome::Committed || result.outcome == MineOutcome::NothingPending ? 0 : 1;
  }

  if (command == "tip") {
    print_json(to_json(ledger.get_tip()));
    return 0;
  }

  if (command == "block") {
    if (args.size() != 2) {
      print_usage();
      return 1;
    }
    auto index = parse_u64("block index", args[1]);
    auto block = ledger.get_block(index);
    if (!block) {
      std::fprintf(stderr, "Block %llu not found\n", static_cast<unsigned long long>(index));
      return 1;
    }
    print_json(to_json(*block));
    return 0;
  }

  if (command == "pending") {
    size_t limit = args.size() > 1 ? parse_u64("limit", args[1]) : DEFAULT_PAGE_SIZE;
    Json::Value events(Json::arrayValue);
    for (const auto& event : ledger.peek_pending(limit)) events.append(to_json(event));
    Json::Value out(Json::objectValue);
    out["pending_count"] = static_cast<Json::UInt64>(ledger.pending_count());
    out["events"] = events;
    print_json(out);
    return 0;
  }

  if (command == "trail") {
    AuditQuery query;
    for (size_t i = 1; i < args.size(); ++i) {
      const std::string& arg = args[i];
      bool has_value = i + 1 < args.size();
      if (arg == "--kind" && has_value) {
        auto kind = parse_event_kind(args[++i]);
        if (!kind) throw std::invalid_argument("unknown event kind: '" + args[i] + "'");
        query.kind = kind;
      } else if (arg == "--since" && has_value) {
        query.start_time = parse_u64("--since", args[++i]);
      } else if (arg == "--until" && has_value) {
        query.end_time = parse_u64("--until", args[++i]);
      } else if (arg == "--limit" && has_value) {
        query.limit = parse_u64("--limit", args[++i]);
      } else if (arg == "--cursor" && has_value) {
        query.cursor = args[++i];
      } else {
        std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
        print_usage();
        return 1;
      }
    }
    print_json(to_json(ledger.get_audit_trail(query)));
    return 0;
  }

  if (command == "export") {
    if (args.size() < 2 || args.size() > 3) {
      print_usage();
      return 1;
    }
    auto format = parse_export_format(args[1]);
    if (!format) {
      std::fprintf(stderr, "Unknown export format: %s\n", args[1].c_str());
      return 1;
    }
    if (args.size() == 3) {
      std::ofstream file(args[2], std::ios::out | std::ios::trunc);
      if (!file) {
        std::fprintf(stderr, "Cannot open %s\n", args[2].c_str());
        return 1;
      }
      ledger.export_chain(*format, file);
      file.close();
      if (!file) {
        std::fprintf(stderr, "Failed writing %s\n", args[2].c_str());
        return 1;
      }
      std::cout << "exported to " << args[2] << "\n";
    } else {
      ledger.export_chain(*format, std::cout);
    }
    return 0;
  }

  if (command == "prune") {
    if (args.size() != 2) {
      print_usage();
      return 1;
    }
    auto days = parse_u64("days", args[1]);
    auto now = unix_time_ms();
    auto window = days * 24ULL * 60 * 60 * 1000;
    print_json(to_json(ledger.prune(window < now ? now - window : 0)));
    return 0;
  }

  if (command == "retention") {
    print_json(to_json(ledger.apply_retention()));
    return 0;
  }

  if (command == "demo-record") {
    if (args.size() != 2) {
      print_usage();
      return 1;
    }
    auto count = parse_u64("count", args[1]);
    const char* symbols[] = {"BTC/USDT", "ETH/USDT", "SOL/USDT"};
    uint64_t queued = 0;
    for (uint64_t i = 0; i < count; ++i) {
      TradeEvent trade{
        .symbol = symbols[i % 3],
        .side = i % 2 == 0 ? Side::Buy : Side::Sell,
        .quantity = 0.01 * static_cast<double>(i + 1),
        .price = 100.0 + static_cast<double>(i),
        .order_id = "demo-" + std::to_string(i),
      };
      if (ledger.record_trade(std::move(trade)) == RecordStatus::Queued) ++queued;
    }
    Json::Value out(Json::objectValue);
    out["queued"] = static_cast<Json::UInt64>(queued);
    out["pending_count"] = static_cast<Json::UInt64>(ledger.pending_count());
    print_json(out);
    return 0;
  }

  std::fprintf(stderr, "Unknown command: %s\n", command.c_str());
  print_usage();
  return 1;
}

int main(int argc, char** argv) {
  std::string config_file;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg.rfind("--config=", 0) == 0 && args.empty()) {
      config_file = arg.substr(9);
    } else if (arg == "--config" && args.empty() && i + 1 < argc) {
      config_file = argv[++i];
    } else if ((arg == "-h" || arg == "--help") && args.empty()) {
      print_usage();
      return 0;
    } else {
      args.push_back(arg);
    }
  }

  if (args.empty()) {
    print_usage();
    return 0;
  }

  auto loaded = resolve_config(config_file);
  if (auto* error = std::get_if<std::string>(&loaded)) {
    std::fprintf(stderr, "Config error: %s\n", error->c_str());
    return 1;
  }
  auto cfg = std::get<config::LedgerConfig>(std::move(loaded));
  // One-shot commands never run the background miner.
  cfg.auto_mine = false;

  auto log = std::make_shared<logging::log>(cfg.log_level, false);
  if (cfg.log_file) {
    auto file = std::make_unique<std::ofstream>(*cfg.log_file, std::ios::out | std::ios::app);
    if (!*file) {
      std::fprintf(stderr, "Cannot open log file %s\n", cfg.log_file->c_str());
      return 1;
    }
    log->set_logfile(std::move(file));
  }

  try {
    AuditLedger ledger(std::move(cfg), log);
    return run_command(ledger, args);
  } catch (const InvalidCursorError& ex) {
    std::fprintf(stderr, "Invalid cursor: %s\n", ex.what());
    return 1;
  } catch (const std::exception& ex) {
    std::fprintf(stderr, "Error: %s\n", ex.what());
    return 1;
  }
}

#include "auditchain/core/logging.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>

namespace auditchain::logging {
  null_stream::null_stream() : std::ostream(nullptr) {}

  log::log(log_level level, bool use_stdout, std::unique_ptr<std::ostream> logfile)
    : m_stdout(use_stdout), m_loglevel(level), m_logfile(std::move(logfile)) {
    if (!m_logfile) m_logfile = std::make_unique<null_stream>();
  }

  void log::set_stdout_enabled(bool stdout_enabled) {
    const std::lock_guard<std::mutex> lock(m_stream_mut);
    m_stdout = stdout_enabled;
  }

  void log::set_logfile(std::unique_ptr<std::ostream> logfile) {
    const std::lock_guard<std::mutex> lock(m_stream_mut);
    m_logfile = logfile ? std::move(logfile) : std::make_unique<null_stream>();
  }

  void log::set_loglevel(log_level level) { m_loglevel = level; }

  log_level log::get_log_level() const { return m_loglevel; }

  std::string log::to_string(log_level level) {
    switch (level) {
      case log_level::trace: return "TRACE";
      case log_level::debug: return "DEBUG";
      case log_level::info: return "INFO ";
      case log_level::warn: return "WARN ";
      case log_level::error: return "ERROR";
      case log_level::fatal: return "FATAL";
    }
    return "NONE ";
  }

  void log::write_log_prefix(std::stringstream& ss, log_level level) {
    auto now = std::chrono::system_clock::now();
    auto now_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local_tm{};
    localtime_r(&now_t, &local_tm);
    ss << std::put_time(&local_tm, "[%Y-%m-%d %H:%M:%S.")
       << std::setfill('0') << std::setw(3) << now_ms << "] ["
       << to_string(level) << "]";
  }

  std::optional<log_level> parse_loglevel(const std::string& level) {
    if (level == "TRACE") return log_level::trace;
    if (level == "DEBUG") return log_level::debug;
    if (level == "INFO") return log_level::info;
    if (level == "WARN") return log_level::warn;
    if (level == "ERROR") return log_level::error;
    if (level == "FATAL") return log_level::fatal;
    return std::nullopt;
  }
}

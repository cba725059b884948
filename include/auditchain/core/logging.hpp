#pragma once
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace auditchain::logging {
  // Discards everything written to it.
  class null_stream : public std::ostream {
    public:
      null_stream();
  };

  enum class log_level : uint8_t {
    trace,
    debug,
    info,
    warn,
    error,
    fatal
  };

  // Leveled logger shared by the ledger components. Writes to stdout and/or a log file,
  // one line per statement, prefixed with a timestamp and the level.
  class log {
    public:
      explicit log(log_level level,
                   bool use_stdout = true,
                   std::unique_ptr<std::ostream> logfile = std::make_unique<null_stream>());

      void set_stdout_enabled(bool stdout_enabled);
      void set_logfile(std::unique_ptr<std::ostream> logfile);
      void set_loglevel(log_level level);
      [[nodiscard]] log_level get_log_level() const;

      template <typename... Targs>
      void trace(Targs&&... args) { write_log_statement(log_level::trace, std::forward<Targs>(args)...); }

      template <typename... Targs>
      void debug(Targs&&... args) { write_log_statement(log_level::debug, std::forward<Targs>(args)...); }

      template <typename... Targs>
      void info(Targs&&... args) { write_log_statement(log_level::info, std::forward<Targs>(args)...); }

      template <typename... Targs>
      void warn(Targs&&... args) { write_log_statement(log_level::warn, std::forward<Targs>(args)...); }

      template <typename... Targs>
      void error(Targs&&... args) { write_log_statement(log_level::error, std::forward<Targs>(args)...); }

      // Logs and terminates the process.
      template <typename... Targs>
      [[noreturn]] void fatal(Targs&&... args) {
        write_log_statement(log_level::fatal, std::forward<Targs>(args)...);
        std::exit(EXIT_FAILURE);
      }

    private:
      static std::string to_string(log_level level);
      static void write_log_prefix(std::stringstream& ss, log_level level);

      template <typename... Targs>
      void write_log_statement(log_level level, Targs&&... args) {
        if (level < m_loglevel.load()) return;
        std::stringstream ss;
        write_log_prefix(ss, level);
        ((ss << " " << args), ...);
        ss << "\n";
        auto line = ss.str();
        const std::lock_guard<std::mutex> lock(m_stream_mut);
        if (m_stdout) std::cout << line;
        *m_logfile << line;
        m_logfile->flush();
      }

      bool m_stdout{true};
      std::atomic<log_level> m_loglevel{};
      std::mutex m_stream_mut{};
      std::unique_ptr<std::ostream> m_logfile;
  };

  // TRACE, DEBUG, INFO, WARN, ERROR or FATAL.
  std::optional<log_level> parse_loglevel(const std::string& level);
}

#include <gtest/gtest.h>
#include <sstream>
#include "auditchain/core/logging.hpp"

using namespace auditchain;

TEST(Logging, FiltersBelowLevel) {
  auto sink = std::make_unique<std::ostringstream>();
  auto* out = sink.get();
  logging::log log(logging::log_level::warn, false, std::move(sink));

  log.info("hidden");
  log.warn("shown", 42);
  log.error("also", "shown");

  auto text = out->str();
  EXPECT_EQ(text.find("hidden"), std::string::npos);
  EXPECT_NE(text.find("[WARN ] shown 42\n"), std::string::npos);
  EXPECT_NE(text.find("[ERROR] also shown\n"), std::string::npos);
}

TEST(Logging, LevelCanChange) {
  auto sink = std::make_unique<std::ostringstream>();
  auto* out = sink.get();
  logging::log log(logging::log_level::error, false, std::move(sink));
  log.debug("before");
  log.set_loglevel(logging::log_level::trace);
  EXPECT_EQ(log.get_log_level(), logging::log_level::trace);
  log.debug("after");

  auto text = out->str();
  EXPECT_EQ(text.find("before"), std::string::npos);
  EXPECT_NE(text.find("[DEBUG] after"), std::string::npos);
}

TEST(Logging, ParseLevel) {
  EXPECT_EQ(logging::parse_loglevel("TRACE"), logging::log_level::trace);
  EXPECT_EQ(logging::parse_loglevel("WARN"), logging::log_level::warn);
  EXPECT_EQ(logging::parse_loglevel("FATAL"), logging::log_level::fatal);
  EXPECT_FALSE(logging::parse_loglevel("warn").has_value());
}

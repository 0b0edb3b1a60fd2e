#include "core/logging/logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

using framewatch::core::logging::LogLevel;
using framewatch::core::logging::Logger;
using framewatch::core::logging::ParseLogLevel;

TEST_CASE("ParseLogLevel accepts known levels case-insensitively", "[core][logging]") {
  LogLevel level = LogLevel::kInfo;
  std::string error;

  REQUIRE(ParseLogLevel("DEBUG", level, error));
  REQUIRE(level == LogLevel::kDebug);
  REQUIRE(ParseLogLevel("warning", level, error));
  REQUIRE(level == LogLevel::kWarn);
  REQUIRE(ParseLogLevel("error", level, error));
  REQUIRE(level == LogLevel::kError);

  REQUIRE_FALSE(ParseLogLevel("verbose", level, error));
  REQUIRE(error.find("expected debug|info|warn|error") != std::string::npos);
  REQUIRE_FALSE(ParseLogLevel("", level, error));
  REQUIRE(error.find("missing value for --log-level") != std::string::npos);
}

TEST_CASE("Logger writes key=value lines with session id", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kInfo, out);
  logger.SetSessionId("monitor-1-1");

  logger.Info("frame fetch failed", {{"since_frame", "41"}, {"error", "say \"hi\""}});
  const std::string line = out.str();

  REQUIRE(line.rfind("ts_utc=", 0) == 0);
  REQUIRE(line.find(" level=INFO") != std::string::npos);
  REQUIRE(line.find(" session_id=\"monitor-1-1\"") != std::string::npos);
  REQUIRE(line.find(" msg=\"frame fetch failed\"") != std::string::npos);
  REQUIRE(line.find(" since_frame=\"41\" error=\"say \\\"hi\\\"\"") != std::string::npos);
  REQUIRE(line.back() == '\n');
}

TEST_CASE("Logger drops lines below the minimum level", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kWarn, out);

  logger.Debug("tick skipped");
  logger.Info("round complete");
  REQUIRE(out.str().empty());

  logger.Warn("control lost");
  REQUIRE(out.str().find("session_id=\"-\"") != std::string::npos);

  logger.SetMinLevel(LogLevel::kDebug);
  REQUIRE(logger.ShouldLog(LogLevel::kDebug));
}

#include "core/logging/logger.hpp"

#include <catch2/catch.hpp>

#include <sstream>
#include <string>

using flowexec::core::logging::Logger;
using flowexec::core::logging::LogLevel;

TEST_CASE("Logger routes error lines to the error sink", "[core][logging]") {
  std::ostringstream info;
  std::ostringstream errors;
  Logger logger(LogLevel::kDebug, info, errors);

  logger.Info("workflow resolved", {{"workflow_id", "5"}});
  logger.Error("Execution error:", {{"message", "boom"}});

  const std::string info_text = info.str();
  const std::string error_text = errors.str();
  REQUIRE(info_text.find("level=INFO") != std::string::npos);
  REQUIRE(info_text.find("msg=\"workflow resolved\"") != std::string::npos);
  REQUIRE(info_text.find("workflow_id=\"5\"") != std::string::npos);
  REQUIRE(info_text.find("boom") == std::string::npos);
  REQUIRE(error_text.find("level=ERROR") != std::string::npos);
  REQUIRE(error_text.find("message=\"boom\"") != std::string::npos);
}

TEST_CASE("Logger drops lines below the minimum level", "[core][logging]") {
  std::ostringstream info;
  std::ostringstream errors;
  Logger logger(LogLevel::kWarn, info, errors);

  logger.Debug("hidden");
  logger.Info("hidden too");
  logger.Warn("shown");

  REQUIRE(info.str().find("hidden") == std::string::npos);
  REQUIRE(info.str().find("msg=\"shown\"") != std::string::npos);
}

TEST_CASE("Logger stamps the run id and escapes values", "[core][logging]") {
  std::ostringstream sink;
  Logger logger(LogLevel::kInfo, sink, sink);
  logger.SetRunId("42");
  logger.Info("line", {{"stack", "Error: x\n    at y"}});

  const std::string text = sink.str();
  REQUIRE(text.find("run_id=\"42\"") != std::string::npos);
  REQUIRE(text.find("stack=\"Error: x\\n    at y\"") != std::string::npos);
}

TEST_CASE("ParseLogLevel accepts known names case-insensitively", "[core][logging]") {
  LogLevel level = LogLevel::kInfo;
  std::string error;
  REQUIRE(flowexec::core::logging::ParseLogLevel("DEBUG", level, error));
  REQUIRE(level == LogLevel::kDebug);
  REQUIRE(flowexec::core::logging::ParseLogLevel("warning", level, error));
  REQUIRE(level == LogLevel::kWarn);
  REQUIRE_FALSE(flowexec::core::logging::ParseLogLevel("verbose", level, error));
  REQUIRE(error.find("verbose") != std::string::npos);
}

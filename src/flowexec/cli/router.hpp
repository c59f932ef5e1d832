#pragma once

#include "core/logging/logger.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flowexec::cli {

// Parsed `flowexec execute` invocation.
struct ExecuteCommandOptions {
  std::optional<std::string> file_path;
  std::optional<std::string> id;
  // Empty means settings::DefaultUserFolder().
  std::filesystem::path user_folder;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  // Empty means the default sinks (stderr).
  std::filesystem::path log_file;
  bool show_help = false;
};

// Environment fallbacks read before flags are parsed:
//   FLOWEXEC_LOG_LEVEL, FLOWEXEC_LOG_FILE
// FLOWEXEC_USER_FOLDER is resolved later through DefaultUserFolder().
inline constexpr const char* kLogLevelEnvVar = "FLOWEXEC_LOG_LEVEL";
inline constexpr const char* kLogFileEnvVar = "FLOWEXEC_LOG_FILE";

bool ApplyEnvironmentDefaults(ExecuteCommandOptions& options, std::string& error);

// Accepts `--flag=value` and `--flag value` for --file, --id, --user-folder,
// --log-level and --log-file, plus --help/-h. Unknown flags, positional
// arguments and repeated flags are usage errors. Whether exactly one of
// --file/--id is present is left to the execute flow.
bool ParseExecuteOptions(const std::vector<std::string_view>& args,
                         ExecuteCommandOptions& options, std::string& error);

// Routes `flowexec` subcommands and returns the process exit code:
//   0  => success
//   1  => execution failed or fatal error
//   2  => usage error
//   10 => workflow data invalid
//   11 => workflow not found
//   12 => workflow has no start node
int Dispatch(int argc, char** argv);

} // namespace flowexec::cli

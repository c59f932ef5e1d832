#include "flowexec/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "flowexec/default_services.hpp"
#include "orchestration/execute_flow.hpp"
#include "settings/user_settings.hpp"

#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace flowexec::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  flowexec execute (--id=<id> | --file=<workflow.json>) [--user-folder=<dir>] "
         "[--log-level=<debug|info|warn|error>] [--log-file=<path>]\n"
      << "  flowexec version\n"
      << "  flowexec help\n";
}

void PrintExecuteHelp(std::ostream& out) {
  out << "Executes a given workflow.\n"
      << "\n"
      << "usage:\n"
      << "  flowexec execute --id=<id>\n"
      << "  flowexec execute --file=<workflow.json>\n"
      << "\n"
      << "options:\n"
      << "  --id=<id>              id of the stored workflow to execute\n"
      << "  --file=<path>          path to a workflow JSON file to execute\n"
      << "  --user-folder=<dir>    user folder holding storage and settings\n"
      << "  --log-level=<level>    debug|info|warn|error\n"
      << "  --log-file=<path>      write all log lines to this file\n"
      << "  -h, --help             show this help\n";
}

// Matches `--name=value` or `--name value` at args[i]. Returns false only when
// the flag matches but has no value; `matched` tells whether it was this flag.
bool MatchValueFlag(const std::vector<std::string_view>& args, std::size_t& i,
                    std::string_view name, std::string& value, bool& matched,
                    std::string& error) {
  matched = false;
  const std::string_view token = args[i];
  if (token.substr(0, name.size()) != name) {
    return true;
  }

  const std::string_view rest = token.substr(name.size());
  if (rest.empty()) {
    if (i + 1 >= args.size()) {
      error = "missing value for " + std::string(name);
      return false;
    }
    value = std::string(args[i + 1]);
    ++i;
    matched = true;
    return true;
  }
  if (rest.front() != '=') {
    return true;
  }

  value = std::string(rest.substr(1));
  matched = true;
  return true;
}

bool StoreOnce(std::optional<std::string>& slot, std::string value, std::string_view name,
               std::string& error) {
  if (slot.has_value()) {
    error = std::string(name) + " was given more than once";
    return false;
  }
  slot = std::move(value);
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "flowexec 0.1.0\n";
  return kExitSuccess;
}

int CommandExecute(const std::vector<std::string_view>& args) {
  ExecuteCommandOptions options;
  std::string error;
  if (!ApplyEnvironmentDefaults(options, error) || !ParseExecuteOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  if (options.show_help) {
    PrintExecuteHelp(std::cout);
    return kExitSuccess;
  }

  core::logging::Logger logger(options.log_level);
  std::ofstream log_stream;
  if (!options.log_file.empty()) {
    if (!core::EnsureParentDirectory(options.log_file, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitUsage;
    }
    log_stream.open(options.log_file, std::ios::out | std::ios::app);
    if (!log_stream) {
      std::cerr << "error: unable to open log file: " << options.log_file.string() << '\n';
      return kExitUsage;
    }
    logger.SetSinks(log_stream, log_stream);
  }

  const fs::path user_folder =
      options.user_folder.empty() ? settings::DefaultUserFolder() : options.user_folder;
  logger.Debug("execute requested",
               {{"user_folder", user_folder.string()},
                {"file", options.file_path.value_or("")},
                {"id", options.id.value_or("")}});

  app::DefaultServices services(user_folder);
  orchestration::ExecuteOptions execute_options;
  execute_options.source.file_path = options.file_path;
  execute_options.source.id = options.id;

  const int exit_code = orchestration::RunExecute(execute_options, services.View(), logger,
                                                  std::cout, std::cerr);
  logger.Debug("execute finished", {{"exit_code", std::to_string(exit_code)}});
  return exit_code;
}

} // namespace

bool ApplyEnvironmentDefaults(ExecuteCommandOptions& options, std::string& error) {
  error.clear();

  const char* raw_level = std::getenv(kLogLevelEnvVar);
  if (raw_level != nullptr && *raw_level != '\0') {
    core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
    if (!core::logging::ParseLogLevel(raw_level, parsed, error)) {
      error = std::string(kLogLevelEnvVar) + ": " + error;
      return false;
    }
    options.log_level = parsed;
  }

  const char* raw_file = std::getenv(kLogFileEnvVar);
  if (raw_file != nullptr && *raw_file != '\0') {
    options.log_file = fs::path(raw_file);
  }
  return true;
}

bool ParseExecuteOptions(const std::vector<std::string_view>& args,
                         ExecuteCommandOptions& options, std::string& error) {
  error.clear();

  std::optional<std::string> user_folder;
  std::optional<std::string> log_level;
  std::optional<std::string> log_file;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--help" || token == "-h") {
      options.show_help = true;
      continue;
    }

    struct ValueFlag {
      std::string_view name;
      std::optional<std::string>* slot;
    };
    const ValueFlag value_flags[] = {
        {"--file", &options.file_path}, {"--id", &options.id},
        {"--user-folder", &user_folder}, {"--log-level", &log_level},
        {"--log-file", &log_file},
    };

    bool matched = false;
    for (const ValueFlag& flag : value_flags) {
      std::string value;
      if (!MatchValueFlag(args, i, flag.name, value, matched, error)) {
        return false;
      }
      if (!matched) {
        continue;
      }
      if (!StoreOnce(*flag.slot, std::move(value), flag.name, error)) {
        return false;
      }
      break;
    }
    if (matched) {
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    error = "execute does not accept positional arguments: " + std::string(token);
    return false;
  }

  if (user_folder.has_value()) {
    if (user_folder->empty()) {
      error = "--user-folder cannot be empty";
      return false;
    }
    options.user_folder = fs::path(*user_folder);
  }
  if (log_level.has_value()) {
    core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
    if (!core::logging::ParseLogLevel(*log_level, parsed, error)) {
      return false;
    }
    options.log_level = parsed;
  }
  if (log_file.has_value()) {
    options.log_file = fs::path(*log_file);
  }
  return true;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "execute") {
    return CommandExecute(args);
  }

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace flowexec::cli

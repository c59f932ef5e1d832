#include "hooks/external_hooks.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cstdlib>
#include <utility>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace fs = std::filesystem;

namespace flowexec::hooks {

namespace {

using JsonValue = core::json::Value;

std::string ShellQuote(std::string_view raw) {
  std::string quoted = "'";
  for (const char c : raw) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

bool RunShellCommandNoCapture(const std::string& command, int& exit_code, std::string& error) {
  error.clear();
  exit_code = -1;
  const int raw_status = std::system(command.c_str());
  if (raw_status == -1) {
    error = "failed to execute shell command";
    return false;
  }

#if defined(_WIN32)
  exit_code = raw_status;
#else
  if (WIFEXITED(raw_status)) {
    exit_code = WEXITSTATUS(raw_status);
  } else {
    exit_code = raw_status;
  }
#endif
  return true;
}

bool LoadHookFile(const fs::path& path,
                  std::map<std::string, std::vector<std::string>, std::less<>>& commands,
                  std::string& error) {
  std::string text;
  bool not_found = false;
  if (!core::ReadTextFile(path, text, not_found, error)) {
    error = "failed to load external hook file: " + error;
    return false;
  }

  JsonValue root;
  if (!core::json::Parse(text, root, error)) {
    error = "external hook file '" + path.string() + "' is invalid: " + error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "external hook file '" + path.string() + "' must contain an object";
    return false;
  }

  for (const auto& [hook_name, list] : root.object_value) {
    if (list.type != JsonValue::Type::kArray) {
      error = "external hook '" + hook_name + "' in '" + path.string() +
              "' must be an array of commands";
      return false;
    }
    for (const JsonValue& command : list.array_value) {
      if (command.type != JsonValue::Type::kString || command.string_value.empty()) {
        error = "external hook '" + hook_name + "' in '" + path.string() +
                "' contains a non-string or empty command";
        return false;
      }
      commands[hook_name].push_back(command.string_value);
    }
  }
  return true;
}

} // namespace

FileExternalHooks::FileExternalHooks() {
  if (const char* env = std::getenv(kEnvVar); env != nullptr) {
    hook_files_ = SplitHookFileList(env);
  }
}

FileExternalHooks::FileExternalHooks(std::vector<fs::path> hook_files)
    : hook_files_(std::move(hook_files)) {}

bool FileExternalHooks::Init(std::string& error) {
  error.clear();
  commands_by_hook_.clear();

  std::map<std::string, std::vector<std::string>, std::less<>> staged;
  for (const fs::path& path : hook_files_) {
    if (!LoadHookFile(path, staged, error)) {
      return false;
    }
  }
  commands_by_hook_ = std::move(staged);
  return true;
}

bool FileExternalHooks::Run(std::string_view hook_name, const std::vector<std::string>& args,
                            std::string& error) {
  error.clear();
  const auto it = commands_by_hook_.find(hook_name);
  if (it == commands_by_hook_.end()) {
    return true;
  }

  for (const std::string& command_template : it->second) {
    const std::string command = ExpandHookCommand(command_template, args);
    int exit_code = -1;
    if (!RunShellCommandNoCapture(command, exit_code, error)) {
      error = "external hook '" + std::string(hook_name) + "' could not run: " + error;
      return false;
    }
    if (exit_code != 0) {
      error = "external hook '" + std::string(hook_name) + "' failed with exit code " +
              std::to_string(exit_code) + ": " + command;
      return false;
    }
  }
  return true;
}

std::size_t FileExternalHooks::CommandCount(std::string_view hook_name) const {
  const auto it = commands_by_hook_.find(hook_name);
  return it == commands_by_hook_.end() ? 0U : it->second.size();
}

std::vector<fs::path> SplitHookFileList(std::string_view raw) {
  std::vector<fs::path> paths;
  std::size_t begin = 0;
  while (begin <= raw.size()) {
    std::size_t end = raw.find(':', begin);
    if (end == std::string_view::npos) {
      end = raw.size();
    }
    if (end > begin) {
      paths.emplace_back(std::string(raw.substr(begin, end - begin)));
    }
    begin = end + 1;
  }
  return paths;
}

std::string ExpandHookCommand(std::string command_template, const std::vector<std::string>& args) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string needle = "<arg" + std::to_string(i) + ">";
    const std::string replacement = ShellQuote(args[i]);
    std::size_t pos = 0;
    while ((pos = command_template.find(needle, pos)) != std::string::npos) {
      command_template.replace(pos, needle.size(), replacement);
      pos += replacement.size();
    }
  }
  return command_template;
}

} // namespace flowexec::hooks

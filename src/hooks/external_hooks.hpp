#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace flowexec::hooks {

// Named extension points fired around a workflow run.
constexpr std::string_view kWorkflowPreExecute = "workflow.preExecute";
constexpr std::string_view kWorkflowPostExecute = "workflow.postExecute";

class IExternalHooks {
public:
  virtual ~IExternalHooks() = default;

  virtual bool Init(std::string& error) = 0;

  // Runs every callback registered for `hook_name`. A hook with no callbacks
  // succeeds without doing anything.
  virtual bool Run(std::string_view hook_name, const std::vector<std::string>& args,
                   std::string& error) = 0;
};

// Shell-command hooks loaded from JSON files.
//
// Each file is an object mapping hook names to arrays of command templates:
//   {"workflow.preExecute": ["notify-start <arg0>"]}
// `<argN>` is replaced with the N-th hook argument, single-quoted for the
// shell. Commands run in file order; a nonzero exit status fails the hook.
class FileExternalHooks final : public IExternalHooks {
public:
  static constexpr const char* kEnvVar = "FLOWEXEC_EXTERNAL_HOOK_FILES";

  // Reads the hook file list from kEnvVar (':'-separated).
  FileExternalHooks();
  explicit FileExternalHooks(std::vector<std::filesystem::path> hook_files);

  bool Init(std::string& error) override;
  bool Run(std::string_view hook_name, const std::vector<std::string>& args,
           std::string& error) override;

  std::size_t CommandCount(std::string_view hook_name) const;

private:
  std::vector<std::filesystem::path> hook_files_;
  std::map<std::string, std::vector<std::string>, std::less<>> commands_by_hook_;
};

// Splits a ':'-separated path list, dropping empty entries.
std::vector<std::filesystem::path> SplitHookFileList(std::string_view raw);

// Expands `<argN>` placeholders with shell-quoted arguments.
std::string ExpandHookCommand(std::string command_template, const std::vector<std::string>& args);

} // namespace flowexec::hooks

#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/fakes.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

using flowexec::tests::common::AssertContains;
using flowexec::tests::common::AssertExitCode;
using flowexec::tests::common::AssertNotContains;
using flowexec::tests::common::CapturedDispatch;
using flowexec::tests::common::DispatchCaptured;
using flowexec::tests::common::ReadFileToString;
using flowexec::tests::common::ScopedEnvOverride;
using flowexec::tests::common::WriteTextFile;

int main() {
  const fs::path temp_root =
      flowexec::tests::common::CreateUniqueTempDir("flowexec-failure-smoke");
  const fs::path user_folder = temp_root / "user";
  const fs::path workflow_path = temp_root / "start-noop.json";
  const fs::path log_path = temp_root / "logs" / "flowexec.log";
  WriteTextFile(workflow_path, flowexec::tests::common::kStartNoopWorkflowJson);

  // A node that fails inside the engine is an execution error.
  {
    ScopedEnvOverride fail_node("FLOWEXEC_SIM_FAIL_NODE", std::string("Noop"));
    const CapturedDispatch failed = DispatchCaptured({
        "flowexec",
        "execute",
        "--file=" + workflow_path.string(),
        "--user-folder=" + user_folder.string(),
        "--log-file=" + log_path.string(),
    });
    AssertExitCode(failed.exit_code, 1, "simulated node failure", failed.stdout_text);
    AssertContains(failed.stdout_text,
                   "Execution was NOT successful. See log message for details.");
    AssertNotContains(failed.stdout_text, "Execution was successful");
    AssertContains(failed.stderr_text, "Error executing workflow. See log messages for details.");

    const std::string log_text = ReadFileToString(log_path);
    AssertContains(log_text, "level=ERROR");
    AssertContains(log_text, "message=\"simulated failure in node \\\"Noop\\\"\"");
    AssertContains(log_text, "level=INFO");
    AssertContains(log_text, "lastNodeExecuted");
  }

  // A failing pre-execute hook stops the run before dispatch.
  {
    const fs::path hook_file = temp_root / "hooks.json";
    WriteTextFile(hook_file, R"({"workflow.preExecute": ["exit 3"]})");
    ScopedEnvOverride hook_files("FLOWEXEC_EXTERNAL_HOOK_FILES", hook_file.string());
    const CapturedDispatch hooked = DispatchCaptured({
        "flowexec",
        "execute",
        "--file=" + workflow_path.string(),
        "--user-folder=" + user_folder.string(),
    });
    AssertExitCode(hooked.exit_code, 1, "failing pre-execute hook", hooked.stderr_text);
    AssertContains(hooked.stderr_text, "Error executing workflow.");
    AssertContains(hooked.stderr_text, "failed with exit code 3");
  }

  // Broken credentials overwrite data is fatal during initialization.
  {
    ScopedEnvOverride overwrites("FLOWEXEC_CREDENTIALS_OVERWRITE_DATA",
                                 std::string("{not json"));
    const CapturedDispatch broken = DispatchCaptured({
        "flowexec",
        "execute",
        "--file=" + workflow_path.string(),
        "--user-folder=" + user_folder.string(),
    });
    AssertExitCode(broken.exit_code, 1, "invalid credentials overwrite data", broken.stderr_text);
    AssertContains(broken.stderr_text, "credentials_overwrites initialization failed");
  }

  flowexec::tests::common::RemovePathBestEffort(temp_root);
  return 0;
}

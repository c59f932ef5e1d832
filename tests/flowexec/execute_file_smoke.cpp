#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/fakes.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using flowexec::tests::common::AssertContains;
using flowexec::tests::common::AssertExitCode;
using flowexec::tests::common::AssertNotContains;
using flowexec::tests::common::CapturedDispatch;
using flowexec::tests::common::DispatchCaptured;
using flowexec::tests::common::Fail;
using flowexec::tests::common::WriteTextFile;

int main() {
  const fs::path temp_root = flowexec::tests::common::CreateUniqueTempDir("flowexec-file-smoke");
  const fs::path user_folder = temp_root / "user";
  const fs::path workflow_path = temp_root / "start-noop.json";
  WriteTextFile(workflow_path, flowexec::tests::common::kStartNoopWorkflowJson);

  const CapturedDispatch equals_form = DispatchCaptured({
      "flowexec",
      "execute",
      "--file=" + workflow_path.string(),
      "--user-folder=" + user_folder.string(),
  });
  AssertExitCode(equals_form.exit_code, 0, "execute --file=<path>", equals_form.stderr_text);
  AssertContains(equals_form.stdout_text, "Execution was successful:\n");
  AssertContains(equals_form.stdout_text, "====================================");
  AssertContains(equals_form.stdout_text, "\"runData\": {");
  AssertContains(equals_form.stdout_text, "\"Noop\": [");
  AssertContains(equals_form.stdout_text, "\"mode\": \"cli\"");
  AssertNotContains(equals_form.stderr_text, "Error executing workflow");

  // Settings are prepared on first use.
  if (!fs::exists(user_folder / "config")) {
    Fail("user settings file was not created");
  }
  if (!fs::is_directory(user_folder / "workflows")) {
    Fail("workflows directory was not created");
  }

  const CapturedDispatch separate_form = DispatchCaptured({
      "flowexec",
      "execute",
      "--file",
      workflow_path.string(),
      "--user-folder",
      user_folder.string(),
  });
  AssertExitCode(separate_form.exit_code, 0, "execute --file <path>", separate_form.stderr_text);
  AssertContains(separate_form.stdout_text, "Execution was successful:");

  const CapturedDispatch missing = DispatchCaptured({
      "flowexec",
      "execute",
      "--file=" + (temp_root / "absent.json").string(),
      "--user-folder=" + user_folder.string(),
  });
  AssertExitCode(missing.exit_code, 11, "missing workflow file", missing.stdout_text);
  AssertContains(missing.stdout_text, "could not be found.");

  const fs::path broken_path = temp_root / "broken.json";
  WriteTextFile(broken_path, "{\"nodes\": [");
  const CapturedDispatch broken = DispatchCaptured({
      "flowexec",
      "execute",
      "--file=" + broken_path.string(),
      "--user-folder=" + user_folder.string(),
  });
  AssertExitCode(broken.exit_code, 10, "malformed workflow file", broken.stdout_text);
  AssertContains(broken.stdout_text, "does not contain valid workflow data");

  const fs::path deep_path = temp_root / "deep.json";
  WriteTextFile(deep_path, std::string(200000, '['));
  const CapturedDispatch deep = DispatchCaptured({
      "flowexec",
      "execute",
      "--file=" + deep_path.string(),
      "--user-folder=" + user_folder.string(),
  });
  AssertExitCode(deep.exit_code, 10, "deeply nested workflow file", deep.stdout_text);

  flowexec::tests::common::RemovePathBestEffort(temp_root);
  return 0;
}

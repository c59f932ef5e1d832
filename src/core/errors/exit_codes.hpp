#pragma once

namespace flowexec::core::errors {

// Stable process-exit contract for CLI automation.
//
// The first three values preserve conventional meanings used by scripts:
// - 0 success
// - 1 generic failure (fatal collaborator failure or engine-reported error)
// - 2 usage/argument failure
//
// Additional values classify the workflow-source failure modes so wrappers can
// branch without scraping stdout text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kInvalidFormat = 10,
  kNotFound = 11,
  kMissingEntryPoint = 12,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace flowexec::core::errors

#pragma once

#include "core/errors/run_error.hpp"
#include "core/logging/logger.hpp"
#include "engine/execution_engine.hpp"

#include <ostream>

namespace flowexec::orchestration {

enum class OutcomeKind {
  kSuccess,
  kExecutionError,
  kFatal,
};

const char* ToString(OutcomeKind kind);

struct RunOutcome {
  OutcomeKind kind = OutcomeKind::kSuccess;
  // Empty for kSuccess. For kExecutionError this is the error derived from
  // the engine result, carrying the original message and stack.
  core::errors::RunError error;
};

// Pure mapping: embedded error present -> kExecutionError, otherwise kSuccess.
RunOutcome ClassifyResult(const engine::ExecutionResult& result);

// Failure raised before any result existed.
RunOutcome ClassifyFailure(const core::errors::RunError& error);

// Writes the user-facing report and the structured log entries for a
// terminal outcome, and returns the process exit code.
//
// - kSuccess: success banner and the pretty-printed payload on `out`
// - kExecutionError: "NOT successful" on `out`, the full payload logged at
//   info level, then reported like kFatal with the derived error
// - kFatal: banner on `err`, message and stack logged at error level
// `result` may be null for kFatal.
int ReportOutcome(const RunOutcome& outcome, const engine::ExecutionResult* result,
                  core::logging::Logger& logger, std::ostream& out, std::ostream& err);

} // namespace flowexec::orchestration

#include "orchestration/outcome_classifier.hpp"

#include "core/errors/exit_codes.hpp"
#include "core/json_dom.hpp"

#include <string>
#include <string_view>

namespace flowexec::orchestration {

namespace {

constexpr std::string_view kSeparator = "====================================";

void ReportFailure(const core::errors::RunError& error, core::logging::Logger& logger,
                   std::ostream& err) {
  err << "Error executing workflow. See log messages for details.\n";
  logger.Error("Execution error:",
               {{"kind", core::errors::ToString(error.kind)},
                {"message", error.message},
                {"stack", error.stack}});
}

} // namespace

const char* ToString(OutcomeKind kind) {
  switch (kind) {
  case OutcomeKind::kSuccess:
    return "success";
  case OutcomeKind::kExecutionError:
    return "execution_error";
  case OutcomeKind::kFatal:
    return "fatal";
  }

  return "fatal";
}

RunOutcome ClassifyResult(const engine::ExecutionResult& result) {
  RunOutcome outcome;
  if (!result.error.has_value()) {
    outcome.kind = OutcomeKind::kSuccess;
    return outcome;
  }

  outcome.kind = OutcomeKind::kExecutionError;
  outcome.error = core::errors::MakeRunError(core::errors::RunErrorKind::kExecution,
                                             result.error->message, result.error->stack);
  return outcome;
}

RunOutcome ClassifyFailure(const core::errors::RunError& error) {
  RunOutcome outcome;
  outcome.kind = error.kind == core::errors::RunErrorKind::kExecution
                     ? OutcomeKind::kExecutionError
                     : OutcomeKind::kFatal;
  outcome.error = error;
  return outcome;
}

int ReportOutcome(const RunOutcome& outcome, const engine::ExecutionResult* result,
                  core::logging::Logger& logger, std::ostream& out, std::ostream& err) {
  switch (outcome.kind) {
  case OutcomeKind::kSuccess: {
    const std::string dump =
        result != nullptr ? core::json::Serialize(result->payload, 2) : std::string("null");
    out << "Execution was successful:\n" << kSeparator << '\n' << dump << '\n';
    logger.Info("execution finished", {{"outcome", ToString(outcome.kind)}});
    return core::errors::ToInt(core::errors::ExitCode::kSuccess);
  }
  case OutcomeKind::kExecutionError:
    out << "Execution was NOT successful. See log message for details.\n";
    if (result != nullptr) {
      logger.Info("Execution error:", {{"result", core::json::Serialize(result->payload)}});
    }
    ReportFailure(outcome.error, logger, err);
    return core::errors::ToInt(core::errors::ExitCode::kFailure);
  case OutcomeKind::kFatal:
    ReportFailure(outcome.error, logger, err);
    return core::errors::ToInt(core::errors::ExitCode::kFailure);
  }

  return core::errors::ToInt(core::errors::ExitCode::kFailure);
}

} // namespace flowexec::orchestration

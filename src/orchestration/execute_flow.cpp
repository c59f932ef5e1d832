#include "orchestration/execute_flow.hpp"

#include "core/errors/exit_codes.hpp"
#include "orchestration/completion_waiter.hpp"
#include "orchestration/execution_dispatcher.hpp"
#include "orchestration/init_barrier.hpp"
#include "workflow/model.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace flowexec::orchestration {

namespace {

using core::errors::MakeRunError;
using core::errors::RunError;
using core::errors::RunErrorKind;

bool StartReadinessPoints(InitBarrier& barrier, const ExecuteServices& services,
                          std::string& error) {
  if (!barrier.Start(
          kReadyStorage,
          [&storage = services.storage](std::string& task_error) {
            return storage.Init(task_error);
          },
          error)) {
    return false;
  }
  if (!barrier.Start(
          kReadyTypes,
          [&services](std::string& task_error) {
            return types::LoadAndRegisterTypes(services.type_loader, services.node_types,
                                               services.credential_types, task_error);
          },
          error)) {
    return false;
  }
  if (!barrier.Start(
          kReadyCredentialsOverwrites,
          [&overwrites = services.credentials_overwrites](std::string& task_error) {
            return overwrites.Init(task_error);
          },
          error)) {
    return false;
  }
  return barrier.Start(
      kReadyExternalHooks,
      [&hooks = services.external_hooks](std::string& task_error) {
        return hooks.Init(task_error);
      },
      error);
}

bool AwaitPoint(InitBarrier& barrier, std::string_view name, RunError& error) {
  std::string barrier_error;
  if (!barrier.Await(name, barrier_error)) {
    error = MakeRunError(RunErrorKind::kFatal,
                         std::string(name) + " initialization failed: " + barrier_error);
    return false;
  }
  return true;
}

// Storage first, then user settings, then the remaining points in any order.
bool AwaitBarrier(InitBarrier& barrier, const ExecuteServices& services, RunError& error) {
  if (!AwaitPoint(barrier, kReadyStorage, error)) {
    return false;
  }

  std::string settings_error;
  if (!services.user_settings.Prepare(settings_error)) {
    error = MakeRunError(RunErrorKind::kFatal,
                         "user settings could not be prepared: " + settings_error);
    return false;
  }

  return AwaitPoint(barrier, kReadyTypes, error) &&
         AwaitPoint(barrier, kReadyCredentialsOverwrites, error) &&
         AwaitPoint(barrier, kReadyExternalHooks, error);
}

bool RunHook(hooks::IExternalHooks& external_hooks, std::string_view hook_name,
             std::vector<std::string> args, RunError& error) {
  std::string hook_error;
  if (!external_hooks.Run(hook_name, args, hook_error)) {
    error = MakeRunError(RunErrorKind::kFatal, hook_error);
    return false;
  }
  return true;
}

// Resolution and validation failures are plain user-facing messages.
int ReportEarlyFailure(const RunError& error, FlowStage stage, core::logging::Logger& logger,
                       std::ostream& out) {
  out << error.message << '\n';
  logger.Debug("execute stopped before dispatch",
               {{"stage", ToString(stage)}, {"kind", core::errors::ToString(error.kind)}});
  return core::errors::ToInt(core::errors::ToExitCode(error.kind));
}

int ReportFatal(const RunError& error, core::logging::Logger& logger, std::ostream& out,
                std::ostream& err, ExecuteReport& report) {
  report.outcome = ClassifyFailure(error);
  return ReportOutcome(*report.outcome, nullptr, logger, out, err);
}

} // namespace

const char* ToString(FlowStage stage) {
  switch (stage) {
  case FlowStage::kInit:
    return "init";
  case FlowStage::kResolveSource:
    return "resolve_source";
  case FlowStage::kValidateStartNode:
    return "validate_start_node";
  case FlowStage::kAwaitBarrier:
    return "await_barrier";
  case FlowStage::kDispatch:
    return "dispatch";
  case FlowStage::kAwaitCompletion:
    return "await_completion";
  case FlowStage::kClassify:
    return "classify";
  case FlowStage::kDone:
    return "done";
  }

  return "init";
}

int RunExecute(const ExecuteOptions& options, const ExecuteServices& services,
               core::logging::Logger& logger, std::ostream& out, std::ostream& err,
               ExecuteReport* report) {
  ExecuteReport local_report;
  ExecuteReport& state = report != nullptr ? *report : local_report;
  state = ExecuteReport{};

  // Declared first so every pending init task is joined after all other
  // locals are gone.
  InitBarrier barrier;
  RunError run_error;

  state.stage = FlowStage::kInit;
  std::string init_error;
  if (!StartReadinessPoints(barrier, services, init_error)) {
    state.exit_code =
        ReportFatal(MakeRunError(RunErrorKind::kFatal, init_error), logger, out, err, state);
    return state.exit_code;
  }

  state.stage = FlowStage::kResolveSource;
  const workflow::WorkflowSourceResolver resolver(
      services.storage,
      [&barrier](std::string& gate_error) { return barrier.Await(kReadyStorage, gate_error); });
  workflow::WorkflowDefinition definition;
  if (!resolver.Resolve(options.source, definition, run_error)) {
    // Storage that never became ready is fatal, not a lookup miss.
    state.exit_code = run_error.kind == RunErrorKind::kFatal
                          ? ReportFatal(run_error, logger, out, err, state)
                          : ReportEarlyFailure(run_error, state.stage, logger, out);
    return state.exit_code;
  }
  logger.Info("workflow resolved",
              {{"source", options.source.file_path.has_value() &&
                                  !options.source.file_path->empty()
                              ? "file"
                              : "id"},
               {"workflow_id", definition.id},
               {"node_count", std::to_string(definition.nodes.size())}});

  state.stage = FlowStage::kValidateStartNode;
  const workflow::StartNodeValidator validator(options.is_entry_node);
  const workflow::Node* start_node = validator.FindStartNode(definition, run_error);
  if (start_node == nullptr) {
    state.exit_code = ReportEarlyFailure(run_error, state.stage, logger, out);
    return state.exit_code;
  }

  state.stage = FlowStage::kAwaitBarrier;
  if (!AwaitBarrier(barrier, services, run_error)) {
    state.exit_code = ReportFatal(run_error, logger, out, err, state);
    return state.exit_code;
  }

  if (!workflow::IsWorkflowIdValid(definition.id)) {
    definition.id.clear();
  }
  state.workflow_id = definition.id;

  state.stage = FlowStage::kDispatch;
  if (!RunHook(services.external_hooks, hooks::kWorkflowPreExecute,
               {definition.id, std::string(engine::kExecutionModeCli)}, run_error)) {
    state.exit_code = ReportFatal(run_error, logger, out, err, state);
    return state.exit_code;
  }

  ExecutionDispatcher dispatcher(services.engine, services.credentials_resolver);
  engine::ExecutionHandle handle;
  if (!dispatcher.Dispatch(definition, *start_node, handle, run_error)) {
    state.exit_code = ReportFatal(run_error, logger, out, err, state);
    return state.exit_code;
  }
  state.execution_id = handle.ExecutionId();
  logger.SetRunId(state.execution_id);
  logger.Info("execution dispatched",
              {{"workflow_id", definition.id}, {"start_node", start_node->name}});

  state.stage = FlowStage::kAwaitCompletion;
  CompletionWaiter waiter(services.engine);
  engine::ExecutionResult result;
  if (!waiter.Await(std::move(handle), result, run_error)) {
    state.exit_code = ReportFatal(run_error, logger, out, err, state);
    return state.exit_code;
  }

  state.stage = FlowStage::kClassify;
  state.outcome = ClassifyResult(result);
  state.exit_code = ReportOutcome(*state.outcome, &result, logger, out, err);

  // Runs after the result is reported; a failure never changes the outcome.
  if (!RunHook(services.external_hooks, hooks::kWorkflowPostExecute,
               {definition.id, std::string(engine::kExecutionModeCli),
                result.finished ? "true" : "false"},
               run_error)) {
    logger.Error("post-execute hook failed",
                 {{"hook", hooks::kWorkflowPostExecute}, {"message", run_error.message}});
    state.exit_code = core::errors::ToInt(core::errors::ExitCode::kFailure);
  }

  state.stage = FlowStage::kDone;
  return state.exit_code;
}

} // namespace flowexec::orchestration

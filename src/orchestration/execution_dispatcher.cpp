#include "orchestration/execution_dispatcher.hpp"

#include <string>
#include <utility>
#include <vector>

namespace flowexec::orchestration {

using core::errors::MakeRunError;
using core::errors::RunErrorKind;

ExecutionDispatcher::ExecutionDispatcher(engine::IExecutionEngine& engine,
                                         credentials::ICredentialsResolver& credentials_resolver)
    : engine_(engine), credentials_resolver_(credentials_resolver) {}

bool ExecutionDispatcher::Dispatch(const workflow::WorkflowDefinition& workflow,
                                   const workflow::Node& start_node,
                                   engine::ExecutionHandle& handle,
                                   core::errors::RunError& error) {
  std::string collaborator_error;
  credentials::CredentialsSnapshot credentials;
  if (!credentials_resolver_.Resolve(workflow.nodes, credentials, collaborator_error)) {
    error = MakeRunError(RunErrorKind::kFatal, collaborator_error);
    return false;
  }

  const engine::ExecutionRequest request(std::move(credentials),
                                         std::string(engine::kExecutionModeCli),
                                         std::vector<std::string>{start_node.name}, workflow);

  engine::ExecutionHandle dispatched;
  if (!engine_.Dispatch(request, dispatched, collaborator_error)) {
    error = MakeRunError(RunErrorKind::kFatal, "engine rejected the execution: " + collaborator_error);
    return false;
  }
  if (dispatched.Empty()) {
    error = MakeRunError(RunErrorKind::kFatal, "engine returned an empty execution handle");
    return false;
  }

  handle = std::move(dispatched);
  return true;
}

} // namespace flowexec::orchestration

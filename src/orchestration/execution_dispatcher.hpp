#pragma once

#include "core/errors/run_error.hpp"
#include "credentials/credentials_resolver.hpp"
#include "engine/execution_engine.hpp"
#include "workflow/model.hpp"

namespace flowexec::orchestration {

// Builds the one ExecutionRequest of a run and submits it to the engine.
//
// The request carries the resolved credentials snapshot, mode "cli", the
// matched start node's name as the only start node, and a copy of the
// workflow. Dispatch returns as soon as the engine handed out a handle; it
// never waits for completion. Any collaborator failure is kFatal.
class ExecutionDispatcher {
public:
  ExecutionDispatcher(engine::IExecutionEngine& engine,
                      credentials::ICredentialsResolver& credentials_resolver);

  bool Dispatch(const workflow::WorkflowDefinition& workflow, const workflow::Node& start_node,
                engine::ExecutionHandle& handle, core::errors::RunError& error);

private:
  engine::IExecutionEngine& engine_;
  credentials::ICredentialsResolver& credentials_resolver_;
};

} // namespace flowexec::orchestration

#pragma once

#include "core/errors/run_error.hpp"
#include "engine/execution_engine.hpp"

namespace flowexec::orchestration {

// Blocks until the engine delivered the single result of a dispatched run.
//
// Takes the handle by value so the caller's handle is consumed. An empty
// handle, an unknown id or an engine-side failure is kFatal. There is no
// timeout; the engine alone bounds the wait.
class CompletionWaiter {
public:
  explicit CompletionWaiter(engine::IExecutionEngine& engine);

  bool Await(engine::ExecutionHandle handle, engine::ExecutionResult& result,
             core::errors::RunError& error);

private:
  engine::IExecutionEngine& engine_;
};

} // namespace flowexec::orchestration

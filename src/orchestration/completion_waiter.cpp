#include "orchestration/completion_waiter.hpp"

#include <string>

namespace flowexec::orchestration {

using core::errors::MakeRunError;
using core::errors::RunErrorKind;

CompletionWaiter::CompletionWaiter(engine::IExecutionEngine& engine) : engine_(engine) {}

bool CompletionWaiter::Await(engine::ExecutionHandle handle, engine::ExecutionResult& result,
                             core::errors::RunError& error) {
  if (handle.Empty()) {
    error = MakeRunError(RunErrorKind::kFatal, "cannot wait on an empty execution handle");
    return false;
  }

  std::string engine_error;
  if (!engine_.AwaitResult(handle.ExecutionId(), result, engine_error)) {
    error = MakeRunError(RunErrorKind::kFatal, engine_error);
    return false;
  }
  return true;
}

} // namespace flowexec::orchestration

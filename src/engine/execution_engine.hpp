#pragma once

#include "core/json_dom.hpp"
#include "credentials/credentials_resolver.hpp"
#include "workflow/model.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace flowexec::engine {

constexpr std::string_view kExecutionModeCli = "cli";

// Immutable run request built once per invocation. There are no setters; the
// only way to obtain one is the constructor.
class ExecutionRequest {
public:
  ExecutionRequest(credentials::CredentialsSnapshot credentials, std::string execution_mode,
                   std::vector<std::string> start_nodes, workflow::WorkflowDefinition workflow)
      : credentials_(std::move(credentials)),
        execution_mode_(std::move(execution_mode)),
        start_nodes_(std::move(start_nodes)),
        workflow_(std::move(workflow)) {}

  const credentials::CredentialsSnapshot& Credentials() const {
    return credentials_;
  }

  const std::string& ExecutionMode() const {
    return execution_mode_;
  }

  const std::vector<std::string>& StartNodes() const {
    return start_nodes_;
  }

  const workflow::WorkflowDefinition& Workflow() const {
    return workflow_;
  }

private:
  credentials::CredentialsSnapshot credentials_;
  std::string execution_mode_;
  std::vector<std::string> start_nodes_;
  workflow::WorkflowDefinition workflow_;
};

// Opaque id correlating one dispatched run with its single result.
//
// Move-only: waiting consumes the handle, and a moved-from handle is empty,
// so the same run cannot be awaited twice through one handle.
class ExecutionHandle {
public:
  ExecutionHandle() = default;
  explicit ExecutionHandle(std::string execution_id) : execution_id_(std::move(execution_id)) {}

  ExecutionHandle(const ExecutionHandle&) = delete;
  ExecutionHandle& operator=(const ExecutionHandle&) = delete;

  ExecutionHandle(ExecutionHandle&& other) noexcept
      : execution_id_(std::exchange(other.execution_id_, std::string())) {}

  ExecutionHandle& operator=(ExecutionHandle&& other) noexcept {
    execution_id_ = std::exchange(other.execution_id_, std::string());
    return *this;
  }

  const std::string& ExecutionId() const {
    return execution_id_;
  }

  bool Empty() const {
    return execution_id_.empty();
  }

private:
  std::string execution_id_;
};

struct ExecutionError {
  std::string message;
  std::string stack;
};

// Delivered exactly once per handle.
struct ExecutionResult {
  bool finished = false;
  std::optional<ExecutionError> error;
  // Full engine payload, dumped verbatim for post-mortem inspection.
  core::json::Value payload;
};

// Workflow execution engine contract.
class IExecutionEngine {
public:
  virtual ~IExecutionEngine() = default;

  // Submits a run and returns its handle without waiting for completion.
  virtual bool Dispatch(const ExecutionRequest& request, ExecutionHandle& handle,
                        std::string& error) = 0;

  // Blocks until the run behind `execution_id` delivered its result. Fails for
  // unknown ids and for ids whose result was already taken.
  virtual bool AwaitResult(const std::string& execution_id, ExecutionResult& result,
                           std::string& error) = 0;
};

// Extracts the embedded error from a result payload: `data.resultData.error`
// for full run data, or a top-level `error` object. Returns nullopt when
// neither is present.
std::optional<ExecutionError> ExtractResultError(const core::json::Value& payload);

// Builds an ExecutionResult from a raw payload document.
ExecutionResult MakeResultFromPayload(core::json::Value payload);

} // namespace flowexec::engine

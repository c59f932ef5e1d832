#pragma once

#include "engine/execution_engine.hpp"
#include "types/type_registry.hpp"

#include <cstdint>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace flowexec::engine::sim {

// Deterministic, side-effect-free engine used when no external engine is
// wired in.
//
// Each dispatched run executes on its own worker thread. The worker walks the
// nodes reachable from the start nodes (breadth-first over
// `connections.<node>.main[][].node`) and records one run-data entry per node,
// passing items through unchanged. It does not implement node behavior.
//
// Fault injection:
// - a node whose type is not registered ends the run with an error result
// - the node named by FLOWEXEC_SIM_FAIL_NODE ends the run with an error result
class SimExecutionEngine final : public IExecutionEngine {
public:
  static constexpr const char* kFailNodeEnvVar = "FLOWEXEC_SIM_FAIL_NODE";

  // Reads the fault-injection node name from kFailNodeEnvVar.
  explicit SimExecutionEngine(const types::NodeTypeRegistry& node_types);
  SimExecutionEngine(const types::NodeTypeRegistry& node_types,
                     std::optional<std::string> fail_node);

  // Joins every worker whose result was never awaited.
  ~SimExecutionEngine() override = default;

  SimExecutionEngine(const SimExecutionEngine&) = delete;
  SimExecutionEngine& operator=(const SimExecutionEngine&) = delete;

  bool Dispatch(const ExecutionRequest& request, ExecutionHandle& handle,
                std::string& error) override;
  bool AwaitResult(const std::string& execution_id, ExecutionResult& result,
                   std::string& error) override;

  // Number of dispatched runs whose result has not been taken yet.
  std::size_t ActiveCount() const;

private:
  const types::NodeTypeRegistry& node_types_;
  std::optional<std::string> fail_node_;

  mutable std::mutex mu_;
  std::uint64_t next_execution_id_ = 1;
  std::map<std::string, std::future<ExecutionResult>> active_runs_;
};

// Runs one simulated execution synchronously. Exposed for tests.
ExecutionResult Simulate(const ExecutionRequest& request,
                         const types::NodeTypeRegistry& node_types,
                         const std::optional<std::string>& fail_node);

} // namespace flowexec::engine::sim

#include "engine/sim/sim_execution_engine.hpp"

#include "common/fakes.hpp"

#include <catch2/catch.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace json = flowexec::core::json;

using flowexec::engine::ExecutionHandle;
using flowexec::engine::ExecutionRequest;
using flowexec::engine::ExecutionResult;
using flowexec::engine::ExtractResultError;
using flowexec::engine::MakeResultFromPayload;
using flowexec::engine::sim::SimExecutionEngine;
using flowexec::engine::sim::Simulate;
using flowexec::tests::common::MakeNode;
using flowexec::types::NodeTypeRegistry;
using flowexec::workflow::WorkflowDefinition;

namespace {

NodeTypeRegistry MakeNodeTypes() {
  NodeTypeRegistry registry;
  std::string error;
  REQUIRE(registry.Init({{"n8n-nodes-base.start", "Start"},
                         {"n8n-nodes-base.noOp", "No Op"},
                         {"n8n-nodes-base.set", "Set"}},
                        error));
  return registry;
}

// Start -> A -> B, plus an unreachable C.
WorkflowDefinition MakeChain() {
  WorkflowDefinition workflow;
  workflow.id = "5";
  workflow.nodes.push_back(MakeNode("Start", "n8n-nodes-base.start"));
  workflow.nodes.push_back(MakeNode("A", "n8n-nodes-base.noOp"));
  workflow.nodes.push_back(MakeNode("B", "n8n-nodes-base.set"));
  workflow.nodes.push_back(MakeNode("C", "n8n-nodes-base.noOp"));

  std::string error;
  REQUIRE(json::Parse(R"({
    "Start": {"main": [[{"node": "A", "type": "main", "index": 0}]]},
    "A": {"main": [[{"node": "B", "type": "main", "index": 0}]]}
  })",
                      workflow.connections, error));
  return workflow;
}

ExecutionRequest MakeRequest(WorkflowDefinition workflow) {
  return ExecutionRequest({}, "cli", {"Start"}, std::move(workflow));
}

const json::Value* RunData(const ExecutionResult& result) {
  const json::Value* data = json::GetField(result.payload, "data");
  const json::Value* result_data = json::GetField(*data, "resultData");
  return json::GetField(*result_data, "runData");
}

} // namespace

TEST_CASE("Simulate walks reachable nodes from the start node", "[engine][sim]") {
  const NodeTypeRegistry node_types = MakeNodeTypes();
  const ExecutionResult result = Simulate(MakeRequest(MakeChain()), node_types, std::nullopt);

  REQUIRE(result.finished);
  REQUIRE_FALSE(result.error.has_value());
  const json::Value* run_data = RunData(result);
  REQUIRE(run_data->object_value.size() == 3U);
  REQUIRE(run_data->object_value.count("B") == 1U);
  REQUIRE(run_data->object_value.count("C") == 0U);
  REQUIRE(json::GetField(result.payload, "mode")->string_value == "cli");
  REQUIRE(json::GetField(result.payload, "workflowId")->string_value == "5");
}

TEST_CASE("Simulate skips disabled nodes but keeps walking", "[engine][sim]") {
  const NodeTypeRegistry node_types = MakeNodeTypes();
  WorkflowDefinition workflow = MakeChain();
  workflow.nodes[1].disabled = true;

  const ExecutionResult result = Simulate(MakeRequest(workflow), node_types, std::nullopt);
  REQUIRE(result.finished);
  const json::Value* run_data = RunData(result);
  REQUIRE(run_data->object_value.count("A") == 0U);
  REQUIRE(run_data->object_value.count("B") == 1U);
}

TEST_CASE("Simulate ends with an error for unknown types and injected faults", "[engine][sim]") {
  const NodeTypeRegistry node_types = MakeNodeTypes();

  WorkflowDefinition unknown_type = MakeChain();
  unknown_type.nodes[2].type = "acme.missing";
  const ExecutionResult unknown = Simulate(MakeRequest(unknown_type), node_types, std::nullopt);
  REQUIRE_FALSE(unknown.finished);
  REQUIRE(unknown.error.has_value());
  REQUIRE(unknown.error->message == "Unrecognized node type: acme.missing");

  const ExecutionResult injected =
      Simulate(MakeRequest(MakeChain()), node_types, std::optional<std::string>("A"));
  REQUIRE(injected.error.has_value());
  REQUIRE(injected.error->message == "simulated failure in node \"A\"");
  REQUIRE_FALSE(injected.error->stack.empty());
  REQUIRE(RunData(injected)->object_value.count("B") == 0U);
}

TEST_CASE("SimExecutionEngine delivers each result exactly once", "[engine][sim]") {
  const NodeTypeRegistry node_types = MakeNodeTypes();
  SimExecutionEngine engine(node_types, std::nullopt);

  ExecutionHandle first;
  ExecutionHandle second;
  std::string error;
  REQUIRE(engine.Dispatch(MakeRequest(MakeChain()), first, error));
  REQUIRE(engine.Dispatch(MakeRequest(MakeChain()), second, error));
  REQUIRE(first.ExecutionId() != second.ExecutionId());
  REQUIRE(engine.ActiveCount() == 2U);

  ExecutionResult result;
  REQUIRE(engine.AwaitResult(second.ExecutionId(), result, error));
  REQUIRE(result.finished);
  REQUIRE(engine.AwaitResult(first.ExecutionId(), result, error));
  REQUIRE(engine.ActiveCount() == 0U);

  REQUIRE_FALSE(engine.AwaitResult(first.ExecutionId(), result, error));
  REQUIRE(error.find("no active execution") != std::string::npos);
}

TEST_CASE("SimExecutionEngine rejects requests without start nodes", "[engine][sim]") {
  const NodeTypeRegistry node_types = MakeNodeTypes();
  SimExecutionEngine engine(node_types, std::nullopt);
  ExecutionHandle handle;
  std::string error;
  REQUIRE_FALSE(engine.Dispatch(ExecutionRequest({}, "cli", {}, MakeChain()), handle, error));
  REQUIRE(handle.Empty());
}

TEST_CASE("ExtractResultError reads nested and top-level errors", "[engine]") {
  json::Value nested;
  std::string error;
  REQUIRE(json::Parse(R"({"data": {"resultData": {"error": {"message": "m", "stack": "s"}}}})",
                      nested, error));
  const auto nested_error = ExtractResultError(nested);
  REQUIRE(nested_error.has_value());
  REQUIRE(nested_error->message == "m");
  REQUIRE(nested_error->stack == "s");

  json::Value top_level;
  REQUIRE(json::Parse(R"({"error": "plain"})", top_level, error));
  REQUIRE(ExtractResultError(top_level)->message == "plain");

  json::Value clean;
  REQUIRE(json::Parse(R"({"finished": true})", clean, error));
  REQUIRE_FALSE(ExtractResultError(clean).has_value());
  REQUIRE(MakeResultFromPayload(clean).finished);
}

#include "engine/sim/sim_execution_engine.hpp"

#include "core/time_utils.hpp"

#include <cstdint>
#include <cstdlib>
#include <deque>
#include <exception>
#include <map>
#include <set>
#include <system_error>
#include <utility>
#include <vector>

namespace flowexec::engine::sim {

namespace {

using JsonValue = core::json::Value;

std::optional<std::string> ReadFailNodeFromEnv() {
  const char* raw = std::getenv(SimExecutionEngine::kFailNodeEnvVar);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  return std::string(raw);
}

std::int64_t NowMillis() {
  return core::ToEpochMillis(core::Clock::now());
}

// Successor names in connection order: main outputs first to last, and within
// each output the listed targets in order.
std::vector<std::string> ListSuccessors(const JsonValue& connections, const std::string& name) {
  std::vector<std::string> successors;
  const JsonValue* by_type = core::json::GetField(connections, name);
  if (by_type == nullptr) {
    return successors;
  }
  const JsonValue* main_outputs = core::json::GetField(*by_type, "main");
  if (!core::json::IsArray(main_outputs)) {
    return successors;
  }

  for (const JsonValue& output : main_outputs->array_value) {
    if (output.type != JsonValue::Type::kArray) {
      continue;
    }
    for (const JsonValue& target : output.array_value) {
      const JsonValue* target_name = core::json::GetField(target, "node");
      if (core::json::IsString(target_name)) {
        successors.push_back(target_name->string_value);
      }
    }
  }
  return successors;
}

JsonValue BuildErrorObject(const workflow::Node& node, const std::string& message,
                           const std::string& stack) {
  JsonValue error = core::json::MakeObject();
  error.object_value["message"] = core::json::MakeString(message);
  error.object_value["stack"] = core::json::MakeString(stack);

  JsonValue failed_node = core::json::MakeObject();
  failed_node.object_value["name"] = core::json::MakeString(node.name);
  failed_node.object_value["type"] = core::json::MakeString(node.type);
  error.object_value["node"] = std::move(failed_node);
  return error;
}

JsonValue BuildTaskData(std::int64_t start_ms, const JsonValue& items) {
  JsonValue main_output = core::json::MakeArray();
  main_output.array_value.push_back(items);

  JsonValue data = core::json::MakeObject();
  data.object_value["main"] = std::move(main_output);

  JsonValue task = core::json::MakeObject();
  task.object_value["startTime"] = core::json::MakeNumber(static_cast<double>(start_ms));
  task.object_value["executionTime"] =
      core::json::MakeNumber(static_cast<double>(NowMillis() - start_ms));
  task.object_value["data"] = std::move(data);
  return task;
}

} // namespace

SimExecutionEngine::SimExecutionEngine(const types::NodeTypeRegistry& node_types)
    : SimExecutionEngine(node_types, ReadFailNodeFromEnv()) {}

SimExecutionEngine::SimExecutionEngine(const types::NodeTypeRegistry& node_types,
                                       std::optional<std::string> fail_node)
    : node_types_(node_types), fail_node_(std::move(fail_node)) {}

bool SimExecutionEngine::Dispatch(const ExecutionRequest& request, ExecutionHandle& handle,
                                  std::string& error) {
  error.clear();
  if (request.StartNodes().empty()) {
    error = "execution request has no start nodes";
    return false;
  }

  std::lock_guard<std::mutex> lock(mu_);
  const std::string execution_id = std::to_string(next_execution_id_++);
  try {
    active_runs_.emplace(execution_id,
                         std::async(std::launch::async,
                                    [request, this]() {
                                      return Simulate(request, node_types_, fail_node_);
                                    }));
  } catch (const std::system_error& ex) {
    error = std::string("failed to start execution worker: ") + ex.what();
    return false;
  }

  handle = ExecutionHandle(execution_id);
  return true;
}

bool SimExecutionEngine::AwaitResult(const std::string& execution_id, ExecutionResult& result,
                                     std::string& error) {
  error.clear();

  std::future<ExecutionResult> pending;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = active_runs_.find(execution_id);
    if (it == active_runs_.end()) {
      error = "no active execution with id '" + execution_id + "'";
      return false;
    }
    pending = std::move(it->second);
    active_runs_.erase(it);
  }

  try {
    result = pending.get();
  } catch (const std::exception& ex) {
    error = "execution " + execution_id + " failed inside the engine: " + ex.what();
    return false;
  }
  return true;
}

std::size_t SimExecutionEngine::ActiveCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return active_runs_.size();
}

ExecutionResult Simulate(const ExecutionRequest& request,
                         const types::NodeTypeRegistry& node_types,
                         const std::optional<std::string>& fail_node) {
  const workflow::WorkflowDefinition& workflow = request.Workflow();
  const auto started_at = core::Clock::now();

  std::map<std::string, const workflow::Node*> nodes_by_name;
  for (const workflow::Node& node : workflow.nodes) {
    nodes_by_name.emplace(node.name, &node);
  }

  JsonValue run_data = core::json::MakeObject();
  JsonValue result_data = core::json::MakeObject();
  std::optional<JsonValue> error_object;
  std::string last_node_executed;

  JsonValue initial_items = core::json::MakeArray();
  JsonValue empty_item = core::json::MakeObject();
  empty_item.object_value["json"] = core::json::MakeObject();
  initial_items.array_value.push_back(std::move(empty_item));

  std::deque<std::string> queue(request.StartNodes().begin(), request.StartNodes().end());
  std::set<std::string> visited;
  while (!queue.empty() && !error_object.has_value()) {
    const std::string name = queue.front();
    queue.pop_front();
    if (!visited.insert(name).second) {
      continue;
    }

    const auto it = nodes_by_name.find(name);
    if (it == nodes_by_name.end()) {
      workflow::Node missing;
      missing.name = name;
      error_object = BuildErrorObject(missing, "node \"" + name + "\" is not part of the workflow",
                                      "Error: node \"" + name + "\" is not part of the workflow");
      break;
    }
    const workflow::Node& node = *it->second;

    if (!node.disabled) {
      const std::int64_t start_ms = NowMillis();
      last_node_executed = node.name;

      if (!node_types.Has(node.type)) {
        const std::string message = "Unrecognized node type: " + node.type;
        error_object = BuildErrorObject(node, message,
                                        "Error: " + message + "\n    at node \"" + node.name + "\"");
        break;
      }
      if (fail_node.has_value() && *fail_node == node.name) {
        const std::string message = "simulated failure in node \"" + node.name + "\"";
        error_object = BuildErrorObject(node, message,
                                        "SimulatedError: " + message + "\n    at node \"" +
                                            node.name + "\"");
        break;
      }

      JsonValue node_runs = core::json::MakeArray();
      node_runs.array_value.push_back(BuildTaskData(start_ms, initial_items));
      run_data.object_value[node.name] = std::move(node_runs);
    }

    for (std::string& successor : ListSuccessors(workflow.connections, node.name)) {
      queue.push_back(std::move(successor));
    }
  }

  result_data.object_value["runData"] = std::move(run_data);
  if (!last_node_executed.empty()) {
    result_data.object_value["lastNodeExecuted"] = core::json::MakeString(last_node_executed);
  }
  if (error_object.has_value()) {
    result_data.object_value["error"] = *error_object;
  }

  JsonValue data = core::json::MakeObject();
  data.object_value["resultData"] = std::move(result_data);

  JsonValue payload = core::json::MakeObject();
  payload.object_value["data"] = std::move(data);
  payload.object_value["finished"] = core::json::MakeBool(!error_object.has_value());
  payload.object_value["mode"] = core::json::MakeString(request.ExecutionMode());
  payload.object_value["startedAt"] =
      core::json::MakeString(core::FormatUtcTimestamp(started_at));
  payload.object_value["stoppedAt"] =
      core::json::MakeString(core::FormatUtcTimestamp(core::Clock::now()));
  if (!workflow.id.empty()) {
    payload.object_value["workflowId"] = core::json::MakeString(workflow.id);
  }

  return MakeResultFromPayload(std::move(payload));
}

} // namespace flowexec::engine::sim

#include "workflow/model.hpp"

#include <cctype>
#include <cmath>
#include <string>
#include <utility>

namespace flowexec::workflow {

namespace {

using JsonValue = core::json::Value;

bool ParseIdField(const JsonValue& field, std::string& id, std::string& error) {
  if (field.type == JsonValue::Type::kString) {
    id = field.string_value;
    return true;
  }
  if (field.type == JsonValue::Type::kNumber) {
    if (std::floor(field.number_value) != field.number_value) {
      error = "workflow id must be a string or an integer";
      return false;
    }
    id = core::json::FormatNumber(field.number_value);
    return true;
  }
  if (field.type == JsonValue::Type::kNull) {
    id.clear();
    return true;
  }
  error = "workflow id must be a string or an integer";
  return false;
}

bool ParseCredentialRefs(const JsonValue& field, const std::string& node_path, Node& node,
                         std::string& error) {
  if (field.type != JsonValue::Type::kObject) {
    error = node_path + ".credentials must be an object";
    return false;
  }

  for (const auto& [credential_type, ref] : field.object_value) {
    // Older documents store the name directly, newer ones wrap it as {name}.
    if (ref.type == JsonValue::Type::kString) {
      node.credentials[credential_type] = ref.string_value;
      continue;
    }
    const JsonValue* ref_name = core::json::GetField(ref, "name");
    if (!core::json::IsString(ref_name)) {
      error = node_path + ".credentials." + credential_type +
              " must be a credential name or an object with a string name";
      return false;
    }
    node.credentials[credential_type] = ref_name->string_value;
  }
  return true;
}

bool ParseNode(const JsonValue& raw, std::size_t index, Node& node, std::string& error) {
  const std::string node_path = "nodes[" + std::to_string(index) + "]";
  if (raw.type != JsonValue::Type::kObject) {
    error = node_path + " must be an object";
    return false;
  }

  const JsonValue* name = core::json::GetField(raw, "name");
  if (!core::json::IsString(name)) {
    error = node_path + ".name is required and must be a string";
    return false;
  }
  const JsonValue* type = core::json::GetField(raw, "type");
  if (!core::json::IsString(type)) {
    error = node_path + ".type is required and must be a string";
    return false;
  }
  node.name = name->string_value;
  node.type = type->string_value;

  if (const JsonValue* version = core::json::GetField(raw, "typeVersion"); version != nullptr) {
    if (!core::json::IsNumber(version)) {
      error = node_path + ".typeVersion must be a number";
      return false;
    }
    node.type_version = version->number_value;
  }

  if (const JsonValue* parameters = core::json::GetField(raw, "parameters");
      parameters != nullptr) {
    if (!core::json::IsObject(parameters)) {
      error = node_path + ".parameters must be an object";
      return false;
    }
    node.parameters = *parameters;
  }

  if (const JsonValue* credentials = core::json::GetField(raw, "credentials");
      credentials != nullptr) {
    if (!ParseCredentialRefs(*credentials, node_path, node, error)) {
      return false;
    }
  }

  if (const JsonValue* disabled = core::json::GetField(raw, "disabled"); disabled != nullptr) {
    if (!core::json::IsBool(disabled)) {
      error = node_path + ".disabled must be a boolean";
      return false;
    }
    node.disabled = disabled->bool_value;
  }

  return true;
}

} // namespace

bool ParseWorkflowDefinition(const JsonValue& root, WorkflowDefinition& workflow,
                             std::string& error) {
  workflow = WorkflowDefinition{};
  error.clear();

  if (root.type != JsonValue::Type::kObject) {
    error = "workflow document must be a JSON object";
    return false;
  }

  const JsonValue* nodes = core::json::GetField(root, "nodes");
  if (!core::json::IsArray(nodes)) {
    error = "workflow document requires a `nodes` array";
    return false;
  }
  const JsonValue* connections = core::json::GetField(root, "connections");
  if (!core::json::IsObject(connections)) {
    error = "workflow document requires a `connections` object";
    return false;
  }

  if (const JsonValue* id = core::json::GetField(root, "id"); id != nullptr) {
    if (!ParseIdField(*id, workflow.id, error)) {
      return false;
    }
  }
  if (const JsonValue* name = core::json::GetField(root, "name"); core::json::IsString(name)) {
    workflow.name = name->string_value;
  }

  workflow.nodes.reserve(nodes->array_value.size());
  for (std::size_t i = 0; i < nodes->array_value.size(); ++i) {
    Node node;
    if (!ParseNode(nodes->array_value[i], i, node, error)) {
      return false;
    }
    workflow.nodes.push_back(std::move(node));
  }
  workflow.connections = *connections;

  for (const auto& [key, value] : root.object_value) {
    if (key == "id" || key == "name" || key == "nodes" || key == "connections") {
      continue;
    }
    workflow.metadata.emplace(key, value);
  }

  return true;
}

bool ParseWorkflowText(std::string_view json_text, WorkflowDefinition& workflow,
                       std::string& error) {
  JsonValue root;
  if (!core::json::Parse(json_text, root, error)) {
    return false;
  }
  return ParseWorkflowDefinition(root, workflow, error);
}

bool IsWorkflowIdValid(std::string_view id) {
  std::size_t pos = 0;
  while (pos < id.size() && std::isspace(static_cast<unsigned char>(id[pos])) != 0) {
    ++pos;
  }
  if (pos < id.size() && (id[pos] == '-' || id[pos] == '+')) {
    ++pos;
  }
  return pos < id.size() && std::isdigit(static_cast<unsigned char>(id[pos])) != 0;
}

} // namespace flowexec::workflow

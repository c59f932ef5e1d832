#include "types/type_loader.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <array>
#include <string_view>
#include <utility>

namespace fs = std::filesystem;

namespace flowexec::types {

namespace {

using JsonValue = core::json::Value;

struct BuiltinType {
  std::string_view name;
  std::string_view display_name;
};

constexpr std::array<BuiltinType, 10> kBuiltinNodeTypes = {{
    {"n8n-nodes-base.start", "Start"},
    {"n8n-nodes-base.manualTrigger", "Manual Trigger"},
    {"n8n-nodes-base.cron", "Cron"},
    {"n8n-nodes-base.noOp", "No Operation"},
    {"n8n-nodes-base.set", "Set"},
    {"n8n-nodes-base.if", "IF"},
    {"n8n-nodes-base.merge", "Merge"},
    {"n8n-nodes-base.function", "Function"},
    {"n8n-nodes-base.httpRequest", "HTTP Request"},
    {"n8n-nodes-base.stopAndError", "Stop and Error"},
}};

constexpr std::array<BuiltinType, 3> kBuiltinCredentialTypes = {{
    {"httpBasicAuth", "Basic Auth"},
    {"httpHeaderAuth", "Header Auth"},
    {"oAuth2Api", "OAuth2 API"},
}};

// Accepts either "name" or {"name": ..., "displayName": ...}.
bool ParseTypeEntry(const JsonValue& entry, std::string_view path, std::string& name,
                    std::string& display_name, std::string& error) {
  if (entry.type == JsonValue::Type::kString) {
    name = entry.string_value;
    display_name = entry.string_value;
    return true;
  }

  const JsonValue* raw_name = core::json::GetField(entry, "name");
  if (!core::json::IsString(raw_name)) {
    error = std::string(path) + " must be a type name or an object with a string name";
    return false;
  }
  name = raw_name->string_value;
  const JsonValue* raw_display = core::json::GetField(entry, "displayName");
  display_name = core::json::IsString(raw_display) ? raw_display->string_value : name;
  return true;
}

template <typename Description>
bool AppendCustomTypes(const JsonValue& root, std::string_view key,
                       std::vector<Description>& output, std::string& error) {
  const JsonValue* list = core::json::GetField(root, key);
  if (list == nullptr) {
    return true;
  }
  if (!core::json::IsArray(list)) {
    error = "custom types field `" + std::string(key) + "` must be an array";
    return false;
  }

  for (std::size_t i = 0; i < list->array_value.size(); ++i) {
    Description description;
    const std::string path = std::string(key) + "[" + std::to_string(i) + "]";
    if (!ParseTypeEntry(list->array_value[i], path, description.name,
                        description.display_name, error)) {
      return false;
    }
    output.push_back(std::move(description));
  }
  return true;
}

} // namespace

BuiltinTypeLoader::BuiltinTypeLoader(fs::path custom_types_path)
    : custom_types_path_(std::move(custom_types_path)) {}

bool BuiltinTypeLoader::Load(LoadedTypes& types, std::string& error) {
  types = LoadedTypes{};
  error.clear();

  for (const BuiltinType& builtin : kBuiltinNodeTypes) {
    types.node_types.push_back(
        {.name = std::string(builtin.name), .display_name = std::string(builtin.display_name)});
  }
  for (const BuiltinType& builtin : kBuiltinCredentialTypes) {
    types.credential_types.push_back(
        {.name = std::string(builtin.name), .display_name = std::string(builtin.display_name)});
  }

  if (custom_types_path_.empty()) {
    return true;
  }

  std::string text;
  bool not_found = false;
  if (!core::ReadTextFile(custom_types_path_, text, not_found, error)) {
    if (not_found) {
      error.clear();
      return true;
    }
    return false;
  }

  JsonValue root;
  if (!core::json::Parse(text, root, error)) {
    error = "custom types file '" + custom_types_path_.string() + "' is invalid: " + error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "custom types file '" + custom_types_path_.string() + "' must contain an object";
    return false;
  }

  if (!AppendCustomTypes(root, "nodeTypes", types.node_types, error)) {
    return false;
  }
  return AppendCustomTypes(root, "credentialTypes", types.credential_types, error);
}

bool LoadAndRegisterTypes(ITypeLoader& loader, NodeTypeRegistry& node_types,
                          CredentialTypeRegistry& credential_types, std::string& error) {
  LoadedTypes loaded;
  if (!loader.Load(loaded, error)) {
    return false;
  }
  if (!node_types.Init(loaded.node_types, error)) {
    return false;
  }
  return credential_types.Init(loaded.credential_types, error);
}

} // namespace flowexec::types

#include "credentials/credentials_overwrites.hpp"

#include <cstdlib>
#include <utility>

namespace flowexec::credentials {

namespace {

using JsonValue = core::json::Value;

bool IsUnset(const JsonValue* value) {
  if (value == nullptr || value->type == JsonValue::Type::kNull) {
    return true;
  }
  return value->type == JsonValue::Type::kString && value->string_value.empty();
}

} // namespace

EnvCredentialsOverwrites::EnvCredentialsOverwrites(std::optional<std::string> raw_override)
    : raw_override_(std::move(raw_override)), use_override_(true) {}

bool EnvCredentialsOverwrites::Init(std::string& error) {
  error.clear();
  overwrites_ = core::json::MakeObject();

  std::optional<std::string> raw;
  if (use_override_) {
    raw = raw_override_;
  } else if (const char* env = std::getenv(kEnvVar); env != nullptr && *env != '\0') {
    raw = std::string(env);
  }
  if (!raw.has_value() || raw->empty()) {
    return true;
  }

  JsonValue parsed;
  if (!core::json::Parse(*raw, parsed, error)) {
    error = std::string("credentials overwrite data is not valid JSON: ") + error;
    return false;
  }
  if (parsed.type != JsonValue::Type::kObject) {
    error = "credentials overwrite data must be a JSON object";
    return false;
  }
  for (const auto& [credential_type, fields] : parsed.object_value) {
    if (fields.type != JsonValue::Type::kObject) {
      error = "credentials overwrite for type '" + credential_type + "' must be an object";
      return false;
    }
  }

  overwrites_ = std::move(parsed);
  return true;
}

void EnvCredentialsOverwrites::Apply(std::string_view credential_type, JsonValue& data) const {
  const JsonValue* fields = core::json::GetField(overwrites_, credential_type);
  if (fields == nullptr) {
    return;
  }
  if (data.type != JsonValue::Type::kObject) {
    data = core::json::MakeObject();
  }

  for (const auto& [key, value] : fields->object_value) {
    if (IsUnset(core::json::GetField(data, key))) {
      data.object_value[key] = value;
    }
  }
}

} // namespace flowexec::credentials

#include "engine/execution_engine.hpp"

namespace flowexec::engine {

namespace {

using JsonValue = core::json::Value;

std::optional<ExecutionError> ReadErrorObject(const JsonValue* error_value) {
  if (error_value == nullptr || error_value->type == JsonValue::Type::kNull) {
    return std::nullopt;
  }

  ExecutionError error;
  if (error_value->type == JsonValue::Type::kString) {
    error.message = error_value->string_value;
    return error;
  }

  if (const JsonValue* message = core::json::GetField(*error_value, "message");
      core::json::IsString(message)) {
    error.message = message->string_value;
  }
  if (const JsonValue* stack = core::json::GetField(*error_value, "stack");
      core::json::IsString(stack)) {
    error.stack = stack->string_value;
  }
  return error;
}

} // namespace

std::optional<ExecutionError> ExtractResultError(const JsonValue& payload) {
  if (const JsonValue* data = core::json::GetField(payload, "data"); data != nullptr) {
    if (const JsonValue* result_data = core::json::GetField(*data, "resultData");
        result_data != nullptr) {
      if (auto error = ReadErrorObject(core::json::GetField(*result_data, "error"))) {
        return error;
      }
    }
  }
  return ReadErrorObject(core::json::GetField(payload, "error"));
}

ExecutionResult MakeResultFromPayload(JsonValue payload) {
  ExecutionResult result;
  result.error = ExtractResultError(payload);
  if (const JsonValue* finished = core::json::GetField(payload, "finished");
      core::json::IsBool(finished)) {
    result.finished = finished->bool_value;
  } else {
    result.finished = !result.error.has_value();
  }
  result.payload = std::move(payload);
  return result;
}

} // namespace flowexec::engine

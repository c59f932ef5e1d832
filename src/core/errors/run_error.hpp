#pragma once

#include "core/errors/exit_codes.hpp"

#include <string>
#include <utility>

namespace flowexec::core::errors {

// Failure taxonomy shared by every step of the execute flow.
enum class RunErrorKind {
  kUsage,
  kNotFound,
  kInvalidFormat,
  kMissingEntryPoint,
  kExecution,
  kFatal,
};

struct RunError {
  RunErrorKind kind = RunErrorKind::kFatal;
  std::string message;
  // Only populated when the engine supplied one.
  std::string stack;
};

inline const char* ToString(RunErrorKind kind) {
  switch (kind) {
  case RunErrorKind::kUsage:
    return "usage";
  case RunErrorKind::kNotFound:
    return "not_found";
  case RunErrorKind::kInvalidFormat:
    return "invalid_format";
  case RunErrorKind::kMissingEntryPoint:
    return "missing_entry_point";
  case RunErrorKind::kExecution:
    return "execution";
  case RunErrorKind::kFatal:
    return "fatal";
  }

  return "fatal";
}

inline ExitCode ToExitCode(RunErrorKind kind) {
  switch (kind) {
  case RunErrorKind::kUsage:
    return ExitCode::kUsage;
  case RunErrorKind::kNotFound:
    return ExitCode::kNotFound;
  case RunErrorKind::kInvalidFormat:
    return ExitCode::kInvalidFormat;
  case RunErrorKind::kMissingEntryPoint:
    return ExitCode::kMissingEntryPoint;
  case RunErrorKind::kExecution:
  case RunErrorKind::kFatal:
    return ExitCode::kFailure;
  }

  return ExitCode::kFailure;
}

inline RunError MakeRunError(RunErrorKind kind, std::string message, std::string stack = {}) {
  RunError error;
  error.kind = kind;
  error.message = std::move(message);
  error.stack = std::move(stack);
  return error;
}

} // namespace flowexec::core::errors

#pragma once

#include "core/errors/run_error.hpp"
#include "storage/storage.hpp"
#include "workflow/model.hpp"

#include <functional>
#include <optional>
#include <string>

namespace flowexec::workflow {

// Where the workflow comes from. Exactly one field must be set.
struct WorkflowSource {
  std::optional<std::string> file_path;
  std::optional<std::string> id;
};

// Obtains the workflow definition from exactly one of {file, stored id}.
//
// Contract:
// - neither or both set: kUsage, no I/O and no storage access
// - file: missing file -> kNotFound; unreadable, malformed JSON or missing
//   `nodes`/`connections` -> kInvalidFormat
// - id: `await_storage` runs first (failure -> kFatal), then the lookup;
//   no record -> kNotFound; lookup failure -> kFatal
class WorkflowSourceResolver {
public:
  using ReadinessGate = std::function<bool(std::string& error)>;

  WorkflowSourceResolver(storage::IStorage& storage, ReadinessGate await_storage);

  bool Resolve(const WorkflowSource& source, WorkflowDefinition& workflow,
               core::errors::RunError& error) const;

private:
  bool ResolveFromFile(const std::string& file_path, WorkflowDefinition& workflow,
                       core::errors::RunError& error) const;
  bool ResolveFromStorage(const std::string& id, WorkflowDefinition& workflow,
                          core::errors::RunError& error) const;

  storage::IStorage& storage_;
  ReadinessGate await_storage_;
};

} // namespace flowexec::workflow

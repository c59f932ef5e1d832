#include "workflow/source_resolver.hpp"

#include "core/fs_utils.hpp"

#include <utility>

namespace flowexec::workflow {

using core::errors::MakeRunError;
using core::errors::RunError;
using core::errors::RunErrorKind;

namespace {

bool IsSet(const std::optional<std::string>& value) {
  return value.has_value() && !value->empty();
}

} // namespace

WorkflowSourceResolver::WorkflowSourceResolver(storage::IStorage& storage,
                                               ReadinessGate await_storage)
    : storage_(storage), await_storage_(std::move(await_storage)) {}

bool WorkflowSourceResolver::Resolve(const WorkflowSource& source, WorkflowDefinition& workflow,
                                     RunError& error) const {
  const bool has_file = IsSet(source.file_path);
  const bool has_id = IsSet(source.id);

  if (!has_file && !has_id) {
    error = MakeRunError(RunErrorKind::kUsage, "Either option \"--id\" or \"--file\" have to be set!");
    return false;
  }
  if (has_file && has_id) {
    error = MakeRunError(RunErrorKind::kUsage, "Either \"id\" or \"file\" can be set never both!");
    return false;
  }

  if (has_file) {
    return ResolveFromFile(*source.file_path, workflow, error);
  }
  return ResolveFromStorage(*source.id, workflow, error);
}

bool WorkflowSourceResolver::ResolveFromFile(const std::string& file_path,
                                             WorkflowDefinition& workflow,
                                             RunError& error) const {
  std::string text;
  bool not_found = false;
  std::string io_error;
  if (!core::ReadTextFile(file_path, text, not_found, io_error)) {
    if (not_found) {
      error = MakeRunError(RunErrorKind::kNotFound,
                           "The file \"" + file_path + "\" could not be found.");
      return false;
    }
    error = MakeRunError(RunErrorKind::kInvalidFormat,
                         "The file \"" + file_path + "\" could not be read: " + io_error);
    return false;
  }

  std::string parse_error;
  if (!ParseWorkflowText(text, workflow, parse_error)) {
    error = MakeRunError(RunErrorKind::kInvalidFormat,
                         "The file \"" + file_path + "\" does not contain valid workflow data: " +
                             parse_error);
    return false;
  }
  return true;
}

bool WorkflowSourceResolver::ResolveFromStorage(const std::string& id,
                                                WorkflowDefinition& workflow,
                                                RunError& error) const {
  std::string storage_error;
  if (!await_storage_(storage_error)) {
    error = MakeRunError(RunErrorKind::kFatal, "storage is not available: " + storage_error);
    return false;
  }

  std::optional<WorkflowDefinition> found;
  if (!storage_.FindWorkflowById(id, found, storage_error)) {
    error = MakeRunError(RunErrorKind::kFatal,
                         "failed to look up workflow \"" + id + "\": " + storage_error);
    return false;
  }
  if (!found.has_value()) {
    error = MakeRunError(RunErrorKind::kNotFound,
                         "The workflow with the id \"" + id + "\" does not exist.");
    return false;
  }

  workflow = std::move(*found);
  // The requested id is authoritative for downstream references.
  workflow.id = id;
  return true;
}

} // namespace flowexec::workflow

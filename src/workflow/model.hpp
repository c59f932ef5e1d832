#pragma once

#include "core/json_dom.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace flowexec::workflow {

// One node of a workflow graph. Only the fields the execute flow and its
// collaborators read are lifted out of the JSON document.
struct Node {
  std::string name;
  std::string type;
  double type_version = 1.0;
  core::json::Value parameters = core::json::MakeObject();
  // Credential type -> credential name.
  std::map<std::string, std::string> credentials;
  bool disabled = false;
};

// Workflow definition produced by a file parse or a storage lookup.
// Read-only to the execute flow once resolved.
struct WorkflowDefinition {
  // Empty when the source did not carry an id.
  std::string id;
  std::string name;
  std::vector<Node> nodes;
  core::json::Value connections = core::json::MakeObject();
  // Every top-level field not listed above (active, settings, staticData...).
  core::json::Value::Object metadata;
};

// Maps a parsed JSON document onto WorkflowDefinition.
//
// Contract:
// - root must be an object with `nodes` (array) and `connections` (object)
// - every node must be an object with string `name` and `type`
// - `id` may be a string or an integral number; absent id leaves `id` empty
// Returns false with an actionable `error` when the document does not match.
bool ParseWorkflowDefinition(const core::json::Value& root, WorkflowDefinition& workflow,
                             std::string& error);

// Convenience for text input; JSON syntax errors are reported through `error`.
bool ParseWorkflowText(std::string_view json_text, WorkflowDefinition& workflow,
                       std::string& error);

// Ids are valid when they parse as a leading integer (e.g. "5", "12abc").
// Anything else is treated as "no id" by downstream consumers.
bool IsWorkflowIdValid(std::string_view id);

} // namespace flowexec::workflow

#pragma once

#include "core/errors/run_error.hpp"
#include "workflow/model.hpp"

#include <functional>
#include <string_view>

namespace flowexec::workflow {

// Node type that marks a workflow as invokable headlessly.
constexpr std::string_view kStartNodeType = "n8n-nodes-base.start";

using EntryNodePredicate = std::function<bool(const Node& node)>;

// Default entry predicate: node type equals kStartNodeType.
bool IsStartNode(const Node& node);

// Finds the entry node of a workflow.
//
// Scans `workflow.nodes` in list order and returns the first node accepted by
// the predicate; first match wins. Returns nullptr and sets
// kMissingEntryPoint when no node matches. The returned pointer refers into
// `workflow` and lives as long as it does.
class StartNodeValidator {
public:
  explicit StartNodeValidator(EntryNodePredicate is_entry_node = IsStartNode);

  const Node* FindStartNode(const WorkflowDefinition& workflow,
                            core::errors::RunError& error) const;

private:
  EntryNodePredicate is_entry_node_;
};

} // namespace flowexec::workflow

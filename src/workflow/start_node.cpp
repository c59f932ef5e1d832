#include "workflow/start_node.hpp"

#include <utility>

namespace flowexec::workflow {

bool IsStartNode(const Node& node) {
  return node.type == kStartNodeType;
}

StartNodeValidator::StartNodeValidator(EntryNodePredicate is_entry_node)
    : is_entry_node_(is_entry_node ? std::move(is_entry_node) : EntryNodePredicate(IsStartNode)) {}

const Node* StartNodeValidator::FindStartNode(const WorkflowDefinition& workflow,
                                              core::errors::RunError& error) const {
  for (const Node& node : workflow.nodes) {
    if (is_entry_node_(node)) {
      return &node;
    }
  }

  error = core::errors::MakeRunError(
      core::errors::RunErrorKind::kMissingEntryPoint,
      "The workflow does not contain a \"Start\" node. So it can not be executed.");
  return nullptr;
}

} // namespace flowexec::workflow

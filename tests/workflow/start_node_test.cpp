#include "workflow/start_node.hpp"

#include "common/fakes.hpp"

#include <catch2/catch.hpp>

using flowexec::core::errors::RunError;
using flowexec::core::errors::RunErrorKind;
using flowexec::tests::common::MakeNode;
using flowexec::workflow::Node;
using flowexec::workflow::StartNodeValidator;
using flowexec::workflow::WorkflowDefinition;

TEST_CASE("FindStartNode returns the first start node in list order", "[workflow][start_node]") {
  WorkflowDefinition workflow;
  workflow.nodes.push_back(MakeNode("Noop", "n8n-nodes-base.noOp"));
  workflow.nodes.push_back(MakeNode("Start A", "n8n-nodes-base.start"));
  workflow.nodes.push_back(MakeNode("Start B", "n8n-nodes-base.start"));

  const StartNodeValidator validator;
  RunError error;
  const Node* start = validator.FindStartNode(workflow, error);
  REQUIRE(start != nullptr);
  REQUIRE(start->name == "Start A");
  REQUIRE(start == &workflow.nodes[1]);
}

TEST_CASE("FindStartNode reports a missing entry point", "[workflow][start_node]") {
  WorkflowDefinition workflow;
  workflow.nodes.push_back(MakeNode("Cron", "n8n-nodes-base.cron"));

  const StartNodeValidator validator;
  RunError error;
  REQUIRE(validator.FindStartNode(workflow, error) == nullptr);
  REQUIRE(error.kind == RunErrorKind::kMissingEntryPoint);
  REQUIRE(error.message ==
          "The workflow does not contain a \"Start\" node. So it can not be executed.");

  WorkflowDefinition empty;
  REQUIRE(validator.FindStartNode(empty, error) == nullptr);
  REQUIRE(error.kind == RunErrorKind::kMissingEntryPoint);
}

TEST_CASE("FindStartNode honors a custom entry predicate", "[workflow][start_node]") {
  WorkflowDefinition workflow;
  workflow.nodes.push_back(MakeNode("Start", "n8n-nodes-base.start"));
  workflow.nodes.push_back(MakeNode("Manual", "n8n-nodes-base.manualTrigger"));

  const StartNodeValidator validator(
      [](const Node& node) { return node.type == "n8n-nodes-base.manualTrigger"; });
  RunError error;
  const Node* start = validator.FindStartNode(workflow, error);
  REQUIRE(start != nullptr);
  REQUIRE(start->name == "Manual");
}

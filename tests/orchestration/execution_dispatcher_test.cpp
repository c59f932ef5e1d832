#include "orchestration/execution_dispatcher.hpp"

#include "common/fakes.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using flowexec::core::errors::RunError;
using flowexec::core::errors::RunErrorKind;
using flowexec::engine::ExecutionHandle;
using flowexec::orchestration::ExecutionDispatcher;
using flowexec::tests::common::FakeCredentialsResolver;
using flowexec::tests::common::FakeEngine;
using flowexec::tests::common::MakeStartWorkflow;

TEST_CASE("Dispatch builds a cli request from the start node", "[orchestration][dispatcher]") {
  FakeEngine engine;
  FakeCredentialsResolver resolver;
  ExecutionDispatcher dispatcher(engine, resolver);

  auto workflow = MakeStartWorkflow("5");
  workflow.nodes[1].credentials["httpBasicAuth"] = "main";

  ExecutionHandle handle;
  RunError error;
  REQUIRE(dispatcher.Dispatch(workflow, workflow.nodes[0], handle, error));
  REQUIRE_FALSE(handle.Empty());
  REQUIRE(engine.last_mode == "cli");
  REQUIRE(engine.last_start_nodes == std::vector<std::string>{"Start"});
  REQUIRE(engine.last_workflow_id == "5");
  REQUIRE(engine.last_credentials.at("httpBasicAuth").count("main") == 1U);
}

TEST_CASE("Dispatch fails fatally when credentials cannot be resolved",
          "[orchestration][dispatcher]") {
  FakeEngine engine;
  FakeCredentialsResolver resolver;
  resolver.resolve_ok = false;
  ExecutionDispatcher dispatcher(engine, resolver);

  const auto workflow = MakeStartWorkflow();
  ExecutionHandle handle;
  RunError error;
  REQUIRE_FALSE(dispatcher.Dispatch(workflow, workflow.nodes[0], handle, error));
  REQUIRE(error.kind == RunErrorKind::kFatal);
  REQUIRE(error.message.find("could not find credentials") != std::string::npos);
  REQUIRE(engine.dispatch_calls == 0);
  REQUIRE(handle.Empty());
}

TEST_CASE("Dispatch fails fatally when the engine rejects the run",
          "[orchestration][dispatcher]") {
  FakeEngine engine;
  FakeCredentialsResolver resolver;
  ExecutionDispatcher dispatcher(engine, resolver);
  const auto workflow = MakeStartWorkflow();
  ExecutionHandle handle;
  RunError error;

  engine.dispatch_ok = false;
  REQUIRE_FALSE(dispatcher.Dispatch(workflow, workflow.nodes[0], handle, error));
  REQUIRE(error.kind == RunErrorKind::kFatal);
  REQUIRE(error.message.find("engine is shutting down") != std::string::npos);

  engine.dispatch_ok = true;
  engine.return_empty_handle = true;
  REQUIRE_FALSE(dispatcher.Dispatch(workflow, workflow.nodes[0], handle, error));
  REQUIRE(error.kind == RunErrorKind::kFatal);
  REQUIRE(handle.Empty());
}

#include "orchestration/completion_waiter.hpp"

#include "common/fakes.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <utility>

using flowexec::core::errors::RunError;
using flowexec::core::errors::RunErrorKind;
using flowexec::engine::ExecutionHandle;
using flowexec::engine::ExecutionResult;
using flowexec::orchestration::CompletionWaiter;
using flowexec::tests::common::FakeEngine;

TEST_CASE("Await consumes the handle and delivers the result once",
          "[orchestration][waiter]") {
  FakeEngine engine;
  engine.payload.object_value["finished"] = flowexec::core::json::MakeBool(true);

  ExecutionHandle handle("exec-1");
  engine.pending.emplace("exec-1", engine.payload);

  CompletionWaiter waiter(engine);
  ExecutionResult result;
  RunError error;
  REQUIRE(waiter.Await(std::move(handle), result, error));
  REQUIRE(result.finished);
  REQUIRE_FALSE(result.error.has_value());
  REQUIRE(handle.Empty());

  REQUIRE_FALSE(waiter.Await(ExecutionHandle("exec-1"), result, error));
  REQUIRE(error.kind == RunErrorKind::kFatal);
  REQUIRE(error.message.find("exec-1") != std::string::npos);
}

TEST_CASE("Await rejects an empty handle without calling the engine",
          "[orchestration][waiter]") {
  FakeEngine engine;
  CompletionWaiter waiter(engine);
  ExecutionResult result;
  RunError error;
  REQUIRE_FALSE(waiter.Await(ExecutionHandle(), result, error));
  REQUIRE(error.kind == RunErrorKind::kFatal);
  REQUIRE(engine.await_calls == 0);
}

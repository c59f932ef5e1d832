#include "orchestration/init_barrier.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <future>
#include <stdexcept>
#include <string>

using flowexec::orchestration::InitBarrier;

TEST_CASE("InitBarrier runs tasks concurrently and awaits by name", "[orchestration][barrier]") {
  std::promise<void> release_storage;
  std::shared_future<void> storage_gate = release_storage.get_future().share();
  std::promise<void> types_started;

  InitBarrier barrier;
  std::string error;
  REQUIRE(barrier.Start(
      "storage",
      [storage_gate](std::string&) {
        storage_gate.wait();
        return true;
      },
      error));
  REQUIRE(barrier.Start(
      "types",
      [&types_started](std::string&) {
        types_started.set_value();
        return true;
      },
      error));

  // The second task makes progress while the first one is still blocked.
  REQUIRE(types_started.get_future().wait_for(std::chrono::seconds(5)) ==
          std::future_status::ready);
  REQUIRE(barrier.Await("types", error));

  release_storage.set_value();
  REQUIRE(barrier.Await("storage", error));
  REQUIRE(barrier.Await("storage", error));
  REQUIRE(barrier.StartedPoints() == std::vector<std::string>{"storage", "types"});
}

TEST_CASE("InitBarrier reports task failures and exceptions", "[orchestration][barrier]") {
  InitBarrier barrier;
  std::string error;
  REQUIRE(barrier.Start(
      "credentials_overwrites",
      [](std::string& task_error) {
        task_error = "overwrite data is not valid JSON";
        return false;
      },
      error));
  REQUIRE(barrier.Start(
      "external_hooks",
      [](std::string&) -> bool { throw std::runtime_error("hook file vanished"); }, error));
  REQUIRE(barrier.Start("types", [](std::string&) { return false; }, error));
  REQUIRE(barrier.Start("storage", [](std::string&) -> bool { throw 42; }, error));

  REQUIRE_FALSE(barrier.Await("credentials_overwrites", error));
  REQUIRE(error == "overwrite data is not valid JSON");
  REQUIRE_FALSE(barrier.Await("external_hooks", error));
  REQUIRE(error == "hook file vanished");
  REQUIRE_FALSE(barrier.Await("types", error));
  REQUIRE(error.find("types") != std::string::npos);
  REQUIRE_FALSE(barrier.Await("storage", error));
  REQUIRE(error == "init task 'storage' threw an unknown exception");
}

TEST_CASE("InitBarrier rejects invalid start and await calls", "[orchestration][barrier]") {
  InitBarrier barrier;
  std::string error;

  REQUIRE_FALSE(barrier.Start("", [](std::string&) { return true; }, error));
  REQUIRE_FALSE(barrier.Start("storage", InitBarrier::InitTask{}, error));

  REQUIRE(barrier.Start("storage", [](std::string&) { return true; }, error));
  REQUIRE_FALSE(barrier.Start("storage", [](std::string&) { return true; }, error));
  REQUIRE(error.find("already started") != std::string::npos);

  REQUIRE_FALSE(barrier.Await("types", error));
  REQUIRE(error.find("never started") != std::string::npos);
  REQUIRE(barrier.IsStarted("storage"));
  REQUIRE_FALSE(barrier.IsStarted("types"));
}

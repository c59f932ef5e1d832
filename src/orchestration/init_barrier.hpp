#pragma once

#include <functional>
#include <future>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace flowexec::orchestration {

// Readiness point names used by the execute flow.
constexpr std::string_view kReadyStorage = "storage";
constexpr std::string_view kReadyTypes = "types";
constexpr std::string_view kReadyCredentialsOverwrites = "credentials_overwrites";
constexpr std::string_view kReadyExternalHooks = "external_hooks";

// Starts independent initialization tasks eagerly and lets later steps block
// on each one by name, exactly where that subsystem is first needed.
//
// Every task runs on its own thread from the moment it is started. `Await`
// joins one task and returns its outcome; awaiting the same point again
// returns the cached outcome. A task that throws is reported as failed with
// the exception message, or a generic one for non-standard exceptions.
// Destruction joins every task that is still running.
//
// Start/Await are meant to be called from one flow of control.
class InitBarrier {
public:
  using InitTask = std::function<bool(std::string& error)>;

  InitBarrier() = default;
  ~InitBarrier();

  InitBarrier(const InitBarrier&) = delete;
  InitBarrier& operator=(const InitBarrier&) = delete;

  // Launches `task` immediately. Fails for empty or duplicate names, or when
  // no thread could be started.
  bool Start(std::string_view name, InitTask task, std::string& error);

  // Blocks until the task behind `name` finished. Returns false with the
  // task's error when it failed, or when `name` was never started.
  bool Await(std::string_view name, std::string& error);

  bool IsStarted(std::string_view name) const;

  // Names in start order.
  const std::vector<std::string>& StartedPoints() const {
    return start_order_;
  }

private:
  struct Outcome {
    bool ok = false;
    std::string error;
  };

  std::map<std::string, std::shared_future<Outcome>, std::less<>> points_;
  std::vector<std::string> start_order_;
};

} // namespace flowexec::orchestration

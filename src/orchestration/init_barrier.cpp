#include "orchestration/init_barrier.hpp"

#include <exception>
#include <system_error>
#include <utility>

namespace flowexec::orchestration {

InitBarrier::~InitBarrier() {
  for (auto& [name, outcome] : points_) {
    if (outcome.valid()) {
      outcome.wait();
    }
  }
}

bool InitBarrier::Start(std::string_view name, InitTask task, std::string& error) {
  error.clear();
  if (name.empty()) {
    error = "readiness point name cannot be empty";
    return false;
  }
  if (!task) {
    error = "readiness point '" + std::string(name) + "' has no init task";
    return false;
  }
  if (IsStarted(name)) {
    error = "readiness point '" + std::string(name) + "' was already started";
    return false;
  }

  std::string point_name(name);
  std::shared_future<Outcome> outcome;
  try {
    outcome = std::async(std::launch::async,
                         [point_name, task = std::move(task)]() {
                           Outcome result;
                           try {
                             result.ok = task(result.error);
                           } catch (const std::exception& ex) {
                             result.ok = false;
                             result.error = ex.what();
                           } catch (...) {
                             result.ok = false;
                             result.error = "init task '" + point_name +
                                            "' threw an unknown exception";
                           }
                           if (!result.ok && result.error.empty()) {
                             result.error = "initialization of '" + point_name + "' failed";
                           }
                           return result;
                         })
                  .share();
  } catch (const std::system_error& ex) {
    error = "failed to start init task '" + point_name + "': " + ex.what();
    return false;
  }

  points_.emplace(point_name, std::move(outcome));
  start_order_.push_back(std::move(point_name));
  return true;
}

bool InitBarrier::Await(std::string_view name, std::string& error) {
  error.clear();
  const auto it = points_.find(name);
  if (it == points_.end()) {
    error = "readiness point '" + std::string(name) + "' was never started";
    return false;
  }

  const Outcome& outcome = it->second.get();
  if (!outcome.ok) {
    error = outcome.error;
    return false;
  }
  return true;
}

bool InitBarrier::IsStarted(std::string_view name) const {
  return points_.find(name) != points_.end();
}

} // namespace flowexec::orchestration

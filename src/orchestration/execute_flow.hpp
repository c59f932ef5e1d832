#pragma once

#include "core/logging/logger.hpp"
#include "credentials/credentials_overwrites.hpp"
#include "credentials/credentials_resolver.hpp"
#include "engine/execution_engine.hpp"
#include "hooks/external_hooks.hpp"
#include "orchestration/outcome_classifier.hpp"
#include "settings/user_settings.hpp"
#include "storage/storage.hpp"
#include "types/type_loader.hpp"
#include "types/type_registry.hpp"
#include "workflow/source_resolver.hpp"
#include "workflow/start_node.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace flowexec::orchestration {

// Collaborators of one execute run. Every reference must outlive RunExecute.
struct ExecuteServices {
  storage::IStorage& storage;
  settings::IUserSettings& user_settings;
  types::ITypeLoader& type_loader;
  types::NodeTypeRegistry& node_types;
  types::CredentialTypeRegistry& credential_types;
  credentials::ICredentialsOverwrites& credentials_overwrites;
  credentials::ICredentialsResolver& credentials_resolver;
  hooks::IExternalHooks& external_hooks;
  engine::IExecutionEngine& engine;
};

struct ExecuteOptions {
  workflow::WorkflowSource source;
  workflow::EntryNodePredicate is_entry_node = workflow::IsStartNode;
};

enum class FlowStage {
  kInit,
  kResolveSource,
  kValidateStartNode,
  kAwaitBarrier,
  kDispatch,
  kAwaitCompletion,
  kClassify,
  kDone,
};

const char* ToString(FlowStage stage);

// What happened during one RunExecute call, for in-process callers.
struct ExecuteReport {
  // Stage that was running when the flow stopped; kDone once a result was
  // classified and reported.
  FlowStage stage = FlowStage::kInit;
  int exit_code = 0;
  std::string workflow_id;
  std::string execution_id;
  std::optional<RunOutcome> outcome;
};

// Runs `execute` once:
//
//   INIT -> RESOLVE_SOURCE -> VALIDATE_START_NODE -> AWAIT_BARRIER
//        -> DISPATCH -> AWAIT_COMPLETION -> CLASSIFY -> DONE
//
// INIT starts the storage, types, credentials_overwrites and external_hooks
// readiness points before anything else. Usage, not-found, invalid-format and
// missing-start-node failures print their message on `out` and return their
// own exit code without dispatching. Storage failures during resolution and
// every failure from the barrier up to the result are reported as fatal. A
// failing post-execute hook is logged and forces exit code 1 without
// changing the classified outcome.
// Returns the process exit code.
int RunExecute(const ExecuteOptions& options, const ExecuteServices& services,
               core::logging::Logger& logger, std::ostream& out, std::ostream& err,
               ExecuteReport* report = nullptr);

} // namespace flowexec::orchestration

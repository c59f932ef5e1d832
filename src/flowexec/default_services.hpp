#pragma once

#include "credentials/credentials_overwrites.hpp"
#include "credentials/credentials_resolver.hpp"
#include "engine/sim/sim_execution_engine.hpp"
#include "hooks/external_hooks.hpp"
#include "orchestration/execute_flow.hpp"
#include "settings/user_settings.hpp"
#include "storage/file_storage.hpp"
#include "types/type_loader.hpp"
#include "types/type_registry.hpp"

#include <filesystem>

namespace flowexec::app {

// Production wiring of the execute collaborators for one user folder.
//
// Construction does no I/O; everything is initialized through the readiness
// points started by RunExecute. Members are declared in dependency order so
// the engine (which joins its workers) is destroyed first.
class DefaultServices {
public:
  explicit DefaultServices(const std::filesystem::path& user_folder);

  DefaultServices(const DefaultServices&) = delete;
  DefaultServices& operator=(const DefaultServices&) = delete;

  orchestration::ExecuteServices View();

private:
  storage::FileStorage storage_;
  settings::FileUserSettings user_settings_;
  types::BuiltinTypeLoader type_loader_;
  types::NodeTypeRegistry node_types_;
  types::CredentialTypeRegistry credential_types_;
  credentials::EnvCredentialsOverwrites credentials_overwrites_;
  credentials::StoredCredentialsResolver credentials_resolver_;
  hooks::FileExternalHooks external_hooks_;
  engine::sim::SimExecutionEngine engine_;
};

// `<user_folder>/custom/types.json`
std::filesystem::path CustomTypesPath(const std::filesystem::path& user_folder);

} // namespace flowexec::app

#include "flowexec/default_services.hpp"

namespace fs = std::filesystem;

namespace flowexec::app {

fs::path CustomTypesPath(const fs::path& user_folder) {
  return user_folder / "custom" / "types.json";
}

DefaultServices::DefaultServices(const fs::path& user_folder)
    : storage_(user_folder),
      user_settings_(user_folder),
      type_loader_(CustomTypesPath(user_folder)),
      credentials_resolver_(storage_, credential_types_, credentials_overwrites_),
      engine_(node_types_) {}

orchestration::ExecuteServices DefaultServices::View() {
  return orchestration::ExecuteServices{
      .storage = storage_,
      .user_settings = user_settings_,
      .type_loader = type_loader_,
      .node_types = node_types_,
      .credential_types = credential_types_,
      .credentials_overwrites = credentials_overwrites_,
      .credentials_resolver = credentials_resolver_,
      .external_hooks = external_hooks_,
      .engine = engine_,
  };
}

} // namespace flowexec::app

#include "credentials/credentials_resolver.hpp"

#include <optional>
#include <utility>

namespace flowexec::credentials {

StoredCredentialsResolver::StoredCredentialsResolver(
    storage::IStorage& storage, const types::CredentialTypeRegistry& credential_types,
    const ICredentialsOverwrites& overwrites)
    : storage_(storage), credential_types_(credential_types), overwrites_(overwrites) {}

bool StoredCredentialsResolver::Resolve(const std::vector<workflow::Node>& nodes,
                                        CredentialsSnapshot& snapshot, std::string& error) {
  snapshot.clear();
  error.clear();

  for (const workflow::Node& node : nodes) {
    if (node.disabled) {
      continue;
    }

    for (const auto& [credential_type, name] : node.credentials) {
      if (!credential_types_.Has(credential_type)) {
        error = "node \"" + node.name + "\" uses unknown credential type '" + credential_type +
                "'";
        return false;
      }

      auto& by_name = snapshot[credential_type];
      if (by_name.find(name) != by_name.end()) {
        continue;
      }

      std::optional<core::json::Value> data;
      if (!storage_.FindCredentials(credential_type, name, data, error)) {
        return false;
      }
      if (!data.has_value()) {
        error = "could not find credentials for type \"" + credential_type +
                "\" with name \"" + name + "\"";
        return false;
      }

      overwrites_.Apply(credential_type, *data);
      by_name.emplace(name, std::move(*data));
    }
  }

  return true;
}

} // namespace flowexec::credentials

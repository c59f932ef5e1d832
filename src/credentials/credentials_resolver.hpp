#pragma once

#include "core/json_dom.hpp"
#include "credentials/credentials_overwrites.hpp"
#include "storage/storage.hpp"
#include "types/type_registry.hpp"
#include "workflow/model.hpp"

#include <map>
#include <string>
#include <vector>

namespace flowexec::credentials {

// Credential type -> credential name -> resolved credential data.
using CredentialsSnapshot = std::map<std::string, std::map<std::string, core::json::Value>>;

// Resolves the secret material referenced by a workflow's nodes.
class ICredentialsResolver {
public:
  virtual ~ICredentialsResolver() = default;

  virtual bool Resolve(const std::vector<workflow::Node>& nodes, CredentialsSnapshot& snapshot,
                       std::string& error) = 0;
};

// Looks every credential reference of every enabled node up in storage and
// applies the configured overwrites to each entry.
class StoredCredentialsResolver final : public ICredentialsResolver {
public:
  StoredCredentialsResolver(storage::IStorage& storage,
                            const types::CredentialTypeRegistry& credential_types,
                            const ICredentialsOverwrites& overwrites);

  bool Resolve(const std::vector<workflow::Node>& nodes, CredentialsSnapshot& snapshot,
               std::string& error) override;

private:
  storage::IStorage& storage_;
  const types::CredentialTypeRegistry& credential_types_;
  const ICredentialsOverwrites& overwrites_;
};

} // namespace flowexec::credentials

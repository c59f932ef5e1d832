#pragma once

#include "types/type_registry.hpp"

#include <filesystem>
#include <string>

namespace flowexec::types {

// Discovers the node and credential types available to this process.
class ITypeLoader {
public:
  virtual ~ITypeLoader() = default;

  virtual bool Load(LoadedTypes& types, std::string& error) = 0;
};

// Built-in catalog plus optional user-supplied custom types.
//
// Custom types file format:
//   {"nodeTypes": ["acme.widget", {"name": "acme.gadget", "displayName": "Gadget"}],
//    "credentialTypes": ["acmeApi"]}
// A missing custom types file is not an error.
class BuiltinTypeLoader final : public ITypeLoader {
public:
  explicit BuiltinTypeLoader(std::filesystem::path custom_types_path = {});

  bool Load(LoadedTypes& types, std::string& error) override;

private:
  std::filesystem::path custom_types_path_;
};

// Loads types and initializes both registries in one step. This is the unit
// of work behind the `types` readiness point.
bool LoadAndRegisterTypes(ITypeLoader& loader, NodeTypeRegistry& node_types,
                          CredentialTypeRegistry& credential_types, std::string& error);

} // namespace flowexec::types

#include "types/type_registry.hpp"

#include <utility>

namespace flowexec::types {

namespace {

template <typename Description>
bool BuildIndex(const std::vector<Description>& descriptions, std::string_view kind,
                std::map<std::string, Description, std::less<>>& index, std::string& error) {
  std::map<std::string, Description, std::less<>> staged;
  for (const Description& description : descriptions) {
    if (description.name.empty()) {
      error = std::string(kind) + " type name cannot be empty";
      return false;
    }
    if (!staged.emplace(description.name, description).second) {
      error = "duplicate " + std::string(kind) + " type: " + description.name;
      return false;
    }
  }
  index = std::move(staged);
  return true;
}

} // namespace

bool NodeTypeRegistry::Init(const std::vector<NodeTypeDescription>& node_types,
                            std::string& error) {
  error.clear();
  return BuildIndex(node_types, "node", by_name_, error);
}

bool NodeTypeRegistry::Has(std::string_view name) const {
  return by_name_.find(name) != by_name_.end();
}

const NodeTypeDescription* NodeTypeRegistry::Find(std::string_view name) const {
  const auto it = by_name_.find(name);
  if (it == by_name_.end()) {
    return nullptr;
  }
  return &it->second;
}

bool CredentialTypeRegistry::Init(const std::vector<CredentialTypeDescription>& credential_types,
                                  std::string& error) {
  error.clear();
  return BuildIndex(credential_types, "credential", by_name_, error);
}

bool CredentialTypeRegistry::Has(std::string_view name) const {
  return by_name_.find(name) != by_name_.end();
}

} // namespace flowexec::types

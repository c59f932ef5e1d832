#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace flowexec::types {

struct NodeTypeDescription {
  std::string name;
  std::string display_name;
};

struct CredentialTypeDescription {
  std::string name;
  std::string display_name;
};

// Output of a type loader, handed to the registries once loading finished.
struct LoadedTypes {
  std::vector<NodeTypeDescription> node_types;
  std::vector<CredentialTypeDescription> credential_types;
};

// Name-indexed registry of node types known to this process.
//
// Written once by `Init` on the types init thread; read-only afterwards.
class NodeTypeRegistry {
public:
  // Fails on empty or duplicate names and leaves the registry unchanged.
  bool Init(const std::vector<NodeTypeDescription>& node_types, std::string& error);

  bool Has(std::string_view name) const;
  const NodeTypeDescription* Find(std::string_view name) const;
  std::size_t Size() const {
    return by_name_.size();
  }

private:
  std::map<std::string, NodeTypeDescription, std::less<>> by_name_;
};

class CredentialTypeRegistry {
public:
  bool Init(const std::vector<CredentialTypeDescription>& credential_types, std::string& error);

  bool Has(std::string_view name) const;
  std::size_t Size() const {
    return by_name_.size();
  }

private:
  std::map<std::string, CredentialTypeDescription, std::less<>> by_name_;
};

} // namespace flowexec::types

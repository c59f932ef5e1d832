#pragma once

#include "core/json_dom.hpp"
#include "workflow/model.hpp"

#include <optional>
#include <string>

namespace flowexec::storage {

// Persistent storage contract used by the execute flow.
//
// `Init` runs on an init thread; lookups run on the main flow only after the
// storage readiness point was awaited.
class IStorage {
public:
  virtual ~IStorage() = default;

  // Prepares the backing store (connections, directories, migrations).
  virtual bool Init(std::string& error) = 0;

  // Returns true with `workflow` left empty when no record matches `id`.
  // Returns false only when the lookup itself failed.
  virtual bool FindWorkflowById(const std::string& id,
                                std::optional<workflow::WorkflowDefinition>& workflow,
                                std::string& error) = 0;

  // Same contract as FindWorkflowById for stored credential data.
  virtual bool FindCredentials(const std::string& credential_type, const std::string& name,
                               std::optional<core::json::Value>& data, std::string& error) = 0;
};

} // namespace flowexec::storage

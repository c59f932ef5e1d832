#pragma once

#include "storage/storage.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace flowexec::storage {

// User-folder backed storage.
//
// Layout:
// - <user_folder>/workflows/<id>.json   one workflow document per file
// - <user_folder>/credentials.json      {"<type>": {"<name>": {...data}}}
//
// A stored workflow without an `id` field takes its id from the file name.
class FileStorage final : public IStorage {
public:
  explicit FileStorage(std::filesystem::path user_folder);

  bool Init(std::string& error) override;
  bool FindWorkflowById(const std::string& id,
                        std::optional<workflow::WorkflowDefinition>& workflow,
                        std::string& error) override;
  bool FindCredentials(const std::string& credential_type, const std::string& name,
                       std::optional<core::json::Value>& data, std::string& error) override;

  const std::filesystem::path& WorkflowsDir() const {
    return workflows_dir_;
  }

private:
  std::filesystem::path user_folder_;
  std::filesystem::path workflows_dir_;
  std::filesystem::path credentials_path_;
};

// Ids map directly onto file names, so anything that could escape the
// workflows directory is rejected.
bool IsSafeRecordId(std::string_view id);

} // namespace flowexec::storage

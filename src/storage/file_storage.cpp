#include "storage/file_storage.hpp"

#include "core/fs_utils.hpp"

#include <string_view>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace flowexec::storage {

FileStorage::FileStorage(fs::path user_folder)
    : user_folder_(std::move(user_folder)),
      workflows_dir_(user_folder_ / "workflows"),
      credentials_path_(user_folder_ / "credentials.json") {}

bool FileStorage::Init(std::string& error) {
  error.clear();
  if (user_folder_.empty()) {
    error = "user folder cannot be empty";
    return false;
  }

  std::error_code ec;
  if (fs::exists(user_folder_, ec) && !fs::is_directory(user_folder_, ec)) {
    error = "user folder is not a directory: " + user_folder_.string();
    return false;
  }

  fs::create_directories(workflows_dir_, ec);
  if (ec) {
    error = "failed to create workflows directory '" + workflows_dir_.string() +
            "': " + ec.message();
    return false;
  }
  return true;
}

bool FileStorage::FindWorkflowById(const std::string& id,
                                   std::optional<workflow::WorkflowDefinition>& workflow,
                                   std::string& error) {
  workflow.reset();
  error.clear();

  if (!IsSafeRecordId(id)) {
    return true;
  }

  const fs::path record_path = workflows_dir_ / (id + ".json");
  std::string text;
  bool not_found = false;
  if (!core::ReadTextFile(record_path, text, not_found, error)) {
    if (not_found) {
      error.clear();
      return true;
    }
    return false;
  }

  workflow::WorkflowDefinition parsed;
  if (!workflow::ParseWorkflowText(text, parsed, error)) {
    error = "stored workflow '" + id + "' is corrupt: " + error;
    return false;
  }
  if (parsed.id.empty()) {
    parsed.id = id;
  }
  workflow = std::move(parsed);
  return true;
}

bool FileStorage::FindCredentials(const std::string& credential_type, const std::string& name,
                                  std::optional<core::json::Value>& data, std::string& error) {
  data.reset();
  error.clear();

  std::string text;
  bool not_found = false;
  if (!core::ReadTextFile(credentials_path_, text, not_found, error)) {
    if (not_found) {
      error.clear();
      return true;
    }
    return false;
  }

  core::json::Value root;
  if (!core::json::Parse(text, root, error)) {
    error = "credentials store is corrupt: " + error;
    return false;
  }
  if (root.type != core::json::Value::Type::kObject) {
    error = "credentials store must contain a JSON object";
    return false;
  }

  const core::json::Value* by_type = core::json::GetField(root, credential_type);
  if (by_type == nullptr) {
    return true;
  }
  const core::json::Value* entry = core::json::GetField(*by_type, name);
  if (entry == nullptr) {
    return true;
  }
  data = *entry;
  return true;
}

bool IsSafeRecordId(std::string_view id) {
  if (id.empty() || id == "." || id == "..") {
    return false;
  }
  for (const char c : id) {
    if (c == '/' || c == '\\' || c == '\0') {
      return false;
    }
  }
  return id.find("..") == std::string_view::npos;
}

} // namespace flowexec::storage

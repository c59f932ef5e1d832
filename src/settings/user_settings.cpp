#include "settings/user_settings.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cstdlib>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace flowexec::settings {

namespace {

constexpr std::size_t kEncryptionKeyBytes = 32;

std::string GenerateEncryptionKey() {
  std::random_device device;
  std::uniform_int_distribution<int> byte_dist(0, 255);
  std::ostringstream out;
  for (std::size_t i = 0; i < kEncryptionKeyBytes; ++i) {
    out << std::hex << std::setw(2) << std::setfill('0') << byte_dist(device);
  }
  return out.str();
}

} // namespace

FileUserSettings::FileUserSettings(fs::path user_folder)
    : settings_path_(std::move(user_folder) / "config") {}

bool FileUserSettings::Prepare(std::string& error) {
  error.clear();
  encryption_key_.clear();

  std::string text;
  bool not_found = false;
  if (core::ReadTextFile(settings_path_, text, not_found, error)) {
    core::json::Value root;
    if (!core::json::Parse(text, root, error)) {
      error = "user settings file '" + settings_path_.string() + "' is invalid: " + error;
      return false;
    }
    const core::json::Value* key = core::json::GetField(root, "encryptionKey");
    if (!core::json::IsString(key) || key->string_value.empty()) {
      error = "user settings file '" + settings_path_.string() +
              "' must define a non-empty string encryptionKey";
      return false;
    }
    encryption_key_ = key->string_value;
    return true;
  }
  if (!not_found) {
    return false;
  }
  error.clear();

  core::json::Value root = core::json::MakeObject();
  root.object_value["encryptionKey"] = core::json::MakeString(GenerateEncryptionKey());
  if (!core::WriteTextFileAtomic(settings_path_, core::json::Serialize(root, 2) + "\n", error)) {
    return false;
  }
  encryption_key_ = root.object_value["encryptionKey"].string_value;
  return true;
}

fs::path DefaultUserFolder() {
  if (const char* env = std::getenv("FLOWEXEC_USER_FOLDER"); env != nullptr && *env != '\0') {
    return fs::path(env);
  }
  if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return fs::path(home) / ".flowexec";
  }
  return fs::path(".flowexec");
}

} // namespace flowexec::settings

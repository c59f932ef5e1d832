#pragma once

#include <filesystem>
#include <string>

namespace flowexec::settings {

// Per-user settings that must exist before any workflow can run.
class IUserSettings {
public:
  virtual ~IUserSettings() = default;

  // Creates missing settings with defaults; validates existing ones.
  virtual bool Prepare(std::string& error) = 0;
};

// Settings file at `<user_folder>/config`:
//   {"encryptionKey": "<64 hex chars>"}
// A fresh random key is generated and written atomically when the file does
// not exist. An existing file is left untouched but must parse as an object
// with a non-empty string `encryptionKey`.
class FileUserSettings final : public IUserSettings {
public:
  explicit FileUserSettings(std::filesystem::path user_folder);

  bool Prepare(std::string& error) override;

  const std::filesystem::path& SettingsPath() const {
    return settings_path_;
  }

  // Valid only after a successful Prepare.
  const std::string& EncryptionKey() const {
    return encryption_key_;
  }

private:
  std::filesystem::path settings_path_;
  std::string encryption_key_;
};

// Returns `FLOWEXEC_USER_FOLDER` when set, otherwise `$HOME/.flowexec`,
// otherwise `.flowexec` in the working directory.
std::filesystem::path DefaultUserFolder();

} // namespace flowexec::settings

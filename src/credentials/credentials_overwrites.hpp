#pragma once

#include "core/json_dom.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace flowexec::credentials {

// Deployment-wide credential defaults applied on top of stored credentials.
class ICredentialsOverwrites {
public:
  virtual ~ICredentialsOverwrites() = default;

  virtual bool Init(std::string& error) = 0;

  // Fills fields of `data` that are missing, null or empty strings with the
  // overwrite values configured for `credential_type`. Values already set in
  // `data` are never replaced.
  virtual void Apply(std::string_view credential_type, core::json::Value& data) const = 0;
};

// Reads overwrites from `FLOWEXEC_CREDENTIALS_OVERWRITE_DATA`, a JSON object
// of credential type -> field map. Tests may inject the raw text directly.
class EnvCredentialsOverwrites final : public ICredentialsOverwrites {
public:
  static constexpr const char* kEnvVar = "FLOWEXEC_CREDENTIALS_OVERWRITE_DATA";

  EnvCredentialsOverwrites() = default;
  explicit EnvCredentialsOverwrites(std::optional<std::string> raw_override);

  bool Init(std::string& error) override;
  void Apply(std::string_view credential_type, core::json::Value& data) const override;

private:
  std::optional<std::string> raw_override_;
  bool use_override_ = false;
  core::json::Value overwrites_ = core::json::MakeObject();
};

} // namespace flowexec::credentials

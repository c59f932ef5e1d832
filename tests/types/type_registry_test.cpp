#include "types/type_loader.hpp"
#include "types/type_registry.hpp"

#include "common/temp_dir.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

using flowexec::types::BuiltinTypeLoader;
using flowexec::types::CredentialTypeRegistry;
using flowexec::types::LoadAndRegisterTypes;
using flowexec::types::NodeTypeRegistry;

TEST_CASE("NodeTypeRegistry rejects duplicates and stays unchanged", "[types]") {
  NodeTypeRegistry registry;
  std::string error;
  REQUIRE(registry.Init({{"a.start", "Start"}}, error));
  REQUIRE(registry.Has("a.start"));

  REQUIRE_FALSE(registry.Init({{"b.one", "One"}, {"b.one", "One again"}}, error));
  REQUIRE(error.find("b.one") != std::string::npos);
  REQUIRE(registry.Has("a.start"));
  REQUIRE_FALSE(registry.Has("b.one"));
  REQUIRE(registry.Size() == 1U);

  REQUIRE_FALSE(registry.Init({{"", "Nameless"}}, error));
}

TEST_CASE("BuiltinTypeLoader registers built-in and custom types", "[types]") {
  const fs::path root = flowexec::tests::common::CreateUniqueTempDir("flowexec-types");
  const fs::path custom = root / "types.json";
  {
    std::ofstream out(custom);
    out << R"({"nodeTypes": ["acme.widget", {"name": "acme.gadget", "displayName": "Gadget"}],
               "credentialTypes": ["acmeApi"]})";
  }

  BuiltinTypeLoader loader(custom);
  NodeTypeRegistry node_types;
  CredentialTypeRegistry credential_types;
  std::string error;
  REQUIRE(LoadAndRegisterTypes(loader, node_types, credential_types, error));
  REQUIRE(node_types.Has("n8n-nodes-base.start"));
  REQUIRE(node_types.Has("acme.widget"));
  REQUIRE(node_types.Find("acme.gadget")->display_name == "Gadget");
  REQUIRE(credential_types.Has("httpBasicAuth"));
  REQUIRE(credential_types.Has("acmeApi"));

  flowexec::tests::common::RemovePathBestEffort(root);
}

TEST_CASE("BuiltinTypeLoader tolerates a missing custom file", "[types]") {
  BuiltinTypeLoader loader(fs::temp_directory_path() / "flowexec-no-such-types.json");
  NodeTypeRegistry node_types;
  CredentialTypeRegistry credential_types;
  std::string error;
  REQUIRE(LoadAndRegisterTypes(loader, node_types, credential_types, error));
  REQUIRE(node_types.Size() == 10U);
  REQUIRE(credential_types.Size() == 3U);
}

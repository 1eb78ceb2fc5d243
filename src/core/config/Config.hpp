#pragma once
#include <optional>
#include <string>

#include "core/Env.hpp"
#include "core/release/ImageName.hpp"
#include "core/sdk/Sdk.hpp"

namespace nb {

struct Config {
  std::string team;
  std::string app;          // empty = name of the source directory
  std::string manifest;     // empty = auto-detect from the source tree

  SdkSettings sdk;

  ReleaseTarget release = ReleaseTarget::GoogleArtifactRegistry;
  std::string garRegistry  = "europe-north1-docker.pkg.dev/nais-io/nais";
  std::string ghcrRegistry = "ghcr.io";
  std::string ghcrUsername; // empty = GITHUB_ACTOR

  const std::string& registry() const {
    return release == ReleaseTarget::GitHubContainerRegistry ? ghcrRegistry : garRegistry;
  }
};

// Apply a JSON document on top of cfg. Throws ConfigError on syntax or type errors.
void apply_config_json(Config& cfg, const std::string& text);

// Defaults <- config file <- environment (NB_TEAM, NB_APP, NB_RELEASE_TYPE, NB_REGISTRY, NB_MANIFEST).
// explicitPath must exist; otherwise nb.json in the working directory is used if present.
Config load_config(const std::optional<std::string>& explicitPath,
                   const std::string& sourceDir,
                   const EnvLookup& env);

}

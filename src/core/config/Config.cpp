#include "Config.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

using nlohmann::json;

namespace nb {

static constexpr const char* kDefaultConfigFile = "nb.json";

static void read_string(const json& j, const char* key, std::string& out) {
  if (!j.contains(key)) return;
  if (!j[key].is_string()) throw ConfigError(std::string("'") + key + "' must be a string");
  out = j[key].get<std::string>();
}

static void read_images(const json& sdk, const char* name, SdkImages& out) {
  if (!sdk.contains(name)) return;
  const json& j = sdk[name];
  if (!j.is_object()) throw ConfigError(std::string("'sdk.") + name + "' must be a table");
  read_string(j, "build_docker_image", out.builderImage);
  read_string(j, "runtime_docker_image", out.runtimeImage);
}

static ReleaseTarget release_target_or_throw(const std::string& s) {
  auto t = parse_release_target(s);
  if (!t) throw ConfigError("unknown release type '" + s + "' (expected gar or ghcr)");
  return *t;
}

void apply_config_json(Config& cfg, const std::string& text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    throw ConfigError(std::string("syntax error: ") + e.what());
  }
  if (!j.is_object()) throw ConfigError("top level must be an object");

  read_string(j, "team", cfg.team);
  read_string(j, "app", cfg.app);
  read_string(j, "manifest", cfg.manifest);

  if (j.contains("sdk")) {
    const json& sdk = j["sdk"];
    read_images(sdk, "go", cfg.sdk.go);
    read_images(sdk, "gradle", cfg.sdk.gradle);
    read_images(sdk, "maven", cfg.sdk.maven);
  }

  if (j.contains("release")) {
    const json& rel = j["release"];
    if (!rel.is_object()) throw ConfigError("'release' must be a table");
    std::string type;
    read_string(rel, "type", type);
    if (!type.empty()) cfg.release = release_target_or_throw(type);
    if (rel.contains("gar")) read_string(rel["gar"], "registry", cfg.garRegistry);
    if (rel.contains("ghcr")) {
      read_string(rel["ghcr"], "registry", cfg.ghcrRegistry);
      read_string(rel["ghcr"], "username", cfg.ghcrUsername);
    }
  }
}

static std::string read_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw ConfigError("cannot open config file: " + path);
  std::ostringstream buf; buf << in.rdbuf();
  return buf.str();
}

static std::string directory_name(const std::string& dir) {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::path p = fs::weakly_canonical(fs::absolute(dir), ec);
  if (ec) p = fs::path(dir).lexically_normal();
  return p.filename().string();
}

Config load_config(const std::optional<std::string>& explicitPath,
                   const std::string& sourceDir,
                   const EnvLookup& env) {
  namespace fs = std::filesystem;
  Config cfg;

  std::optional<std::string> path = explicitPath;
  if (!path) {
    std::error_code ec;
    if (fs::is_regular_file(kDefaultConfigFile, ec)) path = kDefaultConfigFile;
  }
  if (path) {
    spdlog::debug("Reading configuration from {}", *path);
    apply_config_json(cfg, read_file(*path));
  }

  cfg.team = get_env_or(env, "NB_TEAM", cfg.team);
  cfg.app = get_env_or(env, "NB_APP", cfg.app);
  cfg.manifest = get_env_or(env, "NB_MANIFEST", cfg.manifest);
  if (auto type = env("NB_RELEASE_TYPE"); type && !type->empty()) {
    cfg.release = release_target_or_throw(*type);
  }
  if (auto registry = env("NB_REGISTRY"); registry && !registry->empty()) {
    if (cfg.release == ReleaseTarget::GitHubContainerRegistry) cfg.ghcrRegistry = *registry;
    else cfg.garRegistry = *registry;
  }

  if (cfg.app.empty()) cfg.app = directory_name(sourceDir);
  return cfg;
}

} // namespace nb

#include "Pipeline.hpp"

#include <exception>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/manifest/ManifestLocator.hpp"
#include "core/release/ImageName.hpp"
#include "core/release/ImageTag.hpp"
#include "core/sdk/SdkDetector.hpp"
#include "core/storage/TempFile.hpp"
#include "services/docker/ContainerEngine.hpp"
#include "services/git/Git.hpp"

namespace nb {

// docker login user name for OAuth access tokens on Artifact Registry
static constexpr const char* kGarUsername = "oauth2accesstoken";

const char* to_string(Stage stage) {
  switch (stage) {
    case Stage::Dockerfile: return "dockerfile";
    case Stage::Build:      return "build";
    case Stage::Release:    return "release";
    case Stage::Deploy:     return "deploy";
  }
  return "unknown";
}

Pipeline::Pipeline(PipelineOptions opts,
                   Config cfg,
                   ProcessRunner& processes,
                   TokenProvider& tokens,
                   EnvLookup env,
                   std::ostream& out,
                   Clock now)
  : opts_(std::move(opts)), cfg_(std::move(cfg)), processes_(processes), tokens_(tokens),
    env_(std::move(env)), out_(out), now_(std::move(now)) {}

void Pipeline::run(Stage stage) {
  preflight(stage);
  resolve(stage);

  const bool overridden = opts_.imageOverride.has_value();
  switch (stage) {
    case Stage::Dockerfile:
      dockerfileStage();
      break;
    case Stage::Build:
      buildStage();
      break;
    case Stage::Release:
      if (!overridden) buildStage();
      releaseStage();
      break;
    case Stage::Deploy:
      if (!overridden) {
        buildStage();
        releaseStage();
      }
      deployStage();
      break;
  }
}

// Configuration checks that must pass before any external program runs.
void Pipeline::preflight(Stage stage) {
  const bool overridden = opts_.imageOverride.has_value();

  if (!overridden && cfg_.release == ReleaseTarget::GoogleArtifactRegistry && cfg_.team.empty()) {
    throw ConfigError("team must be set to name images for gar");
  }

  // The registry to log in to is taken from the image reference itself.
  if (stage == Stage::Release && overridden && !has_registry_host(*opts_.imageOverride)) {
    throw ConfigError("image " + *opts_.imageOverride + " names no registry host to release to");
  }

  if (stage == Stage::Release || (stage == Stage::Deploy && !overridden)) {
    if (cfg_.release == ReleaseTarget::GitHubContainerRegistry) {
      if (get_env_or(env_, "GITHUB_TOKEN", "").empty()) {
        throw ConfigError("GITHUB_TOKEN must be set to release to ghcr");
      }
      if (cfg_.ghcrUsername.empty() && get_env_or(env_, "GITHUB_ACTOR", "").empty()) {
        throw ConfigError("release.ghcr.username or GITHUB_ACTOR must be set to release to ghcr");
      }
    }
  }

  if (stage == Stage::Deploy) {
    deploy_ = deploy_request_from_env(env_);
    if (!deploy_) throw ConfigError("NAIS_DEPLOY_APIKEY and NAIS_DEPLOY_SERVER must be set to deploy");
    if (opts_.cluster.empty()) throw ConfigError("deploy needs a target cluster");

    std::string manifest = cfg_.manifest;
    if (manifest.empty()) {
      auto found = find_manifest(opts_.sourceDir);
      if (!found) throw ConfigError("no deployment manifest found in " + opts_.sourceDir);
      manifest = *found;
    }
    deploy_->cluster = opts_.cluster;
    deploy_->resources = {manifest};
  }
}

void Pipeline::resolve(Stage stage) {
  const bool overridden = opts_.imageOverride.has_value();
  if (stage <= Stage::Build || !overridden) {
    sdk_ = detect_sdk(opts_.sourceDir, cfg_.sdk);
  }
  image_ = overridden ? *opts_.imageOverride : formattedImageName();
  spdlog::debug("Image reference: {}", image_);
}

std::string Pipeline::formattedImageName() {
  Git git(processes_, opts_.sourceDir);
  const std::string tag = make_image_tag(now_(), git.shortCommit(), git.dirty());
  return format_image_name(cfg_.release, ImageReference{cfg_.registry(), cfg_.team, cfg_.app, tag});
}

void Pipeline::dockerfileStage() {
  out_ << sdk_->dockerfile() << "\n";
  spdlog::info("Will be built as: {}", image_);
}

void Pipeline::buildStage() {
  const TempFile dockerfile("nb-Dockerfile-", sdk_->dockerfile());
  ContainerEngine(processes_).build(dockerfile.path(), image_, sdk_->sourcePath());
}

RegistryLogin Pipeline::registryLogin() {
  RegistryLogin login;
  login.host = registry_host(image_);
  if (cfg_.release == ReleaseTarget::GitHubContainerRegistry) {
    login.username = cfg_.ghcrUsername.empty() ? get_env_or(env_, "GITHUB_ACTOR", "") : cfg_.ghcrUsername;
    login.password = get_env_or(env_, "GITHUB_TOKEN", "");
  } else {
    login.username = kGarUsername;
    login.password = tokens_.acquireRegistryToken();
  }
  login.password = strip_bearer_prefix(login.password);
  return login;
}

void Pipeline::releaseStage() {
  const RegistryLogin login = registryLogin();
  ContainerEngine docker(processes_);
  docker.login(login.host, login.username, login.password);

  std::exception_ptr pushError;
  try {
    docker.push(image_);
  } catch (const Error&) {
    pushError = std::current_exception();
  }

  try {
    docker.logout(login.host);
  } catch (const Error& e) {
    if (!pushError) throw;
    spdlog::error("{}", e.what());
  }

  if (pushError) std::rethrow_exception(pushError);
  spdlog::info("Released {}", image_);
}

void Pipeline::deployStage() {
  Git git(processes_, opts_.sourceDir);
  const RepositorySlug slug = git.repository(env_);

  DeployRequest req = *deploy_;
  req.owner = slug.owner;
  req.repository = slug.name;
  req.gitRef = git.commit();
  req.vars = {"image=" + image_};

  DeployClient(processes_).deploy(req);
  spdlog::info("Deployed {} to {}", image_, req.cluster);
}

} // namespace nb

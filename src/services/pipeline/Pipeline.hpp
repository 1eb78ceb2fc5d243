#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "core/Env.hpp"
#include "core/config/Config.hpp"
#include "core/sdk/Sdk.hpp"
#include "services/auth/TokenProvider.hpp"
#include "services/deploy/DeployClient.hpp"
#include "services/process/ProcessRunner.hpp"

namespace nb {

// Ordered: requesting a stage runs every earlier stage first.
enum class Stage { Dockerfile, Build, Release, Deploy };

const char* to_string(Stage stage);

struct PipelineOptions {
  std::string sourceDir = ".";
  // Externally built image. Release and Deploy skip Dockerfile/Build and use it
  // verbatim; Deploy also skips Release.
  std::optional<std::string> imageOverride;
  std::string cluster; // deploy target
};

struct RegistryLogin {
  std::string host;
  std::string username;
  std::string password;
};

// Drives dockerfile -> build -> release -> deploy. Stages run strictly in
// order; the first failure aborts the rest and is thrown to the caller.
class Pipeline {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  Pipeline(PipelineOptions opts,
           Config cfg,
           ProcessRunner& processes,
           TokenProvider& tokens,
           EnvLookup env,
           std::ostream& out,
           Clock now = [] { return std::chrono::system_clock::now(); });

  void run(Stage stage);

  // Valid after run() has resolved them.
  const std::string& imageName() const { return image_; }
  const Sdk* sdk() const { return sdk_.get(); }

private:
  void preflight(Stage stage);
  void resolve(Stage stage);

  void dockerfileStage();
  void buildStage();
  void releaseStage();
  void deployStage();

  std::string formattedImageName();
  RegistryLogin registryLogin();

  PipelineOptions opts_;
  Config cfg_;
  ProcessRunner& processes_;
  TokenProvider& tokens_;
  EnvLookup env_;
  std::ostream& out_;
  Clock now_;

  std::unique_ptr<Sdk> sdk_;
  std::string image_;
  std::optional<DeployRequest> deploy_;
};

}

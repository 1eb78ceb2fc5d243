#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/Env.hpp"
#include "services/process/ProcessRunner.hpp"

namespace nb {

// Field names follow the deploy client's flags (gitRef is --ref).
struct DeployRequest {
  std::string apiKey;
  std::string cluster;
  std::string deployServer;
  std::string owner;
  std::string gitRef;
  std::string repository;
  std::vector<std::string> resources;
  std::vector<std::string> vars;  // key=value
  std::string varsFile;           // optional
  bool wait = true;
};

// Credentials for the deploy server from NAIS_DEPLOY_APIKEY and NAIS_DEPLOY_SERVER.
// Either one missing -> nullopt.
std::optional<DeployRequest> deploy_request_from_env(const EnvLookup& env);

// Names of required fields that are empty. Empty result = complete.
std::vector<std::string> missing_deploy_fields(const DeployRequest& req);

std::vector<std::string> deploy_arguments(const DeployRequest& req, const std::string& program = "deploy");

class DeployClient {
public:
  explicit DeployClient(ProcessRunner& runner, std::string program = "deploy")
    : runner_(runner), program_(std::move(program)) {}

  // Throws ConfigError without running anything if the request is incomplete,
  // ProcessError on a non-zero exit.
  void deploy(const DeployRequest& req);

private:
  ProcessRunner& runner_;
  std::string program_;
};

}

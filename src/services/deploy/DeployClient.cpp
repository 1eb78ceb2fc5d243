#include "DeployClient.hpp"

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace nb {

std::optional<DeployRequest> deploy_request_from_env(const EnvLookup& env) {
  auto apiKey = env("NAIS_DEPLOY_APIKEY");
  auto server = env("NAIS_DEPLOY_SERVER");
  if (!apiKey || apiKey->empty() || !server || server->empty()) return std::nullopt;

  DeployRequest req;
  req.apiKey = *apiKey;
  req.deployServer = *server;
  req.wait = true;
  return req;
}

std::vector<std::string> missing_deploy_fields(const DeployRequest& req) {
  std::vector<std::string> missing;
  if (req.apiKey.empty())       missing.push_back("apikey");
  if (req.deployServer.empty()) missing.push_back("deploy-server");
  if (req.cluster.empty())      missing.push_back("cluster");
  if (req.owner.empty())        missing.push_back("owner");
  if (req.repository.empty())   missing.push_back("repository");
  if (req.gitRef.empty())       missing.push_back("ref");
  if (req.resources.empty())    missing.push_back("resource");
  return missing;
}

std::vector<std::string> deploy_arguments(const DeployRequest& req, const std::string& program) {
  std::vector<std::string> args = {program};
  for (const auto& r : req.resources) { args.push_back("--resource"); args.push_back(r); }
  for (const auto& v : req.vars)      { args.push_back("--var");      args.push_back(v); }
  args.insert(args.end(), {
    "--apikey",        req.apiKey,
    "--cluster",       req.cluster,
    "--deploy-server", req.deployServer,
    "--owner",         req.owner,
    "--ref",           req.gitRef,
    "--repository",    req.repository,
  });
  if (!req.varsFile.empty()) { args.push_back("--vars"); args.push_back(req.varsFile); }
  args.push_back("--wait");
  args.push_back(req.wait ? "true" : "false");
  return args;
}

void DeployClient::deploy(const DeployRequest& req) {
  const auto missing = missing_deploy_fields(req);
  if (!missing.empty()) {
    std::string fields;
    for (const auto& f : missing) fields += (fields.empty() ? "" : ", ") + f;
    throw ConfigError("deploy configuration incomplete, missing: " + fields);
  }

  spdlog::info("Deploying {}/{} to {}", req.owner, req.repository, req.cluster);
  const int status = runner_.run(deploy_arguments(req, program_));
  if (status != 0) throw ProcessError("deploy", status);
}

} // namespace nb

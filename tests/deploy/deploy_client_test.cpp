#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "common/FixedEnv.hpp"
#include "common/RecordingProcessRunner.hpp"
#include "core/Errors.hpp"
#include "services/deploy/DeployClient.hpp"

using nb::tests::RecordingProcessRunner;
using nb::tests::fixed_env;

namespace {

nb::DeployRequest complete_request() {
  nb::DeployRequest req;
  req.apiKey = "key";
  req.cluster = "dev-gcp";
  req.deployServer = "deploy.example.com:443";
  req.owner = "navikt";
  req.repository = "myapp";
  req.gitRef = "0123abc";
  req.resources = {"nais.yaml"};
  return req;
}

}

TEST(DeployClient, RequestFromEnvironmentNeedsKeyAndServer) {
  auto req = nb::deploy_request_from_env(fixed_env({
    {"NAIS_DEPLOY_APIKEY", "key"},
    {"NAIS_DEPLOY_SERVER", "deploy.example.com:443"},
  }));
  ASSERT_TRUE(req.has_value());
  EXPECT_EQ(req->apiKey, "key");
  EXPECT_EQ(req->deployServer, "deploy.example.com:443");
  EXPECT_TRUE(req->wait);

  EXPECT_FALSE(nb::deploy_request_from_env(fixed_env({{"NAIS_DEPLOY_APIKEY", "key"}})).has_value());
  EXPECT_FALSE(nb::deploy_request_from_env(fixed_env({{"NAIS_DEPLOY_SERVER", "x"}})).has_value());
  EXPECT_FALSE(nb::deploy_request_from_env(fixed_env({
    {"NAIS_DEPLOY_APIKEY", ""},
    {"NAIS_DEPLOY_SERVER", "x"},
  })).has_value());
}

TEST(DeployClient, ArgumentComposition) {
  auto req = complete_request();
  req.resources = {"nais.yaml", "alerts.yaml"};
  req.vars = {"image=ghcr.io/navikt/myapp:1"};
  req.varsFile = "vars/dev.yaml";
  req.wait = false;

  const std::vector<std::string> expected = {
    "deploy",
    "--resource", "nais.yaml",
    "--resource", "alerts.yaml",
    "--var", "image=ghcr.io/navikt/myapp:1",
    "--apikey", "key",
    "--cluster", "dev-gcp",
    "--deploy-server", "deploy.example.com:443",
    "--owner", "navikt",
    "--ref", "0123abc",
    "--repository", "myapp",
    "--vars", "vars/dev.yaml",
    "--wait", "false",
  };
  EXPECT_EQ(nb::deploy_arguments(req), expected);
}

TEST(DeployClient, VarsFileOmittedWhenEmpty) {
  const auto args = nb::deploy_arguments(complete_request(), "/usr/local/bin/deploy");
  EXPECT_EQ(args.front(), "/usr/local/bin/deploy");
  EXPECT_EQ(std::find(args.begin(), args.end(), "--vars"), args.end());
  EXPECT_EQ(args[args.size() - 2], "--wait");
  EXPECT_EQ(args.back(), "true");
}

TEST(DeployClient, MissingFieldsAreNamed) {
  nb::DeployRequest req;
  req.apiKey = "key";
  req.deployServer = "server";
  EXPECT_EQ(nb::missing_deploy_fields(req),
            (std::vector<std::string>{"cluster", "owner", "repository", "ref", "resource"}));
  EXPECT_TRUE(nb::missing_deploy_fields(complete_request()).empty());
}

TEST(DeployClient, IncompleteRequestNeverRuns) {
  RecordingProcessRunner runner;
  auto req = complete_request();
  req.apiKey.clear();

  try {
    nb::DeployClient(runner).deploy(req);
    FAIL() << "expected ConfigError";
  } catch (const nb::ConfigError& e) {
    EXPECT_NE(std::string(e.what()).find("apikey"), std::string::npos);
  }
  EXPECT_TRUE(runner.calls.empty());
}

TEST(DeployClient, NonZeroExitIsProcessError) {
  RecordingProcessRunner runner;
  runner.failWith("deploy", 2);

  try {
    nb::DeployClient(runner).deploy(complete_request());
    FAIL() << "expected ProcessError";
  } catch (const nb::ProcessError& e) {
    EXPECT_EQ(e.exitStatus(), 2);
  }
  EXPECT_EQ(runner.calls.size(), 1u);
}

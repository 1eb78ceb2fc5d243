#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "common/RecordingProcessRunner.hpp"
#include "core/Errors.hpp"
#include "services/docker/ContainerEngine.hpp"

using nb::tests::RecordingProcessRunner;

TEST(ContainerEngine, BuildArguments) {
  RecordingProcessRunner runner;
  nb::ContainerEngine(runner).build("/tmp/Dockerfile", "r/t/a:1", "/src");

  ASSERT_EQ(runner.calls.size(), 1u);
  EXPECT_EQ(runner.calls[0].argv,
            (std::vector<std::string>{"docker", "build", "--file", "/tmp/Dockerfile", "--tag", "r/t/a:1", "/src"}));
}

TEST(ContainerEngine, BuildFailureCarriesExitStatus) {
  RecordingProcessRunner runner;
  runner.failWith("docker build", 125);

  try {
    nb::ContainerEngine(runner).build("/tmp/Dockerfile", "r/t/a:1", "/src");
    FAIL() << "expected BuildFailed";
  } catch (const nb::BuildFailed& e) {
    EXPECT_EQ(e.exitStatus(), 125);
  }
}

TEST(ContainerEngine, LoginPassesPasswordOnStdin) {
  RecordingProcessRunner runner;
  nb::ContainerEngine(runner, "podman").login("ghcr.io", "octocat", "s3cret");

  ASSERT_EQ(runner.calls.size(), 1u);
  const auto& call = runner.calls[0];
  EXPECT_EQ(call.argv,
            (std::vector<std::string>{"podman", "login", "ghcr.io", "--username", "octocat", "--password-stdin"}));
  EXPECT_EQ(call.input, "s3cret");
  for (const auto& arg : call.argv) EXPECT_EQ(arg.find("s3cret"), std::string::npos);
}

TEST(ContainerEngine, PushAndLogoutFailures) {
  RecordingProcessRunner runner;
  runner.failWith("docker push", 1);
  runner.failWith("docker logout", 2);
  nb::ContainerEngine docker(runner);

  EXPECT_THROW(docker.push("r/a:1"), nb::ProcessError);
  EXPECT_THROW(docker.logout("r"), nb::ProcessError);
  EXPECT_EQ(RecordingProcessRunner::key(runner.calls[0].argv), "docker push r/a:1");
  EXPECT_EQ(RecordingProcessRunner::key(runner.calls[1].argv), "docker logout r");
}

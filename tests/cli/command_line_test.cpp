#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "services/cli/CommandLine.hpp"

using nb::UsageError;
using nb::parse_command_line;

TEST(CommandLine, DefaultsForBareCommand) {
  const auto cl = parse_command_line({"dockerfile"});
  EXPECT_EQ(cl.stage, nb::Stage::Dockerfile);
  EXPECT_EQ(cl.sourceDir, ".");
  EXPECT_FALSE(cl.configFile.has_value());
  EXPECT_FALSE(cl.image.has_value());
  EXPECT_FALSE(cl.verbose);
}

TEST(CommandLine, OptionsInBothForms) {
  const auto cl = parse_command_line(
    {"-v", "--source-directory", "/src/app", "--config=nb.json", "release", "-i", "ghcr.io/navikt/app:1"});
  EXPECT_EQ(cl.stage, nb::Stage::Release);
  EXPECT_TRUE(cl.verbose);
  EXPECT_EQ(cl.sourceDir, "/src/app");
  EXPECT_EQ(cl.configFile, "nb.json");
  EXPECT_EQ(cl.image, "ghcr.io/navikt/app:1");
}

TEST(CommandLine, DeployTakesCluster) {
  const auto cl = parse_command_line({"deploy", "dev-gcp"});
  EXPECT_EQ(cl.stage, nb::Stage::Deploy);
  EXPECT_EQ(cl.cluster, "dev-gcp");
}

TEST(CommandLine, HelpNeedsNoCommand) {
  EXPECT_TRUE(parse_command_line({"--help"}).help);
  EXPECT_TRUE(parse_command_line({"-h", "bogus"}).help);
}

TEST(CommandLine, UsageErrors) {
  EXPECT_THROW(parse_command_line({}), UsageError);
  EXPECT_THROW(parse_command_line({"publish"}), UsageError);
  EXPECT_THROW(parse_command_line({"deploy"}), UsageError);
  EXPECT_THROW(parse_command_line({"build", "extra"}), UsageError);
  EXPECT_THROW(parse_command_line({"deploy", "dev-gcp", "prod-gcp"}), UsageError);
  EXPECT_THROW(parse_command_line({"--frobnicate", "build"}), UsageError);
  EXPECT_THROW(parse_command_line({"build", "--config"}), UsageError);
  EXPECT_THROW(parse_command_line({"release", "--image="}), UsageError);
}

TEST(CommandLine, UsageMentionsEveryCommand) {
  std::ostringstream os;
  nb::print_usage(os, "nb");
  const std::string text = os.str();
  for (const char* cmd : {"dockerfile", "build", "release", "deploy <cluster>"}) {
    EXPECT_NE(text.find(cmd), std::string::npos) << cmd;
  }
}

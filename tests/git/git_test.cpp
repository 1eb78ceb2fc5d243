#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "common/FixedEnv.hpp"
#include "common/RecordingProcessRunner.hpp"
#include "core/Errors.hpp"
#include "services/git/Git.hpp"

using nb::tests::RecordingProcessRunner;
using nb::tests::fixed_env;

TEST(Git, RepositorySlugFromRemote) {
  const char* urls[] = {
    "https://github.com/navikt/myapp.git",
    "https://github.com/navikt/myapp",
    "https://github.com/navikt/myapp/",
    "git@github.com:navikt/myapp.git",
    "ssh://git@github.com/navikt/myapp.git",
    "git@github.com:navikt/myapp\n",
  };
  for (const char* url : urls) {
    auto slug = nb::parse_repository_slug(url);
    ASSERT_TRUE(slug.has_value()) << url;
    EXPECT_EQ(slug->owner, "navikt") << url;
    EXPECT_EQ(slug->name, "myapp") << url;
  }
}

TEST(Git, UnparseableRemote) {
  EXPECT_FALSE(nb::parse_repository_slug("").has_value());
  EXPECT_FALSE(nb::parse_repository_slug("myapp").has_value());
  EXPECT_FALSE(nb::parse_repository_slug("/myapp").has_value());
}

TEST(Git, CommitQueriesRunInWorkTree) {
  RecordingProcessRunner runner;
  nb::Git git(runner, "/src/app");

  EXPECT_EQ(git.shortCommit(), "abc1234");
  EXPECT_EQ(git.commit(), "abc1234def5678abc1234def5678abc1234def56");
  EXPECT_FALSE(git.dirty());

  ASSERT_EQ(runner.calls.size(), 3u);
  EXPECT_EQ(runner.calls[0].argv,
            (std::vector<std::string>{"git", "-C", "/src/app", "rev-parse", "--short", "HEAD"}));
}

TEST(Git, DirtyWhenStatusHasOutput) {
  RecordingProcessRunner runner;
  runner.output("git status --porcelain", "?? new-file.go\n");
  EXPECT_TRUE(nb::Git(runner, ".").dirty());
}

TEST(Git, FailureIsProcessError) {
  RecordingProcessRunner runner;
  runner.failWith("git rev-parse", 128);

  try {
    nb::Git(runner, ".").commit();
    FAIL() << "expected ProcessError";
  } catch (const nb::ProcessError& e) {
    EXPECT_EQ(e.exitStatus(), 128);
    EXPECT_NE(std::string(e.what()).find("git rev-parse"), std::string::npos);
  }
}

TEST(Git, GithubRepositoryWinsOverRemote) {
  RecordingProcessRunner runner;
  const auto slug = nb::Git(runner, ".").repository(fixed_env({{"GITHUB_REPOSITORY", "someorg/otherrepo"}}));
  EXPECT_EQ(slug.owner, "someorg");
  EXPECT_EQ(slug.name, "otherrepo");
  EXPECT_TRUE(runner.calls.empty());
}

TEST(Git, RepositoryFromOriginRemote) {
  RecordingProcessRunner runner;
  const auto slug = nb::Git(runner, ".").repository(fixed_env({{"GITHUB_REPOSITORY", "malformed"}}));
  EXPECT_EQ(slug.owner, "navikt");
  EXPECT_EQ(slug.name, "myapp");
  EXPECT_EQ(runner.callsTo("git remote get-url origin").size(), 1u);
}

TEST(Git, UnusableRemoteIsConfigError) {
  RecordingProcessRunner runner;
  runner.output("git remote get-url origin", "localrepo\n");
  EXPECT_THROW(nb::Git(runner, ".").repository(fixed_env()), nb::ConfigError);
}

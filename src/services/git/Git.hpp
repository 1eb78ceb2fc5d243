#pragma once
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>

#include "core/Env.hpp"
#include "services/process/ProcessRunner.hpp"

namespace nb {

struct RepositorySlug {
  std::string owner;
  std::string name;
};

// "https://github.com/navikt/app.git", "git@github.com:navikt/app" -> {navikt, app}
std::optional<RepositorySlug> parse_repository_slug(const std::string& remoteUrl);

// Version-control metadata for the source tree, read through the git CLI.
class Git {
public:
  Git(ProcessRunner& runner, std::string workTree)
    : runner_(runner), workTree_(std::move(workTree)) {}

  std::string commit();
  std::string shortCommit();
  bool dirty();

  // GITHUB_REPOSITORY ("owner/name") wins over the origin remote.
  RepositorySlug repository(const EnvLookup& env);

private:
  std::string output(std::initializer_list<std::string> args);

  ProcessRunner& runner_;
  std::string workTree_;
};

}

#include "Git.hpp"

#include <vector>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace nb {

static std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::optional<RepositorySlug> parse_repository_slug(const std::string& remoteUrl) {
  std::string s = trim(remoteUrl);
  while (!s.empty() && s.back() == '/') s.pop_back();
  if (s.size() > 4 && s.compare(s.size() - 4, 4, ".git") == 0) s.resize(s.size() - 4);

  const auto sep = s.find_last_of('/');
  if (sep == std::string::npos || sep == 0) return std::nullopt;
  const std::string name = s.substr(sep + 1);

  const std::string rest = s.substr(0, sep);
  const auto ownerSep = rest.find_last_of("/:");
  const std::string owner = ownerSep == std::string::npos ? rest : rest.substr(ownerSep + 1);

  if (owner.empty() || name.empty()) return std::nullopt;
  return RepositorySlug{owner, name};
}

std::string Git::output(std::initializer_list<std::string> args) {
  std::vector<std::string> argv = {"git", "-C", workTree_};
  argv.insert(argv.end(), args.begin(), args.end());
  auto result = runner_.capture(argv);
  if (result.exitStatus != 0) {
    throw ProcessError("git " + *args.begin(), result.exitStatus);
  }
  return trim(result.output);
}

std::string Git::commit() {
  return output({"rev-parse", "HEAD"});
}

std::string Git::shortCommit() {
  return output({"rev-parse", "--short", "HEAD"});
}

bool Git::dirty() {
  return !output({"status", "--porcelain"}).empty();
}

RepositorySlug Git::repository(const EnvLookup& env) {
  if (auto gh = env("GITHUB_REPOSITORY"); gh && !gh->empty()) {
    const auto sep = gh->find('/');
    if (sep != std::string::npos && sep > 0 && sep + 1 < gh->size()) {
      return RepositorySlug{gh->substr(0, sep), gh->substr(sep + 1)};
    }
    spdlog::warn("ignoring malformed GITHUB_REPOSITORY '{}'", *gh);
  }

  const std::string remote = output({"remote", "get-url", "origin"});
  auto slug = parse_repository_slug(remote);
  if (!slug) throw ConfigError("cannot determine repository owner/name from remote '" + remote + "'");
  return *slug;
}

} // namespace nb

#include "ImageName.hpp"

#include <stdexcept>

namespace nb {

std::string to_string(ReleaseTarget target) {
  switch (target) {
    case ReleaseTarget::GoogleArtifactRegistry:  return "gar";
    case ReleaseTarget::GitHubContainerRegistry: return "ghcr";
  }
  return "gar";
}

std::optional<ReleaseTarget> parse_release_target(const std::string& s) {
  if (s == "gar") return ReleaseTarget::GoogleArtifactRegistry;
  if (s == "ghcr") return ReleaseTarget::GitHubContainerRegistry;
  return std::nullopt;
}

static void require(const std::string& value, const char* field) {
  if (value.empty()) throw std::invalid_argument(std::string("image name: empty ") + field);
}

std::string format_image_name(ReleaseTarget target, const ImageReference& ref) {
  require(ref.registry, "registry");
  require(ref.app, "app");
  require(ref.tag, "tag");

  switch (target) {
    case ReleaseTarget::GoogleArtifactRegistry:
      require(ref.team, "team");
      return ref.registry + "/" + ref.team + "/" + ref.app + ":" + ref.tag;
    case ReleaseTarget::GitHubContainerRegistry:
      return ref.registry + "/" + ref.app + ":" + ref.tag;
  }
  throw std::invalid_argument("image name: unknown release target");
}

std::string registry_host(const std::string& registry) {
  return registry.substr(0, registry.find('/'));
}

bool has_registry_host(const std::string& image) {
  const auto slash = image.find('/');
  if (slash == std::string::npos || slash == 0) return false;
  const std::string host = image.substr(0, slash);
  return host == "localhost" || host.find_first_of(".:") != std::string::npos;
}

} // namespace nb

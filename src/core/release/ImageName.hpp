#pragma once
#include <optional>
#include <string>

namespace nb {

enum class ReleaseTarget {
  GoogleArtifactRegistry,  // "gar"
  GitHubContainerRegistry, // "ghcr"
};

struct ImageReference {
  std::string registry;
  std::string team;
  std::string app;
  std::string tag;
};

std::string to_string(ReleaseTarget target);
std::optional<ReleaseTarget> parse_release_target(const std::string& s);

// GAR:  {registry}/{team}/{app}:{tag}
// GHCR: {registry}/{app}:{tag}
// Throws std::invalid_argument on an empty component the target needs.
std::string format_image_name(ReleaseTarget target, const ImageReference& ref);

// Host part of a registry path, as used by "docker login":
// "europe-north1-docker.pkg.dev/project/repo" -> "europe-north1-docker.pkg.dev"
std::string registry_host(const std::string& registry);

// True when the reference starts with a registry host the way docker reads it:
// a first path component containing '.' or ':', or "localhost".
// "ghcr.io/navikt/app:1" -> true, "myapp:1" and "library/app" -> false
bool has_registry_host(const std::string& image);

}

#include "ManifestLocator.hpp"

#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

namespace nb {

static const char* const kCandidates[] = {
  ".nais.yaml",       ".nais.yml",
  ".naiserator.yaml", ".naiserator.yml",
  "dev-fss.yaml",     "dev-fss.yml",
  "dev-gcp.yaml",     "dev-gcp.yml",
  "dev.yml",
  "nais.yaml",        "nais.yml",
  "naiserator.yaml",  "naiserator.yml",
  "prod-fss.yaml",    "prod-fss.yml",
  "prod-gcp.yaml",    "prod-gcp.yml",
  "prod.yml",
};

std::optional<std::string> find_manifest(const std::string& root) {
  namespace fs = std::filesystem;
  const fs::path dirs[] = { fs::path(root), fs::path(root) / ".nais" };

  for (const auto& dir : dirs) {
    for (const char* name : kCandidates) {
      const fs::path p = dir / name;
      std::error_code ec;
      if (fs::is_regular_file(p, ec)) {
        spdlog::debug("Using deployment manifest {}", p.string());
        return p.string();
      }
    }
  }
  return std::nullopt;
}

} // namespace nb

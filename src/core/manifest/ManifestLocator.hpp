#pragma once
#include <optional>
#include <string>

namespace nb {
  // Path of the deployment manifest in the source tree. The root is searched
  // before .nais/; within each directory the first known file name wins.
  // The file content is not read.
  std::optional<std::string> find_manifest(const std::string& root);
}

#pragma once
#include <string>

namespace nb {
  // True if <root>/<file> is a regular file, false if it does not exist.
  // Any other filesystem failure (permission denied, I/O error) throws DetectionError.
  bool marker_present(const std::string& sdk, const std::string& root, const std::string& file);
}

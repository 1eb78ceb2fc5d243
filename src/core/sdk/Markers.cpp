#include "Markers.hpp"

#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace nb {

bool marker_present(const std::string& sdk, const std::string& root, const std::string& file) {
  namespace fs = std::filesystem;
  const fs::path p = fs::path(root) / file;

  std::error_code ec;
  const fs::file_status st = fs::status(p, ec);
  if (st.type() == fs::file_type::not_found) return false;
  if (ec) throw DetectionError(sdk, p.string(), ec.message());

  const bool found = st.type() == fs::file_type::regular;
  spdlog::debug("probe {}: {} {}", sdk, p.string(), found ? "found" : "not a regular file");
  return found;
}

} // namespace nb

#include "BuildTargets.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace nb {

bool is_valid_utf8(std::string_view s) {
  size_t i = 0;
  while (i < s.size()) {
    const auto c = static_cast<unsigned char>(s[i]);
    size_t len = 0;
    if (c < 0x80) len = 1;
    else if ((c & 0xE0) == 0xC0 && c >= 0xC2) len = 2;
    else if ((c & 0xF0) == 0xE0) len = 3;
    else if ((c & 0xF8) == 0xF0 && c <= 0xF4) len = 4;
    else return false;
    if (i + len > s.size()) return false;
    for (size_t k = 1; k < len; ++k) {
      if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return false;
    }
    // overlongs, UTF-16 surrogates and code points above U+10FFFF
    const auto c1 = static_cast<unsigned char>(len > 1 ? s[i + 1] : 0);
    if (c == 0xE0 && c1 < 0xA0) return false;
    if (c == 0xED && c1 > 0x9F) return false;
    if (c == 0xF0 && c1 < 0x90) return false;
    if (c == 0xF4 && c1 > 0x8F) return false;
    i += len;
  }
  return true;
}

std::vector<std::string> list_cmd_targets(const std::string& root) {
  namespace fs = std::filesystem;
  using Kind = TargetDiscoveryError::Kind;

  const fs::path dir = fs::path(root) / "cmd";
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    throw TargetDiscoveryError(Kind::Filesystem, "filesystem error: " + dir.string() + ": " + ec.message());
  }

  std::vector<std::string> targets;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) break;
    std::error_code typeEc;
    const fs::file_status st = it->status(typeEc);
    if (st.type() == fs::file_type::not_found) continue; // dangling symlink
    if (typeEc) {
      throw TargetDiscoveryError(Kind::Filesystem,
                                 "filesystem error: " + it->path().string() + ": " + typeEc.message());
    }
    if (st.type() != fs::file_type::directory) continue;

    const std::string name = it->path().filename().native();
    if (name.empty() || !is_valid_utf8(name)) {
      throw TargetDiscoveryError(Kind::EmptyFilename, "target name is empty");
    }
    targets.push_back(name);
  }
  if (ec) {
    throw TargetDiscoveryError(Kind::Filesystem, "filesystem error: " + dir.string() + ": " + ec.message());
  }

  // directory iteration order is unspecified
  std::sort(targets.begin(), targets.end());
  spdlog::debug("{} build target(s) found in {}", targets.size(), dir.string());
  return targets;
}

} // namespace nb

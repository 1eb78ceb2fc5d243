#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace nb {

// Immediate subdirectories of <root>/cmd, sorted. Each one is a binary to build.
// Throws TargetDiscoveryError (Filesystem) if cmd/ cannot be listed and
// TargetDiscoveryError (EmptyFilename) if a name is empty or not UTF-8.
std::vector<std::string> list_cmd_targets(const std::string& root);

bool is_valid_utf8(std::string_view s);

}

#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "Sdk.hpp"

namespace nb {

struct SdkCandidate {
  std::string name;
  // Cheap read-only check. false = not applicable; unexpected I/O errors throw.
  std::function<bool(const std::string& root)> probe;
  std::function<std::unique_ptr<Sdk>(const std::string& root, const SdkSettings&)> create;
};

// Known SDKs, highest priority first: go, gradle, maven.
const std::vector<SdkCandidate>& sdk_priority();

// First candidate whose probe succeeds wins; later candidates are not probed.
// Throws SdkNotDetected when nothing matches.
std::unique_ptr<Sdk> detect_sdk(const std::string& root,
                                const SdkSettings& settings,
                                const std::vector<SdkCandidate>& candidates = sdk_priority());

}

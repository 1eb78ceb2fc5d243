#include "SdkDetector.hpp"

#include <spdlog/spdlog.h>

#include "GoSdk.hpp"
#include "JvmSdk.hpp"
#include "core/Errors.hpp"

namespace nb {

const std::vector<SdkCandidate>& sdk_priority() {
  static const std::vector<SdkCandidate> candidates = {
    {"go",     &GoSdk::probe,     &GoSdk::create},
    {"gradle", &GradleSdk::probe, &GradleSdk::create},
    {"maven",  &MavenSdk::probe,  &MavenSdk::create},
  };
  return candidates;
}

std::unique_ptr<Sdk> detect_sdk(const std::string& root,
                                const SdkSettings& settings,
                                const std::vector<SdkCandidate>& candidates) {
  for (const auto& c : candidates) {
    if (!c.probe(root)) continue;
    spdlog::info("Detected {} SDK in {}", c.name, root);
    return c.create(root, settings);
  }
  throw SdkNotDetected();
}

} // namespace nb

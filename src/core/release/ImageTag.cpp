#include "ImageTag.hpp"

#include <ctime>
#include <stdexcept>

namespace nb {

std::string make_image_tag(std::chrono::system_clock::time_point now,
                           const std::string& shortCommit,
                           bool dirty) {
  if (shortCommit.empty()) throw std::invalid_argument("image tag: empty commit hash");

  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%d.%H%M%S", &tm);

  std::string tag = std::string(buf) + "." + shortCommit;
  if (dirty) tag += "-dirty";
  return tag;
}

} // namespace nb

#pragma once
#include <chrono>
#include <string>

namespace nb {
  // "YYYYMMDD.HHMMSS.<shortCommit>" in UTC, with "-dirty" appended for an unclean tree.
  std::string make_image_tag(std::chrono::system_clock::time_point now,
                             const std::string& shortCommit,
                             bool dirty);
}

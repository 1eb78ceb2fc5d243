#pragma once
#include <string>

namespace nb {
  // Route the default spdlog logger to stderr; stdout carries command output.
  // levelName: spdlog level name ("debug", "info", ...). Empty keeps "info".
  void init_logging(const std::string& levelName);
}

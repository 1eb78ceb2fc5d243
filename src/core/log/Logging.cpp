#include "Logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace nb {

void init_logging(const std::string& levelName) {
  auto logger = spdlog::stderr_color_mt("nb");
  logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
  spdlog::set_default_logger(logger);

  auto level = spdlog::level::info;
  if (!levelName.empty()) {
    level = spdlog::level::from_str(levelName);
    // from_str maps unknown names to "off"; keep info instead of going silent
    if (level == spdlog::level::off && levelName != "off") {
      level = spdlog::level::info;
      spdlog::warn("unknown log level '{}', using info", levelName);
    }
  }
  spdlog::set_level(level);
}

} // namespace nb

#pragma once
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "services/pipeline/Pipeline.hpp"

namespace nb {

struct CommandLine {
  std::string sourceDir = ".";
  std::optional<std::string> configFile;
  std::optional<std::string> image;  // --image: use this reference instead of building
  bool verbose = false;
  bool help = false;
  Stage stage = Stage::Dockerfile;
  std::string cluster;               // deploy <cluster>
};

class UsageError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// args excludes argv[0]. Throws UsageError.
CommandLine parse_command_line(const std::vector<std::string>& args);

void print_usage(std::ostream& os, const std::string& argv0);

}

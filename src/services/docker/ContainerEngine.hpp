#pragma once
#include <string>
#include <utility>

#include "services/process/ProcessRunner.hpp"

namespace nb {

// docker CLI wrapper. Every operation throws ProcessError on a non-zero exit.
class ContainerEngine {
public:
  explicit ContainerEngine(ProcessRunner& runner, std::string program = "docker")
    : runner_(runner), program_(std::move(program)) {}

  // Throws BuildFailed.
  void build(const std::string& dockerfile, const std::string& tag, const std::string& contextDir);

  // Password goes through stdin, never the argument list.
  void login(const std::string& registry, const std::string& username, const std::string& password);
  void logout(const std::string& registry);
  void push(const std::string& image);

private:
  ProcessRunner& runner_;
  std::string program_;
};

}

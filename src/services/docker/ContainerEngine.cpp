#include "ContainerEngine.hpp"

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace nb {

void ContainerEngine::build(const std::string& dockerfile, const std::string& tag, const std::string& contextDir) {
  spdlog::info("Building image {}", tag);
  const int status = runner_.run({program_, "build", "--file", dockerfile, "--tag", tag, contextDir});
  if (status != 0) throw BuildFailed(status);
}

void ContainerEngine::login(const std::string& registry, const std::string& username, const std::string& password) {
  spdlog::debug("Logging in to Docker registry {}", registry);
  const int status = runner_.runWithInput(
    {program_, "login", registry, "--username", username, "--password-stdin"}, password);
  if (status != 0) throw ProcessError("docker login", status);
}

void ContainerEngine::logout(const std::string& registry) {
  spdlog::debug("Logging out of Docker registry {}", registry);
  const int status = runner_.run({program_, "logout", registry});
  if (status != 0) throw ProcessError("docker logout", status);
}

void ContainerEngine::push(const std::string& image) {
  spdlog::info("Pushing image {}", image);
  const int status = runner_.run({program_, "push", image});
  if (status != 0) throw ProcessError("docker push", status);
}

} // namespace nb

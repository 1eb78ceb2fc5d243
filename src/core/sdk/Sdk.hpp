#pragma once
#include <string>
#include <utility>
#include <vector>

namespace nb {

struct SdkImages {
  std::string builderImage;
  std::string runtimeImage;
};

// Docker images for every known SDK, from configuration.
struct SdkSettings {
  SdkImages go     {"golang:1-alpine", "alpine:3"};
  SdkImages gradle {"gradle:8-jdk21-alpine", "eclipse-temurin:21-jre-alpine"};
  SdkImages maven  {"maven:3-eclipse-temurin-21-alpine", "eclipse-temurin:21-jre-alpine"};
};

// A detected build SDK. Immutable: build targets are resolved at construction,
// so dockerfile() performs no I/O.
class Sdk {
public:
  Sdk(std::string name, std::string sourcePath, SdkImages images, std::vector<std::string> targets)
    : name_(std::move(name)), sourcePath_(std::move(sourcePath)),
      images_(std::move(images)), targets_(std::move(targets)) {}
  virtual ~Sdk() = default;

  const std::string& name() const { return name_; }
  const std::string& sourcePath() const { return sourcePath_; }
  const std::string& builderImage() const { return images_.builderImage; }
  const std::string& runtimeImage() const { return images_.runtimeImage; }
  const std::vector<std::string>& buildTargets() const { return targets_; }

  virtual std::string dockerfile() const = 0;

private:
  std::string name_;
  std::string sourcePath_;
  SdkImages images_;
  std::vector<std::string> targets_;
};

} // namespace nb

#pragma once
#include <memory>
#include <string>

#include "Sdk.hpp"

namespace nb {

// Gradle builds. Marker: gradlew wrapper, build.gradle or build.gradle.kts.
// Targets are fixed: test, then build.
class GradleSdk : public Sdk {
public:
  GradleSdk(std::string sourcePath, SdkImages images);

  std::string dockerfile() const override;

  static bool probe(const std::string& root);
  static std::unique_ptr<Sdk> create(const std::string& root, const SdkSettings& settings);
};

// Maven (single or multi-module). Marker: pom.xml.
// Targets are fixed: test, then package.
class MavenSdk : public Sdk {
public:
  MavenSdk(std::string sourcePath, SdkImages images);

  std::string dockerfile() const override;

  static bool probe(const std::string& root);
  static std::unique_ptr<Sdk> create(const std::string& root, const SdkSettings& settings);
};

}

#pragma once
#include <memory>
#include <string>

#include "Sdk.hpp"

namespace nb {

// Go modules. Marker: go.mod. One binary per directory under cmd/.
class GoSdk : public Sdk {
public:
  GoSdk(std::string sourcePath, SdkImages images, std::vector<std::string> targets)
    : Sdk("go", std::move(sourcePath), std::move(images), std::move(targets)) {}

  std::string dockerfile() const override;

  static bool probe(const std::string& root);
  static std::unique_ptr<Sdk> create(const std::string& root, const SdkSettings& settings);
};

}

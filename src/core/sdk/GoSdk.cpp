#include "GoSdk.hpp"

#include <sstream>

#include "BuildTargets.hpp"
#include "Markers.hpp"

namespace nb {

bool GoSdk::probe(const std::string& root) {
  return marker_present("go", root, "go.mod");
}

std::unique_ptr<Sdk> GoSdk::create(const std::string& root, const SdkSettings& settings) {
  return std::make_unique<GoSdk>(root, settings.go, list_cmd_targets(root));
}

std::string GoSdk::dockerfile() const {
  const auto& targets = buildTargets();
  std::ostringstream os;
  os << "# Dockerfile generated by nb\n"
     << "\n"
     << "#\n"
     << "# Builder image\n"
     << "#\n"
     << "FROM " << builderImage() << " AS builder\n"
     << "ENV GOOS=linux\n"
     << "ENV CGO_ENABLED=0\n"
     << "WORKDIR /src\n"
     << "\n"
     << "# Download dependencies before copying the source code\n"
     << "COPY go.* /src/\n"
     << "RUN go mod download\n"
     << "COPY . /src\n"
     << "\n"
     << "# Test all modules\n"
     << "RUN go test ./...\n"
     << "\n"
     << "# Build all binaries found in ./cmd/*\n";
  for (const auto& t : targets) {
    os << "RUN go build -a -installsuffix cgo -o /build/" << t << " ./cmd/" << t << "\n";
  }
  os << "\n"
     << "#\n"
     << "# Runtime image\n"
     << "#\n"
     << "FROM " << runtimeImage() << "\n"
     << "WORKDIR /app\n";
  for (const auto& t : targets) {
    os << "COPY --from=builder /build/" << t << " /app/" << t << "\n";
  }
  if (targets.size() == 1) {
    os << "CMD [\"/app/" << targets[0] << "\"]\n";
  } else {
    os << "# Default CMD omitted due to multiple targets specified\n";
  }
  return os.str();
}

} // namespace nb

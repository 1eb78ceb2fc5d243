#include "JvmSdk.hpp"

#include <sstream>

#include "Markers.hpp"

namespace nb {

// -------- gradle --------

GradleSdk::GradleSdk(std::string sourcePath, SdkImages images)
  : Sdk("gradle", std::move(sourcePath), std::move(images), {"test", "build"}) {}

bool GradleSdk::probe(const std::string& root) {
  return marker_present("gradle", root, "gradlew")
      || marker_present("gradle", root, "build.gradle.kts")
      || marker_present("gradle", root, "build.gradle");
}

std::unique_ptr<Sdk> GradleSdk::create(const std::string& root, const SdkSettings& settings) {
  return std::make_unique<GradleSdk>(root, settings.gradle);
}

std::string GradleSdk::dockerfile() const {
  std::ostringstream os;
  os << "# Dockerfile generated by nb\n"
     << "\n"
     << "#\n"
     << "# Builder image\n"
     << "#\n"
     << "FROM " << builderImage() << " AS builder\n"
     << "WORKDIR /src\n"
     << "COPY . /src\n"
     << "\n";
  // The wrapper pins the Gradle version when the project ships one.
  for (const auto& t : buildTargets()) {
    os << "RUN if [ -x ./gradlew ]; then ./gradlew --no-daemon " << t
       << "; else gradle --no-daemon " << t << "; fi\n";
  }
  os << "\n"
     << "#\n"
     << "# Runtime image\n"
     << "#\n"
     << "FROM " << runtimeImage() << "\n"
     << "WORKDIR /app\n"
     << "COPY --from=builder /src/build/libs/*.jar /app/app.jar\n"
     << "CMD [\"java\", \"-jar\", \"/app/app.jar\"]\n";
  return os.str();
}

// -------- maven --------

MavenSdk::MavenSdk(std::string sourcePath, SdkImages images)
  : Sdk("maven", std::move(sourcePath), std::move(images), {"test", "package"}) {}

bool MavenSdk::probe(const std::string& root) {
  return marker_present("maven", root, "pom.xml");
}

std::unique_ptr<Sdk> MavenSdk::create(const std::string& root, const SdkSettings& settings) {
  return std::make_unique<MavenSdk>(root, settings.maven);
}

std::string MavenSdk::dockerfile() const {
  std::ostringstream os;
  os << "# Dockerfile generated by nb\n"
     << "\n"
     << "#\n"
     << "# Builder image\n"
     << "#\n"
     << "FROM " << builderImage() << " AS builder\n"
     << "WORKDIR /src\n"
     << "COPY . /src\n"
     << "\n"
     << "RUN mvn -B test\n"
     << "RUN mvn -B -DskipTests package\n"
     << "\n"
     << "#\n"
     << "# Runtime image\n"
     << "#\n"
     << "FROM " << runtimeImage() << "\n"
     << "WORKDIR /app\n"
     << "COPY --from=builder /src/target/*.jar /app/app.jar\n"
     << "CMD [\"java\", \"-jar\", \"/app/app.jar\"]\n";
  return os.str();
}

} // namespace nb

#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace nb {

// Base of every failure reported to the operator. main() prints what() and exits 2.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// No SDK marker matched the source tree.
class SdkNotDetected : public Error {
public:
  SdkNotDetected() : Error("no compatible SDKs for this source directory") {}
};

// A probe failed for a reason other than "marker absent".
class DetectionError : public Error {
public:
  DetectionError(const std::string& sdk, const std::string& path, const std::string& reason)
    : Error("detect " + sdk + " SDK: " + path + ": " + reason) {}
};

class TargetDiscoveryError : public Error {
public:
  enum class Kind { EmptyFilename, Filesystem };

  TargetDiscoveryError(Kind kind, const std::string& message)
    : Error("detect build target: " + message), kind_(kind) {}

  Kind kind() const { return kind_; }

private:
  Kind kind_;
};

// HTTP failure. status is 0 when no response was received (timeout, connect failure).
class TransportError : public Error {
public:
  TransportError(std::string endpoint, int status, std::string body, const std::string& reason)
    : Error(reason + " (endpoint: " + endpoint + ", code: " + std::to_string(status) +
            ", body: " + body + ")"),
      endpoint_(std::move(endpoint)), status_(status), body_(std::move(body)) {}

  const std::string& endpoint() const { return endpoint_; }
  int status() const { return status_; }
  const std::string& body() const { return body_; }

private:
  std::string endpoint_;
  int status_;
  std::string body_;
};

// External process exited with a non-zero status (or could not be started).
class ProcessError : public Error {
public:
  ProcessError(const std::string& what, int exitStatus)
    : Error(what + " failed with exit code " + std::to_string(exitStatus)),
      exitStatus_(exitStatus) {}

  int exitStatus() const { return exitStatus_; }

private:
  int exitStatus_;
};

class BuildFailed : public ProcessError {
public:
  explicit BuildFailed(int exitStatus) : ProcessError("docker build", exitStatus) {}
};

// Missing or malformed configuration; raised before any external call.
class ConfigError : public Error {
public:
  explicit ConfigError(const std::string& message) : Error("configuration error: " + message) {}
};

} // namespace nb

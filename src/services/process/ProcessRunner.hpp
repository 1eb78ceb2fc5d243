#pragma once
#include <string>
#include <vector>

namespace nb {

struct ProcessResult {
  int exitStatus = 0;
  std::string output; // captured stdout
};

// Seam for every external program nb drives (docker, git, deploy).
class ProcessRunner {
public:
  virtual ~ProcessRunner() = default;

  // Runs argv with stdout/stderr streamed through; returns the exit status.
  virtual int run(const std::vector<std::string>& argv) = 0;

  // Same, with stdinData written to the child's stdin.
  virtual int runWithInput(const std::vector<std::string>& argv, const std::string& stdinData) = 0;

  // Captures stdout; stderr is streamed through.
  virtual ProcessResult capture(const std::vector<std::string>& argv) = 0;
};

// fork/execvp implementation. A program that cannot be executed exits 127.
class PosixProcessRunner : public ProcessRunner {
public:
  int run(const std::vector<std::string>& argv) override;
  int runWithInput(const std::vector<std::string>& argv, const std::string& stdinData) override;
  ProcessResult capture(const std::vector<std::string>& argv) override;
};

}

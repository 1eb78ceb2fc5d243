#include "ProcessRunner.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace nb {

static std::string join(const std::vector<std::string>& argv) {
  std::string s;
  for (const auto& a : argv) {
    if (!s.empty()) s += ' ';
    s += a;
  }
  return s;
}

static void close_fd(int& fd) {
  if (fd >= 0) { close(fd); fd = -1; }
}

// Child side: wire up fds and exec. Never returns.
[[noreturn]] static void exec_child(const std::vector<std::string>& argv, int stdinFd, int stdoutFd) {
  if (stdinFd >= 0) { dup2(stdinFd, STDIN_FILENO); close(stdinFd); }
  if (stdoutFd >= 0) { dup2(stdoutFd, STDOUT_FILENO); close(stdoutFd); }
  std::vector<char*> cargs;
  for (const auto& s : argv) cargs.push_back(const_cast<char*>(s.c_str()));
  cargs.push_back(nullptr);
  execvp(cargs[0], cargs.data());
  perror(argv[0].c_str());
  _exit(127);
}

static int wait_for(pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) throw Error(std::string("waitpid: ") + std::strerror(errno));
  }
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return 1;
}

static void make_pipe(int fds[2]) {
  if (pipe(fds) < 0) throw Error(std::string("pipe: ") + std::strerror(errno));
}

static pid_t fork_or_throw(const std::vector<std::string>& argv) {
  if (argv.empty()) throw Error("cannot run an empty command");
  spdlog::debug("exec: {}", join(argv));
  pid_t pid = fork();
  if (pid < 0) throw Error("fork " + argv[0] + ": " + std::strerror(errno));
  return pid;
}

int PosixProcessRunner::run(const std::vector<std::string>& argv) {
  pid_t pid = fork_or_throw(argv);
  if (pid == 0) exec_child(argv, -1, -1);
  return wait_for(pid);
}

int PosixProcessRunner::runWithInput(const std::vector<std::string>& argv, const std::string& stdinData) {
  int fds[2] = {-1, -1};
  make_pipe(fds);
  pid_t pid;
  try {
    pid = fork_or_throw(argv);
  } catch (...) {
    close_fd(fds[0]); close_fd(fds[1]);
    throw;
  }
  if (pid == 0) {
    close(fds[1]);
    exec_child(argv, fds[0], -1);
  }
  close_fd(fds[0]);

  // A child that exits early closes its end; EPIPE is then not our error to report.
  size_t off = 0;
  while (off < stdinData.size()) {
    ssize_t n = write(fds[1], stdinData.data() + off, stdinData.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno != EPIPE) spdlog::warn("write to {} stdin: {}", argv[0], std::strerror(errno));
      break;
    }
    off += static_cast<size_t>(n);
  }
  close_fd(fds[1]);
  return wait_for(pid);
}

ProcessResult PosixProcessRunner::capture(const std::vector<std::string>& argv) {
  int fds[2] = {-1, -1};
  make_pipe(fds);
  pid_t pid;
  try {
    pid = fork_or_throw(argv);
  } catch (...) {
    close_fd(fds[0]); close_fd(fds[1]);
    throw;
  }
  if (pid == 0) {
    close(fds[0]);
    exec_child(argv, -1, fds[1]);
  }
  close_fd(fds[1]);

  ProcessResult result;
  char buf[4096];
  for (;;) {
    ssize_t n = read(fds[0], buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (n == 0) break;
    result.output.append(buf, static_cast<size_t>(n));
  }
  close_fd(fds[0]);
  result.exitStatus = wait_for(pid);
  return result;
}

} // namespace nb

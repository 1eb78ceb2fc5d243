#include "TempFile.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <unistd.h>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace nb {

TempFile::TempFile(std::string_view prefix, std::string_view bytes) {
  namespace fs = std::filesystem;
  std::string pattern = (fs::temp_directory_path() / (std::string(prefix) + "XXXXXX")).string();
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');

  int fd = mkstemp(buf.data());
  if (fd < 0) throw Error("create temporary file " + pattern + ": " + std::strerror(errno));
  path_ = buf.data();

  size_t off = 0;
  while (off < bytes.size()) {
    ssize_t n = write(fd, bytes.data() + off, bytes.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      const std::string err = std::strerror(errno);
      close(fd);
      std::remove(path_.c_str());
      throw Error("write temporary file " + path_ + ": " + err);
    }
    off += static_cast<size_t>(n);
  }
  if (close(fd) != 0) {
    const std::string err = std::strerror(errno);
    std::remove(path_.c_str());
    throw Error("close temporary file " + path_ + ": " + err);
  }
}

TempFile::~TempFile() {
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) spdlog::warn("remove temporary file {}: {}", path_, ec.message());
}

} // namespace nb

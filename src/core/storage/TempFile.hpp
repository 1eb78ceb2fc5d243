#pragma once
#include <string>
#include <string_view>

namespace nb {

// A uniquely named file under the system temp directory, removed when the
// object goes out of scope (success, exception, early return).
class TempFile {
public:
  // Writes bytes into a fresh file named <prefix>XXXXXX; throws nb::Error on failure.
  TempFile(std::string_view prefix, std::string_view bytes);
  ~TempFile();

  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

}

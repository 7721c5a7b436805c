#pragma once

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace sigil::test {

// A unique file path in the temp directory, removed on destruction.
class TempFile {
 public:
  TempFile() {
    namespace fs = std::filesystem;
    const auto base = fs::temp_directory_path();

    int id = 1;
    do {
      std::ostringstream oss;
      oss << "sigil_test_" << std::setw(4) << std::setfill('0') << id++ << ".log";
      path_ = base / oss.str();
    } while (fs::exists(path_));
  }

  ~TempFile() noexcept {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  const std::filesystem::path& Path() const { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace sigil::test

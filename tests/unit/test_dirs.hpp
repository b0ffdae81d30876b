#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace flowstore::testing {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
 public:
  explicit TempDir(const std::string& test_name)
      : path_(std::filesystem::temp_directory_path() / "flowstore_tests" / (test_name + "-" + util::ToString(util::GenerateUUID()))) {
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&)            = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

inline void WriteText(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string ReadText(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// <dir>/<name>.job with the given type and comma separated dependencies.
inline void WriteJob(const std::filesystem::path& dir, const std::string& name, const std::string& dependencies = "",
                     const std::string& type = "command") {
  std::string content = "type=" + type + "\ncommand=echo " + name + "\n";
  if (!dependencies.empty()) content += "dependencies=" + dependencies + "\n";
  WriteText(dir / (name + ".job"), content);
}

} // namespace flowstore::testing

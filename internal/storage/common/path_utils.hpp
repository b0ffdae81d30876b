#pragma once

#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"

namespace flowstore::storage::common {

inline constexpr char kProjectFilename[]     = "project.json";
inline constexpr char kProjectBackupSuffix[] = "_old";
inline constexpr char kFlowExtension[]       = ".flow";
inline constexpr char kFlowBackupSuffix[]    = ".old";
inline constexpr char kSourceDirectory[]     = "src";

inline bool IsValidProjectName(const std::string& name) {
  if (name.empty()) return false;

  const auto is_alpha = [](char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); };
  if (!is_alpha(name.front())) return false;

  for (char c : name) {
    if (!is_alpha(c) && !(c >= '0' && c <= '9') && c != '_' && c != '-') return false;
  }
  return true;
}

/*
  A source path inside an Install Version's src/ directory. Must stay
  inside it: relative, non-empty, no ".." component.
*/
inline void ValidateRelativeSource(const std::string& source) {
  if (source.empty()) {
    throw util::ValidationError("source path must not be empty");
  }
  const std::filesystem::path path(source);
  if (path.is_absolute() || path.has_root_name()) {
    throw util::ValidationError("source path must be relative: " + source);
  }
  for (const auto& part : path) {
    if (part == "..") {
      throw util::ValidationError("source path must not leave the project: " + source);
    }
  }
}

inline std::filesystem::path ProjectPath(const std::filesystem::path& root, const std::string& name) {
  return root / name;
}

inline std::filesystem::path FlowFilename(const std::string& flow_id) {
  return flow_id + kFlowExtension;
}

// Flow files: regular, not hidden, longer than the bare extension.
inline bool IsFlowFile(const std::filesystem::directory_entry& entry) {
  const auto name = entry.path().filename().string();
  const std::string suffix(kFlowExtension);
  std::error_code ec;
  return entry.is_regular_file(ec) && !name.empty() && name.front() != '.' && name.size() > suffix.size() &&
         name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace flowstore::storage::common

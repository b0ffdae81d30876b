#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace flowstore::storage {

/*
  Crash-safe file replace.

  Sequence (all within one directory, so one filesystem):
      write .<name>.<uuid>.tmp → rename <name> to <name><backup_suffix>
      → rename tmp to <name> → remove backup

  Every crash point leaves either the previous <name> or the new one
  fully written. Between the two renames only the backup exists; readers
  fall back to it when <name> is missing.

  Failures throw util::PersistenceError. Nothing is retried.
*/
class AtomicFileWriter {
 public:
  explicit AtomicFileWriter(bool fsync = false);

  void Persist(const std::filesystem::path& directory, const std::string& filename, std::string_view bytes,
               const std::string& backup_suffix = ".old") const;

  static std::filesystem::path TempPath(const std::filesystem::path& directory, const std::string& filename);

  static bool IsTempFile(const std::filesystem::path& path);

 private:
  bool fsync_;
};

} // namespace flowstore::storage

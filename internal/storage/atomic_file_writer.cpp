#include "atomic_file_writer.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace flowstore::storage {

namespace fs = std::filesystem;

using flowstore::observability::StringField;

namespace {

constexpr char kTempSuffix[] = ".tmp";

void RemoveQuietly(const fs::path& path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    FLOWSTORE_LOG_WARN("Could not remove file", {StringField("path", path.string()), StringField("error", ec.message())});
  }
}

} // namespace

AtomicFileWriter::AtomicFileWriter(bool fsync) : fsync_(fsync) {
}

fs::path AtomicFileWriter::TempPath(const fs::path& directory, const std::string& filename) {
  return directory / ("." + filename + "." + util::ToString(util::GenerateUUID()) + kTempSuffix);
}

bool AtomicFileWriter::IsTempFile(const fs::path& path) {
  const auto name = path.filename().string();
  const std::string suffix(kTempSuffix);
  return name.size() > suffix.size() && name.front() == '.' && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void AtomicFileWriter::Persist(const fs::path& directory, const std::string& filename, std::string_view bytes,
                               const std::string& backup_suffix) const {
  const auto final_path  = directory / filename;
  const auto backup_path = directory / (filename + backup_suffix);
  const auto tmp_path    = TempPath(directory, filename);

  FLOWSTORE_LOG_DEBUG("Writing file", {StringField("path", final_path.string()), StringField("tmp", tmp_path.filename().string())});

  // ------------------------------------------------------------
  // 1. temp file; canonical file untouched on failure
  // ------------------------------------------------------------
  try {
    common::WriteFile(tmp_path, bytes, fsync_);
  } catch (const std::exception& e) {
    RemoveQuietly(tmp_path);
    throw util::PersistenceError("Cannot write " + final_path.string(), e);
  }

  // ------------------------------------------------------------
  // 2. move the current file aside
  // ------------------------------------------------------------
  std::error_code ec;
  const bool      had_previous = fs::exists(final_path, ec);
  if (had_previous) {
    fs::rename(final_path, backup_path, ec);
    if (ec) {
      RemoveQuietly(tmp_path);
      throw util::PersistenceError("Cannot move " + final_path.string() + " aside: " + ec.message());
    }
  }

  // ------------------------------------------------------------
  // 3. promote
  // ------------------------------------------------------------
  fs::rename(tmp_path, final_path, ec);
  if (ec) {
    const auto promote_error = ec.message();
    if (had_previous) {
      std::error_code restore_ec;
      fs::rename(backup_path, final_path, restore_ec);
      if (restore_ec) {
        FLOWSTORE_LOG_ERROR("Cannot restore backup", {StringField("path", backup_path.string()), StringField("error", restore_ec.message())});
      }
    }
    RemoveQuietly(tmp_path);
    throw util::PersistenceError("Cannot promote " + tmp_path.string() + " to " + final_path.string() + ": " + promote_error);
  }

  // ------------------------------------------------------------
  // 4. drop the backup
  // ------------------------------------------------------------
  if (had_previous) {
    RemoveQuietly(backup_path);
  }
}

} // namespace flowstore::storage

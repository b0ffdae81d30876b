#include "arrow_utils.hpp"

namespace flowstore::storage::common {

std::string ReadFileToString(const std::filesystem::path& path) {
  auto file   = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  auto buffer = ReadAll(file);
  Unwrap(file->Close());
  return buffer->ToString();
}

void WriteFile(const std::filesystem::path& path, std::string_view bytes, bool flush) {
  auto out = Unwrap(arrow::io::FileOutputStream::Open(path.string()));
  Unwrap(out->Write(bytes.data(), static_cast<int64_t>(bytes.size())));

  if (flush)
    Unwrap(out->Flush());

  Unwrap(out->Close());
}

} // namespace flowstore::storage::common

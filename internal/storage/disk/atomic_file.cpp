#include "atomic_file.hpp"

#include <arrow/io/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace torrentfs::storage::disk {

using namespace torrentfs::storage::common;
using torrentfs::observability::StringField;

namespace {

void WriteDurably(const std::filesystem::path& tmp_path, const std::shared_ptr<arrow::Buffer>& buffer) {
  const auto context = "write " + tmp_path.string();

  auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path.string()), context);
  Unwrap(out->Write(buffer->data(), buffer->size()), context);
  Unwrap(out->Flush(), context);

  if (::fsync(out->file_descriptor()) != 0) {
    const int err = errno;
    auto close_status = out->Close();
    if (!close_status.ok()) {
      TORRENTFS_LOG_WARN("failed to close temporary file",
                         {StringField("path", tmp_path.string()), StringField("error", close_status.ToString())});
    }
    throw util::IoError("fsync " + tmp_path.string() + ": " + std::strerror(err));
  }

  Unwrap(out->Close(), context);
}

void DiscardTemp(const std::filesystem::path& tmp_path) {
  std::error_code ec;
  std::filesystem::remove(tmp_path, ec);
  if (ec) {
    TORRENTFS_LOG_WARN("failed to remove temporary file", {StringField("path", tmp_path.string()), StringField("error", ec.message())});
  }
}

} // namespace

/*
  Atomic write:
      write tmp → flush → fsync → rename
*/
void AtomicWrite(const std::filesystem::path& path, const std::shared_ptr<arrow::Buffer>& buffer) {
  const auto tmp_path = TempPath(path);

  try {
    WriteDurably(tmp_path, buffer);
  } catch (const util::IoError&) {
    DiscardTemp(tmp_path);
    throw;
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    DiscardTemp(tmp_path);
    throw util::IoError("rename " + tmp_path.string() + " -> " + path.string() + ": " + ec.message());
  }
}

/*
  Read entire file from disk.
*/
std::shared_ptr<arrow::Buffer> ReadFile(const std::filesystem::path& path) {
  std::error_code ec;
  const bool      exists = std::filesystem::exists(path, ec);
  if (ec) {
    throw util::IoError("stat " + path.string() + ": " + ec.message());
  }
  if (!exists) {
    throw util::NotFound("file not found: " + path.string());
  }

  const auto context = "read " + path.string();
  auto       file    = Unwrap(arrow::io::ReadableFile::Open(path.string()), context);
  auto       buffer  = ReadAll(file, context);
  Unwrap(file->Close(), context);
  return buffer;
}

bool FileExists(const std::filesystem::path& path) noexcept {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) && !ec;
}

void RemoveFile(const std::filesystem::path& path) {
  std::error_code ec;
  const bool      removed = std::filesystem::remove(path, ec);
  if (ec) {
    throw util::IoError("remove " + path.string() + ": " + ec.message());
  }
  if (!removed) {
    throw util::NotFound("file not found: " + path.string());
  }
}

} // namespace torrentfs::storage::disk

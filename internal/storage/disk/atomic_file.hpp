#pragma once

#include <arrow/buffer.h>

#include <filesystem>
#include <memory>

namespace torrentfs::storage::disk {

/*
  Crash-safe file primitives.

  AtomicWrite:
    write <path>.tmp → flush → fsync → close → rename over <path>

  A reader of <path> sees either the previous state or the complete new
  contents. A crash leaves at most a stray <path>.tmp, which the next
  AtomicWrite of the same path truncates and reuses.

  Callers serialize access to a given path themselves.
*/

void AtomicWrite(const std::filesystem::path& path, const std::shared_ptr<arrow::Buffer>& buffer);

// Throws util::NotFound when the file is missing, util::IoError otherwise.
std::shared_ptr<arrow::Buffer> ReadFile(const std::filesystem::path& path);

// Stat errors count as "absent".
bool FileExists(const std::filesystem::path& path) noexcept;

// Throws util::NotFound when the file is missing.
void RemoveFile(const std::filesystem::path& path);

} // namespace torrentfs::storage::disk

#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>

#include <memory>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace torrentfs::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw util::IoError
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result, const std::string& context) {
  if (!result.ok()) throw util::IoError(context + ": " + result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status, const std::string& context) {
  if (!status.ok()) throw util::IoError(context + ": " + status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file, const std::string& context) {
  auto size = Unwrap(file->GetSize(), context);
  return Unwrap(file->Read(size), context);
}

/*
  Non-owning views between Arrow buffers and byte strings.
  The source must outlive the result.
*/
inline std::string_view AsStringView(const arrow::Buffer& buffer) {
  return {reinterpret_cast<const char*>(buffer.data()), static_cast<size_t>(buffer.size())};
}

inline std::shared_ptr<arrow::Buffer> WrapBytes(std::string_view bytes) {
  return std::make_shared<arrow::Buffer>(reinterpret_cast<const uint8_t*>(bytes.data()), static_cast<int64_t>(bytes.size()));
}

} // namespace torrentfs::storage::common

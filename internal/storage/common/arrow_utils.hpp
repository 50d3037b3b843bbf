#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace snapshot::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(std::shared_ptr<arrow::io::RandomAccessFile> file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

std::string ReadFileToString(const std::filesystem::path& path);

/*
  Atomic write:
      write tmp → flush → rename
*/
void WriteFileAtomic(const std::filesystem::path& path, std::string_view content, bool fsync = false);

// Streams src into dst in fixed-size chunks; dst is replaced.
void CopyFile(const std::filesystem::path& src, const std::filesystem::path& dst);

// Streams a file into an already open sink; returns the number of bytes written.
int64_t CopyInto(const std::filesystem::path& src, arrow::io::OutputStream& sink);

} // namespace snapshot::storage::common

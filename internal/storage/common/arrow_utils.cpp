#include "arrow_utils.hpp"

namespace snapshot::storage::common {

namespace {

constexpr int64_t kCopyChunkBytes = 1 << 20;

} // namespace

std::string ReadFileToString(const std::filesystem::path& path) {
  auto file   = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  auto buffer = ReadAll(file);
  Unwrap(file->Close());
  return buffer->ToString();
}

void WriteFileAtomic(const std::filesystem::path& path, std::string_view content, bool fsync) {
  auto tmp_path = path.string() + ".tmp";

  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
    Unwrap(out->Write(content.data(), static_cast<int64_t>(content.size())));

    if (fsync) Unwrap(out->Flush());

    Unwrap(out->Close());
  }

  std::filesystem::rename(tmp_path, path);
}

int64_t CopyInto(const std::filesystem::path& src, arrow::io::OutputStream& sink) {
  auto    in      = Unwrap(arrow::io::ReadableFile::Open(src.string()));
  int64_t written = 0;
  for (;;) {
    auto chunk = Unwrap(in->Read(kCopyChunkBytes));
    if (chunk->size() == 0) {
      break;
    }
    Unwrap(sink.Write(chunk));
    written += chunk->size();
  }
  Unwrap(in->Close());
  return written;
}

void CopyFile(const std::filesystem::path& src, const std::filesystem::path& dst) {
  auto out = Unwrap(arrow::io::FileOutputStream::Open(dst.string()));
  CopyInto(src, *out);
  Unwrap(out->Close());
}

} // namespace snapshot::storage::common

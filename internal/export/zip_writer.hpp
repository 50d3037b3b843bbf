#pragma once

#include <arrow/io/interfaces.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/time.hpp"

namespace snapshot::exporting {

/*
  Streaming zip archive writer.

  Entries are DEFLATE compressed (zlib, raw stream) and followed by a
  data descriptor, so nothing is buffered beyond one chunk and the sink
  never needs to seek. ZIP64 is not supported: entries and archives are
  limited to 4 GiB and 65535 entries.
*/
class ZipWriter {
 public:
  explicit ZipWriter(std::shared_ptr<arrow::io::OutputStream> sink, util::TimePoint modified = util::Now());
  ~ZipWriter();

  ZipWriter(const ZipWriter&)            = delete;
  ZipWriter& operator=(const ZipWriter&) = delete;

  void AddBytes(const std::string& name, std::string_view data);
  void AddFile(const std::string& name, const std::filesystem::path& path);

  // Writes the central directory. No entry can be added afterwards.
  void Finish();

  std::size_t Entries() const { return entries_.size(); }

 private:
  struct CentralEntry {
    std::string name;
    uint32_t    crc               = 0;
    uint64_t    compressed_size   = 0;
    uint64_t    uncompressed_size = 0;
    uint64_t    offset            = 0;
  };

  class Deflater;

  void BeginEntry(const std::string& name);
  void EndEntry(uint32_t crc, uint64_t compressed_size, uint64_t uncompressed_size);
  void Write(const std::string& bytes);
  void Write(const void* data, std::size_t size);

  std::shared_ptr<arrow::io::OutputStream> sink_;
  util::DosDateTime                        modified_;
  std::vector<CentralEntry>                entries_;
  uint64_t                                 offset_   = 0;
  bool                                     finished_ = false;
};

} // namespace snapshot::exporting

#include "zip_writer.hpp"

#include <zlib.h>

#include <limits>
#include <stdexcept>

#include "internal/storage/common/arrow_utils.hpp"

namespace snapshot::exporting {

namespace {

constexpr uint32_t kLocalHeaderSignature   = 0x04034b50;
constexpr uint32_t kDescriptorSignature    = 0x08074b50;
constexpr uint32_t kCentralHeaderSignature = 0x02014b50;
constexpr uint32_t kEndOfCentralSignature  = 0x06054b50;

constexpr uint16_t kVersionNeeded   = 20;
constexpr uint16_t kFlagDescriptor  = 0x0008;
constexpr uint16_t kFlagUtf8        = 0x0800;
constexpr uint16_t kMethodDeflate   = 8;
constexpr int64_t  kChunkBytes      = 64 * 1024;
constexpr uint64_t kMax32           = std::numeric_limits<uint32_t>::max();
constexpr std::size_t kMaxEntries   = std::numeric_limits<uint16_t>::max();

void Put16(std::string& out, uint16_t v) {
  out.push_back(static_cast<char>(v & 0xff));
  out.push_back(static_cast<char>((v >> 8) & 0xff));
}

void Put32(std::string& out, uint32_t v) {
  Put16(out, static_cast<uint16_t>(v & 0xffff));
  Put16(out, static_cast<uint16_t>((v >> 16) & 0xffff));
}

uint32_t Narrow32(uint64_t v, const char* what) {
  if (v > kMax32) {
    throw std::runtime_error(std::string("zip: ") + what + " exceeds 4 GiB");
  }
  return static_cast<uint32_t>(v);
}

} // namespace

// ------------------------------------------------------------
// Deflater: raw DEFLATE of one entry straight into the writer
// ------------------------------------------------------------

class ZipWriter::Deflater {
 public:
  explicit Deflater(ZipWriter& writer) : writer_(writer) {
    if (deflateInit2(&stream_, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
      throw std::runtime_error("zip: deflateInit2 failed");
    }
  }

  ~Deflater() {
    deflateEnd(&stream_);
  }

  Deflater(const Deflater&)            = delete;
  Deflater& operator=(const Deflater&) = delete;

  void Update(const void* data, std::size_t size) {
    crc_ = crc32(crc_, static_cast<const Bytef*>(data), static_cast<uInt>(size));
    uncompressed_ += size;

    stream_.next_in  = const_cast<Bytef*>(static_cast<const Bytef*>(data));
    stream_.avail_in = static_cast<uInt>(size);
    while (stream_.avail_in > 0) {
      Pump(Z_NO_FLUSH);
    }
  }

  void Finish() {
    stream_.next_in  = nullptr;
    stream_.avail_in = 0;
    while (Pump(Z_FINISH) != Z_STREAM_END) {
    }
  }

  uint32_t Crc() const { return static_cast<uint32_t>(crc_); }
  uint64_t Compressed() const { return compressed_; }
  uint64_t Uncompressed() const { return uncompressed_; }

 private:
  int Pump(int flush) {
    stream_.next_out  = buffer_;
    stream_.avail_out = sizeof(buffer_);

    const int rc = deflate(&stream_, flush);
    if (rc == Z_STREAM_ERROR) {
      throw std::runtime_error("zip: deflate failed");
    }

    const std::size_t produced = sizeof(buffer_) - stream_.avail_out;
    if (produced > 0) {
      writer_.Write(buffer_, produced);
      compressed_ += produced;
    }
    return rc;
  }

  ZipWriter& writer_;
  z_stream   stream_{};
  Bytef      buffer_[16 * 1024];
  uLong      crc_          = crc32(0L, Z_NULL, 0);
  uint64_t   compressed_   = 0;
  uint64_t   uncompressed_ = 0;
};

// ------------------------------------------------------------
// ZipWriter
// ------------------------------------------------------------

ZipWriter::ZipWriter(std::shared_ptr<arrow::io::OutputStream> sink, util::TimePoint modified)
    : sink_(std::move(sink)), modified_(util::ToDosDateTime(modified)) {
}

ZipWriter::~ZipWriter() = default;

void ZipWriter::Write(const void* data, std::size_t size) {
  storage::common::Unwrap(sink_->Write(data, static_cast<int64_t>(size)));
  offset_ += size;
}

void ZipWriter::Write(const std::string& bytes) {
  Write(bytes.data(), bytes.size());
}

void ZipWriter::BeginEntry(const std::string& name) {
  if (finished_) {
    throw std::logic_error("zip: archive already finished");
  }
  if (entries_.size() >= kMaxEntries) {
    throw std::runtime_error("zip: too many entries");
  }

  CentralEntry entry;
  entry.name   = name;
  entry.offset = offset_;
  Narrow32(entry.offset, "archive");
  entries_.push_back(std::move(entry));

  std::string header;
  Put32(header, kLocalHeaderSignature);
  Put16(header, kVersionNeeded);
  Put16(header, kFlagDescriptor | kFlagUtf8);
  Put16(header, kMethodDeflate);
  Put16(header, modified_.time);
  Put16(header, modified_.date);
  Put32(header, 0); // crc, sizes: see data descriptor
  Put32(header, 0);
  Put32(header, 0);
  Put16(header, static_cast<uint16_t>(name.size()));
  Put16(header, 0);
  header += name;
  Write(header);
}

void ZipWriter::EndEntry(uint32_t crc, uint64_t compressed_size, uint64_t uncompressed_size) {
  auto& entry             = entries_.back();
  entry.crc               = crc;
  entry.compressed_size   = compressed_size;
  entry.uncompressed_size = uncompressed_size;

  std::string descriptor;
  Put32(descriptor, kDescriptorSignature);
  Put32(descriptor, crc);
  Put32(descriptor, Narrow32(compressed_size, "entry"));
  Put32(descriptor, Narrow32(uncompressed_size, "entry"));
  Write(descriptor);
}

void ZipWriter::AddBytes(const std::string& name, std::string_view data) {
  BeginEntry(name);

  Deflater deflater(*this);
  deflater.Update(data.data(), data.size());
  deflater.Finish();

  EndEntry(deflater.Crc(), deflater.Compressed(), deflater.Uncompressed());
}

void ZipWriter::AddFile(const std::string& name, const std::filesystem::path& path) {
  // open before the header goes out so a missing file leaves no trace
  auto in = storage::common::Unwrap(arrow::io::ReadableFile::Open(path.string()));

  BeginEntry(name);

  Deflater deflater(*this);
  for (;;) {
    auto chunk = storage::common::Unwrap(in->Read(kChunkBytes));
    if (chunk->size() == 0) break;
    deflater.Update(chunk->data(), static_cast<std::size_t>(chunk->size()));
  }
  deflater.Finish();
  storage::common::Unwrap(in->Close());

  EndEntry(deflater.Crc(), deflater.Compressed(), deflater.Uncompressed());
}

void ZipWriter::Finish() {
  if (finished_) return;

  const uint64_t directory_offset = offset_;
  for (const auto& entry : entries_) {
    std::string header;
    Put32(header, kCentralHeaderSignature);
    Put16(header, kVersionNeeded); // made by
    Put16(header, kVersionNeeded);
    Put16(header, kFlagDescriptor | kFlagUtf8);
    Put16(header, kMethodDeflate);
    Put16(header, modified_.time);
    Put16(header, modified_.date);
    Put32(header, entry.crc);
    Put32(header, Narrow32(entry.compressed_size, "entry"));
    Put32(header, Narrow32(entry.uncompressed_size, "entry"));
    Put16(header, static_cast<uint16_t>(entry.name.size()));
    Put16(header, 0); // extra
    Put16(header, 0); // comment
    Put16(header, 0); // disk
    Put16(header, 0); // internal attributes
    Put32(header, 0); // external attributes
    Put32(header, Narrow32(entry.offset, "archive"));
    header += entry.name;
    Write(header);
  }
  const uint64_t directory_size = offset_ - directory_offset;

  std::string end;
  Put32(end, kEndOfCentralSignature);
  Put16(end, 0);
  Put16(end, 0);
  Put16(end, static_cast<uint16_t>(entries_.size()));
  Put16(end, static_cast<uint16_t>(entries_.size()));
  Put32(end, Narrow32(directory_size, "archive"));
  Put32(end, Narrow32(directory_offset, "archive"));
  Put16(end, 0);
  Write(end);

  storage::common::Unwrap(sink_->Flush());
  finished_ = true;
}

} // namespace snapshot::exporting

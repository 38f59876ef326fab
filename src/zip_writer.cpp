#include <algorithm>
#include <chrono>
#include <ctime>
#include <format>
#include <fstream>
#include <limits>

#include <zlib.h>

#include <nli/endian.hpp>
#include <nli/mmap.hpp>
#include <nli/names.hpp>
#include <nli/zip_writer.hpp>

namespace nli {

namespace {

// Output of one deflate round
constexpr size_t kDeflateChunkSize = 256 * 1024;

// MS-DOS time and date of the write, as stored in every header
struct DosStamp {
  uint16_t time = 0;
  uint16_t date = 0;
};

DosStamp dosStampNow() {
  std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&t, &tm);

  DosStamp stamp;
  int year = tm.tm_year + 1900;
  if (year < 1980) {
    year = 1980;
  }
  stamp.time = static_cast<uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
  stamp.date = static_cast<uint16_t>(((year - 1980) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
  return stamp;
}

void appendLE16(std::vector<uint8_t> &record, uint16_t value) {
  size_t at = record.size();
  record.resize(at + 2);
  storeLE16(record.data() + at, value);
}

void appendLE32(std::vector<uint8_t> &record, uint32_t value) {
  size_t at = record.size();
  record.resize(at + 4);
  storeLE32(record.data() + at, value);
}

void appendLE64(std::vector<uint8_t> &record, uint64_t value) {
  size_t at = record.size();
  record.resize(at + 8);
  storeLE64(record.data() + at, value);
}

bool needsZip64(uint64_t value) {
  return value >= ZipLayout::sizePlaceholder;
}

uint32_t field32(uint64_t value) {
  return needsZip64(value) ? ZipLayout::sizePlaceholder : static_cast<uint32_t>(value);
}

// The local header has a fixed length per member: zip64 is decided from the uncompressed size,
// which a stored or deflated payload never exceeds
std::vector<uint8_t> localHeader(const ArchiveEntry &entry, DosStamp stamp, bool zip64) {
  std::vector<uint8_t> record;
  record.reserve(ZipLayout::localHeaderSize + entry.path.size() + 20);

  appendLE32(record, ZipLayout::localHeaderSignature);
  appendLE16(record, zip64 ? ZipLayout::versionNeededZip64 : ZipLayout::versionNeeded);
  appendLE16(record, ZipLayout::flagUtf8);
  appendLE16(record, entry.method);
  appendLE16(record, stamp.time);
  appendLE16(record, stamp.date);
  appendLE32(record, entry.crc32);
  appendLE32(record, zip64 ? ZipLayout::sizePlaceholder : static_cast<uint32_t>(entry.compressedSize));
  appendLE32(record,
             zip64 ? ZipLayout::sizePlaceholder : static_cast<uint32_t>(entry.uncompressedSize));
  appendLE16(record, static_cast<uint16_t>(entry.path.size()));
  appendLE16(record, zip64 ? 20 : 0); // Extra field length
  record.insert(record.end(), entry.path.begin(), entry.path.end());

  if (zip64) {
    appendLE16(record, ZipLayout::zip64ExtraId);
    appendLE16(record, 16);
    appendLE64(record, entry.uncompressedSize);
    appendLE64(record, entry.compressedSize);
  }
  return record;
}

std::vector<uint8_t> centralHeader(const ArchiveEntry &entry, DosStamp stamp) {
  // Only the fields that overflow go into the ZIP64 extra field, in this order
  std::vector<uint64_t> extended;
  if (needsZip64(entry.uncompressedSize)) {
    extended.push_back(entry.uncompressedSize);
  }
  if (needsZip64(entry.compressedSize)) {
    extended.push_back(entry.compressedSize);
  }
  if (needsZip64(entry.localHeaderOffset)) {
    extended.push_back(entry.localHeaderOffset);
  }
  auto extraLength = static_cast<uint16_t>(extended.empty() ? 0 : 4 + 8 * extended.size());

  // UNIX mode in the high half; 0x10 is the MS-DOS directory attribute
  uint32_t externalAttributes = entry.isDirectory() ? ((040755u << 16) | 0x10u) : (0100644u << 16);

  std::vector<uint8_t> record;
  record.reserve(ZipLayout::centralHeaderSize + entry.path.size() + extraLength);

  appendLE32(record, ZipLayout::centralHeaderSignature);
  appendLE16(record, ZipLayout::versionMadeBy);
  appendLE16(record, extended.empty() ? ZipLayout::versionNeeded : ZipLayout::versionNeededZip64);
  appendLE16(record, ZipLayout::flagUtf8);
  appendLE16(record, entry.method);
  appendLE16(record, stamp.time);
  appendLE16(record, stamp.date);
  appendLE32(record, entry.crc32);
  appendLE32(record, field32(entry.compressedSize));
  appendLE32(record, field32(entry.uncompressedSize));
  appendLE16(record, static_cast<uint16_t>(entry.path.size()));
  appendLE16(record, extraLength);
  appendLE16(record, 0); // Comment length
  appendLE16(record, 0); // Disk number start
  appendLE16(record, 0); // Internal attributes
  appendLE32(record, externalAttributes);
  appendLE32(record, field32(entry.localHeaderOffset));
  record.insert(record.end(), entry.path.begin(), entry.path.end());

  if (!extended.empty()) {
    appendLE16(record, ZipLayout::zip64ExtraId);
    appendLE16(record, static_cast<uint16_t>(8 * extended.size()));
    for (uint64_t value : extended) {
      appendLE64(record, value);
    }
  }
  return record;
}

// ZIP64 end record and locator when needed, then the classic end of central directory record
std::vector<uint8_t> endRecords(uint64_t count, uint64_t centralStart, uint64_t centralSize) {
  bool zip64 = count >= ZipLayout::countPlaceholder || needsZip64(centralStart) ||
               needsZip64(centralSize);
  uint64_t zip64EndOffset = centralStart + centralSize;

  std::vector<uint8_t> record;
  if (zip64) {
    appendLE32(record, ZipLayout::zip64EndOfCentralDirSignature);
    appendLE64(record, ZipLayout::zip64EndOfCentralDirSize - 12); // Size of the remaining record
    appendLE16(record, ZipLayout::versionMadeBy);
    appendLE16(record, ZipLayout::versionNeededZip64);
    appendLE32(record, 0); // This disk
    appendLE32(record, 0); // Disk with the central directory
    appendLE64(record, count);
    appendLE64(record, count);
    appendLE64(record, centralSize);
    appendLE64(record, centralStart);

    appendLE32(record, ZipLayout::zip64LocatorSignature);
    appendLE32(record, 0);
    appendLE64(record, zip64EndOffset);
    appendLE32(record, 1); // Total disks
  }

  auto count16 = static_cast<uint16_t>(zip64 ? ZipLayout::countPlaceholder : count);
  appendLE32(record, ZipLayout::endOfCentralDirSignature);
  appendLE16(record, 0);
  appendLE16(record, 0);
  appendLE16(record, count16);
  appendLE16(record, count16);
  appendLE32(record, zip64 ? ZipLayout::sizePlaceholder : static_cast<uint32_t>(centralSize));
  appendLE32(record, zip64 ? ZipLayout::sizePlaceholder : static_cast<uint32_t>(centralStart));
  appendLE16(record, 0); // Comment length
  return record;
}

bool writeBytes(std::ofstream &out, std::span<const uint8_t> bytes) {
  out.write(reinterpret_cast<const char *>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
  return static_cast<bool>(out);
}

// Raw deflate of input straight into out; produced receives the compressed size
bool deflateTo(std::ofstream &out, std::span<const uint8_t> input, int level, uint64_t &produced,
               std::string *outError) {
  z_stream stream{};
  // Negative window bits: raw deflate without zlib header, as ZIP requires
  if (deflateInit2(&stream, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
    if (outError) {
      *outError = "Failed to initialize zlib deflate";
    }
    return false;
  }

  std::vector<uint8_t> buffer(kDeflateChunkSize);
  produced = 0;
  int rc = Z_OK;

  do {
    // zlib counts in 32 bits; feed larger inputs in slices
    if (stream.avail_in == 0 && !input.empty()) {
      size_t slice = std::min<size_t>(input.size(), std::numeric_limits<uInt>::max());
      stream.next_in = const_cast<Bytef *>(input.data());
      stream.avail_in = static_cast<uInt>(slice);
      input = input.subspan(slice);
    }

    stream.next_out = buffer.data();
    stream.avail_out = static_cast<uInt>(buffer.size());
    rc = deflate(&stream, input.empty() ? Z_FINISH : Z_NO_FLUSH);
    if (rc == Z_STREAM_ERROR) {
      break;
    }

    size_t have = buffer.size() - stream.avail_out;
    if (!writeBytes(out, std::span<const uint8_t>(buffer.data(), have))) {
      rc = Z_ERRNO;
      break;
    }
    produced += have;
  } while (rc != Z_STREAM_END);

  deflateEnd(&stream);

  if (rc != Z_STREAM_END) {
    if (outError) {
      *outError = std::format("zlib deflate failed (code {})", rc);
    }
    return false;
  }
  return true;
}

// Bytes of one member: a read mapping of the source file, or the in-memory copy
struct MemberSource {
  MappedFile mapped;
  std::span<const uint8_t> bytes;
};

bool openSource(const std::filesystem::path &sourcePath, MemberSource &source,
                std::string *outError) {
  std::error_code ec;
  uintmax_t size = std::filesystem::file_size(sourcePath, ec);
  if (ec) {
    if (outError) {
      *outError = std::format("Failed to open source file: {}: {}", sourcePath.string(),
                              ec.message());
    }
    return false;
  }

  // Empty files cannot be mapped
  if (size == 0) {
    source.bytes = {};
    return true;
  }
  if (!source.mapped.openRead(sourcePath, outError)) {
    return false;
  }
  source.bytes = source.mapped.data();
  return true;
}

} // namespace

bool ZipWriter::reservePath(const std::string &archivePath, std::string *outError) {
  if (archivePath.empty() || archivePath.front() == '/') {
    if (outError) {
      *outError = std::format("Invalid path in container: '{}'", archivePath);
    }
    return false;
  }
  if (archivePath.size() > std::numeric_limits<uint16_t>::max()) {
    if (outError) {
      *outError = std::format("Path too long for a ZIP container: {}", archivePath);
    }
    return false;
  }

  // Check for duplicate paths (case-insensitive)
  if (!normalizedPaths_.insert(normalizeArchivePath(archivePath)).second) {
    if (outError) {
      *outError = std::format("Duplicate file path in container: {}", archivePath);
    }
    return false;
  }
  return true;
}

bool ZipWriter::addFile(const std::filesystem::path &sourcePath, const std::string &archivePath,
                        std::string *outError) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(sourcePath, ec)) {
    if (outError) {
      *outError = std::format("Source file does not exist: {}", sourcePath.string());
    }
    return false;
  }

  if (!reservePath(archivePath, outError)) {
    return false;
  }

  PendingMember pending;
  pending.archivePath = archivePath;
  pending.sourcePath = sourcePath;
  pending.fromDisk = true;
  pendingMembers_.push_back(std::move(pending));
  return true;
}

bool ZipWriter::addFile(std::span<const uint8_t> data, const std::string &archivePath,
                        std::string *outError) {
  if (!reservePath(archivePath, outError)) {
    return false;
  }

  PendingMember pending;
  pending.archivePath = archivePath;
  pending.data.assign(data.begin(), data.end());
  pendingMembers_.push_back(std::move(pending));
  return true;
}

bool ZipWriter::addDirectory(const std::string &archivePath, std::string *outError) {
  std::string path = archivePath;
  if (path.empty() || path.back() != '/') {
    path += '/';
  }
  if (!reservePath(path, outError)) {
    return false;
  }

  PendingMember pending;
  pending.archivePath = std::move(path);
  pendingMembers_.push_back(std::move(pending));
  return true;
}

bool ZipWriter::write(const std::filesystem::path &destPath, std::string *outError) {
  if (pendingMembers_.empty()) {
    if (outError) {
      *outError = "Cannot write container with no members";
    }
    return false;
  }

  std::ofstream out(destPath, std::ios::binary | std::ios::trunc);
  if (!out) {
    if (outError) {
      *outError = std::format("Failed to create container: {}", destPath.string());
    }
    return false;
  }

  uint64_t pos = 0;
  std::vector<ArchiveEntry> written;
  bool ok = writeTo(out, pos, written, outError);
  out.close();

  std::error_code ec;
  if (ok && out.fail()) {
    ok = false;
    if (outError) {
      *outError = std::format("Failed to write container: {}", destPath.string());
    }
  }
  // A member that fell back to stored may leave deflate output past the end records
  if (ok) {
    std::filesystem::resize_file(destPath, pos, ec);
    if (ec) {
      ok = false;
      if (outError) {
        *outError = std::format("Failed to finish container: {}: {}", destPath.string(),
                                ec.message());
      }
    }
  }

  if (!ok) {
    std::filesystem::remove(destPath, ec);
    return false;
  }

  entries_ = std::move(written);
  return true;
}

bool ZipWriter::writeTo(std::ofstream &out, uint64_t &pos, std::vector<ArchiveEntry> &written,
                        std::string *outError) const {
  DosStamp stamp = dosStampNow();
  written.reserve(pendingMembers_.size());

  // Step 1: Local headers and member data, one member at a time
  for (const auto &pending : pendingMembers_) {
    MemberSource source;
    if (pending.fromDisk) {
      if (!openSource(pending.sourcePath, source, outError)) {
        return false;
      }
    } else {
      source.bytes = pending.data;
    }

    ArchiveEntry entry;
    entry.path = pending.archivePath;
    entry.lowercasePath = normalizeArchivePath(entry.path);
    entry.localHeaderOffset = pos;
    entry.uncompressedSize = source.bytes.size();
    entry.crc32 = static_cast<uint32_t>(
        crc32_z(crc32(0L, Z_NULL, 0), source.bytes.data(), source.bytes.size()));
    entry.method = (source.bytes.empty() || compressionLevel_ == 0) ? ZipLayout::methodStored
                                                                     : ZipLayout::methodDeflated;
    bool zip64 = needsZip64(entry.uncompressedSize);

    // Sizes are not known yet; the header is rewritten once the payload is out
    std::vector<uint8_t> header = localHeader(entry, stamp, zip64);
    if (!writeBytes(out, header)) {
      break;
    }
    uint64_t dataStart = pos + header.size();

    if (entry.method == ZipLayout::methodDeflated) {
      if (!deflateTo(out, source.bytes, compressionLevel_, entry.compressedSize, outError)) {
        return false;
      }
      // Keep the smaller representation
      if (entry.compressedSize >= entry.uncompressedSize) {
        entry.method = ZipLayout::methodStored;
        out.seekp(static_cast<std::streamoff>(dataStart));
      }
    }
    if (entry.method == ZipLayout::methodStored) {
      if (!writeBytes(out, source.bytes)) {
        break;
      }
      entry.compressedSize = entry.uncompressedSize;
    }

    pos = dataStart + entry.compressedSize;
    out.seekp(static_cast<std::streamoff>(entry.localHeaderOffset));
    writeBytes(out, localHeader(entry, stamp, zip64));
    out.seekp(static_cast<std::streamoff>(pos));
    if (!out) {
      break;
    }

    written.push_back(std::move(entry));
  }

  if (written.size() != pendingMembers_.size()) {
    if (outError) {
      *outError = std::format("Failed to write member: {}",
                              pendingMembers_[written.size()].archivePath);
    }
    return false;
  }

  // Step 2: Central directory
  uint64_t centralStart = pos;
  for (const auto &entry : written) {
    std::vector<uint8_t> record = centralHeader(entry, stamp);
    if (!writeBytes(out, record)) {
      if (outError) {
        *outError = "Failed to write central directory";
      }
      return false;
    }
    pos += record.size();
  }

  // Step 3: End of central directory records
  std::vector<uint8_t> end = endRecords(written.size(), centralStart, pos - centralStart);
  if (!writeBytes(out, end)) {
    if (outError) {
      *outError = "Failed to write end of central directory";
    }
    return false;
  }
  pos += end.size();

  out.flush();
  if (!out) {
    if (outError) {
      *outError = "Failed to flush container";
    }
    return false;
  }
  return true;
}

void ZipWriter::clear() {
  pendingMembers_.clear();
  normalizedPaths_.clear();
  entries_.clear();
}

} // namespace nli

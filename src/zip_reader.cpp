#include <algorithm>
#include <format>
#include <limits>

#include <zlib.h>

#include <nli/endian.hpp>
#include <nli/names.hpp>
#include <nli/zip_reader.hpp>

namespace nli {

namespace {

// EOCD may be followed by a comment of up to 64 KiB
constexpr size_t kMaxCommentSize = 0xFFFF;

// Replace 0xFFFFFFFF placeholders with the values of the ZIP64 extended information field
bool applyZip64Extra(std::span<const uint8_t> extra, ArchiveEntry &entry) {
  bool wantUncompressed = entry.uncompressedSize == ZipLayout::sizePlaceholder;
  bool wantCompressed = entry.compressedSize == ZipLayout::sizePlaceholder;
  bool wantOffset = entry.localHeaderOffset == ZipLayout::sizePlaceholder;
  if (!wantUncompressed && !wantCompressed && !wantOffset) {
    return true;
  }

  size_t at = 0;
  while (at + 4 <= extra.size()) {
    uint16_t id = loadLE16(extra.data() + at);
    uint16_t size = loadLE16(extra.data() + at + 2);
    at += 4;
    if (at + size > extra.size()) {
      return false;
    }
    if (id != ZipLayout::zip64ExtraId) {
      at += size;
      continue;
    }

    // Present fields appear in this fixed order
    std::span<const uint8_t> field = extra.subspan(at, size);
    size_t offset = 0;
    auto next = [&](uint64_t &value) {
      if (offset + 8 > field.size()) {
        return false;
      }
      value = loadLE64(field.data() + offset);
      offset += 8;
      return true;
    };
    return (!wantUncompressed || next(entry.uncompressedSize)) &&
           (!wantCompressed || next(entry.compressedSize)) &&
           (!wantOffset || next(entry.localHeaderOffset));
  }
  return false;
}

} // namespace

std::optional<ZipReader> ZipReader::open(const std::filesystem::path &path,
                                         std::string *outError) {
  ZipReader reader;
  if (!reader.mappedFile_.openRead(path, outError)) {
    return std::nullopt;
  }

  if (!reader.parse(outError)) {
    reader.close();
    return std::nullopt;
  }

  return reader;
}

bool ZipReader::parse(std::string *outError) {
  auto fileData = mappedFile_.data();
  const uint8_t *data = fileData.data();

  if (fileData.size() < ZipLayout::endOfCentralDirSize) {
    if (outError) {
      *outError = std::format("File too small to be a ZIP container (size: {})", fileData.size());
    }
    return false;
  }

  // Scan backwards for the end of central directory record
  size_t searchStart = fileData.size() - ZipLayout::endOfCentralDirSize;
  size_t searchEnd = searchStart > kMaxCommentSize ? searchStart - kMaxCommentSize : 0;
  std::optional<size_t> eocd;
  for (size_t pos = searchStart + 1; pos-- > searchEnd;) {
    if (loadLE32(data + pos) == ZipLayout::endOfCentralDirSignature) {
      eocd = pos;
      break;
    }
  }
  if (!eocd) {
    if (outError) {
      *outError = "End of central directory record not found";
    }
    return false;
  }

  uint64_t entryCount = loadLE16(data + *eocd + 10);
  uint64_t centralSize = loadLE32(data + *eocd + 12);
  uint64_t centralOffset = loadLE32(data + *eocd + 16);
  uint64_t directoryEnd = *eocd;

  // ZIP64: the locator sits right before the classic record and points at the 64-bit one
  if (*eocd >= ZipLayout::zip64LocatorSize &&
      loadLE32(data + *eocd - ZipLayout::zip64LocatorSize) == ZipLayout::zip64LocatorSignature) {
    uint64_t recordOffset = loadLE64(data + *eocd - ZipLayout::zip64LocatorSize + 8);
    size_t recordLimit = *eocd - ZipLayout::zip64LocatorSize;
    if (recordLimit < ZipLayout::zip64EndOfCentralDirSize ||
        recordOffset > recordLimit - ZipLayout::zip64EndOfCentralDirSize ||
        loadLE32(data + recordOffset) != ZipLayout::zip64EndOfCentralDirSignature) {
      if (outError) {
        *outError = "Invalid ZIP64 end of central directory record";
      }
      return false;
    }
    entryCount = loadLE64(data + recordOffset + 32);
    centralSize = loadLE64(data + recordOffset + 40);
    centralOffset = loadLE64(data + recordOffset + 48);
    directoryEnd = recordOffset;
  }

  if (centralOffset > directoryEnd || centralSize > directoryEnd - centralOffset) {
    if (outError) {
      *outError = std::format("Central directory has invalid offset/size (offset={}, size={})",
                              centralOffset, centralSize);
    }
    return false;
  }

  size_t pos = static_cast<size_t>(centralOffset);
  size_t end = static_cast<size_t>(centralOffset + centralSize);
  entries_.reserve(std::min<uint64_t>(entryCount, centralSize / ZipLayout::centralHeaderSize));

  for (uint64_t i = 0; i < entryCount; ++i) {
    if (pos + ZipLayout::centralHeaderSize > end) {
      if (outError) {
        *outError = std::format("Central directory entry {} extends beyond its bounds", i);
      }
      return false;
    }
    if (loadLE32(data + pos) != ZipLayout::centralHeaderSignature) {
      if (outError) {
        *outError = std::format("Invalid central directory signature at entry {}", i);
      }
      return false;
    }

    ArchiveEntry entry;
    entry.method = loadLE16(data + pos + 10);
    entry.crc32 = loadLE32(data + pos + 16);
    entry.compressedSize = loadLE32(data + pos + 20);
    entry.uncompressedSize = loadLE32(data + pos + 24);
    uint16_t nameLength = loadLE16(data + pos + 28);
    uint16_t extraLength = loadLE16(data + pos + 30);
    uint16_t commentLength = loadLE16(data + pos + 32);
    entry.localHeaderOffset = loadLE32(data + pos + 42);
    pos += ZipLayout::centralHeaderSize;

    if (pos + nameLength + extraLength + commentLength > end) {
      if (outError) {
        *outError = std::format("Central directory entry {} has a truncated name", i);
      }
      return false;
    }

    entry.path.assign(reinterpret_cast<const char *>(data + pos), nameLength);
    entry.lowercasePath = normalizeArchivePath(entry.path);
    if (!applyZip64Extra(std::span<const uint8_t>(data + pos + nameLength, extraLength), entry)) {
      if (outError) {
        *outError = std::format("Central directory entry {} lacks its ZIP64 sizes", i);
      }
      return false;
    }
    pos += nameLength + extraLength + commentLength;

    entries_.push_back(std::move(entry));
  }

  // Build lookup table
  lookup_.reserve(entries_.size());
  for (size_t i = 0; i < entries_.size(); ++i) {
    const auto &entry = entries_[i];

    if (lookup_.contains(entry.lowercasePath)) {
      if (outError) {
        *outError = std::format("Duplicate file path in container: {}", entry.path);
      }
      return false;
    }

    lookup_[entry.lowercasePath] = i;
  }

  return true;
}

const ArchiveEntry *ZipReader::findEntry(const std::string &path) const {
  auto it = lookup_.find(normalizeArchivePath(path));
  if (it == lookup_.end()) {
    return nullptr;
  }
  return &entries_[it->second];
}

std::optional<std::span<const uint8_t>> ZipReader::payloadView(const ArchiveEntry &entry) const {
  auto archiveData = mappedFile_.data();
  uint64_t offset = entry.localHeaderOffset;

  if (offset > archiveData.size() || offset + ZipLayout::localHeaderSize > archiveData.size() ||
      loadLE32(archiveData.data() + offset) != ZipLayout::localHeaderSignature) {
    return std::nullopt;
  }

  uint16_t nameLength = loadLE16(archiveData.data() + offset + 26);
  uint16_t extraLength = loadLE16(archiveData.data() + offset + 28);
  uint64_t start = offset + ZipLayout::localHeaderSize + nameLength + extraLength;

  // Validate bounds
  if (start > archiveData.size() || entry.compressedSize > archiveData.size() - start) {
    return std::nullopt;
  }

  return archiveData.subspan(start, entry.compressedSize);
}

std::optional<std::vector<uint8_t>> ZipReader::extractToMemory(const ArchiveEntry &entry,
                                                               std::string *outError) const {
  auto view = payloadView(entry);
  if (!view) {
    if (outError) {
      *outError = std::format("Invalid member bounds for: {}", entry.path);
    }
    return std::nullopt;
  }
  std::span<const uint8_t> payload = *view;

  std::vector<uint8_t> result;
  if (entry.method == ZipLayout::methodStored) {
    result.assign(payload.begin(), payload.end());
  } else if (entry.method == ZipLayout::methodDeflated) {
    result.resize(entry.uncompressedSize);

    z_stream stream{};
    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
      if (outError) {
        *outError = "Failed to initialize zlib inflate";
      }
      return std::nullopt;
    }

    // zlib counts in 32 bits; hand over input and output in slices
    constexpr size_t maxSlice = std::numeric_limits<uInt>::max();
    size_t inPos = 0;
    size_t outPos = 0;
    int rc = Z_OK;
    while (rc == Z_OK) {
      if (stream.avail_in == 0 && inPos < payload.size()) {
        size_t slice = std::min(payload.size() - inPos, maxSlice);
        stream.next_in = const_cast<Bytef *>(payload.data() + inPos);
        stream.avail_in = static_cast<uInt>(slice);
        inPos += slice;
      }
      if (stream.avail_out == 0 && outPos < result.size()) {
        size_t slice = std::min(result.size() - outPos, maxSlice);
        stream.next_out = result.data() + outPos;
        stream.avail_out = static_cast<uInt>(slice);
        outPos += slice;
      }
      rc = inflate(&stream, Z_NO_FLUSH);
    }
    uint64_t produced = stream.total_out;
    inflateEnd(&stream);

    if (rc != Z_STREAM_END || produced != entry.uncompressedSize) {
      if (outError) {
        *outError = std::format("Failed to inflate member: {} (code {})", entry.path, rc);
      }
      return std::nullopt;
    }
  } else {
    if (outError) {
      *outError = std::format("Unsupported compression method {} for: {}", entry.method,
                              entry.path);
    }
    return std::nullopt;
  }

  auto crc = static_cast<uint32_t>(crc32_z(crc32(0L, Z_NULL, 0), result.data(), result.size()));
  if (crc != entry.crc32) {
    if (outError) {
      *outError = std::format("CRC-32 mismatch for member: {}", entry.path);
    }
    return std::nullopt;
  }

  return result;
}

std::optional<std::string> ZipReader::extractText(const std::string &path,
                                                  std::string *outError) const {
  const ArchiveEntry *entry = findEntry(path);
  if (!entry) {
    if (outError) {
      *outError = std::format("Member not found: {}", path);
    }
    return std::nullopt;
  }

  auto bytes = extractToMemory(*entry, outError);
  if (!bytes) {
    return std::nullopt;
  }
  return std::string(bytes->begin(), bytes->end());
}

bool ZipReader::isOpen() const {
  return mappedFile_.isOpen();
}

void ZipReader::close() {
  mappedFile_.close();
  entries_.clear();
  lookup_.clear();
}

} // namespace nli

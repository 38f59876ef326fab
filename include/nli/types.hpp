#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace nli {

// Point in time stored on DateTime fields (UTC, microsecond resolution)
using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

// Longest effective entry name, in bytes
inline constexpr size_t kMaxNameLength = 255;

// Classification of every failure the library reports
enum class ErrorCode {
  None,
  InvalidFieldType,
  DateParseError,
  DanglingParentReference,
  CyclicParentReference,
  PackagingIOError,
  MalformedSourceDocument,
  DuplicateField,
  UnknownField,
  InvalidArgument,
  // Any other exception, such as one thrown by a caller's generator or entry override
  UnhandledException,
};

std::string_view toString(ErrorCode code) noexcept;

// Exception thrown by the entry model, decomposers and assembly internals
class Error : public std::runtime_error {
public:
  Error(ErrorCode code, const std::string &msg) : std::runtime_error(msg), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

// Error report filled by the public builder API
struct ErrorInfo {
  ErrorCode code = ErrorCode::None;
  std::string message;
};

// Member of a ZIP container
struct ArchiveEntry {
  std::string path;              // Forward slashes, directories end with '/'
  std::string lowercasePath;     // For case-insensitive lookup
  uint64_t localHeaderOffset = 0;
  uint64_t compressedSize = 0;
  uint64_t uncompressedSize = 0;
  uint32_t crc32 = 0;
  uint16_t method = 0;           // 0 = stored, 8 = deflated

  bool isDirectory() const { return !path.empty() && path.back() == '/'; }
};

// ZIP record layout (PKWARE APPNOTE), ZIP64 records included
struct ZipLayout {
  static constexpr uint32_t localHeaderSignature = 0x04034b50;
  static constexpr uint32_t centralHeaderSignature = 0x02014b50;
  static constexpr uint32_t endOfCentralDirSignature = 0x06054b50;

  static constexpr size_t localHeaderSize = 30;
  static constexpr size_t centralHeaderSize = 46;
  static constexpr size_t endOfCentralDirSize = 22;

  static constexpr uint16_t versionNeeded = 20;
  static constexpr uint16_t versionMadeBy = (3 << 8) | 45; // UNIX, 4.5
  static constexpr uint16_t flagUtf8 = 0x0800;
  static constexpr uint16_t methodStored = 0;
  static constexpr uint16_t methodDeflated = 8;

  // ZIP64 takes over when a count, size or offset reaches these placeholders
  static constexpr uint16_t countPlaceholder = 0xFFFF;
  static constexpr uint32_t sizePlaceholder = 0xFFFFFFFF;

  static constexpr uint32_t zip64EndOfCentralDirSignature = 0x06064b50;
  static constexpr uint32_t zip64LocatorSignature = 0x07064b50;
  static constexpr size_t zip64EndOfCentralDirSize = 56;
  static constexpr size_t zip64LocatorSize = 20;
  static constexpr uint16_t zip64ExtraId = 0x0001;
  static constexpr uint16_t versionNeededZip64 = 45;
};

} // namespace nli

#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace nli {

enum class DigestAlgorithm { Sha1, Md5 };

// Incremental message digest (OpenSSL EVP)
class Digest {
public:
  explicit Digest(DigestAlgorithm algorithm);
  ~Digest();

  Digest(const Digest &) = delete;
  Digest &operator=(const Digest &) = delete;
  Digest(Digest &&other) noexcept;
  Digest &operator=(Digest &&other) noexcept;

  void update(std::span<const uint8_t> data);
  void update(std::string_view data);

  // Finalize; the digest cannot be updated afterwards
  std::vector<uint8_t> finish();
  std::string finishHex();

private:
  void *ctx_ = nullptr; // EVP_MD_CTX
};

std::string toHex(std::span<const uint8_t> bytes);

// 40-hex-character SHA-1 of data
std::string sha1Hex(std::string_view data);

std::vector<uint8_t> sha1(std::span<const uint8_t> data);

struct FileDigests {
  std::string sha1;
  std::string md5;
  uint64_t size = 0;
};

// SHA-1 and MD5 of a file in one read pass; throws Error(PackagingIOError) when unreadable
FileDigests hashFile(const std::filesystem::path &path, size_t bufferSize);

} // namespace nli

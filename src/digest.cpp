#include <format>
#include <fstream>
#include <stdexcept>
#include <utility>

#include <openssl/evp.h>

#include <nli/digest.hpp>
#include <nli/types.hpp>

namespace nli {

namespace {

EVP_MD_CTX *context(void *ctx) {
  return static_cast<EVP_MD_CTX *>(ctx);
}

} // namespace

Digest::Digest(DigestAlgorithm algorithm) {
  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");
  }

  const EVP_MD *md = algorithm == DigestAlgorithm::Sha1 ? EVP_sha1() : EVP_md5();
  if (EVP_DigestInit_ex(ctx, md, nullptr) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("OpenSSL: EVP_DigestInit_ex failed");
  }
  ctx_ = ctx;
}

Digest::~Digest() {
  if (ctx_) {
    EVP_MD_CTX_free(context(ctx_));
  }
}

Digest::Digest(Digest &&other) noexcept : ctx_(std::exchange(other.ctx_, nullptr)) {}

Digest &Digest::operator=(Digest &&other) noexcept {
  if (this != &other) {
    if (ctx_) {
      EVP_MD_CTX_free(context(ctx_));
    }
    ctx_ = std::exchange(other.ctx_, nullptr);
  }
  return *this;
}

void Digest::update(std::span<const uint8_t> data) {
  if (!ctx_) {
    throw std::logic_error("Digest already finished");
  }
  if (EVP_DigestUpdate(context(ctx_), data.data(), data.size()) != 1) {
    throw std::runtime_error("OpenSSL: EVP_DigestUpdate failed");
  }
}

void Digest::update(std::string_view data) {
  update(std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(data.data()), data.size()));
}

std::vector<uint8_t> Digest::finish() {
  if (!ctx_) {
    throw std::logic_error("Digest already finished");
  }

  std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
  unsigned int outLen = 0;
  int rc = EVP_DigestFinal_ex(context(ctx_), out.data(), &outLen);
  EVP_MD_CTX_free(context(ctx_));
  ctx_ = nullptr;
  if (rc != 1) {
    throw std::runtime_error("OpenSSL: EVP_DigestFinal_ex failed");
  }

  out.resize(outLen);
  return out;
}

std::string Digest::finishHex() {
  return toHex(finish());
}

std::string toHex(std::span<const uint8_t> bytes) {
  static constexpr char digits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    hex += digits[b >> 4];
    hex += digits[b & 0x0F];
  }
  return hex;
}

std::string sha1Hex(std::string_view data) {
  Digest digest(DigestAlgorithm::Sha1);
  digest.update(data);
  return digest.finishHex();
}

std::vector<uint8_t> sha1(std::span<const uint8_t> data) {
  Digest digest(DigestAlgorithm::Sha1);
  digest.update(data);
  return digest.finish();
}

FileDigests hashFile(const std::filesystem::path &path, size_t bufferSize) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw Error(ErrorCode::PackagingIOError,
                std::format("Failed to open native file: {}", path.string()));
  }

  Digest sha(DigestAlgorithm::Sha1);
  Digest md5(DigestAlgorithm::Md5);
  std::vector<uint8_t> buffer(bufferSize > 0 ? bufferSize : 65536);
  FileDigests result;

  while (in) {
    in.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    auto got = static_cast<size_t>(in.gcount());
    if (got == 0) {
      break;
    }
    std::span<const uint8_t> chunk(buffer.data(), got);
    sha.update(chunk);
    md5.update(chunk);
    result.size += got;
  }

  if (in.bad()) {
    throw Error(ErrorCode::PackagingIOError,
                std::format("Failed to read native file: {}", path.string()));
  }

  result.sha1 = sha.finishHex();
  result.md5 = md5.finishHex();
  return result;
}

} // namespace nli

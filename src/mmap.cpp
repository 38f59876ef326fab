#include <cerrno>
#include <cstring>
#include <format>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <nli/mmap.hpp>

namespace nli {

namespace {

std::string describeErrno(int err) {
  return std::format("{} (errno: {})", std::strerror(err), err);
}

} // namespace

MappedFile::MappedFile() = default;

MappedFile::~MappedFile() {
  close();
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    : fd_(std::exchange(other.fd_, -1)), data_(std::exchange(other.data_, nullptr)),
      size_(std::exchange(other.size_, 0)), path_(std::move(other.path_)) {}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    data_ = std::exchange(other.data_, nullptr);
    size_ = std::exchange(other.size_, 0);
    path_ = std::move(other.path_);
  }
  return *this;
}

bool MappedFile::openRead(const std::filesystem::path &path, std::string *outError) {
  close();

  fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd_ < 0) {
    if (outError) {
      *outError = std::format("Failed to open file for reading: {}: {}", path.string(),
                              describeErrno(errno));
    }
    return false;
  }

  struct stat st;
  if (fstat(fd_, &st) < 0) {
    int err = errno;
    close();
    if (outError) {
      *outError = std::format("Failed to stat file: {}: {}", path.string(), describeErrno(err));
    }
    return false;
  }

  if (st.st_size == 0) {
    close();
    if (outError) {
      *outError = std::format("File is empty: {}", path.string());
    }
    return false;
  }

  size_ = static_cast<size_t>(st.st_size);
  data_ = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
  if (data_ == MAP_FAILED) {
    int err = errno;
    data_ = nullptr;
    close();
    if (outError) {
      *outError = std::format("Failed to map file: {}: {}", path.string(), describeErrno(err));
    }
    return false;
  }

  path_ = path;
  return true;
}

void MappedFile::close() {
  cleanup();
}

void MappedFile::cleanup() noexcept {
  if (data_) {
    munmap(data_, size_);
    data_ = nullptr;
  }

  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }

  size_ = 0;
  path_.clear();
}

} // namespace nli

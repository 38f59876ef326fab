#include <cerrno>
#include <cstring>
#include <format>
#include <vector>

#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

#include <nli/datetime.hpp>
#include <nli/file_entry.hpp>
#include <nli/log.hpp>

namespace nli {

namespace {

std::filesystem::path absolutePath(const std::filesystem::path &path) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(path, ec);
  return ec ? path : absolute.lexically_normal();
}

// User name of uid, or "Undefined" when it cannot be resolved
std::string ownerName(uid_t uid) {
  long bufferSize = sysconf(_SC_GETPW_R_SIZE_MAX);
  std::vector<char> buffer(bufferSize > 0 ? static_cast<size_t>(bufferSize) : 16384);

  struct passwd pwd;
  struct passwd *result = nullptr;
  if (getpwuid_r(uid, &pwd, buffer.data(), buffer.size(), &result) == 0 && result) {
    return result->pw_name;
  }
  return "Undefined";
}

Field dateField(std::string_view name, const struct timespec &ts) {
  return Field(std::string(name), FieldType::DateTime, fromTimespec(ts));
}

} // namespace

FileEntry::FileEntry(const std::filesystem::path &path, std::string mimeType,
                     std::optional<std::string> parentId)
    : Entry(std::move(mimeType), std::move(parentId)), path_(absolutePath(path)) {}

std::string FileEntry::getName() const {
  return path_.filename().string();
}

void FileEntry::populateStandardFields(const BuildConfig &config) {
  struct stat st;
  if (::stat(path_.c_str(), &st) != 0) {
    int err = errno;
    throw Error(ErrorCode::PackagingIOError,
                std::format("Cannot stat native file {}: {}", path_.string(), std::strerror(err)));
  }
  if (!S_ISREG(st.st_mode)) {
    throw Error(ErrorCode::PackagingIOError,
                std::format("Native path is not a regular file: {}", path_.string()));
  }

  digests_ = hashFile(path_, config.hashBufferSize);
  itemDate_ = fromTimespec(st.st_ctim);
  NLI_LOG(Debug) << "Hashed " << path_.string() << " (" << digests_.size << " bytes)";

  putField(Field(std::string(standard_fields::MimeType), FieldType::Text, mimeType()));
  putField(Field(std::string(standard_fields::ItemDate), FieldType::DateTime, *itemDate_));
  putField(Field(std::string(standard_fields::PathName), FieldType::Text, path_.string()));
  putField(dateField(standard_fields::FileAccessed, st.st_atim));
  // POSIX stat has no birth time; the status change time stands in for it
  putField(dateField(standard_fields::FileCreated, st.st_ctim));
  putField(dateField(standard_fields::FileModified, st.st_mtim));
  putField(Field(std::string(standard_fields::FileOwner), FieldType::Text, ownerName(st.st_uid)));
  putField(Field(std::string(standard_fields::Name), FieldType::Text, getName()));
  putField(Field(std::string(standard_fields::Sha1), FieldType::Text, digests_.sha1));
  putField(Field(std::string(standard_fields::FileSize), FieldType::LongInteger,
                 static_cast<int64_t>(digests_.size)));
}

DirectoryEntry::DirectoryEntry(std::string name, std::optional<std::string> parentId)
    : Entry("filesystem/directory", std::move(parentId)), name_(std::move(name)) {}

DirectoryEntry::DirectoryEntry(const Mapping &fields, std::optional<std::string> parentId)
    : Entry("filesystem/directory", std::move(parentId)), name_(mappingDisplayName(fields)) {
  for (const auto &[key, value] : fields) {
    putField(FieldFactory::infer(key, value));
  }
}

std::string DirectoryEntry::addAsParentPath(const std::string &existingPath) const {
  return std::format("{}/{}", name(), existingPath);
}

} // namespace nli

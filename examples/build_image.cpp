#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <nli/nli.hpp>

namespace fs = std::filesystem;

namespace {

std::string guessMimeType(const fs::path &path) {
  std::string ext = path.extension().string();
  if (ext == ".txt" || ext == ".log") {
    return "text/plain";
  }
  if (ext == ".html" || ext == ".htm") {
    return "text/html";
  }
  if (ext == ".pdf") {
    return "application/pdf";
  }
  return "application/octet-stream";
}

bool addPath(nli::ImageBuilder &builder, const fs::path &path,
             const std::optional<std::string> &parentId) {
  nli::ErrorInfo info;
  std::optional<std::string> id;

  if (fs::is_directory(path)) {
    id = builder.addDirectory(path.filename().string(), parentId, &info);
    if (!id) {
      std::cerr << "Failed to add " << path << ": " << info.message << "\n";
      return false;
    }
    for (const auto &child : fs::directory_iterator(path)) {
      if (!addPath(builder, child.path(), id)) {
        return false;
      }
    }
    return true;
  }

  std::string ext = path.extension().string();
  if (ext == ".csv") {
    id = builder.addEntry(std::make_unique<nli::CsvEntry>(path, parentId), &info);
  } else if (ext == ".json") {
    id = builder.addEntry(std::make_unique<nli::JsonFileEntry>(path, parentId), &info);
  } else {
    id = builder.addFile(path, guessMimeType(path), parentId, &info);
  }

  if (!id) {
    std::cerr << "Failed to add " << path << ": " << info.message << "\n";
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " [-c settings.json] [-v] <image.zip> <path>...\n";
    return 1;
  }

  std::optional<fs::path> settings;
  int arg = 1;
  for (; arg < argc; ++arg) {
    std::string flag = argv[arg];
    if (flag == "-c" && arg + 1 < argc) {
      settings = argv[++arg];
    } else if (flag == "-v") {
      nli::log::setLevel(nli::log::Level::Info);
    } else {
      break;
    }
  }

  if (argc - arg < 2) {
    std::cerr << "Missing output or input paths\n";
    return 1;
  }

  nli::ErrorInfo info;
  std::optional<nli::ImageBuilder> builder;
  if (settings) {
    builder = nli::ImageBuilder::fromConfigFile(*settings, &info);
    if (!builder) {
      std::cerr << "Error: " << info.message << "\n";
      return 1;
    }
  } else {
    builder.emplace();
  }

  fs::path output = argv[arg++];
  for (; arg < argc; ++arg) {
    if (!addPath(*builder, argv[arg], std::nullopt)) {
      return 1;
    }
  }

  if (!builder->save(output, &info)) {
    std::cerr << "Error: " << info.message << "\n";
    return 1;
  }

  std::cout << "Wrote " << builder->entryCount() << " entries to " << output << "\n";
  return 0;
}

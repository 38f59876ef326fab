#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace nli {

// Tunables for one build session
struct BuildConfig {
  // Custodian written into every document's Location
  std::string custodian = "Unknown";
  // Appended to every formatted DateTime value
  std::string timeZoneSuffix = "+00:00";
  // Read size when hashing native files
  size_t hashBufferSize = 65536;
  std::string locale = "US";
  // zlib level, -1 selects zlib's default
  int compressionLevel = -1;

  // image_metadata.xml properties
  std::string caseNumber = "01";
  std::string evidenceNumber = "01";
  std::string examinerName = "Unknown";
  std::string softwareName = "NLI Forge";
  std::string softwareVersion = "0.1.0";
};

// Loads and saves BuildConfig as a JSON settings file.
//
// Keys are snake_case versions of the member names ("custodian", "time_zone_suffix",
// "hash_buffer_size", ...). Missing keys keep their defaults.
class ConfigLoader {
public:
  // Returns std::nullopt on failure (unreadable file, invalid JSON, wrong value type)
  static std::optional<BuildConfig> load(const std::filesystem::path &path,
                                         std::string *outError = nullptr);

  static bool save(const BuildConfig &config, const std::filesystem::path &path,
                   std::string *outError = nullptr);
};

} // namespace nli

#include <format>
#include <fstream>

#include <nlohmann/json.hpp>

#include <nli/config.hpp>
#include <nli/log.hpp>

namespace nli {

namespace {

template <typename T> void readKey(const nlohmann::json &j, const char *key, T &target) {
  if (j.contains(key)) {
    target = j.at(key).get<T>();
  }
}

} // namespace

std::optional<BuildConfig> ConfigLoader::load(const std::filesystem::path &path,
                                              std::string *outError) {
  std::ifstream file(path);
  if (!file) {
    if (outError) {
      *outError = std::format("Failed to open settings file: {}", path.string());
    }
    return std::nullopt;
  }

  BuildConfig config;
  try {
    nlohmann::json j;
    file >> j;

    if (!j.is_object()) {
      if (outError) {
        *outError = std::format("Settings file is not a JSON object: {}", path.string());
      }
      return std::nullopt;
    }

    readKey(j, "custodian", config.custodian);
    readKey(j, "time_zone_suffix", config.timeZoneSuffix);
    readKey(j, "hash_buffer_size", config.hashBufferSize);
    readKey(j, "locale", config.locale);
    readKey(j, "compression_level", config.compressionLevel);
    readKey(j, "case_number", config.caseNumber);
    readKey(j, "evidence_number", config.evidenceNumber);
    readKey(j, "examiner_name", config.examinerName);
    readKey(j, "software_name", config.softwareName);
    readKey(j, "software_version", config.softwareVersion);
  } catch (const nlohmann::json::exception &e) {
    if (outError) {
      *outError = std::format("Invalid settings file {}: {}", path.string(), e.what());
    }
    return std::nullopt;
  }

  if (config.hashBufferSize == 0) {
    if (outError) {
      *outError = "hash_buffer_size must be greater than zero";
    }
    return std::nullopt;
  }
  if (config.compressionLevel < -1 || config.compressionLevel > 9) {
    if (outError) {
      *outError = std::format("compression_level out of range: {}", config.compressionLevel);
    }
    return std::nullopt;
  }

  NLI_LOG(Debug) << "Loaded settings from " << path.string();
  return config;
}

bool ConfigLoader::save(const BuildConfig &config, const std::filesystem::path &path,
                        std::string *outError) {
  nlohmann::json j;
  j["custodian"] = config.custodian;
  j["time_zone_suffix"] = config.timeZoneSuffix;
  j["hash_buffer_size"] = config.hashBufferSize;
  j["locale"] = config.locale;
  j["compression_level"] = config.compressionLevel;
  j["case_number"] = config.caseNumber;
  j["evidence_number"] = config.evidenceNumber;
  j["examiner_name"] = config.examinerName;
  j["software_name"] = config.softwareName;
  j["software_version"] = config.softwareVersion;

  std::ofstream file(path);
  if (!file) {
    if (outError) {
      *outError = std::format("Failed to create settings file: {}", path.string());
    }
    return false;
  }

  file << j.dump(4);
  if (!file) {
    if (outError) {
      *outError = std::format("Failed to write settings file: {}", path.string());
    }
    return false;
  }
  return true;
}

} // namespace nli

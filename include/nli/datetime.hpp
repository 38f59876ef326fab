#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <string_view>

#include "types.hpp"

namespace nli {

// Format used by DateTime field values and the manifest: 2024-03-01T12:30:05.250
// followed by zoneSuffix (the manifest uses the configured suffix, "+00:00" by default)
std::string formatTimestamp(Timestamp ts, std::string_view zoneSuffix = "+00:00");

// Format used by the image metadata creation-datetime property: 2024/03/01 12:30:05.250 UTC
std::string formatMetadataTimestamp(Timestamp ts);

// Parse text with a strftime-style format (interpreted as UTC).
// Fractional seconds directly after the parsed portion (".123" or ".123456") are accepted,
// as is a trailing "Z" or "+00:00". Returns std::nullopt when text does not match.
std::optional<Timestamp> parseTimestamp(std::string_view text, const std::string &format);

// Accept the formats the library itself writes plus the common "YYYY-MM-DD HH:MM:SS"
std::optional<Timestamp> parseAnyTimestamp(std::string_view text);

Timestamp fromTimespec(const struct timespec &ts);

Timestamp now();

} // namespace nli

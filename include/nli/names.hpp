#pragma once

#include <string>
#include <string_view>

namespace nli {

// Filesystem-safe form of a raw entry name.
// Invalid UTF-8 is replaced with U+FFFD. Characters illegal in a path segment (/ \ : * ? " < > | and control characters) become '_',
// surrounding whitespace and trailing dots are dropped and the result is capped at
// kMaxNameLength bytes without splitting a UTF-8 sequence. Never returns an empty string:
// fallback is used when nothing usable remains, "unnamed" when fallback is empty too.
std::string sanitizeName(std::string_view raw, std::string_view fallback);

// Percent-encode an archive path for a LocationURI ('/' kept, space becomes '+')
std::string percentEncodePath(std::string_view path);

bool isValidUtf8(std::string_view text);

// Each invalid UTF-8 byte (overlong, surrogate, truncated, stray continuation) becomes U+FFFD
std::string toValidUtf8(std::string_view text);

// Valid UTF-8 restricted to the characters XML 1.0 allows in text content:
// invalid bytes become U+FFFD, disallowed characters are removed
std::string sanitizeXmlText(std::string_view text);

// Lowercase with forward slashes, used for case-insensitive archive path comparison
std::string normalizeArchivePath(std::string_view path);

} // namespace nli

#include <array>
#include <cctype>
#include <format>
#include <iomanip>
#include <locale>
#include <sstream>

#include <nli/datetime.hpp>

namespace nli {

namespace {

std::tm toUtc(std::time_t tt) {
  std::tm tm = {};
  gmtime_r(&tt, &tm);
  return tm;
}

// Split into whole seconds and the sub-second remainder (always non-negative)
std::pair<std::time_t, int64_t> splitSeconds(Timestamp ts) {
  auto seconds = std::chrono::floor<std::chrono::seconds>(ts);
  auto micros = (ts - seconds).count();
  return {static_cast<std::time_t>(seconds.time_since_epoch().count()), micros};
}

std::string_view trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

// Parse "Z", "+HH:MM", "-HH:MM" or "+HHMM"; returns offset in seconds east of UTC
std::optional<int> parseZone(std::string_view zone) {
  if (zone == "Z" || zone == "z") {
    return 0;
  }
  if (zone.size() != 6 && zone.size() != 5) {
    return std::nullopt;
  }
  if (zone[0] != '+' && zone[0] != '-') {
    return std::nullopt;
  }
  std::string digits;
  for (char c : zone.substr(1)) {
    if (c == ':') {
      continue;
    }
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
    digits += c;
  }
  if (digits.size() != 4) {
    return std::nullopt;
  }
  int hours = (digits[0] - '0') * 10 + (digits[1] - '0');
  int minutes = (digits[2] - '0') * 10 + (digits[3] - '0');
  if (hours > 23 || minutes > 59) {
    return std::nullopt;
  }
  int offset = hours * 3600 + minutes * 60;
  return zone[0] == '-' ? -offset : offset;
}

} // namespace

std::string formatTimestamp(Timestamp ts, std::string_view zoneSuffix) {
  auto [seconds, micros] = splitSeconds(ts);
  std::tm tm = toUtc(seconds);

  std::array<char, 32> buf{};
  std::strftime(buf.data(), buf.size(), "%Y-%m-%dT%H:%M:%S", &tm);
  return std::format("{}.{:03}{}", buf.data(), micros / 1000, zoneSuffix);
}

std::string formatMetadataTimestamp(Timestamp ts) {
  auto [seconds, micros] = splitSeconds(ts);
  std::tm tm = toUtc(seconds);

  std::array<char, 32> buf{};
  std::strftime(buf.data(), buf.size(), "%Y/%m/%d %H:%M:%S", &tm);
  return std::format("{}.{:03} UTC", buf.data(), micros / 1000);
}

std::optional<Timestamp> parseTimestamp(std::string_view text, const std::string &format) {
  text = trim(text);
  if (text.empty() || format.empty()) {
    return std::nullopt;
  }

  std::istringstream in{std::string(text)};
  in.imbue(std::locale::classic());

  std::tm tm = {};
  in >> std::get_time(&tm, format.c_str());
  if (in.fail()) {
    return std::nullopt;
  }

  std::string rest;
  std::getline(in, rest, '\0');
  std::string_view tail = rest;

  // Fractional seconds
  int64_t micros = 0;
  if (!tail.empty() && tail.front() == '.') {
    tail.remove_prefix(1);
    size_t digits = 0;
    int64_t scale = 100000;
    while (!tail.empty() && std::isdigit(static_cast<unsigned char>(tail.front()))) {
      if (digits < 6) {
        micros += (tail.front() - '0') * scale;
        scale /= 10;
      }
      ++digits;
      tail.remove_prefix(1);
    }
    if (digits == 0) {
      return std::nullopt;
    }
  }

  int offset = 0;
  tail = trim(tail);
  if (!tail.empty()) {
    auto zone = parseZone(tail);
    if (!zone) {
      return std::nullopt;
    }
    offset = *zone;
  }

  std::time_t seconds = timegm(&tm);
  return Timestamp(std::chrono::seconds(seconds - offset)) + std::chrono::microseconds(micros);
}

std::optional<Timestamp> parseAnyTimestamp(std::string_view text) {
  static const std::array<std::string, 4> formats = {
      "%Y-%m-%dT%H:%M:%S",
      "%Y-%m-%d %H:%M:%S",
      "%Y/%m/%d %H:%M:%S",
      "%Y-%m-%d",
  };

  for (const auto &format : formats) {
    if (auto ts = parseTimestamp(text, format)) {
      return ts;
    }
  }
  return std::nullopt;
}

Timestamp fromTimespec(const struct timespec &ts) {
  return Timestamp(std::chrono::seconds(ts.tv_sec)) + std::chrono::microseconds(ts.tv_nsec / 1000);
}

Timestamp now() {
  return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
}

} // namespace nli

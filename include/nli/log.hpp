#pragma once

#include <functional>
#include <sstream>
#include <string_view>

namespace nli::log {

enum class Level { Debug, Info, Warning, Error, Off };

std::string_view toString(Level level) noexcept;

// Messages below the threshold are discarded (default: Warning)
void setLevel(Level level) noexcept;
Level level() noexcept;

// Replace the destination of log lines; an empty function restores the stderr sink
using Sink = std::function<void(Level, std::string_view)>;
void setSink(Sink sink);

void write(Level level, std::string_view message);

// One log line, emitted on destruction
class Line {
public:
  explicit Line(Level level) : level_(level) {}
  ~Line() { write(level_, stream_.str()); }

  Line(const Line &) = delete;
  Line &operator=(const Line &) = delete;

  template <typename T> Line &operator<<(const T &value) {
    stream_ << value;
    return *this;
  }

private:
  Level level_;
  std::ostringstream stream_;
};

} // namespace nli::log

// NLI_LOG(Info) << "Registered " << id;
#define NLI_LOG(LEVEL)                                                                             \
  if (::nli::log::Level::LEVEL < ::nli::log::level()) {                                            \
  } else                                                                                           \
    ::nli::log::Line(::nli::log::Level::LEVEL)

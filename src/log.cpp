#include <atomic>
#include <iostream>
#include <mutex>

#include <nli/log.hpp>

namespace nli::log {

namespace {

std::atomic<Level> threshold{Level::Warning};

std::mutex &sinkMutex() {
  static std::mutex mutex;
  return mutex;
}

Sink &currentSink() {
  static Sink sink;
  return sink;
}

} // namespace

std::string_view toString(Level level) noexcept {
  switch (level) {
  case Level::Debug:
    return "debug";
  case Level::Info:
    return "info";
  case Level::Warning:
    return "warning";
  case Level::Error:
    return "error";
  case Level::Off:
    return "off";
  }
  return "unknown";
}

void setLevel(Level level) noexcept {
  threshold.store(level);
}

Level level() noexcept {
  return threshold.load();
}

void setSink(Sink sink) {
  std::lock_guard lock(sinkMutex());
  currentSink() = std::move(sink);
}

void write(Level level, std::string_view message) {
  if (level < threshold.load() || level == Level::Off) {
    return;
  }

  std::lock_guard lock(sinkMutex());
  if (currentSink()) {
    currentSink()(level, message);
    return;
  }
  std::cerr << "[nli] " << toString(level) << ": " << message << '\n';
}

} // namespace nli::log

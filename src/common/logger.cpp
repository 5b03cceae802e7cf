#include "common/logger.hpp"
#include <atomic>
#include <cstdint>
#include <ctime>
#include <mutex>
#include <string>
#include <string_view>
#include <time.h>
#include <fmt/chrono.h>
#include <fmt/core.h>

namespace diaglink {

namespace {

std::atomic<LogLevel> g_level{LogLevel::kInfo};
std::mutex g_sink_mutex;
Logger::Sink g_sink;

std::string_view BaseName(const char *path) {
  std::string_view view(path);
  size_t slash = view.find_last_of('/');
  if (slash != std::string_view::npos) {
    view.remove_prefix(slash + 1);
  }
  return view;
}

}  // namespace

void Logger::SetLevel(LogLevel level) noexcept {
  g_level.store(level, std::memory_order_relaxed);
}

LogLevel Logger::GetLevel() noexcept {
  return g_level.load(std::memory_order_relaxed);
}

bool Logger::IsEnabled(LogLevel level) noexcept {
  return static_cast<uint8_t>(level) <= static_cast<uint8_t>(GetLevel());
}

void Logger::SetSink(Sink sink) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_sink = std::move(sink);
}

void Logger::ResetSink() {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_sink = nullptr;
}

const char *Logger::LevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::kError:
      return "ERROR";
    case LogLevel::kWarn:
      return "WARNING";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kDebug:
      return "DEBUG";
  }
  return "UNKNOWN";
}

void Logger::Write(LogLevel level, const char *file, uint32_t line, const std::string &message) {
  std::time_t now = std::time(nullptr);
  std::tm local_time{};
  ::localtime_r(&now, &local_time);
  std::string formatted = fmt::format("[{:%H:%M:%S} | {} @ {}:{} ] {}", local_time, LevelToString(level),
                                      BaseName(file), line, message);

  std::lock_guard<std::mutex> lock(g_sink_mutex);
  if (g_sink) {
    g_sink(level, formatted);
    return;
  }
  fmt::print(stderr, "{}\n", formatted);
}

}  // namespace diaglink

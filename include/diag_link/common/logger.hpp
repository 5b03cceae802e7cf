#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/core.h>

namespace diaglink {

/**
 * @brief Log level, ordered from most to least severe
 */
enum class LogLevel : uint8_t {
  kError = 0,
  kWarn = 1,
  kInfo = 2,
  kDebug = 3,
};

/**
 * @brief Process-wide logger
 *
 * Messages are formatted with {fmt} and written to stderr as
 * "[HH:MM:SS | LEVEL @ file:line ] message". Messages below the configured
 * level are dropped before formatting. The output sink can be replaced, e.g.
 * to capture log lines in tests.
 */
class Logger {
 public:
  using Sink = std::function<void(LogLevel level, std::string_view line)>;

  static void SetLevel(LogLevel level) noexcept;
  [[nodiscard]] static LogLevel GetLevel() noexcept;
  [[nodiscard]] static bool IsEnabled(LogLevel level) noexcept;

  /**
   * @brief Replace the output sink (stderr by default)
   */
  static void SetSink(Sink sink);
  static void ResetSink();

  template <typename... Args>
  static void Publish(LogLevel level, const char *file, uint32_t line, fmt::format_string<Args...> format,
                      Args &&...args) {
    if (!IsEnabled(level)) {
      return;
    }
    Write(level, file, line, fmt::format(format, std::forward<Args>(args)...));
  }

  [[nodiscard]] static const char *LevelToString(LogLevel level);

 private:
  static void Write(LogLevel level, const char *file, uint32_t line, const std::string &message);
};

}  // namespace diaglink

#define DIAGLINK_LOG_ERROR(...) ::diaglink::Logger::Publish(::diaglink::LogLevel::kError, __FILE__, __LINE__, __VA_ARGS__)
#define DIAGLINK_LOG_WARN(...) ::diaglink::Logger::Publish(::diaglink::LogLevel::kWarn, __FILE__, __LINE__, __VA_ARGS__)
#define DIAGLINK_LOG_INFO(...) ::diaglink::Logger::Publish(::diaglink::LogLevel::kInfo, __FILE__, __LINE__, __VA_ARGS__)
#define DIAGLINK_LOG_DEBUG(...) ::diaglink::Logger::Publish(::diaglink::LogLevel::kDebug, __FILE__, __LINE__, __VA_ARGS__)

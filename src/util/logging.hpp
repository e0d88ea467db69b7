#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace dappvault::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);

// Accepts debug/info/warn/warning/error in any case. Throws std::runtime_error
// on anything else.
LogLevel ParseLogLevelString(std::string_view value);

// Process-wide log sink. Lines go to stderr at or above the console threshold
// (stdout is reserved for the command channel) and, once EnableFile() has been
// called, to a debug log file rotated by size.
class Logger {
 public:
  void EnableFile(const std::string& path);
  void Configure(LogLevel file_level, std::uintmax_t max_bytes, std::size_t max_files);
  void SetConsoleLevel(LogLevel level);
  void SetConsoleEnabled(bool enabled);

  void Log(LogLevel level, std::string_view category, std::string_view message);

 private:
  void RotateLocked();

  mutable std::mutex mutex_;
  std::ofstream stream_;
  std::string path_;
  LogLevel file_threshold_{LogLevel::kDebug};
  LogLevel console_threshold_{LogLevel::kInfo};
  bool console_enabled_{true};
  std::uintmax_t max_bytes_{0};
  std::size_t max_files_{0};
  std::uintmax_t current_size_{0};
};

Logger& GlobalLogger();

std::string FormatTimestamp();

inline void LogDebug(std::string_view category, std::string_view message) {
  GlobalLogger().Log(LogLevel::kDebug, category, message);
}
inline void LogInfo(std::string_view category, std::string_view message) {
  GlobalLogger().Log(LogLevel::kInfo, category, message);
}
inline void LogWarn(std::string_view category, std::string_view message) {
  GlobalLogger().Log(LogLevel::kWarn, category, message);
}
inline void LogError(std::string_view category, std::string_view message) {
  GlobalLogger().Log(LogLevel::kError, category, message);
}

}  // namespace dappvault::util

#include "util/logging.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace dappvault::util {

std::string FormatTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t time = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
#ifdef _WIN32
  localtime_s(&tm_buf, &time);
#else
  localtime_r(&time, &tm_buf);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

LogLevel ParseLogLevelString(std::string_view value) {
  std::string lower;
  lower.reserve(value.size());
  for (char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "debug") {
    return LogLevel::kDebug;
  }
  if (lower == "info") {
    return LogLevel::kInfo;
  }
  if (lower == "warn" || lower == "warning") {
    return LogLevel::kWarn;
  }
  if (lower == "error") {
    return LogLevel::kError;
  }
  throw std::runtime_error("invalid log level: " + std::string(value));
}

void Logger::EnableFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stream_.is_open()) {
    stream_.close();
  }
  path_ = path;
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
  }
  stream_.open(path, std::ios::app);
  if (!stream_) {
    throw std::runtime_error("failed to open debug log: " + path);
  }
  current_size_ = 0;
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (!ec) {
    current_size_ = size;
  }
  const std::string header = "---- dappvaultd debug log started " + FormatTimestamp() + " ----\n";
  stream_ << header;
  stream_.flush();
  current_size_ += static_cast<std::uintmax_t>(header.size());
}

void Logger::Configure(LogLevel file_level, std::uintmax_t max_bytes, std::size_t max_files) {
  std::lock_guard<std::mutex> lock(mutex_);
  file_threshold_ = file_level;
  max_bytes_ = max_bytes;
  max_files_ = max_files;
}

void Logger::SetConsoleLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  console_threshold_ = level;
}

void Logger::SetConsoleEnabled(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  console_enabled_ = enabled;
}

void Logger::Log(LogLevel level, std::string_view category, std::string_view message) {
  std::lock_guard<std::mutex> lock(mutex_);
  const bool to_console =
      console_enabled_ && static_cast<int>(level) >= static_cast<int>(console_threshold_);
  const bool to_file =
      stream_.is_open() && static_cast<int>(level) >= static_cast<int>(file_threshold_);
  if (!to_console && !to_file) {
    return;
  }
  std::ostringstream line;
  line << "[" << FormatTimestamp() << "] [" << LogLevelName(level) << "] [" << category << "] "
       << message << '\n';
  const std::string text = line.str();
  if (to_console) {
    std::cerr << text;
  }
  if (to_file) {
    if (max_bytes_ > 0 && current_size_ >= max_bytes_) {
      RotateLocked();
    }
    stream_ << text;
    stream_.flush();
    current_size_ += static_cast<std::uintmax_t>(text.size());
  }
}

void Logger::RotateLocked() {
  if (path_.empty() || max_bytes_ == 0 || max_files_ == 0) {
    return;
  }
  stream_.close();
  // debug.log.(n-1) -> debug.log.n, oldest falls off the end.
  for (std::size_t i = max_files_; i > 0; --i) {
    const auto rotated = std::filesystem::path(path_).concat("." + std::to_string(i));
    const auto previous = (i == 1)
                              ? std::filesystem::path(path_)
                              : std::filesystem::path(path_).concat("." + std::to_string(i - 1));
    std::error_code ec;
    if (std::filesystem::exists(previous, ec)) {
      std::filesystem::rename(previous, rotated, ec);
    }
  }
  stream_.open(path_, std::ios::trunc);
  current_size_ = 0;
}

Logger& GlobalLogger() {
  static Logger logger;
  return logger;
}

}  // namespace dappvault::util

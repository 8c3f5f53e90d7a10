#include "util/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace veil::util {

namespace {

struct LevelNames {
  LogLevel level;
  const char* upper;
  const char* lower;
};

constexpr std::array<LevelNames, 4> kLevels = {{
    {LogLevel::kDebug, "DEBUG", "debug"},
    {LogLevel::kInfo, "INFO", "info"},
    {LogLevel::kWarn, "WARN", "warn"},
    {LogLevel::kError, "ERROR", "error"},
}};

const LevelNames* FindLevel(LogLevel level) {
  for (const auto& entry : kLevels) {
    if (entry.level == level) return &entry;
  }
  return nullptr;
}

bool AtLeast(LogLevel level, LogLevel threshold) {
  return static_cast<int>(level) >= static_cast<int>(threshold);
}

// UTC, millisecond precision: 2024-05-01T12:00:00.123Z
std::string UtcTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch()).count() % 1000;
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  std::tm parts{};
#ifdef _WIN32
  gmtime_s(&parts, &seconds);
#else
  gmtime_r(&seconds, &parts);
#endif
  char buf[32];
  const auto len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &parts);
  char out[40];
  std::snprintf(out, sizeof(out), "%.*s.%03dZ", static_cast<int>(len), buf,
                static_cast<int>(millis));
  return out;
}

std::filesystem::path Generation(const std::string& base, std::size_t n) {
  if (n == 0) return base;
  return std::filesystem::path(base + "." + std::to_string(n));
}

}  // namespace

const char* LogLevelName(LogLevel level) {
  const auto* entry = FindLevel(level);
  return entry ? entry->upper : "UNKNOWN";
}

LogLevel ParseLogLevelString(const std::string& value) {
  std::string key(value);
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (key == "warning") key = "warn";
  for (const auto& entry : kLevels) {
    if (key == entry.lower) return entry.level;
  }
  throw std::runtime_error("invalid log level: " + value);
}

void Logger::EnableFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  stream_.close();
  std::error_code ec;
  const auto dir = std::filesystem::path(path).parent_path();
  if (!dir.empty()) {
    std::filesystem::create_directories(dir, ec);
  }
  stream_.clear();
  stream_.open(path, std::ios::app);
  if (!stream_) {
    path_.clear();
    throw std::runtime_error("failed to open debug log: " + path);
  }
  path_ = path;
  const auto existing = std::filesystem::file_size(path, ec);
  current_size_ = ec ? 0 : existing;
  const std::string banner = "==== log opened " + UtcTimestamp() + " ====\n";
  stream_ << banner << std::flush;
  current_size_ += banner.size();
}

void Logger::DisableFile() {
  std::lock_guard<std::mutex> lock(mutex_);
  stream_.close();
  path_.clear();
}

void Logger::Configure(LogLevel level, std::uintmax_t max_bytes, std::size_t max_files) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_threshold_ = level;
  max_bytes_ = max_bytes;
  max_files_ = max_files;
}

void Logger::SetStderrThreshold(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  stderr_threshold_ = level;
}

bool Logger::ShouldLog(LogLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return AtLeast(level, level_threshold_) || AtLeast(level, stderr_threshold_);
}

void Logger::Log(LogLevel level, std::string_view component, const std::string& message) {
  CaptureFn capture;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (AtLeast(level, stderr_threshold_)) {
      const auto* entry = FindLevel(level);
      std::cerr << '[' << component << "] " << (entry ? entry->lower : "log") << ": " << message
                << '\n';
    }
    if (!AtLeast(level, level_threshold_)) {
      return;
    }
    capture = capture_;
    if (stream_.is_open()) {
      if (max_bytes_ != 0 && current_size_ >= max_bytes_) {
        RotateLocked();
      }
      std::string line;
      line.reserve(message.size() + component.size() + 48);
      line.append("[").append(UtcTimestamp()).append("] [").append(LogLevelName(level));
      line.append("] [").append(component).append("] ").append(message).push_back('\n');
      stream_ << line << std::flush;
      current_size_ += line.size();
    }
  }
  if (capture) {
    capture(level, component, message);
  }
}

bool Logger::FileEnabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stream_.is_open();
}

void Logger::SetCaptureForTest(CaptureFn capture) {
  std::lock_guard<std::mutex> lock(mutex_);
  capture_ = std::move(capture);
}

// Shifts debug.log.N-1 to debug.log.N, the oldest falling off, then reopens
// an empty live file.
void Logger::RotateLocked() {
  if (path_.empty() || max_files_ == 0) {
    return;
  }
  stream_.close();
  std::error_code ec;
  std::filesystem::remove(Generation(path_, max_files_), ec);
  for (std::size_t n = max_files_; n > 0; --n) {
    const auto from = Generation(path_, n - 1);
    if (std::filesystem::exists(from, ec)) {
      std::filesystem::rename(from, Generation(path_, n), ec);
    }
  }
  stream_.clear();
  stream_.open(path_, std::ios::trunc);
  current_size_ = 0;
}

Logger& GetLogger() {
  static Logger logger;
  return logger;
}

void LogDebug(std::string_view component, const std::string& message) {
  GetLogger().Log(LogLevel::kDebug, component, message);
}

void LogInfo(std::string_view component, const std::string& message) {
  GetLogger().Log(LogLevel::kInfo, component, message);
}

void LogWarn(std::string_view component, const std::string& message) {
  GetLogger().Log(LogLevel::kWarn, component, message);
}

void LogError(std::string_view component, const std::string& message) {
  GetLogger().Log(LogLevel::kError, component, message);
}

}  // namespace veil::util

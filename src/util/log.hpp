#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace veil::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);
// Throws std::runtime_error on an unknown level name.
LogLevel ParseLogLevelString(const std::string& value);

// Process-wide logger. Lines go to an optional rotating file
// ("[timestamp] [LEVEL] [component] message"); warnings and errors are also
// echoed to stderr as "[component] warn: message".
class Logger {
 public:
  using CaptureFn =
      std::function<void(LogLevel level, std::string_view component, const std::string& message)>;

  // Throws std::runtime_error when the file cannot be opened.
  void EnableFile(const std::string& path);
  void DisableFile();
  void Configure(LogLevel level, std::uintmax_t max_bytes, std::size_t max_files);
  void SetStderrThreshold(LogLevel level);

  void Log(LogLevel level, std::string_view component, const std::string& message);

  bool FileEnabled() const;
  bool ShouldLog(LogLevel level) const;

  // Test-only hook: observe every line that passes the level threshold.
  void SetCaptureForTest(CaptureFn capture);

 private:
  void RotateLocked();

  mutable std::mutex mutex_;
  std::ofstream stream_;
  std::string path_;
  LogLevel level_threshold_{LogLevel::kInfo};
  LogLevel stderr_threshold_{LogLevel::kWarn};
  std::uintmax_t max_bytes_{0};
  std::size_t max_files_{0};
  std::uintmax_t current_size_{0};
  CaptureFn capture_;
};

Logger& GetLogger();

void LogDebug(std::string_view component, const std::string& message);
void LogInfo(std::string_view component, const std::string& message);
void LogWarn(std::string_view component, const std::string& message);
void LogError(std::string_view component, const std::string& message);

}  // namespace veil::util

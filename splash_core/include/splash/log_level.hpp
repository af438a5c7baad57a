#pragma once
#include <cstdint>
#include <string_view>

namespace splash
{

enum class LogLevel : uint8_t
{
  Trace = 0,
  Debug = 1,
  Info = 2,
  Warn = 3,
  Error = 4,
  Fatal = 5,
  Off = 6
};

constexpr std::string_view ToString(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Trace:
      return "TRACE";
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Fatal:
      return "FATAL";
    case LogLevel::Off:
      return "OFF";
  }
  return "UNKNOWN";
}

constexpr char ToShortChar(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Trace:
      return 'T';
    case LogLevel::Debug:
      return 'D';
    case LogLevel::Info:
      return 'I';
    case LogLevel::Warn:
      return 'W';
    case LogLevel::Error:
      return 'E';
    case LogLevel::Fatal:
      return 'F';
    case LogLevel::Off:
      return 'O';
  }
  return '?';
}

// Accepts "trace", "WARN", "warning", ... Returns false for anything else.
bool ParseLogLevel(std::string_view text, LogLevel& out);

// 编译期最低活跃级别（通过 CMake -DSPLASH_LOG_ACTIVE_LEVEL=2 注入）
#ifndef SPLASH_LOG_ACTIVE_LEVEL
#ifdef NDEBUG
#define SPLASH_LOG_ACTIVE_LEVEL 1  // Debug
#else
#define SPLASH_LOG_ACTIVE_LEVEL 0  // Trace
#endif
#endif

}  // namespace splash

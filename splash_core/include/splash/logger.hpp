#pragma once
#include <atomic>
#include <cstdio>  // snprintf fallback
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

#include "log_level.hpp"
#include "platform.hpp"
#include "source_location.hpp"

#ifdef SPLASH_LOG_USE_FMTLIB
#include <fmt/printf.h>
#endif

namespace splash
{

// Process-wide diagnostic logger. Records are formatted on the calling thread
// and handed to the writer synchronously; the default writer is stderr so that
// diagnostics never interleave with rendered output on stdout.
class Logger
{
 public:
  // Receives one complete record, without trailing newline.
  using Writer = std::function<void(LogLevel, std::string_view)>;

  static Logger& Instance();

  void SetLevel(LogLevel level);
  LogLevel Level() const;

  void SetWriter(Writer writer);
  void ResetWriter();

  uint64_t RecordCount() const;

  // Core log method, defined in header
  template <typename... Args>
  void LogImpl(LogLevel level, const SourceLocation& loc, const char* format, Args&&... args);

 private:
  Logger() = default;

  void Emit(LogLevel level, const SourceLocation& loc, std::string_view msg);

  std::atomic<LogLevel> level_{LogLevel::Warn};
  std::atomic<uint64_t> record_count_{0};
  std::mutex writer_mutex_;
  Writer writer_;
};

// ===== LogImpl template implementation =====

template <typename... Args>
void Logger::LogImpl(LogLevel level, const SourceLocation& loc, const char* format,
                     Args&&... args)
{
#ifdef SPLASH_LOG_USE_FMTLIB
  std::string formatted = fmt::sprintf(format, std::forward<Args>(args)...);
  std::string_view msg = formatted;
  if (msg.size() > SPLASH_LOG_MAX_MSG_LEN - 1)
  {
    msg = msg.substr(0, SPLASH_LOG_MAX_MSG_LEN - 1);
  }
  Emit(level, loc, msg);
#else
  char msg[SPLASH_LOG_MAX_MSG_LEN];
  int written = std::snprintf(msg, sizeof(msg), format, args...);
  size_t len = 0;
  if (written > 0)
  {
    len = static_cast<size_t>(written) < sizeof(msg) ? static_cast<size_t>(written)
                                                      : sizeof(msg) - 1;
  }
  Emit(level, loc, std::string_view(msg, len));
#endif
}

}  // namespace splash

// ===== Logging macros =====

#define SPLASH_LOG_CALL(lvl, fmt_str, ...)                                         \
  do                                                                               \
  {                                                                                \
    constexpr auto _splash_lvl = ::splash::LogLevel::lvl;                          \
    if (static_cast<int>(_splash_lvl) >= SPLASH_LOG_ACTIVE_LEVEL)                  \
    {                                                                              \
      auto& _splash_logger = ::splash::Logger::Instance();                         \
      if (_splash_lvl >= _splash_logger.Level())                                   \
      {                                                                            \
        _splash_logger.LogImpl(_splash_lvl, SPLASH_CURRENT_LOCATION(), fmt_str,    \
                               ##__VA_ARGS__);                                     \
      }                                                                            \
    }                                                                              \
  } while (0)

#define LOG_TRACE(fmt, ...) SPLASH_LOG_CALL(Trace, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) SPLASH_LOG_CALL(Debug, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) SPLASH_LOG_CALL(Info, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) SPLASH_LOG_CALL(Warn, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) SPLASH_LOG_CALL(Error, fmt, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) SPLASH_LOG_CALL(Fatal, fmt, ##__VA_ARGS__)

// Conditional logging
#define LOG_WARN_IF(cond, fmt, ...) \
  do                                \
  {                                 \
    if (cond) LOG_WARN(fmt, ##__VA_ARGS__); \
  } while (0)

#define LOG_ONCE(lvl, fmt, ...)                                  \
  do                                                             \
  {                                                              \
    static std::atomic<bool> _splash_logged{false};              \
    if (!_splash_logged.exchange(true, std::memory_order_relaxed)) \
    {                                                            \
      SPLASH_LOG_CALL(lvl, fmt, ##__VA_ARGS__);                  \
    }                                                            \
  } while (0)

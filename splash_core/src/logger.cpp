#include "splash/logger.hpp"

#include <cctype>
#include <cstdio>
#include <string>

namespace splash
{

bool ParseLogLevel(std::string_view text, LogLevel& out)
{
  std::string lower;
  lower.reserve(text.size());
  for (char c : text)
  {
    lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  if (lower == "trace")
  {
    out = LogLevel::Trace;
  }
  else if (lower == "debug")
  {
    out = LogLevel::Debug;
  }
  else if (lower == "info")
  {
    out = LogLevel::Info;
  }
  else if (lower == "warn" || lower == "warning")
  {
    out = LogLevel::Warn;
  }
  else if (lower == "error")
  {
    out = LogLevel::Error;
  }
  else if (lower == "fatal")
  {
    out = LogLevel::Fatal;
  }
  else if (lower == "off")
  {
    out = LogLevel::Off;
  }
  else
  {
    return false;
  }
  return true;
}

Logger& Logger::Instance()
{
  static Logger inst;
  return inst;
}

void Logger::SetLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }

LogLevel Logger::Level() const { return level_.load(std::memory_order_relaxed); }

void Logger::SetWriter(Writer writer)
{
  std::lock_guard<std::mutex> lock(writer_mutex_);
  writer_ = std::move(writer);
}

void Logger::ResetWriter()
{
  std::lock_guard<std::mutex> lock(writer_mutex_);
  writer_ = nullptr;
}

uint64_t Logger::RecordCount() const { return record_count_.load(std::memory_order_relaxed); }

void Logger::Emit(LogLevel level, const SourceLocation& loc, std::string_view msg)
{
  std::string record;
  record.reserve(msg.size() + 64);
  record += "splash: [";
  record += ToString(level);
  record += "] ";
  if (loc.file_name)
  {
    record += loc.file_name;
    record += ':';
    record += std::to_string(loc.line);
    record += ' ';
  }
  record += msg;

  record_count_.fetch_add(1, std::memory_order_relaxed);

  std::lock_guard<std::mutex> lock(writer_mutex_);
  if (writer_)
  {
    writer_(level, record);
    return;
  }
  record += '\n';
  std::fwrite(record.data(), 1, record.size(), stderr);
}

}  // namespace splash

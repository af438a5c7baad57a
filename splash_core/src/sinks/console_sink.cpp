#include "splash/sinks/console_sink.hpp"

#include "splash/platform.hpp"

#if defined(SPLASH_PLATFORM_POSIX)
#include <unistd.h>
#elif defined(SPLASH_PLATFORM_WINDOWS)
#include <io.h>
#define isatty _isatty
#define STDOUT_FILENO 1
#endif

namespace splash
{

bool ShouldUseColor(std::optional<bool> force_color)
{
  if (force_color.has_value())
  {
    return force_color.value();
  }
  return ::isatty(STDOUT_FILENO) != 0;
}

ConsoleSink::ConsoleSink(std::FILE* target, bool flush_each_line)
    : target_(target), flush_each_line_(flush_each_line)
{
}

void ConsoleSink::Write(std::string_view line)
{
  std::fwrite(line.data(), 1, line.size(), target_);
  std::fwrite("\n", 1, 1, target_);
  if (flush_each_line_)
  {
    std::fflush(target_);
  }
}

void ConsoleSink::Flush() { std::fflush(target_); }

}  // namespace splash

#pragma once
#include <cstdint>

namespace splash
{

struct SourceLocation
{
  const char* file_name;
  const char* function_name;
  uint32_t line;

  static constexpr const char* ExtractFilename(const char* path)
  {
    const char* name = path;
    for (const char* p = path; *p != '\0'; ++p)
    {
      if (*p == '/' || *p == '\\') name = p + 1;
    }
    return name;
  }
};

#define SPLASH_CURRENT_LOCATION()                                                    \
  ::splash::SourceLocation                                                           \
  {                                                                                  \
    ::splash::SourceLocation::ExtractFilename(__FILE__), __func__,                   \
        static_cast<uint32_t>(__LINE__)                                              \
  }

}  // namespace splash

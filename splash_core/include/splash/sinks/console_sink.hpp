#pragma once
#include <cstdio>
#include <optional>

#include "sink_interface.hpp"

namespace splash
{

// True when color output should be produced for stdout: the forced value if
// given, otherwise whether stdout is a terminal.
bool ShouldUseColor(std::optional<bool> force_color);

class ConsoleSink : public ILineSink
{
 public:
  explicit ConsoleSink(std::FILE* target = stdout, bool flush_each_line = true);

  void Write(std::string_view line) override;
  void Flush() override;

 private:
  std::FILE* target_;
  bool flush_each_line_;
};

}  // namespace splash

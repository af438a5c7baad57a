#pragma once
#include <cstddef>
#include <string>

#include "../style.hpp"

namespace splash
{

class IFormatter
{
 public:
  virtual ~IFormatter() = default;
  // Appends the rendered line to out, returns the number of bytes appended.
  virtual size_t Format(const HighlightedLine& line, std::string& out) const = 0;
};

}  // namespace splash

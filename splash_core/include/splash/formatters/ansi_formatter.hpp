#pragma once
#include <string_view>

#include "formatter_interface.hpp"

namespace splash
{

// Renders each styled segment as "ESC[<codes>m<text>ESC[0m". With color off
// the segments are concatenated verbatim, so output is the plain text.
class AnsiFormatter : public IFormatter
{
 public:
  explicit AnsiFormatter(bool enable_color = true);

  size_t Format(const HighlightedLine& line, std::string& out) const override;

  bool ColorEnabled() const { return enable_color_; }

  // SGR parameter list for a style, empty for Style::Plain.
  static std::string_view SgrCodes(Style style);

 private:
  bool enable_color_;
};

}  // namespace splash

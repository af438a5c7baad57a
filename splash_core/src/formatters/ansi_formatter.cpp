#include "splash/formatters/ansi_formatter.hpp"

namespace splash
{

AnsiFormatter::AnsiFormatter(bool enable_color) : enable_color_(enable_color) {}

std::string_view AnsiFormatter::SgrCodes(Style style)
{
  switch (style)
  {
    case Style::Plain:
      return "";
    case Style::Client:
      return "91";
    case Style::UserIdentifier:
      return "37";
    case Style::UserId:
      return "1;37";
    case Style::DateTime:
      return "95";
    case Style::Method:
      return "96";
    case Style::Request:
    case Style::Protocol:
      return "36";
    case Style::Status:
      return "93";
    case Style::Size:
      return "92";
    case Style::Number:
      return "34";
    case Style::IpAddress:
      return "31;47";
    case Style::HttpVerb:
      return "92";
    case Style::Quote:
      return "96";
    case Style::Bracket:
      return "92";
  }
  return "";
}

size_t AnsiFormatter::Format(const HighlightedLine& line, std::string& out) const
{
  const size_t start = out.size();

  for (const auto& seg : line.Segments())
  {
    std::string_view codes = enable_color_ ? SgrCodes(seg.style) : std::string_view{};
    if (codes.empty())
    {
      out += seg.text;
      continue;
    }
    out += "\033[";
    out += codes;
    out += 'm';
    out += seg.text;
    out += "\033[0m";
  }

  return out.size() - start;
}

}  // namespace splash

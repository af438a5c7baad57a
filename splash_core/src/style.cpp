#include "splash/style.hpp"

namespace splash
{

std::string_view ToString(Style style)
{
  switch (style)
  {
    case Style::Plain:
      return "plain";
    case Style::Client:
      return "client";
    case Style::UserIdentifier:
      return "user_identifier";
    case Style::UserId:
      return "userid";
    case Style::DateTime:
      return "datetime";
    case Style::Method:
      return "method";
    case Style::Request:
      return "request";
    case Style::Protocol:
      return "protocol";
    case Style::Status:
      return "status";
    case Style::Size:
      return "size";
    case Style::Number:
      return "number";
    case Style::IpAddress:
      return "ip_address";
    case Style::HttpVerb:
      return "http_verb";
    case Style::Quote:
      return "quote";
    case Style::Bracket:
      return "bracket";
  }
  return "unknown";
}

void HighlightedLine::Append(Style style, std::string_view text)
{
  if (text.empty())
  {
    return;
  }
  if (style == Style::Plain && !segments_.empty() && segments_.back().style == Style::Plain)
  {
    segments_.back().text.append(text.data(), text.size());
    return;
  }
  segments_.push_back({style, std::string(text)});
}

void HighlightedLine::Append(const HighlightedLine& other)
{
  for (const auto& seg : other.segments_)
  {
    Append(seg.style, seg.text);
  }
}

std::string HighlightedLine::PlainText() const
{
  std::string out;
  for (const auto& seg : segments_)
  {
    out += seg.text;
  }
  return out;
}

}  // namespace splash

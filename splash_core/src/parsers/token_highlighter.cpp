#include "splash/parsers/token_highlighter.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace splash
{

namespace
{

constexpr const char* kIpAddressPattern = R"(\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3})";
constexpr const char* kHttpVerbPattern = "GET|POST";

bool IsSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

bool IsAllDigits(std::string_view token)
{
  return !token.empty() && std::all_of(token.begin(), token.end(), [](char c)
                                       { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

std::vector<std::string_view> SplitWhitespace(std::string_view line)
{
  std::vector<std::string_view> tokens;
  size_t i = 0;
  while (i < line.size())
  {
    while (i < line.size() && IsSpace(line[i])) ++i;
    size_t start = i;
    while (i < line.size() && !IsSpace(line[i])) ++i;
    if (i > start)
    {
      tokens.push_back(line.substr(start, i - start));
    }
  }
  return tokens;
}

std::string_view View(const std::csub_match& m)
{
  return std::string_view(m.first, static_cast<size_t>(m.length()));
}

}  // namespace

HighlightRules::HighlightRules(const std::string& ip_address, const std::string& http_verb,
                               std::string quote_chars, std::string bracket_chars)
    : ip_address_(ip_address, std::regex::ECMAScript | std::regex::optimize),
      http_verb_(http_verb, std::regex::ECMAScript | std::regex::optimize),
      quote_chars_(std::move(quote_chars)),
      bracket_chars_(std::move(bracket_chars))
{
}

HighlightRules HighlightRules::Default()
{
  return HighlightRules(kIpAddressPattern, kHttpVerbPattern, "\"", "[]");
}

TokenHighlighter::TokenHighlighter(const HighlightRules& rules) : rules_(rules) {}

HighlightedLine TokenHighlighter::Highlight(std::string_view line) const
{
  HighlightedLine out;
  bool first = true;
  for (std::string_view token : SplitWhitespace(line))
  {
    if (!first)
    {
      out.Append(Style::Plain, " ");
    }
    first = false;

    const HighlightedLine classified = ClassifyToken(token);
    for (const auto& seg : classified.Segments())
    {
      if (seg.style == Style::Plain)
      {
        AppendWithCharStyles(out, seg.text);
      }
      else
      {
        out.Append(seg.style, seg.text);
      }
    }
  }
  return out;
}

HighlightedLine TokenHighlighter::ClassifyToken(std::string_view token) const
{
  HighlightedLine out;
  const char* begin = token.data();
  const char* end = token.data() + token.size();

  if (IsAllDigits(token))
  {
    out.Append(Style::Number, token);
    return out;
  }

  std::cmatch m;
  if (std::regex_search(begin, end, m, rules_.IpAddress()))
  {
    out.Append(Style::Plain, View(m.prefix()));
    out.Append(Style::IpAddress, View(m[0]));
    out.Append(Style::Plain, View(m.suffix()));
    return out;
  }

  // The verb nearest the end of the token wins.
  const char* verb_begin = nullptr;
  const char* verb_end = nullptr;
  for (std::cregex_iterator it(begin, end, rules_.HttpVerb()), last; it != last; ++it)
  {
    if ((*it)[0].length() > 0)
    {
      verb_begin = (*it)[0].first;
      verb_end = (*it)[0].second;
    }
  }
  if (verb_begin != nullptr)
  {
    out.Append(Style::Plain, std::string_view(begin, static_cast<size_t>(verb_begin - begin)));
    out.Append(Style::HttpVerb,
               std::string_view(verb_begin, static_cast<size_t>(verb_end - verb_begin)));
    out.Append(Style::Plain, std::string_view(verb_end, static_cast<size_t>(end - verb_end)));
    return out;
  }

  out.Append(Style::Plain, token);
  return out;
}

void TokenHighlighter::AppendWithCharStyles(HighlightedLine& out, std::string_view text) const
{
  size_t run_start = 0;
  for (size_t i = 0; i < text.size(); ++i)
  {
    const char c = text[i];
    Style style = Style::Plain;
    if (rules_.IsQuote(c))
    {
      style = Style::Quote;
    }
    else if (rules_.IsBracket(c))
    {
      style = Style::Bracket;
    }
    if (style == Style::Plain)
    {
      continue;
    }

    out.Append(Style::Plain, text.substr(run_start, i - run_start));
    out.Append(style, text.substr(i, 1));
    run_start = i + 1;
  }
  out.Append(Style::Plain, text.substr(run_start));
}

}  // namespace splash

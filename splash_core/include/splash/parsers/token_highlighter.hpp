#pragma once
#include <regex>
#include <string>
#include <string_view>

#include "../style.hpp"

namespace splash
{

// The matching rules of the ad-hoc highlighter. Built once at startup and
// shared read-only by every highlighter.
//
// Both patterns are searched inside a token and should describe only the
// styled text, with no leading or trailing ".*".
class HighlightRules
{
 public:
  // ip_address: first match in the token is styled
  // http_verb:  last match in the token is styled
  HighlightRules(const std::string& ip_address, const std::string& http_verb,
                 std::string quote_chars, std::string bracket_chars);

  // A dotted quad of 1-3 digit groups, GET|POST, '"' and '[' ']'.
  static HighlightRules Default();

  const std::regex& IpAddress() const { return ip_address_; }
  const std::regex& HttpVerb() const { return http_verb_; }

  bool IsQuote(char c) const { return quote_chars_.find(c) != std::string::npos; }
  bool IsBracket(char c) const { return bracket_chars_.find(c) != std::string::npos; }

 private:
  std::regex ip_address_;
  std::regex http_verb_;
  std::string quote_chars_;
  std::string bracket_chars_;
};

// Highlights free-form lines token by token. Each whitespace-separated token
// is classified on its raw text (first rule wins: all digits, embedded dotted
// quad, last embedded GET/POST, nothing); quotes and brackets in the parts the
// classification left plain are then styled character by character. Tokens
// are re-joined with single spaces.
class TokenHighlighter
{
 public:
  explicit TokenHighlighter(const HighlightRules& rules);

  HighlightedLine Highlight(std::string_view line) const;

  HighlightedLine ClassifyToken(std::string_view token) const;

 private:
  void AppendWithCharStyles(HighlightedLine& out, std::string_view text) const;

  const HighlightRules& rules_;
};

}  // namespace splash

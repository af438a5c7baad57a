#include "splash/parsers/clf_parser.hpp"

#include <cctype>

namespace splash
{

namespace
{

// Single-character classes of the grammar, in the "C" locale.
bool IsSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
bool IsDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
bool IsUpper(char c) { return c >= 'A' && c <= 'Z'; }
bool IsLineBreak(char c) { return c == '\n' || c == '\r'; }

// Scans one field at a time over [pos_, end). Every Take* either consumes its
// field and returns true, or returns false with the position unspecified.
class FieldScanner
{
 public:
  FieldScanner(std::string_view line, size_t pos) : line_(line), pos_(pos) {}

  size_t Pos() const { return pos_; }

  bool TakeSpace()
  {
    if (pos_ < line_.size() && IsSpace(line_[pos_]))
    {
      ++pos_;
      return true;
    }
    return false;
  }

  bool TakeChar(char c)
  {
    if (pos_ < line_.size() && line_[pos_] == c)
    {
      ++pos_;
      return true;
    }
    return false;
  }

  // 1-3 digits; the run must not continue with a fourth digit.
  bool TakeOctet()
  {
    size_t n = 0;
    while (pos_ + n < line_.size() && IsDigit(line_[pos_ + n]) && n < 4) ++n;
    if (n == 0 || n > 3)
    {
      return false;
    }
    pos_ += n;
    return true;
  }

  bool TakeQuad(std::string_view& out)
  {
    const size_t start = pos_;
    for (int i = 0; i < 4; ++i)
    {
      if (i > 0 && !TakeChar('.'))
      {
        return false;
      }
      if (!TakeOctet())
      {
        return false;
      }
    }
    out = line_.substr(start, pos_ - start);
    return true;
  }

  // Maximal run of non-whitespace, at least one character.
  bool TakeToken(std::string_view& out)
  {
    const size_t start = pos_;
    while (pos_ < line_.size() && !IsSpace(line_[pos_])) ++pos_;
    out = line_.substr(start, pos_ - start);
    return pos_ > start;
  }

  bool TakeUpper(std::string_view& out)
  {
    const size_t start = pos_;
    while (pos_ < line_.size() && IsUpper(line_[pos_])) ++pos_;
    out = line_.substr(start, pos_ - start);
    return pos_ > start;
  }

  // Exactly three digits.
  bool TakeStatus(std::string_view& out)
  {
    if (pos_ + 3 > line_.size())
    {
      return false;
    }
    for (size_t i = 0; i < 3; ++i)
    {
      if (!IsDigit(line_[pos_ + i]))
      {
        return false;
      }
    }
    out = line_.substr(pos_, 3);
    pos_ += 3;
    return true;
  }

  // Digits, or a single '-'.
  bool TakeSize(std::string_view& out)
  {
    const size_t start = pos_;
    while (pos_ < line_.size() && IsDigit(line_[pos_])) ++pos_;
    if (pos_ == start && !TakeChar('-'))
    {
      return false;
    }
    out = line_.substr(start, pos_ - start);
    return true;
  }

  // Protocol token directly followed by the closing '"': the non-whitespace
  // run has to end in '"' and hold at least one character before it.
  bool TakeQuotedTail(std::string_view& out)
  {
    std::string_view run;
    if (!TakeToken(run) || run.size() < 2 || run.back() != '"')
    {
      return false;
    }
    out = run.substr(0, run.size() - 1);
    return true;
  }

 private:
  std::string_view line_;
  size_t pos_;
};

// Everything after the datetime field: "METHOD REQUEST PROTOCOL" STATUS SIZE.
bool MatchRequestTail(std::string_view line, size_t pos, ClfRecord& rec, size_t& end)
{
  FieldScanner s(line, pos);
  if (!s.TakeSpace() || !s.TakeChar('"') || !s.TakeUpper(rec.method) || !s.TakeSpace() ||
      !s.TakeToken(rec.request) || !s.TakeSpace() || !s.TakeQuotedTail(rec.protocol) ||
      !s.TakeSpace() || !s.TakeStatus(rec.status) || !s.TakeSpace() || !s.TakeSize(rec.size))
  {
    return false;
  }
  end = s.Pos();
  return true;
}

// One entry starting exactly at `start`. The datetime is the shortest
// bracketed run for which the rest of the entry still matches.
bool MatchAt(std::string_view line, size_t start, ClfRecord& rec, size_t& end)
{
  FieldScanner s(line, start);
  if (!s.TakeQuad(rec.client) || !s.TakeSpace() || !s.TakeToken(rec.user_identifier) ||
      !s.TakeSpace() || !s.TakeToken(rec.userid) || !s.TakeSpace() || !s.TakeChar('['))
  {
    return false;
  }

  const size_t open = s.Pos() - 1;
  for (size_t i = s.Pos(); i < line.size() && !IsLineBreak(line[i]); ++i)
  {
    if (line[i] != ']')
    {
      continue;
    }
    if (MatchRequestTail(line, i + 1, rec, end))
    {
      rec.datetime = line.substr(open, i + 1 - open);
      return true;
    }
  }
  return false;
}

}  // namespace

std::vector<ClfRecord> ClfParser::Parse(std::string_view line) const
{
  std::vector<ClfRecord> records;

  size_t pos = 0;
  while (pos < line.size())
  {
    ClfRecord rec;
    size_t end = 0;
    if (IsDigit(line[pos]) && MatchAt(line, pos, rec, end))
    {
      records.push_back(rec);
      pos = end;
    }
    else
    {
      ++pos;
    }
  }

  return records;
}

HighlightedLine ClfParser::Render(const ClfRecord& record)
{
  HighlightedLine out;
  out.Append(Style::Client, record.client);
  out.Append(Style::Plain, " ");
  out.Append(Style::UserIdentifier, record.user_identifier);
  out.Append(Style::Plain, " ");
  out.Append(Style::UserId, record.userid);
  out.Append(Style::Plain, " ");
  out.Append(Style::DateTime, record.datetime);
  out.Append(Style::Plain, " \"");
  out.Append(Style::Method, record.method);
  out.Append(Style::Plain, " ");
  out.Append(Style::Request, record.request);
  out.Append(Style::Plain, " ");
  out.Append(Style::Protocol, record.protocol);
  out.Append(Style::Plain, "\" ");
  out.Append(Style::Status, record.status);
  out.Append(Style::Plain, " ");
  out.Append(Style::Size, record.size);
  return out;
}

}  // namespace splash

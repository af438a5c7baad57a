#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace splash
{

// Semantic emphasis of a piece of rendered text. Formatters decide how each
// style looks; parsers only say what a piece of text is.
enum class Style : uint8_t
{
  Plain,
  // access-log fields
  Client,
  UserIdentifier,
  UserId,
  DateTime,
  Method,
  Request,
  Protocol,
  Status,
  Size,
  // ad-hoc tokens
  Number,
  IpAddress,
  HttpVerb,
  Quote,
  Bracket
};

std::string_view ToString(Style style);

struct StyledSegment
{
  Style style;
  std::string text;
};

class HighlightedLine
{
 public:
  // Adjacent Plain text is merged into one segment; empty text is ignored.
  void Append(Style style, std::string_view text);
  void Append(const HighlightedLine& other);

  const std::vector<StyledSegment>& Segments() const { return segments_; }

  // The underlying characters, without any styling.
  std::string PlainText() const;

  bool Empty() const { return segments_.empty(); }
  void Clear() { segments_.clear(); }

 private:
  std::vector<StyledSegment> segments_;
};

}  // namespace splash

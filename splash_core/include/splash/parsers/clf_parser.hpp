#pragma once
#include <string_view>
#include <vector>

#include "../style.hpp"

namespace splash
{

// One Common Log Format entry. Every field is a view into the parsed line and
// must not outlive it.
struct ClfRecord
{
  std::string_view client;
  std::string_view user_identifier;
  std::string_view userid;
  std::string_view datetime;  // brackets included
  std::string_view method;
  std::string_view request;
  std::string_view protocol;
  std::string_view status;
  std::string_view size;
};

// Extracts access-log entries of the form
//   127.0.0.1 - frank [10/Oct/2000:13:55:36 -0700] "GET /a.gif HTTP/1.0" 200 2326
// The grammar is searched, not anchored: every non-overlapping match on the
// line is returned, and a line without any match yields nothing. Fields are
// scanned iteratively; stack use does not grow with line length.
class ClfParser
{
 public:
  std::vector<ClfRecord> Parse(std::string_view line) const;

  // client user_identifier userid datetime "method request protocol" status size
  static HighlightedLine Render(const ClfRecord& record);
};

}  // namespace splash

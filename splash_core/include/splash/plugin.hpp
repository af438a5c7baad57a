#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace splash
{

struct PluginVersion
{
  uint32_t major = 0;
  uint32_t minor = 0;
  uint32_t patch = 0;

  // Same major, and not older than required within that major.
  bool IsCompatibleWith(const PluginVersion& required) const;

  // "major.minor.patch"
  std::string ToString() const;

  bool operator==(const PluginVersion& other) const
  {
    return major == other.major && minor == other.minor && patch == other.patch;
  }
  bool operator!=(const PluginVersion& other) const { return !(*this == other); }
};

// Parses "1.2.3"; all three parts are required.
bool ParsePluginVersion(std::string_view text, PluginVersion& out);

struct PluginMetadata
{
  std::string name;
  PluginVersion version;
  std::string description;
  std::string author;
};

// ===== ParseLine 的结果 =====

struct Parsed
{
  std::string text;  // rendered, possibly several lines joined by '\n'
};

struct NoMatch
{
};

struct ParseError
{
  std::string message;
};

using ParseResult = std::variant<Parsed, NoMatch, ParseError>;

// A line format. Built-in parsers and third-party formats implement the same
// interface; instances are immutable once constructed and shared between the
// registry and whoever resolved them, so every method is const.
class IFormatPlugin
{
 public:
  virtual ~IFormatPlugin() = default;

  virtual const PluginMetadata& Metadata() const = 0;

  const std::string& Name() const { return Metadata().name; }
  const PluginVersion& Version() const { return Metadata().version; }

  virtual ParseResult ParseLine(std::string_view line) const = 0;

  // Default: ParseLine yields Parsed.
  virtual bool CanParse(std::string_view line) const;

  // Fraction of samples this plugin can parse, in [0.0, 1.0]. 0.0 when empty.
  virtual double DetectFormat(const std::vector<std::string_view>& samples) const;
};

}  // namespace splash

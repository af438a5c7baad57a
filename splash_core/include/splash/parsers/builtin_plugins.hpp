#pragma once
#include <memory>

#include "../formatters/ansi_formatter.hpp"
#include "../plugin.hpp"
#include "../plugin_registry.hpp"
#include "clf_parser.hpp"
#include "token_highlighter.hpp"

namespace splash
{

constexpr const char* kClfPluginName = "clf";
constexpr const char* kAdHocPluginName = "ad-hoc";

// Common Log Format. NoMatch for lines without an access-log entry; several
// entries on one line are rendered as several lines joined by '\n'.
class ClfPlugin : public IFormatPlugin
{
 public:
  explicit ClfPlugin(bool enable_color = true);

  const PluginMetadata& Metadata() const override { return metadata_; }
  ParseResult ParseLine(std::string_view line) const override;

  // Cheaper than ParseLine: no rendering.
  bool CanParse(std::string_view line) const override;

 private:
  PluginMetadata metadata_;
  ClfParser parser_;
  AnsiFormatter formatter_;
};

// Free-form token highlighting. Accepts every line that has a token.
class AdHocPlugin : public IFormatPlugin
{
 public:
  AdHocPlugin(std::shared_ptr<const HighlightRules> rules, bool enable_color = true);

  const PluginMetadata& Metadata() const override { return metadata_; }
  ParseResult ParseLine(std::string_view line) const override;

 private:
  PluginMetadata metadata_;
  std::shared_ptr<const HighlightRules> rules_;
  TokenHighlighter highlighter_;
  AnsiFormatter formatter_;
};

// Registers "clf" and "ad-hoc". Fails on the first registration error.
RegistryStatus RegisterBuiltinPlugins(PluginRegistry& registry,
                                      std::shared_ptr<const HighlightRules> rules,
                                      bool enable_color);

}  // namespace splash

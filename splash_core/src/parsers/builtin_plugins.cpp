#include "splash/parsers/builtin_plugins.hpp"

namespace splash
{

ClfPlugin::ClfPlugin(bool enable_color)
    : metadata_{kClfPluginName, PluginVersion{1, 0, 0}, "Common Log Format (web access logs)",
                "splash"},
      formatter_(enable_color)
{
}

ParseResult ClfPlugin::ParseLine(std::string_view line) const
{
  std::vector<ClfRecord> records = parser_.Parse(line);
  if (records.empty())
  {
    return NoMatch{};
  }

  std::string text;
  for (size_t i = 0; i < records.size(); ++i)
  {
    if (i > 0)
    {
      text += '\n';
    }
    formatter_.Format(ClfParser::Render(records[i]), text);
  }
  return Parsed{std::move(text)};
}

bool ClfPlugin::CanParse(std::string_view line) const { return !parser_.Parse(line).empty(); }

AdHocPlugin::AdHocPlugin(std::shared_ptr<const HighlightRules> rules, bool enable_color)
    : metadata_{kAdHocPluginName, PluginVersion{1, 0, 0},
                "Highlights numbers, IP addresses, HTTP verbs, quotes and brackets", "splash"},
      rules_(std::move(rules)),
      highlighter_(*rules_),
      formatter_(enable_color)
{
}

ParseResult AdHocPlugin::ParseLine(std::string_view line) const
{
  HighlightedLine highlighted = highlighter_.Highlight(line);
  if (highlighted.Empty())
  {
    return NoMatch{};
  }

  std::string text;
  formatter_.Format(highlighted, text);
  return Parsed{std::move(text)};
}

RegistryStatus RegisterBuiltinPlugins(PluginRegistry& registry,
                                      std::shared_ptr<const HighlightRules> rules,
                                      bool enable_color)
{
  if (auto err = registry.Register(std::make_shared<const ClfPlugin>(enable_color)))
  {
    return err;
  }
  return registry.Register(std::make_shared<const AdHocPlugin>(std::move(rules), enable_color));
}

}  // namespace splash

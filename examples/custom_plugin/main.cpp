#include <splash/formatters/ansi_formatter.hpp>
#include <splash/logger.hpp>
#include <splash/parsers/builtin_plugins.hpp>
#include <splash/plugin.hpp>
#include <splash/plugin_registry.hpp>
#include <splash/sinks/callback_sink.hpp>
#include <splash/dispatch.hpp>

#include <cstdio>
#include <memory>
#include <regex>
#include <string>
#include <variant>
#include <vector>

// A third-party format: BSD syslog lines such as
//   Oct 11 22:14:15 mymachine su: 'su root' failed for lonvick on /dev/pts/8
class SyslogPlugin : public splash::IFormatPlugin
{
 public:
  explicit SyslogPlugin(bool enable_color)
      : metadata_{"syslog", {1, 2, 0}, "BSD syslog (RFC 3164)", "example"},
        pattern_(R"(^([A-Z][a-z]{2}\s+\d{1,2}\s\d{2}:\d{2}:\d{2})\s(\S+)\s([^:\s]+):\s(.*)$)",
                 std::regex::ECMAScript | std::regex::optimize),
        formatter_(enable_color)
  {
  }

  const splash::PluginMetadata& Metadata() const override { return metadata_; }

  splash::ParseResult ParseLine(std::string_view line) const override
  {
    std::cmatch m;
    if (!std::regex_match(line.data(), line.data() + line.size(), m, pattern_))
    {
      return splash::NoMatch{};
    }

    splash::HighlightedLine out;
    out.Append(splash::Style::DateTime, std::string_view(m[1].first, m[1].length()));
    out.Append(splash::Style::Plain, " ");
    out.Append(splash::Style::Client, std::string_view(m[2].first, m[2].length()));
    out.Append(splash::Style::Plain, " ");
    out.Append(splash::Style::Method, std::string_view(m[3].first, m[3].length()));
    out.Append(splash::Style::Plain, ": ");
    out.Append(splash::Style::Plain, std::string_view(m[4].first, m[4].length()));

    splash::Parsed parsed;
    formatter_.Format(out, parsed.text);
    return parsed;
  }

 private:
  splash::PluginMetadata metadata_;
  std::regex pattern_;
  splash::AnsiFormatter formatter_;
};

int main()
{
  splash::Logger::Instance().SetLevel(splash::LogLevel::Info);

  splash::PluginRegistry registry;
  auto rules = std::make_shared<const splash::HighlightRules>(splash::HighlightRules::Default());
  if (auto err = splash::RegisterBuiltinPlugins(registry, rules, true))
  {
    std::fprintf(stderr, "%s\n", err->Message().c_str());
    return 1;
  }
  if (auto err = registry.Register(std::make_shared<SyslogPlugin>(true)))
  {
    std::fprintf(stderr, "%s\n", err->Message().c_str());
    return 1;
  }

  // The host needs syslog 1.1 or newer within major 1.
  if (auto err = registry.VerifyVersion("syslog", splash::PluginVersion{1, 1, 0}))
  {
    std::fprintf(stderr, "%s\n", err->Message().c_str());
    return 1;
  }

  const std::vector<std::string_view> samples = {
      "Oct 11 22:14:15 mymachine su: 'su root' failed for lonvick on /dev/pts/8",
      "Oct 11 22:14:16 mymachine sshd: Accepted publickey for lonvick from 10.0.0.7",
      "Oct 11 22:15:02 mymachine CRON: (root) CMD (run-parts /etc/cron.hourly)",
  };

  // Pick the format that understands most of the sample. ad-hoc accepts
  // every non-empty line, so it only wins when nothing scores higher.
  auto names = registry.ListEnabled();
  if (auto* err = std::get_if<splash::RegistryError>(&names))
  {
    std::fprintf(stderr, "%s\n", err->Message().c_str());
    return 1;
  }
  splash::PluginHandle best;
  double best_score = -1.0;
  for (const auto& name : std::get<std::vector<std::string>>(names))
  {
    auto lookup = registry.Get(name);
    auto* plugin = std::get_if<splash::PluginHandle>(&lookup);
    if (plugin == nullptr)
    {
      continue;
    }
    double score = (*plugin)->DetectFormat(samples);
    if (name == splash::kAdHocPluginName)
    {
      score -= 0.01;
    }
    std::printf("%-8s %.2f\n", name.c_str(), score);
    if (score > best_score)
    {
      best_score = score;
      best = *plugin;
    }
  }
  if (!best)
  {
    return 1;
  }
  std::printf("detected: %s %s\n\n", best->Name().c_str(), best->Version().ToString().c_str());

  splash::CallbackSink sink([](std::string_view line)
                            { std::printf("%.*s\n", static_cast<int>(line.size()), line.data()); });
  splash::LineDispatcher dispatcher(best, sink);
  for (auto line : samples)
  {
    dispatcher.DispatchLine(line);
  }
  return 0;
}

#include <splash/dispatch.hpp>
#include <splash/logger.hpp>
#include <splash/options.hpp>
#include <splash/parsers/builtin_plugins.hpp>
#include <splash/platform.hpp>
#include <splash/plugin_discovery.hpp>
#include <splash/plugin_registry.hpp>
#include <splash/sinks/console_sink.hpp>
#include <splash/tailer.hpp>

#include <algorithm>
#include <cstdio>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

int ListPlugins(const splash::PluginRegistry& registry, const splash::Options& opts)
{
  auto names = registry.List();
  if (auto* err = std::get_if<splash::RegistryError>(&names))
  {
    std::fprintf(stderr, "splash: error: %s\n", err->Message().c_str());
    return kExitFailure;
  }
  auto& list = std::get<std::vector<std::string>>(names);
  std::sort(list.begin(), list.end());

  std::printf("registered plugins:\n");
  for (const auto& name : list)
  {
    auto lookup = registry.Get(name);
    if (auto* plugin = std::get_if<splash::PluginHandle>(&lookup))
    {
      const auto& meta = (*plugin)->Metadata();
      std::printf("  %-10s %-8s %s%s\n", meta.name.c_str(), meta.version.ToString().c_str(),
                  meta.description.c_str(), registry.IsDisabled(name) ? " (disabled)" : "");
    }
  }

  splash::PluginDiscovery discovery;
  for (const auto& dir : opts.plugin_dirs)
  {
    discovery.AddPath(dir);
  }
  auto candidates = discovery.DiscoverCandidates();
  if (auto* err = std::get_if<splash::DiscoveryError>(&candidates))
  {
    std::fprintf(stderr, "splash: error: %s\n", err->Message().c_str());
    return kExitFailure;
  }

  std::printf("plugin search paths:\n");
  for (const auto& dir : discovery.SearchPaths())
  {
    std::printf("  %s\n", dir.c_str());
  }
  const auto& found = std::get<std::vector<std::string>>(candidates);
  std::printf("discovered candidates: %zu\n", found.size());
  for (const auto& path : found)
  {
    std::printf("  %s\n", path.c_str());
  }
  return kExitOk;
}

}  // namespace

int main(int argc, char* argv[])
{
  auto parsed = splash::ParseOptions(argc, argv);
  if (auto* err = std::get_if<splash::OptionsError>(&parsed))
  {
    std::fprintf(stderr, "splash: %s\n%s", err->message.c_str(), splash::Usage(argv[0]).c_str());
    return kExitUsage;
  }
  const auto& opts = std::get<splash::Options>(parsed);

  if (opts.show_help)
  {
    std::fputs(splash::Usage(argv[0]).c_str(), stdout);
    return kExitOk;
  }
  if (opts.show_version)
  {
    std::printf("splash %s (%s, %s)\n", SPLASH_VERSION, SPLASH_GIT_HASH, SPLASH_BUILD_TYPE);
    return kExitOk;
  }

  splash::Logger::Instance().SetLevel(opts.log_level);

  const bool color = splash::ShouldUseColor(splash::ForcedColor(opts.color));
  auto rules = std::make_shared<const splash::HighlightRules>(splash::HighlightRules::Default());

  splash::PluginRegistry registry;
  if (auto err = splash::RegisterBuiltinPlugins(registry, rules, color))
  {
    std::fprintf(stderr, "splash: error: %s\n", err->Message().c_str());
    return kExitFailure;
  }

  if (opts.list_plugins)
  {
    return ListPlugins(registry, opts);
  }

  auto lookup = splash::SelectPlugin(registry, opts.mode);
  if (auto* err = std::get_if<splash::RegistryError>(&lookup))
  {
    std::fprintf(stderr, "splash: error: %s\n", err->Message().c_str());
    return kExitFailure;
  }
  auto plugin = std::get<splash::PluginHandle>(lookup);
  LOG_INFO("mode '%s' uses plugin %s %s", opts.mode.c_str(), plugin->Name().c_str(),
           plugin->Version().ToString().c_str());

  splash::ConsoleSink sink(stdout);
  splash::LineDispatcher dispatcher(plugin, sink);

  if (!opts.path)
  {
    if (!splash::ConsumeStream(stdin, dispatcher))
    {
      std::fprintf(stderr, "splash: error: failed to read standard input\n");
      return kExitFailure;
    }
    sink.Flush();
    return kExitOk;
  }

  splash::PollWatcher watcher(*opts.path);
  splash::Tailer tailer;
  splash::TailError err = tailer.Run(*opts.path, watcher, [&dispatcher](std::string_view batch)
                                     { dispatcher.DispatchBatch(batch); });
  sink.Flush();
  std::fprintf(stderr, "splash: error: %s\n", err.Message().c_str());
  return kExitFailure;
}

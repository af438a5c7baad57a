#pragma once
#include <cstdint>
#include <cstdio>
#include <string_view>

#include "plugin_registry.hpp"
#include "sinks/sink_interface.hpp"

namespace splash
{

// "clf" selects the access-log parser, everything else (including an empty
// selector) the ad-hoc highlighter.
std::string_view PluginNameForMode(std::string_view mode);

// Resolves the mode once per run.
PluginLookup SelectPlugin(const PluginRegistry& registry, std::string_view mode);

struct DispatchStats
{
  uint64_t lines_seen = 0;     // non-empty input lines
  uint64_t lines_emitted = 0;  // output lines written to the sink
  uint64_t no_match = 0;
  uint64_t errors = 0;
};

// Feeds input lines to one plugin and writes what it renders to a sink.
// Empty lines are skipped, lines the plugin does not match are dropped and
// plugin errors are logged and skipped.
class LineDispatcher
{
 public:
  LineDispatcher(PluginHandle plugin, ILineSink& sink);

  // Splits on '\n' (a trailing '\r' is removed) and dispatches every line.
  // Returns the number of output lines written.
  size_t DispatchBatch(std::string_view batch);

  size_t DispatchLine(std::string_view line);

  const DispatchStats& Stats() const { return stats_; }

 private:
  PluginHandle plugin_;
  ILineSink& sink_;
  DispatchStats stats_;
};

// Reads lines from `in` until EOF and dispatches each as it arrives.
// Returns false if reading failed before EOF.
bool ConsumeStream(std::FILE* in, LineDispatcher& dispatcher);

}  // namespace splash

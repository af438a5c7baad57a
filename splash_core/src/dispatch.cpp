#include "splash/dispatch.hpp"

#include <sys/types.h>

#include <cstdlib>
#include <variant>

#include "splash/logger.hpp"
#include "splash/parsers/builtin_plugins.hpp"

namespace splash
{

namespace
{

std::string_view StripCarriageReturn(std::string_view line)
{
  if (!line.empty() && line.back() == '\r')
  {
    line.remove_suffix(1);
  }
  return line;
}

}  // namespace

std::string_view PluginNameForMode(std::string_view mode)
{
  return mode == kClfPluginName ? kClfPluginName : kAdHocPluginName;
}

PluginLookup SelectPlugin(const PluginRegistry& registry, std::string_view mode)
{
  std::string_view name = PluginNameForMode(mode);
  PluginLookup lookup = registry.Get(name);
  if (std::holds_alternative<PluginHandle>(lookup))
  {
    LOG_INFO("mode '%.*s' -> plugin '%.*s'", static_cast<int>(mode.size()), mode.data(),
             static_cast<int>(name.size()), name.data());
  }
  return lookup;
}

LineDispatcher::LineDispatcher(PluginHandle plugin, ILineSink& sink)
    : plugin_(std::move(plugin)), sink_(sink)
{
}

size_t LineDispatcher::DispatchBatch(std::string_view batch)
{
  size_t written = 0;
  size_t start = 0;
  while (start < batch.size())
  {
    size_t nl = batch.find('\n', start);
    size_t end = (nl == std::string_view::npos) ? batch.size() : nl;
    written += DispatchLine(batch.substr(start, end - start));
    start = end + 1;
  }
  return written;
}

size_t LineDispatcher::DispatchLine(std::string_view line)
{
  line = StripCarriageReturn(line);
  if (line.empty())
  {
    return 0;
  }
  ++stats_.lines_seen;

  ParseResult result = plugin_->ParseLine(line);

  if (std::holds_alternative<NoMatch>(result))
  {
    ++stats_.no_match;
    return 0;
  }
  if (auto* err = std::get_if<ParseError>(&result))
  {
    ++stats_.errors;
    LOG_WARN("plugin '%s' failed on a line: %s", plugin_->Name().c_str(), err->message.c_str());
    return 0;
  }

  std::string_view text = std::get<Parsed>(result).text;
  size_t written = 0;
  size_t start = 0;
  for (;;)
  {
    size_t nl = text.find('\n', start);
    sink_.Write(text.substr(start, nl == std::string_view::npos ? std::string_view::npos
                                                                 : nl - start));
    ++written;
    if (nl == std::string_view::npos)
    {
      break;
    }
    start = nl + 1;
  }
  stats_.lines_emitted += written;
  return written;
}

bool ConsumeStream(std::FILE* in, LineDispatcher& dispatcher)
{
  char* buf = nullptr;
  size_t cap = 0;
  ssize_t len = 0;

  while ((len = ::getline(&buf, &cap, in)) >= 0)
  {
    std::string_view line(buf, static_cast<size_t>(len));
    if (!line.empty() && line.back() == '\n')
    {
      line.remove_suffix(1);
    }
    dispatcher.DispatchLine(line);
  }

  const bool failed = std::ferror(in) != 0;
  std::free(buf);
  if (failed)
  {
    LOG_ERROR("reading input failed");
  }
  return !failed;
}

}  // namespace splash

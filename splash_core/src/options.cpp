#include "splash/options.hpp"

#include <getopt.h>

#include <cstdlib>
#include <cstring>

#include "splash/platform.hpp"

namespace splash
{

namespace
{

enum LongOnly : int
{
  kOptColor = 256,
  kOptLogLevel,
  kOptPluginDir,
  kOptListPlugins
};

const struct option kLongOptions[] = {
    {"mode", required_argument, nullptr, 'm'},
    {"path", required_argument, nullptr, 'p'},
    {"color", required_argument, nullptr, kOptColor},
    {"log-level", required_argument, nullptr, kOptLogLevel},
    {"plugin-dir", required_argument, nullptr, kOptPluginDir},
    {"list-plugins", no_argument, nullptr, kOptListPlugins},
    {"help", no_argument, nullptr, 'h'},
    {"version", no_argument, nullptr, 'V'},
    {nullptr, 0, nullptr, 0},
};

bool ParseColorMode(const char* text, ColorMode& out)
{
  if (std::strcmp(text, "auto") == 0)
  {
    out = ColorMode::Auto;
  }
  else if (std::strcmp(text, "always") == 0)
  {
    out = ColorMode::Always;
  }
  else if (std::strcmp(text, "never") == 0)
  {
    out = ColorMode::Never;
  }
  else
  {
    return false;
  }
  return true;
}

void SplitPathList(const char* list, std::vector<std::string>& out)
{
  std::string current;
  for (const char* p = list;; ++p)
  {
    if (*p == ':' || *p == '\0')
    {
      if (!current.empty())
      {
        out.push_back(current);
      }
      current.clear();
      if (*p == '\0')
      {
        break;
      }
      continue;
    }
    current += *p;
  }
}

std::optional<OptionsError> ApplyEnvironment(Options& opts)
{
  if (const char* level = std::getenv("SPLASH_LOG_LEVEL"))
  {
    if (*level && !ParseLogLevel(level, opts.log_level))
    {
      return OptionsError{std::string("invalid SPLASH_LOG_LEVEL '") + level + "'"};
    }
  }
  if (const char* dirs = std::getenv("SPLASH_PLUGIN_PATH"))
  {
    SplitPathList(dirs, opts.plugin_dirs);
  }
  return std::nullopt;
}

}  // namespace

OptionsResult ParseOptions(int argc, char* const argv[])
{
  Options opts;
  if (auto err = ApplyEnvironment(opts))
  {
    return *err;
  }

  // getopt keeps global state; start over on every call.
#if defined(__GLIBC__)
  optind = 0;
#else
  optind = 1;
#endif
  opterr = 0;

  int c = 0;
  while ((c = ::getopt_long(argc, argv, ":m:p:hV", kLongOptions, nullptr)) != -1)
  {
    switch (c)
    {
      case 'm':
        opts.mode = optarg;
        break;
      case 'p':
        opts.path = std::string(optarg);
        break;
      case kOptColor:
        if (!ParseColorMode(optarg, opts.color))
        {
          return OptionsError{std::string("invalid --color value '") + optarg +
                              "' (expected auto, always or never)"};
        }
        break;
      case kOptLogLevel:
        if (!ParseLogLevel(optarg, opts.log_level))
        {
          return OptionsError{std::string("invalid --log-level value '") + optarg + "'"};
        }
        break;
      case kOptPluginDir:
        opts.plugin_dirs.emplace_back(optarg);
        break;
      case kOptListPlugins:
        opts.list_plugins = true;
        break;
      case 'h':
        opts.show_help = true;
        break;
      case 'V':
        opts.show_version = true;
        break;
      case ':':
        return OptionsError{std::string("option '") + argv[optind - 1] + "' requires an argument"};
      default:
        return OptionsError{std::string("unknown option '") + argv[optind - 1] + "'"};
    }
  }

  if (optind < argc)
  {
    return OptionsError{std::string("unexpected argument '") + argv[optind] + "'"};
  }
  return opts;
}

std::optional<bool> ForcedColor(ColorMode mode)
{
  switch (mode)
  {
    case ColorMode::Always:
      return true;
    case ColorMode::Never:
      return false;
    case ColorMode::Auto:
      break;
  }
  return std::nullopt;
}

std::string Usage(const char* prog)
{
  std::string text = "usage: ";
  text += prog;
  text +=
      " [-m MODE] [-p PATH] [--color WHEN] [--log-level LEVEL]\n"
      "       [--plugin-dir DIR]... [--list-plugins] [-h] [-V]\n"
      "\n"
      "Tails PATH (or reads standard input) and highlights every new line.\n"
      "\n"
      "  -m, --mode MODE        clf for web access logs, anything else highlights\n"
      "                         numbers, IP addresses and HTTP verbs (default ad-hoc)\n"
      "  -p, --path PATH        file to follow; only lines appended after start\n"
      "                         are shown (checked every " +
      std::to_string(SPLASH_POLL_INTERVAL_MS / 1000) +
      " s)\n"
      "      --color WHEN       auto, always or never (default auto)\n"
      "      --log-level LEVEL  diagnostics on stderr: trace, debug, info, warn,\n"
      "                         error, fatal, off (default warn, env SPLASH_LOG_LEVEL)\n"
      "      --plugin-dir DIR   extra plugin search directory (env SPLASH_PLUGIN_PATH)\n"
      "      --list-plugins     list registered and discovered plugins, then exit\n"
      "  -h, --help             show this help\n"
      "  -V, --version          show version\n";
  return text;
}

}  // namespace splash

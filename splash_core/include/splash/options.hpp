#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "log_level.hpp"

namespace splash
{

enum class ColorMode : uint8_t
{
  Auto,
  Always,
  Never
};

struct Options
{
  std::string mode = "ad-hoc";
  std::optional<std::string> path;  // stdin when unset
  ColorMode color = ColorMode::Auto;
  LogLevel log_level = LogLevel::Warn;
  std::vector<std::string> plugin_dirs;  // appended to the default search paths
  bool list_plugins = false;
  bool show_help = false;
  bool show_version = false;
};

struct OptionsError
{
  std::string message;
};

using OptionsResult = std::variant<Options, OptionsError>;

// Environment (SPLASH_LOG_LEVEL, SPLASH_PLUGIN_PATH) first, then argv.
OptionsResult ParseOptions(int argc, char* const argv[]);

// nullopt for ColorMode::Auto.
std::optional<bool> ForcedColor(ColorMode mode);

std::string Usage(const char* prog);

}  // namespace splash

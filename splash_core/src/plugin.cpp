#include "splash/plugin.hpp"

#include <charconv>

namespace splash
{

bool PluginVersion::IsCompatibleWith(const PluginVersion& required) const
{
  if (major != required.major)
  {
    return false;
  }
  if (minor < required.minor)
  {
    return false;
  }
  if (minor == required.minor && patch < required.patch)
  {
    return false;
  }
  return true;
}

std::string PluginVersion::ToString() const
{
  return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

bool ParsePluginVersion(std::string_view text, PluginVersion& out)
{
  uint32_t parts[3] = {};
  const char* p = text.data();
  const char* end = text.data() + text.size();

  for (int i = 0; i < 3; ++i)
  {
    auto [next, ec] = std::from_chars(p, end, parts[i]);
    if (ec != std::errc() || next == p)
    {
      return false;
    }
    p = next;
    if (i < 2)
    {
      if (p == end || *p != '.')
      {
        return false;
      }
      ++p;
    }
  }
  if (p != end)
  {
    return false;
  }

  out.major = parts[0];
  out.minor = parts[1];
  out.patch = parts[2];
  return true;
}

bool IFormatPlugin::CanParse(std::string_view line) const
{
  return std::holds_alternative<Parsed>(ParseLine(line));
}

double IFormatPlugin::DetectFormat(const std::vector<std::string_view>& samples) const
{
  if (samples.empty())
  {
    return 0.0;
  }

  size_t matches = 0;
  for (const auto& line : samples)
  {
    if (CanParse(line))
    {
      ++matches;
    }
  }
  return static_cast<double>(matches) / static_cast<double>(samples.size());
}

}  // namespace splash

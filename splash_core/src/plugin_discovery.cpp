#include "splash/plugin_discovery.hpp"

#include <dirent.h>
#include <sys/stat.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "splash/logger.hpp"
#include "splash/platform.hpp"

#if defined(SPLASH_PLATFORM_POSIX)
#include <pwd.h>
#include <unistd.h>
#endif

namespace splash
{

namespace
{

constexpr const char* kModuleExtensions[] = {"so", "dylib", "dll"};

std::string JoinPath(const std::string& dir, const char* name)
{
  std::string result = dir;
  if (!result.empty() && result.back() != '/')
  {
    result += '/';
  }
  result += name;
  return result;
}

std::string_view BaseName(std::string_view path)
{
  size_t slash = path.find_last_of('/');
  return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

std::string_view Stem(std::string_view filename)
{
  size_t dot = filename.find_last_of('.');
  if (dot == std::string_view::npos || dot == 0)
  {
    return filename;
  }
  return filename.substr(0, dot);
}

std::optional<std::string> HomeDirectory()
{
  const char* home = std::getenv("HOME");
  if (home && *home)
  {
    return std::string(home);
  }
#if defined(SPLASH_PLATFORM_POSIX)
  struct passwd* pw = ::getpwuid(::getuid());
  if (pw && pw->pw_dir && *pw->pw_dir)
  {
    return std::string(pw->pw_dir);
  }
#elif defined(SPLASH_PLATFORM_WINDOWS)
  const char* profile = std::getenv("USERPROFILE");
  if (profile && *profile)
  {
    return std::string(profile);
  }
#endif
  return std::nullopt;
}

}  // namespace

std::string DiscoveryError::Message() const
{
  std::string msg;
  switch (code)
  {
    case DiscoveryErrc::DirectoryNotFound:
      msg = "Plugin directory not found: " + path;
      break;
    case DiscoveryErrc::PermissionDenied:
      msg = "Permission denied accessing: " + path;
      break;
    case DiscoveryErrc::Io:
      msg = "IO error during discovery of " + path;
      break;
  }
  if (sys_errno != 0)
  {
    msg += " (";
    msg += std::strerror(sys_errno);
    msg += ")";
  }
  return msg;
}

PluginDiscovery::PluginDiscovery() : search_paths_(DefaultSearchPaths()) {}

PluginDiscovery::PluginDiscovery(std::vector<std::string> search_paths)
    : search_paths_(std::move(search_paths))
{
}

std::vector<std::string> PluginDiscovery::DefaultSearchPaths()
{
  std::vector<std::string> paths;

  if (auto home = HomeDirectory())
  {
    paths.push_back(JoinPath(*home, "." SPLASH_PLUGIN_DIR_NAME "/plugins"));
  }

#if defined(SPLASH_PLATFORM_POSIX)
  paths.push_back("/usr/local/lib/" SPLASH_PLUGIN_DIR_NAME "/plugins");
  paths.push_back("/usr/lib/" SPLASH_PLUGIN_DIR_NAME "/plugins");
#elif defined(SPLASH_PLATFORM_WINDOWS)
  const char* program_files = std::getenv("ProgramFiles");
  if (program_files && *program_files)
  {
    paths.push_back(std::string(program_files) + "\\" SPLASH_PLUGIN_DIR_NAME "\\plugins");
  }
#endif

  return paths;
}

void PluginDiscovery::AddPath(std::string path) { search_paths_.push_back(std::move(path)); }

bool PluginDiscovery::HasModuleExtension(std::string_view filename)
{
  size_t dot = filename.find_last_of('.');
  if (dot == std::string_view::npos || dot + 1 == filename.size())
  {
    return false;
  }

  std::string ext;
  for (char c : filename.substr(dot + 1))
  {
    ext += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  for (const char* candidate : kModuleExtensions)
  {
    if (ext == candidate)
    {
      return true;
    }
  }
  return false;
}

bool PluginDiscovery::IsCandidateFile(const std::string& path)
{
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
  {
    return false;
  }
  return HasModuleExtension(BaseName(path));
}

DiscoveryErrc DiscoveryErrcFromErrno(int sys_errno)
{
  switch (sys_errno)
  {
    case ENOENT:
    case ENOTDIR:
      return DiscoveryErrc::DirectoryNotFound;
    case EACCES:
    case EPERM:
      return DiscoveryErrc::PermissionDenied;
    default:
      return DiscoveryErrc::Io;
  }
}

bool PluginDiscovery::IsSkippable(const DiscoveryError& err)
{
  return err.code == DiscoveryErrc::DirectoryNotFound ||
         err.code == DiscoveryErrc::PermissionDenied;
}

CandidateList PluginDiscovery::ScanDirectory(const std::string& dir)
{
  DIR* d = ::opendir(dir.c_str());
  if (!d)
  {
    int err = errno;
    return DiscoveryError{DiscoveryErrcFromErrno(err), dir, err};
  }

  std::vector<std::string> found;
  for (;;)
  {
    errno = 0;
    struct dirent* ent = ::readdir(d);
    if (!ent)
    {
      int err = errno;
      if (err != 0)
      {
        ::closedir(d);
        return DiscoveryError{DiscoveryErrc::Io, dir, err};
      }
      break;
    }

    if (std::strcmp(ent->d_name, ".") == 0 || std::strcmp(ent->d_name, "..") == 0)
    {
      continue;
    }
    std::string full = JoinPath(dir, ent->d_name);
    if (IsCandidateFile(full))
    {
      found.push_back(std::move(full));
    }
  }
  ::closedir(d);

  std::sort(found.begin(), found.end());
  return found;
}

CandidateList PluginDiscovery::DiscoverCandidates() const
{
  std::vector<std::string> candidates;

  for (const auto& path : search_paths_)
  {
    CandidateList scanned = ScanDirectory(path);
    if (auto* err = std::get_if<DiscoveryError>(&scanned))
    {
      if (IsSkippable(*err))
      {
        LOG_DEBUG("skipping plugin path %s: %s", path.c_str(), err->Message().c_str());
        continue;
      }
      return *err;
    }

    auto& files = std::get<std::vector<std::string>>(scanned);
    LOG_DEBUG("plugin path %s: %zu candidate(s)", path.c_str(), files.size());
    candidates.insert(candidates.end(), std::make_move_iterator(files.begin()),
                      std::make_move_iterator(files.end()));
  }

  return candidates;
}

CandidateLookup PluginDiscovery::FindByName(std::string_view name) const
{
  CandidateList all = DiscoverCandidates();
  if (auto* err = std::get_if<DiscoveryError>(&all))
  {
    return *err;
  }

  const std::string lib_name = "lib" + std::string(name);
  for (auto& path : std::get<std::vector<std::string>>(all))
  {
    std::string_view stem = Stem(BaseName(path));
    if (stem == name || stem == lib_name)
    {
      return std::optional<std::string>(std::move(path));
    }
  }
  return std::optional<std::string>();
}

}  // namespace splash

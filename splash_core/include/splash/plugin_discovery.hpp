#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace splash
{

enum class DiscoveryErrc : uint8_t
{
  DirectoryNotFound,
  PermissionDenied,
  Io
};

struct DiscoveryError
{
  DiscoveryErrc code;
  std::string path;
  int sys_errno;

  std::string Message() const;
};

// ENOENT and ENOTDIR: DirectoryNotFound; EACCES and EPERM: PermissionDenied;
// anything else: Io.
DiscoveryErrc DiscoveryErrcFromErrno(int sys_errno);

using CandidateList = std::variant<std::vector<std::string>, DiscoveryError>;
using CandidateLookup = std::variant<std::optional<std::string>, DiscoveryError>;

// Locates candidate plugin modules (.so / .dylib / .dll) in a list of search
// directories. Nothing is loaded or opened; a candidate is only a file name
// that follows the native-module convention.
class PluginDiscovery
{
 public:
  // Seeded with DefaultSearchPaths().
  PluginDiscovery();
  explicit PluginDiscovery(std::vector<std::string> search_paths);

  // ~/.splash/plugins, then the system-wide plugin directories of the
  // platform. Entries that cannot be resolved are left out.
  static std::vector<std::string> DefaultSearchPaths();

  void AddPath(std::string path);
  const std::vector<std::string>& SearchPaths() const { return search_paths_; }

  // Scans every search path in order. Missing paths, non-directories and
  // directories we may not read are skipped; any other failure aborts.
  CandidateList DiscoverCandidates() const;

  // Scans one directory and reports every failure, including the ones
  // DiscoverCandidates() skips. Entries are sorted by file name.
  static CandidateList ScanDirectory(const std::string& dir);

  // True for the failures DiscoverCandidates() steps over.
  static bool IsSkippable(const DiscoveryError& err);

  // First candidate whose stem is `name` or "lib" + `name`.
  CandidateLookup FindByName(std::string_view name) const;

  static bool IsCandidateFile(const std::string& path);
  static bool HasModuleExtension(std::string_view filename);

 private:
  std::vector<std::string> search_paths_;
};

}  // namespace splash

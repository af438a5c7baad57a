#include <dirent.h>
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

#include "splash/plugin_discovery.hpp"

using splash::DiscoveryErrc;
using splash::DiscoveryError;
using splash::PluginDiscovery;

static void remove_directory_recursive(const std::string& path)
{
  DIR* dir = ::opendir(path.c_str());
  if (!dir) return;
  struct dirent* ent;
  while ((ent = ::readdir(dir)) != nullptr)
  {
    if (std::strcmp(ent->d_name, ".") == 0 || std::strcmp(ent->d_name, "..") == 0) continue;
    std::string full = path + "/" + ent->d_name;
    struct stat st{};
    if (::lstat(full.c_str(), &st) == 0 && S_ISDIR(st.st_mode))
    {
      remove_directory_recursive(full);
    }
    else
    {
      ::unlink(full.c_str());
    }
  }
  ::closedir(dir);
  ::rmdir(path.c_str());
}

static void touch(const std::string& path)
{
  std::FILE* f = std::fopen(path.c_str(), "w");
  ASSERT_NE(f, nullptr) << path;
  std::fputs("x", f);
  std::fclose(f);
}

static std::vector<std::string> candidates_of(const splash::CandidateList& list)
{
  if (auto* err = std::get_if<DiscoveryError>(&list))
  {
    ADD_FAILURE() << err->Message();
    return {};
  }
  return std::get<std::vector<std::string>>(list);
}

class PluginDiscoveryTest : public ::testing::Test
{
 protected:
  std::string root_;

  void SetUp() override
  {
    char tmpl[] = "/tmp/splash_discovery_XXXXXX";
    char* dir = ::mkdtemp(tmpl);
    ASSERT_NE(dir, nullptr);
    root_ = dir;
  }

  void TearDown() override { remove_directory_recursive(root_); }

  std::string MakeDir(const std::string& name)
  {
    std::string path = root_ + "/" + name;
    EXPECT_EQ(::mkdir(path.c_str(), 0755), 0);
    return path;
  }
};

TEST(PluginDiscovery, DefaultSearchPathsEndWithSystemDirectories)
{
  auto paths = PluginDiscovery::DefaultSearchPaths();
  ASSERT_GE(paths.size(), 2u);
  EXPECT_EQ(paths[paths.size() - 2], "/usr/local/lib/splash/plugins");
  EXPECT_EQ(paths.back(), "/usr/lib/splash/plugins");
  if (paths.size() == 3)
  {
    const std::string suffix = "/.splash/plugins";
    ASSERT_GE(paths[0].size(), suffix.size());
    EXPECT_EQ(paths[0].compare(paths[0].size() - suffix.size(), suffix.size(), suffix), 0);
  }
}

TEST(PluginDiscovery, HasModuleExtension)
{
  EXPECT_TRUE(PluginDiscovery::HasModuleExtension("libapache.so"));
  EXPECT_TRUE(PluginDiscovery::HasModuleExtension("syslog.dylib"));
  EXPECT_TRUE(PluginDiscovery::HasModuleExtension("json.DLL"));
  EXPECT_FALSE(PluginDiscovery::HasModuleExtension("readme.txt"));
  EXPECT_FALSE(PluginDiscovery::HasModuleExtension("apache"));
  EXPECT_FALSE(PluginDiscovery::HasModuleExtension("apache."));
  EXPECT_FALSE(PluginDiscovery::HasModuleExtension("libfoo.so.1"));
}

TEST_F(PluginDiscoveryTest, NonexistentPathYieldsNothing)
{
  PluginDiscovery discovery({root_ + "/does-not-exist"});
  EXPECT_TRUE(candidates_of(discovery.DiscoverCandidates()).empty());
}

TEST_F(PluginDiscoveryTest, OnlyRegularFilesWithModuleExtensions)
{
  std::string dir = MakeDir("plugins");
  touch(dir + "/libapache.so");
  touch(dir + "/syslog.dylib");
  touch(dir + "/json.dll");
  touch(dir + "/notes.txt");
  touch(dir + "/noext");
  MakeDir("plugins/nested.so");

  PluginDiscovery discovery({dir});
  auto found = candidates_of(discovery.DiscoverCandidates());
  EXPECT_EQ(found, (std::vector<std::string>{dir + "/json.dll", dir + "/libapache.so",
                                             dir + "/syslog.dylib"}));
}

TEST_F(PluginDiscoveryTest, SearchPathOrderIsKept)
{
  std::string first = MakeDir("first");
  std::string second = MakeDir("second");
  touch(second + "/a.so");
  touch(first + "/z.so");

  PluginDiscovery discovery({first, root_ + "/missing", second});
  auto found = candidates_of(discovery.DiscoverCandidates());
  EXPECT_EQ(found, (std::vector<std::string>{first + "/z.so", second + "/a.so"}));
}

TEST_F(PluginDiscoveryTest, AddPathAppends)
{
  std::string dir = MakeDir("extra");
  touch(dir + "/x.so");

  PluginDiscovery discovery(std::vector<std::string>{});
  EXPECT_TRUE(candidates_of(discovery.DiscoverCandidates()).empty());
  discovery.AddPath(dir);
  ASSERT_EQ(discovery.SearchPaths().size(), 1u);
  EXPECT_EQ(candidates_of(discovery.DiscoverCandidates()).size(), 1u);
}

TEST_F(PluginDiscoveryTest, FindByNameMatchesStemOrLibPrefix)
{
  std::string dir = MakeDir("plugins");
  touch(dir + "/libapache.so");
  touch(dir + "/syslog.dylib");

  PluginDiscovery discovery({dir});

  auto apache = discovery.FindByName("apache");
  ASSERT_TRUE(std::holds_alternative<std::optional<std::string>>(apache));
  EXPECT_EQ(std::get<std::optional<std::string>>(apache).value_or(""), dir + "/libapache.so");

  auto lib = discovery.FindByName("libapache");
  EXPECT_EQ(std::get<std::optional<std::string>>(lib).value_or(""), dir + "/libapache.so");

  auto syslog = discovery.FindByName("syslog");
  EXPECT_EQ(std::get<std::optional<std::string>>(syslog).value_or(""), dir + "/syslog.dylib");

  auto missing = discovery.FindByName("nginx");
  ASSERT_TRUE(std::holds_alternative<std::optional<std::string>>(missing));
  EXPECT_FALSE(std::get<std::optional<std::string>>(missing).has_value());
}

TEST_F(PluginDiscoveryTest, FindByNameTakesFirstSearchPath)
{
  std::string a = MakeDir("a");
  std::string b = MakeDir("b");
  touch(a + "/libjson.so");
  touch(b + "/json.so");

  PluginDiscovery discovery({b, a});
  auto found = discovery.FindByName("json");
  EXPECT_EQ(std::get<std::optional<std::string>>(found).value_or(""), b + "/json.so");
}

TEST_F(PluginDiscoveryTest, ScanDirectoryReportsMissingDirectory)
{
  auto result = PluginDiscovery::ScanDirectory(root_ + "/nope");
  ASSERT_TRUE(std::holds_alternative<DiscoveryError>(result));
  const auto& err = std::get<DiscoveryError>(result);
  EXPECT_EQ(err.code, DiscoveryErrc::DirectoryNotFound);
  EXPECT_EQ(err.path, root_ + "/nope");
  EXPECT_NE(err.Message().find("Plugin directory not found: "), std::string::npos);
}

TEST_F(PluginDiscoveryTest, ScanDirectoryOnFileIsNotFound)
{
  std::string file = root_ + "/plain.so";
  touch(file);
  auto result = PluginDiscovery::ScanDirectory(file);
  ASSERT_TRUE(std::holds_alternative<DiscoveryError>(result));
  EXPECT_EQ(std::get<DiscoveryError>(result).code, DiscoveryErrc::DirectoryNotFound);

  // The same path as a search path is skipped.
  PluginDiscovery discovery({file});
  EXPECT_TRUE(candidates_of(discovery.DiscoverCandidates()).empty());
}

TEST_F(PluginDiscoveryTest, UnreadableDirectoryIsSkipped)
{
  if (::geteuid() == 0)
  {
    GTEST_SKIP() << "root ignores directory permissions";
  }
  std::string locked = MakeDir("locked");
  touch(locked + "/a.so");
  ASSERT_EQ(::chmod(locked.c_str(), 0), 0);

  auto result = PluginDiscovery::ScanDirectory(locked);
  ASSERT_TRUE(std::holds_alternative<DiscoveryError>(result));
  EXPECT_EQ(std::get<DiscoveryError>(result).code, DiscoveryErrc::PermissionDenied);

  PluginDiscovery discovery({locked});
  EXPECT_TRUE(candidates_of(discovery.DiscoverCandidates()).empty());

  ::chmod(locked.c_str(), 0755);
}

TEST(PluginDiscovery, ErrnoMapping)
{
  EXPECT_EQ(splash::DiscoveryErrcFromErrno(ENOENT), DiscoveryErrc::DirectoryNotFound);
  EXPECT_EQ(splash::DiscoveryErrcFromErrno(ENOTDIR), DiscoveryErrc::DirectoryNotFound);
  EXPECT_EQ(splash::DiscoveryErrcFromErrno(EACCES), DiscoveryErrc::PermissionDenied);
  EXPECT_EQ(splash::DiscoveryErrcFromErrno(EPERM), DiscoveryErrc::PermissionDenied);
  EXPECT_EQ(splash::DiscoveryErrcFromErrno(EIO), DiscoveryErrc::Io);
  EXPECT_EQ(splash::DiscoveryErrcFromErrno(EMFILE), DiscoveryErrc::Io);
}

TEST(PluginDiscovery, OnlyMissingAndDeniedAreSkipped)
{
  EXPECT_TRUE(PluginDiscovery::IsSkippable({DiscoveryErrc::DirectoryNotFound, "/x", ENOENT}));
  EXPECT_TRUE(PluginDiscovery::IsSkippable({DiscoveryErrc::PermissionDenied, "/x", EACCES}));
  EXPECT_FALSE(PluginDiscovery::IsSkippable({DiscoveryErrc::Io, "/x", EIO}));

  const DiscoveryError denied{splash::DiscoveryErrcFromErrno(EACCES), "/locked", EACCES};
  EXPECT_TRUE(PluginDiscovery::IsSkippable(denied));
  EXPECT_NE(denied.Message().find("/locked"), std::string::npos);
}

TEST_F(PluginDiscoveryTest, IsCandidateFile)
{
  std::string file = root_ + "/x.so";
  touch(file);
  EXPECT_TRUE(PluginDiscovery::IsCandidateFile(file));
  EXPECT_FALSE(PluginDiscovery::IsCandidateFile(root_ + "/missing.so"));
  EXPECT_FALSE(PluginDiscovery::IsCandidateFile(MakeDir("dir.so")));
}

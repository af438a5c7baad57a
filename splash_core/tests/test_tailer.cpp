#include <dirent.h>
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utime.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <deque>
#include <functional>
#include <string>
#include <vector>

#include "splash/tailer.hpp"

using splash::PollWatcher;
using splash::Tailer;
using splash::TailErrc;
using splash::TailError;

static void remove_directory_recursive(const std::string& path)
{
  DIR* dir = ::opendir(path.c_str());
  if (!dir) return;
  struct dirent* ent;
  while ((ent = ::readdir(dir)) != nullptr)
  {
    if (std::strcmp(ent->d_name, ".") == 0 || std::strcmp(ent->d_name, "..") == 0) continue;
    std::string full = path + "/" + ent->d_name;
    ::unlink(full.c_str());
  }
  ::closedir(dir);
  ::rmdir(path.c_str());
}

static void write_file(const std::string& path, const std::string& content, const char* mode)
{
  std::FILE* f = std::fopen(path.c_str(), mode);
  ASSERT_NE(f, nullptr) << path;
  std::fwrite(content.data(), 1, content.size(), f);
  std::fclose(f);
}

// Runs one scripted step per change event, then fails with Watch.
class ScriptedChanges : public splash::IChangeSource
{
 public:
  explicit ScriptedChanges(std::string path) : path_(std::move(path)) {}

  void Then(std::function<void()> step) { steps_.push_back(std::move(step)); }

  splash::TailStatus WaitForChange() override
  {
    ++calls_;
    if (steps_.empty())
    {
      return TailError{TailErrc::Watch, path_, 0};
    }
    auto step = std::move(steps_.front());
    steps_.pop_front();
    step();
    return std::nullopt;
  }

  int Calls() const { return calls_; }

 private:
  std::string path_;
  std::deque<std::function<void()>> steps_;
  int calls_ = 0;
};

class TailerTest : public ::testing::Test
{
 protected:
  std::string tmp_dir_;
  std::string log_path_;

  void SetUp() override
  {
    char tmpl[] = "/tmp/splash_tailer_XXXXXX";
    char* dir = ::mkdtemp(tmpl);
    ASSERT_NE(dir, nullptr);
    tmp_dir_ = dir;
    log_path_ = tmp_dir_ + "/app.log";
  }

  void TearDown() override { remove_directory_recursive(tmp_dir_); }

  void Append(const std::string& text) { write_file(log_path_, text, "a"); }
  void Overwrite(const std::string& text) { write_file(log_path_, text, "w"); }
};

TEST_F(TailerTest, OpenMissingFileFails)
{
  Tailer tailer;
  auto err = tailer.Open(log_path_);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->code, TailErrc::Open);
  EXPECT_EQ(err->sys_errno, ENOENT);
  EXPECT_EQ(err->path, log_path_);
  EXPECT_EQ(err->Message().rfind("cannot open " + log_path_, 0), 0u);
}

TEST_F(TailerTest, ExistingContentIsSkipped)
{
  Overwrite("old line\n");
  Tailer tailer;
  ASSERT_FALSE(tailer.Open(log_path_).has_value());
  EXPECT_EQ(tailer.State().path, log_path_);
  EXPECT_EQ(tailer.State().byte_offset, 9u);
  EXPECT_EQ(tailer.State().last_known_length, 9u);

  std::string batch = "stale";
  ASSERT_FALSE(tailer.ReadDelta(batch).has_value());
  EXPECT_TRUE(batch.empty());
}

TEST_F(TailerTest, EachAppendIsReadOnce)
{
  Overwrite("");
  Tailer tailer;
  ASSERT_FALSE(tailer.Open(log_path_).has_value());

  std::string batch;
  Append("X\n");
  ASSERT_FALSE(tailer.ReadDelta(batch).has_value());
  EXPECT_EQ(batch, "X\n");

  Append("Y\n");
  ASSERT_FALSE(tailer.ReadDelta(batch).has_value());
  EXPECT_EQ(batch, "Y\n");
  EXPECT_EQ(tailer.State().byte_offset, 4u);

  ASSERT_FALSE(tailer.ReadDelta(batch).has_value());
  EXPECT_TRUE(batch.empty());
}

TEST_F(TailerTest, PartialLineIsDeliveredAsIs)
{
  Overwrite("");
  Tailer tailer;
  ASSERT_FALSE(tailer.Open(log_path_).has_value());

  std::string batch;
  Append("par");
  ASSERT_FALSE(tailer.ReadDelta(batch).has_value());
  EXPECT_EQ(batch, "par");
  Append("tial\n");
  ASSERT_FALSE(tailer.ReadDelta(batch).has_value());
  EXPECT_EQ(batch, "tial\n");
}

TEST_F(TailerTest, TruncationRestartsFromBeginning)
{
  Overwrite("0123456789\n");
  Tailer tailer;
  ASSERT_FALSE(tailer.Open(log_path_).has_value());

  Overwrite("ab\n");
  std::string batch;
  ASSERT_FALSE(tailer.ReadDelta(batch).has_value());
  EXPECT_EQ(batch, "ab\n");
  EXPECT_EQ(tailer.State().byte_offset, 3u);
  EXPECT_EQ(tailer.State().last_known_length, 3u);

  Append("c\n");
  ASSERT_FALSE(tailer.ReadDelta(batch).has_value());
  EXPECT_EQ(batch, "c\n");
}

TEST_F(TailerTest, ReplacedFileIsReadFromStart)
{
  Overwrite("short\n");
  Tailer tailer;
  ASSERT_FALSE(tailer.Open(log_path_).has_value());

  std::string replacement = tmp_dir_ + "/app.log.new";
  write_file(replacement, "a longer replacement line\n", "w");
  ASSERT_EQ(std::rename(replacement.c_str(), log_path_.c_str()), 0);

  std::string batch;
  ASSERT_FALSE(tailer.ReadDelta(batch).has_value());
  EXPECT_EQ(batch, "a longer replacement line\n");
  EXPECT_EQ(tailer.State().byte_offset, batch.size());
}

TEST_F(TailerTest, DeletedFileIsAnError)
{
  Overwrite("x\n");
  Tailer tailer;
  ASSERT_FALSE(tailer.Open(log_path_).has_value());
  ASSERT_EQ(::unlink(log_path_.c_str()), 0);

  std::string batch;
  auto err = tailer.ReadDelta(batch);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->code, TailErrc::Open);
}

TEST_F(TailerTest, ReadBeforeOpenIsAnError)
{
  Tailer tailer;
  std::string batch;
  EXPECT_TRUE(tailer.ReadDelta(batch).has_value());
}

TEST_F(TailerTest, RunDeliversNonEmptyBatchesUntilSourceFails)
{
  Overwrite("ignored\n");
  ScriptedChanges changes(log_path_);
  changes.Then([this] { Append("X\n"); });
  changes.Then([] {});
  changes.Then([this] { Append("Y\n"); });

  std::vector<std::string> batches;
  Tailer tailer;
  TailError err = tailer.Run(log_path_, changes,
                             [&](std::string_view b) { batches.emplace_back(b); });

  EXPECT_EQ(err.code, TailErrc::Watch);
  EXPECT_EQ(changes.Calls(), 4);
  EXPECT_EQ(batches, (std::vector<std::string>{"X\n", "Y\n"}));
}

// Wraps a PollWatcher and appends to the file at the two moments a polling
// source can miss: before its baseline, and right before it polls.
class AppendingPollSource : public splash::IChangeSource
{
 public:
  AppendingPollSource(std::string path, std::function<void(const std::string&)> append)
      : watcher_(path, std::chrono::milliseconds(1)),
        path_(std::move(path)),
        append_(std::move(append))
  {
  }

  splash::TailStatus Prime() override
  {
    append_("gap\n");
    return watcher_.Prime();
  }

  splash::TailStatus WaitForChange() override
  {
    if (++waits_ > 1)
    {
      return TailError{TailErrc::Watch, path_, 0};
    }
    append_("late\n");
    bool changed = false;
    if (auto err = watcher_.PollOnce(changed))
    {
      return err;
    }
    if (!changed)
    {
      return TailError{TailErrc::Watch, path_, 0};
    }
    return std::nullopt;
  }

 private:
  PollWatcher watcher_;
  std::string path_;
  std::function<void(const std::string&)> append_;
  int waits_ = 0;
};

TEST_F(TailerTest, RunKeepsBytesAppendedBeforeFirstPoll)
{
  Overwrite("old\n");
  AppendingPollSource changes(log_path_, [this](const std::string& text) { Append(text); });

  std::vector<std::string> batches;
  Tailer tailer;
  TailError err = tailer.Run(log_path_, changes,
                             [&](std::string_view b) { batches.emplace_back(b); });

  EXPECT_EQ(err.code, TailErrc::Watch);
  EXPECT_EQ(err.sys_errno, 0);
  EXPECT_EQ(batches, (std::vector<std::string>{"gap\n", "late\n"}));
  EXPECT_EQ(tailer.State().byte_offset, 13u);
}

TEST_F(TailerTest, RunOnMissingFileFailsBeforeWaiting)
{
  ScriptedChanges changes(log_path_);
  Tailer tailer;
  TailError err = tailer.Run(log_path_, changes, [](std::string_view) { FAIL(); });
  EXPECT_EQ(err.code, TailErrc::Open);
  EXPECT_EQ(changes.Calls(), 0);
}

TEST_F(TailerTest, PollWatcherComparesContent)
{
  Overwrite("one\n");
  PollWatcher watcher(log_path_, std::chrono::milliseconds(1));

  bool changed = true;
  ASSERT_FALSE(watcher.PollOnce(changed).has_value());
  EXPECT_FALSE(changed);

  ASSERT_FALSE(watcher.PollOnce(changed).has_value());
  EXPECT_FALSE(changed);

  // Metadata only.
  ASSERT_EQ(::utime(log_path_.c_str(), nullptr), 0);
  ASSERT_FALSE(watcher.PollOnce(changed).has_value());
  EXPECT_FALSE(changed);

  Append("two\n");
  ASSERT_FALSE(watcher.PollOnce(changed).has_value());
  EXPECT_TRUE(changed);

  // Same size, different bytes.
  Overwrite("ONE\ntwo\n");
  ASSERT_FALSE(watcher.PollOnce(changed).has_value());
  EXPECT_TRUE(changed);
}

TEST_F(TailerTest, PollWatcherReportsMissingFile)
{
  PollWatcher watcher(log_path_, std::chrono::milliseconds(1));
  bool changed = false;
  auto err = watcher.PollOnce(changed);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->code, TailErrc::Watch);
  EXPECT_EQ(err->sys_errno, ENOENT);

  err = watcher.WaitForChange();
  ASSERT_TRUE(err.has_value());
}

TEST_F(TailerTest, PollWatcherWaitReturnsAfterChange)
{
  Overwrite("a\n");
  PollWatcher watcher(log_path_, std::chrono::milliseconds(1));
  bool primed = false;
  ASSERT_FALSE(watcher.PollOnce(primed).has_value());

  Append("b\n");
  EXPECT_FALSE(watcher.WaitForChange().has_value());
}

TEST_F(TailerTest, PollWatcherPrimeTakesBaselineOnce)
{
  Overwrite("a\n");
  PollWatcher watcher(log_path_, std::chrono::milliseconds(1));
  ASSERT_FALSE(watcher.Prime().has_value());

  Append("b\n");
  // Already primed: the append must still count as a change.
  ASSERT_FALSE(watcher.Prime().has_value());
  bool changed = false;
  ASSERT_FALSE(watcher.PollOnce(changed).has_value());
  EXPECT_TRUE(changed);
}

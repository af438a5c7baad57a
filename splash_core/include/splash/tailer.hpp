#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "platform.hpp"

namespace splash
{

struct TailState
{
  std::string path;
  uint64_t byte_offset = 0;
  uint64_t last_known_length = 0;
};

enum class TailErrc : uint8_t
{
  Open,
  Stat,
  Seek,
  Read,
  Watch
};

struct TailError
{
  TailErrc code;
  std::string path;
  int sys_errno;

  std::string Message() const;
};

// nullopt on success
using TailStatus = std::optional<TailError>;

// Blocks until the watched file changed. A returned error ends tailing.
class IChangeSource
{
 public:
  virtual ~IChangeSource() = default;

  // Takes the baseline that later changes are measured against. Called once,
  // right after the tailer recorded its starting offset.
  virtual TailStatus Prime() { return std::nullopt; }

  virtual TailStatus WaitForChange() = 0;
};

// Polls a file at a fixed interval and reports a change only when its content
// differs from the previous poll; touching the file is not a change.
class PollWatcher : public IChangeSource
{
 public:
  explicit PollWatcher(std::string path, std::chrono::milliseconds interval =
                                             std::chrono::milliseconds(SPLASH_POLL_INTERVAL_MS));

  // Snapshots the file unless a snapshot already exists.
  TailStatus Prime() override;

  TailStatus WaitForChange() override;

  // One comparison against the previous snapshot, without sleeping. The first
  // call only takes the snapshot.
  TailStatus PollOnce(bool& changed);

 private:
  struct Snapshot
  {
    uint64_t size = 0;
    uint64_t hash = 0;
  };

  TailStatus TakeSnapshot(Snapshot& out) const;

  std::string path_;
  std::chrono::milliseconds interval_;
  bool primed_ = false;
  Snapshot last_;
};

// Follows one file and hands out exactly the bytes appended since the last
// read. Content present when tailing starts is never returned. When the file
// shrinks below the stored offset, or is replaced by another file, reading
// restarts at offset 0 and the whole current content is the next batch.
class Tailer
{
 public:
  using BatchCallback = std::function<void(std::string_view batch)>;

  // Baseline: offset = current length.
  TailStatus Open(const std::string& path);

  // Handles one change event. batch receives [offset, EOF); may be empty.
  TailStatus ReadDelta(std::string& batch);

  // Open(), prime the change source and pass on whatever was appended in
  // between. Then, forever, wait for a change and pass each non-empty delta to
  // cb. Only returns when something failed.
  TailError Run(const std::string& path, IChangeSource& changes, const BatchCallback& cb);

  const TailState& State() const { return state_; }

 private:
  struct FileId
  {
    uint64_t dev = 0;
    uint64_t ino = 0;
    bool operator!=(const FileId& o) const { return dev != o.dev || ino != o.ino; }
  };

  TailState state_;
  FileId file_id_;
  bool opened_ = false;
};

}  // namespace splash

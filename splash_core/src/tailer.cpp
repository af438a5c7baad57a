#include "splash/tailer.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cinttypes>
#include <cstring>
#include <thread>
#include <vector>

#include "splash/logger.hpp"

namespace splash
{

namespace
{

class ScopedFd
{
 public:
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd()
  {
    if (fd_ >= 0)
    {
      ::close(fd_);
    }
  }
  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  int Get() const { return fd_; }

 private:
  int fd_;
};

int OpenReadOnly(const std::string& path)
{
  int flags = O_RDONLY;
#ifdef O_CLOEXEC
  flags |= O_CLOEXEC;
#endif
  return ::open(path.c_str(), flags);
}

// Reads up to EOF, retrying on EINTR. Returns false with errno set on failure.
bool ReadToEnd(int fd, const std::function<void(const char*, size_t)>& consume)
{
  std::vector<char> chunk(SPLASH_READ_CHUNK_SIZE);
  for (;;)
  {
    ssize_t n = ::read(fd, chunk.data(), chunk.size());
    if (n < 0)
    {
      if (errno == EINTR)
      {
        continue;
      }
      return false;
    }
    if (n == 0)
    {
      return true;
    }
    consume(chunk.data(), static_cast<size_t>(n));
  }
}

// 64-bit FNV-1a, fed chunk by chunk.
constexpr uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

uint64_t FnvUpdate(uint64_t hash, const char* data, size_t len)
{
  for (size_t i = 0; i < len; ++i)
  {
    hash ^= static_cast<unsigned char>(data[i]);
    hash *= kFnvPrime;
  }
  return hash;
}

}  // namespace

std::string TailError::Message() const
{
  std::string msg;
  switch (code)
  {
    case TailErrc::Open:
      msg = "cannot open " + path;
      break;
    case TailErrc::Stat:
      msg = "cannot stat " + path;
      break;
    case TailErrc::Seek:
      msg = "cannot seek in " + path;
      break;
    case TailErrc::Read:
      msg = "cannot read " + path;
      break;
    case TailErrc::Watch:
      msg = "watch failed for " + path;
      break;
  }
  if (sys_errno != 0)
  {
    msg += ": ";
    msg += std::strerror(sys_errno);
  }
  return msg;
}

// ===== PollWatcher =====

PollWatcher::PollWatcher(std::string path, std::chrono::milliseconds interval)
    : path_(std::move(path)), interval_(interval)
{
}

TailStatus PollWatcher::TakeSnapshot(Snapshot& out) const
{
  ScopedFd fd(OpenReadOnly(path_));
  if (fd.Get() < 0)
  {
    return TailError{TailErrc::Watch, path_, errno};
  }

  Snapshot snap;
  snap.hash = kFnvOffset;
  bool ok = ReadToEnd(fd.Get(),
                      [&](const char* data, size_t len)
                      {
                        snap.size += len;
                        snap.hash = FnvUpdate(snap.hash, data, len);
                      });
  if (!ok)
  {
    return TailError{TailErrc::Watch, path_, errno};
  }
  out = snap;
  return std::nullopt;
}

TailStatus PollWatcher::PollOnce(bool& changed)
{
  changed = false;
  Snapshot current;
  if (auto err = TakeSnapshot(current))
  {
    return err;
  }

  if (primed_)
  {
    changed = current.size != last_.size || current.hash != last_.hash;
  }
  last_ = current;
  primed_ = true;
  return std::nullopt;
}

TailStatus PollWatcher::Prime()
{
  if (primed_)
  {
    return std::nullopt;
  }
  bool ignored = false;
  return PollOnce(ignored);
}

TailStatus PollWatcher::WaitForChange()
{
  if (auto err = Prime())
  {
    return err;
  }

  for (;;)
  {
    std::this_thread::sleep_for(interval_);
    bool changed = false;
    if (auto err = PollOnce(changed))
    {
      return err;
    }
    if (changed)
    {
      LOG_TRACE("content of %s changed", path_.c_str());
      return std::nullopt;
    }
  }
}

// ===== Tailer =====

TailStatus Tailer::Open(const std::string& path)
{
  ScopedFd fd(OpenReadOnly(path));
  if (fd.Get() < 0)
  {
    return TailError{TailErrc::Open, path, errno};
  }

  struct stat st{};
  if (::fstat(fd.Get(), &st) != 0)
  {
    return TailError{TailErrc::Stat, path, errno};
  }

  state_.path = path;
  state_.last_known_length = static_cast<uint64_t>(st.st_size);
  state_.byte_offset = state_.last_known_length;
  file_id_.dev = static_cast<uint64_t>(st.st_dev);
  file_id_.ino = static_cast<uint64_t>(st.st_ino);
  opened_ = true;

  LOG_INFO("tailing %s from offset %" PRIu64, path.c_str(), state_.byte_offset);
  return std::nullopt;
}

TailStatus Tailer::ReadDelta(std::string& batch)
{
  batch.clear();
  if (!opened_)
  {
    return TailError{TailErrc::Open, state_.path, EBADF};
  }

  ScopedFd fd(OpenReadOnly(state_.path));
  if (fd.Get() < 0)
  {
    return TailError{TailErrc::Open, state_.path, errno};
  }

  struct stat st{};
  if (::fstat(fd.Get(), &st) != 0)
  {
    return TailError{TailErrc::Stat, state_.path, errno};
  }

  const uint64_t length = static_cast<uint64_t>(st.st_size);
  FileId id;
  id.dev = static_cast<uint64_t>(st.st_dev);
  id.ino = static_cast<uint64_t>(st.st_ino);

  uint64_t offset = state_.byte_offset;
  if (id != file_id_)
  {
    LOG_INFO("%s was replaced, reading from the start", state_.path.c_str());
    offset = 0;
    file_id_ = id;
  }
  else if (length < offset)
  {
    LOG_WARN("%s shrank from %" PRIu64 " to %" PRIu64 " bytes, reading from the start",
             state_.path.c_str(), offset, length);
    offset = 0;
  }

  if (::lseek(fd.Get(), static_cast<off_t>(offset), SEEK_SET) == static_cast<off_t>(-1))
  {
    return TailError{TailErrc::Seek, state_.path, errno};
  }

  bool ok = ReadToEnd(fd.Get(), [&](const char* data, size_t len) { batch.append(data, len); });
  if (!ok)
  {
    int err = errno;
    batch.clear();
    return TailError{TailErrc::Read, state_.path, err};
  }

  state_.byte_offset = offset + batch.size();
  state_.last_known_length = length > state_.byte_offset ? length : state_.byte_offset;
  return std::nullopt;
}

TailError Tailer::Run(const std::string& path, IChangeSource& changes, const BatchCallback& cb)
{
  if (auto err = Open(path))
  {
    return *err;
  }

  if (auto err = changes.Prime())
  {
    return *err;
  }

  // Bytes appended before the baseline was taken raise no change event.
  std::string batch;
  if (auto err = ReadDelta(batch))
  {
    return *err;
  }
  if (!batch.empty())
  {
    LOG_DEBUG("%zu byte(s) appended to %s while priming", batch.size(), path.c_str());
    cb(batch);
  }

  for (;;)
  {
    if (auto err = changes.WaitForChange())
    {
      return *err;
    }
    if (auto err = ReadDelta(batch))
    {
      return *err;
    }
    if (!batch.empty())
    {
      LOG_DEBUG("%zu new byte(s) in %s", batch.size(), path.c_str());
      cb(batch);
    }
  }
}

}  // namespace splash

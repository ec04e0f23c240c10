#include "ByteSink.h"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <print>

namespace fat12Image {

// -----------------------------------------------------------------------------
// FileSink
// -----------------------------------------------------------------------------

FileSink::~FileSink() { close(); }

Fat12Result FileSink::open(const std::string& path, bool createIfMissing) {
  close();

  int flags = O_RDWR;
  if (createIfMissing) {
    flags |= O_CREAT;
  }
  fd_ = ::open(path.c_str(), flags, 0644);
  if (fd_ < 0) {
    std::println("[Fat12Image] Failed to open '{}': {}", path,
                 std::strerror(errno));
    return Fat12Result::StorageOpenFailed;
  }
  return Fat12Result::Success;
}

void FileSink::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

Fat12Result FileSink::write(std::span<const std::byte> data) {
  if (fd_ < 0) {
    return Fat12Result::StorageWriteFailed;
  }

  const std::byte* ptr = data.data();
  size_t remaining = data.size();
  while (remaining > 0) {
    ssize_t written = ::write(fd_, ptr, remaining);
    if (written == -1) {
      if (errno == EINTR) {
        continue;
      }
      std::println("[Fat12Image] Write failed: {}", std::strerror(errno));
      return Fat12Result::StorageWriteFailed;
    }
    ptr += written;
    remaining -= static_cast<size_t>(written);
  }
  return Fat12Result::Success;
}

Fat12Result FileSink::seek(uint64_t offset) {
  if (fd_ < 0 || lseek(fd_, static_cast<off_t>(offset), SEEK_SET) == -1) {
    return Fat12Result::StorageSeekFailed;
  }
  return Fat12Result::Success;
}

Fat12Result FileSink::position(uint64_t& offset) {
  off_t current = fd_ < 0 ? -1 : lseek(fd_, 0, SEEK_CUR);
  if (current == -1) {
    return Fat12Result::StorageSeekFailed;
  }
  offset = static_cast<uint64_t>(current);
  return Fat12Result::Success;
}

// -----------------------------------------------------------------------------
// MemorySink
// -----------------------------------------------------------------------------

Fat12Result MemorySink::write(std::span<const std::byte> data) {
  size_t end = position_ + data.size();
  if (end > bytes_.size()) {
    bytes_.resize(end);
  }
  std::copy(data.begin(), data.end(),
            bytes_.begin() + static_cast<std::ptrdiff_t>(position_));
  position_ = end;
  return Fat12Result::Success;
}

Fat12Result MemorySink::seek(uint64_t offset) {
  position_ = static_cast<size_t>(offset);
  return Fat12Result::Success;
}

Fat12Result MemorySink::position(uint64_t& offset) {
  offset = position_;
  return Fat12Result::Success;
}

}  // namespace fat12Image

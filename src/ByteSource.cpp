#include "ByteSource.h"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <print>

namespace fat12Image {

// -----------------------------------------------------------------------------
// FileSource
// -----------------------------------------------------------------------------

FileSource::~FileSource() { close(); }

Fat12Result FileSource::open() {
  close();

  if (path_.empty()) {
    std::println("[Fat12Image] No reserved sector content path given");
    return Fat12Result::ReservedSectorSourceUnavailable;
  }
  fd_ = ::open(path_.c_str(), O_RDONLY);
  if (fd_ < 0) {
    std::println("[Fat12Image] Failed to open reserved sector content '{}': {}",
                 path_, std::strerror(errno));
    return Fat12Result::ReservedSectorSourceUnavailable;
  }
  return Fat12Result::Success;
}

Fat12Result FileSource::read(std::span<std::byte> buffer, size_t& bytesRead) {
  bytesRead = 0;
  if (fd_ < 0) {
    return Fat12Result::ReservedSectorReadFailed;
  }

  while (bytesRead < buffer.size()) {
    ssize_t count =
        ::read(fd_, buffer.data() + bytesRead, buffer.size() - bytesRead);
    if (count == -1) {
      if (errno == EINTR) {
        continue;
      }
      std::println("[Fat12Image] Failed to read '{}': {}", path_,
                   std::strerror(errno));
      return Fat12Result::ReservedSectorReadFailed;
    }
    if (count == 0) {
      break;  // EOF
    }
    bytesRead += static_cast<size_t>(count);
  }
  return Fat12Result::Success;
}

void FileSource::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

// -----------------------------------------------------------------------------
// MemorySource
// -----------------------------------------------------------------------------

Fat12Result MemorySource::open() {
  offset_ = 0;
  return Fat12Result::Success;
}

Fat12Result MemorySource::read(std::span<std::byte> buffer, size_t& bytesRead) {
  bytesRead = std::min(buffer.size(), content_.size() - offset_);
  std::copy_n(content_.begin() + static_cast<std::ptrdiff_t>(offset_),
              bytesRead, buffer.begin());
  offset_ += bytesRead;
  return Fat12Result::Success;
}

}  // namespace fat12Image

#ifndef FAT12_BYTE_SINK_H
#define FAT12_BYTE_SINK_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "Fat12Result.h"

namespace fat12Image {

// Forward-only destination for image bytes.
class ByteSink {
public:
  virtual ~ByteSink() = default;

  // Writes all of data or fails with StorageWriteFailed.
  virtual Fat12Result write(std::span<const std::byte> data) = 0;
};

// Random-access destination. Positions are absolute byte offsets.
class SeekableSink : public ByteSink {
public:
  virtual Fat12Result seek(uint64_t offset) = 0;
  virtual Fat12Result position(uint64_t& offset) = 0;
};

// FileSink
// --------
// Owns a POSIX file descriptor to an image file or block device. Writes go
// through write(2), retrying partial writes and EINTR.
class FileSink : public SeekableSink {
public:
  FileSink() = default;
  ~FileSink() override;

  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;

  // Opens read-write. Existing content is preserved; with createIfMissing
  // the file is created when absent.
  Fat12Result open(const std::string& path, bool createIfMissing);
  void close();
  bool isOpen() const { return fd_ >= 0; }

  Fat12Result write(std::span<const std::byte> data) override;
  Fat12Result seek(uint64_t offset) override;
  Fat12Result position(uint64_t& offset) override;

private:
  int fd_{-1};
};

// MemorySink
// ----------
// Growable in-memory image. Seeking past the end is allowed; the gap is
// zero-filled by the next write.
class MemorySink : public SeekableSink {
public:
  MemorySink() = default;
  explicit MemorySink(std::vector<std::byte> initial)
      : bytes_(std::move(initial)) {}

  Fat12Result write(std::span<const std::byte> data) override;
  Fat12Result seek(uint64_t offset) override;
  Fat12Result position(uint64_t& offset) override;

  const std::vector<std::byte>& bytes() const { return bytes_; }

private:
  std::vector<std::byte> bytes_;
  size_t position_{0};
};

}  // namespace fat12Image

#endif  // FAT12_BYTE_SINK_H

#ifndef FAT12_BYTE_SOURCE_H
#define FAT12_BYTE_SOURCE_H

#include <cstddef>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "Fat12Result.h"

namespace fat12Image {

// Supplies the content of the reserved sectors following the boot sector.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Fails with ReservedSectorSourceUnavailable.
  virtual Fat12Result open() = 0;

  // Fills buffer until it is full or the source is exhausted. bytesRead is
  // smaller than buffer.size() only at end of input. Fails with
  // ReservedSectorReadFailed.
  virtual Fat12Result read(std::span<std::byte> buffer, size_t& bytesRead) = 0;

  virtual void close() = 0;
};

class FileSource : public ByteSource {
public:
  explicit FileSource(std::string path) : path_(std::move(path)) {}
  ~FileSource() override;

  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  Fat12Result open() override;
  Fat12Result read(std::span<std::byte> buffer, size_t& bytesRead) override;
  void close() override;

private:
  std::string path_;
  int fd_{-1};
};

class MemorySource : public ByteSource {
public:
  explicit MemorySource(std::vector<std::byte> content)
      : content_(std::move(content)) {}

  Fat12Result open() override;
  Fat12Result read(std::span<std::byte> buffer, size_t& bytesRead) override;
  void close() override {}

private:
  std::vector<std::byte> content_;
  size_t offset_{0};
};

}  // namespace fat12Image

#endif  // FAT12_BYTE_SOURCE_H

#ifndef FAT12_IMAGE_BUILDER_H
#define FAT12_IMAGE_BUILDER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "ByteSink.h"
#include "ByteSource.h"
#include "Fat12Result.h"
#include "VolumeGeometry.h"

namespace fat12Image {

class ImageBuilder {
public:
  // Constants
  // Low bytes of the reserved FAT[1] entry (end-of-chain).
  static constexpr uint8_t kFatEndOfChain = 0xFF;

  explicit ImageBuilder(const VolumeGeometry& geometry);

  // Seekable Targets
  //
  // Builds the volume at the sink's current position: zero-fill the whole
  // partition, boot sector, reserved sectors, FAT copies. The position is
  // restored afterwards. Without an explicit source, reserved sector content
  // is read from the geometry's content path when reservedSectorCount > 1.
  Fat12Result writeToSink(SeekableSink& sink) const;
  Fat12Result writeToSink(SeekableSink& sink, ByteSource* reservedSource) const;

  // Forward-only Targets
  //
  // Emits the same bytes in one pass. The unread tail of the reserved region
  // and everything after the FATs are written as zero sectors.
  Fat12Result writeToStream(ByteSink& sink) const;
  Fat12Result writeToStream(ByteSink& sink, ByteSource* reservedSource) const;

  // File Targets
  //
  // startByte is where the partition begins inside a larger container. Bytes
  // outside [startByte, startByte + partitionBytes) are never touched, and the
  // file position is restored to its value on entry.
  Fat12Result writeToFile(FileSink& file, uint64_t startByte) const;
  Fat12Result writeToFileAtPath(const std::string& path,
                                uint64_t startByte = 0) const;

  // Accessors
  const VolumeGeometry& geometry() const { return geometry_; }

private:
  Fat12Result writeZeroSectors(ByteSink& sink, uint64_t count) const;
  Fat12Result writeBootSector(ByteSink& sink) const;
  Fat12Result readReservedContent(ByteSource* source,
                                  std::vector<std::byte>& region,
                                  size_t& bytesRead) const;
  Fat12Result writeFatTables(ByteSink& sink) const;

  VolumeGeometry geometry_;
};

// Validates config and builds the image into the file at path, creating the
// file when missing. Fails with GeometryInvalid before the file is opened.
Fat12Result formatImageFile(const VolumeConfig& config,
                            const std::string& path, uint64_t startByte = 0);

}  // namespace fat12Image

#endif  // FAT12_IMAGE_BUILDER_H

// =============================================================================
// ImageBuilder.cpp
// =============================================================================
//
// Writes a complete, empty FAT12 volume.
//
// On-Disk Layout Overview
// -----------------------
//
//   ┌───────────────────────────────────────────────────────────────────────┐
//   │ Sector 0              Boot sector (BPB)                               │
//   ├───────────────────────────────────────────────────────────────────────┤
//   │ Sectors 1..R-1        Reserved sectors                                │
//   │                       Copied from the content source, zero past EOF   │
//   ├───────────────────────────────────────────────────────────────────────┤
//   │ Sector R              FAT Region                                      │
//   │  ├─ FAT 1             fatSize sectors: F8 FF FF, then zero            │
//   │  └─ FAT 2..N          identical copies                                │
//   ├───────────────────────────────────────────────────────────────────────┤
//   │ rootDirStart          Root directory, zero (no entries)               │
//   ├───────────────────────────────────────────────────────────────────────┤
//   │ dataRegionStart       Cluster data, zero                              │
//   └───────────────────────────────────────────────────────────────────────┘
//
// Write Sequence (seekable targets)
// ---------------------------------
//   1. Zero the whole partition, one reused sector buffer at a time.
//   2. Boot sector at sector 0.
//   3. Reserved sector content, exactly as many bytes as the source yields.
//   4. FAT copies starting at sector R.
//   5. Restore the sink position.
//
// Nothing is read back. A failure aborts the sequence and leaves the target
// partially written.
//
// =============================================================================

#include "ImageBuilder.h"

#include <optional>
#include <print>
#include <span>

#include "BootSector.h"

namespace fat12Image {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------

ImageBuilder::ImageBuilder(const VolumeGeometry& geometry)
    : geometry_(geometry) {}

// -----------------------------------------------------------------------------
// Write Steps
// -----------------------------------------------------------------------------

Fat12Result ImageBuilder::writeZeroSectors(ByteSink& sink,
                                           uint64_t count) const {
  const std::vector<std::byte> zeroedSector(geometry_.logicalSectorSize());

  for (uint64_t i = 0; i < count; i++) {
    if (auto result = sink.write(zeroedSector); result != Fat12Result::Success) {
      return result;
    }
  }
  return Fat12Result::Success;
}

Fat12Result ImageBuilder::writeBootSector(ByteSink& sink) const {
  std::println("[Fat12Image] Writing Boot Sector...");
  return sink.write(serializeBootSector(geometry_));
}

Fat12Result ImageBuilder::readReservedContent(ByteSource* source,
                                              std::vector<std::byte>& region,
                                              size_t& bytesRead) const {
  region.assign(geometry_.reservedRegionCapacity(), std::byte{0});
  bytesRead = 0;

  if (source == nullptr) {
    std::println("[Fat12Image] No source for {} reserved sectors",
                 geometry_.reservedSectorCount() - 1);
    return Fat12Result::ReservedSectorSourceUnavailable;
  }

  if (auto result = source->open(); result != Fat12Result::Success) {
    return result;
  }
  // Content beyond the region capacity is never read.
  Fat12Result result = source->read(region, bytesRead);
  source->close();
  return result;
}

Fat12Result ImageBuilder::writeFatTables(ByteSink& sink) const {
  std::vector<std::byte> sector(geometry_.logicalSectorSize());

  std::println("[Fat12Image] Initializing {} FAT(s) of {} sectors...",
               geometry_.fatCount(), geometry_.fatSizeSectors());

  for (unsigned fat = 0; fat < geometry_.fatCount(); fat++) {
    // FAT[0] carries the media descriptor, FAT[1] the end-of-chain marker.
    sector[0] = std::byte{kMediaDescriptor};
    sector[1] = std::byte{kFatEndOfChain};
    sector[2] = std::byte{kFatEndOfChain};
    if (auto result = sink.write(sector); result != Fat12Result::Success) {
      return result;
    }

    // Rest of the FAT is free clusters
    sector[0] = sector[1] = sector[2] = std::byte{0};
    if (auto result = writeZeroSectors(sink, geometry_.fatSizeSectors() - 1u);
        result != Fat12Result::Success) {
      return result;
    }
  }
  return Fat12Result::Success;
}

// -----------------------------------------------------------------------------
// Seekable Targets
// -----------------------------------------------------------------------------

Fat12Result ImageBuilder::writeToSink(SeekableSink& sink) const {
  FileSource source(geometry_.reservedSectorContentPath());
  return writeToSink(sink, &source);
}

Fat12Result ImageBuilder::writeToSink(SeekableSink& sink,
                                      ByteSource* reservedSource) const {
  const uint64_t sectorSize = geometry_.logicalSectorSize();

  uint64_t start = 0;
  if (auto result = sink.position(start); result != Fat12Result::Success) {
    return result;
  }

  std::println("[Fat12Image] Zeroing {} sectors starting at byte {}",
               geometry_.partitionSectorCount(), start);
  if (auto result = writeZeroSectors(sink, geometry_.partitionSectorCount());
      result != Fat12Result::Success) {
    return result;
  }
  if (auto result = sink.seek(start); result != Fat12Result::Success) {
    return result;
  }

  if (auto result = writeBootSector(sink); result != Fat12Result::Success) {
    return result;
  }

  if (geometry_.reservedSectorCount() > 1) {
    std::vector<std::byte> region;
    size_t bytesRead = 0;
    if (auto result = readReservedContent(reservedSource, region, bytesRead);
        result != Fat12Result::Success) {
      return result;
    }

    // The pre-fill already zeroed whatever the source did not cover.
    std::println("[Fat12Image] Writing {} bytes of reserved sector content...",
                 bytesRead);
    if (auto result = sink.write(std::span{region.data(), bytesRead});
        result != Fat12Result::Success) {
      return result;
    }
  }

  if (auto result =
          sink.seek(start + geometry_.fatRegionStartSector() * sectorSize);
      result != Fat12Result::Success) {
    return result;
  }
  if (auto result = writeFatTables(sink); result != Fat12Result::Success) {
    return result;
  }

  return sink.seek(start);
}

// -----------------------------------------------------------------------------
// Forward-only Targets
// -----------------------------------------------------------------------------

Fat12Result ImageBuilder::writeToStream(ByteSink& sink) const {
  FileSource source(geometry_.reservedSectorContentPath());
  return writeToStream(sink, &source);
}

Fat12Result ImageBuilder::writeToStream(ByteSink& sink,
                                        ByteSource* reservedSource) const {
  if (auto result = writeBootSector(sink); result != Fat12Result::Success) {
    return result;
  }

  if (geometry_.reservedSectorCount() > 1) {
    std::vector<std::byte> region;
    size_t bytesRead = 0;
    if (auto result = readReservedContent(reservedSource, region, bytesRead);
        result != Fat12Result::Success) {
      return result;
    }

    // No pre-fill here: the zeroed tail of the buffer stands in for it.
    std::println("[Fat12Image] Writing {} bytes of reserved sector content...",
                 bytesRead);
    if (auto result = sink.write(region); result != Fat12Result::Success) {
      return result;
    }
  }

  if (auto result = writeFatTables(sink); result != Fat12Result::Success) {
    return result;
  }

  const uint64_t remaining =
      geometry_.partitionSectorCount() - geometry_.rootDirStartSector();
  std::println("[Fat12Image] Zeroing {} root directory and data sectors",
               remaining);
  return writeZeroSectors(sink, remaining);
}

// -----------------------------------------------------------------------------
// File Targets
// -----------------------------------------------------------------------------

Fat12Result ImageBuilder::writeToFile(FileSink& file,
                                      uint64_t startByte) const {
  uint64_t entryPosition = 0;
  if (auto result = file.position(entryPosition);
      result != Fat12Result::Success) {
    return result;
  }
  if (auto result = file.seek(startByte); result != Fat12Result::Success) {
    return result;
  }

  if (auto result = writeToSink(file); result != Fat12Result::Success) {
    return result;
  }

  return file.seek(entryPosition);
}

Fat12Result ImageBuilder::writeToFileAtPath(const std::string& path,
                                            uint64_t startByte) const {
  FileSink file;
  if (auto result = file.open(path, true); result != Fat12Result::Success) {
    return result;
  }

  std::println("[Fat12Image] Building {}-byte FAT12 volume in '{}' at byte {}",
               geometry_.partitionBytes(), path, startByte);
  return writeToFile(file, startByte);
}

Fat12Result formatImageFile(const VolumeConfig& config, const std::string& path,
                            uint64_t startByte) {
  std::optional<VolumeGeometry> geometry = VolumeGeometry::make(config);
  if (!geometry) {
    return Fat12Result::GeometryInvalid;
  }
  return ImageBuilder(*geometry).writeToFileAtPath(path, startByte);
}

}  // namespace fat12Image

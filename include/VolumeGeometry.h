// =============================================================================
// VolumeGeometry.h
// =============================================================================
//
// Configuration and validated geometry of a FAT12 volume.
//
// VolumeConfig is a plain aggregate holding the documented defaults. Callers
// override individual fields, then pass it to VolumeGeometry::make(), which
// rejects anything the boot sector cannot describe. The resulting geometry is
// immutable and drives both the boot sector serializer and the image builder,
// so the declared BPB and the physical layout cannot disagree.
//
// VolumeConfig fields are wider than their on-disk encoding; make() rejects
// values that overflow the fixed-width BPB field.
//
// Layout of a volume (partition-relative sectors):
//
//   [0]                               Boot sector (BPB)
//   [1 .. reserved-1]                 Reserved sectors (optional payload)
//   [reserved .. +fatCount*fatSize)   FAT copies
//   [rootDirStart .. +rootDirSectors) Root directory (zeroed)
//   [dataRegionStart .. end)          Cluster data (zeroed)
//
// =============================================================================

#ifndef FAT12_VOLUME_GEOMETRY_H
#define FAT12_VOLUME_GEOMETRY_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace fat12Image {

struct VolumeConfig {
  // Bytes per logical sector. Should match the physical sector size of the
  // target medium. One of 512, 1024, 2048, 4096.
  uint32_t logicalSectorSize{512};

  // Size of the partition in logical sectors. Must cover the reserved, FAT
  // and root directory regions.
  uint64_t partitionSectorCount{0};

  // Logical sectors per cluster. Power of two, at most 128.
  uint32_t clusterSizeSectors{4};

  // Sectors before the first FAT, including the boot sector. At least 1.
  uint32_t reservedSectorCount{1};

  // Maximum number of root directory entries. Entries are 32 bytes and must
  // fill whole sectors: with 512-byte sectors, a multiple of 16. Zero is
  // rejected.
  uint32_t rootFolderCapacity{256};

  uint32_t fatCount{2};

  // Sectors per FAT copy. At least 1.
  uint32_t fatSizeSectors{3};

  // Sectors preceding the partition on the medium (BPB hidden sectors).
  uint64_t hiddenSectors{0};

  uint32_t volumeId{0};
  std::string volumeLabel{"NO NAME"};

  // File supplying the content of reserved sectors 1..N-1. Only opened when
  // reservedSectorCount > 1.
  std::string reservedSectorContentPath;

  static VolumeConfig withDefaults(uint64_t partitionSectorCount,
                                   uint32_t sectorSize);
};

class VolumeGeometry {
public:
  static constexpr uint32_t kDirectoryEntrySize = 32;
  static constexpr uint32_t kMaxFat12Clusters = 0xFF4;
  static constexpr size_t kVolumeLabelLength = 11;

  // Returns std::nullopt when the configuration cannot be encoded. The
  // reason is logged.
  static std::optional<VolumeGeometry> make(const VolumeConfig& config);

  uint16_t logicalSectorSize() const { return logicalSectorSize_; }
  uint64_t partitionSectorCount() const { return partitionSectorCount_; }
  uint8_t clusterSizeSectors() const { return clusterSizeSectors_; }
  uint16_t reservedSectorCount() const { return reservedSectorCount_; }
  uint16_t rootFolderCapacity() const { return rootFolderCapacity_; }
  uint8_t fatCount() const { return fatCount_; }
  uint16_t fatSizeSectors() const { return fatSizeSectors_; }
  uint32_t hiddenSectors() const { return hiddenSectors_; }
  uint32_t volumeId() const { return volumeId_; }
  const std::array<char, kVolumeLabelLength>& volumeLabel() const {
    return volumeLabel_;
  }
  const std::string& reservedSectorContentPath() const {
    return reservedSectorContentPath_;
  }

  // Derived layout
  uint32_t rootDirSectors() const;
  uint32_t fatRegionStartSector() const { return reservedSectorCount_; }
  uint32_t rootDirStartSector() const;
  uint32_t dataRegionStartSector() const;
  uint64_t clusterCount() const;
  uint64_t partitionBytes() const;
  size_t reservedRegionCapacity() const;

private:
  VolumeGeometry(const VolumeConfig& config,
                 std::array<char, kVolumeLabelLength> volumeLabel);

  uint16_t logicalSectorSize_;
  uint64_t partitionSectorCount_;
  uint8_t clusterSizeSectors_;
  uint16_t reservedSectorCount_;
  uint16_t rootFolderCapacity_;
  uint8_t fatCount_;
  uint16_t fatSizeSectors_;
  uint32_t hiddenSectors_;
  uint32_t volumeId_;
  std::array<char, kVolumeLabelLength> volumeLabel_;
  std::string reservedSectorContentPath_;
};

}  // namespace fat12Image

#endif  // FAT12_VOLUME_GEOMETRY_H

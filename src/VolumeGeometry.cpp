#include "VolumeGeometry.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <print>
#include <string_view>

namespace fat12Image {

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------

// FAT12 stores one entry per 12 bits, so two entries share three bytes.
static constexpr uint64_t kFat12EntriesPerThreeBytes = 2;

static bool isPowerOfTwo(uint64_t value) {
  return value != 0 && (value & (value - 1)) == 0;
}

static bool reject(std::string_view field, uint64_t value,
                   std::string_view reason) {
  std::println("[Fat12Image] Invalid geometry: {} = {} ({})", field, value,
               reason);
  return false;
}

static std::array<char, VolumeGeometry::kVolumeLabelLength> prepareVolumeLabel(
    std::string_view label) {
  std::array<char, VolumeGeometry::kVolumeLabelLength> result;
  result.fill(' ');
  size_t len = std::min(label.length(), result.size());
  for (size_t i = 0; i < len; i++) {
    result[i] =
        static_cast<char>(std::toupper(static_cast<unsigned char>(label[i])));
  }
  return result;
}

static bool validate(const VolumeConfig& config) {
  constexpr uint64_t kMax8 = std::numeric_limits<uint8_t>::max();
  constexpr uint64_t kMax16 = std::numeric_limits<uint16_t>::max();
  constexpr uint64_t kMax32 = std::numeric_limits<uint32_t>::max();

  switch (config.logicalSectorSize) {
    case 512:
    case 1024:
    case 2048:
    case 4096:
      break;
    default:
      return reject("logicalSectorSize", config.logicalSectorSize,
                    "must be 512, 1024, 2048 or 4096");
  }
  if (!isPowerOfTwo(config.clusterSizeSectors) ||
      config.clusterSizeSectors > 128) {
    return reject("clusterSizeSectors", config.clusterSizeSectors,
                  "must be a power of two up to 128");
  }
  if (config.reservedSectorCount == 0 || config.reservedSectorCount > kMax16) {
    return reject("reservedSectorCount", config.reservedSectorCount,
                  "must be between 1 and 65535");
  }
  if (config.rootFolderCapacity == 0 || config.rootFolderCapacity > kMax16) {
    return reject("rootFolderCapacity", config.rootFolderCapacity,
                  "must be between 1 and 65535");
  }
  if ((uint64_t{config.rootFolderCapacity} *
       VolumeGeometry::kDirectoryEntrySize) %
          config.logicalSectorSize !=
      0) {
    return reject("rootFolderCapacity", config.rootFolderCapacity,
                  "root directory must fill whole sectors");
  }
  if (config.fatCount == 0 || config.fatCount > kMax8) {
    return reject("fatCount", config.fatCount, "must be between 1 and 255");
  }
  if (config.fatSizeSectors == 0 || config.fatSizeSectors > kMax16) {
    return reject("fatSizeSectors", config.fatSizeSectors,
                  "must be between 1 and 65535");
  }
  if (config.hiddenSectors > kMax32) {
    return reject("hiddenSectors", config.hiddenSectors,
                  "does not fit in 32 bits");
  }
  if (config.partitionSectorCount > kMax32) {
    return reject("partitionSectorCount", config.partitionSectorCount,
                  "does not fit in 32 bits");
  }

  uint64_t rootDirSectors = uint64_t{config.rootFolderCapacity} *
                            VolumeGeometry::kDirectoryEntrySize /
                            config.logicalSectorSize;
  uint64_t metadataSectors =
      uint64_t{config.reservedSectorCount} +
      uint64_t{config.fatCount} * config.fatSizeSectors + rootDirSectors;
  if (config.partitionSectorCount < metadataSectors) {
    return reject("partitionSectorCount", config.partitionSectorCount,
                  "smaller than reserved, FAT and root directory regions");
  }

  return true;
}

// -----------------------------------------------------------------------------
// VolumeConfig
// -----------------------------------------------------------------------------

VolumeConfig VolumeConfig::withDefaults(uint64_t partitionSectorCount,
                                        uint32_t sectorSize) {
  VolumeConfig config;
  config.partitionSectorCount = partitionSectorCount;
  config.logicalSectorSize = sectorSize;
  return config;
}

// -----------------------------------------------------------------------------
// Factory & Constructor
// -----------------------------------------------------------------------------

VolumeGeometry::VolumeGeometry(const VolumeConfig& config,
                               std::array<char, kVolumeLabelLength> volumeLabel)
    : logicalSectorSize_(static_cast<uint16_t>(config.logicalSectorSize)),
      partitionSectorCount_(config.partitionSectorCount),
      clusterSizeSectors_(static_cast<uint8_t>(config.clusterSizeSectors)),
      reservedSectorCount_(static_cast<uint16_t>(config.reservedSectorCount)),
      rootFolderCapacity_(static_cast<uint16_t>(config.rootFolderCapacity)),
      fatCount_(static_cast<uint8_t>(config.fatCount)),
      fatSizeSectors_(static_cast<uint16_t>(config.fatSizeSectors)),
      hiddenSectors_(static_cast<uint32_t>(config.hiddenSectors)),
      volumeId_(config.volumeId),
      volumeLabel_(volumeLabel),
      reservedSectorContentPath_(config.reservedSectorContentPath) {}

std::optional<VolumeGeometry> VolumeGeometry::make(const VolumeConfig& config) {
  if (!validate(config)) {
    return std::nullopt;
  }

  VolumeGeometry geometry(config, prepareVolumeLabel(config.volumeLabel));

  // A FAT12 reader derives the FAT type from the cluster count, and the FAT
  // has to describe clusters 0..clusterCount+1. Neither affects the bytes
  // written, so these are reported rather than rejected.
  uint64_t clusters = geometry.clusterCount();
  if (clusters > kMaxFat12Clusters) {
    std::println(
        "[Fat12Image] Warning: {} clusters exceeds the FAT12 limit of {}",
        clusters, kMaxFat12Clusters);
  }
  uint64_t fatEntries = uint64_t{geometry.fatSizeSectors()} *
                        geometry.logicalSectorSize() *
                        kFat12EntriesPerThreeBytes / 3;
  if (fatEntries < clusters + 2) {
    std::println(
        "[Fat12Image] Warning: FAT holds {} entries but the volume has {} "
        "clusters",
        fatEntries, clusters);
  }

  return geometry;
}

// -----------------------------------------------------------------------------
// Derived Layout
// -----------------------------------------------------------------------------

uint32_t VolumeGeometry::rootDirSectors() const {
  return uint32_t{rootFolderCapacity_} * kDirectoryEntrySize /
         logicalSectorSize_;
}

uint32_t VolumeGeometry::rootDirStartSector() const {
  return fatRegionStartSector() + uint32_t{fatCount_} * fatSizeSectors_;
}

uint32_t VolumeGeometry::dataRegionStartSector() const {
  return rootDirStartSector() + rootDirSectors();
}

uint64_t VolumeGeometry::clusterCount() const {
  return (partitionSectorCount_ - dataRegionStartSector()) /
         clusterSizeSectors_;
}

uint64_t VolumeGeometry::partitionBytes() const {
  return partitionSectorCount_ * logicalSectorSize_;
}

size_t VolumeGeometry::reservedRegionCapacity() const {
  return size_t{reservedSectorCount_ - 1u} * logicalSectorSize_;
}

}  // namespace fat12Image

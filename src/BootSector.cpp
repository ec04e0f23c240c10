// =============================================================================
// BootSector.cpp
// =============================================================================
//
// FAT12 boot sector encoding.
//
// The boot sector is the first sector of the volume. Any FAT driver reads it
// to learn the volume geometry, so every field here must agree with what the
// image builder actually lays out on disk.
//
//   Offset  Size  Field
//   0x000      3  VBR_jmpBoot
//   0x003      8  VBR_oemName
//   0x00B     25  BIOS Parameter Block
//   0x024     26  Extended boot record (drive, signature, id, label, type)
//   0x03E    448  Boot code (zeroed)
//   0x1FE      2  Signature 0xAA55
//
// The structures are packed and copied as raw bytes, which yields the
// little-endian encoding the FAT format requires on little-endian hosts.
//
// =============================================================================

#include "BootSector.h"

#include <array>
#include <bit>
#include <cstring>
#include <limits>
#include <span>

namespace fat12Image {

static_assert(std::endian::native == std::endian::little,
              "Boot sector structures are serialized in host byte order");

// -----------------------------------------------------------------------------
// Constants
// -----------------------------------------------------------------------------

// Short jump over the BPB to offset 0x3E, followed by NOP.
static constexpr std::array<uint8_t, 3> kJmpBoot{0xEB, 0x3C, 0x90};

// kBootSignature: 0x55 at offset 510, 0xAA at offset 511.
static constexpr uint16_t kBootSignature = 0xAA55;

// 0x29 marks volumeId, volumeLabel and fsType as present.
static constexpr uint8_t kExtendedBootSignature = 0x29;

// INT 13h drive number for the first fixed disk, matching kMediaDescriptor.
static constexpr uint8_t kDriveNumber = 0x80;

// Legacy CHS geometry reported to INT 13h.
static constexpr uint16_t kSectorsPerTrack = 63;
static constexpr uint16_t kHeadCount = 255;

static constexpr size_t kBootRecordSize = 512;

// -----------------------------------------------------------------------------
// On-Disk Structures
// -----------------------------------------------------------------------------

struct BiosParameterBlock {
  // BPB_bytesPerSector: 512, 1024, 2048 or 4096.
  const uint16_t bytesPerSector;

  // BPB_sectorsPerCluster: power of two, 1..128.
  const uint8_t sectorsPerCluster;

  // BPB_reservedSectorCount: includes the boot sector itself.
  const uint16_t reservedSectorCount;

  const uint8_t fatCount;

  // BPB_rootEntryCount: 32-byte entries in the fixed root directory.
  const uint16_t rootEntryCount;

  // BPB_totalSectors16: used when the volume has fewer than 65536 sectors,
  // otherwise 0 and totalSectors32 holds the count.
  const uint16_t totalSectors16;

  const uint8_t mediaDescriptor{kMediaDescriptor};

  // BPB_fatSize16: sectors occupied by one FAT copy.
  const uint16_t fatSize16;

  const uint16_t sectorsPerTrack{kSectorsPerTrack};
  const uint16_t headCount{kHeadCount};

  // BPB_hiddenSectors: sectors preceding the partition on the medium.
  const uint32_t hiddenSectors;

  const uint32_t totalSectors32;
} __attribute__((packed));

static_assert(sizeof(BiosParameterBlock) == 25,
              "BiosParameterBlock must be 25 bytes");

struct Fat12BootSector {
  const std::array<uint8_t, 3> jmpBoot{kJmpBoot};
  const std::array<char, 8> oemName{'M', 'S', 'W', 'I', 'N', '4', '.', '1'};

  const BiosParameterBlock bpb;

  const uint8_t driveNumber{kDriveNumber};
  const uint8_t reserved1{0};
  const uint8_t bootSignature{kExtendedBootSignature};
  const uint32_t volumeId;
  const std::array<char, 11> volumeLabel;

  // VBR_fsType: informational only, readers determine the FAT type from the
  // cluster count.
  const std::array<char, 8> fsType{'F', 'A', 'T', '1', '2', ' ', ' ', ' '};

  const std::array<std::byte, 448> bootCode{};
  const uint16_t signature{kBootSignature};
} __attribute__((packed));

static_assert(sizeof(Fat12BootSector) == kBootRecordSize,
              "Fat12BootSector must be 512 bytes");

// -----------------------------------------------------------------------------
// Serialization
// -----------------------------------------------------------------------------

std::vector<std::byte> serializeBootSector(const VolumeGeometry& geometry) {
  const uint64_t totalSectors = geometry.partitionSectorCount();
  const bool fitsIn16 =
      totalSectors <= std::numeric_limits<uint16_t>::max();

  const Fat12BootSector bootSector = {
      .bpb =
          {
              .bytesPerSector = geometry.logicalSectorSize(),
              .sectorsPerCluster = geometry.clusterSizeSectors(),
              .reservedSectorCount = geometry.reservedSectorCount(),
              .fatCount = geometry.fatCount(),
              .rootEntryCount = geometry.rootFolderCapacity(),
              .totalSectors16 =
                  fitsIn16 ? static_cast<uint16_t>(totalSectors) : uint16_t{0},
              .fatSize16 = geometry.fatSizeSectors(),
              .hiddenSectors = geometry.hiddenSectors(),
              .totalSectors32 =
                  fitsIn16 ? uint32_t{0} : static_cast<uint32_t>(totalSectors),
          },
      .volumeId = geometry.volumeId(),
      .volumeLabel = geometry.volumeLabel(),
  };

  std::vector<std::byte> sector(geometry.logicalSectorSize());
  auto record = std::as_bytes(std::span{&bootSector, 1});
  std::memcpy(sector.data(), record.data(), record.size());
  return sector;
}

}  // namespace fat12Image

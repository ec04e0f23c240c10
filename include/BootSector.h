#ifndef FAT12_BOOT_SECTOR_H
#define FAT12_BOOT_SECTOR_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "VolumeGeometry.h"

namespace fat12Image {

// Media descriptor for fixed disks. Stored in the BPB and in FAT[0].
inline constexpr uint8_t kMediaDescriptor = 0xF8;

// serializeBootSector
// -------------------
// Encodes the FAT12 boot sector (BIOS Parameter Block plus extended boot
// record) for the given geometry. The result is exactly one logical sector
// long; bytes past offset 512 are zero. All integers are little-endian.
//
// Pure: no I/O, no failure path. The geometry has already been validated by
// VolumeGeometry::make(), so every field fits its on-disk width.
std::vector<std::byte> serializeBootSector(const VolumeGeometry& geometry);

}  // namespace fat12Image

#endif  // FAT12_BOOT_SECTOR_H

#ifndef FAT12_RESULT_H
#define FAT12_RESULT_H

#include <string_view>

/**
 * @brief Result codes for FAT12 image generation.
 *
 * Every operation that touches storage returns one of these. The first
 * failure aborts the remaining write sequence and is returned unchanged.
 */
enum class Fat12Result {
  Success = 0,
  GeometryInvalid,
  StorageOpenFailed,
  StorageWriteFailed,
  StorageSeekFailed,
  ReservedSectorSourceUnavailable,
  ReservedSectorReadFailed
};

constexpr std::string_view fat12ResultName(Fat12Result result) {
  switch (result) {
    case Fat12Result::Success:
      return "Success";
    case Fat12Result::GeometryInvalid:
      return "GeometryInvalid";
    case Fat12Result::StorageOpenFailed:
      return "StorageOpenFailed";
    case Fat12Result::StorageWriteFailed:
      return "StorageWriteFailed";
    case Fat12Result::StorageSeekFailed:
      return "StorageSeekFailed";
    case Fat12Result::ReservedSectorSourceUnavailable:
      return "ReservedSectorSourceUnavailable";
    case Fat12Result::ReservedSectorReadFailed:
      return "ReservedSectorReadFailed";
  }
  return "Unknown";
}

#endif  // FAT12_RESULT_H

/// @file MakeImage.cpp
/// @brief Command-line tool that writes an empty FAT12 volume.
///
/// Usage: make_fat12_image <path> <sector-count> [options]
///
/// Builds a VolumeConfig from the documented defaults and the options given,
/// validates it, and writes the volume into the file at @p path (created if
/// missing, never truncated).  With --offset the volume is embedded at that
/// byte offset of a larger container and the surrounding bytes are left
/// untouched.  Exits 0 on success, 1 on any failure.

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <print>
#include <stdexcept>
#include <string>
#include <string_view>

#include "Fat12Result.h"
#include "ImageBuilder.h"
#include "VolumeGeometry.h"

static void printUsage() {
  std::println(stderr,
               "Usage: make_fat12_image <path> <sector-count> [options]\n"
               "  --offset BYTES           partition start inside the file\n"
               "  --sector-size N          bytes per logical sector (512)\n"
               "  --cluster-size N         sectors per cluster (4)\n"
               "  --reserved N             reserved sectors (1)\n"
               "  --reserved-content PATH  content of reserved sectors 1..N-1\n"
               "  --root-capacity N        root directory entries (256)\n"
               "  --fats N                 number of FAT copies (2)\n"
               "  --fat-size N             sectors per FAT (3)\n"
               "  --hidden N               hidden sectors (0)\n"
               "  --volume-id N            volume serial number (0)\n"
               "  --label TEXT             volume label (NO NAME)\n"
               "Numbers are decimal, or hexadecimal with a 0x prefix.");
}

// Numbers are decimal, or hexadecimal with a 0x prefix. A leading zero does
// not select octal. std::stoull skips whitespace and accepts a sign, so the
// text must start with a digit.
static std::optional<uint64_t> parseNumber(std::string_view text) {
  if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
    return std::nullopt;
  }
  int base = 10;
  if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    base = 16;
    text.remove_prefix(2);
    if (!std::isxdigit(static_cast<unsigned char>(text.front()))) {
      return std::nullopt;
    }
  }
  try {
    size_t consumed = 0;
    uint64_t value = std::stoull(std::string(text), &consumed, base);
    if (consumed != text.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

int main(int argc, char* argv[]) {
  if (argc < 3) {
    printUsage();
    return 1;
  }

  const std::string path = argv[1];
  const std::optional<uint64_t> sectorCount = parseNumber(argv[2]);
  if (!sectorCount) {
    std::println(stderr, "Error: Invalid sector count '{}'", argv[2]);
    return 1;
  }

  fat12Image::VolumeConfig config =
      fat12Image::VolumeConfig::withDefaults(*sectorCount, 512);
  uint64_t offset = 0;

  struct NumericOption {
    std::string_view name;
    uint64_t* target64;
    uint32_t* target32;
  };

  const NumericOption numericOptions[] = {
      {"--offset", &offset, nullptr},
      {"--sector-size", nullptr, &config.logicalSectorSize},
      {"--cluster-size", nullptr, &config.clusterSizeSectors},
      {"--reserved", nullptr, &config.reservedSectorCount},
      {"--root-capacity", nullptr, &config.rootFolderCapacity},
      {"--fats", nullptr, &config.fatCount},
      {"--fat-size", nullptr, &config.fatSizeSectors},
      {"--hidden", &config.hiddenSectors, nullptr},
      {"--volume-id", nullptr, &config.volumeId},
  };

  for (int i = 3; i < argc; i++) {
    const std::string_view option = argv[i];
    if (i + 1 >= argc) {
      std::println(stderr, "Error: Missing value for '{}'", option);
      printUsage();
      return 1;
    }
    const std::string_view value = argv[++i];

    if (option == "--label") {
      config.volumeLabel = value;
      continue;
    }
    if (option == "--reserved-content") {
      config.reservedSectorContentPath = value;
      continue;
    }

    bool matched = false;
    for (const auto& numeric : numericOptions) {
      if (option != numeric.name) {
        continue;
      }
      matched = true;
      const std::optional<uint64_t> number = parseNumber(value);
      if (!number || (numeric.target32 != nullptr && *number > UINT32_MAX)) {
        std::println(stderr, "Error: Invalid value '{}' for '{}'", value,
                     option);
        return 1;
      }
      if (numeric.target32 != nullptr) {
        *numeric.target32 = static_cast<uint32_t>(*number);
      } else {
        *numeric.target64 = *number;
      }
    }
    if (!matched) {
      std::println(stderr, "Error: Unknown option '{}'", option);
      printUsage();
      return 1;
    }
  }

  std::println("[MakeImage] Writing FAT12 image '{}'...", path);
  const Fat12Result result = fat12Image::formatImageFile(config, path, offset);
  if (result != Fat12Result::Success) {
    std::println(stderr, "Error: Image build failed ({})",
                 fat12ResultName(result));
    return 1;
  }

  std::println("[MakeImage] Done.");
  return 0;
}

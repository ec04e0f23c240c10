#include <sys/wait.h>
#include <unistd.h>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <print>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using std::println;

struct CommandResult {
  int exitCode;
  std::string output;
};

// Runs @p cmd through the shell with stderr folded into the captured output.
// exitCode is -1 when the command did not exit normally.
CommandResult runTool(const std::string& cmd) {
  FILE* pipe = popen((cmd + " 2>&1").c_str(), "r");
  if (pipe == nullptr) {
    throw std::runtime_error("Cannot start: " + cmd);
  }

  CommandResult result{-1, {}};
  std::string chunk(4096, '\0');
  size_t n = 0;
  while ((n = fread(chunk.data(), 1, chunk.size(), pipe)) > 0) {
    result.output.append(chunk, 0, n);
  }

  const int status = pclose(pipe);
  if (status != -1 && WIFEXITED(status)) {
    result.exitCode = WEXITSTATUS(status);
  }
  return result;
}

std::string tempImage(const std::string& name) {
  return (fs::temp_directory_path() /
          ("fat12image_it_" + std::to_string(getpid()) + "_" + name))
      .string();
}

uint8_t patternByte(uint64_t offset) {
  return static_cast<uint8_t>(offset % 253 + 1);
}

// Writes a container of @p sizeBytes where every byte is patternByte(offset),
// so bytes the tool must not touch are recognizable afterwards.
void writePatternedContainer(const std::string& filename, uint64_t sizeBytes) {
  std::vector<uint8_t> buffer(sizeBytes);
  for (uint64_t b = 0; b < sizeBytes; b++) {
    buffer[b] = patternByte(b);
  }

  FILE* f = fopen(filename.c_str(), "wb");
  if (f == nullptr) {
    throw std::runtime_error("Cannot create container " + filename);
  }
  const size_t written = fwrite(buffer.data(), 1, buffer.size(), f);
  if (fclose(f) != 0 || written != buffer.size()) {
    throw std::runtime_error("Short write to container " + filename);
  }
}

std::vector<uint8_t> readImage(const std::string& filename) {
  std::vector<uint8_t> data(fs::file_size(filename));
  FILE* f = fopen(filename.c_str(), "rb");
  if (!f) {
    throw std::runtime_error("Failed to read image");
  }
  size_t read = fread(data.data(), 1, data.size(), f);
  fclose(f);
  if (read != data.size()) {
    throw std::runtime_error("Short read from image");
  }
  return data;
}

uint16_t le16(const std::vector<uint8_t>& bytes, size_t offset) {
  return static_cast<uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
}

uint32_t le32(const std::vector<uint8_t>& bytes, size_t offset) {
  return le16(bytes, offset) | (uint32_t{le16(bytes, offset + 2)} << 16);
}

std::string findChecker() {
  for (const char* name : {"fsck.fat", "dosfsck", "fsck.vfat"}) {
    if (runTool(std::string("command -v ") + name).exitCode == 0) {
      return name;
    }
  }
  return "";
}

// -----------------------------------------------------------------------------
// Tests
// -----------------------------------------------------------------------------

bool testEmbeddedAtOffset(const std::string& tool) {
  println("------------------------------------------------");
  println("Running Test: embedded volume at offset");
  const std::string imgFile = tempImage("embedded.img");
  const uint64_t offset = 1024 * 1024;
  const uint64_t partitionBytes = 2880 * 512;
  const uint64_t containerBytes = offset + partitionBytes + 65536;

  println("[*] Creating container...");
  writePatternedContainer(imgFile, containerBytes);

  println("[*] Formatting...");
  auto [rc, out] = runTool(tool + " " + imgFile + " 2880 --offset " +
                              std::to_string(offset) +
                              " --hidden 2048 --label embedded --volume-id "
                              "0x1234ABCD");
  if (rc != 0) {
    println(stderr, "    [!] Tool failed (Exit Code {}):\n{}", rc, out);
    fs::remove(imgFile);
    return false;
  }

  const std::vector<uint8_t> image = readImage(imgFile);
  fs::remove(imgFile);

  bool passed = image.size() == containerBytes;
  for (uint64_t b = 0; passed && b < offset; b++) {
    passed = image[b] == patternByte(b);
  }
  for (uint64_t b = offset + partitionBytes; passed && b < containerBytes;
       b++) {
    passed = image[b] == patternByte(b);
  }
  if (!passed) {
    println(stderr, "    [!] Bytes outside the partition were modified");
    return false;
  }

  passed = le16(image, offset + 0x0B) == 512 &&
           le16(image, offset + 0x13) == 2880 &&
           le32(image, offset + 0x1C) == 2048 &&
           le32(image, offset + 0x27) == 0x1234ABCD &&
           std::string(image.begin() + offset + 0x2B,
                        image.begin() + offset + 0x2B + 11) == "EMBEDDED   " &&
           image[offset + 510] == 0x55 && image[offset + 511] == 0xAA;
  if (!passed) {
    println(stderr, "    [!] Boot sector fields do not match");
    return false;
  }

  for (uint64_t fat : {offset + 512, offset + 2048}) {
    passed &= image[fat] == 0xF8 && image[fat + 1] == 0xFF &&
              image[fat + 2] == 0xFF;
  }
  for (uint64_t b = offset + 3584; passed && b < offset + partitionBytes;
       b++) {
    passed = image[b] == 0;
  }
  if (!passed) {
    println(stderr, "    [!] FAT or data region content is wrong");
    return false;
  }

  println("    [+] Layout verified.");
  return true;
}

bool testFsck(const std::string& tool) {
  println("------------------------------------------------");
  println("Running Test: fsck on a standalone image");

  const std::string checker = findChecker();
  if (checker.empty()) {
    println("    [-] No FAT checker installed, skipping.");
    return true;
  }

  const std::string imgFile = tempImage("standalone.img");
  fs::remove(imgFile);

  println("[*] Formatting...");
  auto [rc, out] = runTool(tool + " " + imgFile + " 2880");
  if (rc != 0) {
    println(stderr, "    [!] Tool failed (Exit Code {}):\n{}", rc, out);
    fs::remove(imgFile);
    return false;
  }

  println("[*] Verifying with {}...", checker);
  auto [fsckRc, fsckOut] = runTool(checker + " -n " + imgFile);
  fs::remove(imgFile);
  if (fsckRc != 0) {
    println(stderr, "    [!] FSCK Failed (Exit Code {}):\n{}", fsckRc,
            fsckOut);
    return false;
  }

  println("    [+] FSCK passed.");
  return true;
}

bool testRejectedArguments(const std::string& tool) {
  println("------------------------------------------------");
  println("Running Test: rejected configurations");
  const std::string imgFile = tempImage("rejected.img");
  fs::remove(imgFile);

  auto [rc, out] =
      runTool(tool + " " + imgFile + " 2880 --root-capacity 10");
  if (rc != 1 || out.find("GeometryInvalid") == std::string::npos ||
      fs::exists(imgFile)) {
    println(stderr, "    [!] Invalid root capacity not rejected:\n{}", out);
    fs::remove(imgFile);
    return false;
  }

  auto [missingRc, missingOut] =
      runTool(tool + " " + imgFile +
                 " 2880 --reserved 2 --reserved-content /nonexistent/boot.bin");
  fs::remove(imgFile);
  if (missingRc != 1 ||
      missingOut.find("ReservedSectorSourceUnavailable") == std::string::npos) {
    println(stderr, "    [!] Missing reserved content not reported:\n{}",
            missingOut);
    return false;
  }

  println("    [+] Failures reported.");
  return true;
}

bool testNumberParsing(const std::string& tool) {
  println("------------------------------------------------");
  println("Running Test: numeric argument parsing");
  const std::string imgFile = tempImage("numbers.img");
  fs::remove(imgFile);

  // A leading zero is decimal: 010 sectors per FAT, not 8.
  auto [rc, out] = runTool(tool + " " + imgFile + " 2880 --fat-size 010");
  if (rc != 0) {
    println(stderr, "    [!] Tool failed (Exit Code {}):\n{}", rc, out);
    fs::remove(imgFile);
    return false;
  }
  const std::vector<uint8_t> image = readImage(imgFile);
  fs::remove(imgFile);
  const size_t secondFat = 512 + 10 * 512;
  if (le16(image, 0x16) != 10 || image[secondFat] != 0xF8 ||
      image[secondFat + 1] != 0xFF || image[secondFat + 2] != 0xFF) {
    println(stderr, "    [!] --fat-size 010 not read as decimal ten");
    return false;
  }

  for (const char* bad : {"' -5'", "-5", "+5", "0x", "12abc"}) {
    auto [badRc, badOut] =
        runTool(tool + " " + imgFile + " 2880 --fats " + bad);
    if (badRc != 1 || badOut.find("Invalid value") == std::string::npos ||
        fs::exists(imgFile)) {
      println(stderr, "    [!] --fats {} accepted:\n{}", bad, badOut);
      fs::remove(imgFile);
      return false;
    }
  }

  println("    [+] Numbers parsed as documented.");
  return true;
}

int main(int argc, char* argv[]) {
  if (argc != 2) {
    println(stderr, "Usage: integration_runner <path-to-make_fat12_image>");
    return 1;
  }

  const std::string tool = argv[1];
  if (!fs::exists(tool)) {
    println(stderr, "Error: {} not found. Build it first.", tool);
    return 1;
  }

  bool (*const tests[])(const std::string&) = {
      testEmbeddedAtOffset,
      testFsck,
      testRejectedArguments,
      testNumberParsing,
  };

  int failed = 0;
  for (auto test : tests) {
    try {
      if (!test(tool)) {
        println("RESULT: [FAILED]");
        failed++;
        continue;
      }
    } catch (const std::exception& e) {
      println(stderr, "Exception: {}", e.what());
      println("RESULT: [FAILED]");
      failed++;
      continue;
    }
    println("RESULT: [PASSED]");
  }

  println("------------------------------------------------");
  if (failed == 0) {
    println("ALL TESTS PASSED");
    return 0;
  } else {
    println("{} TEST(S) FAILED", failed);
    return 1;
  }
}

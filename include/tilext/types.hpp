#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tilext {

// Kind of member stored in a tar archive
enum class EntryType : uint8_t {
  File,
  Directory,
  Other, // Links, devices, fifos: recorded but never extracted
};

// Member entry in a tar archive
struct TarEntry {
  std::string path;  // Normalized to forward slashes, no trailing slash
  EntryType type = EntryType::File;
  uint64_t offset = 0; // Absolute offset of the member data within the archive
  uint64_t size = 0;   // Declared data size in bytes
  uint32_t mode = 0644;
  int64_t mtime = 0; // Seconds since the epoch
};

// ustar layout constants
struct TarFormat {
  static constexpr size_t blockSize = 512;
  static constexpr size_t recordSize = 20 * blockSize; // Archives are padded to full records
  static constexpr size_t nameSize = 100;
  static constexpr size_t prefixSize = 155;

  // Largest size representable in the 11 octal digits of the size field
  static constexpr uint64_t maxOctalSize = 077777777777ull;

  // Number of blocks occupied by a member payload of the given size
  static constexpr uint64_t paddedSize(uint64_t size) noexcept {
    return (size + blockSize - 1) / blockSize * blockSize;
  }
};

// Missing, unreadable or invalid configuration
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &msg) : std::runtime_error(msg) {}
};

// Tile root missing, not a directory, or without any tile
class NoTilesFoundError : public std::runtime_error {
public:
  explicit NoTilesFoundError(const std::string &msg) : std::runtime_error(msg) {}
};

// A tile member name does not decode to a tile id
class MalformedPathError : public std::runtime_error {
public:
  explicit MalformedPathError(const std::string &msg) : std::runtime_error(msg) {}
};

// Tile payload too short to hold the header bit field
class HeaderDecodeError : public std::runtime_error {
public:
  explicit HeaderDecodeError(const std::string &msg) : std::runtime_error(msg) {}
};

// I/O or consistency failure while writing, reading back or patching an archive
class ArchiveError : public std::runtime_error {
public:
  explicit ArchiveError(const std::string &msg) : std::runtime_error(msg) {}
};

} // namespace tilext

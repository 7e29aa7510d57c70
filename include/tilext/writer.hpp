#pragma once

#include <filesystem>
#include <span>
#include <string>
#include <unordered_set>
#include <vector>

#include "types.hpp"

namespace tilext {

// Builds a ustar archive in one pass over a memory-mapped output file
// Members are written in the order they were added
class TarWriter {
public:
  TarWriter() = default;
  ~TarWriter() = default;

  // Delete copy, enable move
  TarWriter(const TarWriter &) = delete;
  TarWriter &operator=(const TarWriter &) = delete;
  TarWriter(TarWriter &&) noexcept = default;
  TarWriter &operator=(TarWriter &&) noexcept = default;

  // Add regular file from disk; its contents are read during write()
  // Mode and modification time are taken from the source file
  bool addFile(const std::filesystem::path &sourcePath, const std::string &archivePath,
               std::string *outError = nullptr);

  // Add regular file from memory
  bool addFile(std::span<const uint8_t> data, const std::string &archivePath,
               std::string *outError = nullptr);

  // Add regular file of the given size whose contents are all zero bytes
  bool addZeroFilled(uint64_t size, const std::string &archivePath,
                     std::string *outError = nullptr);

  // Write archive to disk
  // Returns true on success, false on failure (error in outError if provided)
  bool write(const std::filesystem::path &destPath, std::string *outError = nullptr);

  void clear();

  // Entries of the last successful write(), with their data offsets
  const std::vector<TarEntry> &files() const { return entries_; }

  // Number of members to be written
  size_t fileCount() const { return pendingFiles_.size(); }

private:
  enum class Source : uint8_t { Disk, Memory, Zero };

  struct PendingFile {
    std::string archivePath;          // Normalized path (forward slashes)
    Source source = Source::Memory;
    std::filesystem::path sourcePath; // Only for Source::Disk
    std::vector<uint8_t> data;        // Only for Source::Memory
    uint64_t size = 0;
    uint32_t mode = 0644;
    int64_t mtime = 0;
  };

  bool reserveName(const std::string &archivePath, std::string *outError);

  static std::string normalizeSlashes(const std::string &path);

  static int64_t now();

  std::vector<PendingFile> pendingFiles_;
  std::unordered_set<std::string> names_;
  std::vector<TarEntry> entries_;
};

} // namespace tilext

#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "mmap.hpp"
#include "types.hpp"

namespace tilext {

class TarReader {
public:
  TarReader() = default;
  ~TarReader() = default;

  // Delete copy, enable move
  TarReader(const TarReader &) = delete;
  TarReader &operator=(const TarReader &) = delete;
  TarReader(TarReader &&) noexcept = default;
  TarReader &operator=(TarReader &&) noexcept = default;

  // Open tar archive from file (memory-mapped) and walk all member headers
  // Returns std::nullopt on failure, with error message in outError if provided
  static std::optional<TarReader> open(const std::filesystem::path &path,
                                       std::string *outError = nullptr);

  // Members in physical archive order
  const std::vector<TarEntry> &files() const { return files_; }

  size_t fileCount() const { return files_.size(); }

  // Exact path lookup; a later member shadows an earlier one with the same name
  // Returns nullptr if not found
  const TarEntry *findFile(const std::string &path) const;

  // Extract member data to disk
  bool extract(const TarEntry &entry, const std::filesystem::path &destPath,
               std::string *outError = nullptr) const;

  // Extract member data to memory
  std::optional<std::vector<uint8_t>> extractToMemory(const TarEntry &entry,
                                                      std::string *outError = nullptr) const;

  // Zero-copy view of the member data
  // Returns empty span if the member bounds are invalid
  std::span<const uint8_t> getFileView(const TarEntry &entry) const;

  // Raw archive bytes starting at offset, clipped to the end of the archive
  std::span<const uint8_t> readAt(uint64_t offset, size_t size) const;

  // Total size of the archive file
  size_t archiveSize() const { return mappedFile_.size(); }

  bool isOpen() const;

  void close();

private:
  bool parse(std::string *outError);

  static std::string normalizePath(const std::string &path);

  MappedFile mappedFile_;
  std::vector<TarEntry> files_;
  std::unordered_map<std::string, size_t> lookup_; // path -> index into files_
};

} // namespace tilext

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "index_table.hpp"

namespace tilext {

class TarWriter;

// Packs a tile directory into a tar extract whose first member, index.bin,
// maps every tile id to the offset and size of the tile within the extract.
//
// The index has to be written before the tile offsets are known, so the
// extract is built in passes:
//
//   1. discover()        count tiles, reject a missing or empty tile dir
//   2. writeReservation() write a zero-filled index.bin of the final size,
//                         followed by the whole tile tree
//   3. recoverOffsets()  read the extract back and collect tile offsets
//   4. patchIndex()      overwrite the index.bin payload in place
//
// build() runs all of them in order. Failures are thrown (see types.hpp);
// a partially written extract is left on disk.
class ArchiveBuilder {
public:
  ArchiveBuilder(std::filesystem::path tileDir, std::filesystem::path extractPath);

  const IndexTable &build();

  // Throws NoTilesFoundError; touches nothing on disk
  size_t discover();

  // Throws ArchiveError
  void writeReservation();

  // Throws ArchiveError or MalformedPathError
  void recoverOffsets();

  // Throws ArchiveError
  void patchIndex();

  // Recursively count regular files carrying the tile extension
  // Returns 0 if root is missing or not a directory
  static size_t countTiles(const std::filesystem::path &root);

  const IndexTable &index() const { return index_; }

  // Final index.bin payload, valid after patchIndex()
  const std::vector<uint8_t> &indexBytes() const { return indexBytes_; }

  size_t tileCount() const { return tileCount_; }

  const std::filesystem::path &extractPath() const { return extractPath_; }

private:
  void addTree(TarWriter &writer, const std::filesystem::path &dir, const std::string &prefix);

  std::filesystem::path tileDir_;
  std::filesystem::path extractPath_;

  size_t tileCount_ = 0;
  size_t reservedSize_ = 0;
  bool reserved_ = false;

  IndexTable index_;
  bool recovered_ = false;
  uint64_t indexOffset_ = 0; // Data offset of index.bin as read back
  uint64_t indexSize_ = 0;

  std::vector<uint8_t> indexBytes_;
};

} // namespace tilext

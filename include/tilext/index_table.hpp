#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "tile_id.hpp"

namespace tilext {

inline constexpr std::string_view indexMemberName = "index.bin";

// One index.bin record: packed little-endian <u64 offset, u32 tileId, u32 size>
// The 64-bit field comes first so the record has no padding
struct IndexEntry {
  uint64_t offset = 0;
  uint32_t tileId = 0;
  uint32_t size = 0;

  static constexpr size_t encodedSize = 16;

  bool operator==(const IndexEntry &) const = default;
};

// Tile offsets and sizes in archive member order (not sorted by id)
class IndexTable {
public:
  IndexTable() = default;

  // Byte size of the serialized table for n entries
  static constexpr size_t reserve(size_t n) noexcept { return n * IndexEntry::encodedSize; }

  // Append one entry
  // Fails if the tile id or size does not fit the 32-bit record fields
  bool append(uint64_t offset, TileId tileId, uint64_t size, std::string *outError = nullptr);

  // Pack all entries back to back; length is always reserve(size())
  std::vector<uint8_t> serialize() const;

  // Inverse of serialize()
  // Returns std::nullopt if the blob is not a whole number of records
  static std::optional<IndexTable> parse(std::span<const uint8_t> bytes,
                                         std::string *outError = nullptr);

  // First entry with the given tile id, nullptr if absent
  const IndexEntry *find(TileId tileId) const;

  const std::vector<IndexEntry> &entries() const { return entries_; }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  bool operator==(const IndexTable &) const = default;

private:
  std::vector<IndexEntry> entries_;
};

} // namespace tilext

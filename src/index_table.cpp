#include <format>
#include <limits>

#include <tilext/endian.hpp>
#include <tilext/index_table.hpp>

namespace tilext {

bool IndexTable::append(uint64_t offset, TileId tileId, uint64_t size, std::string *outError) {
  constexpr uint64_t fieldMax = std::numeric_limits<uint32_t>::max();

  if (tileId > fieldMax) {
    if (outError) {
      *outError = std::format("Tile id {} does not fit the 32-bit index field", tileId);
    }
    return false;
  }

  if (size > fieldMax) {
    if (outError) {
      *outError = std::format("Tile size {} does not fit the 32-bit index field", size);
    }
    return false;
  }

  entries_.push_back(
      IndexEntry{offset, static_cast<uint32_t>(tileId), static_cast<uint32_t>(size)});
  return true;
}

std::vector<uint8_t> IndexTable::serialize() const {
  std::vector<uint8_t> bytes(reserve(entries_.size()));

  uint8_t *p = bytes.data();
  for (const auto &entry : entries_) {
    storeLE64(p, entry.offset);
    storeLE32(p + 8, entry.tileId);
    storeLE32(p + 12, entry.size);
    p += IndexEntry::encodedSize;
  }

  return bytes;
}

std::optional<IndexTable> IndexTable::parse(std::span<const uint8_t> bytes,
                                            std::string *outError) {
  if (bytes.size() % IndexEntry::encodedSize != 0) {
    if (outError) {
      *outError = std::format("Index size {} is not a multiple of {}", bytes.size(),
                              IndexEntry::encodedSize);
    }
    return std::nullopt;
  }

  IndexTable table;
  table.entries_.reserve(bytes.size() / IndexEntry::encodedSize);

  for (size_t pos = 0; pos < bytes.size(); pos += IndexEntry::encodedSize) {
    const uint8_t *p = bytes.data() + pos;
    table.entries_.push_back(IndexEntry{loadLE64(p), loadLE32(p + 8), loadLE32(p + 12)});
  }

  return table;
}

const IndexEntry *IndexTable::find(TileId tileId) const {
  for (const auto &entry : entries_) {
    if (entry.tileId == tileId) {
      return &entry;
    }
  }
  return nullptr;
}

} // namespace tilext

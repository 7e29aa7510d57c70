#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tilext {

// Numeric tile identifier: level in the low 3 bits, tile index above it
using TileId = uint64_t;

struct TileCoord {
  uint32_t level = 0;
  uint64_t index = 0;

  bool operator==(const TileCoord &) const = default;
};

inline constexpr std::string_view tileExtension = ".gph";
inline constexpr uint32_t tileLevelBits = 3;
inline constexpr uint32_t maxTileLevel = (1u << tileLevelBits) - 1;
inline constexpr uint64_t maxTileIndex = (uint64_t{1} << (64 - tileLevelBits)) - 1;

// True for archive members and file names that hold a graph tile
bool isTileMember(std::string_view name) noexcept;

// Turn a relative tile path such as "2/000/818/660.gph" into its id
// The level is the first segment; every remaining segment is concatenated
// into the decimal tile index ("000" "818" "660" -> 818660)
// Returns std::nullopt for a malformed path, with the reason in outError if provided
std::optional<TileId> encodeTileId(std::string_view path, std::string *outError = nullptr);

constexpr TileId makeTileId(TileCoord coord) noexcept {
  return static_cast<TileId>(coord.level) | (coord.index << tileLevelBits);
}

constexpr TileCoord decodeTileId(TileId id) noexcept {
  return TileCoord{static_cast<uint32_t>(id & maxTileLevel), id >> tileLevelBits};
}

} // namespace tilext

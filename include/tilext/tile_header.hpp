#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include "endian.hpp"

namespace tilext {

// Read-only view of the counts packed into a graph tile header
//
// The first 40 bytes of a tile (graph id, base lon/lat, version string,
// dataset id) are opaque here. They are followed by a little-endian 64-bit
// word holding, lowest bits first:
//
//   nodecount:21 | directededgecount:21 | predictedspeeds_count:21 | spare:1
class TileHeaderView {
public:
  static constexpr size_t skipBytes = 40;
  static constexpr size_t bitFieldSize = sizeof(uint64_t);
  static constexpr size_t minTileSize = skipBytes + bitFieldSize;

  static constexpr uint32_t fieldBits = 21;
  static constexpr uint64_t fieldMask = (uint64_t{1} << fieldBits) - 1;

  constexpr TileHeaderView() = default;
  explicit constexpr TileHeaderView(uint64_t word) noexcept : word_(word) {}

  // Decode from the 8 bit-field bytes themselves
  // Returns std::nullopt if fewer than 8 bytes are given
  static std::optional<TileHeaderView> fromBitField(std::span<const uint8_t> bytes) noexcept {
    if (bytes.size() < bitFieldSize) {
      return std::nullopt;
    }
    return TileHeaderView(loadLE64(bytes.data()));
  }

  // Decode from the start of a tile payload
  static std::optional<TileHeaderView> fromTile(std::span<const uint8_t> tile) noexcept {
    if (tile.size() < minTileSize) {
      return std::nullopt;
    }
    return fromBitField(tile.subspan(skipBytes, bitFieldSize));
  }

  constexpr uint32_t nodeCount() const noexcept { return field(0); }
  constexpr uint32_t directedEdgeCount() const noexcept { return field(1); }
  constexpr uint32_t predictedSpeedsCount() const noexcept { return field(2); }
  constexpr bool spare() const noexcept { return (word_ >> 63) != 0; }

  constexpr uint64_t raw() const noexcept { return word_; }

  static constexpr uint64_t pack(uint32_t nodes, uint32_t edges, uint32_t speeds,
                                 bool spare = false) noexcept {
    return (uint64_t{nodes} & fieldMask) | ((uint64_t{edges} & fieldMask) << fieldBits) |
           ((uint64_t{speeds} & fieldMask) << (2 * fieldBits)) | (uint64_t{spare} << 63);
  }

private:
  constexpr uint32_t field(uint32_t n) const noexcept {
    return static_cast<uint32_t>((word_ >> (n * fieldBits)) & fieldMask);
  }

  uint64_t word_ = 0;
};

} // namespace tilext

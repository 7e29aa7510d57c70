#pragma once

#include <cstdint>
#include <filesystem>

#include "index_table.hpp"

namespace tilext {

// Writes the traffic sidecar of a finished extract: the same index.bin,
// then one zero-filled record per tile, sized for the tile's directed edges.
// Offsets in the copied index still refer to the primary extract.
class TrafficSkeletonBuilder {
public:
  static constexpr size_t headerSize = 32;   // 2 x u64 + 4 x u32
  static constexpr size_t speedSlotSize = 8; // one u64 per directed edge

  static constexpr uint64_t recordSize(uint32_t directedEdgeCount) noexcept {
    return headerSize + speedSlotSize * static_cast<uint64_t>(directedEdgeCount);
  }

  TrafficSkeletonBuilder(std::filesystem::path extractPath, std::filesystem::path trafficPath);

  // Returns the number of traffic records written
  // Throws HeaderDecodeError for a tile too short to hold its header,
  // ArchiveError for I/O failures or an index that differs from the extract's
  size_t build(const IndexTable &index);

private:
  std::filesystem::path extractPath_;
  std::filesystem::path trafficPath_;
};

} // namespace tilext

#include <algorithm>
#include <format>

#include <tilext/log.hpp>
#include <tilext/reader.hpp>
#include <tilext/tile_header.hpp>
#include <tilext/tile_id.hpp>
#include <tilext/traffic_builder.hpp>
#include <tilext/types.hpp>
#include <tilext/writer.hpp>

namespace fs = std::filesystem;

namespace tilext {

TrafficSkeletonBuilder::TrafficSkeletonBuilder(fs::path extractPath, fs::path trafficPath)
    : extractPath_(std::move(extractPath)), trafficPath_(std::move(trafficPath)) {}

size_t TrafficSkeletonBuilder::build(const IndexTable &index) {
  log::info("Start creating traffic extract...");

  std::string error;
  auto reader = TarReader::open(extractPath_, &error);
  if (!reader) {
    throw ArchiveError(error);
  }

  std::vector<uint8_t> indexBytes = index.serialize();

  const TarEntry *indexEntry = reader->findFile(std::string(indexMemberName));
  if (!indexEntry) {
    throw ArchiveError(
        std::format("{} has no {} member", extractPath_.string(), indexMemberName));
  }
  auto stored = reader->getFileView(*indexEntry);
  if (!std::equal(stored.begin(), stored.end(), indexBytes.begin(), indexBytes.end())) {
    throw ArchiveError(
        std::format("{} in {} does not match the built index", indexMemberName,
                    extractPath_.string()));
  }

  TarWriter writer;
  if (!writer.addFile(indexBytes, std::string(indexMemberName), &error)) {
    throw ArchiveError(error);
  }

  size_t records = 0;
  for (const auto &tile : reader->files()) {
    if (tile.type != EntryType::File || !isTileMember(tile.path)) {
      continue;
    }

    // The bit field must lie inside the tile itself, not in the block padding after it
    if (tile.size < TileHeaderView::minTileSize) {
      throw HeaderDecodeError(std::format("Tile {} is {} bytes, too short for its header",
                                          tile.path, tile.size));
    }

    auto bytes = reader->readAt(tile.offset + TileHeaderView::skipBytes,
                                TileHeaderView::bitFieldSize);
    auto header = TileHeaderView::fromBitField(bytes);
    if (!header) {
      throw HeaderDecodeError(std::format("Tile {}: only {} header bytes available at offset {}",
                                          tile.path, bytes.size(),
                                          tile.offset + TileHeaderView::skipBytes));
    }

    log::debug("Tile {} has {} directed edges", tile.path, header->directedEdgeCount());

    if (!writer.addZeroFilled(recordSize(header->directedEdgeCount()), tile.path, &error)) {
      throw ArchiveError(error);
    }
    ++records;
  }

  if (trafficPath_.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(trafficPath_.parent_path(), ec);
    if (ec) {
      throw ArchiveError(std::format("Failed to create directory {}: {}",
                                     trafficPath_.parent_path().string(), ec.message()));
    }
  }

  if (!writer.write(trafficPath_, &error)) {
    throw ArchiveError(error);
  }

  log::info("Finished creating the traffic extract at {}", trafficPath_.string());
  return records;
}

} // namespace tilext

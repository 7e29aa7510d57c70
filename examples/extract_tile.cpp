#include <cstdlib>
#include <fstream>
#include <iostream>

#include <tilext/tilext.hpp>

int main(int argc, char *argv[]) {
  if (argc < 5) {
    std::cerr << "Usage: " << argv[0] << " <extract.tar> <level> <tile_index> <output_file>\n";
    return 1;
  }

  tilext::TileCoord coord{static_cast<uint32_t>(std::strtoul(argv[2], nullptr, 10)),
                          std::strtoull(argv[3], nullptr, 10)};
  tilext::TileId id = tilext::makeTileId(coord);

  std::string error;
  auto reader = tilext::TarReader::open(argv[1], &error);
  if (!reader) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  const auto *indexEntry = reader->findFile(std::string(tilext::indexMemberName));
  if (!indexEntry) {
    std::cerr << "Error: " << argv[1] << " has no " << tilext::indexMemberName << "\n";
    return 1;
  }

  auto index = tilext::IndexTable::parse(reader->getFileView(*indexEntry), &error);
  if (!index) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  const auto *entry = index->find(id);
  if (!entry) {
    std::cerr << "Tile " << coord.level << "/" << coord.index << " (id " << id
              << ") is not in the extract\n";
    return 1;
  }

  auto tile = reader->readAt(entry->offset, entry->size);
  if (tile.size() != entry->size) {
    std::cerr << "Error: index entry points beyond the end of the extract\n";
    return 1;
  }

  std::ofstream out(argv[4], std::ios::binary);
  out.write(reinterpret_cast<const char *>(tile.data()), static_cast<std::streamsize>(tile.size()));
  if (!out) {
    std::cerr << "Error: failed to write " << argv[4] << "\n";
    return 1;
  }

  std::cout << "Extracted tile " << id << " (" << tile.size() << " bytes) to " << argv[4] << "\n";
  return 0;
}

#include <iostream>

#include <tilext/tilext.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <extract.tar>\n";
    return 1;
  }

  std::string error;
  auto reader = tilext::TarReader::open(argv[1], &error);

  if (!reader) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  std::optional<tilext::IndexTable> index;
  if (const auto *indexEntry = reader->findFile(std::string(tilext::indexMemberName))) {
    index = tilext::IndexTable::parse(reader->getFileView(*indexEntry), &error);
    if (!index) {
      std::cerr << "Error: " << error << "\n";
      return 1;
    }
  }

  std::cout << "Archive: " << argv[1] << "\n";
  std::cout << "Members: " << reader->fileCount() << "\n";
  if (index) {
    std::cout << "Indexed tiles: " << index->size() << "\n";
  }
  std::cout << "\n";

  int mismatches = 0;
  for (const auto &file : reader->files()) {
    if (file.type == tilext::EntryType::Directory) {
      std::cout << "  " << file.path << "/\n";
      continue;
    }

    std::cout << "  " << file.path << " (" << file.size << " bytes)";

    if (tilext::isTileMember(file.path)) {
      auto id = tilext::encodeTileId(file.path, &error);
      if (!id) {
        std::cout << " [" << error << "]\n";
        ++mismatches;
        continue;
      }

      auto coord = tilext::decodeTileId(*id);
      std::cout << " id=" << *id << " level=" << coord.level << " index=" << coord.index;

      const auto *entry = index ? index->find(*id) : nullptr;
      if (!entry || entry->offset != file.offset || entry->size != file.size) {
        std::cout << " [index mismatch]";
        ++mismatches;
      }
    }
    std::cout << "\n";
  }

  return mismatches == 0 ? 0 : 1;
}

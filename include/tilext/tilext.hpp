#pragma once

// Tile Extract Library
// Packs a directory of routing graph tiles into a single tar extract with a
// leading index.bin, and derives the zero-filled traffic sidecar from it.

#include "archive_builder.hpp"
#include "config.hpp"
#include "index_table.hpp"
#include "reader.hpp"
#include "tile_header.hpp"
#include "tile_id.hpp"
#include "traffic_builder.hpp"
#include "types.hpp"
#include "writer.hpp"

// Layers, bottom up:
//
// 1. Container: TarReader / TarWriter over MappedFile
//    - TarReader::open() walks an existing archive and exposes member offsets
//    - TarWriter lays out and writes a new archive in one pass
//
// 2. Tile formats: encodeTileId(), TileHeaderView, IndexTable
//
// 3. Builders: ArchiveBuilder, TrafficSkeletonBuilder
//
// Example usage:
//
//   tilext::ArchiveBuilder builder("tiles", "tiles.tar");
//   const auto &index = builder.build();
//
//   tilext::TrafficSkeletonBuilder traffic("tiles.tar", "traffic.tar");
//   traffic.build(index);
//
//   // Looking up a tile afterwards
//   auto reader = tilext::TarReader::open("tiles.tar");
//   auto table = tilext::IndexTable::parse(
//       reader->getFileView(*reader->findFile("index.bin")));
//   const auto *entry = table->find(*tilext::encodeTileId("2/000/818/660.gph"));
//   auto tile = reader->readAt(entry->offset, entry->size);

namespace tilext {}

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <tilext/archive_builder.hpp>
#include <tilext/endian.hpp>
#include <tilext/reader.hpp>
#include <tilext/tile_header.hpp>
#include <tilext/traffic_builder.hpp>
#include <tilext/types.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

class TrafficBuilderTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() / "tilext_test_traffic_builder";
    tileDir_ = tempDir_ / "tiles";
    extractPath_ = tempDir_ / "tiles.tar";
    trafficPath_ = tempDir_ / "traffic" / "traffic.tar";
    fs::create_directories(tileDir_);
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  // Tile with a real header word; the remaining bytes are filler
  void createTile(const std::string &relative, uint32_t edges, size_t size = 256) {
    std::vector<uint8_t> tile(size, 0x5A);
    if (size >= tilext::TileHeaderView::minTileSize) {
      tilext::storeLE64(tile.data() + tilext::TileHeaderView::skipBytes,
                        tilext::TileHeaderView::pack(11, edges, 13));
    }

    fs::path filePath = tileDir_ / relative;
    fs::create_directories(filePath.parent_path());
    std::ofstream file(filePath, std::ios::binary);
    file.write(reinterpret_cast<const char *>(tile.data()), tile.size());
  }

  fs::path tempDir_;
  fs::path tileDir_;
  fs::path extractPath_;
  fs::path trafficPath_;
};

TEST_F(TrafficBuilderTest, RecordSize) {
  static_assert(tilext::TrafficSkeletonBuilder::recordSize(0) == 32);
  EXPECT_EQ(tilext::TrafficSkeletonBuilder::recordSize(5), 72u);
  EXPECT_EQ(tilext::TrafficSkeletonBuilder::recordSize(1000), 8032u);
}

// One zero-filled record per tile behind a copy of the index
TEST_F(TrafficBuilderTest, BuildsSkeleton) {
  createTile("0/001.gph", 5);
  createTile("1/002/003.gph", 0);

  tilext::ArchiveBuilder archive(tileDir_, extractPath_);
  const auto &index = archive.build();

  tilext::TrafficSkeletonBuilder traffic(extractPath_, trafficPath_);
  EXPECT_EQ(traffic.build(index), 2u);

  std::string error;
  auto reader = tilext::TarReader::open(trafficPath_, &error);
  ASSERT_TRUE(reader.has_value()) << error;

  const auto &files = reader->files();
  ASSERT_EQ(files.size(), 3u);
  EXPECT_EQ(files[0].path, "index.bin");
  EXPECT_EQ(files[1].path, "0/001.gph");
  EXPECT_EQ(files[2].path, "1/002/003.gph");

  // Same index bytes as the primary extract, offsets unchanged
  auto stored = reader->getFileView(files[0]);
  EXPECT_EQ(std::vector<uint8_t>(stored.begin(), stored.end()), archive.indexBytes());

  EXPECT_EQ(files[1].size, 72u);
  EXPECT_EQ(files[2].size, 32u);

  for (size_t i = 1; i < files.size(); ++i) {
    for (uint8_t b : reader->getFileView(files[i])) {
      EXPECT_EQ(b, 0);
    }
  }
}

// Non-tile members of the extract get no traffic record
TEST_F(TrafficBuilderTest, SkipsNonTileMembers) {
  createTile("0/001.gph", 2);
  createTile("0/notes.txt", 0, 10);

  tilext::ArchiveBuilder archive(tileDir_, extractPath_);
  const auto &index = archive.build();

  tilext::TrafficSkeletonBuilder traffic(extractPath_, trafficPath_);
  EXPECT_EQ(traffic.build(index), 1u);

  auto reader = tilext::TarReader::open(trafficPath_);
  ASSERT_TRUE(reader.has_value());
  EXPECT_EQ(reader->fileCount(), 2u);
  EXPECT_EQ(reader->findFile("0/notes.txt"), nullptr);
}

// A tile too short for its header is an error, even when padding follows it
TEST_F(TrafficBuilderTest, TruncatedTile) {
  createTile("0/001.gph", 5);
  createTile("0/002.gph", 0, 44);

  tilext::ArchiveBuilder archive(tileDir_, extractPath_);
  const auto &index = archive.build();

  tilext::TrafficSkeletonBuilder traffic(extractPath_, trafficPath_);
  EXPECT_THROW(traffic.build(index), tilext::HeaderDecodeError);
}

// The index passed in must be the one stored in the extract
TEST_F(TrafficBuilderTest, IndexMismatch) {
  createTile("0/001.gph", 5);

  tilext::ArchiveBuilder archive(tileDir_, extractPath_);
  tilext::IndexTable other = archive.build();
  ASSERT_TRUE(other.append(0, 16, 1));

  tilext::TrafficSkeletonBuilder traffic(extractPath_, trafficPath_);
  EXPECT_THROW(traffic.build(other), tilext::ArchiveError);
  EXPECT_FALSE(fs::exists(trafficPath_));
}

TEST_F(TrafficBuilderTest, MissingExtract) {
  tilext::TrafficSkeletonBuilder traffic(tempDir_ / "missing.tar", trafficPath_);
  EXPECT_THROW(traffic.build(tilext::IndexTable()), tilext::ArchiveError);
}

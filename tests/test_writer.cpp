#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <tilext/reader.hpp>
#include <tilext/writer.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

class WriterTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() / "tilext_test_writer";
    fs::create_directories(tempDir_);
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  fs::path createTestFile(const std::string &name, const std::string &content) {
    fs::path filePath = tempDir_ / name;
    fs::create_directories(filePath.parent_path());
    std::ofstream file(filePath, std::ios::binary);
    file.write(content.data(), content.size());
    return filePath;
  }

  static std::vector<uint8_t> bytesOf(const std::string &s) {
    return std::vector<uint8_t>(s.begin(), s.end());
  }

  fs::path tempDir_;
};

// Test writing files from disk
TEST_F(WriterTest, WriteFromDisk) {
  fs::path file1 = createTestFile("src/file1.gph", "Hello, World!");
  fs::path file2 = createTestFile("src/file2.gph", "Test data");

  tilext::TarWriter writer;
  std::string error;
  ASSERT_TRUE(writer.addFile(file1, "0/1.gph", &error)) << error;
  ASSERT_TRUE(writer.addFile(file2, "0/2.gph", &error)) << error;
  EXPECT_EQ(writer.fileCount(), 2u);

  fs::path archivePath = tempDir_ / "disk.tar";
  ASSERT_TRUE(writer.write(archivePath, &error)) << error;

  auto reader = tilext::TarReader::open(archivePath, &error);
  ASSERT_TRUE(reader.has_value()) << error;
  ASSERT_EQ(reader->fileCount(), 2u);

  auto data = reader->extractToMemory(*reader->findFile("0/1.gph"));
  ASSERT_TRUE(data.has_value());
  EXPECT_EQ(std::string(data->begin(), data->end()), "Hello, World!");
}

// Source metadata is carried into the header
TEST_F(WriterTest, KeepsModeAndMtime) {
  fs::path file = createTestFile("meta.gph", "meta");
  fs::permissions(file, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read);

  tilext::TarWriter writer;
  std::string error;
  ASSERT_TRUE(writer.addFile(file, "meta.gph", &error)) << error;
  fs::path archivePath = tempDir_ / "meta.tar";
  ASSERT_TRUE(writer.write(archivePath, &error)) << error;

  auto reader = tilext::TarReader::open(archivePath);
  ASSERT_TRUE(reader.has_value());
  const auto &entry = reader->files()[0];
  EXPECT_EQ(entry.mode, 0640u);
  EXPECT_GT(entry.mtime, 0);
}

// Test writing files from memory
TEST_F(WriterTest, WriteFromMemory) {
  tilext::TarWriter writer;
  std::string error;
  ASSERT_TRUE(writer.addFile(bytesOf("in memory"), "a/b.gph", &error)) << error;
  ASSERT_TRUE(writer.addFile(std::vector<uint8_t>{}, "empty.gph", &error)) << error;

  fs::path archivePath = tempDir_ / "memory.tar";
  ASSERT_TRUE(writer.write(archivePath, &error)) << error;

  auto reader = tilext::TarReader::open(archivePath);
  ASSERT_TRUE(reader.has_value());
  ASSERT_EQ(reader->fileCount(), 2u);

  auto view = reader->getFileView(*reader->findFile("a/b.gph"));
  EXPECT_EQ(std::string(view.begin(), view.end()), "in memory");
  EXPECT_EQ(reader->findFile("empty.gph")->size, 0u);
}

// Zero-filled members have the requested size and no other content
TEST_F(WriterTest, WriteZeroFilled) {
  tilext::TarWriter writer;
  std::string error;
  ASSERT_TRUE(writer.addZeroFilled(72, "record.gph", &error)) << error;

  fs::path archivePath = tempDir_ / "zero.tar";
  ASSERT_TRUE(writer.write(archivePath, &error)) << error;

  auto reader = tilext::TarReader::open(archivePath);
  ASSERT_TRUE(reader.has_value());
  auto view = reader->getFileView(reader->files()[0]);
  ASSERT_EQ(view.size(), 72u);
  for (uint8_t b : view) {
    EXPECT_EQ(b, 0);
  }
}

// Test duplicate path rejection
TEST_F(WriterTest, DuplicatePathRejection) {
  tilext::TarWriter writer;
  std::string error;

  ASSERT_TRUE(writer.addFile(bytesOf("1"), "dir/file.gph", &error)) << error;
  EXPECT_FALSE(writer.addFile(bytesOf("2"), "dir/file.gph", &error));
  EXPECT_NE(error.find("Duplicate"), std::string::npos);

  // Same path once separators are normalized
  EXPECT_FALSE(writer.addZeroFilled(4, "dir\\file.gph", &error));
  EXPECT_EQ(writer.fileCount(), 1u);
}

TEST_F(WriterTest, EmptyPathRejection) {
  tilext::TarWriter writer;
  std::string error;
  EXPECT_FALSE(writer.addFile(bytesOf("x"), "", &error));
  EXPECT_FALSE(error.empty());
}

// Test writing an empty archive fails
TEST_F(WriterTest, EmptyArchiveFails) {
  tilext::TarWriter writer;
  std::string error;

  EXPECT_FALSE(writer.write(tempDir_ / "empty.tar", &error));
  EXPECT_FALSE(error.empty());
  EXPECT_FALSE(fs::exists(tempDir_ / "empty.tar"));
}

// Test adding a non-existent file
TEST_F(WriterTest, AddNonExistentFile) {
  tilext::TarWriter writer;
  std::string error;

  EXPECT_FALSE(writer.addFile(tempDir_ / "nonexistent.gph", "x.gph", &error));
  EXPECT_FALSE(error.empty());
  EXPECT_EQ(writer.fileCount(), 0u);
}

// Test backslash normalization
TEST_F(WriterTest, BackslashNormalization) {
  tilext::TarWriter writer;
  std::string error;
  ASSERT_TRUE(writer.addFile(bytesOf("data"), "2\\000\\818\\660.gph", &error)) << error;

  fs::path archivePath = tempDir_ / "slashes.tar";
  ASSERT_TRUE(writer.write(archivePath, &error)) << error;

  auto reader = tilext::TarReader::open(archivePath);
  ASSERT_TRUE(reader.has_value());
  EXPECT_EQ(reader->files()[0].path, "2/000/818/660.gph");
}

// Names over 100 bytes go into the prefix field when a slash allows it
TEST_F(WriterTest, LongNameUsesPrefix) {
  std::string longPath = std::string(80, 'a') + "/" + std::string(60, 'b') + "/1.gph";

  tilext::TarWriter writer;
  std::string error;
  ASSERT_TRUE(writer.addFile(bytesOf("p"), longPath, &error)) << error;
  fs::path archivePath = tempDir_ / "prefix.tar";
  ASSERT_TRUE(writer.write(archivePath, &error)) << error;

  // Header, one data block, end marker: no extended header was needed
  EXPECT_EQ(writer.files()[0].offset, 512u);

  auto reader = tilext::TarReader::open(archivePath, &error);
  ASSERT_TRUE(reader.has_value()) << error;
  EXPECT_EQ(reader->files()[0].path, longPath);
}

// Names that cannot be split are stored in a pax extended header
TEST_F(WriterTest, VeryLongNameUsesPax) {
  std::string longPath = std::string(300, 'x') + ".gph";

  tilext::TarWriter writer;
  std::string error;
  ASSERT_TRUE(writer.addFile(bytesOf("pax"), longPath, &error)) << error;
  ASSERT_TRUE(writer.addFile(bytesOf("short"), "0/1.gph", &error)) << error;
  fs::path archivePath = tempDir_ / "pax.tar";
  ASSERT_TRUE(writer.write(archivePath, &error)) << error;

  auto reader = tilext::TarReader::open(archivePath, &error);
  ASSERT_TRUE(reader.has_value()) << error;
  ASSERT_EQ(reader->fileCount(), 2u);
  EXPECT_EQ(reader->files()[0].path, longPath);
  EXPECT_EQ(reader->files()[1].path, "0/1.gph");

  auto view = reader->getFileView(reader->files()[0]);
  EXPECT_EQ(std::string(view.begin(), view.end()), "pax");
}

// Archives are padded to whole records
TEST_F(WriterTest, RecordAlignedSize) {
  tilext::TarWriter writer;
  std::string error;
  ASSERT_TRUE(writer.addZeroFilled(100000, "big.gph", &error)) << error;
  fs::path archivePath = tempDir_ / "record.tar";
  ASSERT_TRUE(writer.write(archivePath, &error)) << error;

  auto size = fs::file_size(archivePath);
  EXPECT_EQ(size % tilext::TarFormat::recordSize, 0u);
  EXPECT_GE(size, 512u + 100352u + 1024u);
}

// Offsets reported by the writer are the ones the reader finds
TEST_F(WriterTest, OffsetsMatchReader) {
  tilext::TarWriter writer;
  std::string error;
  ASSERT_TRUE(writer.addZeroFilled(32, "index.bin", &error)) << error;
  ASSERT_TRUE(writer.addFile(bytesOf(std::string(10, 'a')), "0/001.gph", &error)) << error;
  ASSERT_TRUE(writer.addFile(bytesOf(std::string(20, 'b')), "1/002/003.gph", &error)) << error;
  fs::path archivePath = tempDir_ / "offsets.tar";
  ASSERT_TRUE(writer.write(archivePath, &error)) << error;

  auto reader = tilext::TarReader::open(archivePath);
  ASSERT_TRUE(reader.has_value());
  ASSERT_EQ(reader->fileCount(), writer.files().size());

  for (size_t i = 0; i < writer.files().size(); ++i) {
    EXPECT_EQ(reader->files()[i].path, writer.files()[i].path);
    EXPECT_EQ(reader->files()[i].offset, writer.files()[i].offset);
    EXPECT_EQ(reader->files()[i].size, writer.files()[i].size);
  }
  EXPECT_EQ(writer.files()[0].offset, 512u);
  EXPECT_EQ(writer.files()[1].offset, 1536u);
  EXPECT_EQ(writer.files()[2].offset, 2560u);
}

// Test clear
TEST_F(WriterTest, Clear) {
  tilext::TarWriter writer;
  std::string error;
  ASSERT_TRUE(writer.addFile(bytesOf("1"), "a.gph", &error)) << error;
  EXPECT_EQ(writer.fileCount(), 1u);

  writer.clear();
  EXPECT_EQ(writer.fileCount(), 0u);
  EXPECT_TRUE(writer.files().empty());

  // Names are free again
  EXPECT_TRUE(writer.addFile(bytesOf("2"), "a.gph", &error)) << error;
}

// Test move semantics
TEST_F(WriterTest, MoveSemantics) {
  tilext::TarWriter writer1;
  std::string error;
  ASSERT_TRUE(writer1.addFile(bytesOf("1"), "a.gph", &error)) << error;

  tilext::TarWriter writer2 = std::move(writer1);
  EXPECT_EQ(writer2.fileCount(), 1u);

  fs::path archivePath = tempDir_ / "moved.tar";
  EXPECT_TRUE(writer2.write(archivePath, &error)) << error;
}

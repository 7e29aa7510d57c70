#include <string>
#include <vector>

#include <tilext/index_table.hpp>

#include <gtest/gtest.h>

TEST(IndexTableTest, ReserveSize) {
  static_assert(tilext::IndexTable::reserve(0) == 0);
  EXPECT_EQ(tilext::IndexTable::reserve(2), 32u);
  EXPECT_EQ(tilext::IndexTable::reserve(1000), 16000u);
}

// Records are <u64 offset, u32 id, u32 size>, little-endian, no padding
TEST(IndexTableTest, SerializeLayout) {
  tilext::IndexTable table;
  std::string error;
  ASSERT_TRUE(table.append(1536, 8, 10, &error)) << error;
  ASSERT_TRUE(table.append(0x0102030405060708ull, 0xAABBCCDD, 0x11223344, &error)) << error;

  std::vector<uint8_t> expected = {
      0x00, 0x06, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, // offset 1536
      0x08, 0x00, 0x00, 0x00,                         // id 8
      0x0A, 0x00, 0x00, 0x00,                         // size 10
      0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01,
      0xDD, 0xCC, 0xBB, 0xAA,
      0x44, 0x33, 0x22, 0x11,
  };

  auto bytes = table.serialize();
  EXPECT_EQ(bytes.size(), tilext::IndexTable::reserve(table.size()));
  EXPECT_EQ(bytes, expected);
}

TEST(IndexTableTest, ParseRestoresEntries) {
  tilext::IndexTable table;
  ASSERT_TRUE(table.append(512, 8, 10));
  ASSERT_TRUE(table.append(2560, 16025, 20));

  std::string error;
  auto parsed = tilext::IndexTable::parse(table.serialize(), &error);
  ASSERT_TRUE(parsed.has_value()) << error;
  EXPECT_EQ(*parsed, table);
  EXPECT_EQ(parsed->entries()[1], (tilext::IndexEntry{2560, 16025, 20}));
}

TEST(IndexTableTest, ParseEmpty) {
  auto parsed = tilext::IndexTable::parse(std::vector<uint8_t>{});
  ASSERT_TRUE(parsed.has_value());
  EXPECT_TRUE(parsed->empty());
}

TEST(IndexTableTest, ParseRejectsPartialRecord) {
  std::vector<uint8_t> bytes(17, 0);
  std::string error;
  EXPECT_FALSE(tilext::IndexTable::parse(bytes, &error).has_value());
  EXPECT_NE(error.find("multiple of 16"), std::string::npos);
}

// Ids and sizes must fit their 32-bit fields
TEST(IndexTableTest, AppendRejectsWideFields) {
  tilext::IndexTable table;
  std::string error;

  EXPECT_FALSE(table.append(0, uint64_t{1} << 32, 1, &error));
  EXPECT_NE(error.find("Tile id"), std::string::npos);

  EXPECT_FALSE(table.append(0, 8, uint64_t{1} << 32, &error));
  EXPECT_NE(error.find("Tile size"), std::string::npos);

  EXPECT_TRUE(table.empty());
  EXPECT_TRUE(table.append(0, 0xFFFFFFFFu, 0xFFFFFFFFu, &error)) << error;
}

// Entries keep insertion order, lookup returns the first match
TEST(IndexTableTest, FindKeepsMemberOrder) {
  tilext::IndexTable table;
  ASSERT_TRUE(table.append(2560, 16025, 20));
  ASSERT_TRUE(table.append(1536, 8, 10));
  ASSERT_TRUE(table.append(9999, 8, 1));

  EXPECT_EQ(table.entries()[0].tileId, 16025u);

  const auto *entry = table.find(8);
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->offset, 1536u);
  EXPECT_EQ(table.find(42), nullptr);
}

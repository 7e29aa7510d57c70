#include <algorithm>
#include <cstring>
#include <format>

#include <tilext/archive_builder.hpp>
#include <tilext/log.hpp>
#include <tilext/mmap.hpp>
#include <tilext/reader.hpp>
#include <tilext/tile_id.hpp>
#include <tilext/types.hpp>
#include <tilext/writer.hpp>

namespace fs = std::filesystem;

namespace tilext {

ArchiveBuilder::ArchiveBuilder(fs::path tileDir, fs::path extractPath)
    : tileDir_(std::move(tileDir)), extractPath_(std::move(extractPath)) {}

const IndexTable &ArchiveBuilder::build() {
  discover();
  writeReservation();
  recoverOffsets();
  patchIndex();

  log::info("Finished tarring {} tiles to {}", tileCount_, extractPath_.string());
  return index_;
}

size_t ArchiveBuilder::countTiles(const fs::path &root) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return 0;
  }

  size_t count = 0;
  for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec) && isTileMember(it->path().filename().string())) {
      ++count;
    }
  }
  return count;
}

size_t ArchiveBuilder::discover() {
  std::error_code ec;
  if (!fs::exists(tileDir_, ec) || !fs::is_directory(tileDir_, ec)) {
    throw NoTilesFoundError(std::format(
        "Directory 'mjolnir.tile_dir': {} was not found on the filesystem.", tileDir_.string()));
  }

  tileCount_ = countTiles(tileDir_);
  if (tileCount_ == 0) {
    throw NoTilesFoundError(
        std::format("Directory {} does not contain any usable graph tiles.", tileDir_.string()));
  }

  log::debug("Found {} tiles in {}", tileCount_, tileDir_.string());
  return tileCount_;
}

void ArchiveBuilder::writeReservation() {
  if (tileCount_ == 0) {
    throw ArchiveError("Cannot reserve the index before tiles were discovered");
  }

  reservedSize_ = IndexTable::reserve(tileCount_);

  TarWriter writer;
  std::string error;
  if (!writer.addZeroFilled(reservedSize_, std::string(indexMemberName), &error)) {
    throw ArchiveError(error);
  }
  addTree(writer, tileDir_, "");

  if (extractPath_.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(extractPath_.parent_path(), ec);
    if (ec) {
      throw ArchiveError(std::format("Failed to create directory {}: {}",
                                     extractPath_.parent_path().string(), ec.message()));
    }
  }

  if (!writer.write(extractPath_, &error)) {
    throw ArchiveError(error);
  }

  reserved_ = true;
  log::debug("Reserved {} bytes for {} in {}", reservedSize_, indexMemberName,
             extractPath_.string());
}

void ArchiveBuilder::addTree(TarWriter &writer, const fs::path &dir, const std::string &prefix) {
  std::error_code ec;
  std::vector<fs::directory_entry> children;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    children.push_back(*it);
  }
  if (ec) {
    throw ArchiveError(std::format("Failed to list directory {}: {}", dir.string(), ec.message()));
  }

  // Member order must not depend on the file system's enumeration order
  std::sort(children.begin(), children.end(),
            [](const fs::directory_entry &a, const fs::directory_entry &b) {
              return a.path().filename().string() < b.path().filename().string();
            });

  std::string error;
  for (const auto &child : children) {
    std::string name = child.path().filename().string();
    std::string archivePath = prefix.empty() ? name : prefix + "/" + name;

    // An extract written into the tile dir by an earlier run must not archive itself
    std::error_code sameEc;
    if (fs::equivalent(child.path(), extractPath_, sameEc)) {
      log::debug("Skipping the extract itself {}", child.path().string());
      continue;
    }

    if (child.is_symlink(ec) && child.is_directory(ec)) {
      log::debug("Skipping directory symlink {}", child.path().string());
      continue;
    }

    if (child.is_directory(ec)) {
      addTree(writer, child.path(), archivePath);
    } else if (child.is_regular_file(ec)) {
      if (!writer.addFile(child.path(), archivePath, &error)) {
        throw ArchiveError(error);
      }
    } else {
      log::debug("Skipping special file {}", child.path().string());
    }
  }
}

void ArchiveBuilder::recoverOffsets() {
  if (!reserved_) {
    throw ArchiveError("Cannot recover offsets before the extract was written");
  }

  std::string error;
  auto reader = TarReader::open(extractPath_, &error);
  if (!reader) {
    throw ArchiveError(error);
  }

  const auto &files = reader->files();
  if (files.empty() || files.front().path != indexMemberName) {
    throw ArchiveError(
        std::format("{} is not the first member of {}", indexMemberName, extractPath_.string()));
  }
  indexOffset_ = files.front().offset;
  indexSize_ = files.front().size;

  index_ = IndexTable();
  for (const auto &entry : files) {
    if (entry.type != EntryType::File || !isTileMember(entry.path)) {
      continue;
    }

    auto tileId = encodeTileId(entry.path, &error);
    if (!tileId) {
      throw MalformedPathError(error);
    }

    if (!index_.append(entry.offset, *tileId, entry.size, &error)) {
      throw MalformedPathError(std::format("{}: {}", entry.path, error));
    }

    log::debug("Tile {} with offset: {}, size: {}", entry.path, entry.offset, entry.size);
  }

  if (index_.size() != tileCount_) {
    throw ArchiveError(std::format("Expected {} tiles in {} but read back {}", tileCount_,
                                   extractPath_.string(), index_.size()));
  }

  recovered_ = true;
}

void ArchiveBuilder::patchIndex() {
  if (!recovered_) {
    throw ArchiveError("Cannot patch the index before offsets were recovered");
  }

  std::vector<uint8_t> bytes = index_.serialize();

  // Overwriting anything but the reserved range would shift every member after it
  if (bytes.size() != reservedSize_ || indexSize_ != reservedSize_) {
    throw ArchiveError(std::format("Index size mismatch: serialized {}, reserved {}, stored {}",
                                   bytes.size(), reservedSize_, indexSize_));
  }
  if (indexOffset_ != TarFormat::blockSize) {
    throw ArchiveError(std::format("{} data starts at offset {}, expected {}", indexMemberName,
                                   indexOffset_, TarFormat::blockSize));
  }

  std::string error;
  MappedFile file;
  if (!file.openUpdate(extractPath_, &error)) {
    throw ArchiveError(error);
  }

  auto data = file.data();
  if (indexOffset_ + bytes.size() > data.size()) {
    throw ArchiveError(std::format("{} is too small to hold the index", extractPath_.string()));
  }

  std::memcpy(data.data() + indexOffset_, bytes.data(), bytes.size());
  if (!file.flush(&error)) {
    throw ArchiveError(error);
  }
  file.close();

  indexBytes_ = std::move(bytes);
}

} // namespace tilext

#include <chrono>
#include <cstring>
#include <format>
#include <fstream>

#include <tilext/mmap.hpp>
#include <tilext/tar_header.hpp>
#include <tilext/writer.hpp>

namespace tilext {

namespace {

// How one member name is spread over the header fields
struct NameLayout {
  std::string name;
  std::string prefix;
  std::string pax; // Extended header payload, empty if the name fits the ustar fields
};

NameLayout layoutName(const std::string &fullName) {
  NameLayout layout;
  if (fullName.size() <= TarFormat::nameSize) {
    layout.name = fullName;
    return layout;
  }

  // Split at the first slash that leaves a short enough name
  for (size_t slash = fullName.find('/'); slash != std::string::npos;
       slash = fullName.find('/', slash + 1)) {
    size_t nameLength = fullName.size() - slash - 1;
    if (nameLength == 0 || slash > TarFormat::prefixSize) {
      break;
    }
    if (nameLength <= TarFormat::nameSize) {
      layout.prefix = fullName.substr(0, slash);
      layout.name = fullName.substr(slash + 1);
      return layout;
    }
  }

  layout.name = fullName.substr(0, TarFormat::nameSize);
  layout.pax = ustar::paxRecord("path", fullName);
  return layout;
}

void writeHeader(std::span<uint8_t> block, const NameLayout &layout, char typeflag, uint32_t mode,
                 uint64_t size, int64_t mtime) {
  ustar::writeString(block, ustar::name, layout.name);
  ustar::writeOctal(block, ustar::mode, mode & 07777);
  ustar::writeOctal(block, ustar::uid, 0);
  ustar::writeOctal(block, ustar::gid, 0);
  if (!ustar::writeOctal(block, ustar::size, size)) {
    ustar::writeBase256(block, ustar::size, size);
  }
  ustar::writeOctal(block, ustar::mtime, mtime > 0 ? static_cast<uint64_t>(mtime) : 0);
  block[ustar::typeflag.offset] = static_cast<uint8_t>(typeflag);
  ustar::writeString(block, ustar::magic, std::string_view("ustar\0", 6));
  ustar::writeString(block, ustar::version, "00");
  ustar::writeString(block, ustar::prefix, layout.prefix);
  ustar::sealChecksum(block);
}

} // namespace

bool TarWriter::addFile(const std::filesystem::path &sourcePath, const std::string &archivePath,
                        std::string *outError) {
  std::error_code ec;
  auto status = std::filesystem::status(sourcePath, ec);
  if (ec || !std::filesystem::is_regular_file(status)) {
    if (outError) {
      *outError = std::format("Source file does not exist: {}", sourcePath.string());
    }
    return false;
  }

  uint64_t size = std::filesystem::file_size(sourcePath, ec);
  if (ec) {
    if (outError) {
      *outError = std::format("Failed to get file size: {}", sourcePath.string());
    }
    return false;
  }

  auto writeTime = std::filesystem::last_write_time(sourcePath, ec);
  if (ec) {
    if (outError) {
      *outError = std::format("Failed to get modification time: {}", sourcePath.string());
    }
    return false;
  }

  if (!reserveName(archivePath, outError)) {
    return false;
  }

  PendingFile pending;
  pending.archivePath = normalizeSlashes(archivePath);
  pending.source = Source::Disk;
  pending.sourcePath = sourcePath;
  pending.size = size;
  pending.mode = static_cast<uint32_t>(status.permissions()) & 07777;
  pending.mtime = std::chrono::duration_cast<std::chrono::seconds>(
                      std::chrono::file_clock::to_sys(writeTime).time_since_epoch())
                      .count();
  pendingFiles_.push_back(std::move(pending));

  return true;
}

bool TarWriter::addFile(std::span<const uint8_t> data, const std::string &archivePath,
                        std::string *outError) {
  if (!reserveName(archivePath, outError)) {
    return false;
  }

  PendingFile pending;
  pending.archivePath = normalizeSlashes(archivePath);
  pending.source = Source::Memory;
  pending.data.assign(data.begin(), data.end());
  pending.size = data.size();
  pending.mtime = now();
  pendingFiles_.push_back(std::move(pending));

  return true;
}

bool TarWriter::addZeroFilled(uint64_t size, const std::string &archivePath,
                              std::string *outError) {
  if (!reserveName(archivePath, outError)) {
    return false;
  }

  PendingFile pending;
  pending.archivePath = normalizeSlashes(archivePath);
  pending.source = Source::Zero;
  pending.size = size;
  pending.mtime = now();
  pendingFiles_.push_back(std::move(pending));

  return true;
}

bool TarWriter::write(const std::filesystem::path &destPath, std::string *outError) {
  if (pendingFiles_.empty()) {
    if (outError) {
      *outError = "Cannot write archive with no files";
    }
    return false;
  }

  const size_t blockSize = TarFormat::blockSize;

  // Step 1: Lay out every header and calculate total archive size
  std::vector<NameLayout> layouts;
  layouts.reserve(pendingFiles_.size());
  uint64_t totalSize = 0;

  for (const auto &pending : pendingFiles_) {
    NameLayout layout = layoutName(pending.archivePath);
    if (!layout.pax.empty()) {
      totalSize += blockSize + TarFormat::paddedSize(layout.pax.size());
    }
    totalSize += blockSize + TarFormat::paddedSize(pending.size);
    layouts.push_back(std::move(layout));
  }

  // End-of-archive marker is two zero blocks, then pad to a whole record
  totalSize += 2 * blockSize;
  totalSize = (totalSize + TarFormat::recordSize - 1) / TarFormat::recordSize *
              TarFormat::recordSize;

  // Step 2: Create memory-mapped file; unwritten bytes stay zero
  MappedFile outputFile;
  if (!outputFile.openWrite(destPath, static_cast<size_t>(totalSize), outError)) {
    return false;
  }

  auto outputData = outputFile.data();

  // Step 3: Write headers and member data
  std::vector<TarEntry> written;
  written.reserve(pendingFiles_.size());
  uint64_t pos = 0;

  for (size_t i = 0; i < pendingFiles_.size(); ++i) {
    const auto &pending = pendingFiles_[i];
    const auto &layout = layouts[i];

    if (!layout.pax.empty()) {
      NameLayout paxName{"././@PaxHeader", "", ""};
      writeHeader(outputData.subspan(pos, blockSize), paxName, ustar::typePaxLocal, 0644,
                  layout.pax.size(), pending.mtime);
      pos += blockSize;
      std::memcpy(outputData.data() + pos, layout.pax.data(), layout.pax.size());
      pos += TarFormat::paddedSize(layout.pax.size());
    }

    writeHeader(outputData.subspan(pos, blockSize), layout, ustar::typeRegular, pending.mode,
                pending.size, pending.mtime);
    pos += blockSize;

    if (pending.source == Source::Disk) {
      std::ifstream inFile(pending.sourcePath, std::ios::binary);
      if (!inFile) {
        if (outError) {
          *outError = std::format("Failed to open source file: {}", pending.sourcePath.string());
        }
        return false;
      }

      // Read straight into the mapping; a file that shrank since addFile() fails here
      if (!inFile.read(reinterpret_cast<char *>(outputData.data() + pos),
                       static_cast<std::streamsize>(pending.size))) {
        if (outError) {
          *outError = std::format("Failed to read source file: {}", pending.sourcePath.string());
        }
        return false;
      }
      if (inFile.peek() != std::ifstream::traits_type::eof()) {
        if (outError) {
          *outError =
              std::format("Source file grew while archiving: {}", pending.sourcePath.string());
        }
        return false;
      }
    } else if (pending.source == Source::Memory && !pending.data.empty()) {
      std::memcpy(outputData.data() + pos, pending.data.data(), pending.data.size());
    }

    TarEntry entry;
    entry.path = pending.archivePath;
    entry.type = EntryType::File;
    entry.offset = pos;
    entry.size = pending.size;
    entry.mode = pending.mode;
    entry.mtime = pending.mtime;
    written.push_back(std::move(entry));

    pos += TarFormat::paddedSize(pending.size);
  }

  // Step 4: Flush to disk
  if (!outputFile.flush(outError)) {
    return false;
  }

  entries_ = std::move(written);
  return true;
}

void TarWriter::clear() {
  pendingFiles_.clear();
  names_.clear();
  entries_.clear();
}

bool TarWriter::reserveName(const std::string &archivePath, std::string *outError) {
  std::string normalized = normalizeSlashes(archivePath);
  if (normalized.empty()) {
    if (outError) {
      *outError = "Archive path must not be empty";
    }
    return false;
  }

  if (!names_.insert(normalized).second) {
    if (outError) {
      *outError = std::format("Duplicate file path in archive: {}", archivePath);
    }
    return false;
  }

  return true;
}

std::string TarWriter::normalizeSlashes(const std::string &path) {
  std::string result;
  result.reserve(path.size());

  for (char c : path) {
    result += c == '\\' ? '/' : c;
  }

  while (!result.empty() && result.back() == '/') {
    result.pop_back();
  }

  return result;
}

int64_t TarWriter::now() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace tilext

#include <algorithm>
#include <charconv>
#include <cstring>
#include <format>
#include <fstream>

#include <tilext/reader.hpp>
#include <tilext/tar_header.hpp>

namespace tilext {

namespace {

// Overrides collected from a pax extended header, applied to the next member
struct PaxOverrides {
  std::optional<std::string> path;
  std::optional<uint64_t> size;
};

bool parsePaxRecords(std::span<const uint8_t> data, PaxOverrides &out, std::string *outError) {
  const char *p = reinterpret_cast<const char *>(data.data());
  size_t pos = 0;

  while (pos < data.size() && p[pos] != '\0') {
    size_t length = 0;
    auto [end, ec] = std::from_chars(p + pos, p + data.size(), length);
    if (ec != std::errc() || end >= p + data.size() || *end != ' ' || length == 0 ||
        pos + length > data.size() || p[pos + length - 1] != '\n') {
      if (outError) {
        *outError = std::format("Malformed pax record at offset {}", pos);
      }
      return false;
    }

    std::string_view record(end + 1, p + pos + length - 1 - (end + 1));
    size_t eq = record.find('=');
    if (eq == std::string_view::npos) {
      if (outError) {
        *outError = std::format("Pax record without '=' at offset {}", pos);
      }
      return false;
    }

    std::string_view key = record.substr(0, eq);
    std::string_view value = record.substr(eq + 1);
    if (key == "path") {
      out.path = std::string(value);
    } else if (key == "size") {
      uint64_t size = 0;
      auto [sizeEnd, sizeEc] = std::from_chars(value.data(), value.data() + value.size(), size);
      if (sizeEc != std::errc() || sizeEnd != value.data() + value.size()) {
        if (outError) {
          *outError = std::format("Invalid pax size record: {}", value);
        }
        return false;
      }
      out.size = size;
    }

    pos += length;
  }

  return true;
}

EntryType entryTypeOf(char typeflag, const std::string &rawName) {
  switch (typeflag) {
  case ustar::typeRegular:
  case ustar::typeContiguous:
    return EntryType::File;
  case ustar::typeRegularOld:
    // Pre-POSIX archives mark directories only by a trailing slash
    return !rawName.empty() && rawName.back() == '/' ? EntryType::Directory : EntryType::File;
  case ustar::typeDirectory:
    return EntryType::Directory;
  default:
    return EntryType::Other;
  }
}

} // namespace

std::optional<TarReader> TarReader::open(const std::filesystem::path &path,
                                         std::string *outError) {
  TarReader reader;
  if (!reader.mappedFile_.openRead(path, outError)) {
    return std::nullopt;
  }

  if (!reader.parse(outError)) {
    reader.close();
    return std::nullopt;
  }

  return reader;
}

bool TarReader::parse(std::string *outError) {
  auto fileData = mappedFile_.data();
  const size_t blockSize = TarFormat::blockSize;

  if (fileData.size() < blockSize) {
    if (outError) {
      *outError = std::format("File too small to be a tar archive (size: {})", fileData.size());
    }
    return false;
  }

  PaxOverrides pax;
  std::optional<std::string> longName;
  uint64_t pos = 0;

  while (pos + blockSize <= fileData.size()) {
    auto block = fileData.subspan(pos, blockSize);

    // A zero block marks the end of the archive
    if (ustar::isZeroBlock(block)) {
      break;
    }

    auto stored = ustar::parseNumber(block, ustar::chksum);
    if (!stored || (*stored != ustar::checksum(block) &&
                    static_cast<int64_t>(*stored) != ustar::signedChecksum(block))) {
      if (outError) {
        *outError = std::format("Header checksum mismatch at offset {}", pos);
      }
      return false;
    }

    auto size = ustar::parseNumber(block, ustar::size);
    if (!size) {
      if (outError) {
        *outError = std::format("Invalid size field in header at offset {}", pos);
      }
      return false;
    }

    char typeflag = static_cast<char>(block[ustar::typeflag.offset]);
    uint64_t dataStart = pos + blockSize;

    // Extended headers describe the member that follows them
    if (typeflag == ustar::typePaxLocal || typeflag == ustar::typePaxGlobal ||
        typeflag == ustar::typeGnuLongName) {
      if (dataStart + *size > fileData.size()) {
        if (outError) {
          *outError = std::format("Extended header at offset {} extends beyond file bounds", pos);
        }
        return false;
      }

      auto payload = fileData.subspan(dataStart, *size);
      if (typeflag == ustar::typePaxLocal) {
        if (!parsePaxRecords(payload, pax, outError)) {
          return false;
        }
      } else if (typeflag == ustar::typeGnuLongName) {
        std::string name(reinterpret_cast<const char *>(payload.data()), payload.size());
        longName = name.substr(0, name.find('\0'));
      }
      // Global pax headers carry nothing this reader uses

      pos = dataStart + TarFormat::paddedSize(*size);
      continue;
    }

    std::string rawName;
    if (longName) {
      rawName = *longName;
    } else if (pax.path) {
      rawName = *pax.path;
    } else {
      rawName = ustar::parseString(block, ustar::name);
      std::string prefix = ustar::parseString(block, ustar::prefix);
      bool isUstar = std::memcmp(block.data() + ustar::magic.offset, "ustar", 5) == 0;
      if (isUstar && !prefix.empty()) {
        rawName = prefix + "/" + rawName;
      }
    }

    if (pax.size) {
      size = pax.size;
    }

    if (dataStart + *size > fileData.size()) {
      if (outError) {
        *outError = std::format("Member {} has invalid size (offset={}, size={}, fileSize={})",
                                rawName, dataStart, *size, fileData.size());
      }
      return false;
    }

    TarEntry entry;
    entry.path = normalizePath(rawName);
    entry.type = entryTypeOf(typeflag, rawName);
    entry.offset = dataStart;
    entry.size = *size;
    entry.mode = static_cast<uint32_t>(ustar::parseNumber(block, ustar::mode).value_or(0));
    entry.mtime = static_cast<int64_t>(ustar::parseNumber(block, ustar::mtime).value_or(0));

    // Only file members occupy data blocks
    uint64_t dataBlocks = entry.type == EntryType::Directory ? 0 : TarFormat::paddedSize(*size);
    pos = dataStart + dataBlocks;

    pax = PaxOverrides{};
    longName.reset();

    // The archive root itself ("./") carries no name of its own
    if (entry.path.empty()) {
      continue;
    }

    lookup_[entry.path] = files_.size();
    files_.push_back(std::move(entry));
  }

  return true;
}

const TarEntry *TarReader::findFile(const std::string &path) const {
  auto it = lookup_.find(normalizePath(path));
  if (it == lookup_.end()) {
    return nullptr;
  }
  return &files_[it->second];
}

bool TarReader::extract(const TarEntry &entry, const std::filesystem::path &destPath,
                        std::string *outError) const {
  if (entry.offset + entry.size > mappedFile_.size()) {
    if (outError) {
      *outError = std::format("Invalid member bounds for: {}", entry.path);
    }
    return false;
  }
  auto fileData = getFileView(entry);

  if (destPath.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(destPath.parent_path(), ec);
    if (ec) {
      if (outError) {
        *outError = std::format("Failed to create directory {}: {}",
                                destPath.parent_path().string(), ec.message());
      }
      return false;
    }
  }

  std::ofstream out(destPath, std::ios::binary);
  if (!out) {
    if (outError) {
      *outError = std::format("Failed to create output file: {}", destPath.string());
    }
    return false;
  }

  out.write(reinterpret_cast<const char *>(fileData.data()),
            static_cast<std::streamsize>(fileData.size()));
  if (!out) {
    if (outError) {
      *outError = std::format("Failed to write to output file: {}", destPath.string());
    }
    return false;
  }

  return true;
}

std::optional<std::vector<uint8_t>> TarReader::extractToMemory(const TarEntry &entry,
                                                               std::string *outError) const {
  if (entry.offset + entry.size > mappedFile_.size()) {
    if (outError) {
      *outError = std::format("Invalid member bounds for: {}", entry.path);
    }
    return std::nullopt;
  }

  auto fileData = getFileView(entry);
  return std::vector<uint8_t>(fileData.begin(), fileData.end());
}

std::span<const uint8_t> TarReader::getFileView(const TarEntry &entry) const {
  auto archiveData = mappedFile_.data();

  if (entry.offset + entry.size > archiveData.size()) {
    return {};
  }

  return archiveData.subspan(entry.offset, entry.size);
}

std::span<const uint8_t> TarReader::readAt(uint64_t offset, size_t size) const {
  auto archiveData = mappedFile_.data();

  if (offset >= archiveData.size()) {
    return {};
  }

  return archiveData.subspan(offset, std::min<uint64_t>(size, archiveData.size() - offset));
}

bool TarReader::isOpen() const {
  return mappedFile_.isOpen();
}

void TarReader::close() {
  mappedFile_.close();
  files_.clear();
  lookup_.clear();
}

std::string TarReader::normalizePath(const std::string &path) {
  std::string result;
  result.reserve(path.size());

  for (char c : path) {
    result += c == '\\' ? '/' : c;
  }

  while (result.starts_with("./")) {
    result.erase(0, 2);
  }
  while (!result.empty() && result.back() == '/') {
    result.pop_back();
  }
  if (result == ".") {
    result.clear();
  }

  return result;
}

} // namespace tilext

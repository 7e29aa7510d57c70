#include <algorithm>
#include <cstring>

#include <tilext/tar_header.hpp>

namespace tilext::ustar {

uint32_t checksum(std::span<const uint8_t> block) noexcept {
  uint32_t sum = 0;
  for (size_t i = 0; i < TarFormat::blockSize; ++i) {
    bool inField = i >= chksum.offset && i < chksum.offset + chksum.length;
    sum += inField ? static_cast<uint32_t>(' ') : block[i];
  }
  return sum;
}

int32_t signedChecksum(std::span<const uint8_t> block) noexcept {
  int32_t sum = 0;
  for (size_t i = 0; i < TarFormat::blockSize; ++i) {
    bool inField = i >= chksum.offset && i < chksum.offset + chksum.length;
    sum += inField ? static_cast<int32_t>(' ') : static_cast<int8_t>(block[i]);
  }
  return sum;
}

bool isZeroBlock(std::span<const uint8_t> block) noexcept {
  return std::all_of(block.begin(), block.begin() + TarFormat::blockSize,
                     [](uint8_t b) { return b == 0; });
}

std::optional<uint64_t> parseNumber(std::span<const uint8_t> block, Field field) {
  const uint8_t *p = block.data() + field.offset;

  if (p[0] & 0x80) {
    // Base-256: the remaining bits form a big-endian number
    if (p[0] != 0x80) {
      return std::nullopt; // Negative or too large for 64 bits
    }
    uint64_t value = 0;
    for (size_t i = 1; i < field.length; ++i) {
      if (value >> 56) {
        return std::nullopt;
      }
      value = (value << 8) | p[i];
    }
    return value;
  }

  size_t i = 0;
  while (i < field.length && (p[i] == ' ' || p[i] == '\0')) {
    ++i;
  }

  uint64_t value = 0;
  for (; i < field.length; ++i) {
    if (p[i] == ' ' || p[i] == '\0') {
      break;
    }
    if (p[i] < '0' || p[i] > '7') {
      return std::nullopt;
    }
    value = (value << 3) | static_cast<uint64_t>(p[i] - '0');
  }
  return value;
}

std::string parseString(std::span<const uint8_t> block, Field field) {
  const char *p = reinterpret_cast<const char *>(block.data() + field.offset);
  size_t len = 0;
  while (len < field.length && p[len] != '\0') {
    ++len;
  }
  return std::string(p, len);
}

bool writeOctal(std::span<uint8_t> block, Field field, uint64_t value) noexcept {
  uint8_t *p = block.data() + field.offset;
  size_t digits = field.length - 1;

  p[digits] = '\0';
  for (size_t i = digits; i > 0; --i) {
    p[i - 1] = static_cast<uint8_t>('0' + (value & 7));
    value >>= 3;
  }
  return value == 0;
}

void writeBase256(std::span<uint8_t> block, Field field, uint64_t value) noexcept {
  uint8_t *p = block.data() + field.offset;
  std::memset(p, 0, field.length);
  p[0] = 0x80;
  for (size_t i = field.length - 1; i > 0 && value != 0; --i) {
    p[i] = static_cast<uint8_t>(value & 0xFF);
    value >>= 8;
  }
}

void writeString(std::span<uint8_t> block, Field field, std::string_view value) noexcept {
  std::memcpy(block.data() + field.offset, value.data(), std::min(value.size(), field.length));
}

void sealChecksum(std::span<uint8_t> block) noexcept {
  uint32_t sum = checksum(block);

  // Six octal digits, NUL, space
  uint8_t *p = block.data() + chksum.offset;
  for (size_t i = 6; i > 0; --i) {
    p[i - 1] = static_cast<uint8_t>('0' + (sum & 7));
    sum >>= 3;
  }
  p[6] = '\0';
  p[7] = ' ';
}

std::string paxRecord(std::string_view key, std::string_view value) {
  // The length prefix counts itself, so grow it until it is stable
  size_t body = 1 + key.size() + 1 + value.size() + 1; // ' ' key '=' value '\n'
  size_t total = body + 1;
  while (std::to_string(total).size() + body != total) {
    total = std::to_string(total).size() + body;
  }

  std::string record = std::to_string(total);
  record += ' ';
  record += key;
  record += '=';
  record += value;
  record += '\n';
  return record;
}

} // namespace tilext::ustar

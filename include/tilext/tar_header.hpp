#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "types.hpp"

namespace tilext {

// Field layout of a 512-byte ustar header block
namespace ustar {

struct Field {
  size_t offset;
  size_t length;
};

inline constexpr Field name{0, 100};
inline constexpr Field mode{100, 8};
inline constexpr Field uid{108, 8};
inline constexpr Field gid{116, 8};
inline constexpr Field size{124, 12};
inline constexpr Field mtime{136, 12};
inline constexpr Field chksum{148, 8};
inline constexpr Field typeflag{156, 1};
inline constexpr Field linkname{157, 100};
inline constexpr Field magic{257, 6};
inline constexpr Field version{263, 2};
inline constexpr Field uname{265, 32};
inline constexpr Field gname{297, 32};
inline constexpr Field prefix{345, 155};

inline constexpr char typeRegular = '0';
inline constexpr char typeRegularOld = '\0';
inline constexpr char typeContiguous = '7';
inline constexpr char typeDirectory = '5';
inline constexpr char typePaxLocal = 'x';
inline constexpr char typePaxGlobal = 'g';
inline constexpr char typeGnuLongName = 'L';

// Sum of all header bytes with the checksum field counted as spaces
uint32_t checksum(std::span<const uint8_t> block) noexcept;

// Same sum over signed bytes, as written by some historic implementations
int32_t signedChecksum(std::span<const uint8_t> block) noexcept;

bool isZeroBlock(std::span<const uint8_t> block) noexcept;

// Decode an octal or base-256 (GNU) numeric field
std::optional<uint64_t> parseNumber(std::span<const uint8_t> block, Field field);

// NUL-terminated (or full-width) string field
std::string parseString(std::span<const uint8_t> block, Field field);

// Encode value as zero-padded octal followed by a NUL
// Returns false if the value does not fit
bool writeOctal(std::span<uint8_t> block, Field field, uint64_t value) noexcept;

// Encode value in GNU base-256 form (high bit of the first byte set)
void writeBase256(std::span<uint8_t> block, Field field, uint64_t value) noexcept;

// Copy up to field.length bytes; remaining bytes keep their (zero) value
void writeString(std::span<uint8_t> block, Field field, std::string_view value) noexcept;

// Compute and store the checksum of an otherwise complete header
void sealChecksum(std::span<uint8_t> block) noexcept;

// Build one "<len> <key>=<value>\n" pax extended header record
std::string paxRecord(std::string_view key, std::string_view value);

} // namespace ustar

} // namespace tilext

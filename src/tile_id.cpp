#include <charconv>
#include <format>

#include <tilext/tile_id.hpp>

namespace tilext {

namespace {

bool isDigits(std::string_view s) noexcept {
  if (s.empty()) {
    return false;
  }
  for (char c : s) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return true;
}

} // namespace

bool isTileMember(std::string_view name) noexcept {
  return name.size() > tileExtension.size() && name.ends_with(tileExtension);
}

std::optional<TileId> encodeTileId(std::string_view path, std::string *outError) {
  // Strip the final extension (only within the last path segment)
  std::string_view stem = path;
  size_t dot = stem.rfind('.');
  size_t lastSlash = stem.rfind('/');
  if (dot != std::string_view::npos && (lastSlash == std::string_view::npos || dot > lastSlash)) {
    stem = stem.substr(0, dot);
  }

  size_t slash = stem.find('/');
  if (slash == std::string_view::npos) {
    if (outError) {
      *outError = std::format("Tile path has no level separator: {}", path);
    }
    return std::nullopt;
  }

  std::string_view levelStr = stem.substr(0, slash);
  if (!isDigits(levelStr)) {
    if (outError) {
      *outError = std::format("Tile level is not a number: {}", path);
    }
    return std::nullopt;
  }

  uint32_t level = 0;
  auto [levelEnd, levelEc] =
      std::from_chars(levelStr.data(), levelStr.data() + levelStr.size(), level);
  if (levelEc != std::errc() || level > maxTileLevel) {
    if (outError) {
      *outError = std::format("Tile level out of range 0-{}: {}", maxTileLevel, path);
    }
    return std::nullopt;
  }

  std::string digits;
  digits.reserve(stem.size() - slash);
  for (char c : stem.substr(slash + 1)) {
    if (c != '/') {
      digits += c;
    }
  }

  if (!isDigits(digits)) {
    if (outError) {
      *outError = std::format("Tile index is empty or not a number: {}", path);
    }
    return std::nullopt;
  }

  uint64_t index = 0;
  auto [indexEnd, indexEc] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
  if (indexEc != std::errc() || index > maxTileIndex) {
    if (outError) {
      *outError = std::format("Tile index does not fit in {} bits: {}", 64 - tileLevelBits, path);
    }
    return std::nullopt;
  }

  return makeTileId(TileCoord{level, index});
}

} // namespace tilext

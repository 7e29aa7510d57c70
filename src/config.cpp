#include <format>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include <tilext/config.hpp>
#include <tilext/types.hpp>

namespace tilext {

namespace {

std::filesystem::path requirePath(const nlohmann::json &section, const char *key,
                                  const std::string &origin) {
  auto it = section.find(key);
  if (it == section.end()) {
    throw ConfigError(std::format("{}: missing key mjolnir.{}", origin, key));
  }
  if (!it->is_string()) {
    throw ConfigError(std::format("{}: mjolnir.{} must be a string", origin, key));
  }
  return it->get<std::string>();
}

} // namespace

BuildConfig parseConfig(const std::string &text, const std::string &origin) {
  nlohmann::json root;
  try {
    root = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &e) {
    throw ConfigError(std::format("{}: invalid JSON: {}", origin, e.what()));
  }

  auto mjolnir = root.find("mjolnir");
  if (!root.is_object() || mjolnir == root.end() || !mjolnir->is_object()) {
    throw ConfigError(std::format("{}: missing object 'mjolnir'", origin));
  }

  BuildConfig config;
  config.tileDir = requirePath(*mjolnir, "tile_dir", origin);
  config.tileExtract = requirePath(*mjolnir, "tile_extract", origin);
  if (mjolnir->contains("traffic_extract")) {
    config.trafficExtract = requirePath(*mjolnir, "traffic_extract", origin);
  }

  return config;
}

BuildConfig loadConfig(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw ConfigError(std::format("Failed to open config file: {}", path.string()));
  }

  std::ostringstream text;
  text << in.rdbuf();
  if (in.bad()) {
    throw ConfigError(std::format("Failed to read config file: {}", path.string()));
  }

  return parseConfig(text.str(), path.string());
}

} // namespace tilext

#pragma once

#include <filesystem>
#include <string>

namespace tilext {

// Paths read from the "mjolnir" section of the routing config
struct BuildConfig {
  std::filesystem::path tileDir;        // mjolnir.tile_dir
  std::filesystem::path tileExtract;    // mjolnir.tile_extract
  std::filesystem::path trafficExtract; // mjolnir.traffic_extract, may be empty
};

// Everything one run needs, assembled by the command line front end
struct BuildOptions {
  BuildConfig config;
  bool buildTraffic = false;
  int verbosity = 0;
};

// Load and validate a JSON config file
// Throws ConfigError if the file is unreadable, not JSON, or lacks required keys
BuildConfig loadConfig(const std::filesystem::path &path);

// Same, from JSON text already in memory; origin is only used in messages
BuildConfig parseConfig(const std::string &text, const std::string &origin = "<memory>");

} // namespace tilext

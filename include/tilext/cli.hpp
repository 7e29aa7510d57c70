#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "config.hpp"

namespace tilext {

struct CommandLine {
  std::filesystem::path configPath;
  bool traffic = false;
  int verbosity = 0;
  bool help = false;
};

// Accepts -c/--config <path> (or --config=<path>), -t/--traffic,
// -v/--verbosity (repeatable, also -vv) and -h/--help
// Returns std::nullopt on a usage error, with the reason in outError if provided
std::optional<CommandLine> parseCommandLine(int argc, const char *const *argv,
                                            std::string *outError = nullptr);

std::string usage(std::string_view program);

// Build the extract (and the traffic sidecar if requested)
// Throws the errors declared in types.hpp
void buildExtracts(const BuildOptions &options);

// Full run for a parsed command line: configures logging, loads the config,
// builds, and maps every failure to a logged message and exit code 1
int run(const CommandLine &commandLine);

} // namespace tilext

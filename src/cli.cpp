#include <format>

#include <tilext/archive_builder.hpp>
#include <tilext/cli.hpp>
#include <tilext/log.hpp>
#include <tilext/traffic_builder.hpp>
#include <tilext/types.hpp>

namespace tilext {

std::optional<CommandLine> parseCommandLine(int argc, const char *const *argv,
                                            std::string *outError) {
  CommandLine result;
  bool haveConfig = false;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      result.help = true;
    } else if (arg == "-t" || arg == "--traffic") {
      result.traffic = true;
    } else if (arg == "-v" || arg == "--verbosity") {
      ++result.verbosity;
    } else if (arg.size() > 2 && arg[0] == '-' &&
               arg.find_first_not_of('v', 1) == std::string_view::npos) {
      result.verbosity += static_cast<int>(arg.size() - 1);
    } else if (arg == "-c" || arg == "--config") {
      if (i + 1 >= argc) {
        if (outError) {
          *outError = std::format("Option {} requires a path", arg);
        }
        return std::nullopt;
      }
      result.configPath = argv[++i];
      haveConfig = true;
    } else if (arg.starts_with("--config=")) {
      result.configPath = std::string(arg.substr(9));
      haveConfig = true;
    } else {
      if (outError) {
        *outError = std::format("Unknown argument: {}", arg);
      }
      return std::nullopt;
    }
  }

  if (!haveConfig && !result.help) {
    if (outError) {
      *outError = "Missing required option --config";
    }
    return std::nullopt;
  }

  return result;
}

std::string usage(std::string_view program) {
  return std::format("Usage: {} -c <config.json> [-t] [-v|-vv]\n"
                     "\n"
                     "Builds a tar extract from the tiles in mjolnir.tile_dir to the path\n"
                     "specified in mjolnir.tile_extract.\n"
                     "\n"
                     "  -c, --config <path>  Path to the JSON config\n"
                     "  -t, --traffic        Also write the traffic skeleton to\n"
                     "                       mjolnir.traffic_extract\n"
                     "  -v, --verbosity      Accumulative: -v INFO, -vv DEBUG\n"
                     "  -h, --help           Show this help\n",
                     program);
}

void buildExtracts(const BuildOptions &options) {
  const auto &config = options.config;
  if (options.buildTraffic && config.trafficExtract.empty()) {
    throw ConfigError("--traffic requires mjolnir.traffic_extract in the config");
  }

  ArchiveBuilder builder(config.tileDir, config.tileExtract);
  const IndexTable &index = builder.build();

  if (options.buildTraffic) {
    TrafficSkeletonBuilder traffic(config.tileExtract, config.trafficExtract);
    traffic.build(index);
  }
}

int run(const CommandLine &commandLine) {
  log::setLevel(log::levelFromVerbosity(commandLine.verbosity));

  try {
    BuildOptions options;
    options.config = loadConfig(commandLine.configPath);
    options.buildTraffic = commandLine.traffic;
    options.verbosity = commandLine.verbosity;

    buildExtracts(options);
  } catch (const ConfigError &e) {
    log::critical("Invalid config: {}", e.what());
    return 1;
  } catch (const NoTilesFoundError &e) {
    log::critical("{}", e.what());
    return 1;
  } catch (const MalformedPathError &e) {
    log::critical("Malformed tile path: {}", e.what());
    return 1;
  } catch (const HeaderDecodeError &e) {
    log::critical("Corrupt tile header: {}", e.what());
    return 1;
  } catch (const ArchiveError &e) {
    log::critical("Archive failure: {}", e.what());
    return 1;
  }

  return 0;
}

} // namespace tilext

#include <chrono>
#include <iostream>

#include <tilext/log.hpp>

namespace tilext::log {

namespace {

Level currentLevel = Level::Critical;
std::ostream *output = &std::cerr;

std::string_view levelName(Level messageLevel) noexcept {
  switch (messageLevel) {
  case Level::Critical:
    return "CRITICAL";
  case Level::Info:
    return "INFO";
  case Level::Debug:
    return "DEBUG";
  }
  return "?";
}

} // namespace

Level levelFromVerbosity(int verbosity) noexcept {
  if (verbosity <= 0) {
    return Level::Critical;
  }
  if (verbosity == 1) {
    return Level::Info;
  }
  return Level::Debug;
}

void setLevel(Level level) noexcept {
  currentLevel = level;
}

Level level() noexcept {
  return currentLevel;
}

void setOutput(std::ostream &out) noexcept {
  output = &out;
}

void write(Level messageLevel, std::string_view message) {
  auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
  *output << std::format("{:%Y-%m-%d %H:%M:%S} {:>5}: {}\n", now, levelName(messageLevel),
                         message);
  output->flush();
}

} // namespace tilext::log

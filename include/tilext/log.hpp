#pragma once

#include <format>
#include <ostream>
#include <string_view>
#include <utility>

namespace tilext::log {

enum class Level : int {
  Critical = 0,
  Info = 1,
  Debug = 2,
};

// 0 -> Critical, 1 -> Info, 2 and above -> Debug
Level levelFromVerbosity(int verbosity) noexcept;

void setLevel(Level level) noexcept;
Level level() noexcept;

inline bool enabled(Level messageLevel) noexcept {
  return static_cast<int>(messageLevel) <= static_cast<int>(level());
}

// Redirect output (stderr by default); the stream must outlive all logging
void setOutput(std::ostream &out) noexcept;

// Emit one line: "YYYY-MM-DD HH:MM:SS LEVEL: message"
void write(Level messageLevel, std::string_view message);

template <typename... Args> void critical(std::format_string<Args...> fmt, Args &&...args) {
  if (enabled(Level::Critical)) {
    write(Level::Critical, std::format(fmt, std::forward<Args>(args)...));
  }
}

template <typename... Args> void info(std::format_string<Args...> fmt, Args &&...args) {
  if (enabled(Level::Info)) {
    write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
  }
}

template <typename... Args> void debug(std::format_string<Args...> fmt, Args &&...args) {
  if (enabled(Level::Debug)) {
    write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
  }
}

} // namespace tilext::log

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace game {

struct ServerConfig {
  uint16_t port{3000};
  size_t worker_threads{2};
  std::chrono::milliseconds turn_notice_delay{2000};
  std::chrono::milliseconds disconnect_grace{30000};

  // Defaults, overridden by PORT, SPINBOTTLE_WORKERS,
  // SPINBOTTLE_TURN_DELAY_MS and SPINBOTTLE_GRACE_MS when set. Throws
  // std::invalid_argument on malformed values.
  static ServerConfig fromEnvironment();

  // Applies `--port N` and `--workers N`. Throws std::invalid_argument on
  // unknown flags or malformed values.
  void applyArguments(int argc, const char *const argv[]);
};

// Strict decimal parse in [min, max]; throws std::invalid_argument naming
// `what` otherwise.
uint64_t parseUnsigned(const std::string &text, const std::string &what,
                       uint64_t min, uint64_t max);

} // namespace game

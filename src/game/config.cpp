#include "../../include/game/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <thread>

namespace game {

uint64_t parseUnsigned(const std::string &text, const std::string &what,
                       uint64_t min, uint64_t max) {
  if (text.empty() || text.size() > 19 ||
      !std::all_of(text.begin(), text.end(),
                   [](unsigned char c) { return std::isdigit(c); })) {
    throw std::invalid_argument("Invalid value for " + what + ": '" + text +
                                "'");
  }
  uint64_t value = std::stoull(text);
  if (value < min || value > max) {
    throw std::invalid_argument(what + " must be between " +
                                std::to_string(min) + " and " +
                                std::to_string(max));
  }
  return value;
}

ServerConfig ServerConfig::fromEnvironment() {
  ServerConfig config;
  config.worker_threads =
      std::max<size_t>(2, std::thread::hardware_concurrency());

  if (const char *port = std::getenv("PORT")) {
    config.port = static_cast<uint16_t>(parseUnsigned(port, "PORT", 0, 65535));
  }
  if (const char *workers = std::getenv("SPINBOTTLE_WORKERS")) {
    config.worker_threads =
        parseUnsigned(workers, "SPINBOTTLE_WORKERS", 1, 256);
  }
  if (const char *delay = std::getenv("SPINBOTTLE_TURN_DELAY_MS")) {
    config.turn_notice_delay = std::chrono::milliseconds(
        parseUnsigned(delay, "SPINBOTTLE_TURN_DELAY_MS", 0, 3600000));
  }
  if (const char *grace = std::getenv("SPINBOTTLE_GRACE_MS")) {
    config.disconnect_grace = std::chrono::milliseconds(
        parseUnsigned(grace, "SPINBOTTLE_GRACE_MS", 0, 86400000));
  }
  return config;
}

void ServerConfig::applyArguments(int argc, const char *const argv[]) {
  for (int i = 1; i < argc; ++i) {
    const std::string flag = argv[i];
    if (flag != "--port" && flag != "--workers") {
      throw std::invalid_argument("Unknown argument '" + flag + "'");
    }
    if (i + 1 >= argc) {
      throw std::invalid_argument("Missing value for " + flag);
    }
    const std::string value = argv[++i];
    if (flag == "--port") {
      port = static_cast<uint16_t>(parseUnsigned(value, flag, 0, 65535));
    } else {
      worker_threads = parseUnsigned(value, flag, 1, 256);
    }
  }
}

} // namespace game

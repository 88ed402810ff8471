#pragma once

#include "../network/connection.hpp"
#include <cstdint>
#include <functional>
#include <string>

namespace room {

// Player identity. Kept apart from the transport's ConnectionId; for now the
// mapping is 1:1 and a player lives exactly as long as its connection.
class PlayerId {
public:
  PlayerId() = default;

  static PlayerId fromConnection(network::ConnectionId connection) {
    return PlayerId(connection);
  }

  network::ConnectionId connection() const { return _value; }
  std::string toString() const { return std::to_string(_value); }

  bool operator==(const PlayerId &other) const {
    return _value == other._value;
  }
  bool operator!=(const PlayerId &other) const {
    return _value != other._value;
  }
  bool operator<(const PlayerId &other) const { return _value < other._value; }

private:
  explicit PlayerId(uint64_t value) : _value(value) {}

  uint64_t _value{0};
};

struct Player {
  PlayerId id;
  std::string name; // untrusted display name
  bool is_host{false};
};

} // namespace room

namespace std {
template <> struct hash<room::PlayerId> {
  size_t operator()(const room::PlayerId &id) const noexcept {
    return hash<uint64_t>()(id.connection());
  }
};
} // namespace std

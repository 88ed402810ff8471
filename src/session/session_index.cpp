#include "../../include/session/session_index.hpp"

#include <algorithm>

namespace session {

std::optional<std::string>
SessionIndex::bindSession(network::ConnectionId connection,
                          const std::string &room_code) {
  writelock lock(_mutex);

  auto it = _bindings.find(connection);
  if (it == _bindings.end()) {
    _bindings.emplace(connection, Binding{room_code, {room_code}});
    return std::nullopt;
  }

  Binding &binding = it->second;
  std::optional<std::string> previous = binding.current;
  if (std::find(binding.rooms.begin(), binding.rooms.end(), room_code) ==
      binding.rooms.end()) {
    binding.rooms.push_back(room_code);
  }
  binding.current = room_code;
  return previous;
}

std::optional<std::string>
SessionIndex::lookupSession(network::ConnectionId connection) const {
  readlock lock(_mutex);

  auto it = _bindings.find(connection);
  if (it != _bindings.end()) {
    return it->second.current;
  }
  return std::nullopt;
}

std::vector<std::string>
SessionIndex::roomsOf(network::ConnectionId connection) const {
  readlock lock(_mutex);

  auto it = _bindings.find(connection);
  if (it != _bindings.end()) {
    return it->second.rooms;
  }
  return {};
}

std::vector<std::string>
SessionIndex::unbindSession(network::ConnectionId connection) {
  writelock lock(_mutex);

  auto it = _bindings.find(connection);
  if (it == _bindings.end()) {
    return {};
  }
  std::vector<std::string> rooms = std::move(it->second.rooms);
  _bindings.erase(it);
  return rooms;
}

size_t SessionIndex::size() const {
  readlock lock(_mutex);
  return _bindings.size();
}

} // namespace session

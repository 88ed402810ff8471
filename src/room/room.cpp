#include "../../include/room/room.hpp"

#include <algorithm>

namespace room {

const Player *RoomState::findPlayer(const PlayerId &id) const {
  auto it = std::find_if(players.begin(), players.end(),
                         [&id](const Player &p) { return p.id == id; });
  return it != players.end() ? &*it : nullptr;
}

const Player *RoomState::host() const {
  auto it = std::find_if(players.begin(), players.end(),
                         [](const Player &p) { return p.is_host; });
  return it != players.end() ? &*it : nullptr;
}

const Player *RoomState::otherPlayer(const PlayerId &id) const {
  auto it = std::find_if(players.begin(), players.end(),
                         [&id](const Player &p) { return p.id != id; });
  return it != players.end() ? &*it : nullptr;
}

} // namespace room

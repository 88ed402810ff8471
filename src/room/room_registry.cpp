#include "../../include/room/room_registry.hpp"

namespace room {

RoomRegistry::RoomRegistry(RandomSource &random) : _codes(random) {}

RoomRegistry::~RoomRegistry() = default;

std::pair<std::string, RoomState>
RoomRegistry::createRoom(const PlayerId &host, const std::string &playerName) {
  auto entry = std::make_shared<Entry>();

  writelock lock(_mutex);
  std::string code = _codes.generateUnique(
      [this](const std::string &candidate) { return _rooms.count(candidate) > 0; });

  entry->state.code = code;
  entry->state.players.push_back(Player{host, playerName, true});
  _rooms.emplace(code, entry);

  return {code, entry->state};
}

std::shared_ptr<RoomRegistry::Entry>
RoomRegistry::find(const std::string &code) const {
  readlock lock(_mutex);
  auto it = _rooms.find(code);
  if (it != _rooms.end()) {
    return it->second;
  }
  return nullptr;
}

void RoomRegistry::erase(const std::string &code,
                         const std::shared_ptr<Entry> &entry) {
  // Caller holds entry->mutex.
  entry->deleted = true;
  writelock lock(_mutex);
  auto it = _rooms.find(code);
  if (it != _rooms.end() && it->second == entry) {
    _rooms.erase(it);
  }
}

std::optional<RoomState> RoomRegistry::getRoom(const std::string &code) const {
  auto entry = find(code);
  if (!entry) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  if (entry->deleted) {
    return std::nullopt;
  }
  return entry->state;
}

bool RoomRegistry::contains(const std::string &code) const {
  readlock lock(_mutex);
  return _rooms.find(code) != _rooms.end();
}

bool RoomRegistry::deleteRoom(const std::string &code) {
  auto entry = find(code);
  if (!entry) {
    return false;
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  if (entry->deleted) {
    return false;
  }
  erase(code, entry);
  return true;
}

bool RoomRegistry::withRoom(const std::string &code,
                            const std::function<void(RoomState &)> &fn) {
  auto entry = find(code);
  if (!entry) {
    return false;
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  if (entry->deleted) {
    return false;
  }
  fn(entry->state);
  return true;
}

bool RoomRegistry::eraseIf(const std::string &code,
                           const std::function<bool(const RoomState &)> &pred) {
  auto entry = find(code);
  if (!entry) {
    return false;
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  if (entry->deleted || !pred(entry->state)) {
    return false;
  }
  erase(code, entry);
  return true;
}

size_t RoomRegistry::size() const {
  readlock lock(_mutex);
  return _rooms.size();
}

} // namespace room

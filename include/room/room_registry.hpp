#pragma once

#include "room.hpp"
#include "room_code.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace room {

// Owns every live room. The map itself takes a shared_mutex (many readers,
// exclusive insert/erase); each room carries its own mutex so that
// operations on one room are linearized while different rooms run in
// parallel.
//
// Lock order: room mutex, then map mutex. Callbacks passed to withRoom and
// eraseIf must not call back into the registry.
class RoomRegistry {
  using writelock = std::unique_lock<std::shared_mutex>;
  using readlock = std::shared_lock<std::shared_mutex>;

public:
  explicit RoomRegistry(RandomSource &random);
  ~RoomRegistry();

  RoomRegistry(const RoomRegistry &) = delete;
  RoomRegistry &operator=(const RoomRegistry &) = delete;

  // Allocates a fresh code and a room holding only the host.
  std::pair<std::string, RoomState> createRoom(const PlayerId &host,
                                               const std::string &playerName);

  // Snapshot of the room, or nullopt when the code is unknown.
  std::optional<RoomState> getRoom(const std::string &code) const;
  bool contains(const std::string &code) const;
  bool deleteRoom(const std::string &code);

  // Runs `fn` against the live room state with the room locked. Returns
  // false without calling `fn` if no such room exists.
  bool withRoom(const std::string &code,
                const std::function<void(RoomState &)> &fn);

  // Deletes the room if `pred` holds, checked and erased under the room's
  // lock. Returns true when the room was deleted.
  bool eraseIf(const std::string &code,
               const std::function<bool(const RoomState &)> &pred);

  size_t size() const;

private:
  struct Entry {
    std::mutex mutex;
    RoomState state;
    bool deleted{false};
  };

  std::shared_ptr<Entry> find(const std::string &code) const;
  void erase(const std::string &code, const std::shared_ptr<Entry> &entry);

  RoomCodeGenerator _codes;
  std::unordered_map<std::string, std::shared_ptr<Entry>> _rooms;
  mutable std::shared_mutex _mutex;
};

} // namespace room

#pragma once

#include "../network/connection.hpp"
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace session {

// Which rooms each live connection has entered. The latest one is the
// connection's current room; earlier ones are remembered so a disconnect
// can clean up every room the connection ever sat in.
class SessionIndex {
  using writelock = std::unique_lock<std::shared_mutex>;
  using readlock = std::shared_lock<std::shared_mutex>;

public:
  SessionIndex() = default;
  ~SessionIndex() = default;

  SessionIndex(const SessionIndex &) = delete;
  SessionIndex &operator=(const SessionIndex &) = delete;

  // Makes `room_code` the current room. Returns the previous current room,
  // if any.
  std::optional<std::string> bindSession(network::ConnectionId connection,
                                         const std::string &room_code);
  std::optional<std::string>
  lookupSession(network::ConnectionId connection) const;
  // Every room the connection was bound to, oldest first.
  std::vector<std::string> roomsOf(network::ConnectionId connection) const;
  // Forgets the connection and returns every room it was bound to, oldest
  // first. Empty if it was never bound.
  std::vector<std::string> unbindSession(network::ConnectionId connection);

  size_t size() const;

private:
  struct Binding {
    std::string current;
    std::vector<std::string> rooms;
  };

  std::unordered_map<network::ConnectionId, Binding> _bindings;
  mutable std::shared_mutex _mutex;
};

} // namespace session

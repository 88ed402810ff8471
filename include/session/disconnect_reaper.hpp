#pragma once

#include "../network/broadcaster.hpp"
#include "../network/connection.hpp"
#include "../network/scheduler.hpp"
#include "../room/room_registry.hpp"
#include <chrono>
#include <string>

namespace session {

// Deletes rooms nobody is connected to any more, after a grace period that
// covers short connection drops.
class DisconnectReaper {
public:
  static constexpr std::chrono::milliseconds kDefaultGrace{30000};

  DisconnectReaper(room::RoomRegistry &rooms,
                   network::EventBroadcaster &broadcaster,
                   const network::ConnectionLiveness &liveness,
                   network::Scheduler &scheduler,
                   std::chrono::milliseconds grace = kDefaultGrace);

  // Tells the rest of the room and schedules the emptiness check. The
  // transport must already report `connection` as gone.
  network::CancellationToken onDisconnect(network::ConnectionId connection,
                                          const std::string &room_code);

  // Deletes the room if none of its players is connected. Returns true when
  // the room was deleted.
  bool reapIfAbandoned(const std::string &room_code);

  std::chrono::milliseconds grace() const { return _grace; }

private:
  room::RoomRegistry &_rooms;
  network::EventBroadcaster &_broadcaster;
  const network::ConnectionLiveness &_liveness;
  network::Scheduler &_scheduler;
  std::chrono::milliseconds _grace;
};

} // namespace session

#include "../../include/session/disconnect_reaper.hpp"

#include <algorithm>
#include <iostream>

namespace session {

DisconnectReaper::DisconnectReaper(room::RoomRegistry &rooms,
                                   network::EventBroadcaster &broadcaster,
                                   const network::ConnectionLiveness &liveness,
                                   network::Scheduler &scheduler,
                                   std::chrono::milliseconds grace)
    : _rooms(rooms), _broadcaster(broadcaster), _liveness(liveness),
      _scheduler(scheduler), _grace(grace) {}

network::CancellationToken
DisconnectReaper::onDisconnect(network::ConnectionId connection,
                               const std::string &room_code) {
  auto player = room::PlayerId::fromConnection(connection);

  _rooms.withRoom(room_code, [&](room::RoomState &state) {
    const room::Player *gone = state.findPlayer(player);
    if (gone) {
      _broadcaster.sendToRoom(room_code,
                              room::PlayerDisconnected{gone->name});
    }
  });

  return _scheduler.schedule(
      _grace, [this, room_code]() { reapIfAbandoned(room_code); });
}

bool DisconnectReaper::reapIfAbandoned(const std::string &room_code) {
  bool deleted =
      _rooms.eraseIf(room_code, [this](const room::RoomState &state) {
        return std::none_of(state.players.begin(), state.players.end(),
                            [this](const room::Player &p) {
                              return _liveness.isConnected(p.id.connection());
                            });
      });

  if (deleted) {
    std::cout << "Room " << room_code << " deleted after inactivity\n";
  }
  return deleted;
}

} // namespace session

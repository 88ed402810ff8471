#pragma once

#include "../room/events.hpp"
#include "connection.hpp"
#include <string>

namespace network {

// The three delivery modes the game needs from a transport. Rooms are
// addressed as transport groups named by the room code.
class EventBroadcaster {
public:
  virtual ~EventBroadcaster() = default;

  virtual void sendTo(ConnectionId connection,
                      const room::ServerEvent &event) = 0;
  virtual void sendToRoomExcept(const std::string &room_code,
                                ConnectionId except,
                                const room::ServerEvent &event) = 0;
  virtual void sendToRoom(const std::string &room_code,
                          const room::ServerEvent &event) = 0;

  // Membership is released by the transport when the connection closes.
  virtual void joinGroup(ConnectionId connection,
                         const std::string &room_code) = 0;

  void publish(ConnectionId sender, const std::string &room_code,
               const room::Outbound &outbound) {
    switch (outbound.delivery) {
    case room::Delivery::SENDER:
      sendTo(sender, outbound.event);
      break;
    case room::Delivery::ROOM_EXCEPT_SENDER:
      sendToRoomExcept(room_code, sender, outbound.event);
      break;
    case room::Delivery::ROOM:
      sendToRoom(room_code, outbound.event);
      break;
    }
  }
};

} // namespace network

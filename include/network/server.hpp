#pragma once

#include "broadcaster.hpp"
#include "connection.hpp"
#include "protocol.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace network {

// Receives decoded traffic from the server's reader threads. Calls for one
// connection arrive in order; calls for different connections may overlap.
class MessageHandler {
public:
  virtual ~MessageHandler() = default;
  virtual void onConnect(ConnectionId connection) { (void)connection; }
  virtual void onMessage(ConnectionId connection,
                         const ClientMessage &message) = 0;
  // By the time this runs the connection is closed, out of every group and
  // no longer reported by isConnected().
  virtual void onDisconnect(ConnectionId connection) = 0;
};

// TCP transport speaking newline-delimited JSON. Each connection has a
// reader thread and a writer thread draining its outbox; rooms map onto
// named groups of connections. The send calls only queue, so they never
// block on a peer.
class NetworkServer : public EventBroadcaster, public ConnectionLiveness {
public:
  // A connection whose unsent output grows past this is dropped.
  static constexpr size_t kMaxPendingBytes = 1 << 20;

  // Port 0 binds an ephemeral port, see getPort().
  explicit NetworkServer(uint16_t port);
  ~NetworkServer() override;

  NetworkServer(const NetworkServer &) = delete;
  NetworkServer &operator=(const NetworkServer &) = delete;

  // Must be set before start(); not owned.
  void setHandler(MessageHandler *handler);
  void start();
  void stop();
  bool isRunning() const;
  uint16_t getPort() const;
  size_t connectionCount() const;

  void sendTo(ConnectionId connection,
              const room::ServerEvent &event) override;
  void sendToRoomExcept(const std::string &room_code, ConnectionId except,
                        const room::ServerEvent &event) override;
  void sendToRoom(const std::string &room_code,
                  const room::ServerEvent &event) override;
  void joinGroup(ConnectionId connection,
                 const std::string &room_code) override;

  bool isConnected(ConnectionId connection) const override;

private:
  class Impl;
  Impl *_pimpl;
};

} // namespace network

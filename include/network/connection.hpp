#pragma once

#include <cstdint>

namespace network {

// Transport-level identity of a live connection. Never reused by a server
// instance.
using ConnectionId = uint64_t;

class ConnectionLiveness {
public:
  virtual ~ConnectionLiveness() = default;
  virtual bool isConnected(ConnectionId connection) const = 0;
};

} // namespace network

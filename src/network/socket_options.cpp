#include "../../include/network/socket_options.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>

namespace network {

bool SocketOptimiser::optimiseListener(int socket_fd) {
  return enableOption(socket_fd, SOL_SOCKET, SO_REUSEADDR);
}

// Game events are tiny and latency-sensitive; keepalive surfaces peers that
// vanished without a FIN so their rooms get reaped.
bool SocketOptimiser::optimiseClient(int socket_fd,
                                     std::chrono::milliseconds send_timeout) {
  return enableOption(socket_fd, IPPROTO_TCP, TCP_NODELAY) &&
         enableOption(socket_fd, SOL_SOCKET, SO_KEEPALIVE) &&
         setSendTimeout(socket_fd, send_timeout);
}

bool SocketOptimiser::enableOption(int socket_fd, int level, int option) {
  int on = 1;
  return setsockopt(socket_fd, level, option, &on, sizeof(on)) == 0;
}

bool SocketOptimiser::setSendTimeout(int socket_fd,
                                     std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  return setsockopt(socket_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

} // namespace network

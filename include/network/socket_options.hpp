#pragma once

#include <chrono>

namespace network {

class SocketOptimiser {
public:
  static constexpr std::chrono::milliseconds kDefaultSendTimeout{5000};

  static bool optimiseListener(int socket_fd);
  // A send blocked longer than `send_timeout` fails with EAGAIN instead of
  // waiting on the peer forever.
  static bool
  optimiseClient(int socket_fd,
                 std::chrono::milliseconds send_timeout = kDefaultSendTimeout);

private:
  static bool enableOption(int socket_fd, int level, int option);
  static bool setSendTimeout(int socket_fd, std::chrono::milliseconds timeout);
};

} // namespace network

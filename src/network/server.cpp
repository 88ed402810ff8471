#include "../../include/network/server.hpp"
#include "../../include/network/socket_options.hpp"
#include <arpa/inet.h>
#include <array>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <netinet/in.h>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace network {

class NetworkServer::Impl {
  using writelock = std::unique_lock<std::shared_mutex>;
  using readlock = std::shared_lock<std::shared_mutex>;

  // Outbound traffic is queued and written by the connection's own writer
  // thread, so callers never block on a slow peer.
  struct Connection {
    Connection(ConnectionId id, int fd) : id(id), fd(fd) {}

    ConnectionId id;
    int fd; // closed and set to -1 once both threads are done with it
    std::mutex outbox_mutex; // guards fd, outbox, outbox_bytes and closing
    std::condition_variable outbox_ready;
    std::deque<std::string> outbox;
    size_t outbox_bytes{0};
    bool closing{false};
    std::thread writer;
    std::unordered_set<std::string> groups; // guarded by _connections_mutex
  };

public:
  explicit Impl(uint16_t port)
      : _port(port), _running(false), _serverSocket(-1) {}

  ~Impl() { stop(); }

  void setHandler(MessageHandler *handler) { _handler = handler; }

  void start() {
    if (_running)
      return;
    if (!_handler) {
      throw std::runtime_error("No message handler installed");
    }

    _serverSocket = socket(AF_INET, SOCK_STREAM, 0);
    if (_serverSocket < 0) {
      throw std::runtime_error("Failed to create socket");
    }

    if (!SocketOptimiser::optimiseListener(_serverSocket)) {
      closeListener();
      throw std::runtime_error("Failed to configure listening socket");
    }

    sockaddr_in serverAddress{};
    serverAddress.sin_family = AF_INET;
    serverAddress.sin_addr.s_addr = INADDR_ANY;
    serverAddress.sin_port = htons(_port);

    if (bind(_serverSocket, (struct sockaddr *)&serverAddress,
             sizeof(serverAddress)) < 0) {
      closeListener();
      throw std::runtime_error("Failed to bind socket: " +
                               std::string(strerror(errno)));
    }

    if (listen(_serverSocket, SOMAXCONN) < 0) {
      closeListener();
      throw std::runtime_error("Failed to listen on socket");
    }

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (getsockname(_serverSocket, (struct sockaddr *)&bound, &boundLen) ==
        0) {
      _port = ntohs(bound.sin_port);
    }

    _running = true;
    _acceptThread = std::thread(&NetworkServer::Impl::acceptLoop, this);
    std::cout << "Server started on port " << _port << std::endl;
  }

  void stop() {
    if (!_running.exchange(false))
      return;

    if (_serverSocket != -1) {
      shutdown(_serverSocket, SHUT_RDWR);
    }
    if (_acceptThread.joinable()) {
      _acceptThread.join();
    }
    closeListener();

    std::vector<std::shared_ptr<Connection>> open;
    {
      readlock lock(_connections_mutex);
      for (const auto &[id, connection] : _connections) {
        open.push_back(connection);
      }
    }
    for (const auto &connection : open) {
      std::lock_guard<std::mutex> lock(connection->outbox_mutex);
      if (connection->fd != -1) {
        shutdown(connection->fd, SHUT_RDWR);
      }
    }

    std::unordered_map<ConnectionId, std::thread> readers;
    {
      std::lock_guard<std::mutex> lock(_threads_mutex);
      readers.swap(_readers);
      _finished.clear();
    }
    for (auto &[id, reader] : readers) {
      if (reader.joinable()) {
        reader.join();
      }
    }
    std::cout << "Server on port " << _port << " stopped" << std::endl;
  }

  bool isRunning() const { return _running; }
  uint16_t getPort() const { return _port; }

  size_t connectionCount() const {
    readlock lock(_connections_mutex);
    return _connections.size();
  }

  void sendTo(ConnectionId id, const room::ServerEvent &event) {
    auto connection = findConnection(id);
    if (connection) {
      enqueue(*connection, encodeEvent(event));
    }
  }

  void sendToGroup(const std::string &group, const ConnectionId *except,
                   const room::ServerEvent &event) {
    std::vector<std::shared_ptr<Connection>> targets;
    {
      readlock lock(_connections_mutex);
      auto it = _groups.find(group);
      if (it == _groups.end()) {
        return;
      }
      for (ConnectionId member : it->second) {
        if (except && member == *except) {
          continue;
        }
        auto conn = _connections.find(member);
        if (conn != _connections.end()) {
          targets.push_back(conn->second);
        }
      }
    }

    if (targets.empty()) {
      return;
    }
    const std::string payload = encodeEvent(event);
    for (const auto &connection : targets) {
      enqueue(*connection, payload);
    }
  }

  void joinGroup(ConnectionId id, const std::string &group) {
    writelock lock(_connections_mutex);
    auto it = _connections.find(id);
    if (it == _connections.end()) {
      return;
    }
    it->second->groups.insert(group);
    _groups[group].insert(id);
  }

  bool isConnected(ConnectionId id) const {
    readlock lock(_connections_mutex);
    return _connections.find(id) != _connections.end();
  }

private:
  void closeListener() {
    if (_serverSocket != -1) {
      close(_serverSocket);
      _serverSocket = -1;
    }
  }

  void acceptLoop() {
    while (_running) {
      sockaddr_in clientAddress{};
      socklen_t clientLen = sizeof(clientAddress);
      int clientSocket =
          accept(_serverSocket, (struct sockaddr *)&clientAddress, &clientLen);

      if (!_running) {
        if (clientSocket >= 0) {
          close(clientSocket);
        }
        break;
      }

      if (clientSocket < 0) {
        if (errno == EINTR || errno == EWOULDBLOCK || errno == EAGAIN ||
            errno == ECONNABORTED) {
          continue;
        }
        std::cerr << "Failed to accept connection: " << strerror(errno)
                  << std::endl;
        continue;
      }

      if (!SocketOptimiser::optimiseClient(clientSocket)) {
        std::cerr << "Failed to configure client socket: " << strerror(errno)
                  << std::endl;
      }
      reapFinishedReaders();

      ConnectionId id = _nextConnectionId++;
      auto connection = std::make_shared<Connection>(id, clientSocket);
      {
        writelock lock(_connections_mutex);
        _connections.emplace(id, connection);
      }

      try {
        connection->writer =
            std::thread(&NetworkServer::Impl::writeLoop, this, connection.get());
        std::lock_guard<std::mutex> lock(_threads_mutex);
        _readers.emplace(
            id, std::thread(&NetworkServer::Impl::readLoop, this, connection));
      } catch (const std::exception &e) {
        std::cerr << "Failed to start threads for connection " << id << ": "
                  << e.what() << std::endl;
        removeConnection(*connection);
        closeConnection(*connection);
      }
    }
  }

  void reapFinishedReaders() {
    std::vector<std::thread> done;
    {
      std::lock_guard<std::mutex> lock(_threads_mutex);
      for (ConnectionId id : _finished) {
        auto it = _readers.find(id);
        if (it != _readers.end()) {
          done.push_back(std::move(it->second));
          _readers.erase(it);
        }
      }
      _finished.clear();
    }
    for (auto &reader : done) {
      if (reader.joinable()) {
        reader.join();
      }
    }
  }

  void readLoop(std::shared_ptr<Connection> connection) {
    const ConnectionId id = connection->id;
    try {
      _handler->onConnect(id);
    } catch (const std::exception &e) {
      std::cerr << "Connect handler error: " << e.what() << std::endl;
    }

    LineFramer framer;
    std::array<char, 4096> buffer;
    std::vector<std::string> lines;

    while (_running) {
      ssize_t bytesRead = recv(connection->fd, buffer.data(), buffer.size(), 0);
      if (bytesRead == 0) {
        break;
      }
      if (bytesRead < 0) {
        if (errno == EINTR) {
          continue;
        }
        break;
      }

      lines.clear();
      try {
        framer.feed(buffer.data(), static_cast<size_t>(bytesRead), lines);
      } catch (const ProtocolError &e) {
        std::cerr << "Dropping connection " << id << ": " << e.what()
                  << std::endl;
        break;
      }

      for (const auto &line : lines) {
        dispatch(id, line);
      }
    }

    removeConnection(*connection);
    closeConnection(*connection);
    try {
      _handler->onDisconnect(id);
    } catch (const std::exception &e) {
      std::cerr << "Disconnect handler error: " << e.what() << std::endl;
    }

    std::lock_guard<std::mutex> lock(_threads_mutex);
    _finished.push_back(id);
  }

  void dispatch(ConnectionId id, const std::string &line) {
    try {
      ClientMessage message = parseClientMessage(line);
      _handler->onMessage(id, message);
    } catch (const ProtocolError &e) {
      sendTo(id, room::ErrorNotice{room::ErrorCode::BAD_REQUEST, e.what()});
    } catch (const std::exception &e) {
      std::cerr << "Client handler error: " << e.what() << std::endl;
    }
  }

  std::shared_ptr<Connection> findConnection(ConnectionId id) const {
    readlock lock(_connections_mutex);
    auto it = _connections.find(id);
    if (it != _connections.end()) {
      return it->second;
    }
    return nullptr;
  }

  void removeConnection(Connection &connection) {
    {
      writelock lock(_connections_mutex);
      for (const auto &group : connection.groups) {
        auto it = _groups.find(group);
        if (it == _groups.end()) {
          continue;
        }
        it->second.erase(connection.id);
        if (it->second.empty()) {
          _groups.erase(it);
        }
      }
      connection.groups.clear();
      _connections.erase(connection.id);
    }
  }

  // Stops the writer, dropping whatever it had not sent, and releases the
  // socket. Called once per connection, by its reader (or by the accept
  // loop if the reader never started).
  void closeConnection(Connection &connection) {
    {
      std::lock_guard<std::mutex> lock(connection.outbox_mutex);
      connection.closing = true;
      connection.outbox.clear();
      connection.outbox_bytes = 0;
      if (connection.fd != -1) {
        // Wakes a writer stuck in send().
        shutdown(connection.fd, SHUT_RDWR);
      }
    }
    connection.outbox_ready.notify_all();
    if (connection.writer.joinable()) {
      connection.writer.join();
    }

    std::lock_guard<std::mutex> lock(connection.outbox_mutex);
    if (connection.fd != -1) {
      close(connection.fd);
      connection.fd = -1;
    }
  }

  void enqueue(Connection &connection, const std::string &payload) {
    {
      std::lock_guard<std::mutex> lock(connection.outbox_mutex);
      if (connection.closing) {
        return;
      }
      if (connection.outbox_bytes + payload.size() > kMaxPendingBytes) {
        std::cerr << "Connection " << connection.id
                  << " is not reading; dropping it with "
                  << connection.outbox_bytes << " bytes unsent" << std::endl;
        dropLocked(connection);
        return;
      }
      connection.outbox.push_back(payload);
      connection.outbox_bytes += payload.size();
    }
    connection.outbox_ready.notify_one();
  }

  // The reader sees the shutdown and runs the normal disconnect path.
  void dropLocked(Connection &connection) {
    connection.closing = true;
    connection.outbox.clear();
    connection.outbox_bytes = 0;
    if (connection.fd != -1) {
      shutdown(connection.fd, SHUT_RDWR);
    }
    connection.outbox_ready.notify_all();
  }

  void writeLoop(Connection *connection) {
    while (true) {
      std::string payload;
      {
        std::unique_lock<std::mutex> lock(connection->outbox_mutex);
        connection->outbox_ready.wait(lock, [connection]() {
          return connection->closing || !connection->outbox.empty();
        });
        if (connection->closing) {
          return;
        }
        payload = std::move(connection->outbox.front());
        connection->outbox.pop_front();
        connection->outbox_bytes -= payload.size();
      }

      if (!sendAll(*connection, payload)) {
        std::lock_guard<std::mutex> lock(connection->outbox_mutex);
        dropLocked(*connection);
        return;
      }
    }
  }

  // Only the writer thread sends, and the fd stays open until it is joined.
  bool sendAll(Connection &connection, const std::string &payload) {
    size_t sent = 0;
    while (sent < payload.size()) {
      ssize_t n = send(connection.fd, payload.data() + sent,
                       payload.size() - sent, MSG_NOSIGNAL);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
          std::cerr << "Send to connection " << connection.id
                    << " timed out" << std::endl;
        } else {
          std::cerr << "Send to connection " << connection.id
                    << " failed: " << strerror(errno) << std::endl;
        }
        return false;
      }
      sent += static_cast<size_t>(n);
    }
    return true;
  }

private:
  uint16_t _port;
  std::atomic<bool> _running;
  int _serverSocket;
  std::thread _acceptThread;
  MessageHandler *_handler{nullptr};
  std::atomic<ConnectionId> _nextConnectionId{1};

  std::unordered_map<ConnectionId, std::shared_ptr<Connection>> _connections;
  std::unordered_map<std::string, std::unordered_set<ConnectionId>> _groups;
  mutable std::shared_mutex _connections_mutex;

  std::unordered_map<ConnectionId, std::thread> _readers;
  std::vector<ConnectionId> _finished;
  std::mutex _threads_mutex;
};

NetworkServer::NetworkServer(uint16_t port) : _pimpl(new Impl(port)) {}

NetworkServer::~NetworkServer() { delete _pimpl; }

void NetworkServer::setHandler(MessageHandler *handler) {
  _pimpl->setHandler(handler);
}

void NetworkServer::start() { _pimpl->start(); }

void NetworkServer::stop() { _pimpl->stop(); }

bool NetworkServer::isRunning() const { return _pimpl->isRunning(); }

uint16_t NetworkServer::getPort() const { return _pimpl->getPort(); }

size_t NetworkServer::connectionCount() const {
  return _pimpl->connectionCount();
}

void NetworkServer::sendTo(ConnectionId connection,
                           const room::ServerEvent &event) {
  _pimpl->sendTo(connection, event);
}

void NetworkServer::sendToRoomExcept(const std::string &room_code,
                                     ConnectionId except,
                                     const room::ServerEvent &event) {
  _pimpl->sendToGroup(room_code, &except, event);
}

void NetworkServer::sendToRoom(const std::string &room_code,
                               const room::ServerEvent &event) {
  _pimpl->sendToGroup(room_code, nullptr, event);
}

void NetworkServer::joinGroup(ConnectionId connection,
                              const std::string &room_code) {
  _pimpl->joinGroup(connection, room_code);
}

bool NetworkServer::isConnected(ConnectionId connection) const {
  return _pimpl->isConnected(connection);
}

} // namespace network

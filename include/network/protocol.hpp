#pragma once

#include "../room/events.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace network {

// Wire format: one JSON object per line,
//   {"type": "<message>", "data": {...}}

enum class ClientMessageType {
  CREATE_ROOM,
  JOIN_ROOM,
  START_GAME,
  SPIN_BOTTLE,
  SELECT_CHALLENGE,
  COMPLETE_CHALLENGE,
  SKIP_CHALLENGE
};

struct ClientMessage {
  ClientMessageType type;
  std::string room_code;      // all but CREATE_ROOM
  std::string player_name;    // CREATE_ROOM, JOIN_ROOM
  std::string challenge_type; // SELECT_CHALLENGE
  std::string challenge;      // SELECT_CHALLENGE
};

class ProtocolError : public std::runtime_error {
public:
  explicit ProtocolError(const std::string &what) : std::runtime_error(what) {}
};

// Throws ProtocolError on malformed JSON, unknown types or missing fields.
ClientMessage parseClientMessage(const std::string &line);

const char *clientMessageName(ClientMessageType type);
const char *eventName(const room::ServerEvent &event);

nlohmann::json toJson(const room::ServerEvent &event);
// Serialized event followed by '\n'.
std::string encodeEvent(const room::ServerEvent &event);

// Splits a byte stream into '\n'-terminated lines.
class LineFramer {
public:
  static constexpr size_t kMaxLineLength = 64 * 1024;

  // Appends received bytes and moves every complete, non-empty line into
  // `lines`. Throws ProtocolError when a line exceeds kMaxLineLength.
  void feed(const char *data, size_t length, std::vector<std::string> &lines);
  size_t buffered() const { return _buffer.size(); }

private:
  std::string _buffer;
};

} // namespace network

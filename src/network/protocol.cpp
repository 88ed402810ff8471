#include "../../include/network/protocol.hpp"

#include <type_traits>

namespace network {

using json = nlohmann::json;

namespace {

struct MessageKind {
  const char *name;
  ClientMessageType type;
};

constexpr MessageKind kClientMessages[] = {
    {"create_room", ClientMessageType::CREATE_ROOM},
    {"join_room", ClientMessageType::JOIN_ROOM},
    {"start_game", ClientMessageType::START_GAME},
    {"spin_bottle", ClientMessageType::SPIN_BOTTLE},
    {"select_challenge", ClientMessageType::SELECT_CHALLENGE},
    {"complete_challenge", ClientMessageType::COMPLETE_CHALLENGE},
    {"skip_challenge", ClientMessageType::SKIP_CHALLENGE},
};

std::string requireString(const json &data, const char *field) {
  auto it = data.find(field);
  if (it == data.end() || !it->is_string()) {
    throw ProtocolError(std::string("Missing or invalid field '") + field +
                        "'");
  }
  return it->get<std::string>();
}

json playersJson(const std::vector<room::Player> &players) {
  json array = json::array();
  for (const auto &player : players) {
    array.push_back({{"id", player.id.toString()},
                     {"name", player.name},
                     {"isHost", player.is_host}});
  }
  return array;
}

json scoresJson(const room::ScoreBoard &scores) {
  json object = json::object();
  for (const auto &[id, score] : scores) {
    object[id.toString()] = score;
  }
  return object;
}

} // namespace

ClientMessage parseClientMessage(const std::string &line) {
  json j;
  try {
    j = json::parse(line);
  } catch (const json::parse_error &e) {
    throw ProtocolError(std::string("Malformed JSON: ") + e.what());
  }

  if (!j.is_object()) {
    throw ProtocolError("Message must be a JSON object");
  }
  auto typeIt = j.find("type");
  if (typeIt == j.end() || !typeIt->is_string()) {
    throw ProtocolError("Missing message type");
  }
  const std::string name = typeIt->get<std::string>();

  const MessageKind *kind = nullptr;
  for (const auto &candidate : kClientMessages) {
    if (name == candidate.name) {
      kind = &candidate;
      break;
    }
  }
  if (!kind) {
    throw ProtocolError("Unknown message type '" + name + "'");
  }

  auto dataIt = j.find("data");
  if (dataIt == j.end() || !dataIt->is_object()) {
    throw ProtocolError("Missing message data");
  }
  const json &data = *dataIt;

  ClientMessage msg{kind->type, {}, {}, {}, {}};
  if (msg.type == ClientMessageType::CREATE_ROOM ||
      msg.type == ClientMessageType::JOIN_ROOM) {
    msg.player_name = requireString(data, "playerName");
  }
  if (msg.type != ClientMessageType::CREATE_ROOM) {
    msg.room_code = requireString(data, "roomCode");
  }
  if (msg.type == ClientMessageType::SELECT_CHALLENGE) {
    msg.challenge_type = requireString(data, "type");
    msg.challenge = requireString(data, "challenge");
  }
  return msg;
}

const char *clientMessageName(ClientMessageType type) {
  for (const auto &candidate : kClientMessages) {
    if (candidate.type == type) {
      return candidate.name;
    }
  }
  return "unknown";
}

const char *eventName(const room::ServerEvent &event) {
  return std::visit(
      [](const auto &e) -> const char * {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, room::RoomCreated>)
          return "room_created";
        else if constexpr (std::is_same_v<T, room::JoinedRoom>)
          return "joined_room";
        else if constexpr (std::is_same_v<T, room::PlayerJoined>)
          return "player_joined";
        else if constexpr (std::is_same_v<T, room::ErrorNotice>)
          return "error";
        else if constexpr (std::is_same_v<T, room::GameStarted>)
          return "game_started";
        else if constexpr (std::is_same_v<T, room::BottleSpun>)
          return "bottle_spun";
        else if constexpr (std::is_same_v<T, room::ChallengeSelected>)
          return "challenge_selected";
        else if constexpr (std::is_same_v<T, room::ChallengeCompleted>)
          return "challenge_completed";
        else if constexpr (std::is_same_v<T, room::ChallengeSkipped>)
          return "challenge_skipped";
        else if constexpr (std::is_same_v<T, room::TurnChanged>)
          return "turn_changed";
        else
          return "player_disconnected";
      },
      event);
}

json toJson(const room::ServerEvent &event) {
  json data = std::visit(
      [](const auto &e) -> json {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, room::RoomCreated>) {
          return {{"roomCode", e.room_code}};
        } else if constexpr (std::is_same_v<T, room::JoinedRoom>) {
          return {{"roomCode", e.room_code}, {"players", playersJson(e.players)}};
        } else if constexpr (std::is_same_v<T, room::PlayerJoined>) {
          return {{"playerName", e.player_name},
                  {"players", playersJson(e.players)}};
        } else if constexpr (std::is_same_v<T, room::ErrorNotice>) {
          return {{"code", room::errorCodeName(e.code)},
                  {"message", e.message}};
        } else if constexpr (std::is_same_v<T, room::GameStarted>) {
          return {{"currentTurn", e.current_turn.toString()},
                  {"scores", scoresJson(e.scores)}};
        } else if constexpr (std::is_same_v<T, room::BottleSpun>) {
          return {{"rotation", e.rotation}, {"winner", e.winner.toString()}};
        } else if constexpr (std::is_same_v<T, room::ChallengeSelected>) {
          return {{"type", e.type},
                  {"challenge", e.challenge},
                  {"playerName", e.player_name},
                  {"playerId", e.player_id.toString()}};
        } else if constexpr (std::is_same_v<T, room::ChallengeCompleted>) {
          return {{"playerId", e.player_id.toString()},
                  {"playerName", e.player_name},
                  {"scores", scoresJson(e.scores)}};
        } else if constexpr (std::is_same_v<T, room::ChallengeSkipped>) {
          return {{"playerId", e.player_id.toString()},
                  {"playerName", e.player_name}};
        } else if constexpr (std::is_same_v<T, room::TurnChanged>) {
          return {{"currentTurn", e.current_turn.toString()}};
        } else {
          return {{"playerName", e.player_name}};
        }
      },
      event);

  return {{"type", eventName(event)}, {"data", std::move(data)}};
}

std::string encodeEvent(const room::ServerEvent &event) {
  return toJson(event).dump() + "\n";
}

void LineFramer::feed(const char *data, size_t length,
                      std::vector<std::string> &lines) {
  _buffer.append(data, length);

  size_t start = 0;
  size_t newline;
  while ((newline = _buffer.find('\n', start)) != std::string::npos) {
    size_t end = newline;
    if (end > start && _buffer[end - 1] == '\r') {
      --end;
    }
    if (end > start) {
      lines.emplace_back(_buffer, start, end - start);
    }
    start = newline + 1;
  }
  _buffer.erase(0, start);

  if (_buffer.size() > kMaxLineLength) {
    _buffer.clear();
    throw ProtocolError("Line exceeds maximum length");
  }
}

} // namespace network

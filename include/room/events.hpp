#pragma once

#include "room.hpp"
#include <string>
#include <variant>
#include <vector>

namespace room {

enum class ErrorCode { ROOM_NOT_FOUND, ROOM_FULL, GAME_STARTED, BAD_REQUEST };

const char *errorCodeName(ErrorCode code);

// Server -> client notifications
struct RoomCreated {
  std::string room_code;
};

struct JoinedRoom {
  std::string room_code;
  std::vector<Player> players;
};

struct PlayerJoined {
  std::string player_name;
  std::vector<Player> players;
};

struct ErrorNotice {
  ErrorCode code;
  std::string message;
};

struct GameStarted {
  PlayerId current_turn;
  ScoreBoard scores;
};

struct BottleSpun {
  uint32_t rotation; // degrees, cosmetic
  PlayerId winner;
};

struct ChallengeSelected {
  std::string type;
  std::string challenge;
  std::string player_name;
  PlayerId player_id;
};

struct ChallengeCompleted {
  PlayerId player_id;
  std::string player_name;
  ScoreBoard scores;
};

struct ChallengeSkipped {
  PlayerId player_id;
  std::string player_name;
};

struct TurnChanged {
  PlayerId current_turn;
};

struct PlayerDisconnected {
  std::string player_name;
};

using ServerEvent =
    std::variant<RoomCreated, JoinedRoom, PlayerJoined, ErrorNotice,
                 GameStarted, BottleSpun, ChallengeSelected,
                 ChallengeCompleted, ChallengeSkipped, TurnChanged,
                 PlayerDisconnected>;

enum class Delivery {
  SENDER,             // unicast to the originating connection
  ROOM_EXCEPT_SENDER, // everyone in the room but the originator
  ROOM                // everyone in the room
};

struct Outbound {
  Delivery delivery;
  ServerEvent event;
};

} // namespace room

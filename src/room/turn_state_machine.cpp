#include "../../include/room/turn_state_machine.hpp"

namespace room {

const char *errorCodeName(ErrorCode code) {
  switch (code) {
  case ErrorCode::ROOM_NOT_FOUND:
    return "ROOM_NOT_FOUND";
  case ErrorCode::ROOM_FULL:
    return "ROOM_FULL";
  case ErrorCode::GAME_STARTED:
    return "GAME_STARTED";
  case ErrorCode::BAD_REQUEST:
    return "BAD_REQUEST";
  }
  return "UNKNOWN";
}

Outcome Outcome::rejected(ErrorCode code, std::string message) {
  Outcome outcome;
  outcome.verdict = Verdict::REJECTED;
  outcome.events.push_back(
      {Delivery::SENDER, ErrorNotice{code, std::move(message)}});
  return outcome;
}

Outcome TurnStateMachine::roomNotFound() {
  return Outcome::rejected(ErrorCode::ROOM_NOT_FOUND, "Room not found");
}

Outcome TurnStateMachine::join(RoomState &room, const PlayerId &caller,
                               const std::string &playerName) const {
  if (room.isFull()) {
    return Outcome::rejected(ErrorCode::ROOM_FULL, "Room is full");
  }
  if (room.game_started) {
    return Outcome::rejected(ErrorCode::GAME_STARTED,
                             "Game has already started");
  }
  if (room.findPlayer(caller)) {
    return Outcome::ignored();
  }

  room.players.push_back(Player{caller, playerName, false});

  Outcome outcome;
  outcome.verdict = Verdict::APPLIED;
  outcome.events.push_back(
      {Delivery::SENDER, JoinedRoom{room.code, room.players}});
  outcome.events.push_back(
      {Delivery::ROOM_EXCEPT_SENDER, PlayerJoined{playerName, room.players}});
  return outcome;
}

Outcome TurnStateMachine::start(RoomState &room, const PlayerId &caller) const {
  if (room.players.size() != kMaxPlayers) {
    return Outcome::ignored();
  }
  const Player *host = room.host();
  if (!host || host->id != caller) {
    return Outcome::ignored();
  }

  room.game_started = true;
  room.current_turn = pickPlayer(room).id;
  room.current_challenge.reset();
  room.scores.clear();
  for (const auto &player : room.players) {
    room.scores[player.id] = 0;
  }

  Outcome outcome;
  outcome.verdict = Verdict::APPLIED;
  outcome.events.push_back(
      {Delivery::ROOM, GameStarted{*room.current_turn, room.scores}});
  return outcome;
}

Outcome TurnStateMachine::spinBottle(RoomState &room,
                                     const PlayerId &caller) const {
  if (!holdsTurn(room, caller)) {
    return Outcome::ignored();
  }

  uint32_t rotation = kMinRotation + _random.uniform(360);
  // Independent of who spun: the bottle may well point back at the spinner.
  PlayerId winner = pickPlayer(room).id;

  room.current_turn = winner;
  room.current_challenge.reset();

  Outcome outcome;
  outcome.verdict = Verdict::APPLIED;
  outcome.events.push_back({Delivery::ROOM, BottleSpun{rotation, winner}});
  return outcome;
}

Outcome TurnStateMachine::selectChallenge(RoomState &room,
                                          const PlayerId &caller,
                                          const std::string &type,
                                          const std::string &text) const {
  if (!holdsTurn(room, caller)) {
    return Outcome::ignored();
  }

  room.current_challenge = Challenge{type, text, caller};
  const Player *player = room.findPlayer(caller);

  Outcome outcome;
  outcome.verdict = Verdict::APPLIED;
  outcome.events.push_back(
      {Delivery::ROOM, ChallengeSelected{type, text, player->name, caller}});
  return outcome;
}

Outcome TurnStateMachine::completeChallenge(RoomState &room,
                                            const PlayerId &caller) const {
  if (!holdsTurn(room, caller)) {
    return Outcome::ignored();
  }

  // operator[] starts a missing entry at zero
  room.scores[caller] += 1;
  const Player *player = room.findPlayer(caller);

  Outcome outcome;
  outcome.verdict = Verdict::APPLIED;
  outcome.events.push_back(
      {Delivery::ROOM, ChallengeCompleted{caller, player->name, room.scores}});

  passTurn(room, caller);
  outcome.turn_passed = true;
  return outcome;
}

Outcome TurnStateMachine::skipChallenge(RoomState &room,
                                        const PlayerId &caller) const {
  if (!holdsTurn(room, caller)) {
    return Outcome::ignored();
  }

  const Player *player = room.findPlayer(caller);

  Outcome outcome;
  outcome.verdict = Verdict::APPLIED;
  outcome.events.push_back(
      {Delivery::ROOM, ChallengeSkipped{caller, player->name}});

  passTurn(room, caller);
  outcome.turn_passed = true;
  return outcome;
}

bool TurnStateMachine::holdsTurn(const RoomState &room,
                                 const PlayerId &caller) const {
  return room.game_started && room.current_turn &&
         *room.current_turn == caller && room.findPlayer(caller) != nullptr;
}

const Player &TurnStateMachine::pickPlayer(const RoomState &room) const {
  return room.players[_random.uniform(
      static_cast<uint32_t>(room.players.size()))];
}

void TurnStateMachine::passTurn(RoomState &room, const PlayerId &caller) const {
  const Player *other = room.otherPlayer(caller);
  if (other) {
    room.current_turn = other->id;
  }
  room.current_challenge.reset();
}

} // namespace room

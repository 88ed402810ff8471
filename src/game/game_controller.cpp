#include "../../include/game/game_controller.hpp"

#include <iostream>

namespace game {

GameController::GameController(room::RoomRegistry &rooms,
                               session::SessionIndex &sessions,
                               room::RandomSource &random,
                               network::EventBroadcaster &broadcaster,
                               network::Scheduler &scheduler,
                               session::DisconnectReaper &reaper,
                               std::chrono::milliseconds turnNoticeDelay)
    : _rooms(rooms), _sessions(sessions), _rules(random),
      _broadcaster(broadcaster), _scheduler(scheduler), _reaper(reaper),
      _turnNoticeDelay(turnNoticeDelay) {}

void GameController::onMessage(network::ConnectionId connection,
                               const network::ClientMessage &message) {
  using network::ClientMessageType;

  switch (message.type) {
  case ClientMessageType::CREATE_ROOM:
    createRoom(connection, message.player_name);
    break;
  case ClientMessageType::JOIN_ROOM:
    joinRoom(connection, message.room_code, message.player_name);
    break;
  case ClientMessageType::START_GAME:
    startGame(connection, message.room_code);
    break;
  case ClientMessageType::SPIN_BOTTLE:
    spinBottle(connection, message.room_code);
    break;
  case ClientMessageType::SELECT_CHALLENGE:
    selectChallenge(connection, message.room_code, message.challenge_type,
                    message.challenge);
    break;
  case ClientMessageType::COMPLETE_CHALLENGE:
    completeChallenge(connection, message.room_code);
    break;
  case ClientMessageType::SKIP_CHALLENGE:
    skipChallenge(connection, message.room_code);
    break;
  }
}

void GameController::onDisconnect(network::ConnectionId connection) {
  // Every room the connection ever entered, not just the latest one, or the
  // earlier rooms would never be checked for abandonment.
  for (const auto &code : _sessions.unbindSession(connection)) {
    std::cout << "Connection " << connection << " left room " << code
              << std::endl;
    try {
      _reaper.onDisconnect(connection, code);
    } catch (const std::exception &e) {
      std::cerr << "Could not schedule cleanup of room " << code << ": "
                << e.what() << std::endl;
    }
  }
}

std::string GameController::createRoom(network::ConnectionId connection,
                                       const std::string &playerName) {
  auto host = room::PlayerId::fromConnection(connection);

  std::string code;
  try {
    code = _rooms.createRoom(host, playerName).first;
  } catch (const room::RoomCodeExhausted &e) {
    std::cerr << "Create room failed for connection " << connection << ": "
              << e.what() << std::endl;
    return "";
  }

  _rooms.withRoom(code, [&](room::RoomState &) {
    _sessions.bindSession(connection, code);
    _broadcaster.joinGroup(connection, code);
    _broadcaster.sendTo(connection, room::RoomCreated{code});
  });

  std::cout << "Room " << code << " created by " << playerName << std::endl;
  return code;
}

room::Verdict GameController::joinRoom(network::ConnectionId connection,
                                       const std::string &roomCode,
                                       const std::string &playerName) {
  auto player = room::PlayerId::fromConnection(connection);
  room::Outcome outcome;

  bool found = _rooms.withRoom(roomCode, [&](room::RoomState &state) {
    outcome = _rules.join(state, player, playerName);
    if (outcome.applied()) {
      _sessions.bindSession(connection, roomCode);
      _broadcaster.joinGroup(connection, roomCode);
      std::cout << playerName << " joined room " << roomCode << std::endl;
    }
    publish(connection, roomCode, outcome);
  });

  if (!found) {
    outcome = room::TurnStateMachine::roomNotFound();
    publish(connection, roomCode, outcome);
  }
  return outcome.verdict;
}

room::Verdict GameController::startGame(network::ConnectionId connection,
                                        const std::string &roomCode) {
  auto verdict = applyTurn(
      connection, roomCode,
      [this](room::RoomState &state, const room::PlayerId &caller) {
        return _rules.start(state, caller);
      });
  if (verdict == room::Verdict::APPLIED) {
    std::cout << "Game started in room " << roomCode << std::endl;
  }
  return verdict;
}

room::Verdict GameController::spinBottle(network::ConnectionId connection,
                                         const std::string &roomCode) {
  return applyTurn(
      connection, roomCode,
      [this](room::RoomState &state, const room::PlayerId &caller) {
        return _rules.spinBottle(state, caller);
      });
}

room::Verdict GameController::selectChallenge(network::ConnectionId connection,
                                              const std::string &roomCode,
                                              const std::string &type,
                                              const std::string &challenge) {
  return applyTurn(
      connection, roomCode,
      [this, &type, &challenge](room::RoomState &state,
                                const room::PlayerId &caller) {
        return _rules.selectChallenge(state, caller, type, challenge);
      });
}

room::Verdict
GameController::completeChallenge(network::ConnectionId connection,
                                  const std::string &roomCode) {
  return applyTurn(
      connection, roomCode,
      [this](room::RoomState &state, const room::PlayerId &caller) {
        return _rules.completeChallenge(state, caller);
      });
}

room::Verdict GameController::skipChallenge(network::ConnectionId connection,
                                            const std::string &roomCode) {
  return applyTurn(
      connection, roomCode,
      [this](room::RoomState &state, const room::PlayerId &caller) {
        return _rules.skipChallenge(state, caller);
      });
}

room::Verdict GameController::applyTurn(network::ConnectionId connection,
                                        const std::string &roomCode,
                                        const RoomOperation &operation) {
  auto caller = room::PlayerId::fromConnection(connection);
  room::Outcome outcome;

  _rooms.withRoom(roomCode, [&](room::RoomState &state) {
    outcome = operation(state, caller);
    publish(connection, roomCode, outcome);
    if (outcome.turn_passed) {
      scheduleTurnNotice(roomCode);
    }
  });
  return outcome.verdict;
}

void GameController::publish(network::ConnectionId connection,
                             const std::string &roomCode,
                             const room::Outcome &outcome) {
  for (const auto &outbound : outcome.events) {
    _broadcaster.publish(connection, roomCode, outbound);
  }
}

void GameController::scheduleTurnNotice(const std::string &roomCode) {
  try {
    _scheduler.schedule(_turnNoticeDelay, [this, roomCode]() {
      // Room may be gone by now; the notice is then dropped.
      _rooms.withRoom(roomCode, [&](room::RoomState &state) {
        if (state.current_turn) {
          _broadcaster.sendToRoom(roomCode,
                                  room::TurnChanged{*state.current_turn});
        }
      });
    });
  } catch (const std::exception &e) {
    std::cerr << "Could not schedule turn notice for room " << roomCode << ": "
              << e.what() << std::endl;
  }
}

} // namespace game

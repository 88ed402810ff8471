#pragma once

#include "../network/broadcaster.hpp"
#include "../network/connection.hpp"
#include "../network/scheduler.hpp"
#include "../network/server.hpp"
#include "../room/room_registry.hpp"
#include "../room/turn_state_machine.hpp"
#include "../session/disconnect_reaper.hpp"
#include "../session/session_index.hpp"
#include <chrono>
#include <functional>
#include <string>

namespace game {

// Routes client messages to the room they name and publishes the results.
// Every room operation runs under that room's lock, and its events are
// published before the lock is released, so each room sees its events in
// the order its state changed.
//
// Deferred tasks capture this controller: stop the scheduler before
// destroying it.
class GameController : public network::MessageHandler {
public:
  static constexpr std::chrono::milliseconds kDefaultTurnNoticeDelay{2000};

  GameController(room::RoomRegistry &rooms, session::SessionIndex &sessions,
                 room::RandomSource &random,
                 network::EventBroadcaster &broadcaster,
                 network::Scheduler &scheduler,
                 session::DisconnectReaper &reaper,
                 std::chrono::milliseconds turnNoticeDelay =
                     kDefaultTurnNoticeDelay);

  void onMessage(network::ConnectionId connection,
                 const network::ClientMessage &message) override;
  void onDisconnect(network::ConnectionId connection) override;

  // Returns the new room code, or an empty string if no code could be
  // allocated.
  std::string createRoom(network::ConnectionId connection,
                         const std::string &playerName);
  room::Verdict joinRoom(network::ConnectionId connection,
                         const std::string &roomCode,
                         const std::string &playerName);
  room::Verdict startGame(network::ConnectionId connection,
                          const std::string &roomCode);
  room::Verdict spinBottle(network::ConnectionId connection,
                           const std::string &roomCode);
  room::Verdict selectChallenge(network::ConnectionId connection,
                                const std::string &roomCode,
                                const std::string &type,
                                const std::string &challenge);
  room::Verdict completeChallenge(network::ConnectionId connection,
                                  const std::string &roomCode);
  room::Verdict skipChallenge(network::ConnectionId connection,
                              const std::string &roomCode);

private:
  using RoomOperation =
      std::function<room::Outcome(room::RoomState &, const room::PlayerId &)>;

  // Runs a turn operation; unknown rooms are ignored like any other
  // rule violation.
  room::Verdict applyTurn(network::ConnectionId connection,
                          const std::string &roomCode,
                          const RoomOperation &operation);
  void publish(network::ConnectionId connection, const std::string &roomCode,
               const room::Outcome &outcome);
  void scheduleTurnNotice(const std::string &roomCode);

  room::RoomRegistry &_rooms;
  session::SessionIndex &_sessions;
  room::TurnStateMachine _rules;
  network::EventBroadcaster &_broadcaster;
  network::Scheduler &_scheduler;
  session::DisconnectReaper &_reaper;
  std::chrono::milliseconds _turnNoticeDelay;
};

} // namespace game

#pragma once

#include "events.hpp"
#include "random_source.hpp"
#include "room.hpp"
#include <string>
#include <vector>

namespace room {

enum class Verdict {
  APPLIED,  // state changed, events to publish
  IGNORED,  // rule violation absorbed silently: no state change, no events
  REJECTED  // error reported back to the sender
};

struct Outcome {
  Verdict verdict{Verdict::IGNORED};
  std::vector<Outbound> events;
  // The turn moved to the other player; a delayed TurnChanged is due.
  bool turn_passed{false};

  static Outcome ignored() { return Outcome{}; }
  static Outcome rejected(ErrorCode code, std::string message);
  bool applied() const { return verdict == Verdict::APPLIED; }
};

// Game rules for a single room. Operates on state the caller has already
// locked and never performs I/O; the returned Outcome says what to publish.
class TurnStateMachine {
public:
  static constexpr uint32_t kMinRotation = 4 * 360;

  explicit TurnStateMachine(RandomSource &random) : _random(random) {}

  Outcome join(RoomState &room, const PlayerId &caller,
               const std::string &playerName) const;
  Outcome start(RoomState &room, const PlayerId &caller) const;
  Outcome spinBottle(RoomState &room, const PlayerId &caller) const;
  Outcome selectChallenge(RoomState &room, const PlayerId &caller,
                          const std::string &type,
                          const std::string &text) const;
  Outcome completeChallenge(RoomState &room, const PlayerId &caller) const;
  Outcome skipChallenge(RoomState &room, const PlayerId &caller) const;

  static Outcome roomNotFound();

private:
  bool holdsTurn(const RoomState &room, const PlayerId &caller) const;
  const Player &pickPlayer(const RoomState &room) const;
  void passTurn(RoomState &room, const PlayerId &caller) const;

  RandomSource &_random;
};

} // namespace room

#pragma once

#include "player.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace room {

constexpr size_t kMaxPlayers = 2;

using ScoreBoard = std::map<PlayerId, uint32_t>;

struct Challenge {
  std::string type; // "truth", "dare", ... as sent by the client
  std::string text;
  PlayerId owner_id;
};

struct RoomState {
  std::string code;
  std::vector<Player> players; // join order, players[0] is the host
  bool game_started{false};
  std::optional<PlayerId> current_turn;
  ScoreBoard scores;
  std::optional<Challenge> current_challenge;

  const Player *findPlayer(const PlayerId &id) const;
  const Player *host() const;
  // The unique member whose id differs from `id`. Only meaningful while
  // rooms hold at most two players.
  const Player *otherPlayer(const PlayerId &id) const;
  bool isFull() const { return players.size() >= kMaxPlayers; }
};

} // namespace room

#pragma once

#include "random_source.hpp"
#include <functional>
#include <stdexcept>
#include <string>

namespace room {

class RoomCodeExhausted : public std::runtime_error {
public:
  RoomCodeExhausted()
      : std::runtime_error("Could not allocate a free room code") {}
};

class RoomCodeGenerator {
public:
  // No I, O, 0 or 1: they are too easy to misread when shared aloud. That
  // leaves 26 + 10 - 4 = 32 symbols, not 33.
  static constexpr const char *kAlphabet = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
  static constexpr size_t kAlphabetSize = 32;
  static constexpr size_t kCodeLength = 6;
  static constexpr int kMaxAttempts = 1000;

  explicit RoomCodeGenerator(RandomSource &random) : _random(random) {}

  std::string generate();
  // Draws codes until `isTaken` rejects none of them. Throws
  // RoomCodeExhausted after kMaxAttempts collisions.
  std::string generateUnique(const std::function<bool(const std::string &)>
                                 &isTaken);

  static bool isValidCode(const std::string &code);

private:
  RandomSource &_random;
};

} // namespace room

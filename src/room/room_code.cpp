#include "../../include/room/room_code.hpp"

#include <cstring>

namespace room {

std::string RoomCodeGenerator::generate() {
  std::string code;
  code.reserve(kCodeLength);
  for (size_t i = 0; i < kCodeLength; ++i) {
    code.push_back(kAlphabet[_random.uniform(kAlphabetSize)]);
  }
  return code;
}

std::string RoomCodeGenerator::generateUnique(
    const std::function<bool(const std::string &)> &isTaken) {
  for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
    std::string code = generate();
    if (!isTaken(code)) {
      return code;
    }
  }
  throw RoomCodeExhausted();
}

bool RoomCodeGenerator::isValidCode(const std::string &code) {
  if (code.size() != kCodeLength) {
    return false;
  }
  for (char c : code) {
    if (c == '\0' || std::strchr(kAlphabet, c) == nullptr) {
      return false;
    }
  }
  return true;
}

} // namespace room

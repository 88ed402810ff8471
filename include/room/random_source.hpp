#pragma once

#include <cstdint>
#include <mutex>
#include <random>

namespace room {

class RandomSource {
public:
  virtual ~RandomSource() = default;
  // Uniform integer in [0, bound). bound must be > 0.
  virtual uint32_t uniform(uint32_t bound) = 0;
};

// Thread-safe; shared by every room.
class MersenneRandom : public RandomSource {
public:
  MersenneRandom() : _engine(std::random_device{}()) {}
  explicit MersenneRandom(uint32_t seed) : _engine(seed) {}

  uint32_t uniform(uint32_t bound) override {
    std::lock_guard<std::mutex> lock(_mutex);
    std::uniform_int_distribution<uint32_t> dist(0, bound - 1);
    return dist(_engine);
  }

private:
  std::mt19937 _engine;
  std::mutex _mutex;
};

} // namespace room

#ifndef SRC_GAME_RANDOM_H_
#define SRC_GAME_RANDOM_H_

#include <cstdint>
#include <random>

// Per-room random source. A zero seed draws one from the OS.
class Random {
 public:
  explicit Random(uint32_t seed = 0);

  // Uniform in [0, bound).
  int Next(int bound);
  uint32_t NextSeed();

 private:
  std::mt19937 engine;
};

#endif  // SRC_GAME_RANDOM_H_

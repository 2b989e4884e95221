#include "game/random.h"

Random::Random(uint32_t seed)
    : engine(seed != 0 ? seed : std::random_device{}()) {}

int Random::Next(int bound) {
  if (bound <= 1) {
    return 0;
  }
  std::uniform_int_distribution<int> dist(0, bound - 1);
  return dist(engine);
}

uint32_t Random::NextSeed() {
  std::uniform_int_distribution<uint32_t> dist(1, 0xffffffffu);
  return dist(engine);
}

#ifndef SRC_GAME_CONFIG_H_
#define SRC_GAME_CONFIG_H_

#include <cstddef>
#include <cstdint>

typedef uint32_t player_id_t;

struct RoomConfig {
  // Board is square, grid x grid cells.
  int grid = 20;

  uint16_t tick_hz = 20;
  int64_t round_ms = 120000;

  // Cells per second, independent from tick_hz.
  double speed = 7.5;

  int64_t respawn_ms = 2000;
  uint16_t food_reward = 10;

  static const size_t max_players = 4;
  static const size_t spawn_length = 3;
  static const int random_spawn_attempts = 300;
  static const size_t code_length = 5;
  static const size_t max_name_length = 16;

  long TickIntervalMs() const { return 1000L / tick_hz; }
  double StepSeconds() const { return 1.0 / speed; }
};

#endif  // SRC_GAME_CONFIG_H_

#ifndef SRC_GAME_INPUT_H_
#define SRC_GAME_INPUT_H_

#include <cstdint>
#include <unordered_map>

#include "game/config.h"
#include "game/math.h"
#include "game/player.h"

struct InputSample {
  Vec2 dir;
  int64_t seq;
};

// Latest-direction-wins buffer, one sample per player.
class InputReconciler {
 public:
  // Components are clamped into {-1, 0, 1}; anything but one of the four
  // axis-aligned unit vectors is rejected and leaves the buffer untouched.
  bool Submit(player_id_t id, double dx, double dy, int64_t seq);
  void Forget(player_id_t id);

  // Applies the buffered direction of each alive player and raises its
  // acknowledged sequence.
  void Apply(PlayerMap &players) const;

  const InputSample *Find(player_id_t id) const;
  size_t size() const { return samples.size(); }

  // An exact reversal of the current direction is ignored.
  static bool ApplyDirection(Player &p, const Vec2 &dir);

 private:
  std::unordered_map<player_id_t, InputSample> samples;
};

#endif  // SRC_GAME_INPUT_H_

#ifndef SRC_GAME_SPAWN_H_
#define SRC_GAME_SPAWN_H_

#include <vector>

#include <boost/optional.hpp>

#include "game/math.h"
#include "game/player.h"
#include "game/random.h"

struct SpawnPlan {
  BodySeq body;
  Vec2 dir;
};

struct SpawnPreset {
  Vec2 head;
  Vec2 dir;
};

class SpawnPlanner {
 public:
  // Corner presets first, then randomized heads, then a fixed default.
  static SpawnPlan Plan(const PlayerMap &players,
                        const boost::optional<Vec2> &food, int grid,
                        Random &random);

  // Uniform over cells not covered by any body or the food.
  static boost::optional<Vec2> RandomFreeCell(const PlayerMap &players,
                                              const boost::optional<Vec2> &food,
                                              int grid, Random &random);

  static std::vector<SpawnPreset> Presets(int grid);

  // Body of RoomConfig::spawn_length cells ending at head, facing dir.
  static BodySeq BodyBehind(Vec2 head, Vec2 dir);

  static SpawnPlan Fallback();
};

#endif  // SRC_GAME_SPAWN_H_

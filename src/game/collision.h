#ifndef SRC_GAME_COLLISION_H_
#define SRC_GAME_COLLISION_H_

#include <cstdint>

#include <boost/optional.hpp>

#include "game/config.h"
#include "game/events.h"
#include "game/player.h"
#include "game/random.h"

class CollisionResolver {
 public:
  // Advances every alive player by one cell. All moves are resolved against
  // the occupancy captured before any player moved, so snakes may pass
  // through cells vacated in the same step.
  static void Step(PlayerMap &players, boost::optional<Vec2> &food,
                   const RoomConfig &config, int64_t now, Random &random,
                   RoomEvents *events);

  static void Kill(Player &p, const char *reason, const RoomConfig &config,
                   int64_t now, RoomEvents *events);

  static constexpr const char *reason_wall = "wall";
  static constexpr const char *reason_body = "body";
};

#endif  // SRC_GAME_COLLISION_H_

#ifndef SRC_GAME_EVENTS_H_
#define SRC_GAME_EVENTS_H_

#include <cstdint>
#include <string>
#include <vector>

#include <boost/variant.hpp>

#include "game/config.h"
#include "game/math.h"

struct DeathEvent {
  player_id_t id;
  std::string reason;  // "wall" or "body"
  int64_t respawn_at;
};

struct RespawnEvent {
  player_id_t id;
  BodySeq body;
  Vec2 dir;
};

// Emitted in simulation order, broadcast before the tick's snapshot.
typedef boost::variant<DeathEvent, RespawnEvent> RoomEvent;
typedef std::vector<RoomEvent> RoomEvents;

#endif  // SRC_GAME_EVENTS_H_

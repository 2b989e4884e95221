#include "game/collision.h"

#include <vector>

#include "game/spawn.h"

constexpr const char *CollisionResolver::reason_wall;
constexpr const char *CollisionResolver::reason_body;

namespace {

struct PendingMove {
  Player *p;
  Vec2 head;
};

}  // namespace

void CollisionResolver::Kill(Player &p, const char *reason,
                             const RoomConfig &config, int64_t now,
                             RoomEvents *events) {
  if (!p.alive) {
    return;
  }
  p.Kill(now, config.respawn_ms);
  if (events) {
    events->push_back(DeathEvent{p.id, reason, *p.respawn_at});
  }
}

void CollisionResolver::Step(PlayerMap &players, boost::optional<Vec2> &food,
                             const RoomConfig &config, int64_t now,
                             Random &random, RoomEvents *events) {
  std::vector<PendingMove> moves;
  moves.reserve(players.size());

  OccupancyGrid occupied(config.grid);
  for (auto &entry : players) {
    Player &p = entry.second;
    occupied.Mark(p.body);
    if (!p.alive || p.body.empty()) {
      continue;
    }
    moves.push_back(PendingMove{&p, p.head() + p.dir});
  }

  for (const PendingMove &m : moves) {
    Player &p = *m.p;

    if (!Math::in_bounds(m.head, config.grid)) {
      Kill(p, reason_wall, config, now, events);
      continue;
    }

    if (occupied.Contains(m.head)) {
      Kill(p, reason_body, config, now, events);
      continue;
    }

    p.body.push_back(m.head);

    if (food && *food == m.head) {
      p.score += config.food_reward;
      food = SpawnPlanner::RandomFreeCell(players, boost::none, config.grid,
                                          random);
    } else {
      p.body.pop_front();
    }
  }
}

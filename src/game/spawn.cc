#include "game/spawn.h"

#include "game/config.h"

namespace {

bool BodyInBounds(const BodySeq &body, int grid) {
  for (const Vec2 &c : body) {
    if (!Math::in_bounds(c, grid)) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::vector<SpawnPreset> SpawnPlanner::Presets(int grid) {
  return {
      {{3, 3}, Math::dir_right},
      {{grid - 4, 3}, Math::dir_left},
      {{3, grid - 4}, Math::dir_right},
      {{grid - 4, grid - 4}, Math::dir_left},
  };
}

BodySeq SpawnPlanner::BodyBehind(Vec2 head, Vec2 dir) {
  BodySeq body;
  for (int i = static_cast<int>(RoomConfig::spawn_length) - 1; i >= 0; --i) {
    body.push_back(head - dir * i);
  }
  return body;
}

SpawnPlan SpawnPlanner::Fallback() {
  return SpawnPlan{BodySeq{{1, 1}, {2, 1}, {3, 1}}, Math::dir_right};
}

boost::optional<Vec2> SpawnPlanner::RandomFreeCell(
    const PlayerMap &players, const boost::optional<Vec2> &food, int grid,
    Random &random) {
  OccupancyGrid occupied(grid);
  for (const auto &entry : players) {
    occupied.Mark(entry.second.body);
  }
  if (food) {
    occupied.Mark(*food);
  }

  std::vector<Vec2> free;
  free.reserve(static_cast<size_t>(grid * grid) - occupied.Count());
  for (int y = 0; y < grid; y++) {
    for (int x = 0; x < grid; x++) {
      const Vec2 c{x, y};
      if (!occupied.Contains(c)) {
        free.push_back(c);
      }
    }
  }

  if (free.empty()) {
    return boost::none;
  }
  return free[static_cast<size_t>(random.Next(static_cast<int>(free.size())))];
}

SpawnPlan SpawnPlanner::Plan(const PlayerMap &players,
                             const boost::optional<Vec2> &food, int grid,
                             Random &random) {
  OccupancyGrid occupied(grid);
  for (const auto &entry : players) {
    occupied.Mark(entry.second.body);
  }

  for (const SpawnPreset &preset : Presets(grid)) {
    const BodySeq body = BodyBehind(preset.head, preset.dir);
    if (!BodyInBounds(body, grid)) {
      continue;
    }
    bool clear = true;
    for (const Vec2 &c : body) {
      if (occupied.Contains(c)) {
        clear = false;
        break;
      }
    }
    if (clear) {
      return SpawnPlan{body, preset.dir};
    }
  }

  // Only the head is known to be free here; trailing cells may overlap an
  // existing body.
  for (int i = 0; i < RoomConfig::random_spawn_attempts; i++) {
    const boost::optional<Vec2> head = RandomFreeCell(players, food, grid, random);
    if (!head) {
      break;
    }
    const Vec2 dir = Math::directions[random.Next(4)];
    const BodySeq body = BodyBehind(*head, dir);
    if (BodyInBounds(body, grid)) {
      return SpawnPlan{body, dir};
    }
  }

  return Fallback();
}

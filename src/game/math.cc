#include "game/math.h"

#include <cmath>

const Vec2 Math::dir_right = {1, 0};
const Vec2 Math::dir_left = {-1, 0};
const Vec2 Math::dir_down = {0, 1};
const Vec2 Math::dir_up = {0, -1};
const Vec2 Math::directions[4] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};

int Math::sanitize_component(double v) {
  if (std::isnan(v)) {
    return 0;
  }
  if (v <= -1.0) return -1;
  if (v >= 1.0) return 1;
  return static_cast<int>(std::lround(v));
}

OccupancyGrid::OccupancyGrid(int g)
    : grid(g), cells(static_cast<size_t>(g > 0 ? g * g : 0), 0) {}

void OccupancyGrid::Mark(const Vec2 &c) {
  if (!Math::in_bounds(c, grid)) {
    return;
  }
  const size_t i = static_cast<size_t>(c.y * grid + c.x);
  if (!cells[i]) {
    cells[i] = 1;
    count++;
  }
}

void OccupancyGrid::Mark(const BodySeq &body) {
  for (const Vec2 &c : body) {
    Mark(c);
  }
}

bool OccupancyGrid::Contains(const Vec2 &c) const {
  return Math::in_bounds(c, grid) &&
         cells[static_cast<size_t>(c.y * grid + c.x)] != 0;
}

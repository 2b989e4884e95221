#ifndef SRC_GAME_MATH_H_
#define SRC_GAME_MATH_H_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

// Grid cell, or an axis-aligned unit step when used as a direction.
struct Vec2 {
  int x;
  int y;

  bool operator==(const Vec2 &o) const { return x == o.x && y == o.y; }
  bool operator!=(const Vec2 &o) const { return !(*this == o); }
  Vec2 operator+(const Vec2 &o) const { return Vec2{x + o.x, y + o.y}; }
  Vec2 operator-(const Vec2 &o) const { return Vec2{x - o.x, y - o.y}; }
  Vec2 operator*(int k) const { return Vec2{x * k, y * k}; }
};

// tail -> head
typedef std::deque<Vec2> BodySeq;

class Math {
  Math() = delete;

 public:
  static const Vec2 dir_right;
  static const Vec2 dir_left;
  static const Vec2 dir_down;
  static const Vec2 dir_up;
  static const Vec2 directions[4];

  inline static bool in_bounds(const Vec2 &c, int grid) {
    return c.x >= 0 && c.y >= 0 && c.x < grid && c.y < grid;
  }

  inline static bool is_unit_axis(const Vec2 &d) {
    return (d.x == 0) != (d.y == 0) && d.x >= -1 && d.x <= 1 && d.y >= -1 &&
           d.y <= 1;
  }

  inline static bool is_reverse(const Vec2 &a, const Vec2 &b) {
    return a.x == -b.x && a.y == -b.y;
  }

  // Clamps a client supplied component into {-1, 0, 1}.
  static int sanitize_component(double v);
};

// Fixed-size presence table sized to the board. Out-of-bounds cells are
// never present and marking them is a no-op.
class OccupancyGrid {
 public:
  explicit OccupancyGrid(int grid);

  void Mark(const Vec2 &c);
  void Mark(const BodySeq &body);
  bool Contains(const Vec2 &c) const;
  size_t Count() const { return count; }

 private:
  int grid;
  size_t count = 0;
  std::vector<uint8_t> cells;
};

#endif  // SRC_GAME_MATH_H_

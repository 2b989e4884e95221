#ifndef SRC_GAME_PLAYER_H_
#define SRC_GAME_PLAYER_H_

#include <cstdint>
#include <map>
#include <string>
#include <utility>

#include <boost/optional.hpp>

#include "game/config.h"
#include "game/math.h"

struct Player {
  player_id_t id = 0;
  std::string name;
  std::string color;

  uint32_t score = 0;
  bool alive = true;
  boost::optional<int64_t> respawn_at;

  // Empty while dead.
  BodySeq body;
  Vec2 dir = {1, 0};

  // Highest input sequence acknowledged so far, never decreases.
  int64_t ack_seq = 0;

  Player() = default;
  Player(player_id_t in_id, std::string in_name, std::string in_color)
      : id(in_id), name(std::move(in_name)), color(std::move(in_color)) {}

  inline const Vec2 &head() const { return body.back(); }

  void Spawn(const BodySeq &in_body, Vec2 in_dir);
  void Kill(int64_t now, int64_t respawn_ms);
  bool CanRespawn(int64_t now) const;

  // Returns true if the acknowledged sequence moved forward.
  bool Acknowledge(int64_t seq);

  // Trims to RoomConfig::max_name_length code points, never splitting a
  // UTF-8 sequence.
  static std::string SanitizeName(const std::string &in);
};

typedef std::map<player_id_t, Player> PlayerMap;

#endif  // SRC_GAME_PLAYER_H_

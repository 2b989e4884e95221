#ifndef SRC_PACKET_P_FORMAT_H_
#define SRC_PACKET_P_FORMAT_H_

#include <cstdint>
#include <iostream>

#include <boost/optional.hpp>
#include <nlohmann/json.hpp>

#include "game/math.h"
#include "game/player.h"

class Room;

// {"x": .., "y": ..}; found by nlohmann through ADL.
void to_json(nlohmann::json &j, const Vec2 &v);

nlohmann::json write_timestamp(const boost::optional<int64_t> &ts);
nlohmann::json write_cell(const boost::optional<Vec2> &cell);
nlohmann::json write_body(const BodySeq &body);
nlohmann::json write_player(const Player &p);
nlohmann::json write_players(const PlayerMap &players);

// Full room snapshot shared by joined/players/room/ended.
nlohmann::json write_room(const Room &r);

// Serializes one frame. Invalid UTF-8 in player supplied strings is
// replaced rather than thrown.
struct write_json {
  explicit write_json(const nlohmann::json &in) : j(in) {}
  const nlohmann::json &j;
};

std::ostream &operator<<(std::ostream &out, const write_json &w);

#endif  // SRC_PACKET_P_FORMAT_H_

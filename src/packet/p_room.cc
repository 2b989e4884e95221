#include "packet/p_room.h"

#include <string>

std::ostream &operator<<(std::ostream &out, const packet_room_snapshot &p) {
  nlohmann::json j = p.header();
  j["room"] = write_room(*p.r);
  return out << write_json(j);
}

std::ostream &operator<<(std::ostream &out, const packet_joined &p) {
  nlohmann::json j = p.header();
  j["room"] = write_room(*p.r);
  j["you"] = nlohmann::json{{"id", std::to_string(p.you_id)}};
  return out << write_json(j);
}

std::ostream &operator<<(std::ostream &out, const packet_state &p) {
  const Room &r = *p.r;
  nlohmann::json j = p.header();
  j["now"] = p.now;
  j["endsAt"] = write_timestamp(r.ends_at());
  j["tick"] = r.tick();
  j["cps"] = r.speed();
  j["food"] = write_cell(r.food());
  j["players"] = write_players(r.players());
  return out << write_json(j);
}

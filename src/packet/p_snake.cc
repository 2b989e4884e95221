#include "packet/p_snake.h"

#include <string>

std::ostream &operator<<(std::ostream &out, const packet_death &p) {
  nlohmann::json j = p.header();
  j["id"] = std::to_string(p.e.id);
  j["reason"] = p.e.reason;
  j["respawnAt"] = p.e.respawn_at;
  return out << write_json(j);
}

std::ostream &operator<<(std::ostream &out, const packet_respawn &p) {
  nlohmann::json j = p.header();
  j["id"] = std::to_string(p.e.id);
  j["snake"] = write_body(p.e.body);
  j["dir"] = p.e.dir;
  return out << write_json(j);
}

#include "packet/p_init.h"

#include <string>

std::ostream &operator<<(std::ostream &out, const packet_hello &p) {
  nlohmann::json j = p.header();
  j["id"] = std::to_string(p.id);
  j["grid"] = p.grid;
  j["tickHz"] = p.tick_hz;
  j["roundMs"] = p.round_ms;
  j["cps"] = p.speed;
  return out << write_json(j);
}

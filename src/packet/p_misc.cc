#include "packet/p_misc.h"

const char *const packet_error::room_not_found = "Room not found";
const char *const packet_error::room_full = "Room is full (max 4 players)";
const char *const packet_error::round_ended = "Round already ended";

std::ostream &operator<<(std::ostream &out, const packet_pong &p) {
  nlohmann::json j = p.header();
  j["ts"] = p.ts;
  return out << write_json(j);
}

std::ostream &operator<<(std::ostream &out, const packet_error &p) {
  nlohmann::json j = p.header();
  j["message"] = p.message;
  return out << write_json(j);
}

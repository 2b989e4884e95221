#include "packet/p_base.h"

const char *packet_name(out_packet_t t) {
  switch (t) {
    case packet_t_hello:
      return "hello";
    case packet_t_joined:
      return "joined";
    case packet_t_players:
      return "players";
    case packet_t_room:
      return "room";
    case packet_t_state:
      return "state";
    case packet_t_death:
      return "death";
    case packet_t_respawn:
      return "respawn";
    case packet_t_ended:
      return "ended";
    case packet_t_pong:
      return "pong";
    case packet_t_error:
      return "error";
  }
  return "";
}

const char *packet_name(in_packet_t t) {
  switch (t) {
    case in_packet_t_create:
      return "create";
    case in_packet_t_join:
      return "join";
    case in_packet_t_start:
      return "start";
    case in_packet_t_input:
      return "input";
    case in_packet_t_ping:
      return "ping";
  }
  return "";
}

nlohmann::json PacketBase::header() const {
  nlohmann::json j = nlohmann::json::object();
  j["t"] = packet_name(packet_type);
  return j;
}

std::ostream &operator<<(std::ostream &out, const PacketBase &p) {
  return out << write_json(p.header());
}

#ifndef SRC_PACKET_P_BASE_H_
#define SRC_PACKET_P_BASE_H_

#include <cstdint>
#include <iostream>

#include "packet/p_format.h"

enum out_packet_t : uint8_t {
  packet_t_hello,
  packet_t_joined,
  packet_t_players,
  packet_t_room,
  packet_t_state,
  packet_t_death,
  packet_t_respawn,
  packet_t_ended,
  packet_t_pong,
  packet_t_error,
};

enum in_packet_t : uint8_t {
  in_packet_t_create,
  in_packet_t_join,
  in_packet_t_start,
  in_packet_t_input,
  in_packet_t_ping,
};

// Value of the "t" key on the wire.
const char *packet_name(out_packet_t t);
const char *packet_name(in_packet_t t);

struct PacketBase {
  out_packet_t packet_type;

  explicit PacketBase(out_packet_t t) : packet_type(t) {}

  // {"t": <kind>}; every packet extends this object.
  nlohmann::json header() const;
};

std::ostream &operator<<(std::ostream &out, const PacketBase &p);

#endif  // SRC_PACKET_P_BASE_H_

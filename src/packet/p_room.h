#ifndef SRC_PACKET_P_ROOM_H_
#define SRC_PACKET_P_ROOM_H_

#include <cstdint>

#include "game/config.h"
#include "game/room.h"
#include "packet/p_base.h"

// joined, players, room and ended all carry a full room snapshot.
struct packet_room_snapshot : public PacketBase {
  packet_room_snapshot(out_packet_t t, const Room *input)
      : PacketBase(t), r(input) {}

  const Room *r;
};

// Only to the connection that just entered the room.
struct packet_joined : public packet_room_snapshot {
  packet_joined(const Room *input, player_id_t you)
      : packet_room_snapshot(packet_t_joined, input), you_id(you) {}

  player_id_t you_id;
};

// Per-tick simulation snapshot.
struct packet_state : public PacketBase {
  packet_state(const Room *input, int64_t t)
      : PacketBase(packet_t_state), r(input), now(t) {}

  const Room *r;
  int64_t now;
};

std::ostream &operator<<(std::ostream &out, const packet_room_snapshot &p);
std::ostream &operator<<(std::ostream &out, const packet_joined &p);
std::ostream &operator<<(std::ostream &out, const packet_state &p);

#endif  // SRC_PACKET_P_ROOM_H_

#ifndef SRC_PACKET_P_SNAKE_H_
#define SRC_PACKET_P_SNAKE_H_

#include "game/events.h"
#include "packet/p_base.h"

// Sent to the whole room when a snake hits a wall or a body.
struct packet_death : public PacketBase {
  explicit packet_death(const DeathEvent &input)
      : PacketBase(packet_t_death), e(input) {}

  const DeathEvent &e;
};

// Sent to the whole room when a dead snake re-enters the board.
struct packet_respawn : public PacketBase {
  explicit packet_respawn(const RespawnEvent &input)
      : PacketBase(packet_t_respawn), e(input) {}

  const RespawnEvent &e;
};

std::ostream &operator<<(std::ostream &out, const packet_death &p);
std::ostream &operator<<(std::ostream &out, const packet_respawn &p);

#endif  // SRC_PACKET_P_SNAKE_H_

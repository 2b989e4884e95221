#ifndef SRC_PACKET_P_INIT_H_
#define SRC_PACKET_P_INIT_H_

#include "game/config.h"
#include "packet/p_base.h"

// Sent once on connect: the connection id and the board constants.
struct packet_hello : public PacketBase {
  packet_hello(player_id_t in_id, const RoomConfig &config)
      : PacketBase(packet_t_hello),
        id(in_id),
        grid(config.grid),
        tick_hz(config.tick_hz),
        round_ms(config.round_ms),
        speed(config.speed) {}

  player_id_t id;
  int grid;
  uint16_t tick_hz;
  int64_t round_ms;
  double speed;
};

std::ostream &operator<<(std::ostream &out, const packet_hello &p);

#endif  // SRC_PACKET_P_INIT_H_

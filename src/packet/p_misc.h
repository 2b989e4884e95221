#ifndef SRC_PACKET_P_MISC_H_
#define SRC_PACKET_P_MISC_H_

#include <string>
#include <utility>

#include "packet/p_base.h"

// Echoes the client's ping timestamp untouched.
struct packet_pong : public PacketBase {
  explicit packet_pong(nlohmann::json in_ts)
      : PacketBase(packet_t_pong), ts(std::move(in_ts)) {}

  nlohmann::json ts;
};

struct packet_error : public PacketBase {
  explicit packet_error(std::string in_message)
      : PacketBase(packet_t_error), message(std::move(in_message)) {}

  std::string message;

  static const char *const room_not_found;
  static const char *const room_full;
  static const char *const round_ended;
};

std::ostream &operator<<(std::ostream &out, const packet_pong &p);
std::ostream &operator<<(std::ostream &out, const packet_error &p);

#endif  // SRC_PACKET_P_MISC_H_

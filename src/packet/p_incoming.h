#ifndef SRC_PACKET_P_INCOMING_H_
#define SRC_PACKET_P_INCOMING_H_

#include <cstdint>
#include <string>

#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include <nlohmann/json.hpp>

#include "packet/p_base.h"

struct in_create {
  std::string name;
  std::string color;
};

struct in_join {
  std::string code;
  std::string name;
  std::string color;
};

struct in_start {};

// Direction components as sent; sanitized by the room's input buffer.
struct in_input {
  double dx;
  double dy;
  int64_t seq;
};

struct in_ping {
  nlohmann::json ts;
};

// Every client kind. Handlers visit it with a boost::static_visitor, so a new
// kind does not compile until each visitor handles it.
typedef boost::variant<in_create, in_join, in_start, in_input, in_ping>
    InPacket;

// Empty for frames that are not JSON objects, carry an unknown "t", or miss
// a field the kind requires (an input without a numeric dir.x/dir.y).
boost::optional<InPacket> ParseInPacket(const std::string &payload);

in_packet_t GetPacketType(const InPacket &p);

#endif  // SRC_PACKET_P_INCOMING_H_

#include "packet/p_incoming.h"

#include <cmath>

namespace {

const char *const default_name = "Player";
const char *const default_color = "green";

std::string string_field(const nlohmann::json &j, const char *key,
                         const char *fallback) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  if (it->is_string()) {
    const std::string &s = it->get_ref<const std::string &>();
    return s.empty() ? fallback : s;
  }
  if (it->is_number() || it->is_boolean()) {
    return it->dump();
  }
  return fallback;
}

bool number_field(const nlohmann::json &j, const char *key, double *out) {
  const auto it = j.find(key);
  if (it == j.end() || !it->is_number()) {
    return false;
  }
  *out = it->get<double>();
  return std::isfinite(*out);
}

boost::optional<InPacket> ParseInput(const nlohmann::json &j) {
  const auto dir = j.find("dir");
  if (dir == j.end() || !dir->is_object()) {
    return boost::none;
  }
  in_input p{0.0, 0.0, 0};
  if (!number_field(*dir, "x", &p.dx) || !number_field(*dir, "y", &p.dy)) {
    return boost::none;
  }
  double seq = 0.0;
  if (number_field(j, "seq", &seq) && std::fabs(seq) < 9.0e18) {
    p.seq = static_cast<int64_t>(seq);
  }
  return InPacket(p);
}

class packet_type_visitor : public boost::static_visitor<in_packet_t> {
 public:
  in_packet_t operator()(const in_create &) const { return in_packet_t_create; }
  in_packet_t operator()(const in_join &) const { return in_packet_t_join; }
  in_packet_t operator()(const in_start &) const { return in_packet_t_start; }
  in_packet_t operator()(const in_input &) const { return in_packet_t_input; }
  in_packet_t operator()(const in_ping &) const { return in_packet_t_ping; }
};

}  // namespace

boost::optional<InPacket> ParseInPacket(const std::string &payload) {
  const nlohmann::json j = nlohmann::json::parse(payload, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return boost::none;
  }

  const auto t = j.find("t");
  if (t == j.end() || !t->is_string()) {
    return boost::none;
  }
  const std::string &type = t->get_ref<const std::string &>();

  if (type == packet_name(in_packet_t_create)) {
    return InPacket(in_create{string_field(j, "name", default_name),
                              string_field(j, "color", default_color)});
  }
  if (type == packet_name(in_packet_t_join)) {
    return InPacket(in_join{string_field(j, "code", ""),
                            string_field(j, "name", default_name),
                            string_field(j, "color", default_color)});
  }
  if (type == packet_name(in_packet_t_start)) {
    return InPacket(in_start{});
  }
  if (type == packet_name(in_packet_t_input)) {
    return ParseInput(j);
  }
  if (type == packet_name(in_packet_t_ping)) {
    const auto ts = j.find("ts");
    return InPacket(in_ping{ts == j.end() ? nlohmann::json(nullptr) : *ts});
  }
  return boost::none;
}

in_packet_t GetPacketType(const InPacket &p) {
  return boost::apply_visitor(packet_type_visitor(), p);
}

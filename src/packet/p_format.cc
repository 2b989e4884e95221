#include "packet/p_format.h"

#include <string>

#include "game/room.h"

void to_json(nlohmann::json &j, const Vec2 &v) {
  j = nlohmann::json{{"x", v.x}, {"y", v.y}};
}

nlohmann::json write_timestamp(const boost::optional<int64_t> &ts) {
  return ts ? nlohmann::json(*ts) : nlohmann::json(nullptr);
}

nlohmann::json write_cell(const boost::optional<Vec2> &cell) {
  return cell ? nlohmann::json(*cell) : nlohmann::json(nullptr);
}

nlohmann::json write_body(const BodySeq &body) {
  nlohmann::json out = nlohmann::json::array();
  for (const Vec2 &c : body) {
    out.push_back(c);
  }
  return out;
}

nlohmann::json write_player(const Player &p) {
  return nlohmann::json{{"id", std::to_string(p.id)},
                        {"name", p.name},
                        {"color", p.color},
                        {"score", p.score},
                        {"alive", p.alive},
                        {"respawnAt", write_timestamp(p.respawn_at)},
                        {"snake", write_body(p.body)},
                        {"dir", p.dir},
                        {"ackSeq", p.ack_seq}};
}

nlohmann::json write_players(const PlayerMap &players) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto &entry : players) {
    out.push_back(write_player(entry.second));
  }
  return out;
}

nlohmann::json write_room(const Room &r) {
  return nlohmann::json{{"code", r.code()},
                        {"state", ToString(r.state())},
                        {"startedAt", write_timestamp(r.started_at())},
                        {"endsAt", write_timestamp(r.ends_at())},
                        {"grid", r.config().grid},
                        {"cps", r.speed()},
                        {"food", write_cell(r.food())},
                        {"players", write_players(r.players())}};
}

std::ostream &operator<<(std::ostream &out, const write_json &w) {
  return out << w.j.dump(-1, ' ', false,
                         nlohmann::json::error_handler_t::replace);
}

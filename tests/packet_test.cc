#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "game/room.h"
#include "packet/p_all.h"

namespace {

using nlohmann::json;

template <typename T>
json Encode(const T &packet) {
  std::stringstream ss;
  ss << packet;
  return json::parse(ss.str());
}

}  // namespace

TEST(OutPacket, Hello) {
  RoomConfig config;
  const json j = Encode(packet_hello(7, config));

  EXPECT_EQ(j["t"], "hello");
  EXPECT_EQ(j["id"], "7");
  EXPECT_EQ(j["grid"], 20);
  EXPECT_EQ(j["tickHz"], 20);
  EXPECT_EQ(j["roundMs"], 120000);
  EXPECT_DOUBLE_EQ(j["cps"].get<double>(), 7.5);
}

TEST(OutPacket, LobbySnapshot) {
  Room room("QWERT", RoomConfig(), 1);
  room.AddPlayer(3, "bob", "blue");

  const json j = Encode(packet_room_snapshot(packet_t_players, &room));
  EXPECT_EQ(j["t"], "players");

  const json &r = j["room"];
  EXPECT_EQ(r["code"], "QWERT");
  EXPECT_EQ(r["state"], "lobby");
  EXPECT_TRUE(r["startedAt"].is_null());
  EXPECT_TRUE(r["endsAt"].is_null());
  EXPECT_EQ(r["grid"], 20);
  EXPECT_TRUE(r["food"].is_object());

  ASSERT_EQ(r["players"].size(), 1u);
  const json &p = r["players"][0];
  EXPECT_EQ(p["id"], "3");
  EXPECT_EQ(p["name"], "bob");
  EXPECT_EQ(p["color"], "blue");
  EXPECT_EQ(p["score"], 0);
  EXPECT_EQ(p["alive"], true);
  EXPECT_TRUE(p["respawnAt"].is_null());
  EXPECT_EQ(p["dir"], (json{{"x", 1}, {"y", 0}}));
  EXPECT_EQ(p["ackSeq"], 0);
  EXPECT_EQ(p["snake"], json::parse(R"([{"x":1,"y":3},{"x":2,"y":3},{"x":3,"y":3}])"));
}

TEST(OutPacket, JoinedCarriesYou) {
  Room room("QWERT", RoomConfig(), 1);
  room.AddPlayer(3, "bob", "blue");
  room.Start(5000);

  const json j = Encode(packet_joined(&room, 3));
  EXPECT_EQ(j["t"], "joined");
  EXPECT_EQ(j["you"]["id"], "3");
  EXPECT_EQ(j["room"]["state"], "running");
  EXPECT_EQ(j["room"]["startedAt"], 5000);
  EXPECT_EQ(j["room"]["endsAt"], 125000);
}

TEST(OutPacket, EndedSnapshot) {
  Room room("QWERT", RoomConfig(), 1);
  room.AddPlayer(3, "bob", "blue");
  room.Start(5000);
  room.End();

  const json j = Encode(packet_room_snapshot(packet_t_ended, &room));
  EXPECT_EQ(j["t"], "ended");
  EXPECT_EQ(j["room"]["state"], "ended");
}

TEST(OutPacket, State) {
  Room room("QWERT", RoomConfig(), 1);
  room.AddPlayer(3, "bob", "blue");
  room.Start(5000);
  room.Tick(5050);

  const json j = Encode(packet_state(&room, 5050));
  EXPECT_EQ(j["t"], "state");
  EXPECT_EQ(j["now"], 5050);
  EXPECT_EQ(j["endsAt"], 125000);
  EXPECT_EQ(j["tick"], 1);
  EXPECT_DOUBLE_EQ(j["cps"].get<double>(), 7.5);
  EXPECT_TRUE(j["food"].is_object());
  ASSERT_EQ(j["players"].size(), 1u);
  EXPECT_EQ(j["players"][0]["id"], "3");
}

TEST(OutPacket, DeathAndRespawn) {
  const json death = Encode(packet_death(DeathEvent{4, "wall", 9000}));
  EXPECT_EQ(death["t"], "death");
  EXPECT_EQ(death["id"], "4");
  EXPECT_EQ(death["reason"], "wall");
  EXPECT_EQ(death["respawnAt"], 9000);

  const RespawnEvent e{4, BodySeq{{1, 3}, {2, 3}, {3, 3}}, Vec2{1, 0}};
  const json respawn = Encode(packet_respawn(e));
  EXPECT_EQ(respawn["t"], "respawn");
  EXPECT_EQ(respawn["id"], "4");
  EXPECT_EQ(respawn["snake"].size(), 3u);
  EXPECT_EQ(respawn["snake"][2], (json{{"x", 3}, {"y", 3}}));
  EXPECT_EQ(respawn["dir"], (json{{"x", 1}, {"y", 0}}));
}

TEST(OutPacket, PongEchoesTimestamp) {
  const json ts = json{{"client", 12.5}, {"n", 3}};
  const json j = Encode(packet_pong(ts));
  EXPECT_EQ(j["t"], "pong");
  EXPECT_EQ(j["ts"], ts);

  EXPECT_TRUE(Encode(packet_pong(json(nullptr)))["ts"].is_null());
}

TEST(OutPacket, Error) {
  const json j = Encode(packet_error(packet_error::room_full));
  EXPECT_EQ(j["t"], "error");
  EXPECT_EQ(j["message"], "Room is full (max 4 players)");
}

TEST(OutPacket, InvalidUtf8IsReplaced) {
  Player p(1, "ab\xff", "\xc3");
  std::stringstream ss;
  EXPECT_NO_THROW(ss << write_json(write_player(p)));
  EXPECT_FALSE(json::parse(ss.str(), nullptr, false).is_discarded());
}

TEST(InPacket, Create) {
  const auto p = ParseInPacket(R"({"t":"create","name":"ann","color":"red"})");
  ASSERT_TRUE(p.is_initialized());
  ASSERT_EQ(GetPacketType(*p), in_packet_t_create);
  const in_create &c = boost::get<in_create>(*p);
  EXPECT_EQ(c.name, "ann");
  EXPECT_EQ(c.color, "red");
}

TEST(InPacket, DefaultsNameAndColor) {
  const auto p = ParseInPacket(R"({"t":"create"})");
  ASSERT_TRUE(p.is_initialized());
  const in_create &c = boost::get<in_create>(*p);
  EXPECT_EQ(c.name, "Player");
  EXPECT_EQ(c.color, "green");

  const auto q = ParseInPacket(R"({"t":"join","code":"abcde","name":""})");
  ASSERT_TRUE(q.is_initialized());
  const in_join &j = boost::get<in_join>(*q);
  EXPECT_EQ(j.code, "abcde");
  EXPECT_EQ(j.name, "Player");
  EXPECT_EQ(j.color, "green");
}

TEST(InPacket, StartAndPing) {
  const auto start = ParseInPacket(R"({"t":"start"})");
  ASSERT_TRUE(start.is_initialized());
  EXPECT_EQ(GetPacketType(*start), in_packet_t_start);

  const auto ping = ParseInPacket(R"({"t":"ping","ts":1234.5})");
  ASSERT_TRUE(ping.is_initialized());
  EXPECT_EQ(boost::get<in_ping>(*ping).ts, json(1234.5));

  const auto bare = ParseInPacket(R"({"t":"ping"})");
  ASSERT_TRUE(bare.is_initialized());
  EXPECT_TRUE(boost::get<in_ping>(*bare).ts.is_null());
}

TEST(InPacket, Input) {
  const auto p = ParseInPacket(R"({"t":"input","dir":{"x":0,"y":-1},"seq":12})");
  ASSERT_TRUE(p.is_initialized());
  const in_input &in = boost::get<in_input>(*p);
  EXPECT_DOUBLE_EQ(in.dx, 0.0);
  EXPECT_DOUBLE_EQ(in.dy, -1.0);
  EXPECT_EQ(in.seq, 12);

  const auto noseq = ParseInPacket(R"({"t":"input","dir":{"x":1,"y":0}})");
  ASSERT_TRUE(noseq.is_initialized());
  EXPECT_EQ(boost::get<in_input>(*noseq).seq, 0);
}

TEST(InPacket, InputWithoutDirectionIsDropped) {
  EXPECT_FALSE(ParseInPacket(R"({"t":"input","seq":1})").is_initialized());
  EXPECT_FALSE(ParseInPacket(R"({"t":"input","dir":{"x":1}})").is_initialized());
  EXPECT_FALSE(
      ParseInPacket(R"({"t":"input","dir":{"x":"1","y":0}})").is_initialized());
  EXPECT_FALSE(ParseInPacket(R"({"t":"input","dir":[1,0]})").is_initialized());
}

TEST(InPacket, MalformedFramesAreDropped) {
  EXPECT_FALSE(ParseInPacket("").is_initialized());
  EXPECT_FALSE(ParseInPacket("{not json").is_initialized());
  EXPECT_FALSE(ParseInPacket("[1,2,3]").is_initialized());
  EXPECT_FALSE(ParseInPacket(R"({"name":"x"})").is_initialized());
  EXPECT_FALSE(ParseInPacket(R"({"t":5})").is_initialized());
  EXPECT_FALSE(ParseInPacket(R"({"t":"teleport"})").is_initialized());
}

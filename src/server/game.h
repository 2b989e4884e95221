#ifndef SRC_SERVER_GAME_H_
#define SRC_SERVER_GAME_H_

#include <chrono>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>

#include "game/room_registry.h"
#include "packet/p_all.h"
#include "server/config.h"
#include "server/room_ticker.h"
#include "server/server.h"
#include "server/static_files.h"

using websocketpp::lib::placeholders::_1;
using websocketpp::lib::placeholders::_2;
using websocketpp::lib::bind;

struct Session {
  player_id_t id = 0;

  // Empty until the connection creates or joins a room.
  std::string room_code;

  Session() = default;
  explicit Session(player_id_t in_id) : id(in_id) {}
};

class GameServer {
 public:
  explicit GameServer(IncomingConfig in_config);
  int Run();

  typedef std::unordered_map<player_id_t, connection_hdl> ConnectionMap;
  typedef std::map<connection_hdl, Session, std::owner_less<connection_hdl>> SessionMap;
  typedef SessionMap::iterator SessionIter;

 private:
  class InPacketVisitor;
  class RoomEventVisitor;

  void on_socket_init(connection_hdl, boost::asio::ip::tcp::socket &s);  // NOLINT(runtime/references)
  void on_open(connection_hdl hdl);
  void on_message(connection_hdl hdl, message_ptr ptr);
  void on_close(connection_hdl hdl);
  void on_http(connection_hdl hdl);

  void OnCreate(SessionIter ses_i, const in_create &p);
  void OnJoin(SessionIter ses_i, const in_join &p);
  void OnStart(SessionIter ses_i);
  void OnInput(SessionIter ses_i, const in_input &p);

  void EnterRoom(SessionIter ses_i, const Room::Ptr &room,
                 const std::string &name, const std::string &color);
  void LeaveRoom(SessionIter ses_i);
  void OnRoomTick(Room *room);

  Room::Ptr GetRoom(const Session &ss) const;

  static int64_t GetCurrentTime();
  void PrintConfig();

  template <typename T>
  void send_text(SessionIter s, const T &packet) {
    endpoint.send_text(s->first, packet);
  }

  // Serializes once and queues the frame for every member of the room.
  // Skippable frames are dropped for members whose outbound queue is over
  // the configured limit.
  template <typename T>
  void broadcast_text(const Room &room, const T &packet, bool skippable = false) {
    std::stringstream out;
    out << packet;
    const std::string frame = out.str();

    for (const auto &entry : room.players()) {
      const auto con_i = connections.find(entry.first);
      if (con_i == connections.end()) {
        continue;
      }
      if (skippable &&
          endpoint.buffered_amount(con_i->second) > config.max_buffered_bytes) {
        continue;
      }
      error_code ec;
      endpoint.send_raw(con_i->second, frame, ec);
      if (ec && config.verbose) {
        endpoint.get_alog().write(alevel::app,
            "Broadcast to " + std::to_string(entry.first) + " failed: " + ec.message());
      }
    }
  }

  WSPPServer endpoint;
  IncomingConfig config;

  RoomRegistry registry;
  RoomTicker ticker;
  StaticFiles assets;

  player_id_t last_player_id = 0;

  SessionMap sessions;
  ConnectionMap connections;
};

#endif  // SRC_SERVER_GAME_H_

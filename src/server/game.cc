#include "server/game.h"

#include <utility>

// ANSI color codes for terminal output
#define COLOR_RESET   "\033[0m"
#define COLOR_RED     "\033[31m"
#define COLOR_GREEN   "\033[32m"
#define COLOR_YELLOW  "\033[33m"
#define COLOR_CYAN    "\033[36m"
#define COLOR_BOLD    "\033[1m"

class GameServer::InPacketVisitor : public boost::static_visitor<void> {
 public:
  InPacketVisitor(GameServer *in_server, SessionIter in_ses_i)
      : server(in_server), ses_i(in_ses_i) {}

  void operator()(const in_create &p) const { server->OnCreate(ses_i, p); }
  void operator()(const in_join &p) const { server->OnJoin(ses_i, p); }
  void operator()(const in_start &) const { server->OnStart(ses_i); }
  void operator()(const in_input &p) const { server->OnInput(ses_i, p); }
  void operator()(const in_ping &p) const {
    server->send_text(ses_i, packet_pong(p.ts));
  }

 private:
  GameServer *server;
  SessionIter ses_i;
};

class GameServer::RoomEventVisitor : public boost::static_visitor<void> {
 public:
  RoomEventVisitor(GameServer *in_server, const Room &in_room)
      : server(in_server), room(in_room) {}

  void operator()(const DeathEvent &e) const {
    server->broadcast_text(room, packet_death(e));
  }
  void operator()(const RespawnEvent &e) const {
    server->broadcast_text(room, packet_respawn(e));
  }

 private:
  GameServer *server;
  const Room &room;
};

GameServer::GameServer(IncomingConfig in_config)
    : config(std::move(in_config)),
      registry(config.room, config.seed),
      ticker(&endpoint, bind(&GameServer::OnRoomTick, this, _1)),
      assets(config.assets) {
  // set up access channels to only log interesting things
  endpoint.clear_access_channels(alevel::all);
  endpoint.set_access_channels(alevel::app);
  if (config.verbose) {
    endpoint.set_access_channels(alevel::connect | alevel::disconnect |
                                 alevel::http);
  }

  // Initialize the Asio transport policy
  endpoint.init_asio();
  endpoint.set_reuse_addr(true);

  // Bind the handlers we are using
  endpoint.set_socket_init_handler(bind(&GameServer::on_socket_init, this, ::_1, ::_2));

  endpoint.set_open_handler(bind(&GameServer::on_open, this, _1));
  endpoint.set_message_handler(bind(&GameServer::on_message, this, _1, _2));
  endpoint.set_close_handler(bind(&GameServer::on_close, this, _1));
  endpoint.set_http_handler(bind(&GameServer::on_http, this, _1));
}

int GameServer::Run() {
  endpoint.get_alog().write(alevel::app,
      "Running gridsnake server on port " + std::to_string(config.port));
  PrintConfig();

  error_code ec;
  endpoint.listen(config.port, ec);
  if (ec) {
    endpoint.get_alog().write(alevel::app,
        COLOR_RED "Listen failed: " + ec.message() + COLOR_RESET);
    return 1;
  }
  endpoint.start_accept(ec);
  if (ec) {
    endpoint.get_alog().write(alevel::app,
        COLOR_RED "Accept failed: " + ec.message() + COLOR_RESET);
    return 1;
  }

  try {
    endpoint.get_alog().write(alevel::app, "Server started...");
    endpoint.run();
    return 0;
  } catch (websocketpp::exception const &e) {
    std::cout << e.what() << std::endl;
    ticker.StopAll();
    return 1;
  }
}

void GameServer::PrintConfig() {
  std::stringstream s;
  s << "Room config = "
    << "\n\tgrid = " << config.room.grid
    << "\n\ttick_hz = " << config.room.tick_hz
    << "\n\tround_ms = " << config.room.round_ms
    << "\n\tspeed = " << config.room.speed
    << "\n\trespawn_ms = " << config.room.respawn_ms
    << "\n\tfood_reward = " << config.room.food_reward
    << "\n\tmax_players = " << RoomConfig::max_players
    << "\n\tassets = " << assets.root();
  endpoint.get_alog().write(alevel::app, s.str());
}

void GameServer::on_socket_init(websocketpp::connection_hdl, boost::asio::ip::tcp::socket &s) {
  boost::asio::ip::tcp::no_delay option(true);
  s.set_option(option);
}

void GameServer::on_open(connection_hdl hdl) {
  const player_id_t id = ++last_player_id;
  sessions[hdl] = Session(id);
  connections[id] = hdl;

  endpoint.send_text(hdl, packet_hello(id, config.room));
  if (config.verbose) {
    endpoint.get_alog().write(alevel::app, "Connection " + std::to_string(id) + " opened");
  }
}

void GameServer::on_message(connection_hdl hdl, message_ptr ptr) {
  if (ptr->get_opcode() != opcode::text) {
    if (config.verbose) {
      endpoint.get_alog().write(alevel::app,
          "Unknown incoming message opcode " + std::to_string(ptr->get_opcode()));
    }
    return;
  }

  const auto ses_i = sessions.find(hdl);
  if (ses_i == sessions.end()) {
    endpoint.get_alog().write(alevel::app, "No session, skip packet");
    return;
  }

  const boost::optional<InPacket> packet = ParseInPacket(ptr->get_payload());
  if (!packet) {
    if (config.verbose) {
      endpoint.get_alog().write(alevel::app,
          COLOR_YELLOW "Dropped malformed frame from " +
              std::to_string(ses_i->second.id) + COLOR_RESET);
    }
    return;
  }

  boost::apply_visitor(InPacketVisitor(this, ses_i), *packet);
}

void GameServer::on_close(connection_hdl hdl) {
  const auto ses_i = sessions.find(hdl);
  if (ses_i == sessions.end()) {
    return;
  }

  const player_id_t id = ses_i->second.id;
  LeaveRoom(ses_i);
  connections.erase(id);
  sessions.erase(ses_i);

  if (config.verbose) {
    endpoint.get_alog().write(alevel::app, "Connection " + std::to_string(id) + " closed");
  }
}

void GameServer::on_http(connection_hdl hdl) {
  error_code ec;
  const WSPPServer::connection_ptr con = endpoint.get_con_from_hdl(hdl, ec);
  if (ec) {
    return;
  }

  const StaticFiles::Response res = assets.Serve(con->get_resource());
  con->set_status(static_cast<websocketpp::http::status_code::value>(res.status));
  con->replace_header("Content-Type", res.content_type);
  if (res.status == 200) {
    con->replace_header("Cache-Control", "no-store");
  }
  con->set_body(res.body);
}

void GameServer::OnCreate(SessionIter ses_i, const in_create &p) {
  LeaveRoom(ses_i);

  const Room::Ptr room = registry.Create();
  endpoint.get_alog().write(alevel::app,
      COLOR_GREEN "[ROOM] " COLOR_RESET "Created " + room->code() +
          " (" + std::to_string(registry.size()) + " live)");

  EnterRoom(ses_i, room, p.name, p.color);
}

void GameServer::OnJoin(SessionIter ses_i, const in_join &p) {
  const Room::Ptr room = registry.Lookup(p.code);
  if (!room) {
    send_text(ses_i, packet_error(packet_error::room_not_found));
    return;
  }
  if (room->code() == ses_i->second.room_code) {
    send_text(ses_i, packet_joined(room.get(), ses_i->second.id));
    return;
  }
  if (room->full()) {
    send_text(ses_i, packet_error(packet_error::room_full));
    return;
  }
  if (room->state() == RoomState::ended) {
    send_text(ses_i, packet_error(packet_error::round_ended));
    return;
  }

  LeaveRoom(ses_i);
  EnterRoom(ses_i, room, p.name, p.color);
}

void GameServer::EnterRoom(SessionIter ses_i, const Room::Ptr &room,
                           const std::string &name, const std::string &color) {
  Session &ss = ses_i->second;
  if (room->AddPlayer(ss.id, name, color) != JoinResult::ok) {
    send_text(ses_i, packet_error(packet_error::room_full));
    return;
  }
  ss.room_code = room->code();

  std::stringstream log_out;
  log_out << COLOR_GREEN << "[JOIN] " << COLOR_RESET
          << "Player " << ss.id << " '" << room->players().at(ss.id).name
          << "' -> " << room->code() << " (" << room->size() << "/"
          << RoomConfig::max_players << ")";
  endpoint.get_alog().write(alevel::app, log_out.str());

  send_text(ses_i, packet_joined(room.get(), ss.id));
  broadcast_text(*room, packet_room_snapshot(packet_t_players, room.get()));
}

void GameServer::LeaveRoom(SessionIter ses_i) {
  Session &ss = ses_i->second;
  if (ss.room_code.empty()) {
    return;
  }

  const Room::Ptr room = GetRoom(ss);
  const std::string code = ss.room_code;
  ss.room_code.clear();
  if (!room) {
    return;
  }

  room->RemovePlayer(ss.id);
  endpoint.get_alog().write(alevel::app,
      COLOR_YELLOW "[LEAVE] " COLOR_RESET "Player " + std::to_string(ss.id) +
          " left " + code);

  if (room->empty()) {
    ticker.Retire(&registry, code);
    endpoint.get_alog().write(alevel::app,
        COLOR_YELLOW "[ROOM] " COLOR_RESET "Destroyed " + code + " (" +
            std::to_string(registry.size()) + " live)");
    return;
  }

  broadcast_text(*room, packet_room_snapshot(packet_t_players, room.get()));
}

void GameServer::OnStart(SessionIter ses_i) {
  const Room::Ptr room = GetRoom(ses_i->second);
  if (!room || !room->Start(GetCurrentTime())) {
    return;
  }

  endpoint.get_alog().write(alevel::app,
      COLOR_CYAN COLOR_BOLD "[ROUND] " COLOR_RESET "Started " + room->code() +
          " by player " + std::to_string(ses_i->second.id) + " with " +
          std::to_string(room->size()) + " players");

  broadcast_text(*room, packet_room_snapshot(packet_t_room, room.get()));
  ticker.Start(room.get(), config.room.TickIntervalMs());
}

void GameServer::OnInput(SessionIter ses_i, const in_input &p) {
  const Room::Ptr room = GetRoom(ses_i->second);
  if (!room) {
    return;
  }
  room->SubmitInput(ses_i->second.id, p.dx, p.dy, p.seq);
}

void GameServer::OnRoomTick(Room *room) {
  const int64_t now = GetCurrentTime();
  const TickResult result = room->Tick(now);

  const RoomEventVisitor visitor(this, *room);
  for (const RoomEvent &e : result.events) {
    boost::apply_visitor(visitor, e);
  }

  if (result.ended) {
    ticker.Stop(room->code());

    std::stringstream log_out;
    log_out << COLOR_CYAN << COLOR_BOLD << "[ROUND] " << COLOR_RESET
            << "Ended " << room->code() << " after " << room->tick() << " ticks:";
    for (const auto &entry : room->players()) {
      log_out << " " << entry.second.name << "=" << entry.second.score;
    }
    endpoint.get_alog().write(alevel::app, log_out.str());

    broadcast_text(*room, packet_room_snapshot(packet_t_ended, room));
    return;
  }

  if (room->state() == RoomState::running) {
    broadcast_text(*room, packet_state(room, now), true);
  }
}

Room::Ptr GameServer::GetRoom(const Session &ss) const {
  if (ss.room_code.empty()) {
    return nullptr;
  }
  return registry.Lookup(ss.room_code);
}

int64_t GameServer::GetCurrentTime() {
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;
  using std::chrono::system_clock;

  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

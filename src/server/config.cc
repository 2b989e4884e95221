#include "server/config.h"

#include <algorithm>
#include <cstdlib>
#include <iostream>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace {

std::string MapEnvironment(const std::string &name) {
  if (name == "PORT") {
    return "port";
  }
  return "";
}

void ClampRoomConfig(RoomConfig *room) {
  room->tick_hz = std::max<uint16_t>(1, std::min<uint16_t>(room->tick_hz, 120));
  room->speed = std::max(0.5, std::min(room->speed, 60.0));
  room->round_ms = std::max<int64_t>(1000, room->round_ms);
  room->respawn_ms = std::max<int64_t>(0, room->respawn_ms);
}

}  // namespace

IncomingConfig ParseCommandLine(const int argc, const char *const *argv) {
  IncomingConfig config;

  po::options_description generic("Generic options");
  generic.add_options()
      ("help,h", po::bool_switch(&config.help), "print help message")
      ("verbose,v", po::bool_switch(&config.verbose), "set verbose output")
      ("version", po::bool_switch(&config.version), "show version information")
      ("port,p", po::value<uint16_t>(&config.port)->default_value(config.port),
       "bind port (env PORT)")
      ("assets", po::value<std::string>(&config.assets)->default_value(config.assets),
       "static asset root")
      ("seed", po::value<uint32_t>(&config.seed)->default_value(config.seed),
       "random seed, 0 = from the OS")
      ("max_buffer",
       po::value<size_t>(&config.max_buffered_bytes)->default_value(config.max_buffered_bytes),
       "queued bytes above which state frames are skipped");

  po::options_description conf("Room configuration");
  conf.add_options()
      ("speed", po::value<double>(&config.room.speed)->default_value(config.room.speed),
       "movement speed, cells per second")
      ("round_ms",
       po::value<int64_t>(&config.room.round_ms)->default_value(config.room.round_ms),
       "round duration")
      ("tick_hz",
       po::value<uint16_t>(&config.room.tick_hz)->default_value(config.room.tick_hz),
       "simulation ticks per second")
      ("respawn_ms",
       po::value<int64_t>(&config.room.respawn_ms)->default_value(config.room.respawn_ms),
       "respawn delay after a death");

  po::options_description cmdline_options;
  cmdline_options.add(generic).add(conf);

  po::variables_map vm;

  try {
    // First store wins, so the command line overrides the environment.
    po::store(po::parse_command_line(argc, argv, cmdline_options), vm);
    po::store(po::parse_environment(cmdline_options, &MapEnvironment), vm);
    po::notify(vm);
  } catch (const po::error &e) {
    std::cerr << "error: " << e.what() << '\n';
    config.help = true;
  }

  if (config.help) {
    std::cerr << "Usage: gridsnake_server [OPTIONS]\n";
    std::cerr << cmdline_options << '\n';
    exit(1);
  }

  ClampRoomConfig(&config.room);
  return config;
}
